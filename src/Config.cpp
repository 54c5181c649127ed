#include "Config.hpp"
#include "Errors.hpp"

#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace {

int parseInt(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationError("Expected an integer for " + key + ", got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigurationError("Expected an integer for " + key + ", got '" + value + "'");
    }
    return result;
}

uint64_t parseSeed(const std::string& key, const std::string& value) {
    // std::stoull skips leading whitespace and wraps a minus sign, so only digits may start the value
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
        throw ConfigurationError("Expected a non-negative integer for " + key + ", got '" + value + "'");
    }
    size_t consumed = 0;
    unsigned long long result = 0;
    try {
        result = std::stoull(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationError("Expected a non-negative integer for " + key + ", got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigurationError("Expected a non-negative integer for " + key + ", got '" + value + "'");
    }
    return static_cast<uint64_t>(result);
}

double parseDouble(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationError("Expected a number for " + key + ", got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigurationError("Expected a number for " + key + ", got '" + value + "'");
    }
    return result;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no") {
        return false;
    }
    throw ConfigurationError("Expected 0 or 1 for " + key + ", got '" + value + "'");
}

void apply(SweepConfig& sweep, const std::string& key, const std::string& value) {
    RunConfig& base = sweep.base;

    if (key == "population") {
        base.populationSize = parseInt(key, value);
    } else if (key == "rounds") {
        base.numRounds = parseInt(key, value);
    } else if (key == "revision_interval") {
        base.revisionInterval = parseInt(key, value);
    } else if (key == "seed") {
        base.randomSeed = parseSeed(key, value);
    } else if (key == "seed_policy") {
        if (value == "shared") {
            sweep.seedPolicy = SeedPolicy::Shared;
        } else if (value == "per_run") {
            sweep.seedPolicy = SeedPolicy::PerRun;
        } else {
            throw ConfigurationError("seed_policy must be 'shared' or 'per_run', got '" + value + "'");
        }
    } else if (key == "assignment") {
        if (value == "random") {
            base.assignment = Assignment::Random;
        } else if (value == "alternating") {
            base.assignment = Assignment::Alternating;
        } else {
            throw ConfigurationError("assignment must be 'random' or 'alternating', got '" + value + "'");
        }
    } else if (key == "prop_type1") {
        base.propType1 = parseDouble(key, value);
    } else if (key == "prop_b1") {
        base.propPlayingB1 = parseDouble(key, value);
    } else if (key == "divergent_types") {
        base.divergentTypes = parseBool(key, value);
    } else if (key == "weight") {
        sweep.weightMin = sweep.weightMax = parseDouble(key, value);
    } else if (key == "weight_min") {
        sweep.weightMin = parseDouble(key, value);
    } else if (key == "weight_max") {
        sweep.weightMax = parseDouble(key, value);
    } else if (key == "weight_step") {
        sweep.weightStep = parseDouble(key, value);
    } else if (key == "prop") {
        sweep.propMin = sweep.propMax = parseDouble(key, value);
        sweep.propCount = 1;
    } else if (key == "prop_min") {
        sweep.propMin = parseDouble(key, value);
    } else if (key == "prop_max") {
        sweep.propMax = parseDouble(key, value);
    } else if (key == "prop_count") {
        sweep.propCount = parseInt(key, value);
    } else if (key == "output") {
        if (value.empty()) {
            throw ConfigurationError("output must not be empty");
        }
        sweep.outputDir = value;
    } else if (key == "name") {
        if (value.empty()) {
            throw ConfigurationError("name must not be empty");
        }
        sweep.name = value;
    } else if (key == "compress") {
        sweep.compress = parseBool(key, value);
    } else if (key == "trajectories") {
        sweep.trajectories = parseBool(key, value);
    } else if (key == "on_error") {
        if (value == "abort") {
            sweep.onError = FailurePolicy::Abort;
        } else if (value == "continue") {
            sweep.onError = FailurePolicy::Continue;
        } else {
            throw ConfigurationError("on_error must be 'abort' or 'continue', got '" + value + "'");
        }
    } else if (key == "threads") {
        sweep.threads = parseInt(key, value);
        if (sweep.threads < 0) {
            throw ConfigurationError("threads must not be negative");
        }
    } else {
        throw ConfigurationError("Unknown option '" + key + "'");
    }
}

} // namespace

CommandLine parseArguments(const std::vector<std::string>& arguments) {
    CommandLine commandLine;
    for (const std::string& argument : arguments) {
        if (argument == "help" || argument == "--help" || argument == "-h") {
            commandLine.help = true;
            continue;
        }
        size_t separator = argument.find('=');
        if (separator == std::string::npos || separator == 0) {
            throw ConfigurationError("Expected key=value, got '" + argument + "'");
        }
        apply(commandLine.sweep, argument.substr(0, separator), argument.substr(separator + 1));
    }
    return commandLine;
}

CommandLine parseArguments(int argc, char* argv[]) {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return parseArguments(arguments);
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [key=value ...]\n"
        "\n"
        "Run options:\n"
        "  population=N            agents per run, even (default 1000)\n"
        "  rounds=N                rounds per run (default 1000)\n"
        "  revision_interval=N     rounds between strategy revisions (default 1)\n"
        "  seed=N                  random seed (default 42)\n"
        "  seed_policy=P           per_run (seed + index) or shared (default per_run)\n"
        "  assignment=P            random or alternating subgame assignment (default random)\n"
        "  prop_type1=X            share of Type 1 agents (default 0.5)\n"
        "  prop_b1=X               initial share playing B1 (default 0.5)\n"
        "  divergent_types=0|1     Type 2 agents play anti-coordination in subgame B (default 0)\n"
        "\n"
        "Sweep options:\n"
        "  weight=X | weight_min=X weight_max=X weight_step=X   (default 1..100 by 1)\n"
        "  prop=X | prop_min=X prop_max=X prop_count=N          (default 20 values in [0, 0.45])\n"
        "  on_error=abort|continue (default abort)\n"
        "  threads=N               OpenMP threads, 0 for the default (default 0)\n"
        "\n"
        "Output options:\n"
        "  output=DIR              output directory (default ../output)\n"
        "  name=NAME               results table name (default norms)\n"
        "  compress=0|1            gzip output files (default 1)\n"
        "  trajectories=0|1        also write per-round history per run (default 0)\n";
}
