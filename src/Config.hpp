#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>
#include "Types.hpp"

struct CommandLine {
    SweepConfig sweep;
    bool help = false;
};

// Parses `key=value` arguments on top of the defaults. Unknown keys and
// malformed values throw ConfigurationError.
CommandLine parseArguments(const std::vector<std::string>& arguments);
CommandLine parseArguments(int argc, char* argv[]);

std::string usage(const std::string& program);

#endif // CONFIG_HPP
