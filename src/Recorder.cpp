#include "Recorder.hpp"
#include "Errors.hpp"
#include "Utils.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

namespace {

ErrorContext recordContext(const RunResult& result) {
    return {result.weight, result.propPlayingA1, -1};
}

void ensureDirectory(const std::string& outputDir) {
    std::error_code error;
    std::filesystem::create_directories(outputDir, error);
    if (error) {
        throw IOError("Could not create output directory " + outputDir + ": " + error.message());
    }
}

} // namespace

std::string resultHeader() {
    return "weight,prop_playing_a1,seed,population,rounds,"
           "final_a1,final_a2,final_b1,final_b2,"
           "mean_payoff_a1,mean_payoff_a2,mean_payoff_b1,mean_payoff_b2,"
           "pairings_a,pairings_b";
}

std::string resultToCSV(const RunResult& result) {
    return std::to_string(result.weight) + "," +
        std::to_string(result.propPlayingA1) + "," +
        std::to_string(result.seed) + "," +
        std::to_string(result.populationSize) + "," +
        std::to_string(result.numRounds) + "," +
        std::to_string(result.finalPropA1) + "," +
        std::to_string(result.finalPropA2) + "," +
        std::to_string(result.finalPropB1) + "," +
        std::to_string(result.finalPropB2) + "," +
        std::to_string(result.meanPayoffA1) + "," +
        std::to_string(result.meanPayoffA2) + "," +
        std::to_string(result.meanPayoffB1) + "," +
        std::to_string(result.meanPayoffB2) + "," +
        std::to_string(result.totalPairingsA) + "," +
        std::to_string(result.totalPairingsB);
}

std::string trajectoryHeader() {
    return "round,pairings_a,pairings_b,prop_a1,prop_b1,"
           "type1_playing_a1,type2_playing_a1,type1_playing_b1,type2_playing_b1,mean_payoff";
}

std::string roundToCSV(const RoundStats& stats) {
    return std::to_string(stats.round) + "," +
        std::to_string(stats.pairingsA) + "," +
        std::to_string(stats.pairingsB) + "," +
        std::to_string(stats.propA1) + "," +
        std::to_string(stats.propB1) + "," +
        std::to_string(stats.type1PlayingA1) + "," +
        std::to_string(stats.type2PlayingA1) + "," +
        std::to_string(stats.type1PlayingB1) + "," +
        std::to_string(stats.type2PlayingB1) + "," +
        std::to_string(stats.meanPayoff);
}

Recorder::Recorder(const std::string& outputDir, const std::string& name, bool compress)
    : directory(outputDir), csvPath(outputDir + "/" + name + ".csv"), compress(compress) {
    ensureDirectory(outputDir);

    csvFile.open(csvPath);
    if (!csvFile.is_open()) {
        throw IOError("Failed to open file for writing: " + csvPath);
    }
    csvFile << resultHeader() << "\n";
    if (!csvFile) {
        throw IOError("Failed to write header to " + csvPath);
    }
}

Recorder::~Recorder() {
    if (csvFile.is_open()) {
        csvFile.close();
    }
}

void Recorder::append(const RunResult& result) {
    if (closed) {
        throw IOError("Recorder for " + csvPath + " is already closed", recordContext(result));
    }
    csvFile << resultToCSV(result) << "\n";
    if (!csvFile) {
        throw IOError("Failed to append record to " + csvPath, recordContext(result));
    }
    records++;
}

std::string Recorder::close() {
    if (closed) {
        return compress ? csvPath + ".gz" : csvPath;
    }
    csvFile.close();
    closed = true;
    if (csvFile.fail()) {
        throw IOError("Failed to finish writing " + csvPath);
    }
    if (compress) {
        return compressFile(csvPath);
    }
    return csvPath;
}

std::string writeTrajectory(const std::string& outputDir, size_t runIndex, const RunResult& result, bool compress) {
    ensureDirectory(outputDir);

    // Named by sweep position; nearby weights would collide once printed
    std::string outputCsvPath = outputDir + "/trajectory_" + std::to_string(runIndex) + ".csv";
    const std::string runColumns = std::to_string(runIndex) + "," + formatExact(result.weight) + "," +
        formatExact(result.propPlayingA1) + "," + std::to_string(result.seed) + ",";

    std::vector<std::string> csvData;
    csvData.reserve(result.history.size() + 1);
    csvData.push_back("run,weight,prop_playing_a1,seed," + trajectoryHeader());
    for (const RoundStats& stats : result.history) {
        csvData.push_back(runColumns + roundToCSV(stats));
    }

    try {
        writeCSV(outputCsvPath, csvData);
        return compress ? compressFile(outputCsvPath) : outputCsvPath;
    } catch (const IOError& e) {
        throw IOError(e.detail(), recordContext(result));
    }
}
