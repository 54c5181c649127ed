#ifndef RECORDER_HPP
#define RECORDER_HPP

#include <cstddef>
#include <fstream>
#include <string>
#include "Types.hpp"

// Appends one row per run to <outputDir>/<name>.csv, in call order. Any failed
// write throws IOError; close() optionally gzips the table.
class Recorder {
public:
    Recorder(const std::string& outputDir, const std::string& name, bool compress);
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    void append(const RunResult& result);
    // Returns the path of the finished table (.csv or .csv.gz).
    std::string close();

    const std::string& outputDir() const { return directory; }
    const std::string& path() const { return csvPath; }
    size_t recordCount() const { return records; }

private:
    std::string directory;
    std::string csvPath;
    bool compress;
    bool closed = false;
    size_t records = 0;
    std::ofstream csvFile;
};

std::string resultHeader();
std::string resultToCSV(const RunResult& result);

std::string trajectoryHeader();
std::string roundToCSV(const RoundStats& stats);

// Writes the per-round history of run `runIndex` of a sweep to
// <outputDir>/trajectory_<runIndex>.csv, each row prefixed with the run's
// index, weight, propPlayingA1 and seed. Returns the path written.
std::string writeTrajectory(const std::string& outputDir, size_t runIndex, const RunResult& result, bool compress);

#endif // RECORDER_HPP
