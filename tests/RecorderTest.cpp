#include "Errors.hpp"
#include "Recorder.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <zlib.h>

namespace {

std::filesystem::path scratchDirectory() {
    std::string testName = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    std::filesystem::path directory = std::filesystem::temp_directory_path() / ("normsim_recorder_" + testName);
    std::filesystem::remove_all(directory);
    return directory;
}

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

RunResult sampleResult(double weight, double propPlayingA1) {
    RunResult result;
    result.weight = weight;
    result.propPlayingA1 = propPlayingA1;
    result.seed = 7;
    result.populationSize = 10;
    result.numRounds = 2;
    result.finalPropA1 = 0.4;
    result.finalPropA2 = 0.6;
    result.finalPropB1 = 0.5;
    result.finalPropB2 = 0.5;
    result.meanPayoffA1 = 1.5;
    result.totalPairingsA = 6;
    result.totalPairingsB = 4;

    RoundStats first;
    first.round = 1;
    first.pairingsA = 3;
    first.pairingsB = 2;
    RoundStats second = first;
    second.round = 2;
    result.history = {first, second};
    return result;
}

} // namespace

TEST(RecorderTest, AppendsRowsInCallOrder) {
    std::filesystem::path directory = scratchDirectory();
    std::vector<RunResult> results = {sampleResult(2.0, 0.1), sampleResult(1.0, 0.3), sampleResult(3.0, 0.0)};

    Recorder recorder(directory.string(), "norms", false);
    for (const RunResult& result : results) {
        recorder.append(result);
    }
    std::string path = recorder.close();

    EXPECT_EQ(path, (directory / "norms.csv").string());
    std::vector<std::string> lines = readLines(path);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], resultHeader());
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(lines[i + 1], resultToCSV(results[i]));
    }

    std::filesystem::remove_all(directory);
}

TEST(RecorderTest, RowCarriesSchemaFields) {
    std::string header = resultHeader();
    for (const char* field : {"weight", "prop_playing_a1", "final_a1", "final_a2", "final_b1", "final_b2",
                              "mean_payoff_a1", "mean_payoff_a2", "mean_payoff_b1", "mean_payoff_b2"}) {
        EXPECT_NE(header.find(field), std::string::npos) << field;
    }

    std::string row = resultToCSV(sampleResult(2.0, 0.1));
    EXPECT_EQ(row.rfind("2.000000,0.100000,7,10,2,0.400000,0.600000", 0), 0u);
    EXPECT_EQ(std::count(row.begin(), row.end(), ','), std::count(header.begin(), header.end(), ','));
}

TEST(RecorderTest, CompressesTableOnClose) {
    std::filesystem::path directory = scratchDirectory();

    Recorder recorder(directory.string(), "norms", true);
    recorder.append(sampleResult(1.0, 0.2));
    std::string path = recorder.close();

    EXPECT_EQ(path, (directory / "norms.csv.gz").string());
    EXPECT_FALSE(std::filesystem::exists(directory / "norms.csv"));

    gzFile file = gzopen(path.c_str(), "rb");
    ASSERT_NE(file, nullptr);
    char buffer[1024];
    ASSERT_NE(gzgets(file, buffer, sizeof(buffer)), nullptr);
    EXPECT_EQ(std::string(buffer), resultHeader() + "\n");
    ASSERT_NE(gzgets(file, buffer, sizeof(buffer)), nullptr);
    EXPECT_EQ(std::string(buffer), resultToCSV(sampleResult(1.0, 0.2)) + "\n");
    gzclose(file);

    std::filesystem::remove_all(directory);
}

TEST(RecorderTest, UnwritableLocationIsAnIOError) {
    std::filesystem::path directory = scratchDirectory();
    std::filesystem::create_directories(directory);
    std::filesystem::path blocker = directory / "blocker";
    std::ofstream(blocker) << "not a directory";

    EXPECT_THROW(Recorder((blocker / "out").string(), "norms", false), IOError);

    std::filesystem::remove_all(directory);
}

TEST(RecorderTest, AppendAfterCloseIsReportedWithContext) {
    std::filesystem::path directory = scratchDirectory();

    Recorder recorder(directory.string(), "norms", false);
    recorder.close();
    try {
        recorder.append(sampleResult(4.0, 0.25));
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_DOUBLE_EQ(e.context()->weight, 4.0);
        EXPECT_DOUBLE_EQ(e.context()->propPlayingA1, 0.25);
    }
    EXPECT_EQ(recorder.recordCount(), 0u);

    std::filesystem::remove_all(directory);
}

TEST(RecorderTest, NearbyWeightsGetSeparateTrajectories) {
    std::filesystem::path directory = scratchDirectory();
    RunResult first = sampleResult(1.0, 0.1);
    RunResult second = sampleResult(1.0000001, 0.1);

    std::string firstPath = writeTrajectory(directory.string(), 0, first, false);
    std::string secondPath = writeTrajectory(directory.string(), 1, second, false);

    EXPECT_NE(firstPath, secondPath);
    ASSERT_EQ(readLines(firstPath).size(), 3u);
    ASSERT_EQ(readLines(secondPath).size(), 3u);
    EXPECT_EQ(readLines(firstPath)[1].rfind("0,1,0.1", 0), 0u);
    EXPECT_EQ(readLines(secondPath)[1].rfind("1,1.0000001,0.1", 0), 0u);

    std::filesystem::remove_all(directory);
}

TEST(RecorderTest, TrajectoryHasOneRowPerRound) {
    std::filesystem::path directory = scratchDirectory();
    RunResult result = sampleResult(2.0, 0.1);

    std::string path = writeTrajectory(directory.string(), 5, result, false);

    EXPECT_EQ(path, (directory / "trajectory_5.csv").string());
    std::vector<std::string> lines = readLines(path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "run,weight,prop_playing_a1,seed," + trajectoryHeader());
    EXPECT_EQ(lines[1], "5,2,0.1,7," + roundToCSV(result.history[0]));
    EXPECT_EQ(lines[2], "5,2,0.1,7," + roundToCSV(result.history[1]));

    std::string compressed = writeTrajectory(directory.string(), 5, result, true);
    EXPECT_TRUE(std::filesystem::exists(compressed));
    EXPECT_FALSE(std::filesystem::exists(path));

    std::filesystem::remove_all(directory);
}
