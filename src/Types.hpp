#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum Variant { V1, V2 }; // Strategy variant within one role: A1/A2 in subgame A, B1/B2 in subgame B
enum Subgame { GameA, GameB };
enum AgentType { Type1, Type2 };
enum Assignment { Random, Alternating }; // How each pairing is assigned a subgame
enum SeedPolicy { Shared, PerRun };
enum FailurePolicy { Abort, Continue };

constexpr size_t numVariants = 2;

struct RunConfig {
    int populationSize = 1000;
    int numRounds = 1000;
    double weight = 1.0;
    double propPlayingA1 = 0.0;
    int revisionInterval = 1;
    uint64_t randomSeed = 42;
    Assignment assignment = Assignment::Random;
    double propType1 = 0.5;
    double propPlayingB1 = 0.5;
    bool divergentTypes = false; // Type 2 agents play the anti-coordination version of subgame B
};

// Grid of runs: every weight in [weightMin, weightMax] by weightStep, each with
// propCount evenly spaced propPlayingA1 values in [propMin, propMax].
struct SweepConfig {
    RunConfig base;
    double weightMin = 1.0;
    double weightMax = 100.0;
    double weightStep = 1.0;
    double propMin = 0.0;
    double propMax = 0.45;
    int propCount = 20;
    SeedPolicy seedPolicy = SeedPolicy::PerRun;
    FailurePolicy onError = FailurePolicy::Abort;
    std::string outputDir = "../output";
    std::string name = "norms";
    bool compress = true;
    bool trajectories = false;
    int threads = 0; // 0 keeps the OpenMP default
};

struct RoundStats {
    int round = 0;
    size_t pairingsA = 0;
    size_t pairingsB = 0;
    double propA1 = 0.0;
    double propB1 = 0.0;
    double type1PlayingA1 = 0.0;
    double type2PlayingA1 = 0.0;
    double type1PlayingB1 = 0.0;
    double type2PlayingB1 = 0.0;
    double meanPayoff = 0.0; // mean payoff per agent earned in this round

    bool operator==(const RoundStats&) const = default;
};

struct RunResult {
    double weight = 0.0;
    double propPlayingA1 = 0.0;
    uint64_t seed = 0;
    int populationSize = 0;
    int numRounds = 0;

    double finalPropA1 = 0.0;
    double finalPropA2 = 0.0;
    double finalPropB1 = 0.0;
    double finalPropB2 = 0.0;

    // Mean payoff per game over the last revision interval, by the variant held while playing
    double meanPayoffA1 = 0.0;
    double meanPayoffA2 = 0.0;
    double meanPayoffB1 = 0.0;
    double meanPayoffB2 = 0.0;

    size_t totalPairingsA = 0;
    size_t totalPairingsB = 0;

    std::vector<RoundStats> history;

    bool operator==(const RunResult&) const = default;
};

#endif // TYPES_HPP
