#include "Sweep.hpp"
#include "Game.hpp"
#include "Params.hpp"

#include <exception>
#include <iostream>
#include <omp.h>
#include <string>
#include <vector>

std::string describeFailure(const std::exception_ptr& failure) {
    std::string message;
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        message = e.what();
    }
    return message;
}

RunResult runOnce(const RunConfig& config) {
    Game game(config);
    while (!game.finished()) {
        game.playRound();
    }
    return game.result();
}

SweepSummary runSweep(const SweepConfig& sweep, Recorder& recorder) {
    const std::vector<RunConfig> combinations = makeSweep(sweep);
    const long long numCombinations = static_cast<long long>(combinations.size());

    std::cout << "Number of configurations: " << combinations.size() << '\n';

    if (sweep.threads > 0) {
        omp_set_num_threads(sweep.threads);
    }

    // Results are stored by index so the recorded order never depends on scheduling
    std::vector<RunResult> results(combinations.size());
    std::vector<std::exception_ptr> failures(combinations.size());

#pragma omp parallel for schedule(dynamic)
    for (long long idx = 0; idx < numCombinations; ++idx) {
        try {
            results[idx] = runOnce(combinations[idx]);
        } catch (const std::exception&) {
            // Exceptions must not leave the parallel region; handled in order below
            failures[idx] = std::current_exception();
        }
    }

    SweepSummary summary;
    for (size_t idx = 0; idx < combinations.size(); ++idx) {
        const RunConfig& config = combinations[idx];

        if (failures[idx]) {
            if (sweep.onError == FailurePolicy::Abort) {
                std::rethrow_exception(failures[idx]);
            }
            std::cerr << "Skipping configuration " << idx + 1 << " of " << combinations.size()
                      << ": " << describeFailure(failures[idx]) << '\n';
            summary.failed++;
            continue;
        }

        recorder.append(results[idx]);
        if (sweep.trajectories) {
            writeTrajectory(recorder.outputDir(), idx, results[idx], sweep.compress);
        }
        summary.completed++;
        std::cout << "Completed configuration " << idx + 1 << " of " << combinations.size()
                  << " (weight=" << config.weight << ", propPlayingA1=" << config.propPlayingA1 << ")" << '\n';
    }

    return summary;
}
