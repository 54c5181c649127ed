#ifndef SWEEP_HPP
#define SWEEP_HPP

#include <cstddef>
#include <exception>
#include <string>
#include "Recorder.hpp"
#include "Types.hpp"

struct SweepSummary {
    size_t completed = 0;
    size_t failed = 0;
};

// Message of a failure captured from a run; any std::exception is accepted.
std::string describeFailure(const std::exception_ptr& failure);

// A complete, self-contained run: builds its own population and generator.
RunResult runOnce(const RunConfig& config);

// Runs every configuration of the sweep (in parallel when OpenMP is available)
// and appends the results to the recorder in sweep order. With
// FailurePolicy::Abort the first failed configuration is rethrown after the
// results before it are recorded; with Continue it is logged and counted.
SweepSummary runSweep(const SweepConfig& sweep, Recorder& recorder);

#endif // SWEEP_HPP
