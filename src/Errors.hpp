#ifndef ERRORS_HPP
#define ERRORS_HPP

#include "Types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

// Identifies the run (and round, when mid-run) an error belongs to, so it can be reproduced from the seed.
struct ErrorContext {
    double weight = 0.0;
    double propPlayingA1 = 0.0;
    int round = -1; // -1 when the error happened outside the round loop
};

ErrorContext contextFor(const RunConfig& config, int round = -1);

class SimulationError : public std::runtime_error {
public:
    explicit SimulationError(const std::string& detail, std::optional<ErrorContext> context = std::nullopt);

    const std::string& detail() const { return detailMessage; }
    const std::optional<ErrorContext>& context() const { return errorContext; }

private:
    std::string detailMessage;
    std::optional<ErrorContext> errorContext;
};

// Invalid run, sweep or command-line configuration
class ConfigurationError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

// A pairing referenced a strategy combination the payoff matrix does not define
class StrategyLookupError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

// Writing results failed
class IOError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

#endif // ERRORS_HPP
