#include "Errors.hpp"

#include <sstream>

namespace {

std::string describe(const std::string& detail, const std::optional<ErrorContext>& context) {
    if (!context) {
        return detail;
    }
    std::ostringstream message;
    message << detail << " (weight=" << context->weight
            << ", propPlayingA1=" << context->propPlayingA1;
    if (context->round >= 0) {
        message << ", round=" << context->round;
    }
    message << ")";
    return message.str();
}

} // namespace

ErrorContext contextFor(const RunConfig& config, int round) {
    return {config.weight, config.propPlayingA1, round};
}

SimulationError::SimulationError(const std::string& detail, std::optional<ErrorContext> context)
    : std::runtime_error(describe(detail, context)), detailMessage(detail), errorContext(context) {}
