#include "PayoffMatrix.hpp"
#include "Errors.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

PayoffMatrix::PayoffMatrix(std::map<Key, Payoffs> entries) : entries(std::move(entries)) {}

PayoffMatrix PayoffMatrix::coordination(double payoff) {
    std::map<Key, Payoffs> table;
    table[{V1, V1}] = {payoff, payoff};
    table[{V1, V2}] = {0.0, 0.0};
    table[{V2, V1}] = {0.0, 0.0};
    table[{V2, V2}] = {payoff, payoff};
    return PayoffMatrix(std::move(table));
}

PayoffMatrix PayoffMatrix::antiCoordination(double payoff) {
    std::map<Key, Payoffs> table;
    table[{V1, V1}] = {0.0, 0.0};
    table[{V1, V2}] = {payoff, payoff};
    table[{V2, V1}] = {payoff, payoff};
    table[{V2, V2}] = {0.0, 0.0};
    return PayoffMatrix(std::move(table));
}

PayoffMatrix PayoffMatrix::scaled(double weight) const {
    if (!std::isfinite(weight) || weight < 0.0) {
        throw ConfigurationError("Weight must be a non-negative real, got " + std::to_string(weight));
    }
    std::map<Key, Payoffs> result;
    for (const auto& [key, payoffs] : entries) {
        result[key] = {payoffs.sender * weight, payoffs.receiver * weight};
    }
    return PayoffMatrix(std::move(result));
}

const Payoffs& PayoffMatrix::lookup(Variant sent, Variant received) const {
    auto it = entries.find({sent, received});
    if (it == entries.end()) {
        throw StrategyLookupError("No payoff entry for signals (" + variantToString(sent) + ", " +
                                  variantToString(received) + ")");
    }
    return it->second;
}

bool PayoffMatrix::contains(Variant sent, Variant received) const {
    return entries.contains({sent, received});
}

double PayoffMatrix::maxPayoff() const {
    if (entries.empty()) {
        return 0.0;
    }
    double result = -std::numeric_limits<double>::infinity();
    for (const auto& [key, payoffs] : entries) {
        result = std::max({result, payoffs.sender, payoffs.receiver});
    }
    return result;
}

double PayoffMatrix::minPayoff() const {
    if (entries.empty()) {
        return 0.0;
    }
    double result = std::numeric_limits<double>::infinity();
    for (const auto& [key, payoffs] : entries) {
        result = std::min({result, payoffs.sender, payoffs.receiver});
    }
    return result;
}

const PayoffMatrix& GameMatrices::forAgent(AgentType type, Subgame game) const {
    if (game == Subgame::GameA) {
        return gameA;
    }
    return type == AgentType::Type2 ? gameBType2 : gameB;
}

double GameMatrices::span(Subgame game) const {
    if (game == Subgame::GameA) {
        return gameA.span();
    }
    return std::max(gameB.span(), gameBType2.span());
}

GameMatrices makeMatrices(const RunConfig& config) {
    GameMatrices matrices;
    matrices.gameA = PayoffMatrix::coordination(basePayoff);
    matrices.gameB = matrices.gameA.scaled(config.weight);
    matrices.gameBType2 = config.divergentTypes
        ? PayoffMatrix::antiCoordination(basePayoff).scaled(config.weight)
        : matrices.gameB;
    return matrices;
}
