#ifndef PAYOFF_MATRIX_HPP
#define PAYOFF_MATRIX_HPP

#include "Types.hpp"

#include <map>
#include <utility>

struct Payoffs {
    double sender = 0.0;   // payoff to the player whose signal is the row
    double receiver = 0.0; // payoff to the player whose signal is the column

    bool operator==(const Payoffs&) const = default;
};

// Immutable two-player payoff table keyed by (signal sent, signal received).
class PayoffMatrix {
public:
    using Key = std::pair<Variant, Variant>;

    PayoffMatrix() = default;
    explicit PayoffMatrix(std::map<Key, Payoffs> entries);

    // Matching signals pay `payoff` to both players, mismatches pay nothing.
    static PayoffMatrix coordination(double payoff);
    // Mismatching signals pay `payoff` to both players, matches pay nothing.
    static PayoffMatrix antiCoordination(double payoff);

    // Every entry multiplied by weight. Throws ConfigurationError for a negative or non-finite weight.
    PayoffMatrix scaled(double weight) const;

    // Throws StrategyLookupError when the combination has no entry.
    const Payoffs& lookup(Variant sent, Variant received) const;
    bool contains(Variant sent, Variant received) const;

    size_t size() const { return entries.size(); }
    double maxPayoff() const;
    double minPayoff() const;
    double span() const { return maxPayoff() - minPayoff(); }

    bool operator==(const PayoffMatrix&) const = default;

private:
    std::map<Key, Payoffs> entries;
};

// The payoff tables used in one run.
struct GameMatrices {
    PayoffMatrix gameA;
    PayoffMatrix gameB;
    PayoffMatrix gameBType2; // subgame B as played by Type 2 agents; equals gameB unless types diverge

    const PayoffMatrix& forAgent(AgentType type, Subgame game) const;
    double span(Subgame game) const;
};

constexpr double basePayoff = 3.0;

GameMatrices makeMatrices(const RunConfig& config);

#endif // PAYOFF_MATRIX_HPP
