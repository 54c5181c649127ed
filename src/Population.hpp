#ifndef POPULATION_HPP
#define POPULATION_HPP

#include <cstdint>
#include <random>
#include <vector>
#include "Types.hpp"

struct Agent {
    size_t id = 0;
    AgentType type = AgentType::Type1;
    Variant strategyA = Variant::V1;
    Variant strategyB = Variant::V1;

    // Payoffs earned in the current revision interval. cumulativePayoff = payoffA + payoffB.
    double cumulativePayoff = 0.0;
    double payoffA = 0.0;
    double payoffB = 0.0;
    size_t gamesA = 0;
    size_t gamesB = 0;

    Variant strategy(Subgame game) const { return game == Subgame::GameA ? strategyA : strategyB; }
    void setStrategy(Subgame game, Variant variant);
    size_t games(Subgame game) const { return game == Subgame::GameA ? gamesA : gamesB; }
    double averagePayoff(Subgame game) const;
    void addPayoff(Subgame game, double payoff);
    void resetPayoffs();
};

// Fixed-size population of agents. Composition changes only through revision.
class Population {
public:
    Population() = default;
    Population(const RunConfig& config, std::mt19937& gen);

    std::vector<Agent> agents;

    size_t size() const { return agents.size(); }
    const std::vector<size_t>& membersOfType(AgentType type) const;

    size_t count(Subgame game, Variant variant) const;
    double proportion(Subgame game, Variant variant) const;
    double proportion(AgentType type, Subgame game, Variant variant) const;

private:
    std::vector<size_t> type1Members;
    std::vector<size_t> type2Members;
};

// Exactly round(proportion * size) entries are V1, the rest V2, in a seeded random order.
std::vector<Variant> assignVariants(size_t size, double proportion, std::mt19937& gen);

// Same seed and parameters always give the same population.
Population initializePopulation(int populationSize, double propPlayingA1, uint64_t randomSeed);

#endif // POPULATION_HPP
