#include "Population.hpp"
#include "Game.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

void Agent::setStrategy(Subgame game, Variant variant) {
    if (game == Subgame::GameA) {
        strategyA = variant;
    } else {
        strategyB = variant;
    }
}

double Agent::averagePayoff(Subgame game) const {
    return game == Subgame::GameA ? divide(payoffA, static_cast<double>(gamesA))
                                  : divide(payoffB, static_cast<double>(gamesB));
}

void Agent::addPayoff(Subgame game, double payoff) {
    if (game == Subgame::GameA) {
        payoffA += payoff;
        gamesA++;
    } else {
        payoffB += payoff;
        gamesB++;
    }
    cumulativePayoff += payoff;
}

void Agent::resetPayoffs() {
    cumulativePayoff = 0.0;
    payoffA = 0.0;
    payoffB = 0.0;
    gamesA = 0;
    gamesB = 0;
}

std::vector<Variant> assignVariants(size_t size, double proportion, std::mt19937& gen) {
    const size_t numFirst = std::min(size, static_cast<size_t>(std::llround(proportion * static_cast<double>(size))));
    std::vector<Variant> variants(size, Variant::V2);
    std::fill(variants.begin(), variants.begin() + static_cast<std::ptrdiff_t>(numFirst), Variant::V1);
    std::shuffle(variants.begin(), variants.end(), gen);
    return variants;
}

Population::Population(const RunConfig& config, std::mt19937& gen) {
    const size_t numAgents = static_cast<size_t>(config.populationSize);

    // Type 1 plays the role of V1 when assigning agent types
    const std::vector<Variant> types = assignVariants(numAgents, config.propType1, gen);
    const std::vector<Variant> actionsA = assignVariants(numAgents, config.propPlayingA1, gen);
    const std::vector<Variant> actionsB = assignVariants(numAgents, config.propPlayingB1, gen);

    agents.resize(numAgents);
    for (size_t i = 0; i < numAgents; ++i) {
        Agent& agent = agents[i];
        agent.id = i;
        agent.type = types[i] == Variant::V1 ? AgentType::Type1 : AgentType::Type2;
        agent.strategyA = actionsA[i];
        agent.strategyB = actionsB[i];
        if (agent.type == AgentType::Type1) {
            type1Members.push_back(i);
        } else {
            type2Members.push_back(i);
        }
    }
}

const std::vector<size_t>& Population::membersOfType(AgentType type) const {
    return type == AgentType::Type1 ? type1Members : type2Members;
}

size_t Population::count(Subgame game, Variant variant) const {
    return static_cast<size_t>(std::ranges::count_if(agents, [game, variant](const Agent& agent) {
        return agent.strategy(game) == variant;
    }));
}

double Population::proportion(Subgame game, Variant variant) const {
    return divide(static_cast<double>(count(game, variant)), static_cast<double>(agents.size()));
}

double Population::proportion(AgentType type, Subgame game, Variant variant) const {
    const std::vector<size_t>& members = membersOfType(type);
    size_t matching = 0;
    for (size_t index : members) {
        if (agents[index].strategy(game) == variant) {
            matching++;
        }
    }
    return divide(static_cast<double>(matching), static_cast<double>(members.size()));
}

Population initializePopulation(int populationSize, double propPlayingA1, uint64_t randomSeed) {
    RunConfig config;
    config.populationSize = populationSize;
    config.propPlayingA1 = propPlayingA1;
    config.randomSeed = randomSeed;
    validateConfig(config);
    std::mt19937 gen = makeGenerator(randomSeed);
    return Population(config, gen);
}
