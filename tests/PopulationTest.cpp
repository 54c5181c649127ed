#include "Errors.hpp"
#include "Population.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>

TEST(PopulationTest, InitialShareOfA1MatchesConfiguredProportion) {
    for (int size : {100, 1000}) {
        for (double proportion : {0.0, 0.225, 0.45}) {
            Population population = initializePopulation(size, proportion, 42);

            ASSERT_EQ(population.size(), static_cast<size_t>(size));
            EXPECT_LE(std::abs(population.proportion(GameA, V1) - proportion), 1.0 / size)
                << "size " << size << ", propPlayingA1 " << proportion;
            EXPECT_DOUBLE_EQ(population.proportion(GameA, V1) + population.proportion(GameA, V2), 1.0);
        }
    }
}

TEST(PopulationTest, RemainderFollowsDefaultSplit) {
    Population population = initializePopulation(200, 0.3, 9);

    EXPECT_EQ(population.count(GameA, V2), 140u);
    EXPECT_EQ(population.count(GameB, V1), 100u);
    EXPECT_EQ(population.count(GameB, V2), 100u);
    EXPECT_EQ(population.membersOfType(Type1).size(), 100u);
    EXPECT_EQ(population.membersOfType(Type2).size(), 100u);
}

TEST(PopulationTest, SameSeedGivesSamePopulation) {
    Population first = initializePopulation(500, 0.2, 1234);
    Population second = initializePopulation(500, 0.2, 1234);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first.agents[i].type, second.agents[i].type);
        EXPECT_EQ(first.agents[i].strategyA, second.agents[i].strategyA);
        EXPECT_EQ(first.agents[i].strategyB, second.agents[i].strategyB);
    }
}

TEST(PopulationTest, DifferentSeedsShuffleDifferently) {
    Population first = initializePopulation(500, 0.4, 1);
    Population second = initializePopulation(500, 0.4, 2);

    size_t differences = 0;
    for (size_t i = 0; i < first.size(); ++i) {
        if (first.agents[i].strategyA != second.agents[i].strategyA) {
            differences++;
        }
    }
    EXPECT_GT(differences, 0u);
    EXPECT_EQ(first.count(GameA, V1), second.count(GameA, V1));
}

TEST(PopulationTest, AgentsStartWithIdsTypesAndNoPayoff) {
    Population population = initializePopulation(50, 0.5, 3);

    size_t typeMembers = population.membersOfType(Type1).size() + population.membersOfType(Type2).size();
    EXPECT_EQ(typeMembers, population.size());
    for (size_t i = 0; i < population.size(); ++i) {
        const Agent& agent = population.agents[i];
        EXPECT_EQ(agent.id, i);
        EXPECT_EQ(agent.cumulativePayoff, 0.0);
        EXPECT_EQ(agent.gamesA + agent.gamesB, 0u);
    }
    for (size_t index : population.membersOfType(Type2)) {
        EXPECT_EQ(population.agents[index].type, Type2);
    }
}

TEST(PopulationTest, ProportionByTypeCountsWithinType) {
    Population population = initializePopulation(100, 1.0, 5);

    EXPECT_DOUBLE_EQ(population.proportion(Type1, GameA, V1), 1.0);
    EXPECT_DOUBLE_EQ(population.proportion(Type2, GameA, V1), 1.0);
    EXPECT_DOUBLE_EQ(population.proportion(Type1, GameA, V2), 0.0);
}

TEST(PopulationTest, RejectsInvalidParameters) {
    EXPECT_THROW(initializePopulation(101, 0.2, 1), ConfigurationError);
    EXPECT_THROW(initializePopulation(0, 0.2, 1), ConfigurationError);
    EXPECT_THROW(initializePopulation(100, 1.2, 1), ConfigurationError);
    EXPECT_THROW(initializePopulation(100, -0.1, 1), ConfigurationError);
}

TEST(PopulationTest, AssignVariantsIsExact) {
    std::mt19937 gen = makeGenerator(77);
    std::vector<Variant> variants = assignVariants(12, 0.25, gen);

    ASSERT_EQ(variants.size(), 12u);
    EXPECT_EQ(std::count(variants.begin(), variants.end(), V1), 3);
    EXPECT_EQ(std::count(variants.begin(), variants.end(), V2), 9);
}

TEST(AgentTest, AccumulatesAndResetsPayoffs) {
    Agent agent;
    agent.addPayoff(GameA, 3.0);
    agent.addPayoff(GameA, 0.0);
    agent.addPayoff(GameB, 6.0);

    EXPECT_DOUBLE_EQ(agent.cumulativePayoff, 9.0);
    EXPECT_EQ(agent.games(GameA), 2u);
    EXPECT_EQ(agent.games(GameB), 1u);
    EXPECT_DOUBLE_EQ(agent.averagePayoff(GameA), 1.5);
    EXPECT_DOUBLE_EQ(agent.averagePayoff(GameB), 6.0);

    agent.resetPayoffs();
    EXPECT_DOUBLE_EQ(agent.cumulativePayoff, 0.0);
    EXPECT_DOUBLE_EQ(agent.averagePayoff(GameA), 0.0);
    EXPECT_EQ(agent.games(GameB), 0u);
}

TEST(AgentTest, StrategyPerRole) {
    Agent agent;
    agent.setStrategy(GameA, V2);
    agent.setStrategy(GameB, V1);

    EXPECT_EQ(agent.strategy(GameA), V2);
    EXPECT_EQ(agent.strategy(GameB), V1);
}
