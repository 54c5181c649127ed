#include "Game.hpp"
#include "Errors.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>

void validateConfig(const RunConfig &config) {
  const ErrorContext context = contextFor(config);

  if (config.populationSize < 2 || config.populationSize % 2 != 0) {
    throw ConfigurationError("Population size must be even and at least 2, got " +
                                 std::to_string(config.populationSize),
                             context);
  }
  if (config.numRounds <= 0) {
    throw ConfigurationError("Number of rounds must be positive, got " +
                                 std::to_string(config.numRounds),
                             context);
  }
  if (!std::isfinite(config.weight) || config.weight < 0.0) {
    throw ConfigurationError("Weight must be a non-negative real, got " +
                                 std::to_string(config.weight),
                             context);
  }
  if (config.revisionInterval <= 0) {
    throw ConfigurationError("Revision interval must be positive, got " +
                                 std::to_string(config.revisionInterval),
                             context);
  }

  auto checkProportion = [&context](double value, const std::string &name) {
    if (!(value >= 0.0 && value <= 1.0)) {
      throw ConfigurationError(name + " must lie in [0, 1], got " +
                                   std::to_string(value),
                               context);
    }
  };
  checkProportion(config.propPlayingA1, "propPlayingA1");
  checkProportion(config.propPlayingB1, "propPlayingB1");
  checkProportion(config.propType1, "propType1");
}

Game::Game(const RunConfig &config)
    : config(config), gen(makeGenerator(config.randomSeed)) {
  validateConfig(config);
  matrices = makeMatrices(config);
  setup();
}

Game::Game(const RunConfig &config, GameMatrices matrices)
    : config(config), gen(makeGenerator(config.randomSeed)),
      matrices(std::move(matrices)) {
  validateConfig(config);
  setup();
}

void Game::setup() {
  players = Population(config, gen);

  order.resize(players.size());
  std::iota(order.begin(), order.end(), 0);

  lastPairings.reserve(players.size() / 2);
  roundHistory.reserve(static_cast<size_t>(config.numRounds));
}

const RoundStats &Game::playRound() {
  if (finished()) {
    throw std::logic_error("Game already played all " +
                           std::to_string(config.numRounds) + " rounds");
  }
  currentRound++;

  matchPairs();

  double roundPayoff = 0.0;
  size_t pairingsA = 0;
  size_t pairingsB = 0;
  for (const Pairing &pairing : lastPairings) {
    roundPayoff += play(pairing);
    if (pairing.game == Subgame::GameA) {
      pairingsA++;
    } else {
      pairingsB++;
    }
  }
  totalPairingsA += pairingsA;
  totalPairingsB += pairingsB;

  // Payoffs are only compared within an interval, so they reset after revision
  if (currentRound % config.revisionInterval == 0) {
    lastInterval = intervalStats();
    revise();
  } else if (finished()) {
    lastInterval = intervalStats();
  }

  roundHistory.push_back(summarize(roundPayoff, pairingsA, pairingsB));
  return roundHistory.back();
}

void Game::matchPairs() {
  std::shuffle(order.begin(), order.end(), gen);

  lastPairings.clear();
  for (size_t i = 0; i + 1 < order.size(); i += 2) {
    Pairing pairing;
    pairing.first = order[i];
    pairing.second = order[i + 1];
    pairing.game = assignSubgame(i / 2);
    lastPairings.push_back(pairing);
  }
}

Subgame Game::assignSubgame(size_t pairIndex) {
  switch (config.assignment) {
  case Assignment::Alternating: {
    size_t phase = pairIndex + static_cast<size_t>(currentRound - 1);
    return phase % 2 == 0 ? Subgame::GameA : Subgame::GameB;
  }
  case Assignment::Random: {
    std::bernoulli_distribution coin(0.5);
    return coin(gen) ? Subgame::GameA : Subgame::GameB;
  }
  default:
    throw ConfigurationError("Invalid subgame assignment policy",
                             contextFor(config, currentRound));
  }
}

double Game::play(const Pairing &pairing) {
  Agent &first = players.agents[pairing.first];
  Agent &second = players.agents[pairing.second];
  const Variant sent = first.strategy(pairing.game);
  const Variant received = second.strategy(pairing.game);

  double firstPayoff = 0.0;
  double secondPayoff = 0.0;
  try {
    firstPayoff = matrices.forAgent(first.type, pairing.game)
                      .lookup(sent, received)
                      .sender;
    secondPayoff = matrices.forAgent(second.type, pairing.game)
                       .lookup(sent, received)
                       .receiver;
  } catch (const StrategyLookupError &e) {
    throw StrategyLookupError(e.detail() + " in subgame " +
                                  subgameToString(pairing.game),
                              contextFor(config, currentRound));
  }

  first.addPayoff(pairing.game, firstPayoff);
  second.addPayoff(pairing.game, secondPayoff);
  return firstPayoff + secondPayoff;
}

RoundStats Game::summarize(double roundPayoff, size_t pairingsA,
                           size_t pairingsB) const {
  RoundStats stats;
  stats.round = currentRound;
  stats.pairingsA = pairingsA;
  stats.pairingsB = pairingsB;
  stats.propA1 = players.proportion(Subgame::GameA, Variant::V1);
  stats.propB1 = players.proportion(Subgame::GameB, Variant::V1);
  stats.type1PlayingA1 =
      players.proportion(AgentType::Type1, Subgame::GameA, Variant::V1);
  stats.type2PlayingA1 =
      players.proportion(AgentType::Type2, Subgame::GameA, Variant::V1);
  stats.type1PlayingB1 =
      players.proportion(AgentType::Type1, Subgame::GameB, Variant::V1);
  stats.type2PlayingB1 =
      players.proportion(AgentType::Type2, Subgame::GameB, Variant::V1);
  stats.meanPayoff =
      divide(roundPayoff, static_cast<double>(players.size()));
  return stats;
}

IntervalStats Game::intervalStats() const {
  // indexed [subgame][variant]
  double payoffs[2][numVariants] = {};
  double games[2][numVariants] = {};

  for (const Agent &agent : players.agents) {
    payoffs[GameA][agent.strategyA] += agent.payoffA;
    games[GameA][agent.strategyA] += static_cast<double>(agent.gamesA);
    payoffs[GameB][agent.strategyB] += agent.payoffB;
    games[GameB][agent.strategyB] += static_cast<double>(agent.gamesB);
  }

  IntervalStats stats;
  stats.meanPayoffA1 = divide(payoffs[GameA][V1], games[GameA][V1]);
  stats.meanPayoffA2 = divide(payoffs[GameA][V2], games[GameA][V2]);
  stats.meanPayoffB1 = divide(payoffs[GameB][V1], games[GameB][V1]);
  stats.meanPayoffB2 = divide(payoffs[GameB][V2], games[GameB][V2]);
  return stats;
}

RunResult Game::result() const {
  if (!finished()) {
    throw std::logic_error("Run result requested after " +
                           std::to_string(currentRound) + " of " +
                           std::to_string(config.numRounds) + " rounds");
  }

  RunResult result;
  result.weight = config.weight;
  result.propPlayingA1 = config.propPlayingA1;
  result.seed = config.randomSeed;
  result.populationSize = config.populationSize;
  result.numRounds = config.numRounds;

  result.finalPropA1 = players.proportion(Subgame::GameA, Variant::V1);
  result.finalPropA2 = players.proportion(Subgame::GameA, Variant::V2);
  result.finalPropB1 = players.proportion(Subgame::GameB, Variant::V1);
  result.finalPropB2 = players.proportion(Subgame::GameB, Variant::V2);

  result.meanPayoffA1 = lastInterval.meanPayoffA1;
  result.meanPayoffA2 = lastInterval.meanPayoffA2;
  result.meanPayoffB1 = lastInterval.meanPayoffB1;
  result.meanPayoffB2 = lastInterval.meanPayoffB2;

  result.totalPairingsA = totalPairingsA;
  result.totalPairingsB = totalPairingsB;
  result.history = roundHistory;
  return result;
}
