#ifndef GAME_HPP
#define GAME_HPP

#include <random>
#include <vector>
#include "PayoffMatrix.hpp"
#include "Population.hpp"
#include "Types.hpp"

struct Pairing {
  size_t first = 0;
  size_t second = 0;
  Subgame game = Subgame::GameA;
};

// Mean payoff per game in one revision interval, by the variant held while playing
struct IntervalStats {
  double meanPayoffA1 = 0.0;
  double meanPayoffA2 = 0.0;
  double meanPayoffB1 = 0.0;
  double meanPayoffB2 = 0.0;
};

// Throws ConfigurationError for a config no run can start from.
void validateConfig(const RunConfig &config);

// One run of the signaling game: repeated random perfect matchings, subgame
// play, and payoff-biased imitation at every revision boundary. The game owns
// its generator and population, so nothing is shared between runs.
class Game {
public:
  explicit Game(const RunConfig &config);
  // Plays with the given tables instead of the ones derived from the config.
  Game(const RunConfig &config, GameMatrices matrices);

  // Plays one round: shuffle, pair, assign subgames, resolve payoffs, and
  // revise strategies when the round closes a revision interval.
  const RoundStats &playRound();

  bool finished() const { return currentRound >= config.numRounds; }
  int round() const { return currentRound; }

  const RunConfig &runConfig() const { return config; }
  const Population &population() const { return players; }
  const GameMatrices &payoffMatrices() const { return matrices; }
  const std::vector<Pairing> &pairings() const { return lastPairings; }
  const std::vector<RoundStats> &history() const { return roundHistory; }

  // Valid once the game is finished.
  RunResult result() const;

  // Index of a random agent other than `agentIndex`, of the same type when
  // the type has another member.
  size_t pickRoleModel(size_t agentIndex);

private:
  RunConfig config;
  std::mt19937 gen;
  Population players;
  GameMatrices matrices;

  int currentRound = 0;
  std::vector<size_t> order; // agent indices, reshuffled every round
  std::vector<Pairing> lastPairings;
  std::vector<RoundStats> roundHistory;
  IntervalStats lastInterval;
  size_t totalPairingsA = 0;
  size_t totalPairingsB = 0;

  void setup();

  // matching and play
  void matchPairs();
  Subgame assignSubgame(size_t pairIndex);
  double play(const Pairing &pairing);
  RoundStats summarize(double roundPayoff, size_t pairingsA,
                       size_t pairingsB) const;
  IntervalStats intervalStats() const;

  // revision
  void revise();
  Variant imitate(const Agent &agent, const Agent &roleModel, Subgame game);
};

#endif // GAME_HPP
