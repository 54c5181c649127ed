#include "Game.hpp"

#include <algorithm>
#include <random>

// Synchronous proportional imitation: every agent compares itself with one
// role model of its own type, and all switches are decided on the
// pre-revision state before any is applied.
void Game::revise() {
  const size_t numAgents = players.size();
  std::vector<Variant> nextA(numAgents);
  std::vector<Variant> nextB(numAgents);

  for (size_t agentIndex = 0; agentIndex < numAgents; ++agentIndex) {
    const Agent &agent = players.agents[agentIndex];
    const Agent &roleModel = players.agents[pickRoleModel(agentIndex)];
    nextA[agentIndex] = imitate(agent, roleModel, Subgame::GameA);
    nextB[agentIndex] = imitate(agent, roleModel, Subgame::GameB);
  }

  for (size_t agentIndex = 0; agentIndex < numAgents; ++agentIndex) {
    Agent &agent = players.agents[agentIndex];
    agent.setStrategy(Subgame::GameA, nextA[agentIndex]);
    agent.setStrategy(Subgame::GameB, nextB[agentIndex]);
    agent.resetPayoffs();
  }
}

size_t Game::pickRoleModel(size_t agentIndex) {
  const std::vector<size_t> &peers =
      players.membersOfType(players.agents[agentIndex].type);

  // The only member of its type looks at anyone else
  if (peers.size() < 2) {
    std::uniform_int_distribution<size_t> dist(0, players.size() - 2);
    size_t pick = dist(gen);
    return pick >= agentIndex ? pick + 1 : pick;
  }

  // peers is sorted, so the agent's own position can be skipped over
  size_t selfPosition = static_cast<size_t>(
      std::lower_bound(peers.begin(), peers.end(), agentIndex) - peers.begin());
  std::uniform_int_distribution<size_t> dist(0, peers.size() - 2);
  size_t pick = dist(gen);
  return peers[pick >= selfPosition ? pick + 1 : pick];
}

Variant Game::imitate(const Agent &agent, const Agent &roleModel,
                      Subgame game) {
  const Variant current = agent.strategy(game);
  if (roleModel.strategy(game) == current) {
    return current;
  }
  if (agent.games(game) == 0 || roleModel.games(game) == 0) {
    return current;
  }

  const double advantage =
      roleModel.averagePayoff(game) - agent.averagePayoff(game);
  const double span = matrices.span(game);
  if (advantage <= 0.0 || span <= 0.0) {
    return current;
  }

  const double revisionProb = std::min(1.0, advantage / span);
  std::uniform_real_distribution<> dist(0.0, 1.0);
  return dist(gen) < revisionProb ? roleModel.strategy(game) : current;
}
