#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"
#include "mcts/ActionSelector.hpp"
#include "mcts/Node.hpp"
#include "mcts/RolloutPolicy.hpp"

#include <random>

namespace mcts {

/*
 * The four phases of one MCTS iteration, as free-standing static functions over a Node tree.
 *
 * Manager::run_iteration() chains them:
 *
 * Node* leaf = select_leaf(root, selector);
 * if (!leaf->is_terminal()) leaf = expand(leaf);
 * backpropagate(leaf, leaf->is_terminal() ? terminal_values(leaf->state())
 *                                         : simulate(leaf->state(), policy, prng));
 */
template <core::concepts::Game Game>
class Algorithms {
 public:
  using Node = mcts::Node<Game>;
  using ActionSelector = mcts::ActionSelector<Game>;
  using RolloutPolicy = mcts::RolloutPolicy<Game>;
  using ValueArray = Node::ValueArray;
  using State = Game::State;
  using Rules = Game::Rules;

  static constexpr int kNumPlayers = Game::Constants::kNumPlayers;

  /*
   * Descends from root through fully expanded, non-terminal nodes, and returns the first node that
   * is either terminal or still has untried moves.
   */
  static Node* select_leaf(Node* root, const ActionSelector& selector);

  // Materializes one untried move of node. node must be non-terminal and not fully expanded.
  static Node* expand(Node* node);

  /*
   * Plays out the game from state until it is over, choosing moves with policy. Does not touch the
   * tree. Returns the outcome of every seat.
   */
  static ValueArray simulate(const State& state, const RolloutPolicy& policy, std::mt19937& prng);

  // The exact outcome of every seat. state must be a leaf of the game.
  static ValueArray terminal_values(const State& state);

  /*
   * Records values at node and at each ancestor up to and including the root. Only node itself
   * counts the visit as a leaf visit.
   */
  static void backpropagate(Node* node, const ValueArray& values);
};

}  // namespace mcts

#include "inline/mcts/Algorithms.inl"
