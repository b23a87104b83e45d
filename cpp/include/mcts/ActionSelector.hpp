#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"
#include "mcts/Node.hpp"

namespace mcts {

/*
 * UCT child selection. For a fully expanded node with visit count N, picks the child i maximizing
 *
 *   Q_i + c * sqrt(ln(N) / n_i)
 *
 * where Q_i is the mean value stored in child i (the reward of the seat that chose it, i.e. the
 * seat to move at the node being scored), n_i its visit count, and c the exploration constant.
 * Unvisited children score +inf. Ties go to the first child in expansion order.
 */
template <core::concepts::Game Game>
class ActionSelector {
 public:
  using Node = mcts::Node<Game>;

  explicit ActionSelector(float exploration_constant) : c_(exploration_constant) {}

  float exploration_constant() const { return c_; }

  double score(const Node& parent, const Node& child) const;

  // parent must have at least one child.
  Node* select(const Node& parent) const;

 private:
  const float c_;
};

}  // namespace mcts

#include "inline/mcts/ActionSelector.inl"
