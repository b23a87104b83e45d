#include "mcts/Algorithms.hpp"

#include "util/Asserts.hpp"

namespace mcts {

template <core::concepts::Game Game>
typename Algorithms<Game>::Node* Algorithms<Game>::select_leaf(Node* root,
                                                               const ActionSelector& selector) {
  Node* node = root;
  while (!node->is_terminal() && node->is_fully_expanded()) {
    node = selector.select(*node);
  }
  return node;
}

template <core::concepts::Game Game>
typename Algorithms<Game>::Node* Algorithms<Game>::expand(Node* node) {
  DEBUG_ASSERT(!node->is_terminal());
  return node->expand();
}

template <core::concepts::Game Game>
typename Algorithms<Game>::ValueArray Algorithms<Game>::simulate(const State& state,
                                                                 const RolloutPolicy& policy,
                                                                 std::mt19937& prng) {
  State cur = state;
  while (!Rules::is_terminal(cur)) {
    auto moves = Rules::get_legal_moves(cur);
    if (moves.empty()) break;
    cur = Rules::apply(cur, policy.choose_move(cur, moves, prng));
  }
  return terminal_values(cur);
}

template <core::concepts::Game Game>
typename Algorithms<Game>::ValueArray Algorithms<Game>::terminal_values(const State& state) {
  ValueArray values;
  for (int s = 0; s < kNumPlayers; ++s) {
    values[s] = Rules::get_outcome(state, s);
  }
  return values;
}

template <core::concepts::Game Game>
void Algorithms<Game>::backpropagate(Node* node, const ValueArray& values) {
  node->record_visit(values, true);
  for (Node* ancestor = node->parent(); ancestor; ancestor = ancestor->parent()) {
    ancestor->record_visit(values, false);
  }
}

}  // namespace mcts
