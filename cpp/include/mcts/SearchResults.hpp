#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"
#include "mcts/Constants.hpp"

#include <chrono>
#include <cstdint>
#include <ostream>
#include <vector>

namespace mcts {

/*
 * A snapshot of the root of a finished search: everything needed to pick a move, and to analyze
 * how the search spent its budget.
 *
 * children lists the expanded root children in expansion order. mean_value is from the
 * perspective of the seat to move at the root.
 */
template <core::concepts::Game Game>
struct SearchResults {
  using Move = Game::Move;
  using MoveList = std::vector<Move>;

  struct ChildStats {
    Move move;
    int64_t visit_count = 0;
    double total_value = 0;

    double mean_value() const { return visit_count ? total_value / visit_count : 0; }
  };
  using ChildStatsList = std::vector<ChildStats>;

  /*
   * Returns the move to play.
   *
   * Throws mcts::NoIterationsError if there are no legal moves, or if no child has been visited
   * and there is more than one legal move. With exactly one legal move, that move is returned even
   * without statistics.
   */
  Move best_move(final_move_selection_t selection) const;

  /*
   * Adds other's statistics into this. Children are matched by move; moves not yet present are
   * appended in the order they appear in other.
   */
  void merge(const SearchResults& other);

  const ChildStats* find_child(const Move& move) const;
  int64_t total_child_visits() const;

  void print(std::ostream& os) const;

  MoveList legal_moves;
  ChildStatsList children;
  core::seat_index_t active_seat = -1;
  int64_t num_iterations = 0;  // summed over trees after merge()
  int64_t root_visit_count = 0;
  int tree_size = 0;
  std::chrono::nanoseconds elapsed{0};
};

}  // namespace mcts

#include "inline/mcts/SearchResults.inl"
