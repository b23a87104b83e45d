#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace minimax {

/*
 * Negamax search with alpha-beta pruning over any two-player zero-sum Game, i.e. one where
 * get_outcome(state, 0) == -get_outcome(state, 1) for every leaf.
 *
 * Values are always from the perspective of the seat to move in the state being evaluated. A game
 * where the same seat moves twice in a row is handled: the value is only negated across a change
 * of the seat to move.
 *
 * Without a depth limit, the search is exact, and results are memoized in a transposition table
 * keyed by State (requires std::hash<State>). Entries found under a narrowed alpha-beta window are
 * stored as bounds rather than exact values. The table persists across calls until clear_cache().
 *
 * With a depth limit, states at the limit are scored by the supplied evaluation function, and no
 * memoization takes place.
 */
template <core::concepts::Game Game>
class Solver {
 public:
  using State = Game::State;
  using Move = Game::Move;
  using Rules = Game::Rules;
  using MoveList = std::vector<Move>;

  // Returns the value of state for seat.
  using eval_func_t = std::function<core::value_t(const State&, core::seat_index_t)>;

  static_assert(Game::Constants::kNumPlayers == 2, "minimax::Solver requires a two-player game");

  struct Params {
    int max_depth = 0;  // <= 0 means unlimited
    bool alpha_beta = true;
    bool use_cache = true;
  };

  /*
   * eval is required iff params.max_depth > 0; a util::CleanException is thrown otherwise.
   */
  explicit Solver(const Params& params = Params(), eval_func_t eval = nullptr);

  // Value of state for the seat to move.
  core::value_t evaluate(const State& state);

  // Value, for the seat to move in state, of playing move.
  core::value_t move_value(const State& state, const Move& move);

  /*
   * All legal moves of state whose value is maximal, in legal-move order. Throws
   * util::CleanException if state has no legal moves.
   */
  MoveList optimal_moves(const State& state);

  // The first of optimal_moves(state).
  Move best_move(const State& state);

  void clear_cache() { cache_.clear(); }
  size_t cache_size() const { return cache_.size(); }
  uint64_t num_nodes_searched() const { return num_nodes_searched_; }

 private:
  enum bound_t : int8_t { kExact, kLowerBound, kUpperBound };

  struct CacheEntry {
    core::value_t value;
    bound_t bound;
  };

  using cache_t = std::unordered_map<State, CacheEntry>;

  bool caching() const { return params_.use_cache && params_.max_depth <= 0; }

  core::value_t negamax(const State& state, int depth, core::value_t alpha, core::value_t beta);

  // Value of child for seat, where child was reached by a move of seat.
  core::value_t child_value(const State& child, core::seat_index_t seat, int depth,
                            core::value_t alpha, core::value_t beta);

  const Params params_;
  const eval_func_t eval_;
  cache_t cache_;
  uint64_t num_nodes_searched_ = 0;
};

}  // namespace minimax

#include "inline/minimax/Solver.inl"
