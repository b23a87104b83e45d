#include "minimax/Solver.hpp"

#include "util/Exception.hpp"

#include <algorithm>
#include <limits>

namespace minimax {

namespace detail {

constexpr core::value_t kInf = std::numeric_limits<core::value_t>::infinity();

}  // namespace detail

template <core::concepts::Game Game>
Solver<Game>::Solver(const Params& params, eval_func_t eval)
    : params_(params), eval_(std::move(eval)) {
  if (params_.max_depth > 0 && !eval_) {
    throw util::CleanException("minimax::Solver: max_depth={} requires an evaluation function",
                               params_.max_depth);
  }
}

template <core::concepts::Game Game>
core::value_t Solver<Game>::evaluate(const State& state) {
  return negamax(state, 0, -detail::kInf, detail::kInf);
}

template <core::concepts::Game Game>
core::value_t Solver<Game>::move_value(const State& state, const Move& move) {
  core::seat_index_t seat = Rules::get_current_player(state);
  return child_value(Rules::apply(state, move), seat, 1, -detail::kInf, detail::kInf);
}

template <core::concepts::Game Game>
typename Solver<Game>::MoveList Solver<Game>::optimal_moves(const State& state) {
  MoveList moves;
  if (!Rules::is_terminal(state)) moves = Rules::get_legal_moves(state);
  if (moves.empty()) {
    throw util::CleanException("minimax::Solver: no legal moves to choose from");
  }

  std::vector<core::value_t> values;
  for (const Move& move : moves) {
    values.push_back(move_value(state, move));
  }
  core::value_t best = *std::max_element(values.begin(), values.end());

  MoveList out;
  for (size_t i = 0; i < moves.size(); ++i) {
    if (values[i] == best) out.push_back(moves[i]);
  }
  return out;
}

template <core::concepts::Game Game>
typename Solver<Game>::Move Solver<Game>::best_move(const State& state) {
  return optimal_moves(state)[0];
}

template <core::concepts::Game Game>
core::value_t Solver<Game>::negamax(const State& state, int depth, core::value_t alpha,
                                    core::value_t beta) {
  num_nodes_searched_++;
  core::seat_index_t seat = Rules::get_current_player(state);
  if (Rules::is_terminal(state)) return Rules::get_outcome(state, seat);

  MoveList moves = Rules::get_legal_moves(state);
  if (moves.empty()) return Rules::get_outcome(state, seat);
  if (params_.max_depth > 0 && depth >= params_.max_depth) return eval_(state, seat);

  core::value_t alpha0 = alpha;
  if (caching()) {
    auto it = cache_.find(state);
    if (it != cache_.end()) {
      const CacheEntry& entry = it->second;
      switch (entry.bound) {
        case kExact:
          return entry.value;
        case kLowerBound:
          alpha = std::max(alpha, entry.value);
          break;
        case kUpperBound:
          beta = std::min(beta, entry.value);
          break;
      }
      if (alpha >= beta) return entry.value;
    }
  }

  core::value_t best = -detail::kInf;
  for (const Move& move : moves) {
    core::value_t v = child_value(Rules::apply(state, move), seat, depth + 1, alpha, beta);
    best = std::max(best, v);
    alpha = std::max(alpha, best);
    if (params_.alpha_beta && alpha >= beta) break;
  }

  if (caching()) {
    bound_t bound = kExact;
    if (best <= alpha0) {
      bound = kUpperBound;
    } else if (best >= beta) {
      bound = kLowerBound;
    }
    cache_[state] = CacheEntry{best, bound};
  }
  return best;
}

template <core::concepts::Game Game>
core::value_t Solver<Game>::child_value(const State& child, core::seat_index_t seat, int depth,
                                        core::value_t alpha, core::value_t beta) {
  if (Rules::is_terminal(child)) return Rules::get_outcome(child, seat);
  if (Rules::get_current_player(child) == seat) return negamax(child, depth, alpha, beta);
  return -negamax(child, depth, -beta, -alpha);
}

}  // namespace minimax
