#pragma once

#include "core/BasicTypes.hpp"
#include "util/CppUtil.hpp"

#include <concepts>
#include <string>
#include <vector>

namespace core {

namespace concepts {

/*
 * All Game classes G must satisfy core::concepts::Game<G>.
 *
 * This is the entire surface that the search machinery depends on: the board representation and
 * move encoding are opaque to it.
 *
 * - G::State is a value type. Two states compare equal iff they are the same game position.
 * - G::Move labels a transition. It is only ever compared and copied.
 * - G::Rules provides five static functions:
 *
 *   get_legal_moves(state): all moves applicable in state. Empty iff the state is terminal, or a
 *     stalemate that the game scores via get_outcome().
 *
 *   apply(state, move): the successor state. Throws core::InvalidMoveError if move is not legal.
 *
 *   is_terminal(state)
 *
 *   get_outcome(state, seat): the reward of seat in a terminal state (e.g. +1 win, 0 draw, -1
 *     loss).
 *
 *   get_current_player(state): the seat to move.
 */
template <class G>
concept Game = requires(const typename G::State& state, const typename G::Move& move,
                        core::seat_index_t seat) {
  { util::decay_copy(G::Constants::kNumPlayers) } -> std::same_as<int>;

  requires std::copyable<typename G::State>;
  requires std::equality_comparable<typename G::State>;
  requires std::copyable<typename G::Move>;
  requires std::equality_comparable<typename G::Move>;

  { G::Rules::get_legal_moves(state) } -> std::same_as<std::vector<typename G::Move>>;
  { G::Rules::apply(state, move) } -> std::same_as<typename G::State>;
  { G::Rules::is_terminal(state) } -> std::same_as<bool>;
  { G::Rules::get_outcome(state, seat) } -> std::same_as<core::value_t>;
  { G::Rules::get_current_player(state) } -> std::same_as<core::seat_index_t>;
};

/*
 * Optional text support. When a Game provides it, diagnostics print moves with it.
 */
template <class G>
concept GameIO = requires(const typename G::Move& move, const typename G::State& state) {
  requires Game<G>;
  { G::IO::move_to_str(move) } -> std::same_as<std::string>;
  { G::IO::compact_state_repr(state) } -> std::same_as<std::string>;
};

}  // namespace concepts

}  // namespace core
