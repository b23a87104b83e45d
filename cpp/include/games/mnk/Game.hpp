#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"

#include <boost/functional/hash.hpp>

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace mnk {

const core::seat_index_t kX = 0;
const core::seat_index_t kO = 1;
const core::seat_index_t kEmpty = -1;

/*
 * Position of an m,n,k-game: an M-row by N-column board on which two players alternately place a
 * stone, and the first to get K in a row (horizontally, vertically or diagonally) wins.
 *
 * Cell (row, col) has index row * N + col. X always moves first.
 */
template <int M, int N, int K>
struct State {
  static constexpr int kNumCells = M * N;

  State() { board.fill(kEmpty); }
  bool operator==(const State& other) const = default;

  size_t hash() const;
  core::seat_index_t get_player_at(int row, int col) const { return board[row * N + col]; }

  std::array<core::seat_index_t, kNumCells> board;
  int16_t num_moves = 0;
  core::seat_index_t winner = kEmpty;  // set by the move that completes K in a row
};

template <int M, int N, int K>
class Game {
 public:
  static_assert(M > 0 && N > 0, "board must be non-empty");
  static_assert(K > 0 && K <= M && K <= N, "K must be in [1, min(M, N)]");

  struct Constants {
    static constexpr const char* kGameName = "mnk";
    static constexpr int kNumPlayers = 2;
    static constexpr int kNumRows = M;
    static constexpr int kNumCols = N;
    static constexpr int kInARow = K;
    static constexpr int kNumCells = M * N;
  };

  using State = mnk::State<M, N, K>;
  using Move = core::action_t;
  using MoveList = std::vector<Move>;

  struct Rules {
    static State init_state() { return State(); }
    static MoveList get_legal_moves(const State& state);
    static State apply(const State& state, Move move);
    static bool is_terminal(const State& state);
    static core::value_t get_outcome(const State& state, core::seat_index_t seat);
    static core::seat_index_t get_current_player(const State& state);

    static Move make_move(int row, int col) { return row * N + col; }

   private:
    // Length of the run of seat's stones through cell (row, col) along direction (dr, dc).
    static int run_length(const State& state, int row, int col, int dr, int dc);
  };

  struct IO {
    static std::string move_to_str(Move move);
    static std::string player_to_str(core::seat_index_t seat) { return seat == kX ? "X" : "O"; }
    static std::string compact_state_repr(const State& state);
    static void print_state(std::ostream&, const State&);
  };
};

using TicTacToe = Game<3, 3, 3>;
using Gomoku = Game<15, 15, 5>;

}  // namespace mnk

namespace std {

template <int M, int N, int K>
struct hash<mnk::State<M, N, K>> {
  size_t operator()(const mnk::State<M, N, K>& state) const { return state.hash(); }
};

}  // namespace std

static_assert(core::concepts::Game<mnk::TicTacToe>);
static_assert(core::concepts::GameIO<mnk::TicTacToe>);

#include "inline/games/mnk/Game.inl"
