#include "games/mnk/Game.hpp"

#include "core/Exceptions.hpp"
#include "util/Exception.hpp"

#include <fmt/core.h>

namespace mnk {

template <int M, int N, int K>
size_t State<M, N, K>::hash() const {
  size_t seed = boost::hash_range(board.begin(), board.end());
  boost::hash_combine(seed, num_moves);
  return seed;
}

template <int M, int N, int K>
typename Game<M, N, K>::MoveList Game<M, N, K>::Rules::get_legal_moves(const State& state) {
  MoveList moves;
  if (is_terminal(state)) return moves;

  moves.reserve(Constants::kNumCells - state.num_moves);
  for (int i = 0; i < Constants::kNumCells; ++i) {
    if (state.board[i] == kEmpty) {
      moves.push_back(i);
    }
  }
  return moves;
}

template <int M, int N, int K>
typename Game<M, N, K>::State Game<M, N, K>::Rules::apply(const State& state, Move move) {
  if (is_terminal(state)) {
    throw core::InvalidMoveError("mnk: move {} applied to a finished game", move);
  }
  if (move < 0 || move >= Constants::kNumCells) {
    throw core::InvalidMoveError("mnk: move {} is off the {}x{} board", move, M, N);
  }
  if (state.board[move] != kEmpty) {
    throw core::InvalidMoveError("mnk: cell {} is already occupied", IO::move_to_str(move));
  }

  core::seat_index_t seat = get_current_player(state);
  State next = state;
  next.board[move] = seat;
  next.num_moves++;

  int row = move / N;
  int col = move % N;
  constexpr int kDirections[4][2] = {{0, 1}, {1, 0}, {1, 1}, {1, -1}};
  for (const auto& d : kDirections) {
    int length =
      1 + run_length(next, row, col, d[0], d[1]) + run_length(next, row, col, -d[0], -d[1]);
    if (length >= K) {
      next.winner = seat;
      break;
    }
  }
  return next;
}

template <int M, int N, int K>
bool Game<M, N, K>::Rules::is_terminal(const State& state) {
  return state.winner != kEmpty || state.num_moves == Constants::kNumCells;
}

template <int M, int N, int K>
core::value_t Game<M, N, K>::Rules::get_outcome(const State& state, core::seat_index_t seat) {
  if (!is_terminal(state)) {
    throw util::Exception("mnk: outcome requested for a non-terminal state (move {})",
                          state.num_moves);
  }
  if (state.winner == kEmpty) return 0;
  return state.winner == seat ? 1 : -1;
}

template <int M, int N, int K>
core::seat_index_t Game<M, N, K>::Rules::get_current_player(const State& state) {
  return state.num_moves % 2;
}

template <int M, int N, int K>
int Game<M, N, K>::Rules::run_length(const State& state, int row, int col, int dr, int dc) {
  core::seat_index_t seat = state.board[row * N + col];
  int length = 0;
  for (int r = row + dr, c = col + dc; r >= 0 && r < M && c >= 0 && c < N; r += dr, c += dc) {
    if (state.board[r * N + c] != seat) break;
    ++length;
  }
  return length;
}

template <int M, int N, int K>
std::string Game<M, N, K>::IO::move_to_str(Move move) {
  return fmt::format("({},{})", move / N, move % N);
}

template <int M, int N, int K>
std::string Game<M, N, K>::IO::compact_state_repr(const State& state) {
  const char* syms = "_XO";

  std::string repr;
  repr.reserve(M * (N + 1));
  for (int row = 0; row < M; ++row) {
    for (int col = 0; col < N; ++col) {
      repr += syms[state.get_player_at(row, col) + 1];
    }
    repr += '\n';
  }
  return repr;
}

template <int M, int N, int K>
void Game<M, N, K>::IO::print_state(std::ostream& ss, const State& state) {
  ss << compact_state_repr(state);
  if (state.winner != kEmpty) {
    ss << player_to_str(state.winner) << " wins" << std::endl;
  } else if (Rules::is_terminal(state)) {
    ss << "draw" << std::endl;
  } else {
    ss << player_to_str(Rules::get_current_player(state)) << " to move" << std::endl;
  }
}

}  // namespace mnk
