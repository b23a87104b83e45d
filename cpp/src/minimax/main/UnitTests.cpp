#include "games/mnk/Game.hpp"
#include "minimax/Solver.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

/*
 * Tests minimax::Solver against known tic-tac-toe values.
 */

using Game = mnk::TicTacToe;
using State = Game::State;
using Move = Game::Move;
using Rules = Game::Rules;
using Solver = minimax::Solver<Game>;

template <typename... Ts>
State make_state(Ts... moves) {
  State state = Rules::init_state();
  for (int move : {moves...}) {
    state = Rules::apply(state, move);
  }
  return state;
}

bool contains(const std::vector<Move>& moves, Move move) {
  return std::find(moves.begin(), moves.end(), move) != moves.end();
}

TEST(Solver, empty_board_is_a_draw) {
  Solver solver;
  EXPECT_EQ(solver.evaluate(Rules::init_state()), 0);

  // Every opening move draws.
  EXPECT_EQ(solver.optimal_moves(Rules::init_state()).size(), 9u);
  EXPECT_GT(solver.cache_size(), 0u);
}

TEST(Solver, immediate_win) {
  // X: 0 1, O: 3 4
  Solver solver;
  State state = make_state(0, 3, 1, 4);
  EXPECT_EQ(solver.evaluate(state), 1);
  EXPECT_EQ(solver.best_move(state), 2);
  EXPECT_EQ(solver.move_value(state, 2), 1);
  EXPECT_EQ(solver.move_value(state, 8), -1);  // O completes 3-4-5
}

TEST(Solver, forced_block) {
  // X: 0 8, O: 4 2. O threatens 6.
  Solver solver;
  State state = make_state(0, 4, 8, 2);
  EXPECT_EQ(solver.optimal_moves(state), std::vector<Move>{6});
  EXPECT_EQ(solver.evaluate(state), 1);  // blocking at 6 forks 3 and 7
}

TEST(Solver, edge_reply_to_center_loses) {
  // X: 4, O: 1. X to move has a forced win.
  Solver solver;
  State state = make_state(4, 1);
  EXPECT_EQ(solver.evaluate(state), 1);
  for (Move move : solver.optimal_moves(state)) {
    EXPECT_EQ(solver.move_value(state, move), 1);
  }
  EXPECT_TRUE(contains(solver.optimal_moves(state), 0));  // corner next to O's edge
}

TEST(Solver, corner_reply_to_center_draws) {
  Solver solver;
  EXPECT_EQ(solver.evaluate(make_state(4, 0)), 0);
}

TEST(Solver, pruning_and_caching_agree) {
  std::vector<State> states = {Rules::init_state(), make_state(4), make_state(0, 4),
                               make_state(4, 1), make_state(0, 8, 2), make_state(1, 4, 7)};

  Solver::Params plain_params;
  plain_params.alpha_beta = false;
  plain_params.use_cache = false;

  Solver plain(plain_params);
  Solver pruned;
  for (const State& state : states) {
    EXPECT_EQ(plain.evaluate(state), pruned.evaluate(state));
    for (Move move : Rules::get_legal_moves(state)) {
      EXPECT_EQ(plain.move_value(state, move), pruned.move_value(state, move));
    }
  }
  EXPECT_EQ(plain.cache_size(), 0u);
  EXPECT_LT(pruned.num_nodes_searched(), plain.num_nodes_searched());
}

TEST(Solver, terminal_state) {
  Solver solver;
  State state = make_state(0, 3, 1, 4, 2);
  EXPECT_EQ(solver.evaluate(state), -1);  // O to move, X has won
  EXPECT_THROW(solver.optimal_moves(state), util::CleanException);
}

TEST(Solver, depth_limited) {
  Solver::Params params;
  params.max_depth = 1;
  EXPECT_THROW(Solver{params}, util::CleanException);

  // Prefers the center when looking one ply ahead.
  auto eval = [](const State& state, core::seat_index_t seat) -> core::value_t {
    core::seat_index_t center = state.board[4];
    if (center == mnk::kEmpty) return 0;
    return center == seat ? 0.5 : -0.5;
  };
  Solver solver(params, eval);
  EXPECT_EQ(solver.optimal_moves(Rules::init_state()), std::vector<Move>{4});
  EXPECT_EQ(solver.move_value(Rules::init_state(), 4), 0.5);
  EXPECT_EQ(solver.cache_size(), 0u);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
