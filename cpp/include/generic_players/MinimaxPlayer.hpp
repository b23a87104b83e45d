#pragma once

#include "core/AbstractPlayer.hpp"
#include "core/concepts/Game.hpp"
#include "minimax/Solver.hpp"
#include "util/Random.hpp"

namespace generic {

/*
 * MinimaxPlayer plays a move of maximal minimax value. With randomize_ties, it picks uniformly
 * among all such moves; otherwise it picks the first in legal-move order.
 *
 * The solver's memo cache is kept across games.
 */
template <core::concepts::Game Game>
class MinimaxPlayer : public core::AbstractPlayer<Game> {
 public:
  using Solver = minimax::Solver<Game>;
  using State = Game::State;
  using Move = Game::Move;

  struct Params {
    typename Solver::Params solver_params;
    bool randomize_ties = true;
  };

  explicit MinimaxPlayer(const Params& params, typename Solver::eval_func_t eval = nullptr)
      : params_(params), solver_(params.solver_params, std::move(eval)) {}

  Move get_move(const State& state) override {
    if (!params_.randomize_ties) return solver_.best_move(state);

    auto moves = solver_.optimal_moves(state);
    return moves[util::Random::uniform_sample(0, moves.size())];
  }

  const Solver& solver() const { return solver_; }

 private:
  const Params params_;
  Solver solver_;
};

}  // namespace generic
