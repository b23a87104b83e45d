#pragma once

#include "core/AbstractPlayer.hpp"
#include "core/concepts/Game.hpp"
#include "util/Random.hpp"

namespace generic {

/*
 * RandomPlayer always chooses uniformly at random among the set of legal moves.
 */
template <core::concepts::Game Game>
class RandomPlayer : public core::AbstractPlayer<Game> {
 public:
  using State = Game::State;
  using Move = Game::Move;
  using Rules = Game::Rules;

  Move get_move(const State& state) override {
    auto moves = Rules::get_legal_moves(state);
    return moves[util::Random::uniform_sample(0, moves.size())];
  }
};

}  // namespace generic
