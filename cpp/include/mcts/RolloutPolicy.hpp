#pragma once

#include "core/concepts/Game.hpp"

#include <memory>
#include <random>
#include <vector>

namespace mcts {

/*
 * The default policy used to play out a simulation from a leaf to the end of the game.
 *
 * choose_move() is const and takes all of its randomness from prng, so that one policy instance
 * can be shared by concurrently running searches (see ParallelManager). Implementations that need
 * mutable state must protect it themselves.
 */
template <core::concepts::Game Game>
class RolloutPolicy {
 public:
  using State = Game::State;
  using Move = Game::Move;
  using MoveList = std::vector<Move>;
  using sptr = std::shared_ptr<const RolloutPolicy>;

  virtual ~RolloutPolicy() = default;

  // legal_moves is non-empty, and equal to Game::Rules::get_legal_moves(state).
  virtual Move choose_move(const State& state, const MoveList& legal_moves,
                           std::mt19937& prng) const = 0;
};

// Picks uniformly at random among the legal moves.
template <core::concepts::Game Game>
class UniformRandomRollout : public RolloutPolicy<Game> {
 public:
  using base_t = RolloutPolicy<Game>;
  using State = base_t::State;
  using Move = base_t::Move;
  using MoveList = base_t::MoveList;

  Move choose_move(const State&, const MoveList& legal_moves, std::mt19937& prng) const override;
};

}  // namespace mcts

#include "inline/mcts/RolloutPolicy.inl"
