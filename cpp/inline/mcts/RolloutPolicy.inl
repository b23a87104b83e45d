#include "mcts/RolloutPolicy.hpp"

#include "util/Random.hpp"

namespace mcts {

template <core::concepts::Game Game>
typename UniformRandomRollout<Game>::Move UniformRandomRollout<Game>::choose_move(
  const State&, const MoveList& legal_moves, std::mt19937& prng) const {
  return legal_moves[util::Random::uniform_sample(prng, size_t(0), legal_moves.size())];
}

}  // namespace mcts
