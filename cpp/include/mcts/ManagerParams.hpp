#pragma once

#include "mcts/Constants.hpp"

#include <cstdint>
#include <numbers>
#include <optional>

namespace mcts {

/*
 * ManagerParams pertain to a single mcts::Manager instance, and stay fixed for its lifetime.
 *
 * By contrast, SearchParams pertain to a single Manager::start() call.
 */
struct ManagerParams {
  auto make_options_description();
  bool operator==(const ManagerParams& other) const = default;

  // Throws mcts::ConfigurationError.
  void validate() const;

  float exploration_constant = std::numbers::sqrt2_v<float>;

  /*
   * Seeds the Manager's private prng. If unset, a seed is drawn from util::Random's default prng,
   * so that --seed still makes a whole program reproducible.
   */
  std::optional<uint32_t> random_seed;

  final_move_selection_t final_move_selection = kRobustChild;

  // Number of rollouts played from each newly expanded node. Each is backpropagated separately.
  int simulations_per_iteration = 1;

  /*
   * If true, the subtree under the move passed to Manager::advance() is kept and seeds the next
   * search from the matching state.
   */
  bool enable_tree_reuse = false;
};

}  // namespace mcts

#include "inline/mcts/ManagerParams.inl"
