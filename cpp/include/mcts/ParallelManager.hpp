#pragma once

#include "core/concepts/Game.hpp"
#include "mcts/Constants.hpp"
#include "mcts/Manager.hpp"
#include "mcts/ManagerParams.hpp"
#include "mcts/RolloutPolicy.hpp"
#include "mcts/SearchParams.hpp"
#include "mcts/SearchResults.hpp"

#include <thread>
#include <vector>

namespace mcts {

struct ParallelManagerParams {
  auto make_options_description();

  // Throws mcts::ConfigurationError.
  void validate() const;

  int num_trees = 4;

  /*
   * Shared by every worker, except that worker i is seeded with random_seed + i, and that tree
   * reuse is always off.
   */
  ManagerParams manager_params;
};

/*
 * Root parallelism: num_trees independent Manager's search the same root state, each on its own
 * std::thread, with no shared mutable state besides the (const) RolloutPolicy. Once every worker
 * has finished, their root statistics are merged by move, and best_move() applies the usual
 * selection rule to the merged statistics.
 *
 * If any worker throws, all workers are still joined, and the exception of the lowest-indexed
 * failing worker is rethrown out of start().
 */
template <core::concepts::Game Game>
class ParallelManager {
 public:
  using Params = ParallelManagerParams;
  using Manager = mcts::Manager<Game>;
  using RolloutPolicy_sptr = Manager::RolloutPolicy_sptr;
  using SearchResults = mcts::SearchResults<Game>;
  using State = Game::State;
  using Move = Game::Move;

  explicit ParallelManager(const Params& params, RolloutPolicy_sptr policy = nullptr);

  const Params& params() const { return params_; }
  int num_trees() const { return params_.num_trees; }
  execution_state_t execution_state() const { return execution_state_; }

  // Same contract as Manager::start().
  void start(const State& state, const SearchParams& search_params);

  // Same contract as Manager::best_move(), over the merged statistics.
  Move best_move() const;

  const SearchResults& results() const;

 private:
  ManagerParams worker_params(int i, uint32_t base_seed) const;

  const Params params_;
  const RolloutPolicy_sptr rollout_policy_;
  SearchResults results_;
  execution_state_t execution_state_ = kIdle;
};

namespace detail {

// Joins every joinable thread in threads.
inline void join_all(std::vector<std::thread>& threads);

}  // namespace detail

}  // namespace mcts

#include "inline/mcts/ParallelManager.inl"
