#include "mcts/ParallelManager.hpp"

#include "mcts/Exceptions.hpp"
#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <exception>
#include <memory>
#include <thread>
#include <vector>

namespace mcts {

namespace detail {

inline void join_all(std::vector<std::thread>& threads) {
  for (auto& thread : threads) {
    if (thread.joinable()) thread.join();
  }
}

}  // namespace detail

inline auto ParallelManagerParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Parallel search options");

  auto out = desc.template add_option<"num-trees", 'n'>(
    po::value<int>(&num_trees)->default_value(num_trees), "number of trees searched in parallel");

  return out.add(manager_params.make_options_description());
}

inline void ParallelManagerParams::validate() const {
  if (num_trees < 1) {
    throw ConfigurationError("num_trees must be positive (got {})", num_trees);
  }
  manager_params.validate();
}

template <core::concepts::Game Game>
ParallelManager<Game>::ParallelManager(const Params& params, RolloutPolicy_sptr policy)
    : params_(params), rollout_policy_(std::move(policy)) {
  params_.validate();
}

template <core::concepts::Game Game>
void ParallelManager<Game>::start(const State& state, const SearchParams& search_params) {
  if (execution_state_ == kRunning) {
    throw InvalidStateError("ParallelManager::start() called while a search is running");
  }
  search_params.validate();

  const auto& seed = params_.manager_params.random_seed;
  uint32_t base_seed = seed ? *seed : util::Random::draw_seed();

  int n = num_trees();
  std::vector<std::unique_ptr<Manager>> managers;
  for (int i = 0; i < n; ++i) {
    managers.push_back(std::make_unique<Manager>(worker_params(i, base_seed), rollout_policy_));
  }

  execution_state_ = kRunning;
  std::vector<std::exception_ptr> errors(n);
  std::vector<std::thread> threads;
  try {
    for (int i = 0; i < n; ++i) {
      threads.emplace_back([&, i] {
        try {
          managers[i]->start(state, search_params);
        } catch (...) {
          errors[i] = std::current_exception();
        }
      });
    }
  } catch (...) {
    // Workers already launched reference managers, errors and state.
    detail::join_all(threads);
    execution_state_ = kIdle;
    throw;
  }
  detail::join_all(threads);

  for (const auto& error : errors) {
    if (error) {
      execution_state_ = kIdle;
      std::rethrow_exception(error);
    }
  }

  results_ = SearchResults();
  for (const auto& manager : managers) {
    results_.merge(manager->results());
  }
  execution_state_ = kDone;

  LOG_DEBUG("Parallel search done: trees={} iterations={} merged-children={}", n,
            results_.num_iterations, results_.children.size());
}

template <core::concepts::Game Game>
typename ParallelManager<Game>::Move ParallelManager<Game>::best_move() const {
  return results().best_move(params_.manager_params.final_move_selection);
}

template <core::concepts::Game Game>
const typename ParallelManager<Game>::SearchResults& ParallelManager<Game>::results() const {
  if (execution_state_ == kRunning) {
    throw InvalidStateError("ParallelManager::results() called while a search is running");
  }
  if (execution_state_ != kDone) {
    throw NoIterationsError("No finished search to report on");
  }
  return results_;
}

template <core::concepts::Game Game>
ManagerParams ParallelManager<Game>::worker_params(int i, uint32_t base_seed) const {
  ManagerParams params = params_.manager_params;
  params.random_seed = base_seed + i;
  params.enable_tree_reuse = false;
  return params;
}

}  // namespace mcts
