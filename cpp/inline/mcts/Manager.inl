#include "mcts/Manager.hpp"

#include "mcts/Exceptions.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <memory>

namespace mcts {

template <core::concepts::Game Game>
Manager<Game>::Manager(const ManagerParams& params, RolloutPolicy_sptr policy)
    : params_(params),
      action_selector_(params.exploration_constant),
      rollout_policy_(policy ? std::move(policy) : std::make_shared<UniformRandomRollout<Game>>()),
      prng_(params.random_seed ? *params.random_seed : util::Random::draw_seed()) {
  params_.validate();
}

template <core::concepts::Game Game>
void Manager<Game>::start(const State& state, const SearchParams& search_params) {
  check_not_running("start");
  search_params.validate();

  init_root(state);
  execution_state_ = kRunning;
  num_iterations_ = 0;

  auto start_time = clock_t::now();
  try {
    while (more_search_iterations_needed(search_params, start_time)) {
      run_search_iteration();
      num_iterations_++;
    }
  } catch (...) {
    LOG_DEBUG("Search aborted after {} iterations, discarding tree", num_iterations_);
    root_.reset();
    execution_state_ = kIdle;
    throw;
  }
  elapsed_ = clock_t::now() - start_time;
  execution_state_ = kDone;

  LOG_DEBUG("Search done: iterations={} root-visits={} tree-size={} elapsed={}us",
            num_iterations_, root_->visit_count(), root_->subtree_size(),
            std::chrono::duration_cast<std::chrono::microseconds>(elapsed_).count());
}

template <core::concepts::Game Game>
typename Manager<Game>::Move Manager<Game>::best_move() const {
  return results().best_move(params_.final_move_selection);
}

template <core::concepts::Game Game>
typename Manager<Game>::SearchResults Manager<Game>::results() const {
  check_not_running("results");
  if (execution_state_ != kDone) {
    throw NoIterationsError("No finished search to report on");
  }

  SearchResults results;
  results.legal_moves = root_->legal_moves();
  results.active_seat = root_->active_seat();
  for (const auto& child : root_->children()) {
    results.children.push_back(
      {child->incoming_move(), child->visit_count(), child->total_value()});
  }
  results.num_iterations = num_iterations_;
  results.root_visit_count = root_->visit_count();
  results.tree_size = root_->subtree_size();
  results.elapsed = elapsed_;
  return results;
}

template <core::concepts::Game Game>
void Manager<Game>::advance(const Move& move) {
  check_not_running("advance");
  execution_state_ = kIdle;

  if (!params_.enable_tree_reuse) {
    root_.reset();
    return;
  }
  if (!root_) return;

  Node_uptr child = root_->detach_child(move);
  if (child) {
    LOG_DEBUG("Tree reuse: keeping subtree of size {} (visits={})", child->subtree_size(),
              child->visit_count());
    root_ = std::move(child);
  } else {
    root_ = Node::make_root(Rules::apply(root_->state(), move));
  }
}

template <core::concepts::Game Game>
void Manager<Game>::reset() {
  check_not_running("reset");
  root_.reset();
  execution_state_ = kIdle;
  num_iterations_ = 0;
}

template <core::concepts::Game Game>
void Manager<Game>::init_root(const State& state) {
  if (root_ && params_.enable_tree_reuse && root_->state() == state) {
    LOG_DEBUG("Reusing tree of size {} (visits={})", root_->subtree_size(), root_->visit_count());
    return;
  }
  root_ = Node::make_root(state);
}

template <core::concepts::Game Game>
bool Manager<Game>::more_search_iterations_needed(const SearchParams& search_params,
                                                  clock_t::time_point start_time) const {
  if (root_->is_terminal()) return false;
  if (num_iterations_ >= search_params.max_iterations) return false;
  if (search_params.max_duration && clock_t::now() - start_time >= *search_params.max_duration) {
    return false;
  }
  return true;
}

template <core::concepts::Game Game>
void Manager<Game>::run_search_iteration() {
  Node* leaf = Algorithms::select_leaf(root_.get(), action_selector_);
  if (!leaf->is_terminal()) {
    leaf = Algorithms::expand(leaf);
  }

  if (leaf->is_terminal()) {
    Algorithms::backpropagate(leaf, Algorithms::terminal_values(leaf->state()));
    return;
  }

  for (int i = 0; i < params_.simulations_per_iteration; ++i) {
    ValueArray values = Algorithms::simulate(leaf->state(), *rollout_policy_, prng_);
    Algorithms::backpropagate(leaf, values);
  }
  LOG_TRACE("Iteration {}: root-visits={}", num_iterations_, root_->visit_count());
}

template <core::concepts::Game Game>
void Manager<Game>::check_not_running(const char* func) const {
  if (execution_state_ == kRunning) {
    throw InvalidStateError("Manager::{}() called while a search is running", func);
  }
}

}  // namespace mcts
