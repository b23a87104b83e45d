#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"
#include "mcts/ActionSelector.hpp"
#include "mcts/Algorithms.hpp"
#include "mcts/Constants.hpp"
#include "mcts/ManagerParams.hpp"
#include "mcts/Node.hpp"
#include "mcts/RolloutPolicy.hpp"
#include "mcts/SearchParams.hpp"
#include "mcts/SearchResults.hpp"

#include <chrono>
#include <random>

namespace mcts {

/*
 * The Manager class is the main entry point for doing MCTS searches.
 *
 * It owns the search tree, and drives it through the execution states described in
 * mcts/Constants.hpp:
 *
 * - start() builds (or reuses) the root and runs iterations until the SearchParams budget is
 *   exhausted. It returns in kDone.
 * - best_move() / results() read the root statistics of the finished search.
 * - advance() and reset() return to kIdle, keeping the subtree under a played move or nothing.
 *
 * Every iteration runs to completion before the next begins. If an iteration throws (for example
 * a core::InvalidMoveError out of a faulty RolloutPolicy), the tree is discarded, the Manager
 * returns to kIdle, and the exception propagates out of start().
 *
 * Not thread-safe. See mcts::ParallelManager for searching several trees concurrently.
 */
template <core::concepts::Game Game>
class Manager {
 public:
  using Node = mcts::Node<Game>;
  using Node_uptr = Node::Node_uptr;
  using ActionSelector = mcts::ActionSelector<Game>;
  using Algorithms = mcts::Algorithms<Game>;
  using RolloutPolicy = mcts::RolloutPolicy<Game>;
  using RolloutPolicy_sptr = RolloutPolicy::sptr;
  using SearchResults = mcts::SearchResults<Game>;
  using ValueArray = Node::ValueArray;
  using State = Game::State;
  using Move = Game::Move;
  using Rules = Game::Rules;

  using clock_t = std::chrono::steady_clock;

  /*
   * Throws mcts::ConfigurationError if params is invalid. If policy is nullptr, rollouts pick
   * uniformly at random.
   */
  explicit Manager(const ManagerParams& params, RolloutPolicy_sptr policy = nullptr);

  Manager(const Manager&) = delete;
  Manager& operator=(const Manager&) = delete;

  const ManagerParams& params() const { return params_; }
  execution_state_t execution_state() const { return execution_state_; }

  // nullptr until the first start().
  const Node* root() const { return root_.get(); }

  // Iterations run by the last start() call.
  int num_iterations() const { return num_iterations_; }

  /*
   * Runs a search from state. Throws mcts::InvalidStateError if a search is already running, and
   * mcts::ConfigurationError if search_params is invalid.
   */
  void start(const State& state, const SearchParams& search_params);

  /*
   * The move chosen by the last search, per params().final_move_selection.
   *
   * Throws mcts::InvalidStateError while running, and mcts::NoIterationsError when there is no
   * finished search or nothing to decide from (see SearchResults::best_move()).
   */
  Move best_move() const;

  // Same preconditions as best_move().
  SearchResults results() const;

  /*
   * Records that move was played from the current root. With tree reuse enabled, the subtree under
   * move becomes the new root (built fresh if it was never expanded); otherwise the tree is
   * discarded. Returns to kIdle.
   *
   * Throws mcts::InvalidStateError while running, and core::InvalidMoveError if move is illegal
   * at the root.
   */
  void advance(const Move& move);

  void reset();

 private:
  void init_root(const State& state);
  bool more_search_iterations_needed(const SearchParams&, clock_t::time_point start_time) const;
  void run_search_iteration();
  void check_not_running(const char* func) const;

  const ManagerParams params_;
  const ActionSelector action_selector_;
  const RolloutPolicy_sptr rollout_policy_;
  std::mt19937 prng_;

  Node_uptr root_;
  execution_state_t execution_state_ = kIdle;
  int num_iterations_ = 0;
  clock_t::duration elapsed_{0};
};

}  // namespace mcts

#include "inline/mcts/Manager.inl"
