#pragma once

#include <chrono>
#include <limits>
#include <optional>

namespace mcts {

/*
 * SearchParams pertain to a single call to mcts::Manager::start(). The search stops as soon as
 * either limit is reached.
 *
 * max_iterations is always an upper bound: a value <= 0 runs no iterations at all, and is only
 * accepted together with a max_duration. For a search limited by wall-clock time alone, use
 * make_timed_params(), which sets max_iterations to kUnlimitedIterations.
 *
 * The deadline is checked before each iteration; an iteration in flight always completes.
 */
struct SearchParams {
  using duration_t = std::chrono::milliseconds;

  static constexpr int kUnlimitedIterations = std::numeric_limits<int>::max();

  static SearchParams make_iteration_params(int n) { return SearchParams{n, std::nullopt}; }
  static SearchParams make_timed_params(duration_t d) {
    return SearchParams{kUnlimitedIterations, d};
  }

  auto make_options_description();
  bool operator==(const SearchParams& other) const = default;

  // Throws mcts::ConfigurationError.
  void validate() const;

  int max_iterations = 1000;
  std::optional<duration_t> max_duration;
};

}  // namespace mcts

#include "inline/mcts/SearchParams.inl"
