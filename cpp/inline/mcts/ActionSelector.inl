#include "mcts/ActionSelector.hpp"

#include "util/Asserts.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace mcts {

template <core::concepts::Game Game>
double ActionSelector<Game>::score(const Node& parent, const Node& child) const {
  int64_t n = child.visit_count();
  if (n == 0) return std::numeric_limits<double>::infinity();

  int64_t N = std::max<int64_t>(parent.visit_count(), 1);
  return child.mean_value() + c_ * std::sqrt(std::log(double(N)) / n);
}

template <core::concepts::Game Game>
typename ActionSelector<Game>::Node* ActionSelector<Game>::select(const Node& parent) const {
  RELEASE_ASSERT(!parent.children().empty(), "select() called on a node without children");

  Node* best = nullptr;
  double best_score = -std::numeric_limits<double>::infinity();
  for (const auto& child : parent.children()) {
    double s = score(parent, *child);
    if (!best || s > best_score) {
      best = child.get();
      best_score = s;
    }
  }
  return best;
}

}  // namespace mcts
