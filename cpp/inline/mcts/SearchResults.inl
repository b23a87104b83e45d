#include "mcts/SearchResults.hpp"

#include "mcts/Exceptions.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>

namespace mcts {

namespace detail {

template <typename Game>
std::string move_repr(const typename Game::Move& move) {
  if constexpr (core::concepts::GameIO<Game>) {
    return Game::IO::move_to_str(move);
  } else if constexpr (fmt::is_formattable<typename Game::Move>::value) {
    return fmt::format("{}", move);
  } else {
    return "?";
  }
}

}  // namespace detail

template <core::concepts::Game Game>
typename SearchResults<Game>::Move SearchResults<Game>::best_move(
  final_move_selection_t selection) const {
  if (legal_moves.empty()) {
    throw NoIterationsError("No legal moves at the search root");
  }

  const ChildStats* best = nullptr;
  for (const ChildStats& child : children) {
    if (child.visit_count == 0) continue;
    if (!best) {
      best = &child;
      continue;
    }

    bool better;
    if (selection == kRobustChild) {
      better = child.visit_count > best->visit_count ||
               (child.visit_count == best->visit_count && child.mean_value() > best->mean_value());
    } else {
      better = child.mean_value() > best->mean_value() ||
               (child.mean_value() == best->mean_value() && child.visit_count > best->visit_count);
    }
    if (better) best = &child;
  }

  if (best) return best->move;
  if (legal_moves.size() == 1) return legal_moves[0];
  throw NoIterationsError("No search iterations completed ({} legal moves to choose from)",
                          legal_moves.size());
}

template <core::concepts::Game Game>
void SearchResults<Game>::merge(const SearchResults& other) {
  if (legal_moves.empty()) {
    legal_moves = other.legal_moves;
    active_seat = other.active_seat;
  }

  for (const ChildStats& stats : other.children) {
    auto it = std::find_if(children.begin(), children.end(),
                           [&](const ChildStats& c) { return c.move == stats.move; });
    if (it != children.end()) {
      it->visit_count += stats.visit_count;
      it->total_value += stats.total_value;
    } else {
      children.push_back(stats);
    }
  }

  num_iterations += other.num_iterations;
  root_visit_count += other.root_visit_count;
  tree_size += other.tree_size;
  elapsed = std::max(elapsed, other.elapsed);
}

template <core::concepts::Game Game>
const typename SearchResults<Game>::ChildStats* SearchResults<Game>::find_child(
  const Move& move) const {
  for (const ChildStats& child : children) {
    if (child.move == move) return &child;
  }
  return nullptr;
}

template <core::concepts::Game Game>
int64_t SearchResults<Game>::total_child_visits() const {
  int64_t total = 0;
  for (const ChildStats& child : children) {
    total += child.visit_count;
  }
  return total;
}

template <core::concepts::Game Game>
void SearchResults<Game>::print(std::ostream& os) const {
  double ms = std::chrono::duration<double, std::milli>(elapsed).count();
  os << fmt::format("iterations={} root-visits={} tree-size={} elapsed={:.1f}ms\n", num_iterations,
                    root_visit_count, tree_size, ms);
  os << fmt::format("{:>8} | {:>8} | {:>8}\n", "move", "N", "Q");
  for (const ChildStats& child : children) {
    os << fmt::format("{:>8} | {:8d} | {:8.3f}\n", detail::move_repr<Game>(child.move),
                      child.visit_count, child.mean_value());
  }
}

}  // namespace mcts
