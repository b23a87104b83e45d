#pragma once

#include <cstdint>
#include <string>

namespace mcts {

/*
 * Lifecycle of a Manager:
 *
 * kIdle -> start() -> kRunning -> (budget exhausted) -> kDone
 *
 * From kDone, start() runs a new search, and reset()/advance() return to kIdle.
 */
enum execution_state_t : int8_t { kIdle, kRunning, kDone };

/*
 * How the move to play is picked from the root children once the budget is exhausted. Ties on the
 * primary key fall back to the secondary key, then to expansion order.
 *
 * kRobustChild: most visits, then highest mean value.
 * kMaxChild: highest mean value, then most visits.
 */
enum final_move_selection_t : int8_t { kRobustChild, kMaxChild };

inline const char* to_str(execution_state_t state) {
  switch (state) {
    case kIdle:
      return "idle";
    case kRunning:
      return "running";
    case kDone:
      return "done";
  }
  return "?";
}

inline const char* to_str(final_move_selection_t selection) {
  return selection == kRobustChild ? "robust" : "max";
}

// Throws mcts::ConfigurationError for anything other than "robust" or "max".
final_move_selection_t parse_final_move_selection(const std::string& str);

}  // namespace mcts

#include "inline/mcts/Constants.inl"
