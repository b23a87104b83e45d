#include "mcts/Constants.hpp"

#include "mcts/Exceptions.hpp"

namespace mcts {

inline final_move_selection_t parse_final_move_selection(const std::string& str) {
  if (str == to_str(kRobustChild)) return kRobustChild;
  if (str == to_str(kMaxChild)) return kMaxChild;
  throw ConfigurationError("Unknown final move selection: \"{}\" (expected robust or max)", str);
}

}  // namespace mcts
