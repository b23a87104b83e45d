#include "mcts/ManagerParams.hpp"

#include "mcts/Exceptions.hpp"
#include "util/BoostUtil.hpp"

#include <string>

namespace mcts {

inline auto ManagerParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Manager options");

  return desc
    .template add_option<"exploration-constant", 'c'>(
      po2::default_value("{:.3f}", &exploration_constant), "UCT exploration constant")
    .template add_option<"mcts-seed">(
      po::value<uint32_t>()->notifier([this](uint32_t seed) { random_seed = seed; }),
      "seed for the search prng (default: drawn from --seed)")
    .template add_option<"final-move-selection">(
      po::value<std::string>()
        ->default_value(to_str(final_move_selection))
        ->notifier([this](const std::string& s) {
          final_move_selection = parse_final_move_selection(s);
        }),
      "how the move to play is picked from the root children (robust|max)")
    .template add_hidden_option<"simulations-per-iteration">(
      po::value<int>(&simulations_per_iteration)->default_value(simulations_per_iteration),
      "rollouts played from each newly expanded node")
    .template add_flag<"enable-tree-reuse", "disable-tree-reuse">(
      &enable_tree_reuse, "keep the subtree under the played move between searches",
      "discard the tree between searches");
}

inline void ManagerParams::validate() const {
  if (!(exploration_constant >= 0)) {
    throw ConfigurationError("exploration_constant must be non-negative (got {})",
                             exploration_constant);
  }
  if (simulations_per_iteration < 1) {
    throw ConfigurationError("simulations_per_iteration must be positive (got {})",
                             simulations_per_iteration);
  }
  if (final_move_selection != kRobustChild && final_move_selection != kMaxChild) {
    throw ConfigurationError("Unknown final_move_selection: {}", int(final_move_selection));
  }
}

}  // namespace mcts
