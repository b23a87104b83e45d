#include "mcts/SearchParams.hpp"

#include "mcts/Exceptions.hpp"
#include "util/BoostUtil.hpp"

#include <cstdint>

namespace mcts {

inline auto SearchParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Search options");

  return desc
    .template add_option<"max-iterations", 'i'>(
      po::value<int>(&max_iterations)->default_value(max_iterations),
      "maximum iterations per search (<= 0 runs none, and requires --max-duration-ms)")
    .template add_option<"max-duration-ms", 't'>(
      po::value<int64_t>()->notifier([this](int64_t ms) { max_duration = duration_t(ms); }),
      "wall-clock budget per search, in milliseconds");
}

inline void SearchParams::validate() const {
  if (max_duration && max_duration->count() < 0) {
    throw ConfigurationError("max_duration must be non-negative (got {}ms)",
                             max_duration->count());
  }
  if (max_iterations <= 0 && !max_duration) {
    throw ConfigurationError("max_iterations={} requires a max_duration", max_iterations);
  }
}

}  // namespace mcts
