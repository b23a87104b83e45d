#include "generic_players/MctsPlayer.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <sstream>

namespace generic {

template <core::concepts::Game Game>
auto MctsPlayer<Game>::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("MctsPlayer options");

  auto out = desc.template add_option<"verbose", 'v'>(
    po::bool_switch(&verbose)->default_value(verbose), "MCTS player verbose mode");

  return out.add(search_params.make_options_description());
}

template <core::concepts::Game Game>
MctsPlayer<Game>::MctsPlayer(const Params& params, const mcts::ManagerParams& manager_params,
                             RolloutPolicy_sptr policy)
    : params_(params), manager_(manager_params, std::move(policy)) {
  params_.search_params.validate();
}

template <core::concepts::Game Game>
void MctsPlayer<Game>::start_game() {
  manager_.reset();
}

template <core::concepts::Game Game>
void MctsPlayer<Game>::receive_state_change(core::seat_index_t, const State&, const Move& move) {
  manager_.advance(move);
}

template <core::concepts::Game Game>
typename MctsPlayer<Game>::Move MctsPlayer<Game>::get_move(const State& state) {
  manager_.start(state, params_.search_params);
  if (params_.verbose) {
    verbose_dump();
  }
  return manager_.best_move();
}

template <core::concepts::Game Game>
void MctsPlayer<Game>::verbose_dump() const {
  std::ostringstream ss;
  manager_.results().print(ss);
  LOG_INFO("MctsPlayer {} (seat={}):\n{}", this->get_name(), int(this->get_my_seat()), ss.str());
}

}  // namespace generic
