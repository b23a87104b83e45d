#pragma once

#include "core/AbstractPlayer.hpp"
#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"
#include "mcts/Manager.hpp"
#include "mcts/ManagerParams.hpp"
#include "mcts/SearchParams.hpp"

namespace generic {

/*
 * The MctsPlayer uses an mcts::Manager to select moves.
 *
 * Every state change is forwarded to Manager::advance(), so that with tree reuse enabled, the
 * subtree under the moves actually played seeds the next search.
 */
template <core::concepts::Game Game>
class MctsPlayer : public core::AbstractPlayer<Game> {
 public:
  using base_t = core::AbstractPlayer<Game>;
  using MctsManager = mcts::Manager<Game>;
  using RolloutPolicy_sptr = MctsManager::RolloutPolicy_sptr;
  using State = Game::State;
  using Move = Game::Move;

  struct Params {
    auto make_options_description();

    mcts::SearchParams search_params;
    bool verbose = false;
  };

  MctsPlayer(const Params&, const mcts::ManagerParams&, RolloutPolicy_sptr policy = nullptr);

  const MctsManager& get_manager() const { return manager_; }

  void start_game() override;
  void receive_state_change(core::seat_index_t, const State&, const Move&) override;
  Move get_move(const State&) override;

 protected:
  void verbose_dump() const;

  const Params params_;
  MctsManager manager_;
};

}  // namespace generic

#include "inline/generic_players/MctsPlayer.inl"
