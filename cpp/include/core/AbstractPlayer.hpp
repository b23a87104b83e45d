#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"

#include <array>
#include <string>

namespace core {

/*
 * Base class for all players.
 *
 * There are 4 main virtual functions to override:
 *
 * - start_game()
 * - receive_state_change()
 * - get_move()
 * - end_game()
 *
 * start_game() and end_game() are called when a game starts or ends. A single player might play
 * multiple games in succession, so you should override these if there is state that you want to
 * clear between games.
 *
 * receive_state_change() is called after every move, with the state that the move produced. This
 * is where you should update your internal state. Note that you get this callback even after you
 * make your own move, as a sort of "echo" of your own move.
 *
 * get_move() is called when it is your turn to move.
 */
template <concepts::Game Game>
class AbstractPlayer {
 public:
  using State = Game::State;
  using Move = Game::Move;
  using ValueArray = std::array<value_t, Game::Constants::kNumPlayers>;
  using player_array_t = std::array<AbstractPlayer*, Game::Constants::kNumPlayers>;
  using player_name_array_t = std::array<std::string, Game::Constants::kNumPlayers>;

  virtual ~AbstractPlayer() = default;
  void set_name(const std::string& name) { name_ = name; }
  const std::string& get_name() const { return name_; }
  const player_name_array_t& get_player_names() const { return player_names_; }
  game_id_t get_game_id() const { return game_id_; }
  seat_index_t get_my_seat() const { return my_seat_; }

  void init_game(game_id_t game_id, const player_name_array_t& player_names,
                 seat_index_t seat_assignment);

  virtual void start_game() {}

  // The seat_index_t made the Move, and the State is the result.
  virtual void receive_state_change(seat_index_t, const State&, const Move&) {}

  /*
   * state is guaranteed to be identical to the State last received via receive_state_change(), or
   * the initial state if no move has been made yet. The returned move must be legal.
   */
  virtual Move get_move(const State& state) = 0;

  // The ValueArray holds Rules::get_outcome(state, s) for each seat s.
  virtual void end_game(const State&, const ValueArray&) {}

 private:
  std::string name_;
  player_name_array_t player_names_;
  game_id_t game_id_ = -1;
  seat_index_t my_seat_ = -1;
};

}  // namespace core

#include "inline/core/AbstractPlayer.inl"
