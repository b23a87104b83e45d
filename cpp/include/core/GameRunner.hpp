#pragma once

#include "core/AbstractPlayer.hpp"
#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"

#include <array>
#include <string>

namespace core {

/*
 * Plays complete games between a seat-ordered array of players, synchronously on the calling
 * thread.
 *
 * An illegal move returned by a player surfaces as the core::InvalidMoveError thrown by
 * Rules::apply().
 */
template <concepts::Game Game>
class GameRunner {
 public:
  static constexpr int kNumPlayers = Game::Constants::kNumPlayers;

  using Player = AbstractPlayer<Game>;
  using player_array_t = Player::player_array_t;
  using ValueArray = Player::ValueArray;
  using State = Game::State;
  using Rules = Game::Rules;

  struct GameResult {
    State final_state;
    ValueArray outcome;
    int num_moves = 0;
  };

  struct Stats {
    std::string to_str(seat_index_t seat) const;

    std::array<int, kNumPlayers> wins = {};
    int draws = 0;
    int num_games = 0;
  };

  explicit GameRunner(const State& initial_state) : initial_state_(initial_state) {}

  GameResult play_game(const player_array_t& players);
  Stats play_games(const player_array_t& players, int num_games);

  /*
   * The seat with the strictly highest outcome, or -1 if that maximum is shared (e.g. a draw in a
   * two-player game).
   */
  static seat_index_t get_winner(const ValueArray& outcome);

 private:
  const State initial_state_;
  game_id_t next_game_id_ = 0;
};

}  // namespace core

#include "inline/core/GameRunner.inl"
