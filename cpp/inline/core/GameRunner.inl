#include "core/GameRunner.hpp"

#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <fmt/format.h>

namespace core {

template <concepts::Game Game>
std::string GameRunner<Game>::Stats::to_str(seat_index_t seat) const {
  int losses = num_games - wins[seat] - draws;
  return fmt::format("W{} L{} D{} [{}/{}]", wins[seat], losses, draws, wins[seat], num_games);
}

template <concepts::Game Game>
typename GameRunner<Game>::GameResult GameRunner<Game>::play_game(const player_array_t& players) {
  game_id_t game_id = next_game_id_++;

  typename Player::player_name_array_t names;
  for (int p = 0; p < kNumPlayers; ++p) {
    RELEASE_ASSERT(players[p] != nullptr, "null player at seat {}", p);
    names[p] = players[p]->get_name();
  }
  for (int p = 0; p < kNumPlayers; ++p) {
    players[p]->init_game(game_id, names, p);
    players[p]->start_game();
  }

  GameResult result{initial_state_, {}, 0};
  State& state = result.final_state;
  while (!Rules::is_terminal(state) && !Rules::get_legal_moves(state).empty()) {
    seat_index_t seat = Rules::get_current_player(state);
    auto move = players[seat]->get_move(state);
    state = Rules::apply(state, move);
    result.num_moves++;

    for (int p = 0; p < kNumPlayers; ++p) {
      players[p]->receive_state_change(seat, state, move);
    }
  }

  for (int p = 0; p < kNumPlayers; ++p) {
    result.outcome[p] = Rules::get_outcome(state, p);
  }
  for (int p = 0; p < kNumPlayers; ++p) {
    players[p]->end_game(state, result.outcome);
  }

  LOG_DEBUG("Game {} complete after {} moves: winner={}", game_id, result.num_moves,
            int(get_winner(result.outcome)));
  return result;
}

template <concepts::Game Game>
typename GameRunner<Game>::Stats GameRunner<Game>::play_games(const player_array_t& players,
                                                              int num_games) {
  Stats stats;
  for (int g = 0; g < num_games; ++g) {
    GameResult result = play_game(players);
    seat_index_t winner = get_winner(result.outcome);
    if (winner < 0) {
      stats.draws++;
    } else {
      stats.wins[winner]++;
    }
    stats.num_games++;
  }

  LOG_INFO("All games complete!");
  for (int p = 0; p < kNumPlayers; ++p) {
    LOG_INFO("seat={} name={} {}", p, players[p]->get_name(), stats.to_str(p));
  }
  return stats;
}

template <concepts::Game Game>
seat_index_t GameRunner<Game>::get_winner(const ValueArray& outcome) {
  seat_index_t winner = 0;
  bool shared = false;
  for (int p = 1; p < kNumPlayers; ++p) {
    if (outcome[p] > outcome[winner]) {
      winner = p;
      shared = false;
    } else if (outcome[p] == outcome[winner]) {
      shared = true;
    }
  }
  return shared ? -1 : winner;
}

}  // namespace core
