#pragma once

#include <cstdint>

namespace core {

using seat_index_t = int8_t;
using action_t = int32_t;
using game_id_t = int64_t;

// Rewards returned by the game contract, and the statistics accumulated from them.
using value_t = float;

}  // namespace core
