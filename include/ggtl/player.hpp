#pragma once

#include <cstdint>

namespace ggtl {

enum class Player : std::uint8_t { One = 1, Two = 2 };

constexpr Player operator!(Player player) {
  return player == Player::One ? Player::Two : Player::One;
}

} // namespace ggtl
