#pragma once

// =============================================================================
// REVERSI / OTHELLO
// =============================================================================
//
// Two players take turns placing discs on a square board. A disc may only be
// placed where it OUTFLANKS at least one run of opponent discs: starting next
// to the new disc and walking in one of the 8 directions, a contiguous run of
// opponent discs immediately followed by one of the mover's own discs. Every
// outflanked run, in every direction at once, is flipped to the mover.
//
// A player with no such placement must pass. The game ends when neither side
// can place a disc, and the player with more discs wins.
//
// Coordinates are (x, y) with x the row and y the column, both from 0. Moves
// are enumerated row by row, which is the order the search breaks ties in.
//
// Layout notation, used by parse() and to_layout(): the rows from x = 0
// separated by '/', each cell '.' (empty), 'o' (player one) or 'x' (player
// two), then a space and the player to move:
//
//   "......../......../......../...ox.../...xo.../......../......../........ o"
//
// =============================================================================

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ggtl/player.hpp"

namespace ggtl::reversi {

enum class Cell : std::uint8_t { Empty = 0, One = 1, Two = 2 };

[[nodiscard]] constexpr Cell disc(Player player) noexcept {
  return player == Player::One ? Cell::One : Cell::Two;
}

struct Move {
  int x{-1};
  int y{-1};

  // The null move: the mover hands the turn to the opponent.
  [[nodiscard]] static constexpr Move pass() noexcept { return Move{-1, -1}; }
  [[nodiscard]] constexpr bool is_pass() const noexcept { return x == -1 && y == -1; }

  friend constexpr bool operator==(const Move&, const Move&) = default;
};

// "pass", or the column letter followed by the 1-based row ("e3" is (2, 4)).
[[nodiscard]] std::string to_string(const Move& mv);

class Position {
public:
  using Move = reversi::Move;

  static constexpr int DEFAULT_SIZE = 8;
  static constexpr int MIN_SIZE = 4;
  static constexpr int MAX_SIZE = 16;

  // Standard opening on an even-sized board; throws std::invalid_argument
  // for any other size.
  explicit Position(int size = DEFAULT_SIZE);

  // Parse layout notation, throwing std::runtime_error on error.
  static Position parse(std::string_view layout);
  [[nodiscard]] std::string to_layout() const;

  // Board diagram with column letters and row numbers.
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] int size() const noexcept { return size_; }
  [[nodiscard]] Player player_to_move() const noexcept { return to_move_; }

  // Throws std::out_of_range off the board.
  [[nodiscard]] Cell cell_at(int x, int y) const;

  [[nodiscard]] bool is_legal(const Move& mv) const;
  [[nodiscard]] std::vector<Move> legal_moves() const;
  [[nodiscard]] bool apply(const Move& mv);
  [[nodiscard]] bool is_terminal() const;
  [[nodiscard]] int evaluate() const;

  // Legal placements (passes excluded) for player, as if it were their turn.
  [[nodiscard]] int mobility(Player player) const;
  [[nodiscard]] int disc_count(Player player) const noexcept;

  // The player with more discs once the game is over; nullopt while the game
  // is in progress or when it ended level.
  [[nodiscard]] std::optional<Player> winner() const;

  friend bool operator==(const Position&, const Position&) = default;

private:
  Position(int size, Player to_move);

  [[nodiscard]] bool on_board(int x, int y) const noexcept {
    return x >= 0 && x < size_ && y >= 0 && y < size_;
  }

  [[nodiscard]] static constexpr std::size_t index(int x, int y) noexcept {
    return static_cast<std::size_t>(x * MAX_SIZE + y);
  }

  // Length of the opponent run outflanked from (x, y) towards (dx, dy), or 0.
  [[nodiscard]] int outflanked(int x, int y, int dx, int dy, Player player) const noexcept;
  [[nodiscard]] bool is_legal_for(int x, int y, Player player) const noexcept;

  std::array<Cell, MAX_SIZE * MAX_SIZE> cells_{};
  int size_{DEFAULT_SIZE};
  Player to_move_{Player::One};
};

} // namespace ggtl::reversi
