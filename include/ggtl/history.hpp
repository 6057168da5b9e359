#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "ggtl/error.hpp"
#include "ggtl/position.hpp"

namespace ggtl {

// Ordered log of the positions a game has passed through and the moves that
// produced them. There is always exactly one more position than moves; the
// last position is the current one.
//
// Both sequences change only through push() and pop(), together.
template <Transitional P> class History {
public:
  using Move = typename P::Move;

  explicit History(P initial) { positions_.push_back(std::move(initial)); }

  [[nodiscard]] const P& current_position() const noexcept { return positions_.back(); }

  [[nodiscard]] std::optional<Move> last_move() const {
    if (moves_.empty()) {
      return std::nullopt;
    }
    return moves_.back();
  }

  // Apply a move to the current position, keeping the previous one for undo.
  // Throws InvalidMove, with the history unchanged, if the transition rejects it.
  const P& apply_move(const Move& mv) {
    auto next = successor(current_position(), mv);
    if (!next.has_value()) {
      throw InvalidMove();
    }
    push(std::move(*next), mv);
    return current_position();
  }

  // Step back one move. Throws NoHistory if nothing has been applied.
  const P& undo() {
    if (moves_.empty()) {
      throw NoHistory();
    }
    pop();
    return current_position();
  }

  // Start over from a new initial position, discarding the log.
  void reset(P initial) {
    std::vector<P> positions;
    positions.push_back(std::move(initial));
    positions_ = std::move(positions);
    moves_.clear();
  }

  [[nodiscard]] std::size_t size() const noexcept { return moves_.size(); }
  [[nodiscard]] bool empty() const noexcept { return moves_.empty(); }

  [[nodiscard]] const std::vector<P>& positions() const noexcept { return positions_; }
  [[nodiscard]] const std::vector<Move>& moves() const noexcept { return moves_; }

private:
  void push(P pos, const Move& mv) {
    positions_.push_back(std::move(pos));
    try {
      moves_.push_back(mv);
    } catch (...) {
      positions_.pop_back();
      throw;
    }
  }

  void pop() noexcept {
    moves_.pop_back();
    positions_.pop_back();
  }

  std::vector<P> positions_;
  std::vector<Move> moves_;
};

} // namespace ggtl
