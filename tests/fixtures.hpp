#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include "ggtl/player.hpp"
#include "ggtl/position.hpp"
#include "ggtl/report.hpp"

namespace ggtl::fixtures {

// ---------------------------------------------------------------------------
// Counting game
// ---------------------------------------------------------------------------
// A signed integer and a player to move. Each move doubles the value and
// then nudges it by -1, 0 or +1 towards the mover (player one pushes up,
// player two pushes down); a pass only hands over the turn. The game is over
// once the value leaves [-LIMIT, LIMIT]. Small enough to search exhaustively.

enum class Step : int { Stay = 0, Up = 1, Down = -1, Pass = 2 };

class CountingGame {
public:
  using Move = Step;

  static constexpr int LIMIT = 30;

  explicit CountingGame(int value, Player to_move = Player::One)
      : value_(value), to_move_(to_move) {}

  [[nodiscard]] int value() const noexcept { return value_; }
  [[nodiscard]] Player player_to_move() const noexcept { return to_move_; }

  bool apply(const Step& step) {
    if (step != Step::Pass) {
      const int delta = static_cast<int>(step);
      value_ = 2 * value_ + (to_move_ == Player::One ? delta : -delta);
    }
    to_move_ = !to_move_;
    return true;
  }

  [[nodiscard]] bool is_terminal() const { return value_ > LIMIT || value_ < -LIMIT; }

  [[nodiscard]] int evaluate() const { return to_move_ == Player::One ? value_ : -value_; }

  [[nodiscard]] std::vector<Step> legal_moves() const {
    return {Step::Stay, Step::Up, Step::Down, Step::Pass};
  }

  friend bool operator==(const CountingGame&, const CountingGame&) = default;

private:
  int value_;
  Player to_move_;
};

// ---------------------------------------------------------------------------
// Scripted game
// ---------------------------------------------------------------------------
// A root with one move per entry of `scores`. Move i leads straight to a
// terminal leaf that the root sees as scores[i]. A move listed as `rejected`
// is offered by legal_moves() but refused by apply().

class ScriptedGame {
public:
  using Move = int;

  explicit ScriptedGame(std::vector<int> scores, std::optional<int> rejected = std::nullopt)
      : scores_(std::move(scores)), rejected_(rejected) {}

  bool apply(const int& mv) {
    if (leaf_ || mv < 0 || mv >= static_cast<int>(scores_.size()) || rejected_ == mv) {
      return false;
    }
    leaf_ = true;
    leaf_eval_ = -scores_[static_cast<std::size_t>(mv)];
    return true;
  }

  [[nodiscard]] bool is_terminal() const { return leaf_; }

  [[nodiscard]] int evaluate() const { return leaf_ ? leaf_eval_ : 0; }

  [[nodiscard]] std::vector<int> legal_moves() const {
    std::vector<int> moves;
    if (!leaf_) {
      for (std::size_t i = 0; i < scores_.size(); ++i) {
        moves.push_back(static_cast<int>(i));
      }
    }
    return moves;
  }

private:
  std::vector<int> scores_;
  std::optional<int> rejected_;
  bool leaf_{false};
  int leaf_eval_{0};
};

// ---------------------------------------------------------------------------
// Reference search
// ---------------------------------------------------------------------------
// Plain full-width negamax: no window, no pruning. Same terminal-first rule
// as the engine.

template <GamePosition P> int minimax(const P& pos, int depth, std::uint64_t* nodes = nullptr) {
  if (nodes != nullptr) {
    *nodes += 1;
  }

  if (pos.is_terminal() || depth <= 0) {
    return pos.evaluate();
  }

  const auto moves = pos.legal_moves();
  if (moves.empty()) {
    return pos.evaluate();
  }

  int best = std::numeric_limits<int>::min();
  for (const auto& mv : moves) {
    const auto child = successor(pos, mv);
    best = std::max(best, -minimax(*child, depth - 1, nodes));
  }
  return best;
}

// The value the engine assigns the root when searching to ply: the best of
// the children, each searched to ply - 1.
template <GamePosition P> int minimax_root(const P& pos, int ply, std::uint64_t* nodes = nullptr) {
  int best = std::numeric_limits<int>::min();
  for (const auto& mv : pos.legal_moves()) {
    const auto child = successor(pos, mv);
    best = std::max(best, -minimax(*child, ply - 1, nodes));
  }
  return best;
}

// ---------------------------------------------------------------------------
// Recording reporter
// ---------------------------------------------------------------------------

class RecordingReporter : public search::Reporter {
public:
  void search_started(const search::Start& start) override { starts.push_back(start); }
  void root_move_scored(const search::RootMove& root_move) override {
    root_moves.push_back(root_move);
  }
  void cutoff(const search::Cutoff& cutoff) override { cutoffs.push_back(cutoff); }
  void search_completed(const search::Summary& summary) override { summaries.push_back(summary); }

  std::vector<search::Start> starts;
  std::vector<search::RootMove> root_moves;
  std::vector<search::Cutoff> cutoffs;
  std::vector<search::Summary> summaries;
};

} // namespace ggtl::fixtures
