#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "ggtl/error.hpp"
#include "ggtl/history.hpp"
#include "ggtl/position.hpp"
#include "ggtl/report.hpp"
#include "ggtl/search.hpp"

namespace ggtl {

// Engine façade that owns the game history and plays the best move it can
// find. Drivers render current_position() and never need to manage position
// lifetimes themselves.
template <GamePosition P> class Engine {
public:
  using Move = typename P::Move;

  explicit Engine(P initial, Config config = {})
      : config_(config), history_(std::move(initial)), reporter_(&null_reporter_) {
    config_.validate();
  }

  Engine(P initial, Config config, search::Reporter& reporter) : Engine(std::move(initial), config) {
    reporter_ = &reporter;
  }

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  [[nodiscard]] int ply() const noexcept { return config_.ply; }

  // Change the default search depth, returning the previous one.
  int set_ply(int ply) {
    validate_ply(ply);
    return std::exchange(config_.ply, ply);
  }

  [[nodiscard]] const Config& config() const noexcept { return config_; }

  void set_reporter(search::Reporter& reporter) noexcept { reporter_ = &reporter; }

  // Search to the default depth and play the best move found. Returns the
  // resulting position, or nullopt if no move was made (see last_search()).
  std::optional<P> search() { return run(config_.ply, false); }

  // As above, to an explicit depth for this call only.
  std::optional<P> search(int ply) {
    validate_ply(ply);
    return run(ply, true);
  }

  [[nodiscard]] const P& current_position() const noexcept { return history_.current_position(); }
  [[nodiscard]] std::optional<Move> last_move() const { return history_.last_move(); }

  const P& apply_move(const Move& mv) { return history_.apply_move(mv); }
  const P& undo() { return history_.undo(); }

  [[nodiscard]] const History<P>& history() const noexcept { return history_; }
  [[nodiscard]] const search::Stats& stats() const noexcept { return stats_; }
  [[nodiscard]] const search::Summary& last_search() const noexcept { return summary_; }

private:
  std::optional<P> run(int ply, bool explicit_ply) {
    stats_ = search::Stats{};
    summary_ = search::Summary{};
    summary_.ply = ply;
    summary_.explicit_ply = explicit_ply;

    const std::vector<Move> moves = history_.current_position().legal_moves();

    reporter_->search_started(search::Start{
        .ply = ply,
        .default_ply = config_.ply,
        .explicit_ply = explicit_ply,
        .root_moves = moves.size(),
        .alpha = config_.alpha,
        .beta = config_.beta,
    });

    if (moves.empty()) {
      return finish(search::Status::NoLegalMoves);
    }

    int alpha = config_.alpha;
    const int beta = config_.beta;
    std::optional<std::size_t> best;

    for (std::size_t i = 0; i < moves.size(); ++i) {
      const auto child = successor(history_.current_position(), moves[i]);
      if (!child.has_value()) {
        throw InvalidMove("apply() rejected a move produced by legal_moves()");
      }

      const int score = -detail::negamax(*child, -beta, -alpha, ply - 1, stats_, *reporter_);

      // Strict improvement: among equal scores the first move enumerated wins.
      const bool improved = score > alpha;
      reporter_->root_move_scored(search::RootMove{
          .index = i,
          .score = score,
          .alpha = alpha,
          .improved = improved,
      });

      if (improved) {
        best = i;
        alpha = score;
      }
    }

    if (!best.has_value()) {
      return finish(search::Status::NoImprovement);
    }

    summary_.best_index = best;
    summary_.score = alpha;

    P next = history_.apply_move(moves[*best]);
    finish(search::Status::Moved);
    return next;
  }

  std::optional<P> finish(search::Status status) {
    summary_.status = status;
    summary_.stats = stats_;
    summary_.elapsed = std::chrono::steady_clock::now() - summary_.started_at;
    reporter_->search_completed(summary_);
    return std::nullopt;
  }

  Config config_;
  History<P> history_;
  search::Stats stats_{};
  search::Summary summary_{};
  search::NullReporter null_reporter_{};
  search::Reporter* reporter_;
};

} // namespace ggtl
