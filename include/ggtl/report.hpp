#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace ggtl::search {

// ---------------------------------------------------------------------------
// Search events
// ---------------------------------------------------------------------------
// Reports are move-agnostic: root moves are identified by their index in the
// order legal_moves() produced them, so one observer works for every game.

enum class Status : std::uint8_t {
  Moved,         // a move was found and committed to the history
  NoLegalMoves,  // the root position produced no moves at all
  NoImprovement, // no root move scored above the lower bound of the window
};

[[nodiscard]] std::string_view to_string(Status status) noexcept;

struct Stats {
  std::uint64_t nodes{0};         // negamax calls below the root
  std::uint64_t terminal_hits{0}; // of which landed on a terminal position
};

struct Start {
  int ply{0};
  int default_ply{0};
  bool explicit_ply{false};
  std::size_t root_moves{0};
  int alpha{0};
  int beta{0};
};

struct RootMove {
  std::size_t index{0};
  int score{0};
  int alpha{0}; // best score before this move was considered
  bool improved{false};
};

struct Cutoff {
  int depth{0}; // remaining depth at the node that cut off
  std::size_t index{0};
  int alpha{0};
  int beta{0};
};

struct Summary {
  Status status{Status::NoLegalMoves};
  int ply{0};
  bool explicit_ply{false};
  std::optional<std::size_t> best_index{};
  std::optional<int> score{};
  Stats stats{};
  std::chrono::steady_clock::time_point started_at{std::chrono::steady_clock::now()};
  std::chrono::steady_clock::duration elapsed{};
};

// ---------------------------------------------------------------------------
// Observers
// ---------------------------------------------------------------------------

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual void search_started(const Start& start) = 0;
  virtual void root_move_scored(const RootMove& root_move) = 0;
  virtual void cutoff(const Cutoff& cutoff) = 0;
  virtual void search_completed(const Summary& summary) = 0;
};

class NullReporter : public Reporter {
public:
  void search_started(const Start&) override {}
  void root_move_scored(const RootMove&) override {}
  void cutoff(const Cutoff&) override {}
  void search_completed(const Summary&) override {}
};

// Writes one "info ..." line per event. Cutoffs happen at nearly every
// interior node, so they are only written when asked for.
class StreamReporter : public Reporter {
public:
  explicit StreamReporter(std::ostream& out, bool cutoffs = false);

  void search_started(const Start& start) override;
  void root_move_scored(const RootMove& root_move) override;
  void cutoff(const Cutoff& cutoff) override;
  void search_completed(const Summary& summary) override;

private:
  std::ostream* out_;
  bool cutoffs_;
};

} // namespace ggtl::search
