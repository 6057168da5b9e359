#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "ggtl/player.hpp"
#include "ggtl/reversi.hpp"
#include "ggtl/search.hpp"

namespace ggtl::cli {

// Deepest search the frontend will start. The engine itself imposes no
// ceiling; a caller picking the ply is responsible for bounding it.
inline constexpr int MAX_PLY = 10;

enum class Action { Play, Help, Version };

struct Options {
  Action action{Action::Play};
  int ply{DEFAULT_PLY};
  int size{reversi::Position::DEFAULT_SIZE};
  std::optional<int> max_moves{};
  bool trace{false};
  bool cutoffs{false};
};

// Parse command-line arguments (without the program name), throwing
// std::runtime_error on error.
[[nodiscard]] Options parse_options(const std::vector<std::string>& args);

[[nodiscard]] std::string usage();

struct GameResult {
  int moves_played{0};
  bool finished{false}; // reached a terminal position
  int discs_one{0};
  int discs_two{0};
  std::optional<Player> winner{};
};

// Play the engine against itself from the opening, printing the board after
// every move.
GameResult play(const Options& options, std::ostream& out);

// Entry point behind main(); returns the process exit status.
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace ggtl::cli
