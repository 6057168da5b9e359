#include "ggtl/cli.hpp"

#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ggtl/about.hpp"
#include "ggtl/engine.hpp"
#include "ggtl/report.hpp"

namespace ggtl::cli {

namespace {

int parse_int_attr(const std::string& attr, const std::string& value, int min, int max) {
  int parsed = 0;
  std::size_t consumed = 0;
  try {
    parsed = std::stoi(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error("invalid value for '" + attr + "' option");
  }

  if (consumed != value.size() || parsed < min || parsed > max) {
    throw std::runtime_error("invalid value for '" + attr + "' option");
  }
  return parsed;
}

char player_char(Player player) {
  return player == Player::One ? 'o' : 'x';
}

} // namespace

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

Options parse_options(const std::vector<std::string>& args) {
  Options options;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& attr = args[i];

    if (attr == "--help" || attr == "-h") {
      options.action = Action::Help;
      continue;
    }
    if (attr == "--version") {
      options.action = Action::Version;
      continue;
    }
    if (attr == "--trace") {
      options.trace = true;
      continue;
    }
    if (attr == "--cutoffs") {
      options.trace = true;
      options.cutoffs = true;
      continue;
    }

    if (attr != "--ply" && attr != "--size" && attr != "--max-moves") {
      throw std::runtime_error("unknown option '" + attr + "'");
    }

    if (i + 1 >= args.size()) {
      throw std::runtime_error("missing value for '" + attr + "' option");
    }
    const std::string& value = args[++i];

    if (attr == "--ply") {
      options.ply = parse_int_attr(attr, value, 0, MAX_PLY);
    } else if (attr == "--size") {
      options.size = parse_int_attr(attr, value, reversi::Position::MIN_SIZE,
                                    reversi::Position::MAX_SIZE);
      if (options.size % 2 != 0) {
        throw std::runtime_error("invalid value for '--size' option");
      }
    } else {
      options.max_moves = parse_int_attr(attr, value, 0, reversi::Position::MAX_SIZE *
                                                             reversi::Position::MAX_SIZE * 2);
    }
  }

  return options;
}

std::string usage() {
  std::ostringstream out;
  out << "usage: ggtl_reversi [options]\n"
      << "  --ply N         search depth (default " << DEFAULT_PLY << ", max " << MAX_PLY << ")\n"
      << "  --size N        even board size from " << reversi::Position::MIN_SIZE << " to "
      << reversi::Position::MAX_SIZE << " (default " << reversi::Position::DEFAULT_SIZE << ")\n"
      << "  --max-moves N   stop after N moves\n"
      << "  --trace         report search progress\n"
      << "  --cutoffs       report search progress including cutoffs\n"
      << "  --version       print version and exit\n"
      << "  --help          print this message and exit\n";
  return out.str();
}

// ---------------------------------------------------------------------------
// Self-play
// ---------------------------------------------------------------------------

GameResult play(const Options& options, std::ostream& out) {
  Engine<reversi::Position> engine(reversi::Position(options.size), Config{.ply = options.ply});

  search::StreamReporter reporter(out, options.cutoffs);
  if (options.trace) {
    engine.set_reporter(reporter);
  }

  GameResult result;
  out << engine.current_position().to_string();

  while (!engine.current_position().is_terminal()) {
    if (options.max_moves.has_value() && result.moves_played >= *options.max_moves) {
      break;
    }

    const auto next = engine.search();
    if (!next.has_value()) {
      out << "no move: " << search::to_string(engine.last_search().status) << '\n';
      break;
    }

    ++result.moves_played;
    out << '\n'
        << "Player " << static_cast<int>(!next->player_to_move()) << " plays "
        << reversi::to_string(engine.last_move().value()) << '\n'
        << next->to_string();
  }

  const auto& final_pos = engine.current_position();
  result.finished = final_pos.is_terminal();
  result.discs_one = final_pos.disc_count(Player::One);
  result.discs_two = final_pos.disc_count(Player::Two);
  result.winner = final_pos.winner();

  out << '\n';
  if (!result.finished) {
    out << "Stopped after " << result.moves_played << " moves";
  } else if (result.winner.has_value()) {
    out << "Player " << static_cast<int>(*result.winner) << " ("
        << player_char(*result.winner) << ") wins";
  } else {
    out << "Draw";
  }
  out << ": o " << result.discs_one << " x " << result.discs_two << '\n';

  return result;
}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  try {
    const Options options = parse_options(args);

    switch (options.action) {
    case Action::Help:
      out << usage();
      return 0;
    case Action::Version:
      print_about(out);
      return 0;
    case Action::Play:
      play(options, out);
      return 0;
    }
  } catch (const std::exception& ex) {
    err << "error: " << ex.what() << '\n';
  }
  return 1;
}

} // namespace ggtl::cli
