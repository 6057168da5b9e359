#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "ggtl/cli.hpp"
#include "ggtl/engine.hpp"
#include "ggtl/reversi.hpp"

using namespace ggtl;

// -----------------------------------------------------------------------------
// Full game integration
// -----------------------------------------------------------------------------

TEST(Integration, SelfPlayOnSmallBoardReachesTheEnd) {
  cli::Options options;
  options.size = 4;
  options.ply = 2;

  std::ostringstream out;
  const auto result = cli::play(options, out);

  EXPECT_TRUE(result.finished);
  EXPECT_GT(result.moves_played, 0);
  EXPECT_LE(result.discs_one + result.discs_two, 16);
  EXPECT_GT(result.discs_one + result.discs_two, 4);

  const std::string text = out.str();
  if (result.winner.has_value()) {
    EXPECT_NE(text.find("wins: o "), std::string::npos);
    const int leader = *result.winner == Player::One ? result.discs_one : result.discs_two;
    const int trailer = *result.winner == Player::One ? result.discs_two : result.discs_one;
    EXPECT_GT(leader, trailer);
  } else {
    EXPECT_NE(text.find("Draw: o "), std::string::npos);
    EXPECT_EQ(result.discs_one, result.discs_two);
  }
}

TEST(Integration, SelfPlayStopsAtTheMoveLimit) {
  cli::Options options;
  options.ply = 1;
  options.max_moves = 3;

  std::ostringstream out;
  const auto result = cli::play(options, out);

  EXPECT_FALSE(result.finished);
  EXPECT_EQ(result.moves_played, 3);
  EXPECT_EQ(result.discs_one + result.discs_two, 7);
  EXPECT_NE(out.str().find("Stopped after 3 moves"), std::string::npos);
}

TEST(Integration, TracedSelfPlayReportsEverySearch) {
  cli::Options options;
  options.ply = 2;
  options.max_moves = 2;
  options.trace = true;

  std::ostringstream out;
  (void)cli::play(options, out);

  const std::string text = out.str();
  const auto first = text.find("info search ply 2 moves 4 ");
  ASSERT_NE(first, std::string::npos);
  EXPECT_NE(text.find("info search ply 2 moves 3 ", first), std::string::npos);
  EXPECT_NE(text.find("info done moved "), std::string::npos);
  EXPECT_EQ(text.find("info cutoff"), std::string::npos);
}

TEST(Integration, FullGameOnStandardBoardUndoesToTheOpening) {
  const reversi::Position opening;
  Engine<reversi::Position> engine(opening, Config{.ply = 1});

  // 60 empty squares; each side may pass at most once in a row.
  constexpr int max_moves = 200;
  int moves_played = 0;
  while (!engine.current_position().is_terminal() && moves_played < max_moves) {
    ASSERT_TRUE(engine.search().has_value()) << "move " << moves_played;
    ++moves_played;
  }

  const auto& final_pos = engine.current_position();
  ASSERT_TRUE(final_pos.is_terminal());
  EXPECT_LE(final_pos.disc_count(Player::One) + final_pos.disc_count(Player::Two), 64);

  // Every committed move was legal where it was played.
  const auto& history = engine.history();
  ASSERT_EQ(history.size(), static_cast<std::size_t>(moves_played));
  for (std::size_t i = 0; i < history.size(); ++i) {
    EXPECT_TRUE(history.positions()[i].is_legal(history.moves()[i])) << "move " << i;
    EXPECT_EQ(successor(history.positions()[i], history.moves()[i]), history.positions()[i + 1]);
  }

  for (int i = 0; i < moves_played; ++i) {
    engine.undo();
  }
  EXPECT_EQ(engine.current_position(), opening);
  EXPECT_FALSE(engine.last_move().has_value());
}
