#pragma once

// =============================================================================
// GAME-TREE SEARCH: Finding the Best Move
// =============================================================================
//
// Given a position in a two-player zero-sum game, we want the move that leads
// to the best outcome assuming optimal play by both sides.
//
// THE BASIC ALGORITHM: MINIMAX
// What's good for me is bad for you. I pick the move that maximizes my score,
// you pick the move that minimizes it (maximizes yours), recursively, until
// the game ends or we run out of depth and fall back on the static evaluation.
//
// NEGAMAX
// Because evaluate() always scores from the point of view of the player to
// move, both sides can maximize: the score of a child is negated on the way
// up and the (alpha, beta) window is negated and swapped on the way down.
// max(a, b) = -min(-a, -b).
//
// ALPHA-BETA PRUNING
//   - alpha: the best score the player to move is already guaranteed
//   - beta:  the best score the opponent is already guaranteed
// Once alpha >= beta the opponent will never let the game reach this node,
// so the remaining siblings are skipped. The search is fail-hard: a node
// never returns less than the alpha it was given.
//
// Deliberately absent: iterative deepening, transposition tables and move
// ordering. Moves are searched in the order the game enumerates them, and
// that order decides ties at the root.
//
// =============================================================================

#include <cstddef>

#include "ggtl/error.hpp"
#include "ggtl/position.hpp"
#include "ggtl/report.hpp"

namespace ggtl {

inline constexpr int DEFAULT_PLY = 2;

struct Config {
  int ply{DEFAULT_PLY}; // default search depth
  int alpha{ALPHA};     // lower bound of the root window
  int beta{BETA};       // upper bound of the root window

  // Throws std::invalid_argument for a negative ply or an empty window.
  void validate() const;
};

// Throws std::invalid_argument for a negative ply.
void validate_ply(int ply);

namespace detail {

// Exposed for tests. Scores pos for the player to move, searching depth plies
// below it inside the (alpha, beta) window.
template <GamePosition P>
int negamax(const P& pos, int alpha, int beta, int depth, search::Stats& stats,
            search::Reporter& reporter) {
  stats.nodes += 1;

  // Terminal positions are scored as they are, whatever depth remains.
  if (pos.is_terminal()) {
    stats.terminal_hits += 1;
    return pos.evaluate();
  }

  if (depth <= 0) {
    return pos.evaluate();
  }

  const auto moves = pos.legal_moves();
  if (moves.empty()) {
    return pos.evaluate();
  }

  for (std::size_t i = 0; i < moves.size(); ++i) {
    const auto child = successor(pos, moves[i]);
    if (!child.has_value()) {
      throw InvalidMove("apply() rejected a move produced by legal_moves()");
    }

    const int score = -negamax(*child, -beta, -alpha, depth - 1, stats, reporter);

    if (score > alpha) {
      alpha = score;
    }

    if (alpha >= beta) {
      reporter.cutoff(search::Cutoff{
          .depth = depth,
          .index = i,
          .alpha = alpha,
          .beta = beta,
      });
      break;
    }
  }

  return alpha;
}

} // namespace detail

} // namespace ggtl
