#pragma once

// =============================================================================
// POSITION CAPABILITY: What a Game Must Provide
// =============================================================================
//
// The search engine knows nothing about any particular game. It only talks to
// a position through five operations:
//
//   copy          - positions are values; the copy constructor is the copy
//   apply(move)   - transition in place, false if the move is rejected
//   is_terminal() - the game is over at this position
//   evaluate()    - score for the player to move, in [EVAL_MIN, EVAL_MAX]
//   legal_moves() - every move the player to move may make
//
// A game where a player may be forced to pass (Othello) must return a single
// pass move from legal_moves() rather than an empty list. A pass does nothing
// but hand the turn to the opponent.
//
// The operations are expressed as concepts, so a type that lacks one of them
// is rejected when an Engine or History is instantiated for it. There is no
// way to construct a search over an incomplete game.
//
// =============================================================================

#include <concepts>
#include <optional>
#include <vector>

namespace ggtl {

// =============================================================================
// SCORE RANGE
// =============================================================================
// evaluate() must stay inside [EVAL_MIN, EVAL_MAX]. The default search window
// [ALPHA, BETA] lies one unit outside it on each side, so every real score is
// strictly inside the window.
// =============================================================================

inline constexpr int EVAL_MAX = 99'999;
inline constexpr int EVAL_MIN = -EVAL_MAX;
inline constexpr int ALPHA = -100'000;
inline constexpr int BETA = 100'000;

// Everything the move history needs: a copyable state with an in-place
// transition that can fail.
template <typename P>
concept Transitional = std::copyable<P> && requires(P& pos, const typename P::Move& mv) {
  requires std::equality_comparable<typename P::Move>;
  { pos.apply(mv) } -> std::same_as<bool>;
};

// Everything the alpha-beta search needs on top of that.
template <typename P>
concept GamePosition = Transitional<P> && requires(const P& pos) {
  { pos.is_terminal() } -> std::convertible_to<bool>;
  { pos.evaluate() } -> std::convertible_to<int>;
  { pos.legal_moves() } -> std::same_as<std::vector<typename P::Move>>;
};

// The transition function: copy the position and apply the move to the copy.
// Returns nullopt when the move is rejected; the source is never touched.
template <Transitional P>
[[nodiscard]] std::optional<P> successor(const P& pos, const typename P::Move& mv) {
  P next = pos;
  if (!next.apply(mv)) {
    return std::nullopt;
  }
  return next;
}

} // namespace ggtl
