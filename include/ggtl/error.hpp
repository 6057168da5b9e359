#pragma once

#include <stdexcept>
#include <string>

namespace ggtl {

// Base of every error raised by the library itself. Configuration and
// argument errors use the standard exceptions instead.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A transition rejected a move. Raised by History::apply_move and, when the
// rejected move came from the position's own legal_moves(), out of a search.
class InvalidMove : public Error {
public:
  InvalidMove() : Error("invalid move") {}
  explicit InvalidMove(const std::string& what) : Error(what) {}
};

// undo() with an empty move log.
class NoHistory : public Error {
public:
  NoHistory() : Error("no moves to undo") {}
};

} // namespace ggtl
