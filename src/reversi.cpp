#include "ggtl/reversi.hpp"

#include <array>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ggtl::reversi {

namespace {

struct Direction {
  int dx;
  int dy;
};

// Row, column and both diagonals, each way.
constexpr std::array<Direction, 8> DIRECTIONS = {{
    {-1, 0},
    {1, 0},
    {0, -1},
    {0, 1},
    {-1, -1},
    {-1, 1},
    {1, 1},
    {1, -1},
}};

void validate_size(int size) {
  if (size < Position::MIN_SIZE || size > Position::MAX_SIZE || size % 2 != 0) {
    throw std::invalid_argument("invalid board size " + std::to_string(size));
  }
}

char to_char(Cell cell) {
  switch (cell) {
  case Cell::One:
    return 'o';
  case Cell::Two:
    return 'x';
  case Cell::Empty:
    break;
  }
  return '.';
}

std::vector<std::string_view> split(std::string_view str, char sep) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const auto end = str.find(sep, start);
    if (end == std::string_view::npos) {
      parts.push_back(str.substr(start));
      return parts;
    }
    parts.push_back(str.substr(start, end - start));
    start = end + 1;
  }
}

} // namespace

std::string to_string(const Move& mv) {
  if (mv.is_pass()) {
    return "pass";
  }
  return static_cast<char>('a' + mv.y) + std::to_string(mv.x + 1);
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Position::Position(int size, Player to_move) : size_(size), to_move_(to_move) {
  validate_size(size);
}

Position::Position(int size) : Position(size, Player::One) {
  const int half = size / 2;
  cells_[index(half - 1, half - 1)] = Cell::One;
  cells_[index(half, half)] = Cell::One;
  cells_[index(half - 1, half)] = Cell::Two;
  cells_[index(half, half - 1)] = Cell::Two;
}

Position Position::parse(std::string_view layout) {
  const auto space = layout.find(' ');
  if (space == std::string_view::npos) {
    throw std::runtime_error("layout missing player to move");
  }

  const auto rows = split(layout.substr(0, space), '/');
  const auto mover = layout.substr(space + 1);

  const int size = static_cast<int>(rows.size());
  if (size < MIN_SIZE || size > MAX_SIZE || size % 2 != 0) {
    throw std::runtime_error("layout has an invalid number of rows");
  }

  Player to_move{};
  if (mover == "o") {
    to_move = Player::One;
  } else if (mover == "x") {
    to_move = Player::Two;
  } else {
    throw std::runtime_error("invalid player to move '" + std::string(mover) + "'");
  }

  Position pos(size, to_move);

  for (int x = 0; x < size; ++x) {
    const auto row = rows[static_cast<std::size_t>(x)];
    if (static_cast<int>(row.size()) != size) {
      throw std::runtime_error("layout row " + std::to_string(x + 1) + " has the wrong length");
    }

    for (int y = 0; y < size; ++y) {
      switch (row[static_cast<std::size_t>(y)]) {
      case '.':
        break;
      case 'o':
        pos.cells_[index(x, y)] = Cell::One;
        break;
      case 'x':
        pos.cells_[index(x, y)] = Cell::Two;
        break;
      default:
        throw std::runtime_error("invalid cell '" + std::string(1, row[static_cast<std::size_t>(y)]) +
                                 "' in layout");
      }
    }
  }

  return pos;
}

std::string Position::to_layout() const {
  std::string out;
  out.reserve(static_cast<std::size_t>(size_ * (size_ + 1) + 2));

  for (int x = 0; x < size_; ++x) {
    if (x > 0) {
      out.push_back('/');
    }
    for (int y = 0; y < size_; ++y) {
      out.push_back(to_char(cells_[index(x, y)]));
    }
  }

  out.push_back(' ');
  out.push_back(to_char(disc(to_move_)));
  return out;
}

std::string Position::to_string() const {
  std::ostringstream out;

  out << "    ";
  for (int y = 0; y < size_; ++y) {
    out << ' ' << static_cast<char>('a' + y);
  }
  out << "\n   +" << std::string(static_cast<std::size_t>(size_ * 2), '-') << '\n';

  for (int x = 0; x < size_; ++x) {
    out << (x + 1 < 10 ? " " : "") << (x + 1) << " |";
    for (int y = 0; y < size_; ++y) {
      out << ' ' << to_char(cells_[index(x, y)]);
    }
    out << '\n';
  }

  out << "Player " << static_cast<int>(to_move_) << " to move.\n";
  return out.str();
}

Cell Position::cell_at(int x, int y) const {
  if (!on_board(x, y)) {
    throw std::out_of_range("square (" + std::to_string(x) + ", " + std::to_string(y) +
                            ") is off the board");
  }
  return cells_[index(x, y)];
}

// ---------------------------------------------------------------------------
// Move generation
// ---------------------------------------------------------------------------

int Position::outflanked(int x, int y, int dx, int dy, Player player) const noexcept {
  const Cell mine = disc(player);
  const Cell theirs = disc(!player);

  int run = 0;
  int tx = x + dx;
  int ty = y + dy;

  while (on_board(tx, ty) && cells_[index(tx, ty)] == theirs) {
    ++run;
    tx += dx;
    ty += dy;
  }

  if (run > 0 && on_board(tx, ty) && cells_[index(tx, ty)] == mine) {
    return run;
  }
  return 0;
}

bool Position::is_legal_for(int x, int y, Player player) const noexcept {
  if (!on_board(x, y) || cells_[index(x, y)] != Cell::Empty) {
    return false;
  }

  for (const auto& dir : DIRECTIONS) {
    if (outflanked(x, y, dir.dx, dir.dy, player) > 0) {
      return true;
    }
  }
  return false;
}

bool Position::is_legal(const Move& mv) const {
  return mv.is_pass() || is_legal_for(mv.x, mv.y, to_move_);
}

std::vector<Move> Position::legal_moves() const {
  std::vector<Move> moves;

  for (int x = 0; x < size_; ++x) {
    for (int y = 0; y < size_; ++y) {
      if (is_legal_for(x, y, to_move_)) {
        moves.push_back(Move{x, y});
      }
    }
  }

  if (moves.empty()) {
    moves.push_back(Move::pass());
  }
  return moves;
}

// ---------------------------------------------------------------------------
// Move application
// ---------------------------------------------------------------------------

bool Position::apply(const Move& mv) {
  if (mv.is_pass()) {
    to_move_ = !to_move_;
    return true;
  }

  if (!on_board(mv.x, mv.y) || cells_[index(mv.x, mv.y)] != Cell::Empty) {
    return false;
  }

  // Measure every direction before touching the board, so a rejected move
  // leaves the position as it was.
  std::array<int, DIRECTIONS.size()> runs{};
  int flipped = 0;
  for (std::size_t d = 0; d < DIRECTIONS.size(); ++d) {
    runs[d] = outflanked(mv.x, mv.y, DIRECTIONS[d].dx, DIRECTIONS[d].dy, to_move_);
    flipped += runs[d];
  }

  if (flipped == 0) {
    return false;
  }

  const Cell mine = disc(to_move_);
  for (std::size_t d = 0; d < DIRECTIONS.size(); ++d) {
    for (int step = 1; step <= runs[d]; ++step) {
      cells_[index(mv.x + step * DIRECTIONS[d].dx, mv.y + step * DIRECTIONS[d].dy)] = mine;
    }
  }

  cells_[index(mv.x, mv.y)] = mine;
  to_move_ = !to_move_;
  return true;
}

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

int Position::mobility(Player player) const {
  int count = 0;
  for (int x = 0; x < size_; ++x) {
    for (int y = 0; y < size_; ++y) {
      if (is_legal_for(x, y, player)) {
        ++count;
      }
    }
  }
  return count;
}

int Position::disc_count(Player player) const noexcept {
  const Cell mine = disc(player);
  int count = 0;
  for (int x = 0; x < size_; ++x) {
    for (int y = 0; y < size_; ++y) {
      if (cells_[index(x, y)] == mine) {
        ++count;
      }
    }
  }
  return count;
}

// Mobility difference from the point of view of the player to move.
int Position::evaluate() const {
  return mobility(to_move_) - mobility(!to_move_);
}

// Neither side can place a disc: both would have to pass.
bool Position::is_terminal() const {
  return mobility(to_move_) == 0 && mobility(!to_move_) == 0;
}

std::optional<Player> Position::winner() const {
  if (!is_terminal()) {
    return std::nullopt;
  }

  const int one = disc_count(Player::One);
  const int two = disc_count(Player::Two);
  if (one == two) {
    return std::nullopt;
  }
  return one > two ? Player::One : Player::Two;
}

} // namespace ggtl::reversi
