#include "ggtl/search.hpp"

#include <stdexcept>
#include <string>

namespace ggtl {

void validate_ply(int ply) {
  if (ply < 0) {
    throw std::invalid_argument("invalid search depth " + std::to_string(ply));
  }
}

void Config::validate() const {
  validate_ply(ply);

  if (alpha >= beta) {
    throw std::invalid_argument("invalid search window [" + std::to_string(alpha) + ", " +
                                std::to_string(beta) + "]");
  }
}

} // namespace ggtl
