#include "ggtl/about.hpp"

namespace ggtl {

std::string library_name() {
  return "ggtl";
}

std::string library_version() {
  return "0.4.0";
}

std::string about_message() {
  return library_name() + " " + library_version() + " - generic game-tree search (alpha-beta)";
}

void print_about(std::ostream& os) {
  os << about_message() << '\n';
}

} // namespace ggtl
