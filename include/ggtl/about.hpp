#pragma once

#include <ostream>
#include <string>

namespace ggtl {

std::string library_name();
std::string library_version();
std::string about_message();
void print_about(std::ostream& os);

} // namespace ggtl
