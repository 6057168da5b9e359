#include <gtest/gtest.h>

#include <sstream>

#include "ggtl/about.hpp"

TEST(About, MessageIncludesNameAndVersion) {
  const auto message = ggtl::about_message();
  EXPECT_EQ(message.rfind(ggtl::library_name(), 0), 0U);
  EXPECT_NE(message.find(ggtl::library_version()), std::string::npos);
}

TEST(About, PrintWritesMessageWithNewline) {
  std::ostringstream buffer;
  ggtl::print_about(buffer);
  EXPECT_EQ(buffer.str(), ggtl::about_message() + '\n');
}
