#include "mh/log_severity.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

TEST(log_severity, base) {
  ASSERT_LT(mh::severity::LOWEST, mh::severity::HIGHEST);

  using s = mh::severity;
  std::ostringstream os;
  os << s::trace << " " << s::debug << " " << s::info << " " << s::notice << " " << s::warning << " " << s::error << " "
     << s::critical << " " << s::alert << " " << s::fatal;
  ASSERT_EQ(os.str(), "trace debug info notice warning error critical alert fatal");
}

/**
 * @test Verify that severity names can be parsed back, as the command-line flags require.
 */
TEST(log_severity, parse) {
  for (int i = int(mh::severity::LOWEST); i <= int(mh::severity::HIGHEST); ++i) {
    std::ostringstream os;
    os << mh::severity(i);
    EXPECT_EQ(mh::parse_severity(os.str()), mh::severity(i));
  }
  EXPECT_THROW(mh::parse_severity("verbose"), std::invalid_argument);
  EXPECT_THROW(mh::parse_severity(""), std::invalid_argument);
}
