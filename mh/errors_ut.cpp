#include "mh/errors.hpp"

#include <gmock/gmock.h>

/**
 * @test Verify that mh::detail::raise() formats the annotations and raises the right type.
 */
TEST(errors, raise) {
  using namespace ::testing;
  try {
    mh::detail::raise<mh::election_failed>("start_election(", "B", ") - candidates=", 0);
    FAIL() << "expected exception";
  } catch (mh::election_failed const& ex) {
    EXPECT_EQ(std::string(ex.what()), "start_election(B) - candidates=0");
  }
  EXPECT_THROW(mh::detail::raise<mh::decode_error>("short buffer"), std::invalid_argument);
}

/**
 * @test Verify the exception hierarchy, callers catch transport problems as a family.
 */
TEST(errors, hierarchy) {
  EXPECT_THROW(throw mh::transport_unavailable("not running"), mh::transport_error);
  EXPECT_THROW(throw mh::transport_error("send failed"), std::runtime_error);

  mh::broadcast_exhausted ex("gave up", 3);
  EXPECT_EQ(ex.attempts(), 3);
  EXPECT_STREQ(ex.what(), "gave up");
}

/**
 * @test Verify MH_ASSERT_THROW() raises mh::invariant_violation naming the failed predicate.
 */
TEST(errors, assert_throw) {
  using namespace ::testing;
  ASSERT_NO_THROW(MH_ASSERT_THROW(true));
  try {
    int candidates = 0;
    MH_ASSERT_THROW(candidates > 0);
    FAIL() << "expected exception";
  } catch (mh::invariant_violation const& ex) {
    EXPECT_THAT(ex.what(), HasSubstr("candidates > 0"));
    EXPECT_THAT(ex.what(), HasSubstr("errors_ut.cpp"));
  }
}
