#include <mh/detail/broadcast_policies.hpp>

#include <gtest/gtest.h>

#include <thread>

/// @test Verify the delays grow by one base period after each failure.
TEST(broadcast_policies, linear_backoff) {
  using namespace std::chrono_literals;
  EXPECT_THROW(mh::detail::linear_backoff(-1s), std::invalid_argument);
  EXPECT_NO_THROW(mh::detail::linear_backoff(0ms));

  mh::detail::linear_backoff backoff(1s);
  EXPECT_EQ(backoff.on_failure(), 1000ms);
  EXPECT_EQ(backoff.on_failure(), 2000ms);
  EXPECT_EQ(backoff.on_failure(), 3000ms);

  // ... clones start over ...
  auto copy = backoff.clone();
  EXPECT_EQ(copy->on_failure(), 1000ms);
}

/// @test Verify limited_attempts counts the first attempt.
TEST(broadcast_policies, limited_attempts) {
  EXPECT_THROW(mh::detail::limited_attempts(0), std::invalid_argument);
  EXPECT_THROW(mh::detail::limited_attempts(-1), std::invalid_argument);

  mh::detail::limited_attempts policy(3);
  EXPECT_EQ(policy.maximum_attempts(), 3);
  // ... attempt 1 failed, retry ...
  EXPECT_TRUE(policy.on_failure());
  // ... attempt 2 failed, retry ...
  EXPECT_TRUE(policy.on_failure());
  // ... attempt 3 failed, give up ...
  EXPECT_FALSE(policy.on_failure());
  EXPECT_FALSE(policy.on_failure());

  auto copy = policy.clone();
  EXPECT_TRUE(copy->on_failure());

  mh::detail::limited_attempts single(1);
  EXPECT_FALSE(single.on_failure());
}

TEST(broadcast_policies, limited_time) {
  using namespace std::chrono_literals;
  EXPECT_NO_THROW(mh::detail::limited_time(3ms));

  mh::detail::limited_time policy(200us);
  bool failed = false;
  for (int i = 0; i != 10; ++i) {
    std::this_thread::sleep_for(200us);
    if (not policy.on_failure()) {
      failed = true;
      break;
    }
  }
  EXPECT_TRUE(failed);
}
