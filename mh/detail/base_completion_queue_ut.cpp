#include "mh/detail/base_completion_queue.hpp"

#include <gtest/gtest.h>

#include <future>

using namespace std::chrono_literals;

/**
 * @test Verify run() returns after shutdown(), and shutdown() can be called more than once.
 */
TEST(base_completion_queue, run_shutdown) {
  mh::detail::base_completion_queue queue;
  auto loop = std::async(std::launch::async, [&queue]() { queue.run(); });
  // ... give the loop a chance to go around at least once ...
  EXPECT_EQ(loop.wait_for(2 * mh::detail::base_completion_queue::loop_timeout), std::future_status::timeout);

  EXPECT_FALSE(queue.in_shutdown());
  queue.shutdown();
  EXPECT_TRUE(queue.in_shutdown());
  ASSERT_EQ(loop.wait_for(2s), std::future_status::ready);
  EXPECT_NO_THROW(loop.get());
  EXPECT_NO_THROW(queue.shutdown());
}

/**
 * @test Verify a queue shutdown before its loop starts does not block run().
 */
TEST(base_completion_queue, shutdown_before_run) {
  mh::detail::base_completion_queue queue;
  queue.shutdown();
  auto loop = std::async(std::launch::async, [&queue]() { queue.run(); });
  EXPECT_EQ(loop.wait_for(2s), std::future_status::ready);
}
