#include "mh/active_completion_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>

/**
 * @test Verify a loop starts, keeps its name, and is shutdown on destruction.
 */
TEST(active_completion_queue, basic) {
  auto shq = std::make_shared<mh::active_completion_queue>("A");
  EXPECT_EQ(shq->name(), "A");
  EXPECT_FALSE(shq->cq().in_shutdown());
  EXPECT_NO_THROW(shq.reset());

  mh::active_completion_queue unnamed;
  EXPECT_EQ(unnamed.name(), "mesh");
}

/**
 * @test Verify that closures posted with run_async() execute in the loop thread.
 */
TEST(active_completion_queue, run_async_in_loop_thread) {
  mh::active_completion_queue queue;
  EXPECT_FALSE(queue.in_loop_thread());

  std::promise<bool> in_loop;
  queue.cq().run_async("test/in_loop", [&queue, &in_loop]() { in_loop.set_value(queue.in_loop_thread()); });
  auto f = in_loop.get_future();
  ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  EXPECT_TRUE(f.get());
}

/**
 * @test Verify that pending timers are cancelled, not leaked, when the active queue is destroyed.
 */
TEST(active_completion_queue, shutdown_cancels_timers) {
  std::atomic<int> fired(0);
  std::atomic<int> cancelled(0);
  {
    mh::active_completion_queue queue;
    queue.cq().make_relative_timer(std::chrono::hours(1), "test/long_timer", [&](auto const&, bool ok) {
      if (ok) {
        ++fired;
      } else {
        ++cancelled;
      }
    });
  }
  EXPECT_EQ(fired.load(), 0);
  EXPECT_EQ(cancelled.load(), 1);
}
