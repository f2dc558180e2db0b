#include "mh/detail/timer_registry.hpp"
#include <mh/active_completion_queue.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <thread>

using namespace std::chrono_literals;

/**
 * @test Verify the registry works with real gRPC alarms, and nothing fires after shutdown.
 */
TEST(timer_registry_integration, shutdown_silences_timers) {
  mh::active_completion_queue queue;
  mh::detail::timer_registry<mh::completion_queue<>> registry(queue.cq());

  std::promise<void> fired;
  registry.schedule_once("once", 10ms, [&fired]() { fired.set_value(); });
  ASSERT_EQ(fired.get_future().wait_for(2s), std::future_status::ready);

  std::atomic<int> sentinel(0);
  registry.schedule_repeating("repeat", 20ms, [&sentinel]() { ++sentinel; });
  registry.schedule_once("later", 30ms, [&sentinel]() { ++sentinel; });
  // ... run shutdown() in the loop thread, as the coordinator does ...
  queue.cq().run_async("test/shutdown", [&registry]() { registry.shutdown(); }, mh::use_future()).get();
  EXPECT_TRUE(registry.active_ids().empty());

  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(sentinel.load(), 0);
}

/**
 * @test Verify replacing a timer with real alarms never runs the old action.
 */
TEST(timer_registry_integration, replace) {
  mh::active_completion_queue queue;
  mh::detail::timer_registry<mh::completion_queue<>> registry(queue.cq());

  std::atomic<int> old_cnt(0);
  std::promise<void> done;
  registry.schedule_once("election.confirm", 5ms, [&old_cnt]() { ++old_cnt; });
  registry.schedule_once("election.confirm", 50ms, [&done]() { done.set_value(); });
  ASSERT_EQ(done.get_future().wait_for(2s), std::future_status::ready);
  EXPECT_EQ(old_cnt.load(), 0);
}
