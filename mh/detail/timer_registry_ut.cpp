#include "mh/detail/timer_registry.hpp"
#include <mh/detail/simulated_clock.hpp>

#include <gmock/gmock.h>

#include <algorithm>

using namespace std::chrono_literals;

namespace {
using completion_queue_type = mh::completion_queue<mh::detail::mocked_grpc_interceptor>;
using registry_type = mh::detail::timer_registry<completion_queue_type>;
} // anonymous namespace

/**
 * @test Verify one-shot timers fire once and then disappear from the registry.
 */
TEST(timer_registry, schedule_once) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  registry_type registry(queue);

  int cnt = 0;
  registry.schedule_once("host.promotion", 2s, [&cnt]() { ++cnt; });
  EXPECT_TRUE(registry.is_active("host.promotion"));
  EXPECT_EQ(clock.last_delay("timer_registry/host.promotion"), 2000ms);

  clock.advance(1999ms);
  EXPECT_EQ(cnt, 0);
  clock.advance(1ms);
  EXPECT_EQ(cnt, 1);
  EXPECT_FALSE(registry.is_active("host.promotion"));
  EXPECT_TRUE(registry.active_ids().empty());

  clock.advance(10s);
  EXPECT_EQ(cnt, 1);
}

/**
 * @test Verify repeating timers keep firing until cancelled.
 */
TEST(timer_registry, schedule_repeating) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  registry_type registry(queue);

  int cnt = 0;
  registry.schedule_repeating("network.heartbeat", 10s, [&cnt]() { ++cnt; });
  clock.advance(35s);
  EXPECT_EQ(cnt, 3);
  EXPECT_TRUE(registry.is_active("network.heartbeat"));

  registry.cancel("network.heartbeat");
  EXPECT_FALSE(registry.is_active("network.heartbeat"));
  clock.advance(60s);
  EXPECT_EQ(cnt, 3);
}

/**
 * @test Verify scheduling the same name twice leaves a single live timer, and the old one never fires.
 */
TEST(timer_registry, replace_same_id) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  registry_type registry(queue);

  int old_cnt = 0;
  int new_cnt = 0;
  registry.schedule("election.confirm", 1s, false, [&old_cnt]() { ++old_cnt; });
  registry.schedule("election.confirm", 3s, false, [&new_cnt]() { ++new_cnt; });

  auto ids = registry.active_ids();
  ASSERT_EQ(ids.size(), 1UL);
  EXPECT_EQ(ids[0], "election.confirm");

  // ... the first alarm still expires, as if it was already in flight when cancelled ...
  EXPECT_EQ(clock.pending(), 2UL);
  clock.advance(2s);
  EXPECT_EQ(old_cnt, 0);
  EXPECT_EQ(new_cnt, 0);
  clock.advance(1s);
  EXPECT_EQ(old_cnt, 0);
  EXPECT_EQ(new_cnt, 1);
}

/**
 * @test Verify cancel() is idempotent and tolerates unknown names.
 */
TEST(timer_registry, cancel_idempotent) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  registry_type registry(queue);

  int cnt = 0;
  registry.schedule_once("network.reconnect", 2s, [&cnt]() { ++cnt; });
  EXPECT_NO_THROW(registry.cancel("network.reconnect"));
  EXPECT_NO_THROW(registry.cancel("network.reconnect"));
  EXPECT_NO_THROW(registry.cancel("never.scheduled"));
  clock.advance(5s);
  EXPECT_EQ(cnt, 0);
}

/**
 * @test Verify that nothing fires after cancel_all() or shutdown().
 */
TEST(timer_registry, cancel_all_and_shutdown) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  registry_type registry(queue);

  int sentinel = 0;
  registry.schedule_once("a", 1s, [&sentinel]() { ++sentinel; });
  registry.schedule_repeating("b", 1s, [&sentinel]() { ++sentinel; });
  registry.schedule_repeating("c", 500ms, [&sentinel]() { ++sentinel; });
  EXPECT_EQ(registry.active_ids().size(), 3UL);

  registry.cancel_all();
  EXPECT_TRUE(registry.active_ids().empty());
  clock.advance(1min);
  EXPECT_EQ(sentinel, 0);

  // ... cancel_all() still accepts new timers, shutdown() does not ...
  registry.schedule_once("d", 1s, [&sentinel]() { ++sentinel; });
  registry.shutdown();
  registry.schedule_once("e", 1s, [&sentinel]() { ++sentinel; });
  EXPECT_FALSE(registry.is_active("e"));
  EXPECT_NO_THROW(registry.shutdown());
  clock.advance(1min);
  EXPECT_EQ(sentinel, 0);
}

/**
 * @test Verify an action can cancel or replace its own timer.
 */
TEST(timer_registry, action_cancels_itself) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  registry_type registry(queue);

  int cnt = 0;
  registry.schedule_repeating("game.sync", 1s, [&cnt, &registry]() {
    if (++cnt == 2) {
      registry.cancel("game.sync");
    }
  });
  clock.advance(10s);
  EXPECT_EQ(cnt, 2);
  EXPECT_FALSE(registry.is_active("game.sync"));

  int replaced = 0;
  registry.schedule_once("game.restart", 1s, [&replaced, &registry]() {
    registry.schedule_once("game.restart", 1s, [&replaced]() { replaced += 10; });
    ++replaced;
  });
  clock.advance(5s);
  EXPECT_EQ(replaced, 11);
}

/**
 * @test Verify a failing action is logged and does not break the registry.
 */
TEST(timer_registry, action_raises) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  registry_type registry(queue);

  int cnt = 0;
  registry.schedule_repeating("flaky", 1s, [&cnt]() {
    ++cnt;
    throw std::runtime_error("flaky action");
  });
  EXPECT_NO_THROW(clock.advance(3s));
  EXPECT_EQ(cnt, 3);
  EXPECT_TRUE(registry.is_active("flaky"));
}

/**
 * @test Verify the registry can be destroyed while its alarms are still pending.
 */
TEST(timer_registry, destroyed_with_pending_timers) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);

  int cnt = 0;
  {
    registry_type registry(queue);
    registry.schedule_repeating("network.heartbeat", 1s, [&cnt]() { ++cnt; });
  }
  EXPECT_EQ(clock.pending(), 1UL);
  EXPECT_NO_THROW(clock.advance(5s));
  EXPECT_EQ(cnt, 0);
}

/**
 * @test Verify countdowns tick down to zero and then finish.
 */
TEST(timer_registry, countdown) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  registry_type registry(queue);

  std::vector<int> ticks;
  int done = 0;
  registry.start_countdown(
      "game.countdown", 3, 1s, [&ticks](int remaining) { ticks.push_back(remaining); }, [&done]() { ++done; });
  clock.advance(10s);
  EXPECT_EQ(ticks, (std::vector<int>{2, 1, 0}));
  EXPECT_EQ(done, 1);
  EXPECT_FALSE(registry.is_active("game.countdown"));

  registry.start_countdown("game.countdown", 0, 1s, [&ticks](int) { ticks.push_back(-1); }, [&done]() { ++done; });
  EXPECT_EQ(done, 2);
  EXPECT_EQ(ticks.size(), 3UL);
}
