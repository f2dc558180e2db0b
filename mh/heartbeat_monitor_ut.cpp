#include "mh/heartbeat_monitor.hpp"

#include <gmock/gmock.h>

#include <stdexcept>

using namespace std::chrono_literals;

namespace {
mh::heartbeat_monitor::time_point t0() {
  return std::chrono::system_clock::from_time_t(1500000000);
}
} // anonymous namespace

/**
 * @test Verify the timeout is strict: exactly at the timeout the peer is still alive.
 */
TEST(heartbeat_monitor, check_timeout) {
  mh::heartbeat_monitor monitor;
  monitor.record_heartbeat("A", t0());

  EXPECT_FALSE(monitor.check_timeout("A", 15s, t0(), true));
  EXPECT_FALSE(monitor.check_timeout("A", 15s, t0() + 15s, true));
  EXPECT_TRUE(monitor.check_timeout("A", 15s, t0() + 15s + 1ms, false));

  // ... a new heartbeat resets the timeout ...
  monitor.record_heartbeat("A", t0() + 10s);
  EXPECT_FALSE(monitor.check_timeout("A", 15s, t0() + 20s, true));
}

/**
 * @test Verify never seen peers use the caller-supplied grace condition.
 */
TEST(heartbeat_monitor, never_seen) {
  mh::heartbeat_monitor monitor;
  EXPECT_FALSE(monitor.has_seen("Z"));
  EXPECT_TRUE(monitor.check_timeout("Z", 15s, t0(), true));
  EXPECT_FALSE(monitor.check_timeout("Z", 15s, t0(), false));
  EXPECT_THROW(monitor.last_seen("Z"), std::out_of_range);
}

/**
 * @test Verify the bookkeeping functions.
 */
TEST(heartbeat_monitor, bookkeeping) {
  mh::heartbeat_monitor monitor;
  monitor.record_heartbeat("C", t0());
  monitor.record_heartbeat("A", t0() + 10s);
  monitor.record_heartbeat("B", t0() + 20s);
  // ... late messages do not move the time backwards ...
  monitor.record_heartbeat("B", t0() + 5s);
  EXPECT_EQ(monitor.last_seen("B"), t0() + 20s);

  using namespace ::testing;
  EXPECT_THAT(monitor.known_peers(), ElementsAre("A", "B", "C"));
  EXPECT_THAT(monitor.overdue_peers(15s, t0() + 30s), ElementsAre("A", "C"));

  // ... entries are never removed by the checks ...
  EXPECT_TRUE(monitor.has_seen("C"));
  monitor.clear();
  EXPECT_TRUE(monitor.known_peers().empty());
}
