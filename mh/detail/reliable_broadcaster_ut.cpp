#include "mh/detail/reliable_broadcaster.hpp"
#include <mh/detail/simulated_clock.hpp>

#include <gmock/gmock.h>

using namespace std::chrono_literals;

namespace {
using completion_queue_type = mh::completion_queue<mh::detail::mocked_grpc_interceptor>;
using broadcaster_type = mh::detail::reliable_broadcaster<completion_queue_type>;

class mock_transport : public mh::mesh_transport {
public:
  MOCK_CONST_METHOD0(connected_peers, std::set<std::string>());
  MOCK_METHOD2(send_broadcast, void(std::string const&, mh::message_priority));
  MOCK_METHOD1(set_message_handler, void(message_handler));
  MOCK_METHOD0(restart, void());
};

void fail_send(std::string const&, mh::message_priority) {
  throw mh::transport_error("injected failure");
}

/// Create a broadcaster with the default policies: 3 attempts, 1s backoff base.
std::unique_ptr<broadcaster_type> make_broadcaster(
    completion_queue_type& queue, std::shared_ptr<mock_transport> transport) {
  return std::unique_ptr<broadcaster_type>(new broadcaster_type(
      queue, std::move(transport), mh::detail::limited_attempts(3), mh::detail::linear_backoff(1s)));
}
} // anonymous namespace

/**
 * @test Verify a successful first attempt does not schedule any retry.
 */
TEST(reliable_broadcaster, first_attempt_succeeds) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto transport = std::make_shared<mock_transport>();
  auto broadcaster = make_broadcaster(queue, transport);

  using namespace ::testing;
  EXPECT_CALL(*transport, send_broadcast("payload", mh::message_priority::high)).Times(1);

  std::vector<mh::broadcast_result> results;
  broadcaster->broadcast(
      "test", "payload", mh::message_priority::high,
      [&results](mh::broadcast_result const& r) { results.push_back(r); });
  ASSERT_EQ(results.size(), 1UL);
  EXPECT_TRUE(results[0].delivered);
  EXPECT_EQ(results[0].attempts, 1);
  EXPECT_EQ(clock.pending(), 0UL);
  EXPECT_EQ(broadcaster->in_flight(), 0UL);
}

/**
 * @test Verify fail, fail, succeed results in exactly three sends and a delivered message.
 */
TEST(reliable_broadcaster, fail_fail_succeed) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto transport = std::make_shared<mock_transport>();
  auto broadcaster = make_broadcaster(queue, transport);

  using namespace ::testing;
  EXPECT_CALL(*transport, send_broadcast(_, _))
      .WillOnce(Invoke(fail_send))
      .WillOnce(Invoke(fail_send))
      .WillOnce(Return());

  std::vector<mh::broadcast_result> results;
  broadcaster->broadcast(
      "host_heartbeat", "hb", mh::message_priority::normal,
      [&results](mh::broadcast_result const& r) { results.push_back(r); });
  EXPECT_TRUE(results.empty());
  EXPECT_EQ(broadcaster->in_flight(), 1UL);
  // ... the second attempt waits 1 x base ...
  EXPECT_EQ(clock.last_delay("broadcast/host_heartbeat/retry"), 1000ms);

  clock.advance(999ms);
  EXPECT_TRUE(results.empty());
  clock.advance(1ms);
  EXPECT_TRUE(results.empty());
  // ... the third attempt waits 2 x base ...
  EXPECT_EQ(clock.last_delay("broadcast/host_heartbeat/retry"), 2000ms);

  clock.advance(2s);
  ASSERT_EQ(results.size(), 1UL);
  EXPECT_TRUE(results[0].delivered);
  EXPECT_EQ(results[0].attempts, 3);

  auto stats = broadcaster->stats();
  EXPECT_EQ(stats.total, 1U);
  EXPECT_EQ(stats.delivered, 1U);
  EXPECT_EQ(stats.retries, 2U);
  EXPECT_EQ(stats.exhausted, 0U);
}

/**
 * @test Verify a broadcast that always fails is exhausted after three attempts, with no fourth send.
 */
TEST(reliable_broadcaster, always_fails) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto transport = std::make_shared<mock_transport>();
  auto broadcaster = make_broadcaster(queue, transport);

  using namespace ::testing;
  EXPECT_CALL(*transport, send_broadcast(_, _)).Times(3).WillRepeatedly(Invoke(fail_send));

  auto fut = broadcaster->broadcast("election_start", "e", mh::message_priority::high, mh::use_future());
  clock.advance(1min);
  ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
  try {
    fut.get();
    FAIL() << "expected mh::broadcast_exhausted";
  } catch (mh::broadcast_exhausted const& ex) {
    EXPECT_EQ(ex.attempts(), 3);
    EXPECT_THAT(ex.what(), HasSubstr("injected failure"));
  }
  EXPECT_EQ(broadcaster->stats().exhausted, 1U);
  EXPECT_EQ(broadcaster->in_flight(), 0UL);
  EXPECT_EQ(clock.pending(), 0UL);
}

/**
 * @test Verify the future version reports successful deliveries.
 */
TEST(reliable_broadcaster, future_delivered) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto transport = std::make_shared<mock_transport>();
  auto broadcaster = make_broadcaster(queue, transport);

  using namespace ::testing;
  EXPECT_CALL(*transport, send_broadcast(_, _)).WillOnce(Invoke(fail_send)).WillOnce(Return());

  auto fut = broadcaster->broadcast("peer_heartbeat", "p", mh::message_priority::low, mh::use_future());
  EXPECT_EQ(fut.wait_for(0s), std::future_status::timeout);
  clock.advance(1s);
  ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
  EXPECT_NO_THROW(fut.get());
}

/**
 * @test Verify shutdown() cancels the pending retries, and nothing is sent or reported afterwards.
 */
TEST(reliable_broadcaster, shutdown_cancels_retries) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto transport = std::make_shared<mock_transport>();
  auto broadcaster = make_broadcaster(queue, transport);

  using namespace ::testing;
  EXPECT_CALL(*transport, send_broadcast(_, _)).Times(2).WillRepeatedly(Invoke(fail_send));

  int reported = 0;
  broadcaster->broadcast("a", "1", mh::message_priority::normal, [&reported](mh::broadcast_result const&) {
    ++reported;
  });
  broadcaster->broadcast("b", "2", mh::message_priority::normal, [&reported](mh::broadcast_result const&) {
    ++reported;
  });
  EXPECT_EQ(broadcaster->in_flight(), 2UL);

  broadcaster->shutdown();
  EXPECT_EQ(broadcaster->in_flight(), 0UL);
  EXPECT_EQ(broadcaster->stats().cancelled, 2U);

  // ... the retry alarms still expire, the broadcaster must ignore them ...
  clock.advance(1min);
  EXPECT_EQ(reported, 0);

  // ... and new broadcasts are dropped ...
  broadcaster->broadcast("c", "3", mh::message_priority::normal, [&reported](mh::broadcast_result const&) {
    ++reported;
  });
  EXPECT_NO_THROW(broadcaster->shutdown());
  EXPECT_EQ(reported, 0);
}

/**
 * @test Verify the broadcaster can be destroyed with retries pending.
 */
TEST(reliable_broadcaster, destroyed_with_pending_retries) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto transport = std::make_shared<mock_transport>();

  using namespace ::testing;
  EXPECT_CALL(*transport, send_broadcast(_, _)).Times(1).WillRepeatedly(Invoke(fail_send));
  {
    auto broadcaster = make_broadcaster(queue, transport);
    broadcaster->broadcast("a", "1", mh::message_priority::normal, nullptr);
  }
  EXPECT_EQ(clock.pending(), 1UL);
  EXPECT_NO_THROW(clock.advance(1min));
}
