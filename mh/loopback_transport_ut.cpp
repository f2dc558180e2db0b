#include "mh/loopback_transport.hpp"
#include <mh/errors.hpp>

#include <gmock/gmock.h>

#include <atomic>
#include <future>
#include <thread>
#include <vector>

/**
 * @test Verify messages reach every other running member of the hub.
 */
TEST(loopback_transport, broadcast) {
  auto hub = std::make_shared<mh::loopback_hub>();
  auto a = hub->connect("A");
  auto b = hub->connect("B");
  auto c = hub->connect("C");

  std::vector<std::string> at_a;
  std::vector<std::string> at_b;
  std::vector<std::string> at_c;
  a->set_message_handler([&at_a](std::string const& m) { at_a.push_back(m); });
  b->set_message_handler([&at_b](std::string const& m) { at_b.push_back(m); });
  c->set_message_handler([&at_c](std::string const& m) { at_c.push_back(m); });

  using namespace ::testing;
  EXPECT_THAT(a->connected_peers(), ElementsAre("B", "C"));

  a->send_broadcast("hello", mh::message_priority::high);
  EXPECT_TRUE(at_a.empty());
  EXPECT_THAT(at_b, ElementsAre("hello"));
  EXPECT_THAT(at_c, ElementsAre("hello"));

  c->disconnect();
  EXPECT_THAT(a->connected_peers(), ElementsAre("B"));
  EXPECT_TRUE(c->connected_peers().empty());
  b->send_broadcast("again", mh::message_priority::normal);
  EXPECT_THAT(at_c, ElementsAre("hello"));
  EXPECT_THROW(c->send_broadcast("lost", mh::message_priority::low), mh::transport_unavailable);

  c->restart();
  EXPECT_EQ(c->restarts(), 1);
  EXPECT_THAT(a->connected_peers(), ElementsAre("B", "C"));
}

/**
 * @test Verify the fault injection knobs.
 */
TEST(loopback_transport, fault_injection) {
  auto hub = std::make_shared<mh::loopback_hub>();
  auto a = hub->connect("A");
  auto b = hub->connect("B");
  int received = 0;
  b->set_message_handler([&received](std::string const&) { ++received; });

  a->fail_next(2);
  EXPECT_THROW(a->send_broadcast("1", mh::message_priority::normal), mh::transport_error);
  EXPECT_THROW(a->send_broadcast("2", mh::message_priority::normal), mh::transport_error);
  EXPECT_NO_THROW(a->send_broadcast("3", mh::message_priority::normal));
  EXPECT_EQ(received, 1);

  a->fail_always(true);
  for (int i = 0; i != 5; ++i) {
    EXPECT_THROW(a->send_broadcast("x", mh::message_priority::normal), mh::transport_error);
  }
  a->fail_always(false);
  EXPECT_NO_THROW(a->send_broadcast("4", mh::message_priority::normal));
  EXPECT_EQ(received, 2);
  EXPECT_EQ(a->send_attempts(), 9);
  EXPECT_EQ(a->messages_sent(), 2);
}

/**
 * @test Verify peer names are unique in a hub, but can be reused after the transport is gone.
 */
TEST(loopback_transport, unique_names) {
  auto hub = std::make_shared<mh::loopback_hub>();
  auto a = hub->connect("A");
  EXPECT_THROW(hub->connect("A"), std::invalid_argument);
  a.reset();
  EXPECT_NO_THROW(hub->connect("A"));
}

/**
 * @test Verify set_message_handler() waits for a running handler, and the old handler is not called afterwards.
 */
TEST(loopback_transport, replace_handler_waits_for_running_call) {
  using namespace std::chrono_literals;
  auto hub = std::make_shared<mh::loopback_hub>();
  auto a = hub->connect("A");
  auto b = hub->connect("B");

  std::promise<void> entered;
  std::promise<void> release;
  auto release_future = release.get_future().share();
  std::atomic<int> calls(0);
  b->set_message_handler([&entered, release_future, &calls](std::string const&) {
    if (++calls == 1) {
      entered.set_value();
      release_future.wait();
    }
  });

  auto sender = std::async(std::launch::async, [a]() { a->send_broadcast("hello", mh::message_priority::normal); });
  ASSERT_EQ(entered.get_future().wait_for(2s), std::future_status::ready);

  auto replaced =
      std::async(std::launch::async, [b]() { b->set_message_handler(mh::mesh_transport::message_handler()); });
  EXPECT_EQ(replaced.wait_for(100ms), std::future_status::timeout);

  release.set_value();
  ASSERT_EQ(replaced.wait_for(2s), std::future_status::ready);
  ASSERT_EQ(sender.wait_for(2s), std::future_status::ready);
  EXPECT_NO_THROW(sender.get());

  a->send_broadcast("again", mh::message_priority::normal);
  EXPECT_EQ(calls.load(), 1);
}
