#include "mh/mesh_host.hpp"
#include <mh/errors.hpp>
#include <mh/loopback_transport.hpp>

#include <gtest/gtest.h>

#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {
/// A configuration with short intervals, the tests run with the real clock.
mh::mesh_config fast_config(std::string const& self) {
  mh::mesh_config config;
  config.self_id = self;
  config.room_id = "room-1";
  config.device_name = "device-" + self;
  config.election_confirm_delay = 50ms;
  config.host_heartbeat_interval = 50ms;
  config.peer_heartbeat_interval = 100ms;
  config.host_timeout = 300ms;
  config.host_timeout_check_interval = 50ms;
  config.quick_restart_delay = 50ms;
  config.broadcast_backoff_base = 10ms;
  return config;
}

std::unique_ptr<mh::mesh_host> make_host(std::shared_ptr<mh::loopback_transport> transport) {
  auto self = transport->peer_id();
  return std::unique_ptr<mh::mesh_host>(
      new mh::mesh_host(std::make_shared<mh::active_completion_queue>(self), std::move(transport), fast_config(self)));
}

/// Poll @a predicate until it returns true or the timeout expires.
template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = 5s) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return predicate();
}

bool follows(mh::mesh_host const& peer, std::string const& host) {
  auto e = peer.snapshot();
  return e.has_host and e.current_host == host and e.state == mh::election_state::completed;
}
} // anonymous namespace

/**
 * @test Verify three peers elect the lowest id, and elect a new host when it leaves.
 */
TEST(mesh_host, elect_and_fail_over) {
  auto hub = std::make_shared<mh::loopback_hub>();
  auto ta = hub->connect("A");
  auto a = make_host(ta);
  auto b = make_host(hub->connect("B"));
  auto c = make_host(hub->connect("C"));

  b->start_election();
  ASSERT_TRUE(wait_until([&]() { return follows(*a, "A") and follows(*b, "A") and follows(*c, "A"); }));
  EXPECT_TRUE(a->is_host());
  EXPECT_FALSE(b->is_host());
  EXPECT_FALSE(c->is_host());

  // ... the host leaves the mesh without a word ...
  ta->disconnect();
  a.reset();
  ASSERT_TRUE(wait_until([&]() { return follows(*b, "B") and follows(*c, "B"); }));
  EXPECT_TRUE(b->is_host());
  EXPECT_FALSE(c->is_host());
}

/**
 * @test Verify subscribers, called from the queue thread, see the election results.
 */
TEST(mesh_host, subscribers) {
  auto hub = std::make_shared<mh::loopback_hub>();
  auto a = make_host(hub->connect("A"));
  auto b = make_host(hub->connect("B"));

  std::mutex mu;
  std::vector<mh::host_event> events;
  b->subscribe([&mu, &events](mh::host_event const& e) {
    std::lock_guard<std::mutex> lock(mu);
    events.push_back(e);
  });

  a->start_election();
  ASSERT_TRUE(wait_until([&]() {
    std::lock_guard<std::mutex> lock(mu);
    return not events.empty() and events.back() == mh::host_event{true, "A", false, mh::election_state::completed};
  }));
  std::lock_guard<std::mutex> lock(mu);
  EXPECT_EQ(events.front(), (mh::host_event{false, "", false, mh::election_state::idle}));
}

/**
 * @test Verify application messages travel through the mesh.
 */
TEST(mesh_host, application_messages) {
  auto hub = std::make_shared<mh::loopback_hub>();
  auto a = make_host(hub->connect("A"));
  auto b = make_host(hub->connect("B"));

  std::promise<mh::game_message> received;
  b->subscribe_messages([&received](mh::game_message const& m) { received.set_value(m); });

  EXPECT_NO_THROW(a->broadcast_message("number_drawn", "42", mh::message_priority::high).get());
  auto fut = received.get_future();
  ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
  auto msg = fut.get();
  EXPECT_EQ(msg.type, "number_drawn");
  EXPECT_EQ(msg.room_id, "room-1");
  EXPECT_EQ(msg.payload, "42");

  EXPECT_THROW(a->broadcast_message("election_start", "", mh::message_priority::high), std::invalid_argument);
}

/**
 * @test Verify shutdown() is idempotent and the mutators fail after it.
 */
TEST(mesh_host, shutdown) {
  auto hub = std::make_shared<mh::loopback_hub>();
  auto ta = hub->connect("A");
  auto a = make_host(ta);
  a->become_host();
  EXPECT_TRUE(a->is_host());

  a->shutdown();
  EXPECT_FALSE(a->has_host());
  EXPECT_NO_THROW(a->shutdown());
  EXPECT_THROW(a->start_election(), std::runtime_error);
  EXPECT_THROW(a->migrate_host("B"), std::runtime_error);

  auto sent = ta->send_attempts();
  std::this_thread::sleep_for(300ms);
  EXPECT_EQ(ta->send_attempts(), sent);
}
