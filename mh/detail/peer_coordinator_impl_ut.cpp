#include "mh/detail/peer_coordinator_impl.hpp"
#include <mh/detail/simulated_clock.hpp>
#include <mh/loopback_transport.hpp>

#include <gmock/gmock.h>

#include <map>

using namespace std::chrono_literals;

namespace {
using completion_queue_type = mh::completion_queue<mh::detail::mocked_grpc_interceptor>;
using coordinator_type = mh::detail::peer_coordinator_impl<completion_queue_type>;

mh::mesh_config make_config(std::string const& self) {
  mh::mesh_config config;
  config.self_id = self;
  config.room_id = "room-1";
  config.device_name = "device-" + self;
  return config;
}

std::shared_ptr<coordinator_type> make_peer(
    completion_queue_type& queue, mh::detail::simulated_clock& clock, std::shared_ptr<mh::mesh_transport> transport,
    std::string const& self) {
  return std::make_shared<coordinator_type>(
      queue, std::move(transport), make_config(self), [&clock]() { return clock.now(); });
}

/// Encode an election message as a peer in room-1 would send it.
std::string encode(std::string const& type, google::protobuf::Message const& payload) {
  return mh::encode_game_message(mh::wrap_election_message(type, "room-1", "remote-device", payload));
}

std::string host_heartbeat_from(std::string const& peer) {
  return encode(
      mh::message_type::host_heartbeat,
      mh::make_heartbeat(peer, "remote-device", mh::wire::ROLE_HOST, std::chrono::system_clock::now()));
}

/// Count the messages, by type, received by a transport with no coordinator.
class message_counter {
public:
  explicit message_counter(std::shared_ptr<mh::loopback_transport> transport)
      : transport_(std::move(transport))
      , counts_() {
    transport_->set_message_handler(
        [this](std::string const& bytes) { ++counts_[mh::decode_game_message(bytes).type]; });
  }
  message_counter(message_counter const&) = delete;
  message_counter& operator=(message_counter const&) = delete;
  ~message_counter() {
    transport_->set_message_handler(mh::mesh_transport::message_handler());
  }

  int count(std::string const& type) const {
    auto i = counts_.find(type);
    return i == counts_.end() ? 0 : i->second;
  }

private:
  std::shared_ptr<mh::loopback_transport> transport_;
  std::map<std::string, int> counts_;
};
} // anonymous namespace

/**
 * @test Verify the lowest id wins, and the losers follow it.
 */
TEST(peer_coordinator_impl, lowest_id_wins) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto ta = hub->connect("A");
  auto tc = hub->connect("C");
  auto b = make_peer(queue, clock, hub->connect("B"), "B");

  b->start_election({"C", "A"});
  // ... the winner is applied before the confirmation ...
  EXPECT_TRUE(b->has_host());
  EXPECT_EQ(b->current_host(), "A");
  EXPECT_FALSE(b->is_host());
  EXPECT_EQ(b->state(), mh::election_state::in_progress);
  EXPECT_EQ(clock.last_delay("timer_registry/election.confirm"), 2000ms);

  clock.advance(2s);
  EXPECT_EQ(b->state(), mh::election_state::completed);
  EXPECT_EQ(b->current_host(), "A");
  EXPECT_FALSE(b->is_host());
  EXPECT_TRUE(b->active_timers().empty());
}

/**
 * @test Verify every peer computes the same winner, whatever its own id.
 */
TEST(peer_coordinator_impl, deterministic_winner) {
  std::vector<std::string> ids{"delta", "alpha", "echo", "charlie", "bravo"};
  for (auto const& self : ids) {
    completion_queue_type queue;
    mh::detail::simulated_clock clock(queue);
    auto hub = std::make_shared<mh::loopback_hub>();
    auto peer = make_peer(queue, clock, hub->connect(self), self);

    std::set<std::string> others;
    for (auto const& id : ids) {
      if (id != self) {
        others.insert(id);
      }
    }
    peer->start_election(others);
    clock.advance(2s);
    EXPECT_EQ(peer->current_host(), "alpha") << "self=" << self;
    EXPECT_EQ(peer->is_host(), self == "alpha") << "self=" << self;
    EXPECT_EQ(peer->state(), mh::election_state::completed) << "self=" << self;
  }
}

/**
 * @test Verify an election started by one peer brings all the peers in the mesh to the same host.
 */
TEST(peer_coordinator_impl, three_peers_converge) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto tb = hub->connect("B");
  auto a = make_peer(queue, clock, hub->connect("A"), "A");
  auto b = make_peer(queue, clock, tb, "B");
  auto c = make_peer(queue, clock, hub->connect("C"), "C");
  a->startup();
  b->startup();
  c->startup();

  b->start_election(tb->connected_peers());
  clock.run_pending();
  EXPECT_TRUE(a->is_host());
  EXPECT_EQ(b->current_host(), "A");
  EXPECT_EQ(c->current_host(), "A");

  clock.advance(2s);
  for (auto const& peer : {a, b, c}) {
    EXPECT_EQ(peer->state(), mh::election_state::completed) << peer->self_id();
    EXPECT_EQ(peer->current_host(), "A") << peer->self_id();
  }

  // ... the host heartbeats keep the followers from timing out ...
  clock.advance(2min);
  for (auto const& peer : {a, b, c}) {
    EXPECT_EQ(peer->current_host(), "A") << peer->self_id();
    EXPECT_EQ(peer->host_timeouts(), 0) << peer->self_id();
  }
  EXPECT_TRUE(a->is_host());
  EXPECT_TRUE(b->monitor().has_seen("A"));
  EXPECT_TRUE(b->monitor().has_seen("C"));
}

/**
 * @test Verify the followers elect a new host once the host stops sending heartbeats.
 */
TEST(peer_coordinator_impl, silent_host_is_replaced) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto tb = hub->connect("B");
  auto a = make_peer(queue, clock, hub->connect("A"), "A");
  auto b = make_peer(queue, clock, tb, "B");
  auto c = make_peer(queue, clock, hub->connect("C"), "C");
  a->startup();
  b->startup();
  c->startup();
  b->start_election(tb->connected_peers());
  clock.advance(2s);
  ASSERT_TRUE(a->is_host());

  // ... the host stops, but its transport stays in the mesh ...
  a->shutdown();
  clock.advance(12s);
  EXPECT_EQ(b->current_host(), "A");
  EXPECT_EQ(c->current_host(), "A");
  EXPECT_EQ(b->host_timeouts(), 0);

  clock.advance(10s);
  EXPECT_TRUE(b->is_host());
  EXPECT_EQ(c->current_host(), "B");
  EXPECT_EQ(b->state(), mh::election_state::completed);
  EXPECT_EQ(c->state(), mh::election_state::completed);

  clock.advance(2min);
  EXPECT_TRUE(b->is_host());
  EXPECT_EQ(c->current_host(), "B");
  EXPECT_EQ(b->host_timeouts(), 1);
  EXPECT_LE(c->host_timeouts(), 1);
}

/**
 * @test Verify a host that was elected but never heard from times out, and is excluded from the next election.
 */
TEST(peer_coordinator_impl, never_heard_host_times_out_once) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto ta = hub->connect("A");
  auto tc = hub->connect("C");
  auto b = make_peer(queue, clock, hub->connect("B"), "B");
  b->startup();

  b->start_election({"A", "C"});
  clock.advance(14s);
  EXPECT_EQ(b->current_host(), "A");
  EXPECT_EQ(b->host_timeouts(), 0);

  // ... the check at 20s finds the host silent for more than 15s ...
  clock.advance(8s);
  EXPECT_EQ(b->host_timeouts(), 1);
  EXPECT_TRUE(b->is_host());
  EXPECT_EQ(b->state(), mh::election_state::completed);

  clock.advance(5min);
  EXPECT_EQ(b->host_timeouts(), 1);
  EXPECT_TRUE(b->is_host());
}

/**
 * @test Verify nothing is sent, and no subscriber is called, after shutdown().
 */
TEST(peer_coordinator_impl, shutdown_silences_everything) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto ta = hub->connect("A");
  auto a = make_peer(queue, clock, ta, "A");
  auto b = make_peer(queue, clock, hub->connect("B"), "B");
  a->startup();
  b->startup();
  a->start_election({"B"});
  clock.advance(30s);
  ASSERT_TRUE(a->is_host());

  int sentinel = 0;
  a->subscribe([&sentinel](mh::host_event const&) { ++sentinel; });
  ASSERT_EQ(sentinel, 1);

  a->shutdown();
  EXPECT_TRUE(a->active_timers().empty());
  EXPECT_EQ(a->broadcasts_in_flight(), 0UL);
  EXPECT_FALSE(a->has_host());
  EXPECT_EQ(a->state(), mh::election_state::idle);

  auto sent = ta->send_attempts();
  clock.advance(5min);
  EXPECT_EQ(ta->send_attempts(), sent);
  EXPECT_EQ(sentinel, 1);

  EXPECT_NO_THROW(a->shutdown());
  EXPECT_THROW(a->start_election({"B"}), std::runtime_error);
  EXPECT_THROW(a->become_host(), std::runtime_error);
  EXPECT_NO_THROW(a->on_message(host_heartbeat_from("0")));
  EXPECT_NO_THROW(a->handle_host_timeout());
  EXPECT_FALSE(a->has_host());
}

/**
 * @test Verify a peer without an id cannot start an election.
 */
TEST(peer_coordinator_impl, empty_self_id) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto peer = make_peer(queue, clock, hub->connect("anonymous"), "");

  EXPECT_THROW(peer->start_election({"A", "B"}), mh::election_failed);
  EXPECT_EQ(peer->state(), mh::election_state::idle);
  EXPECT_FALSE(peer->has_host());
  EXPECT_EQ(clock.pending(), 0UL);
}

/**
 * @test Verify invalid configurations are rejected at construction.
 */
TEST(peer_coordinator_impl, invalid_config) {
  completion_queue_type queue;
  auto hub = std::make_shared<mh::loopback_hub>();
  auto config = make_config("A");
  config.host_timeout = 1s;
  EXPECT_THROW(coordinator_type(queue, hub->connect("A"), config), std::invalid_argument);
}

/**
 * @test Verify become_host() starts the host heartbeats, and a lower host makes it yield.
 */
TEST(peer_coordinator_impl, lower_host_claim_wins) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  message_counter observer(hub->connect("Z"));
  auto b = make_peer(queue, clock, hub->connect("B"), "B");

  b->become_host();
  EXPECT_TRUE(b->is_host());
  EXPECT_EQ(b->state(), mh::election_state::completed);
  EXPECT_EQ(observer.count("host_announcement"), 1);
  EXPECT_THAT(b->active_timers(), ::testing::ElementsAre("election.host_heartbeat"));
  clock.advance(5s);
  EXPECT_EQ(observer.count("host_heartbeat"), 1);

  b->on_message(host_heartbeat_from("A"));
  EXPECT_FALSE(b->is_host());
  EXPECT_EQ(b->current_host(), "A");
  EXPECT_TRUE(b->active_timers().empty());
  clock.advance(30s);
  EXPECT_EQ(observer.count("host_heartbeat"), 1);
}

/**
 * @test Verify a host answers a higher host claim by announcing itself again.
 */
TEST(peer_coordinator_impl, higher_host_claim_ignored) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  message_counter observer(hub->connect("Z"));
  auto a = make_peer(queue, clock, hub->connect("A"), "A");

  a->become_host();
  ASSERT_EQ(observer.count("host_announcement"), 1);
  a->on_message(encode(mh::message_type::host_announcement, mh::make_host_announcement("C", 1)));
  EXPECT_TRUE(a->is_host());
  EXPECT_EQ(observer.count("host_announcement"), 2);
}

/**
 * @test Verify a follower keeps a live host, and replaces it once it is silent.
 */
TEST(peer_coordinator_impl, follower_keeps_live_host) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto b = make_peer(queue, clock, hub->connect("B"), "B");

  b->handle_heartbeat("A");
  EXPECT_EQ(b->current_host(), "A");
  EXPECT_EQ(b->state(), mh::election_state::completed);

  b->handle_heartbeat("C");
  EXPECT_EQ(b->current_host(), "A");

  // ... A is silent, C claims the role again, but B has a lower id than C ...
  clock.advance(16s);
  b->handle_heartbeat("C");
  EXPECT_TRUE(b->is_host());
  EXPECT_EQ(b->state(), mh::election_state::in_progress);
  clock.advance(2s);
  EXPECT_TRUE(b->is_host());
  EXPECT_EQ(b->state(), mh::election_state::completed);

  // ... heartbeats from the local peer are ignored ...
  b->handle_heartbeat("B");
  EXPECT_TRUE(b->is_host());
}

/**
 * @test Verify the candidates of a remote election_start join the local round, or start one.
 */
TEST(peer_coordinator_impl, election_start_candidates_join_round) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto b = make_peer(queue, clock, hub->connect("B"), "B");
  auto d = make_peer(queue, clock, hub->connect("D"), "D");
  auto start_from_c = encode(mh::message_type::election_start, mh::make_election_start("C", {"A", "C"}, 1));

  b->start_election({"C"});
  ASSERT_TRUE(b->is_host());
  b->on_message(start_from_c);
  // ... the optimistic winner stands until the confirmation ...
  EXPECT_TRUE(b->is_host());
  clock.advance(2s);
  EXPECT_FALSE(b->is_host());
  EXPECT_EQ(b->current_host(), "A");
  EXPECT_EQ(b->state(), mh::election_state::completed);

  // ... an idle peer starts its own round with the remote candidates ...
  d->on_message(start_from_c);
  EXPECT_EQ(d->state(), mh::election_state::in_progress);
  EXPECT_EQ(d->current_host(), "A");
  clock.advance(2s);
  EXPECT_EQ(d->current_host(), "A");
  EXPECT_EQ(d->state(), mh::election_state::completed);
}

/**
 * @test Verify a peer without a host follows a lower claimant at once.
 */
TEST(peer_coordinator_impl, lower_claimant_followed_without_election) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto c = make_peer(queue, clock, hub->connect("C"), "C");

  auto round = c->round();
  c->on_message(host_heartbeat_from("A"));
  EXPECT_EQ(c->current_host(), "A");
  EXPECT_EQ(c->state(), mh::election_state::completed);
  EXPECT_EQ(c->round(), round);
}

/**
 * @test Verify a peer joining late takes the host role from a host with a higher id.
 */
TEST(peer_coordinator_impl, late_lower_peer_takes_over) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto c = make_peer(queue, clock, hub->connect("C"), "C");
  c->startup();
  c->start_election({});
  clock.advance(3s);
  ASSERT_TRUE(c->is_host());

  auto a = make_peer(queue, clock, hub->connect("A"), "A");
  a->startup();
  // ... the first host heartbeat from C reaches A, which has no host and a lower id ...
  clock.advance(5s);
  EXPECT_TRUE(a->is_host());
  EXPECT_EQ(c->current_host(), "A");
  EXPECT_FALSE(c->is_host());

  clock.advance(10min);
  EXPECT_TRUE(a->is_host());
  EXPECT_EQ(a->state(), mh::election_state::completed);
  EXPECT_EQ(c->current_host(), "A");
  EXPECT_FALSE(c->is_host());
  EXPECT_EQ(c->state(), mh::election_state::completed);
  EXPECT_EQ(c->host_timeouts(), 0);
  EXPECT_TRUE(c->monitor().has_seen("A"));
}

/**
 * @test Verify migrate_host() overrides the election.
 */
TEST(peer_coordinator_impl, migrate_host) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto b = make_peer(queue, clock, hub->connect("B"), "B");

  b->start_election({"A"});
  EXPECT_EQ(b->current_host(), "A");
  b->migrate_host("B");
  EXPECT_TRUE(b->is_host());
  EXPECT_EQ(b->state(), mh::election_state::completed);

  // ... the pending confirmation must not undo the migration ...
  clock.advance(3s);
  EXPECT_TRUE(b->is_host());

  b->migrate_host("C");
  EXPECT_FALSE(b->is_host());
  EXPECT_EQ(b->current_host(), "C");
  EXPECT_TRUE(b->active_timers().empty());

  EXPECT_THROW(b->migrate_host(""), std::invalid_argument);
}

/**
 * @test Verify resign_host() runs a new election with the connected peers.
 */
TEST(peer_coordinator_impl, resign_host) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto ta = hub->connect("A");
  auto b = make_peer(queue, clock, hub->connect("B"), "B");

  b->become_host();
  auto round = b->round();
  b->resign_host();
  EXPECT_GT(b->round(), round);
  EXPECT_FALSE(b->is_host());
  EXPECT_EQ(b->current_host(), "A");
  EXPECT_EQ(b->state(), mh::election_state::in_progress);
  clock.advance(2s);
  EXPECT_EQ(b->state(), mh::election_state::completed);
  EXPECT_EQ(b->current_host(), "A");
}

/**
 * @test Verify a host left alone re-elects itself, and ignores changes while it has peers.
 */
TEST(peer_coordinator_impl, network_change) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto tb = hub->connect("B");
  auto a = make_peer(queue, clock, hub->connect("A"), "A");

  a->start_election({"B"});
  clock.advance(2s);
  ASSERT_TRUE(a->is_host());
  auto round = a->round();

  a->handle_network_change();
  EXPECT_EQ(a->round(), round);

  tb->disconnect();
  a->handle_network_change();
  EXPECT_EQ(a->round(), round + 1);
  EXPECT_TRUE(a->is_host());
  EXPECT_EQ(a->state(), mh::election_state::in_progress);
  clock.advance(2s);
  EXPECT_EQ(a->state(), mh::election_state::completed);
}

/**
 * @test Verify application messages reach the message subscribers, and bad input is dropped.
 */
TEST(peer_coordinator_impl, application_messages) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto a = make_peer(queue, clock, hub->connect("A"), "A");
  auto b = make_peer(queue, clock, hub->connect("B"), "B");
  a->startup();
  b->startup();

  std::vector<mh::game_message> received;
  auto token = b->subscribe_messages([&received](mh::game_message const& m) { received.push_back(m); });

  EXPECT_NO_THROW(b->on_message("\x05" "ab"));
  EXPECT_NO_THROW(b->on_message(mh::encode_game_message(mh::game_message{"chat", "room-2", "x", "other room"})));
  EXPECT_NO_THROW(b->on_message(
      mh::encode_game_message(mh::game_message{"host_heartbeat", "room-1", "x", std::string("\xff\xff", 2)})));
  EXPECT_TRUE(received.empty());
  EXPECT_FALSE(b->has_host());

  auto fut = a->broadcast_message("chat", "hello", mh::message_priority::normal);
  ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
  EXPECT_NO_THROW(fut.get());
  clock.run_pending();
  ASSERT_EQ(received.size(), 1UL);
  EXPECT_EQ(received[0].type, "chat");
  EXPECT_EQ(received[0].sender, "device-A");
  EXPECT_EQ(received[0].payload, "hello");

  b->unsubscribe_messages(token);
  a->broadcast_message("chat", "again", mh::message_priority::low);
  clock.run_pending();
  EXPECT_EQ(received.size(), 1UL);

  EXPECT_THROW(a->broadcast_message("host_heartbeat", "x", mh::message_priority::high), std::invalid_argument);
}

/**
 * @test Verify the subscribers see the current state on subscription, and each change after.
 */
TEST(peer_coordinator_impl, subscribers) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto b = make_peer(queue, clock, hub->connect("B"), "B");

  std::vector<mh::host_event> events;
  auto token = b->subscribe([&events](mh::host_event const& e) { events.push_back(e); });
  ASSERT_EQ(events.size(), 1UL);
  EXPECT_EQ(events[0], (mh::host_event{false, "", false, mh::election_state::idle}));

  b->start_election({"A"});
  clock.advance(2s);
  ASSERT_EQ(events.size(), 3UL);
  EXPECT_EQ(events[1], (mh::host_event{true, "A", false, mh::election_state::in_progress}));
  EXPECT_EQ(events[2], (mh::host_event{true, "A", false, mh::election_state::completed}));

  // ... heartbeats from the same host do not change anything ...
  b->handle_heartbeat("A");
  EXPECT_EQ(events.size(), 3UL);

  b->unsubscribe(token);
  b->migrate_host("B");
  EXPECT_EQ(events.size(), 3UL);
  EXPECT_NO_THROW(b->unsubscribe(token));
}

/**
 * @test Verify exhausted broadcasts restart the transport, a bounded number of times.
 */
TEST(peer_coordinator_impl, reconnect_after_exhausted_broadcasts) {
  completion_queue_type queue;
  mh::detail::simulated_clock clock(queue);
  auto hub = std::make_shared<mh::loopback_hub>();
  auto ta = hub->connect("A");
  auto a = make_peer(queue, clock, ta, "A");
  a->startup();

  ta->fail_always(true);
  a->become_host();
  // ... the announcement fails at 0s, 1s and 3s, then the restart waits 2s ...
  clock.advance(4s);
  EXPECT_EQ(ta->restarts(), 0);
  clock.advance(1s);
  EXPECT_EQ(ta->restarts(), 1);

  clock.advance(5min);
  EXPECT_EQ(ta->restarts(), 3);
  EXPECT_EQ(a->reconnect_attempts(), 3);
  EXPECT_GT(a->broadcaster_stats().exhausted, 3U);

  // ... a successful broadcast resets the counter ...
  ta->fail_always(false);
  clock.advance(10s);
  EXPECT_EQ(a->reconnect_attempts(), 0);
  EXPECT_TRUE(a->is_host());
}
