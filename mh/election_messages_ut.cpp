#include "mh/election_messages.hpp"
#include <mh/errors.hpp>

#include <gmock/gmock.h>

/**
 * @test Verify only the election types are reserved.
 */
TEST(election_messages, is_election_message) {
  EXPECT_TRUE(mh::is_election_message("election_start"));
  EXPECT_TRUE(mh::is_election_message("host_announcement"));
  EXPECT_TRUE(mh::is_election_message("host_heartbeat"));
  EXPECT_TRUE(mh::is_election_message("peer_heartbeat"));
  EXPECT_FALSE(mh::is_election_message("chat"));
  EXPECT_FALSE(mh::is_election_message("number_drawn"));
  EXPECT_FALSE(mh::is_election_message(""));
}

/**
 * @test Verify an election_start message survives the game message framing.
 */
TEST(election_messages, election_start_through_frame) {
  auto payload = mh::make_election_start("B", {"C", "A", "B"}, 7);
  ASSERT_EQ(payload.candidates_size(), 3);
  // ... std::set sorts the candidates ...
  EXPECT_EQ(payload.candidates(0), "A");
  EXPECT_EQ(payload.candidates(2), "C");

  auto msg = mh::wrap_election_message(mh::message_type::election_start, "room-1", "Pixel 7", payload);
  EXPECT_EQ(msg.type, "election_start");
  EXPECT_EQ(msg.room_id, "room-1");
  EXPECT_EQ(msg.sender, "Pixel 7");

  auto decoded = mh::decode_game_message(mh::encode_game_message(msg));
  mh::wire::ElectionStart actual;
  mh::parse_election_payload(decoded, actual);
  EXPECT_EQ(actual.initiator(), "B");
  EXPECT_EQ(actual.round(), 7);
  EXPECT_EQ(actual.candidates_size(), 3);
}

/**
 * @test Verify heartbeats carry the sender role and time.
 */
TEST(election_messages, heartbeat) {
  auto at = std::chrono::system_clock::from_time_t(1500000000) + std::chrono::milliseconds(250);
  auto payload = mh::make_heartbeat("A", "iPad", mh::wire::ROLE_HOST, at);
  EXPECT_EQ(payload.peer_id(), "A");
  EXPECT_EQ(payload.device_name(), "iPad");
  EXPECT_EQ(payload.role(), mh::wire::ROLE_HOST);
  EXPECT_EQ(payload.sent_at_ms(), 1500000000250LL);
}

/**
 * @test Verify application types cannot be used to wrap election payloads.
 */
TEST(election_messages, wrap_rejects_application_types) {
  auto payload = mh::make_host_announcement("A", 1);
  EXPECT_THROW(mh::wrap_election_message("chat", "room", "dev", payload), std::invalid_argument);
}

/**
 * @test Verify garbage payloads raise mh::decode_error.
 */
TEST(election_messages, parse_invalid_payload) {
  mh::game_message msg{"host_announcement", "room", "dev", std::string("\xff\xff\xff", 3)};
  mh::wire::HostAnnouncement actual;
  EXPECT_THROW(mh::parse_election_payload(msg, actual), mh::decode_error);
}
