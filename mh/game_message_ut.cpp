#include "mh/game_message.hpp"
#include <mh/errors.hpp>

#include <gmock/gmock.h>

#include <sstream>

/**
 * @test Verify the exact bytes produced for a small message.
 */
TEST(game_message, encode_layout) {
  mh::game_message msg{"host_heartbeat", "R1", "A", std::string("\x01\x02\x03", 3)};
  auto bytes = mh::encode_game_message(msg);

  std::string expected;
  expected += '\x0e';
  expected += "host_heartbeat";
  expected += '\x02';
  expected += "R1";
  expected += '\x01';
  expected += "A";
  expected += std::string("\x03\x00", 2);
  expected += std::string("\x01\x02\x03", 3);
  EXPECT_EQ(bytes, expected);

  EXPECT_EQ(mh::decode_game_message(bytes), msg);
}

/**
 * @test Verify the payload length is little-endian.
 */
TEST(game_message, payload_length_little_endian) {
  mh::game_message msg{"t", "", "", std::string(0x0102, 'x')};
  auto bytes = mh::encode_game_message(msg);
  // ... type field (2 bytes), empty room id (1 byte), empty sender (1 byte), then the payload length ...
  ASSERT_GE(bytes.size(), 6UL);
  EXPECT_EQ(static_cast<unsigned char>(bytes[4]), 0x02);
  EXPECT_EQ(static_cast<unsigned char>(bytes[5]), 0x01);
  EXPECT_EQ(bytes.size(), 6UL + 0x0102);

  mh::game_message biggest{"t", "", "", std::string(mh::max_payload_length, 'y')};
  EXPECT_EQ(mh::decode_game_message(mh::encode_game_message(biggest)), biggest);

  mh::game_message too_big{"t", "", "", std::string(mh::max_payload_length + 1, 'z')};
  EXPECT_THROW(mh::encode_game_message(too_big), std::invalid_argument);
}

/**
 * @test Verify a 300-byte sender name is silently truncated to its first 255 bytes.
 */
TEST(game_message, long_fields_truncated) {
  std::string sender;
  for (int i = 0; i != 300; ++i) {
    sender.push_back(static_cast<char>('a' + i % 26));
  }
  mh::game_message msg{std::string(400, 'T'), std::string(256, 'R'), sender, "payload"};
  auto decoded = mh::decode_game_message(mh::encode_game_message(msg));
  EXPECT_EQ(decoded.sender.size(), 255UL);
  EXPECT_EQ(decoded.sender, sender.substr(0, 255));
  EXPECT_EQ(decoded.type, std::string(255, 'T'));
  EXPECT_EQ(decoded.room_id, std::string(255, 'R'));
  EXPECT_EQ(decoded.payload, "payload");
}

/**
 * @test Verify truncated buffers are rejected, and trailing bytes are ignored.
 */
TEST(game_message, decode_errors) {
  mh::game_message msg{"peer_heartbeat", "room", "B", "B|device"};
  auto bytes = mh::encode_game_message(msg);
  for (std::size_t n = 0; n != bytes.size(); ++n) {
    EXPECT_THROW(mh::decode_game_message(bytes.substr(0, n)), mh::decode_error) << "n=" << n;
  }
  EXPECT_EQ(mh::decode_game_message(bytes + "trailing"), msg);
}

/// @test Verify the streaming operator summarizes the payload.
TEST(game_message, stream) {
  std::ostringstream os;
  os << mh::game_message{"election_start", "R", "A", "1234"};
  EXPECT_EQ(os.str(), "{type=election_start, room_id=R, sender=A, payload=4 bytes}");
}
