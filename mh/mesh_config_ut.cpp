#include "mh/mesh_config.hpp"

#include <gmock/gmock.h>

#include <sstream>

using namespace std::chrono_literals;

/**
 * @test Verify the default intervals.
 */
TEST(mesh_config, defaults) {
  mh::mesh_config config;
  EXPECT_EQ(config.election_confirm_delay, 2s);
  EXPECT_EQ(config.host_heartbeat_interval, 5s);
  EXPECT_EQ(config.peer_heartbeat_interval, 10s);
  EXPECT_EQ(config.host_timeout, 15s);
  EXPECT_EQ(config.host_timeout_check_interval, 5s);
  EXPECT_EQ(config.quick_restart_delay, 2s);
  EXPECT_EQ(config.broadcast_max_attempts, 3);
  EXPECT_EQ(config.broadcast_backoff_base, 1s);
  EXPECT_EQ(config.max_reconnect_attempts, 3);

  EXPECT_NO_THROW(config.validate());
}

/**
 * @test Verify validate() rejects unusable configurations.
 */
TEST(mesh_config, validate) {
  mh::mesh_config base;
  base.self_id = "A";

  auto config = base;
  config.election_confirm_delay = 0ms;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = base;
  config.host_timeout = 5s;
  try {
    config.validate();
    FAIL() << "expected std::invalid_argument";
  } catch (std::invalid_argument const& ex) {
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("host_timeout"));
  }

  config = base;
  config.broadcast_max_attempts = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = base;
  config.max_reconnect_attempts = -1;
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.max_reconnect_attempts = 0;
  EXPECT_NO_THROW(config.validate());
}

/**
 * @test Verify the streaming operator includes the identity of the peer.
 */
TEST(mesh_config, streaming) {
  mh::mesh_config config;
  config.self_id = "peer-1";
  config.room_id = "room-9";
  std::ostringstream os;
  os << config;
  EXPECT_THAT(os.str(), ::testing::HasSubstr("self_id=peer-1"));
  EXPECT_THAT(os.str(), ::testing::HasSubstr("room_id=room-9"));
  EXPECT_THAT(os.str(), ::testing::HasSubstr("host_timeout=15000ms"));
}
