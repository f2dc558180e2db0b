#include "mh/election_state.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that the iostream operators for the election enums work as expected.
 */
TEST(election_state, streaming) {
  std::ostringstream os;
  os << mh::election_state::idle << " " << mh::election_state::in_progress << " " << mh::election_state::completed
     << " " << mh::host_role::none << " " << mh::host_role::host << " " << mh::host_role::follower;
  EXPECT_EQ(os.str(), "idle in_progress completed none host follower");
}

/**
 * @test Verify host events report the right role.
 */
TEST(host_event, role_of) {
  mh::host_event none{false, "", false, mh::election_state::idle};
  mh::host_event host{true, "A", true, mh::election_state::completed};
  mh::host_event follower{true, "A", false, mh::election_state::in_progress};
  EXPECT_EQ(mh::role_of(none), mh::host_role::none);
  EXPECT_EQ(mh::role_of(host), mh::host_role::host);
  EXPECT_EQ(mh::role_of(follower), mh::host_role::follower);
  EXPECT_NE(host, follower);
  EXPECT_EQ(host, (mh::host_event{true, "A", true, mh::election_state::completed}));

  std::ostringstream os;
  os << none << " " << follower;
  EXPECT_EQ(os.str(), "{state=idle, role=none} {state=in_progress, role=follower, host=A}");
}
