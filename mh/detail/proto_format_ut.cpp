#include "mh/detail/proto_format.hpp"
#include <mh/election.pb.h>

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that print_to_stream works as expected.
 */
TEST(proto_format, print_to_stream_basic) {
  using namespace mh::detail;

  mh::wire::HostAnnouncement msg;
  msg.set_host("A");
  msg.set_round(3);

  std::ostringstream os;
  os << "[" << print_to_stream(msg) << "]";
  EXPECT_EQ(os.str(), R"""([host: "A" round: 3])""");
}

/**
 * @test Verify that print_to_stream handles empty messages and repeated fields.
 */
TEST(proto_format, print_to_stream_repeated) {
  using namespace mh::detail;

  mh::wire::ElectionStart msg;
  std::ostringstream empty;
  empty << print_to_stream(msg);
  EXPECT_EQ(empty.str(), "");

  msg.set_initiator("B");
  msg.add_candidates("A");
  msg.add_candidates("B");
  std::ostringstream os;
  os << print_to_stream(msg);
  EXPECT_EQ(os.str(), R"""(initiator: "B" candidates: "A" candidates: "B")""");
}
