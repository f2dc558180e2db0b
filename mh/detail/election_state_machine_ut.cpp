#include "mh/detail/election_state_machine.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify the valid and invalid transitions of the election state machine.
 */
TEST(election_state_machine, basic) {
  using s = mh::election_state;
  mh::detail::election_state_machine machine;

  ASSERT_EQ(machine.current(), s::idle);
  EXPECT_FALSE(machine.change_state("test-1", s::idle));
  EXPECT_TRUE(machine.change_state("test-2", s::in_progress));
  EXPECT_TRUE(machine.change_state("test-3", s::in_progress));

  bool called = false;
  auto check_called = [&called]() { called = true; };
  ASSERT_TRUE(machine.change_state_action("test-4", s::completed, check_called));
  ASSERT_TRUE(called);
  EXPECT_EQ(machine.current(), s::completed);

  // ... losing the host starts a new round ...
  EXPECT_TRUE(machine.change_state("test-5", s::in_progress));
  EXPECT_TRUE(machine.change_state("test-6", s::idle));
  // ... adopting a host from its heartbeats skips the round ...
  EXPECT_TRUE(machine.change_state("test-7", s::completed));
}

/**
 * @test Verify a closed state machine is idle and rejects every change.
 */
TEST(election_state_machine, close) {
  using s = mh::election_state;
  mh::detail::election_state_machine machine;

  ASSERT_TRUE(machine.change_state("test", s::completed));
  EXPECT_FALSE(machine.closed());
  EXPECT_TRUE(machine.close("test"));
  EXPECT_TRUE(machine.closed());
  EXPECT_EQ(machine.current(), s::idle);
  EXPECT_FALSE(machine.close("test"));

  bool called = false;
  auto check_called = [&called]() { called = true; };
  EXPECT_FALSE(machine.change_state("test", s::in_progress));
  EXPECT_FALSE(machine.change_state_action("test", s::completed, check_called));
  EXPECT_FALSE(called);
  EXPECT_EQ(machine.current(), s::idle);
}
