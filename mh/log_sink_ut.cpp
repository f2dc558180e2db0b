#include "mh/log_sink.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify that the mh::make_log_sink works as expected.
 */
TEST(log_sink, basic) {
  std::string value;
  mh::severity sev = mh::severity::trace;
  auto ls = mh::make_log_sink([&value, &sev](mh::severity s, std::string&& m) {
    value = m;
    sev = s;
  });

  ls->log(mh::severity::warning, std::string("broadcast exhausted"));
  ASSERT_EQ(sev, mh::severity::warning);
  ASSERT_EQ(value, "broadcast exhausted");
}

/**
 * @test Verify that named functors, not only lambdas, can be adapted.
 */
TEST(log_sink, lvalue_functor) {
  int count = 0;
  auto counter = [&count](mh::severity, std::string&&) { ++count; };
  auto ls = mh::make_log_sink(counter);
  ls->log(mh::severity::info, std::string("a"));
  ls->log(mh::severity::info, std::string("b"));
  ASSERT_EQ(count, 2);
}
