#include "mh/log.hpp"

#include <gmock/gmock.h>

#include <utility>
#include <vector>

namespace {
using captured_logs = std::vector<std::pair<mh::severity, std::string>>;

std::shared_ptr<mh::log_sink> capture_to(captured_logs& logs) {
  return mh::make_log_sink([&logs](mh::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); });
}
} // anonymous namespace

/**
 * @test Verify that the MH_LOG_I() and the supporting classes all work in the normal case.
 */
TEST(log, basic) {
  mh::log lg;
  // First what basically amounts to a compilation test
  ASSERT_NO_THROW(MH_LOG_I(error, lg) << "foo" << 4 << 2);
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(MH_LOG_I(error, lg) << "host lost"
                                      << " " << 15);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, mh::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] host lost 15"));
}

/**
 * @test Verify that the MH_LOG_I() and the supporting classes all work when a log level is disabled.
 */
TEST(log, run_time_disable) {
  mh::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(MH_LOG_I(info, lg) << "testing 123"
                                     << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, mh::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));

  logs.clear();
  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  lg.min_severity(mh::severity::warning);
  ASSERT_NO_THROW(MH_LOG_I(info, lg) << "testing 123"
                                     << " " << f());
  ASSERT_EQ(logs.size(), 0UL);
  // ... also verify that disabled expressions are not even called ...
  ASSERT_EQ(cnt, 0);
  ASSERT_EQ(f(), 42);
  ASSERT_EQ(cnt, 1);
}

/**
 * @test Verify that the MH_LOG_I() and the supporting classes all work when a log level is disabled at compile-time.
 */
TEST(log, compile_time_disable) {
  mh::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  // ... use a level that is enabled at runtime, but disabled at compile-time ...
  lg.min_severity(mh::severity::trace);
  ASSERT_NO_THROW(MH_LOG_I(debug, lg) << "testing 123"
                                      << " " << f());
  ASSERT_EQ(logs.size(), 0UL);
  ASSERT_EQ(cnt, 0);
}

/**
 * @test Verify that the MH_LOG() macro and the supporting singleton work as expected.
 */
TEST(log, instance_basic) {
  mh::log& lg = mh::log::instance();
  captured_logs logs;
  long token = lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(MH_LOG(info) << "testing 123 " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, mh::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));
  ASSERT_NO_THROW(lg.remove_sink(token));
}

/**
 * @test Verify that the MH_LOG_I() and the supporting classes work with multiple sinks.
 */
TEST(log, multiple_sinks) {
  mh::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  lg.add_sink(mh::make_log_sink([&logs](mh::severity sev, std::string&& msg) {
    auto s = std::string("(2) ") + msg;
    logs.emplace_back(sev, std::move(s));
  }));

  using namespace ::testing;
  ASSERT_NO_THROW(MH_LOG_I(error, lg) << "testing 123"
                                      << " " << 42);
  ASSERT_EQ(logs.size(), 2UL);
  ASSERT_EQ(logs[0].first, mh::severity::error);
  ASSERT_EQ(logs[1].first, mh::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] testing 123 42"));
  ASSERT_THAT(logs[1].second, StartsWith("(2) [error] testing 123 42"));
}

/**
 * @test Verify that a single sink can be removed, leaving the others in place.
 */
TEST(log, remove_sink) {
  mh::log lg;
  captured_logs first;
  captured_logs second;
  long t1 = lg.add_sink(capture_to(first));
  long t2 = lg.add_sink(capture_to(second));
  ASSERT_NE(t1, t2);

  MH_LOG_I(warning, lg) << "one";
  lg.remove_sink(t1);
  MH_LOG_I(warning, lg) << "two";
  // Removing twice, or an unknown token, is harmless.
  ASSERT_NO_THROW(lg.remove_sink(t1));
  ASSERT_NO_THROW(lg.remove_sink(t2 + 100));

  ASSERT_EQ(first.size(), 1UL);
  ASSERT_EQ(second.size(), 2UL);

  lg.clear_sinks();
  MH_LOG_I(warning, lg) << "three";
  ASSERT_EQ(second.size(), 2UL);
}

/**
 * @test Complete code coverage for the mh::logger<true> class.
 */
TEST(log, logger_disabled) {
  // In normal operation neither get() nor write_to() are used, they are needed to make the code compile.  Make sure
  // they are no-op's:
  mh::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  mh::logger<true> logger(mh::severity::error, __func__, __FILE__, __LINE__, lg);

  ASSERT_EQ((bool)logger, false);
  ASSERT_NO_THROW(logger.get() << "testing " << 123 << std::string(" ") << 42);
  ASSERT_TRUE((std::is_same<decltype(logger.get()), mh::detail::null_stream&>::value));
  ASSERT_NO_THROW(logger.write_to(lg));
  ASSERT_EQ(logs.size(), 0U);
}
