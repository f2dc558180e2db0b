#include "mh/detail/mocked_grpc_interceptor.hpp"
#include <mh/completion_queue.hpp>

#include <vector>

namespace {
using completion_queue_type = mh::completion_queue<mh::detail::mocked_grpc_interceptor>;
using timer_ptr = std::shared_ptr<mh::detail::deadline_timer>;

/// Capture every timer created in @a queue into @a captured, without firing them.
void capture_timers(completion_queue_type& queue, std::vector<timer_ptr>& captured) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_))
      .WillRepeatedly(Invoke([&captured](std::shared_ptr<mh::detail::base_async_op> bop) {
        auto* op = dynamic_cast<mh::detail::deadline_timer*>(bop.get());
        ASSERT_TRUE(op != nullptr);
        captured.push_back(timer_ptr(bop, op));
      }));
}
} // anonymous namespace

/**
 * @test Verify the mocked timers carry their name and delay, and the test decides when and how they complete.
 */
TEST(mocked_grpc_interceptor, deadline_timer) {
  using namespace std::chrono_literals;
  completion_queue_type queue;
  std::vector<timer_ptr> captured;
  capture_timers(queue, captured);

  int confirmed = 0;
  int cancelled = 0;
  auto on_timer = [&confirmed, &cancelled](mh::detail::deadline_timer const&, bool ok) {
    if (ok) {
      ++confirmed;
    } else {
      ++cancelled;
    }
  };
  queue.make_relative_timer(2s, "election.confirm", on_timer);
  queue.make_deadline_timer(std::chrono::system_clock::now() + 1h, "election.host_timeout_check", on_timer);
  queue.make_deadline_timer(std::chrono::system_clock::now() - 1s, "broadcast/late/retry", on_timer);
  ASSERT_EQ(captured.size(), 3UL);
  EXPECT_EQ(captured[0]->name, "election.confirm");
  EXPECT_EQ(captured[0]->delay, 2000ms);
  EXPECT_GT(captured[1]->delay, 59min);
  EXPECT_EQ(captured[2]->delay, 0ms);
  EXPECT_EQ(confirmed + cancelled, 0);

  captured[0]->callback(*captured[0], true);
  captured[1]->callback(*captured[1], false);
  EXPECT_EQ(confirmed, 1);
  EXPECT_EQ(cancelled, 1);
}

/**
 * @test Verify closures posted with run_async() go through the mocked timers.
 */
TEST(mocked_grpc_interceptor, run_async) {
  using namespace ::testing;
  mh::completion_queue<mh::detail::mocked_grpc_interceptor> queue;

  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_))
      .WillRepeatedly(Invoke([](auto bop) { bop->callback(*bop, true); }));

  int cnt = 0;
  queue.run_async("testing/run_async", [&cnt]() { ++cnt; });
  ASSERT_EQ(cnt, 1);

  auto fut = queue.run_async("testing/run_async/future", [&cnt]() { ++cnt; }, mh::use_future());
  ASSERT_EQ(fut.wait_for(std::chrono::seconds(0)), std::future_status::ready);
  ASSERT_NO_THROW(fut.get());
  ASSERT_EQ(cnt, 2);

  // ... cancelled closures do not run, and the future reports the problem ...
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_))
      .WillRepeatedly(Invoke([](auto bop) { bop->callback(*bop, false); }));
  queue.run_async("testing/run_async/cancelled", [&cnt]() { ++cnt; });
  auto cancelled = queue.run_async("testing/run_async/future/cancelled", [&cnt]() { ++cnt; }, mh::use_future());
  ASSERT_THROW(cancelled.get(), std::runtime_error);
  ASSERT_EQ(cnt, 2);
}
