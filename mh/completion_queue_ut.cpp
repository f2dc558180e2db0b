#include "mh/completion_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

namespace mh {
namespace detail {
struct base_completion_queue_test_only {
  static grpc::CompletionQueue* get_raw_queue(base_completion_queue& q) {
    return q.cq();
  }
};
} // namespace detail
} // namespace mh

/**
 * @test Verify that one can create, run, and stop a mh::completion_queue.
 */
TEST(completion_queue, basic) {
  mh::completion_queue<> queue;

  std::atomic<int> cnt(0);
  std::atomic<int> cxl(0);
  auto functor = [&cnt, &cxl](auto const& op, bool ok) {
    if (not ok) {
      ++cxl;
    } else {
      ++cnt;
    }
  };

  using namespace std::chrono_literals;

  auto canceled = queue.make_relative_timer(5ms, "test-canceled", functor);
  canceled->cancel();
  auto timer = queue.make_relative_timer(5ms, "test-timer", functor);
  std::thread t([&queue]() { queue.run(); });

  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQ(cnt.load(), 1);
  ASSERT_EQ(cxl.load(), 1);

  queue.shutdown();
  t.join();
}

/**
 * @test Make sure mh::completion_queue handles errors gracefully.
 */
TEST(completion_queue, error) {
  using namespace std::chrono_literals;

  mh::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  // ... manually create alarms with tags the queue does not own, that requires going around the API ...
  grpc::CompletionQueue* cq = mh::detail::base_completion_queue_test_only::get_raw_queue(queue);

  std::atomic<int> cnt(0);
  auto op = queue.make_relative_timer(30ms, "alarm-after", [&cnt](auto const& op, bool ok) { ++cnt; });
  // ... an earlier alarm with a nullptr tag ...
  grpc::Alarm al1;
  al1.Set(cq, std::chrono::system_clock::now() + 10ms, nullptr);
  // ... and an alarm with a tag the queue does not know about ...
  grpc::Alarm al2;
  al2.Set(cq, std::chrono::system_clock::now() + 20ms, (void*)&cnt);

  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(40ms);
  }
  ASSERT_EQ(cnt.load(), 1);

  queue.shutdown();
  t.join();
}

/**
 * @test Verify run_async() executes closures in the order they were posted.
 */
TEST(completion_queue, run_async_order) {
  mh::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  std::vector<int> order;
  std::vector<std::shared_future<void>> done;
  for (int i = 0; i != 5; ++i) {
    done.push_back(queue.run_async("test/order", [&order, i]() { order.push_back(i); }, mh::use_future()));
  }
  for (auto& f : done) {
    ASSERT_NO_THROW(f.get());
  }
  queue.shutdown();
  t.join();
  ASSERT_EQ(order.size(), 5UL);
}

/**
 * @test Verify exceptions raised in closures posted with run_async() reach the future.
 */
TEST(completion_queue, run_async_future_exception) {
  mh::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  auto f = queue.run_async("test/throw", []() { throw std::invalid_argument("bad peer"); }, mh::use_future());
  EXPECT_THROW(f.get(), std::invalid_argument);

  queue.shutdown();
  t.join();
}

/**
 * @test Verify that nothing is scheduled once the queue is shutdown.
 */
TEST(completion_queue, no_timers_after_shutdown) {
  mh::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });
  queue.shutdown();
  t.join();
  ASSERT_TRUE(queue.in_shutdown());

  int cnt = 0;
  queue.make_relative_timer(std::chrono::milliseconds(1), "test/late", [&cnt](auto const&, bool) { ++cnt; });
  auto f = queue.run_async("test/late_future", [&cnt]() { ++cnt; }, mh::use_future());
  EXPECT_THROW(f.get(), std::runtime_error);
  EXPECT_EQ(cnt, 0);
  // ... a second shutdown is harmless ...
  EXPECT_NO_THROW(queue.shutdown());
}
