#ifndef mh_detail_simulated_clock_hpp
#define mh_detail_simulated_clock_hpp

#include <mh/completion_queue.hpp>
#include <mh/detail/mocked_grpc_interceptor.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mh {
namespace detail {

/**
 * Drive a completion queue with a mocked interceptor through simulated time.
 *
 * The tests for the timer registry, the broadcaster and the coordinator need to wait 2, 5, 15 seconds.  This class
 * captures every timer created in the queue and fires them, in deadline order, when the test advances the clock.
 * Cancelling a captured timer does not remove it, the same as a gRPC alarm that expired before it was cancelled:
 * the code under test must ignore stale timers.
 */
class simulated_clock {
public:
  using completion_queue_type = mh::completion_queue<mocked_grpc_interceptor>;
  using time_point = std::chrono::system_clock::time_point;

  explicit simulated_clock(completion_queue_type& queue)
      : now_(std::chrono::system_clock::from_time_t(1500000000))
      , sequence_(0) {
    using namespace ::testing;
    EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_))
        .WillRepeatedly(Invoke([this](std::shared_ptr<base_async_op> bop) { capture(std::move(bop)); }));
  }

  simulated_clock(simulated_clock const&) = delete;
  simulated_clock& operator=(simulated_clock const&) = delete;

  /// The current simulated time.
  time_point now() const {
    return now_;
  }

  /// Advance the simulated time by @a d, firing all the timers that expire in that period.
  template <typename duration_type>
  void advance(duration_type d) {
    auto until = now_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(d);
    while (not pending_.empty() and pending_.begin()->first.first <= until) {
      auto i = pending_.begin();
      auto op = i->second;
      now_ = std::max(now_, i->first.first);
      pending_.erase(i);
      op->callback(*op, true);
    }
    now_ = until;
  }

  /// Fire the timers that are due right now, such as closures posted with run_async().
  void run_pending() {
    advance(std::chrono::milliseconds(0));
  }

  /// The number of timers captured but not fired.
  std::size_t pending() const {
    return pending_.size();
  }

  /// The names of the timers captured but not fired, in deadline order.
  std::vector<std::string> pending_names() const {
    std::vector<std::string> names;
    for (auto const& i : pending_) {
      names.push_back(i.second->name);
    }
    return names;
  }

  /// Return the delay requested for the last timer named @a name.
  std::chrono::milliseconds last_delay(std::string const& name) const {
    auto i = delays_.find(name);
    if (i == delays_.end()) {
      return std::chrono::milliseconds(-1);
    }
    return i->second;
  }

private:
  void capture(std::shared_ptr<base_async_op> bop) {
    auto* op = dynamic_cast<deadline_timer*>(bop.get());
    if (op == nullptr) {
      return;
    }
    auto delay = op->delay;
    delays_[op->name] = delay;
    pending_.emplace(std::make_pair(now_ + delay, ++sequence_), std::shared_ptr<deadline_timer>(bop, op));
  }

private:
  time_point now_;
  std::uint64_t sequence_;
  std::map<std::pair<time_point, std::uint64_t>, std::shared_ptr<deadline_timer>> pending_;
  std::map<std::string, std::chrono::milliseconds> delays_;
};

} // namespace detail
} // namespace mh

#endif // mh_detail_simulated_clock_hpp
