#ifndef mh_detail_async_op_hpp
#define mh_detail_async_op_hpp

#include <grpc++/alarm.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace mh {
namespace detail {

/**
 * An operation pending in a mh::completion_queue.
 *
 * The completion queue owns the operation until it completes, then calls @a callback exactly once, from the loop
 * thread, with ok == false if the operation was cancelled or the queue was shutdown.  Applications never see these
 * objects directly, they get a callback (or a future) instead.
 */
struct base_async_op {
  base_async_op() {
  }
  virtual ~base_async_op() {
  }

  /// Request cancellation, the callback still runs, with ok == false.
  virtual void cancel() {
  }

  std::function<void(base_async_op&, bool)> callback;

  /// Used in log messages and by the simulated clock in the tests, e.g. "election.confirm".
  std::string name;
};

/**
 * A timer backed by a grpc::Alarm.
 *
 * Every time-based behavior in Mesh-Host (election confirmation, heartbeats, host timeout checks, broadcast retries)
 * is one of these, and so is every closure posted to the loop with run_async(), with a zero delay.
 */
struct deadline_timer : public base_async_op {
  // Cancel() only flags the alarm, the loop thread reports the cancellation and releases the alarm.
  void cancel() override {
    if ((bool)alarm_) {
      alarm_->Cancel();
    }
  }

  std::chrono::system_clock::time_point deadline;
  /// The delay requested when the timer was created.
  std::chrono::milliseconds delay;

private:
  friend struct default_grpc_interceptor;
  std::unique_ptr<grpc::Alarm> alarm_;
};

} // namespace detail
} // namespace mh

#endif // mh_detail_async_op_hpp
