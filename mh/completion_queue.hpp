#ifndef mh_completion_queue_hpp
#define mh_completion_queue_hpp

#include <mh/detail/async_op.hpp>
#include <mh/detail/base_completion_queue.hpp>
#include <mh/detail/default_grpc_interceptor.hpp>
#include <mh/log.hpp>

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>

namespace mh {

/// A struct to indicate the APIs should return futures instead of invoking a callback.
struct use_future {};

/**
 * Wrap a gRPC completion queue.
 *
 * The grpc::CompletionQueue is not much of an abstraction, nor is it idiomatic C++.  This wrapper makes it easier to
 * write asynchronous operations that call functors (lambdas, std::function<>, etc) when the operation completes.
 * Mesh-Host only needs alarms from gRPC: they implement every timer, and the thread running the loop serializes all
 * the election state changes.
 *
 * @tparam grpc_interceptor_t mediate all calls to the gRPC library, though mostly to grpc::CompletionQueue.  The
 * default inlines all the calls, so it is basically zero overhead.  The main reason to change it is to mock the
 * gRPC++ APIs in tests, and control time.
 */
template <typename grpc_interceptor_t = detail::default_grpc_interceptor>
class completion_queue : public detail::base_completion_queue {
public:
  //@{
  /**
   * @name type traits
   */
  using grpc_interceptor_type = grpc_interceptor_t;
  //@}

  explicit completion_queue(grpc_interceptor_type interceptor = grpc_interceptor_type())
      : detail::base_completion_queue()
      , interceptor_(std::move(interceptor)) {
  }

  /**
   * Call the functor when the deadline timer expires.
   *
   * Notice that system_clock is not guaranteed to be monotonic, which makes it a poor choice in some cases.  The
   * election intervals are measured in seconds, so it is Okay.
   *
   * If the queue is shutting down the timer is never armed and the functor is never called.
   */
  template <typename Functor>
  std::shared_ptr<detail::deadline_timer>
  make_deadline_timer(std::chrono::system_clock::time_point deadline, std::string name, Functor&& f) {
    using namespace std::chrono;
    auto delay = duration_cast<milliseconds>(deadline - system_clock::now());
    return make_timer(deadline, std::max(delay, milliseconds(0)), std::move(name), std::forward<Functor>(f));
  }

  /// Call the functor N units of time from now.
  template <typename duration_type, typename Functor>
  std::shared_ptr<detail::deadline_timer> make_relative_timer(duration_type duration, std::string name, Functor&& f) {
    using namespace std::chrono;
    return make_timer(
        system_clock::now() + duration, duration_cast<milliseconds>(duration), std::move(name),
        std::forward<Functor>(f));
  }

  /**
   * Run the functor in the thread running the event loop.
   *
   * This is how other threads (the application, or the transport) get work into the coordination context.  The
   * functor is not called if the queue is shutdown before it gets a chance to run.
   */
  template <typename Functor>
  void run_async(std::string name, Functor&& f) {
    make_timer(
        std::chrono::system_clock::now(), std::chrono::milliseconds(0), std::move(name),
        [functor = std::forward<Functor>(f)](detail::deadline_timer const&, bool ok) {
          if (ok) {
            functor();
          }
        });
  }

  /**
   * Run the functor in the event loop thread, and return a future to wait until it completes.
   *
   * The future holds any exception raised by the functor.  If the queue is shutdown before the functor runs the
   * future holds a std::runtime_error.
   */
  template <typename Functor>
  std::shared_future<void> run_async(std::string name, Functor&& f, mh::use_future) {
    auto promise = std::make_shared<std::promise<void>>();
    std::shared_future<void> fut(promise->get_future());
    auto op = create_op<detail::deadline_timer>(
        std::move(name), [promise, functor = std::forward<Functor>(f)](detail::deadline_timer const& op, bool ok) {
          if (not ok) {
            promise->set_exception(std::make_exception_ptr(std::runtime_error("cancelled before running: " + op.name)));
            return;
          }
          try {
            functor();
            promise->set_value();
          } catch (...) {
            promise->set_exception(std::current_exception());
          }
        });
    op->deadline = std::chrono::system_clock::now();
    op->delay = std::chrono::milliseconds(0);
    if (not arm_timer(op)) {
      promise->set_exception(std::make_exception_ptr(std::runtime_error("queue shutdown: " + op->name)));
    }
    return fut;
  }

  grpc_interceptor_type& interceptor() {
    return interceptor_;
  }

private:
  template <typename Functor>
  std::shared_ptr<detail::deadline_timer> make_timer(
      std::chrono::system_clock::time_point deadline, std::chrono::milliseconds delay, std::string name,
      Functor&& f) {
    auto op = create_op<detail::deadline_timer>(std::move(name), std::forward<Functor>(f));
    op->deadline = deadline;
    op->delay = delay;
    arm_timer(op);
    return op;
  }

  /// Arm the timer unless the queue is shutting down, in which case the callback is never called.
  bool arm_timer(std::shared_ptr<detail::deadline_timer> op) {
    bool started = start_op("deadline_timer()", op, [this, op](void* tag) {
      interceptor_.make_deadline_timer(op, cq(), tag);
    });
    if (not started) {
      MH_LOG(debug) << "timer " << op->name << " dropped, queue is shutting down";
    }
    return started;
  }

  grpc_interceptor_type interceptor_;
};

} // namespace mh

#endif // mh_completion_queue_hpp
