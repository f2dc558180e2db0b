#ifndef mh_detail_base_completion_queue_hpp
#define mh_detail_base_completion_queue_hpp

#include <mh/detail/async_op.hpp>

#include <grpc++/grpc++.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace mh {
namespace detail {
/// A helper class for testing.
struct base_completion_queue_test_only;

/**
 * The base class for the grpc::CompletionQueue wrappers.
 *
 * Refactor code common to all mh::completion_queue<> template instantiations.  The thread calling run() is the
 * coordination context: every callback runs there, one at a time.
 */
class base_completion_queue {
public:
  /// Stop the loop periodically to check if we should shutdown.
  static std::chrono::milliseconds constexpr loop_timeout{50};

  base_completion_queue();
  virtual ~base_completion_queue();

  /**
   * Run the completion queue loop.
   *
   * Returns once shutdown() was called and all the pending operations were drained.  Operations drained after
   * shutdown() are reported as cancelled.
   */
  void run();

  /// Shutdown the completion queue loop, cancelling any pending operations.
  void shutdown();

  /// Return true if shutdown() has been called.
  bool in_shutdown() const {
    return shutdown_.load();
  }

protected:
  /**
   * The underlying completion queue pointer for the gRPC APIs.
   */
  friend struct ::mh::detail::base_completion_queue_test_only;
  grpc::CompletionQueue* cq() {
    return &queue_;
  }

  /// Create an operation and perform the common initialization
  template <typename op_type, typename Functor>
  std::shared_ptr<op_type> create_op(std::string name, Functor&& f) const {
    auto op = std::make_shared<op_type>();
    op->callback = [functor = std::forward<Functor>(f)](base_async_op & bop, bool ok) {
      auto const& op = dynamic_cast<op_type const&>(bop);
      functor(op, ok);
    };
    op->name = std::move(name);
    return op;
  }

  /**
   * Register @a op and start it by calling @a start with its gRPC tag.
   *
   * Registration and the gRPC call happen atomically with respect to shutdown(), it is an error to post new work
   * into a grpc::CompletionQueue after it was shutdown.
   *
   * @returns false if the queue is shutting down, in which case the operation is dropped.
   */
  template <typename Functor>
  bool start_op(char const* where, std::shared_ptr<base_async_op> op, Functor&& start) {
    std::lock_guard<std::recursive_mutex> lock(start_mu_);
    if (shutdown_.load()) {
      return false;
    }
    start(register_op(where, std::move(op)));
    return true;
  }

  /// Save a newly created operation and return its gRPC tag.
  void* register_op(char const* where, std::shared_ptr<base_async_op> op);

  /// Get an operation given its gRPC tag.
  std::shared_ptr<base_async_op> unregister_op(void* tag);

private:
  mutable std::mutex mu_;
  using pending_ops_type = std::unordered_map<std::intptr_t, std::shared_ptr<base_async_op>>;
  pending_ops_type pending_ops_;

  // The mocked interceptor can run callbacks from inside start_op(), and those callbacks often start new
  // operations, hence the recursive mutex.
  std::recursive_mutex start_mu_;
  grpc::CompletionQueue queue_;
  std::atomic<bool> shutdown_;
};
} // namespace detail
} // namespace mh

#endif // mh_detail_base_completion_queue_hpp
