#ifndef mh_detail_default_grpc_interceptor_hpp
#define mh_detail_default_grpc_interceptor_hpp

#include <mh/detail/async_op.hpp>

#include <grpc++/grpc++.h>

#include <memory>

namespace mh {
namespace detail {

/**
 * Provides a dependency injection point to mock the gRPC++ library.
 *
 * The coordination tests need to control time: fire the election confirmation, the host heartbeat, or a broadcast
 * retry exactly when the test wants.  This class defines a narrow interface where Mesh-Host intercepts all the
 * gRPC++ calls that create alarms.  Please see mh::detail::mocked_grpc_interceptor for a mocked version.
 */
struct default_grpc_interceptor {
  /// Post a timer to the completion queue.
  template <typename op_type>
  void make_deadline_timer(std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->alarm_.reset(new grpc::Alarm);
    op->alarm_->Set(cq, op->deadline, tag);
  }
};

} // namespace detail
} // namespace mh

#endif // mh_detail_default_grpc_interceptor_hpp
