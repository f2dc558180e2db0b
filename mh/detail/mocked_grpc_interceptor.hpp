#ifndef mh_detail_mocked_grpc_interceptor_hpp
#define mh_detail_mocked_grpc_interceptor_hpp

#include <mh/detail/async_op.hpp>

#include <gmock/gmock.h>
#include <grpc++/grpc++.h>

#include <memory>

namespace mh {
namespace detail {

/**
 * Intercept the gRPC++ calls in mh::completion_queue<> and forward them to a gmock object.
 *
 * Tests set expectations on @c shared_mock, capture the operations, and fire them (with ok == true) or cancel them
 * (with ok == false) whenever the simulated clock says so.
 */
struct mocked_grpc_interceptor {
  mocked_grpc_interceptor()
      : shared_mock(new mocked) {
  }

  /// Post a timer
  template <typename op_type>
  void make_deadline_timer(std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    shared_mock->make_deadline_timer(op);
  }

  struct mocked {
    MOCK_CONST_METHOD1(make_deadline_timer, void(std::shared_ptr<base_async_op> op));
  };

  std::shared_ptr<mocked> shared_mock;
};

} // namespace detail
} // namespace mh

#endif // mh_detail_mocked_grpc_interceptor_hpp
