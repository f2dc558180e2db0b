#ifndef mh_detail_broadcast_retry_policy_hpp
#define mh_detail_broadcast_retry_policy_hpp

#include <memory>

namespace mh {
namespace detail {
/**
 * Define how the reliable broadcaster decides to give up on a message.
 */
class broadcast_retry_policy {
public:
  virtual ~broadcast_retry_policy() = default;

  /// Return true if the broadcaster should try again.
  virtual bool on_failure() = 0;

  /// Create a copy of this policy
  virtual std::unique_ptr<broadcast_retry_policy> clone() const = 0;
};
} // namespace detail
} // namespace mh

#endif // mh_detail_broadcast_retry_policy_hpp
