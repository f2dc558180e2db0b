#ifndef mh_detail_broadcast_backoff_policy_hpp
#define mh_detail_broadcast_backoff_policy_hpp

#include <chrono>
#include <memory>

namespace mh {
namespace detail {
/**
 * Define the interface for a broadcast backoff strategy.
 *
 * The mesh transport drops messages now and then, the reliable broadcaster tries again after a delay.  This
 * interface lets the application define how to pace those attempts.  Each broadcast gets its own copy, via clone(),
 * so the policies can keep per-message state.
 */
class broadcast_backoff_policy {
public:
  virtual ~broadcast_backoff_policy() = default;

  /**
   * Report a failure to the backoff strategy.
   *
   * @returns the delay the broadcaster should wait before trying again.
   */
  virtual std::chrono::milliseconds on_failure() = 0;

  /// Create a copy of this policy
  virtual std::unique_ptr<broadcast_backoff_policy> clone() const = 0;
};
} // namespace detail
} // namespace mh

#endif // mh_detail_broadcast_backoff_policy_hpp
