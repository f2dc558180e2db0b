#ifndef mh_broadcast_result_hpp
#define mh_broadcast_result_hpp

#include <cstdint>
#include <iosfwd>
#include <string>

namespace mh {

/// The outcome of a reliable broadcast.
struct broadcast_result {
  /// True if one of the attempts succeeded.
  bool delivered;
  /// The number of attempts made, including the successful one.
  int attempts;
  /// The error reported by the last failed attempt, empty if none failed.
  std::string last_error;
};

/// Counters kept by the reliable broadcaster.
struct broadcast_stats {
  std::uint64_t total = 0;
  std::uint64_t delivered = 0;
  std::uint64_t exhausted = 0;
  std::uint64_t retries = 0;
  std::uint64_t cancelled = 0;
};

std::ostream& operator<<(std::ostream& os, broadcast_result const& x);
std::ostream& operator<<(std::ostream& os, broadcast_stats const& x);

} // namespace mh

#endif // mh_broadcast_result_hpp
