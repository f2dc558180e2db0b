#include "mh/broadcast_result.hpp"

#include <iostream>

namespace mh {

std::ostream& operator<<(std::ostream& os, broadcast_result const& x) {
  os << "{delivered=" << std::boolalpha << x.delivered << ", attempts=" << x.attempts;
  if (not x.last_error.empty()) {
    os << ", last_error=" << x.last_error;
  }
  return os << "}";
}

std::ostream& operator<<(std::ostream& os, broadcast_stats const& x) {
  return os << "{total=" << x.total << ", delivered=" << x.delivered << ", exhausted=" << x.exhausted
            << ", retries=" << x.retries << ", cancelled=" << x.cancelled << "}";
}

} // namespace mh
