#include "mh/election_state.hpp"

namespace mh {

std::ostream& operator<<(std::ostream& os, election_state x) {
  char const* values[] = {"idle", "in_progress", "completed"};
  return os << values[int(x)];
}

std::ostream& operator<<(std::ostream& os, host_role x) {
  char const* values[] = {"none", "host", "follower"};
  return os << values[int(x)];
}

host_role role_of(host_event const& e) {
  if (not e.has_host) {
    return host_role::none;
  }
  return e.is_self ? host_role::host : host_role::follower;
}

bool operator==(host_event const& lhs, host_event const& rhs) {
  return lhs.has_host == rhs.has_host and lhs.current_host == rhs.current_host and lhs.is_self == rhs.is_self and
         lhs.state == rhs.state;
}

std::ostream& operator<<(std::ostream& os, host_event const& x) {
  os << "{state=" << x.state << ", role=" << role_of(x);
  if (x.has_host) {
    os << ", host=" << x.current_host;
  }
  return os << "}";
}

} // namespace mh
