#include "mh/mesh_config.hpp"
#include <mh/errors.hpp>

#include <iostream>

namespace {
void check_positive(std::chrono::milliseconds value, char const* name) {
  if (value.count() <= 0) {
    mh::detail::raise<std::invalid_argument>("mesh_config - ", name, " must be positive, got ", value.count(), "ms");
  }
}
} // anonymous namespace

namespace mh {

void mesh_config::validate() const {
  check_positive(election_confirm_delay, "election_confirm_delay");
  check_positive(host_heartbeat_interval, "host_heartbeat_interval");
  check_positive(peer_heartbeat_interval, "peer_heartbeat_interval");
  check_positive(host_timeout, "host_timeout");
  check_positive(host_timeout_check_interval, "host_timeout_check_interval");
  check_positive(quick_restart_delay, "quick_restart_delay");
  check_positive(broadcast_backoff_base, "broadcast_backoff_base");
  if (host_timeout <= host_heartbeat_interval) {
    detail::raise<std::invalid_argument>(
        "mesh_config - host_timeout (", host_timeout.count(), "ms) must be longer than host_heartbeat_interval (",
        host_heartbeat_interval.count(), "ms)");
  }
  if (broadcast_max_attempts < 1) {
    detail::raise<std::invalid_argument>(
        "mesh_config - broadcast_max_attempts must be at least 1, got ", broadcast_max_attempts);
  }
  if (max_reconnect_attempts < 0) {
    detail::raise<std::invalid_argument>(
        "mesh_config - max_reconnect_attempts must not be negative, got ", max_reconnect_attempts);
  }
}

std::ostream& operator<<(std::ostream& os, mesh_config const& x) {
  return os << "{self_id=" << x.self_id << ", room_id=" << x.room_id << ", device_name=" << x.device_name
            << ", election_confirm_delay=" << x.election_confirm_delay.count()
            << "ms, host_heartbeat_interval=" << x.host_heartbeat_interval.count()
            << "ms, peer_heartbeat_interval=" << x.peer_heartbeat_interval.count()
            << "ms, host_timeout=" << x.host_timeout.count()
            << "ms, host_timeout_check_interval=" << x.host_timeout_check_interval.count()
            << "ms, quick_restart_delay=" << x.quick_restart_delay.count()
            << "ms, broadcast_max_attempts=" << x.broadcast_max_attempts
            << ", broadcast_backoff_base=" << x.broadcast_backoff_base.count()
            << "ms, max_reconnect_attempts=" << x.max_reconnect_attempts << "}";
}

} // namespace mh
