#ifndef mh_mesh_config_hpp
#define mh_mesh_config_hpp

#include <chrono>
#include <iosfwd>
#include <string>

namespace mh {

/**
 * Configure a peer in the mesh.
 *
 * The defaults are the intervals used by the games in production.  Tests shrink them to milliseconds, but the ratios
 * matter: the host timeout must be longer than the host heartbeat interval, or followers would re-elect a live host.
 */
struct mesh_config {
  /// The id of the local peer, the election picks the lowest id.  A peer without an id cannot start elections.
  std::string self_id;
  /// The room all the messages are tagged with.
  std::string room_id;
  /// The human readable name of the device, sent as the sender of each message.
  std::string device_name;

  std::chrono::milliseconds election_confirm_delay = std::chrono::seconds(2);
  std::chrono::milliseconds host_heartbeat_interval = std::chrono::seconds(5);
  std::chrono::milliseconds peer_heartbeat_interval = std::chrono::seconds(10);
  std::chrono::milliseconds host_timeout = std::chrono::seconds(15);
  std::chrono::milliseconds host_timeout_check_interval = std::chrono::seconds(5);
  /// How long to wait before restarting the transport after a broadcast is exhausted.
  std::chrono::milliseconds quick_restart_delay = std::chrono::seconds(2);

  int broadcast_max_attempts = 3;
  std::chrono::milliseconds broadcast_backoff_base = std::chrono::seconds(1);
  int max_reconnect_attempts = 3;

  /**
   * Check the configuration is usable.
   *
   * @throws std::invalid_argument describing the first problem found.
   */
  void validate() const;
};

/// Streaming operator, mostly for logging.
std::ostream& operator<<(std::ostream& os, mesh_config const& x);

} // namespace mh

#endif // mh_mesh_config_hpp
