#ifndef mh_election_state_hpp
#define mh_election_state_hpp

#include <iostream>
#include <string>

namespace mh {
/**
 * Represent the progress of the host election.
 *
 * A peer starts in the @c idle state, without a host.  Starting an election moves it to @c in_progress, where the
 * winner is applied optimistically, and the confirmation timer moves it to @c completed.  Losing the host starts a new
 * election.  Shutting down returns the peer to @c idle.
 */
enum class election_state {
  /// No election has run since construction (or shutdown).
  idle,

  /// An election round is waiting for its confirmation timer.
  in_progress,

  /// The host is known, either elected or adopted from its heartbeats.
  completed,
};

/// The streaming operator for @c election_state.
std::ostream& operator<<(std::ostream& os, election_state x);

/// The role of the local peer.
enum class host_role {
  /// There is no host.
  none,
  /// The local peer is the host.
  host,
  /// Another peer is the host.
  follower,
};

/// The streaming operator for @c host_role.
std::ostream& operator<<(std::ostream& os, host_role x);

/**
 * Who the local peer believes is the host.
 *
 * The invariant is_self == (has_host and current_host == self id) holds after every change.
 */
struct host_record {
  bool has_host;
  std::string current_host;
  bool is_self;
};

/// The snapshot of the host election delivered to subscribers.
struct host_event {
  bool has_host;
  std::string current_host;
  bool is_self;
  election_state state;
};

/// Return the role implied by a host_event.
host_role role_of(host_event const& e);

bool operator==(host_event const& lhs, host_event const& rhs);
inline bool operator!=(host_event const& lhs, host_event const& rhs) {
  return not(lhs == rhs);
}

/// The streaming operator for @c host_event.
std::ostream& operator<<(std::ostream& os, host_event const& x);

} // namespace mh

#endif // mh_election_state_hpp
