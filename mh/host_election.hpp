#ifndef mh_host_election_hpp
#define mh_host_election_hpp

#include <mh/election_state.hpp>
#include <mh/game_message.hpp>
#include <mh/mesh_transport.hpp>

#include <functional>
#include <future>
#include <set>
#include <string>

namespace mh {

/**
 * Define the interface to elect and follow the host of a mesh.
 *
 * Every peer runs one host_election.  The peers agree on the host without a central server: the lowest peer id that
 * is alive wins.  Elections are optimistic, the local peer applies the winner immediately, and confirms it (or
 * changes its mind) when the confirmation delay expires.  Followers watch the host heartbeats and start a new
 * election when the host goes silent.
 */
class host_election {
public:
  //@{
  /// @name type traits
  /// Called with a snapshot every time the host, the local role, or the election state changes.
  using subscriber_type = std::function<void(host_event const&)>;
  /// Called with each application message received from the mesh.
  using message_subscriber_type = std::function<void(game_message const&)>;
  //@}

  virtual ~host_election() = 0;

  /// Start receiving messages, and start the peer heartbeats and the host timeout checks.
  virtual void startup() = 0;

  /**
   * Stop all timers and pending broadcasts, and forget the host.
   *
   * Calling shutdown() more than once is safe.  No callback changes the state after it returns.
   */
  virtual void shutdown() = 0;

  /**
   * Elect the lowest id among @a peers and the local peer.
   *
   * @throws mh::election_failed if the candidate set is empty, the state is unchanged in that case.
   * @throws std::runtime_error if called after shutdown().
   */
  virtual void start_election(std::set<std::string> const& peers) = 0;

  /// Make the local peer the host, and start sending host heartbeats.
  virtual void become_host() = 0;

  /// Stop sending host heartbeats, forget the host, and start an election with the connected peers.
  virtual void resign_host() = 0;

  /// Process a heartbeat from a peer claiming to be the host.
  virtual void handle_heartbeat(std::string const& from) = 0;

  /// Forget a silent host and elect a new one among the other connected peers.
  virtual void handle_host_timeout() = 0;

  /**
   * Set the host without an election.
   *
   * This is an administrative override, the other peers are not told.
   *
   * @throws std::invalid_argument if @a to is empty.
   */
  virtual void migrate_host(std::string const& to) = 0;

  /// Re-evaluate the local role after the transport reported a change in the connected peers.
  virtual void handle_network_change() = 0;

  /// Process the raw bytes of a message received from the mesh.
  virtual void on_message(std::string const& bytes) = 0;

  /**
   * Broadcast an application message to the mesh, with retries.
   *
   * @returns a future satisfied when the message is sent, or holding a mh::broadcast_exhausted exception.
   * @throws std::invalid_argument if @a type is reserved for the election.
   */
  virtual std::shared_future<void>
  broadcast_message(std::string const& type, std::string const& payload, message_priority priority) = 0;

  /// The id of the local peer.
  virtual std::string const& self_id() const = 0;

  /// Returns false if no host has been elected.
  virtual bool has_host() const = 0;

  /// Returns the id of the current host, an empty string if there is no host.
  virtual std::string current_host() const = 0;

  /// Returns true if the local peer is the host.
  virtual bool is_host() const = 0;

  /// Returns the state of the election.
  virtual election_state state() const = 0;

  /// Returns a consistent snapshot of the host, role and state.
  virtual host_event snapshot() const = 0;

  /**
   * Notify @a subscriber when the host, the local role, or the election state change.
   *
   * Notice that the subscriber is always called with the current status upon subscription.
   * @param subscriber the function to call with subscription updates.
   * @returns a token to later remove the subscription.
   */
  virtual long subscribe(subscriber_type&& subscriber) = 0;

  /// Remove a subscriber, unknown tokens are ignored.
  virtual void unsubscribe(long token) = 0;

  /// Notify @a subscriber of each application message received.
  virtual long subscribe_messages(message_subscriber_type&& subscriber) = 0;

  /// Remove a message subscriber, unknown tokens are ignored.
  virtual void unsubscribe_messages(long token) = 0;
};

} // namespace mh

#endif // mh_host_election_hpp
