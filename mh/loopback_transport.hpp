#ifndef mh_loopback_transport_hpp
#define mh_loopback_transport_hpp

#include <mh/mesh_transport.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mh {
class loopback_transport;

/**
 * An in-process mesh, connecting loopback_transport objects.
 *
 * Messages sent by one member are delivered, synchronously and in the sender's thread, to every other running
 * member.  Used in the tests and the demo program.
 */
class loopback_hub : public std::enable_shared_from_this<loopback_hub> {
public:
  /// Create a new transport for @a peer_id, connected to this hub.
  std::shared_ptr<loopback_transport> connect(std::string const& peer_id);

  /// The running members other than @a peer_id.
  std::set<std::string> peers_of(std::string const& peer_id) const;

private:
  friend class loopback_transport;
  void deliver(std::string const& from, std::string const& bytes);
  void leave(std::string const& peer_id);

private:
  mutable std::mutex mu_;
  std::map<std::string, std::weak_ptr<loopback_transport>> members_;
};

/**
 * A mesh_transport implementation for a loopback_hub, with fault injection.
 */
class loopback_transport : public mesh_transport {
public:
  loopback_transport(std::shared_ptr<loopback_hub> hub, std::string peer_id);
  ~loopback_transport();

  std::set<std::string> connected_peers() const override;
  void send_broadcast(std::string const& bytes, message_priority priority) override;
  void set_message_handler(message_handler handler) override;
  void restart() override;

  std::string const& peer_id() const {
    return peer_id_;
  }

  //@{
  /// @name fault injection
  /// Make the next @a n sends fail with mh::transport_error.
  void fail_next(int n);
  /// Make all sends fail until called with false.
  void fail_always(bool value);
  /// Leave the mesh, the other peers stop seeing this one, and sends raise mh::transport_unavailable.
  void disconnect();
  /// Rejoin the mesh after disconnect().
  void reconnect();
  //@}

  //@{
  /// @name counters
  int send_attempts() const;
  int messages_sent() const;
  int restarts() const;
  //@}

  bool running() const;

private:
  friend class loopback_hub;
  void receive(std::string const& bytes);

private:
  std::shared_ptr<loopback_hub> hub_;
  std::string peer_id_;
  mutable std::mutex mu_;
  // Held while the handler runs, set_message_handler() waits for the running call.
  std::recursive_mutex handler_mu_;
  message_handler handler_;
  bool running_;
  int fail_next_;
  bool fail_always_;
  int send_attempts_;
  int messages_sent_;
  int restarts_;
};

} // namespace mh

#endif // mh_loopback_transport_hpp
