#ifndef mh_mesh_transport_hpp
#define mh_mesh_transport_hpp

#include <functional>
#include <iosfwd>
#include <set>
#include <string>

namespace mh {

/// How urgently the transport should deliver a broadcast.
enum class message_priority {
  low,
  normal,
  high,
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, message_priority x);

/**
 * The interface to the peer-to-peer transport.
 *
 * Mesh-Host does not discover peers, nor does it open connections.  The application provides an implementation of
 * this interface wrapping its mesh networking stack (or mh::loopback_transport in tests).
 */
class mesh_transport {
public:
  /// Called with the raw bytes of each message received from the mesh.
  using message_handler = std::function<void(std::string const&)>;

  virtual ~mesh_transport() = default;

  /// The peers currently connected, never including the local peer.
  virtual std::set<std::string> connected_peers() const = 0;

  /**
   * Send @a bytes to all the connected peers.
   *
   * This is an unreliable primitive: a message may be lost.
   *
   * @throws mh::transport_unavailable if the transport is not running.
   * @throws mh::transport_error if the message could not be sent.
   */
  virtual void send_broadcast(std::string const& bytes, message_priority priority) = 0;

  /**
   * Set the function called for each message received.
   *
   * The handler may be called from any thread.  Passing an empty function stops the delivery.  Implementations
   * must not return while a call to the previous handler is running, once this function returns the previous
   * handler is never called again.
   */
  virtual void set_message_handler(message_handler handler) = 0;

  /// Stop and start the networking stack, used to recover after repeated broadcast failures.
  virtual void restart() = 0;
};

} // namespace mh

#endif // mh_mesh_transport_hpp
