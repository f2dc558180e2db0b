#ifndef mh_mesh_host_hpp
#define mh_mesh_host_hpp

#include <mh/active_completion_queue.hpp>
#include <mh/host_election.hpp>
#include <mh/mesh_config.hpp>
#include <mh/mesh_transport.hpp>

#include <memory>

namespace mh {

/**
 * Participate in the host election of a mesh.
 *
 * This is the class applications use.  It runs the election in an active completion queue, and each member function
 * blocks until the queue thread has executed the request, so it can be called from any thread (including the
 * subscriber callbacks, which run in the queue thread).
 *
 * @code
 * auto queue = std::make_shared<mh::active_completion_queue>();
 * mh::mesh_host host(queue, transport, config);
 * host.subscribe([](mh::host_event const& e) { std::cout << e << std::endl; });
 * host.start_election();
 * @endcode
 */
class mesh_host : public host_election {
public:
  /**
   * Constructor, starts receiving messages, sending peer heartbeats, and watching the host.
   *
   * @throws std::invalid_argument if @a config is not valid.
   */
  mesh_host(
      std::shared_ptr<active_completion_queue> queue, std::shared_ptr<mesh_transport> transport, mesh_config config);

  /// Calls shutdown(), the queue keeps running if shared with other objects.
  ~mesh_host();

  /// Start an election with the peers connected right now.
  void start_election();

  //@{
  /// @name implement host_election interface using pimpl idiom.
  void startup() override;
  void shutdown() override;
  void start_election(std::set<std::string> const& peers) override;
  void become_host() override;
  void resign_host() override;
  void handle_heartbeat(std::string const& from) override;
  void handle_host_timeout() override;
  void migrate_host(std::string const& to) override;
  void handle_network_change() override;
  void on_message(std::string const& bytes) override;
  std::shared_future<void>
  broadcast_message(std::string const& type, std::string const& payload, message_priority priority) override;

  std::string const& self_id() const override {
    return impl_->self_id();
  }
  bool has_host() const override {
    return impl_->has_host();
  }
  std::string current_host() const override {
    return impl_->current_host();
  }
  bool is_host() const override {
    return impl_->is_host();
  }
  election_state state() const override {
    return impl_->state();
  }
  host_event snapshot() const override {
    return impl_->snapshot();
  }
  long subscribe(subscriber_type&& subscriber) override {
    return impl_->subscribe(std::move(subscriber));
  }
  void unsubscribe(long token) override {
    impl_->unsubscribe(token);
  }
  long subscribe_messages(message_subscriber_type&& subscriber) override {
    return impl_->subscribe_messages(std::move(subscriber));
  }
  void unsubscribe_messages(long token) override {
    impl_->unsubscribe_messages(token);
  }
  //@}

private:
  /// Run @a f in the queue thread and wait for it, exceptions raised by @a f are rethrown.
  template <typename Functor>
  void run_on_loop(char const* where, Functor&& f);

private:
  std::shared_ptr<active_completion_queue> queue_;
  std::shared_ptr<mesh_transport> transport_;
  std::shared_ptr<host_election> impl_;
};

} // namespace mh

#endif // mh_mesh_host_hpp
