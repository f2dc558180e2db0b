#include "mh/mesh_host.hpp"
#include <mh/detail/peer_coordinator_impl.hpp>

namespace mh {

template <typename Functor>
void mesh_host::run_on_loop(char const* where, Functor&& f) {
  if (queue_->in_loop_thread()) {
    f();
    return;
  }
  queue_->cq().run_async(where, std::forward<Functor>(f), mh::use_future()).get();
}

mesh_host::mesh_host(
    std::shared_ptr<active_completion_queue> queue, std::shared_ptr<mesh_transport> transport, mesh_config config)
    : queue_(std::move(queue))
    , transport_(std::move(transport))
    , impl_(std::make_shared<detail::peer_coordinator_impl<completion_queue<>>>(
          queue_->cq(), transport_, std::move(config))) {
  startup();
}

mesh_host::~mesh_host() {
  try {
    shutdown();
  } catch (std::exception const& ex) {
    MH_LOG(error) << "mesh_host(" << impl_->self_id() << ") - shutdown() failed in destructor: " << ex.what();
  }
}

void mesh_host::start_election() {
  run_on_loop("mesh_host/start_election", [this]() { impl_->start_election(transport_->connected_peers()); });
}

void mesh_host::startup() {
  run_on_loop("mesh_host/startup", [this]() { impl_->startup(); });
}

void mesh_host::shutdown() {
  auto impl = impl_;
  if (queue_->in_loop_thread()) {
    impl->shutdown();
    return;
  }
  auto done = queue_->cq().run_async("mesh_host/shutdown", [impl]() { impl->shutdown(); }, mh::use_future());
  try {
    done.get();
  } catch (std::runtime_error const& ex) {
    // ... the queue is shutting down and no longer runs the coordinator callbacks, it is safe to shutdown here ...
    MH_LOG(debug) << "mesh_host(" << impl->self_id() << ") - shutdown outside the queue: " << ex.what();
    impl->shutdown();
  }
}

void mesh_host::start_election(std::set<std::string> const& peers) {
  run_on_loop("mesh_host/start_election", [this, &peers]() { impl_->start_election(peers); });
}

void mesh_host::become_host() {
  run_on_loop("mesh_host/become_host", [this]() { impl_->become_host(); });
}

void mesh_host::resign_host() {
  run_on_loop("mesh_host/resign_host", [this]() { impl_->resign_host(); });
}

void mesh_host::handle_heartbeat(std::string const& from) {
  run_on_loop("mesh_host/handle_heartbeat", [this, &from]() { impl_->handle_heartbeat(from); });
}

void mesh_host::handle_host_timeout() {
  run_on_loop("mesh_host/handle_host_timeout", [this]() { impl_->handle_host_timeout(); });
}

void mesh_host::migrate_host(std::string const& to) {
  run_on_loop("mesh_host/migrate_host", [this, &to]() { impl_->migrate_host(to); });
}

void mesh_host::handle_network_change() {
  run_on_loop("mesh_host/handle_network_change", [this]() { impl_->handle_network_change(); });
}

void mesh_host::on_message(std::string const& bytes) {
  run_on_loop("mesh_host/on_message", [this, &bytes]() { impl_->on_message(bytes); });
}

std::shared_future<void>
mesh_host::broadcast_message(std::string const& type, std::string const& payload, message_priority priority) {
  std::shared_future<void> result;
  run_on_loop("mesh_host/broadcast_message", [this, &result, &type, &payload, priority]() {
    result = impl_->broadcast_message(type, payload, priority);
  });
  return result;
}

} // namespace mh
