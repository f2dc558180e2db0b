#include "mh/loopback_transport.hpp"
#include <mh/errors.hpp>
#include <mh/log.hpp>

#include <vector>

namespace mh {

std::shared_ptr<loopback_transport> loopback_hub::connect(std::string const& peer_id) {
  auto transport = std::make_shared<loopback_transport>(shared_from_this(), peer_id);
  std::lock_guard<std::mutex> lock(mu_);
  auto r = members_.emplace(peer_id, transport);
  if (not r.second) {
    if (not r.first->second.expired()) {
      detail::raise<std::invalid_argument>("loopback_hub::connect(", peer_id, ") - peer already connected");
    }
    r.first->second = transport;
  }
  return transport;
}

std::set<std::string> loopback_hub::peers_of(std::string const& peer_id) const {
  std::set<std::string> peers;
  std::lock_guard<std::mutex> lock(mu_);
  for (auto const& m : members_) {
    auto t = m.second.lock();
    if (m.first != peer_id and t and t->running()) {
      peers.insert(m.first);
    }
  }
  return peers;
}

void loopback_hub::deliver(std::string const& from, std::string const& bytes) {
  std::vector<std::shared_ptr<loopback_transport>> receivers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto const& m : members_) {
      auto t = m.second.lock();
      if (m.first != from and t) {
        receivers.push_back(std::move(t));
      }
    }
  }
  for (auto const& r : receivers) {
    r->receive(bytes);
  }
}

void loopback_hub::leave(std::string const& peer_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = members_.find(peer_id);
  if (i != members_.end() and i->second.expired()) {
    members_.erase(i);
  }
}

loopback_transport::loopback_transport(std::shared_ptr<loopback_hub> hub, std::string peer_id)
    : hub_(std::move(hub))
    , peer_id_(std::move(peer_id))
    , mu_()
    , handler_mu_()
    , handler_()
    , running_(true)
    , fail_next_(0)
    , fail_always_(false)
    , send_attempts_(0)
    , messages_sent_(0)
    , restarts_(0) {
}

loopback_transport::~loopback_transport() {
  hub_->leave(peer_id_);
}

std::set<std::string> loopback_transport::connected_peers() const {
  if (not running()) {
    return std::set<std::string>();
  }
  return hub_->peers_of(peer_id_);
}

void loopback_transport::send_broadcast(std::string const& bytes, message_priority priority) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++send_attempts_;
    if (not running_) {
      detail::raise<transport_unavailable>("loopback_transport(", peer_id_, ") - not running");
    }
    if (fail_always_ or fail_next_ > 0) {
      if (fail_next_ > 0) {
        --fail_next_;
      }
      detail::raise<transport_error>("loopback_transport(", peer_id_, ") - injected send failure");
    }
    ++messages_sent_;
  }
  MH_LOG(trace) << "loopback_transport(" << peer_id_ << ") - broadcast " << bytes.size() << " bytes, priority="
                << priority;
  hub_->deliver(peer_id_, bytes);
}

void loopback_transport::set_message_handler(message_handler handler) {
  std::lock_guard<std::recursive_mutex> running(handler_mu_);
  std::lock_guard<std::mutex> lock(mu_);
  handler_ = std::move(handler);
}

void loopback_transport::restart() {
  std::lock_guard<std::mutex> lock(mu_);
  MH_LOG(info) << "loopback_transport(" << peer_id_ << ") - restart";
  ++restarts_;
  running_ = true;
}

void loopback_transport::fail_next(int n) {
  std::lock_guard<std::mutex> lock(mu_);
  fail_next_ = n;
}

void loopback_transport::fail_always(bool value) {
  std::lock_guard<std::mutex> lock(mu_);
  fail_always_ = value;
}

void loopback_transport::disconnect() {
  std::lock_guard<std::mutex> lock(mu_);
  running_ = false;
}

void loopback_transport::reconnect() {
  std::lock_guard<std::mutex> lock(mu_);
  running_ = true;
}

int loopback_transport::send_attempts() const {
  std::lock_guard<std::mutex> lock(mu_);
  return send_attempts_;
}

int loopback_transport::messages_sent() const {
  std::lock_guard<std::mutex> lock(mu_);
  return messages_sent_;
}

int loopback_transport::restarts() const {
  std::lock_guard<std::mutex> lock(mu_);
  return restarts_;
}

bool loopback_transport::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return running_;
}

void loopback_transport::receive(std::string const& bytes) {
  std::lock_guard<std::recursive_mutex> running(handler_mu_);
  message_handler handler;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (not running_) {
      return;
    }
    handler = handler_;
  }
  if (handler) {
    handler(bytes);
  }
}

} // namespace mh
