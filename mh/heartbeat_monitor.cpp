#include "mh/heartbeat_monitor.hpp"
#include <mh/errors.hpp>

namespace mh {

void heartbeat_monitor::record_heartbeat(std::string const& peer, time_point at) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& last = last_seen_[peer];
  // ... messages can arrive out of order, never move the last seen time backwards ...
  if (at > last) {
    last = at;
  }
}

bool heartbeat_monitor::has_seen(std::string const& peer) const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_seen_.find(peer) != last_seen_.end();
}

heartbeat_monitor::time_point heartbeat_monitor::last_seen(std::string const& peer) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = last_seen_.find(peer);
  if (i == last_seen_.end()) {
    detail::raise<std::out_of_range>("heartbeat_monitor::last_seen(", peer, ") - peer never seen");
  }
  return i->second;
}

std::vector<std::string> heartbeat_monitor::known_peers() const {
  std::vector<std::string> peers;
  std::lock_guard<std::mutex> lock(mu_);
  for (auto const& i : last_seen_) {
    peers.push_back(i.first);
  }
  return peers;
}

void heartbeat_monitor::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  last_seen_.clear();
}

} // namespace mh
