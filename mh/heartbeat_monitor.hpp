#ifndef mh_heartbeat_monitor_hpp
#define mh_heartbeat_monitor_hpp

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace mh {

/**
 * Remember when each peer was last heard from.
 *
 * The monitor owns no timers and never reads the clock, the caller provides the time of each heartbeat and the
 * current time for each check.  Entries are never removed, a peer that leaves simply becomes overdue.
 */
class heartbeat_monitor {
public:
  using time_point = std::chrono::system_clock::time_point;

  heartbeat_monitor()
      : mu_()
      , last_seen_() {
  }

  /// Record a heartbeat from @a peer received at @a at.
  void record_heartbeat(std::string const& peer, time_point at);

  /**
   * Return true if @a peer has not been heard from in more than @a timeout.
   *
   * @param never_seen_overdue the result for a peer that was never heard from.
   */
  template <typename duration_type>
  bool check_timeout(std::string const& peer, duration_type timeout, time_point now, bool never_seen_overdue) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto i = last_seen_.find(peer);
    if (i == last_seen_.end()) {
      return never_seen_overdue;
    }
    return now - i->second > timeout;
  }

  /// Return true if @a peer was ever heard from.
  bool has_seen(std::string const& peer) const;

  /**
   * Return the last time @a peer was heard from.
   *
   * @throws std::out_of_range if the peer was never heard from.
   */
  time_point last_seen(std::string const& peer) const;

  /// The peers ever heard from.
  std::vector<std::string> known_peers() const;

  /// The peers not heard from in more than @a timeout.
  template <typename duration_type>
  std::vector<std::string> overdue_peers(duration_type timeout, time_point now) const {
    std::vector<std::string> overdue;
    std::lock_guard<std::mutex> lock(mu_);
    for (auto const& i : last_seen_) {
      if (now - i.second > timeout) {
        overdue.push_back(i.first);
      }
    }
    return overdue;
  }

  /// Forget all the peers, used when the coordinator shuts down.
  void clear();

private:
  mutable std::mutex mu_;
  std::map<std::string, time_point> last_seen_;
};

} // namespace mh

#endif // mh_heartbeat_monitor_hpp
