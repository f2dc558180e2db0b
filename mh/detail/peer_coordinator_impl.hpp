#ifndef mh_detail_peer_coordinator_impl_hpp
#define mh_detail_peer_coordinator_impl_hpp

#include <mh/completion_queue.hpp>
#include <mh/detail/broadcast_policies.hpp>
#include <mh/detail/election_state_machine.hpp>
#include <mh/detail/proto_format.hpp>
#include <mh/detail/reliable_broadcaster.hpp>
#include <mh/detail/timer_registry.hpp>
#include <mh/election_messages.hpp>
#include <mh/errors.hpp>
#include <mh/heartbeat_monitor.hpp>
#include <mh/host_election.hpp>
#include <mh/log.hpp>
#include <mh/mesh_config.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace mh {
namespace detail {

/// The names of the timers used by the coordinator.
namespace timer_id {
constexpr char election_confirm[] = "election.confirm";
constexpr char host_heartbeat[] = "election.host_heartbeat";
constexpr char host_timeout_check[] = "election.host_timeout_check";
constexpr char peer_heartbeat[] = "network.heartbeat";
constexpr char reconnect[] = "network.reconnect";
} // namespace timer_id

/**
 * Implement the host election given the type of completion queue.
 *
 * All the member functions that change the state must be called from the thread running the completion queue (in
 * the unit tests, the thread driving the simulated clock).  The timers and the messages received from the transport
 * are posted to the same queue.  The accessors (has_host(), current_host(), etc.) can be called from any thread.
 *
 * The object must be owned by a std::shared_ptr, the timers and the transport hold weak references to it.
 */
template <typename completion_queue_type>
class peer_coordinator_impl : public host_election,
                              public std::enable_shared_from_this<peer_coordinator_impl<completion_queue_type>> {
public:
  //@{
  /// @name type traits
  using time_point = std::chrono::system_clock::time_point;
  /// The source of time for heartbeats and timeouts, the unit tests use the simulated clock.
  using clock_type = std::function<time_point()>;
  //@}

  /**
   * Constructor, all work is delayed until startup() or start_election().
   *
   * @throws std::invalid_argument if @a config is not valid.
   */
  peer_coordinator_impl(
      completion_queue_type& queue, std::shared_ptr<mesh_transport> transport, mesh_config config,
      clock_type clock = clock_type())
      : queue_(queue)
      , transport_(std::move(transport))
      , config_(validated(std::move(config)))
      , clock_(std::move(clock))
      , timers_(queue)
      , broadcaster_(
            queue, transport_, limited_attempts(config_.broadcast_max_attempts),
            linear_backoff(config_.broadcast_backoff_base))
      , monitor_()
      , machine_()
      , mu_()
      , record_{false, std::string(), false}
      , adopted_at_()
      , candidates_()
      , excluded_()
      , round_(0)
      , reconnects_(0)
      , host_timeouts_(0)
      , started_(false)
      , last_event_{false, std::string(), false, election_state::idle}
      , subscriptions_()
      , message_subscriptions_()
      , token_gen_(0) {
    if (not clock_) {
      clock_ = []() { return std::chrono::system_clock::now(); };
    }
  }

  ~peer_coordinator_impl() {
    shutdown();
  }

  void startup() override {
    check_running("startup()");
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (started_) {
        return;
      }
      started_ = true;
    }
    auto w = weak_self();
    transport_->set_message_handler([w](std::string const& bytes) {
      auto self = w.lock();
      if (not self) {
        return;
      }
      // ... the transport calls from its own threads, move the work to the coordination context ...
      self->queue_.run_async("peer_coordinator/on_message", [w, bytes]() {
        if (auto self = w.lock()) {
          self->on_message(bytes);
        }
      });
    });
    timers_.schedule_repeating(timer_id::peer_heartbeat, config_.peer_heartbeat_interval, [w]() {
      if (auto self = w.lock()) {
        self->send_peer_heartbeat();
      }
    });
    timers_.schedule_repeating(timer_id::host_timeout_check, config_.host_timeout_check_interval, [w]() {
      if (auto self = w.lock()) {
        self->check_host_timeout();
      }
    });
    MH_LOG(info) << log_header() << " started with " << config_;
  }

  void shutdown() override {
    if (not machine_.close("peer_coordinator::shutdown()")) {
      return;
    }
    MH_LOG(info) << log_header() << " shutting down";
    timers_.shutdown();
    broadcaster_.shutdown();
    transport_->set_message_handler(mesh_transport::message_handler());
    // ... release the subscribers outside the lock, their destructors are application code ...
    subscriptions_type subscriptions;
    message_subscriptions_type message_subscriptions;
    {
      std::lock_guard<std::mutex> lock(mu_);
      record_ = host_record{false, std::string(), false};
      candidates_.clear();
      excluded_.clear();
      last_event_ = host_event{false, std::string(), false, election_state::idle};
      subscriptions.swap(subscriptions_);
      message_subscriptions.swap(message_subscriptions_);
    }
    monitor_.clear();
  }

  void start_election(std::set<std::string> const& peers) override {
    check_running("start_election()");
    start_election_impl("start_election()", peers, std::set<std::string>());
  }

  void become_host() override {
    check_running("become_host()");
    become_host_impl();
    if (machine_.current() != election_state::in_progress) {
      machine_.change_state("become_host()", election_state::completed);
    }
    notify();
  }

  void resign_host() override {
    check_running("resign_host()");
    resign_host_impl("resign_host()");
  }

  void handle_heartbeat(std::string const& from) override {
    if (machine_.closed()) {
      MH_LOG(trace) << log_header() << " heartbeat from " << from << " ignored after shutdown";
      return;
    }
    if (from.empty() or from == config_.self_id) {
      return;
    }
    monitor_.record_heartbeat(from, clock_());
    note_alive(from);
    apply_host_claim("handle_heartbeat()", from);
  }

  void handle_host_timeout() override {
    if (machine_.closed()) {
      return;
    }
    host_record current = record();
    if (not current.has_host or current.is_self) {
      MH_LOG(debug) << log_header() << " handle_host_timeout() - no remote host to replace";
      return;
    }
    auto lost = current.current_host;
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++host_timeouts_;
    }
    MH_LOG(warning) << log_header() << " host " << lost << " timed out, starting a new election";
    clear_host();
    notify();
    auto peers = connected_peers_or_empty();
    peers.erase(lost);
    try {
      start_election_impl("handle_host_timeout()", peers, std::set<std::string>{lost});
    } catch (election_failed const& ex) {
      MH_LOG(warning) << log_header() << " re-election failed: " << ex.what();
    }
  }

  void migrate_host(std::string const& to) override {
    check_running("migrate_host()");
    if (to.empty()) {
      raise<std::invalid_argument>("migrate_host() - the new host id must not be empty");
    }
    timers_.cancel(timer_id::election_confirm);
    {
      std::lock_guard<std::mutex> lock(mu_);
      // ... any confirmation already in the queue is now stale ...
      ++round_;
      candidates_.clear();
      excluded_.clear();
    }
    if (to == config_.self_id) {
      if (not is_host()) {
        become_host_impl();
      }
    } else {
      follow(to);
    }
    machine_.change_state("migrate_host()", election_state::completed);
    MH_LOG(notice) << log_header() << " host migrated to " << to;
    notify();
  }

  void handle_network_change() override {
    if (machine_.closed() or not is_host()) {
      return;
    }
    if (not connected_peers_or_empty().empty()) {
      return;
    }
    MH_LOG(notice) << log_header() << " no connected peers left";
    try {
      resign_host_impl("handle_network_change()");
    } catch (election_failed const& ex) {
      MH_LOG(warning) << log_header() << " re-election failed: " << ex.what();
    }
  }

  void on_message(std::string const& bytes) override {
    if (machine_.closed()) {
      MH_LOG(trace) << log_header() << " message dropped after shutdown";
      return;
    }
    game_message msg;
    try {
      msg = decode_game_message(bytes);
    } catch (decode_error const& ex) {
      MH_LOG(warning) << log_header() << " dropping malformed message: " << ex.what();
      return;
    }
    if (not config_.room_id.empty() and msg.room_id != config_.room_id) {
      MH_LOG(debug) << log_header() << " dropping message for room " << msg.room_id;
      return;
    }
    try {
      if (is_election_message(msg.type)) {
        dispatch_election_message(msg);
      } else {
        deliver_message(msg);
      }
    } catch (decode_error const& ex) {
      MH_LOG(warning) << log_header() << " dropping malformed " << msg.type << " message: " << ex.what();
    } catch (std::exception const& ex) {
      MH_LOG(error) << log_header() << " error processing " << msg << ": " << ex.what();
    }
  }

  std::shared_future<void>
  broadcast_message(std::string const& type, std::string const& payload, message_priority priority) override {
    check_running("broadcast_message()");
    if (is_election_message(type)) {
      raise<std::invalid_argument>("broadcast_message() - <", type, "> is reserved for the election");
    }
    auto bytes = encode_game_message(game_message{type, config_.room_id, config_.device_name, payload});
    return broadcast_impl(type, std::move(bytes), priority);
  }

  std::string const& self_id() const override {
    return config_.self_id;
  }

  bool has_host() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return record_.has_host;
  }

  std::string current_host() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return record_.current_host;
  }

  bool is_host() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return record_.is_self;
  }

  election_state state() const override {
    return machine_.current();
  }

  host_event snapshot() const override {
    std::lock_guard<std::mutex> lock(mu_);
    MH_ASSERT_THROW(record_.is_self == (record_.has_host and record_.current_host == config_.self_id));
    return host_event{record_.has_host, record_.current_host, record_.is_self, machine_.current()};
  }

  long subscribe(subscriber_type&& subscriber) override {
    // ... release the lock while calling application code, holding locks in such cases is prone to deadlocking ...
    subscriber(snapshot());
    std::lock_guard<std::mutex> lock(mu_);
    auto token = ++token_gen_;
    subscriptions_.emplace(token, std::move(subscriber));
    return token;
  }

  void unsubscribe(long token) override {
    std::lock_guard<std::mutex> lock(mu_);
    subscriptions_.erase(token);
  }

  long subscribe_messages(message_subscriber_type&& subscriber) override {
    std::lock_guard<std::mutex> lock(mu_);
    auto token = ++token_gen_;
    message_subscriptions_.emplace(token, std::move(subscriber));
    return token;
  }

  void unsubscribe_messages(long token) override {
    std::lock_guard<std::mutex> lock(mu_);
    message_subscriptions_.erase(token);
  }

  //@{
  /// @name diagnostics, mostly for testing
  std::int64_t round() const {
    std::lock_guard<std::mutex> lock(mu_);
    return round_;
  }
  int host_timeouts() const {
    std::lock_guard<std::mutex> lock(mu_);
    return host_timeouts_;
  }
  int reconnect_attempts() const {
    std::lock_guard<std::mutex> lock(mu_);
    return reconnects_;
  }
  std::vector<std::string> active_timers() const {
    return timers_.active_ids();
  }
  std::size_t broadcasts_in_flight() const {
    return broadcaster_.in_flight();
  }
  broadcast_stats broadcaster_stats() const {
    return broadcaster_.stats();
  }
  heartbeat_monitor const& monitor() const {
    return monitor_;
  }
  //@}

private:
  using subscriptions_type = std::unordered_map<long, subscriber_type>;
  using message_subscriptions_type = std::unordered_map<long, message_subscriber_type>;

  static mesh_config validated(mesh_config config) {
    config.validate();
    return config;
  }

  std::weak_ptr<peer_coordinator_impl> weak_self() {
    return std::weak_ptr<peer_coordinator_impl>(this->shared_from_this());
  }

  std::string log_header() const {
    return "peer_coordinator(" + config_.self_id + ")";
  }

  static std::string join(std::set<std::string> const& ids) {
    std::ostringstream os;
    os << "{";
    char const* sep = "";
    for (auto const& id : ids) {
      os << sep << id;
      sep = ", ";
    }
    os << "}";
    return os.str();
  }

  void check_running(char const* where) const {
    if (machine_.closed()) {
      raise<std::runtime_error>(where, " called after shutdown()");
    }
  }

  host_record record() const {
    std::lock_guard<std::mutex> lock(mu_);
    return record_;
  }

  std::set<std::string> connected_peers_or_empty() const {
    try {
      return transport_->connected_peers();
    } catch (std::exception const& ex) {
      MH_LOG(warning) << log_header() << " cannot query the connected peers: " << ex.what();
    }
    return std::set<std::string>();
  }

  /// Run an election round with @a peers, ignoring the @a excluded peers until they are heard from.
  void start_election_impl(char const* where, std::set<std::string> const& peers, std::set<std::string> excluded) {
    if (config_.self_id.empty()) {
      raise<election_failed>(where, " - the local peer has no id, the candidate set would be incomplete");
    }
    std::set<std::string> candidates;
    for (auto const& p : peers) {
      if (not p.empty() and excluded.count(p) == 0) {
        candidates.insert(p);
      }
    }
    candidates.insert(config_.self_id);
    if (not machine_.change_state(where, election_state::in_progress)) {
      raise<std::runtime_error>(where, " - election rejected after shutdown()");
    }
    std::int64_t round;
    {
      std::lock_guard<std::mutex> lock(mu_);
      round = ++round_;
      candidates_ = candidates;
      excluded_ = std::move(excluded);
    }
    auto const& winner = *candidates.begin();
    MH_LOG(info) << log_header() << " " << where << " round " << round << " candidates=" << join(candidates)
                 << " winner=" << winner;
    // ... apply the winner optimistically, the confirmation may change it ...
    if (winner == config_.self_id) {
      become_host_impl();
    } else {
      follow(winner);
    }
    send(message_type::election_start, make_election_start(config_.self_id, candidates, round),
         message_priority::high);
    auto w = weak_self();
    timers_.schedule_once(timer_id::election_confirm, config_.election_confirm_delay, [w, round]() {
      if (auto self = w.lock()) {
        self->confirm_election(round);
      }
    });
    notify();
  }

  /// Recompute the winner with the peers seen during the round, and complete the election.
  void confirm_election(std::int64_t round) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (round != round_) {
        MH_LOG(trace) << log_header() << " stale confirmation for round " << round;
        return;
      }
    }
    if (machine_.current() != election_state::in_progress) {
      return;
    }
    auto connected = connected_peers_or_empty();
    std::set<std::string> candidates;
    {
      std::lock_guard<std::mutex> lock(mu_);
      for (auto const& p : connected) {
        if (excluded_.count(p) == 0) {
          candidates_.insert(p);
        }
      }
      candidates = candidates_;
    }
    auto const& winner = *candidates.begin();
    if (winner == config_.self_id) {
      if (not is_host()) {
        become_host_impl();
      }
    } else if (current_host() != winner) {
      follow(winner);
    }
    machine_.change_state("confirm_election()", election_state::completed);
    MH_LOG(info) << log_header() << " round " << round << " confirmed, candidates=" << join(candidates)
                 << " host=" << winner;
    notify();
  }

  void become_host_impl() {
    std::int64_t round;
    {
      std::lock_guard<std::mutex> lock(mu_);
      record_ = host_record{true, config_.self_id, true};
      adopted_at_ = clock_();
      round = round_;
    }
    auto w = weak_self();
    timers_.schedule_repeating(timer_id::host_heartbeat, config_.host_heartbeat_interval, [w]() {
      if (auto self = w.lock()) {
        self->send_host_heartbeat();
      }
    });
    send(message_type::host_announcement, make_host_announcement(config_.self_id, round), message_priority::high);
    MH_LOG(notice) << log_header() << " is now the host";
  }

  void resign_host_impl(char const* where) {
    MH_LOG(notice) << log_header() << " " << where << " resigning";
    clear_host();
    notify();
    start_election_impl(where, connected_peers_or_empty(), std::set<std::string>());
  }

  /// Make @a host the current host, stopping the local host heartbeats if needed.
  void follow(std::string const& host) {
    bool was_host;
    {
      std::lock_guard<std::mutex> lock(mu_);
      was_host = record_.is_self;
      record_ = host_record{true, host, false};
      adopted_at_ = clock_();
    }
    if (was_host) {
      timers_.cancel(timer_id::host_heartbeat);
      MH_LOG(notice) << log_header() << " yields the host role to " << host;
    }
  }

  void clear_host() {
    bool was_host;
    {
      std::lock_guard<std::mutex> lock(mu_);
      was_host = record_.is_self;
      record_ = host_record{false, std::string(), false};
    }
    if (was_host) {
      timers_.cancel(timer_id::host_heartbeat);
    }
  }

  /// Follow @a host as a result of its heartbeats or announcements.
  void adopt(char const* where, std::string const& host) {
    follow(host);
    if (machine_.current() != election_state::in_progress) {
      machine_.change_state(where, election_state::completed);
    }
    MH_LOG(info) << log_header() << " " << where << " adopted host " << host;
    notify();
  }

  /// A peer that is alive joins the round in progress, even if it was excluded.
  void note_alive(std::string const& peer) {
    if (machine_.current() != election_state::in_progress) {
      return;
    }
    std::lock_guard<std::mutex> lock(mu_);
    candidates_.insert(peer);
    excluded_.erase(peer);
  }

  /// Return true if @a host was not heard from (nor adopted) in more than the host timeout.
  bool host_overdue(std::string const& host, time_point adopted_at, time_point now) const {
    return monitor_.check_timeout(host, config_.host_timeout, now, true) and now - adopted_at > config_.host_timeout;
  }

  /// Apply the conflict rule to a peer claiming to be the host: the lowest id that is alive wins.
  void apply_host_claim(char const* where, std::string const& claimant) {
    host_record current;
    time_point adopted_at;
    {
      std::lock_guard<std::mutex> lock(mu_);
      current = record_;
      adopted_at = adopted_at_;
    }
    if (not current.has_host) {
      follow_or_elect(where, claimant, std::set<std::string>());
      return;
    }
    if (claimant == current.current_host) {
      return;
    }
    if (claimant < current.current_host) {
      adopt(where, claimant);
      return;
    }
    if (current.is_self) {
      MH_LOG(debug) << log_header() << " " << where << " " << claimant << " claims the host role, re-announcing";
      send(message_type::host_announcement, make_host_announcement(config_.self_id, round()),
           message_priority::high);
      return;
    }
    if (not host_overdue(current.current_host, adopted_at, clock_())) {
      MH_LOG(debug) << log_header() << " " << where << " ignoring claim from " << claimant << ", host "
                    << current.current_host << " is alive";
      return;
    }
    follow_or_elect(where, claimant, std::set<std::string>{current.current_host});
  }

  /**
   * Follow @a claimant if it has a lower id than the local peer, otherwise run an election.
   *
   * The local peer wins that election and announces itself, which makes the claimant yield.  The @a excluded peers
   * are left out of the candidates.
   */
  void follow_or_elect(char const* where, std::string const& claimant, std::set<std::string> excluded) {
    if (config_.self_id.empty() or claimant < config_.self_id) {
      adopt(where, claimant);
      return;
    }
    MH_LOG(info) << log_header() << " " << where << " " << claimant << " claims the host role, electing a lower id";
    auto peers = connected_peers_or_empty();
    peers.insert(claimant);
    for (auto const& e : excluded) {
      peers.erase(e);
    }
    try {
      start_election_impl(where, peers, std::move(excluded));
    } catch (election_failed const& ex) {
      MH_LOG(warning) << log_header() << " election failed: " << ex.what();
    }
  }

  void dispatch_election_message(game_message const& msg) {
    auto const& self = config_.self_id;
    if (msg.type == message_type::election_start) {
      wire::ElectionStart payload;
      parse_election_payload(msg, payload);
      MH_LOG(debug) << log_header() << " received " << msg.type << " " << print_to_stream(payload);
      if (payload.initiator().empty() or payload.initiator() == self) {
        return;
      }
      monitor_.record_heartbeat(payload.initiator(), clock_());
      std::set<std::string> remote(payload.candidates().begin(), payload.candidates().end());
      remote.erase(std::string());
      on_election_start(payload.initiator(), remote);
      return;
    }
    if (msg.type == message_type::host_announcement) {
      wire::HostAnnouncement payload;
      parse_election_payload(msg, payload);
      MH_LOG(debug) << log_header() << " received " << msg.type << " " << print_to_stream(payload);
      handle_heartbeat(payload.host());
      return;
    }
    wire::Heartbeat payload;
    parse_election_payload(msg, payload);
    MH_LOG(trace) << log_header() << " received " << msg.type << " " << print_to_stream(payload);
    if (msg.type == message_type::host_heartbeat) {
      handle_heartbeat(payload.peer_id());
      return;
    }
    if (payload.peer_id().empty() or payload.peer_id() == self) {
      return;
    }
    monitor_.record_heartbeat(payload.peer_id(), clock_());
    note_alive(payload.peer_id());
  }

  /// Join the election started by @a initiator, both peers then confirm over the union of their candidates.
  void on_election_start(std::string const& initiator, std::set<std::string> const& remote) {
    switch (machine_.current()) {
    case election_state::in_progress: {
      note_alive(initiator);
      std::lock_guard<std::mutex> lock(mu_);
      for (auto const& p : remote) {
        if (excluded_.count(p) == 0) {
          candidates_.insert(p);
        }
      }
    } break;
    case election_state::idle: {
      // ... the initiator and its candidates may not be in the connected peers yet ...
      auto peers = connected_peers_or_empty();
      peers.insert(initiator);
      peers.insert(remote.begin(), remote.end());
      start_election_impl("on_election_start()", peers, std::set<std::string>());
    } break;
    case election_state::completed:
      if (is_host()) {
        send(message_type::host_announcement, make_host_announcement(config_.self_id, round()),
             message_priority::high);
      }
      break;
    }
  }

  void deliver_message(game_message const& msg) {
    message_subscriptions_type copy;
    {
      std::lock_guard<std::mutex> lock(mu_);
      copy = message_subscriptions_;
    }
    for (auto const& s : copy) {
      s.second(msg);
    }
  }

  /// Call the subscribers if the snapshot changed since the last call.
  void notify() {
    auto event = snapshot();
    subscriptions_type copy;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (event == last_event_) {
        return;
      }
      last_event_ = event;
      copy = subscriptions_;
    }
    MH_LOG(debug) << log_header() << " " << event;
    for (auto const& s : copy) {
      s.second(event);
    }
  }

  void send_host_heartbeat() {
    if (not is_host()) {
      return;
    }
    send(message_type::host_heartbeat, make_heartbeat(config_.self_id, config_.device_name, wire::ROLE_HOST, clock_()),
         message_priority::normal);
  }

  void send_peer_heartbeat() {
    auto current = record();
    auto role = not current.has_host ? wire::ROLE_UNKNOWN : current.is_self ? wire::ROLE_HOST : wire::ROLE_FOLLOWER;
    send(message_type::peer_heartbeat, make_heartbeat(config_.self_id, config_.device_name, role, clock_()),
         message_priority::low);
  }

  void check_host_timeout() {
    host_record current;
    time_point adopted_at;
    {
      std::lock_guard<std::mutex> lock(mu_);
      current = record_;
      adopted_at = adopted_at_;
    }
    if (not current.has_host or current.is_self) {
      return;
    }
    if (host_overdue(current.current_host, adopted_at, clock_())) {
      handle_host_timeout();
    }
  }

  /// Wrap an election payload and broadcast it, the result only matters for the reconnect logic.
  void send(char const* type, google::protobuf::Message const& payload, message_priority priority) {
    std::string bytes;
    try {
      bytes = encode_game_message(wrap_election_message(type, config_.room_id, config_.device_name, payload));
    } catch (std::invalid_argument const& ex) {
      MH_LOG(error) << log_header() << " cannot encode " << type << ": " << ex.what();
      return;
    }
    (void)broadcast_impl(type, std::move(bytes), priority);
  }

  /**
   * Broadcast @a bytes through the reliable broadcaster.
   *
   * If the broadcast is cancelled by shutdown() the future holds a std::future_error (broken promise).
   */
  std::shared_future<void> broadcast_impl(std::string name, std::string bytes, message_priority priority) {
    auto promise = std::make_shared<std::promise<void>>();
    std::shared_future<void> fut(promise->get_future());
    auto w = weak_self();
    std::string what = name;
    broadcaster_.broadcast(
        std::move(name), std::move(bytes), priority, [w, promise, what](broadcast_result const& r) {
          if (auto self = w.lock()) {
            self->on_broadcast_result(what, r);
          }
          if (r.delivered) {
            promise->set_value();
            return;
          }
          promise->set_exception(std::make_exception_ptr(
              broadcast_exhausted(what + " - all attempts failed, last error: " + r.last_error, r.attempts)));
        });
    return fut;
  }

  void on_broadcast_result(std::string const& what, broadcast_result const& r) {
    if (r.delivered) {
      int previous;
      {
        std::lock_guard<std::mutex> lock(mu_);
        previous = reconnects_;
        reconnects_ = 0;
      }
      if (previous != 0) {
        MH_LOG(info) << log_header() << " transport recovered after " << previous << " restart(s)";
      }
      return;
    }
    if (machine_.closed()) {
      return;
    }
    int attempts;
    {
      std::lock_guard<std::mutex> lock(mu_);
      attempts = reconnects_;
    }
    if (attempts >= config_.max_reconnect_attempts) {
      MH_LOG(error) << log_header() << " " << what << " exhausted (" << r << "), giving up after " << attempts
                    << " transport restart(s)";
      return;
    }
    if (timers_.is_active(timer_id::reconnect)) {
      return;
    }
    MH_LOG(warning) << log_header() << " " << what << " exhausted (" << r << "), restarting the transport in "
                    << config_.quick_restart_delay.count() << "ms";
    auto w = weak_self();
    timers_.schedule_once(timer_id::reconnect, config_.quick_restart_delay, [w]() {
      if (auto self = w.lock()) {
        self->reconnect();
      }
    });
  }

  void reconnect() {
    int attempt;
    {
      std::lock_guard<std::mutex> lock(mu_);
      attempt = ++reconnects_;
    }
    MH_LOG(notice) << log_header() << " restarting the transport, attempt " << attempt << "/"
                   << config_.max_reconnect_attempts;
    try {
      transport_->restart();
    } catch (std::exception const& ex) {
      MH_LOG(error) << log_header() << " transport restart failed: " << ex.what();
    }
  }

private:
  completion_queue_type& queue_;
  std::shared_ptr<mesh_transport> transport_;
  mesh_config config_;
  clock_type clock_;
  timer_registry<completion_queue_type> timers_;
  reliable_broadcaster<completion_queue_type> broadcaster_;
  heartbeat_monitor monitor_;
  election_state_machine machine_;

  mutable std::mutex mu_;
  host_record record_;
  time_point adopted_at_;
  // The candidates of the round in progress, grows with the peers heard from during the round.
  std::set<std::string> candidates_;
  // Peers that timed out as hosts, ignored in the round unless heard from again.
  std::set<std::string> excluded_;
  std::int64_t round_;
  int reconnects_;
  int host_timeouts_;
  bool started_;
  host_event last_event_;
  subscriptions_type subscriptions_;
  message_subscriptions_type message_subscriptions_;
  long token_gen_;
};

} // namespace detail
} // namespace mh

#endif // mh_detail_peer_coordinator_impl_hpp
