#ifndef mh_detail_reliable_broadcaster_hpp
#define mh_detail_reliable_broadcaster_hpp

#include <mh/broadcast_result.hpp>
#include <mh/completion_queue.hpp>
#include <mh/detail/broadcast_policies.hpp>
#include <mh/detail/async_op.hpp>
#include <mh/errors.hpp>
#include <mh/log.hpp>
#include <mh/mesh_transport.hpp>

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mh {
namespace detail {

/**
 * Broadcast messages over an unreliable transport, trying again after each failure.
 *
 * The first attempt runs immediately, in the calling thread.  After a failure the retry policy decides if there is
 * another attempt, and the backoff policy how long to wait for it.  The wait is a timer in the completion queue, so
 * the retries run in the coordination context and can be cancelled.  The broadcaster never reconnects the
 * transport, it reports exhausted broadcasts and lets the caller decide.
 *
 * @tparam completion_queue_type the type of completion queue, mocked in the tests.
 */
template <typename completion_queue_type>
class reliable_broadcaster {
public:
  using callback_type = std::function<void(broadcast_result const&)>;

  reliable_broadcaster(
      completion_queue_type& queue, std::shared_ptr<mesh_transport> transport, broadcast_retry_policy const& retry,
      broadcast_backoff_policy const& backoff)
      : state_(std::make_shared<shared_state>(queue, std::move(transport), retry.clone(), backoff.clone())) {
  }

  reliable_broadcaster(reliable_broadcaster const&) = delete;
  reliable_broadcaster& operator=(reliable_broadcaster const&) = delete;

  ~reliable_broadcaster() {
    shutdown();
  }

  /**
   * Broadcast @a bytes and call @a callback with the result.
   *
   * The callback is not called for broadcasts cancelled by cancel_all() or shutdown().
   */
  void broadcast(std::string name, std::string bytes, message_priority priority, callback_type callback) {
    std::uint64_t id;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      if (state_->shutdown) {
        MH_LOG(notice) << "reliable_broadcaster - " << name << " dropped after shutdown";
        return;
      }
      id = ++state_->last_id;
      ++state_->stats.total;
      pending p;
      p.name = std::move(name);
      p.bytes = std::move(bytes);
      p.priority = priority;
      p.attempts = 0;
      p.retry = state_->retry_prototype->clone();
      p.backoff = state_->backoff_prototype->clone();
      p.callback = std::move(callback);
      state_->pending_broadcasts.emplace(id, std::move(p));
    }
    attempt(state_, id);
  }

  /**
   * Broadcast @a bytes and return a future to wait for the result.
   *
   * The future holds a mh::broadcast_exhausted exception if all the attempts failed.
   */
  std::shared_future<void> broadcast(std::string name, std::string bytes, message_priority priority, mh::use_future) {
    auto promise = std::make_shared<std::promise<void>>();
    std::shared_future<void> fut(promise->get_future());
    std::string what = name;
    broadcast(std::move(name), std::move(bytes), priority, [promise, what](broadcast_result const& r) {
      if (r.delivered) {
        promise->set_value();
        return;
      }
      promise->set_exception(std::make_exception_ptr(
          broadcast_exhausted(what + " - all attempts failed, last error: " + r.last_error, r.attempts)));
    });
    return fut;
  }

  /// Cancel all the pending retries, their callbacks are never called.
  void cancel_all() {
    pending_map pending;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      pending.swap(state_->pending_broadcasts);
      state_->stats.cancelled += pending.size();
    }
    for (auto& p : pending) {
      if (p.second.timer) {
        p.second.timer->cancel();
      }
    }
  }

  /// Cancel all the pending retries and drop any new broadcast.
  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      state_->shutdown = true;
    }
    cancel_all();
  }

  /// The number of broadcasts waiting for a retry.
  std::size_t in_flight() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->pending_broadcasts.size();
  }

  broadcast_stats stats() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->stats;
  }

private:
  struct pending {
    std::string name;
    std::string bytes;
    message_priority priority;
    int attempts;
    std::unique_ptr<broadcast_retry_policy> retry;
    std::unique_ptr<broadcast_backoff_policy> backoff;
    callback_type callback;
    std::shared_ptr<deadline_timer> timer;
  };
  using pending_map = std::map<std::uint64_t, pending>;

  struct shared_state {
    shared_state(
        completion_queue_type& q, std::shared_ptr<mesh_transport> t, std::unique_ptr<broadcast_retry_policy> r,
        std::unique_ptr<broadcast_backoff_policy> b)
        : queue(q)
        , transport(std::move(t))
        , retry_prototype(std::move(r))
        , backoff_prototype(std::move(b))
        , mu()
        , pending_broadcasts()
        , last_id(0)
        , shutdown(false)
        , stats() {
    }

    completion_queue_type& queue;
    std::shared_ptr<mesh_transport> transport;
    std::unique_ptr<broadcast_retry_policy> retry_prototype;
    std::unique_ptr<broadcast_backoff_policy> backoff_prototype;
    mutable std::mutex mu;
    pending_map pending_broadcasts;
    std::uint64_t last_id;
    bool shutdown;
    broadcast_stats stats;
  };

  static void attempt(std::shared_ptr<shared_state> const& state, std::uint64_t id) {
    std::string name;
    std::string bytes;
    message_priority priority;
    int attempts;
    {
      std::lock_guard<std::mutex> lock(state->mu);
      auto i = state->pending_broadcasts.find(id);
      if (i == state->pending_broadcasts.end()) {
        // ... cancelled while waiting for the retry ...
        return;
      }
      auto& p = i->second;
      p.timer.reset();
      attempts = ++p.attempts;
      name = p.name;
      bytes = p.bytes;
      priority = p.priority;
    }

    std::string error;
    try {
      state->transport->send_broadcast(bytes, priority);
    } catch (std::exception const& ex) {
      error = ex.what();
    }

    std::unique_lock<std::mutex> lock(state->mu);
    auto i = state->pending_broadcasts.find(id);
    if (i == state->pending_broadcasts.end()) {
      return;
    }
    auto& p = i->second;
    if (error.empty()) {
      auto callback = std::move(p.callback);
      state->pending_broadcasts.erase(i);
      ++state->stats.delivered;
      lock.unlock();
      MH_LOG(trace) << "reliable_broadcaster - " << name << " delivered after " << attempts << " attempt(s)";
      if (callback) {
        callback(broadcast_result{true, attempts, std::string()});
      }
      return;
    }
    if (not p.retry->on_failure()) {
      auto callback = std::move(p.callback);
      state->pending_broadcasts.erase(i);
      ++state->stats.exhausted;
      lock.unlock();
      MH_LOG(warning) << "reliable_broadcaster - " << name << " exhausted after " << attempts
                      << " attempt(s), last error: " << error;
      if (callback) {
        callback(broadcast_result{false, attempts, error});
      }
      return;
    }
    auto delay = p.backoff->on_failure();
    ++state->stats.retries;
    lock.unlock();
    MH_LOG(info) << "reliable_broadcaster - " << name << " attempt " << attempts << " failed (" << error
                 << "), retry in " << delay.count() << "ms";

    std::weak_ptr<shared_state> w(state);
    auto timer = state->queue.make_relative_timer(
        delay, "broadcast/" + name + "/retry", [w, id](deadline_timer const&, bool ok) {
          auto s = w.lock();
          if (not ok or not s) {
            return;
          }
          attempt(s, id);
        });
    lock.lock();
    i = state->pending_broadcasts.find(id);
    if (i != state->pending_broadcasts.end() and i->second.attempts == attempts) {
      i->second.timer = std::move(timer);
      return;
    }
    lock.unlock();
    timer->cancel();
  }

private:
  std::shared_ptr<shared_state> state_;
};

} // namespace detail
} // namespace mh

#endif // mh_detail_reliable_broadcaster_hpp
