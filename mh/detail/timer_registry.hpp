#ifndef mh_detail_timer_registry_hpp
#define mh_detail_timer_registry_hpp

#include <mh/detail/async_op.hpp>
#include <mh/log.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace mh {
namespace detail {

/**
 * Keep a set of named timers in a completion queue.
 *
 * Every time-based behavior in Mesh-Host (the election confirmation, heartbeats, reconnects, and any application
 * countdown) is a named entry in a registry.  There is at most one live timer per name: scheduling a name that is
 * already active cancels the previous timer first, and a cancelled timer never runs its action, even if the
 * underlying alarm already expired and is waiting in the queue.
 *
 * The registry owns the actions, the alarms only hold a weak reference to the registry state.  Destroying the
 * registry (or calling shutdown()) releases every action.
 *
 * @tparam completion_queue_type the type of completion queue, mocked in the tests.
 */
template <typename completion_queue_type>
class timer_registry {
public:
  /// The actions run in the completion queue thread.
  using action_type = std::function<void()>;

  explicit timer_registry(completion_queue_type& queue)
      : state_(std::make_shared<shared_state>(queue)) {
  }

  timer_registry(timer_registry const&) = delete;
  timer_registry& operator=(timer_registry const&) = delete;

  ~timer_registry() {
    shutdown();
  }

  /**
   * Schedule @a action to run after @a interval, and again every @a interval if @a repeats is true.
   *
   * Any timer already scheduled under @a id is cancelled and replaced.
   */
  template <typename duration_type>
  void schedule(std::string const& id, duration_type interval, bool repeats, action_type action) {
    schedule_impl(
        id, std::chrono::duration_cast<std::chrono::milliseconds>(interval), repeats ? forever : 1, std::move(action));
  }

  /// Run @a action once, after @a delay.
  template <typename duration_type>
  void schedule_once(std::string const& id, duration_type delay, action_type action) {
    schedule(id, delay, false, std::move(action));
  }

  /// Run @a action every @a interval until cancelled.
  template <typename duration_type>
  void schedule_repeating(std::string const& id, duration_type interval, action_type action) {
    schedule(id, interval, true, std::move(action));
  }

  /**
   * Count down from @a ticks to zero, one tick every @a interval.
   *
   * @a on_tick is called with the remaining ticks (ticks - 1 down to 0), then @a on_done is called after the last
   * tick and the timer is removed.
   */
  template <typename duration_type>
  void start_countdown(
      std::string const& id, int ticks, duration_type interval, std::function<void(int)> on_tick,
      std::function<void()> on_done) {
    if (ticks <= 0) {
      cancel(id);
      on_done();
      return;
    }
    auto remaining = std::make_shared<int>(ticks);
    schedule_impl(
        id, std::chrono::duration_cast<std::chrono::milliseconds>(interval), ticks,
        [remaining, on_tick, on_done]() {
          --*remaining;
          on_tick(*remaining);
          if (*remaining == 0) {
            on_done();
          }
        });
  }

  /// Cancel the timer named @a id, if any.
  void cancel(std::string const& id) {
    std::shared_ptr<deadline_timer> timer;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      auto i = state_->entries.find(id);
      if (i == state_->entries.end()) {
        return;
      }
      timer = std::move(i->second.timer);
      state_->entries.erase(i);
    }
    MH_LOG(trace) << "timer_registry - cancel " << id;
    if (timer) {
      timer->cancel();
    }
  }

  /// Cancel all the timers, no action runs after this function returns.
  void cancel_all() {
    entries_type entries;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      entries.swap(state_->entries);
    }
    for (auto& i : entries) {
      if (i.second.timer) {
        i.second.timer->cancel();
      }
    }
  }

  /// Cancel all the timers and reject any further schedule() calls.
  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      state_->shutdown = true;
    }
    cancel_all();
  }

  /// Return the names of the live timers.
  std::vector<std::string> active_ids() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(state_->mu);
    for (auto const& i : state_->entries) {
      ids.push_back(i.first);
    }
    return ids;
  }

  /// Return true if there is a live timer named @a id.
  bool is_active(std::string const& id) const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->entries.find(id) != state_->entries.end();
  }

private:
  /// Number of fires for timers that repeat until cancelled.
  static int constexpr forever = -1;

  struct entry {
    std::shared_ptr<deadline_timer> timer;
    std::chrono::milliseconds interval;
    int remaining_fires;
    action_type action;
    std::uint64_t generation;
  };
  using entries_type = std::map<std::string, entry>;

  struct shared_state {
    explicit shared_state(completion_queue_type& q)
        : queue(q)
        , mu()
        , entries()
        , generation(0)
        , shutdown(false) {
    }

    completion_queue_type& queue;
    mutable std::mutex mu;
    entries_type entries;
    // Identifies each armed timer, a timer whose generation no longer matches its entry is stale.
    std::uint64_t generation;
    bool shutdown;
  };

  void schedule_impl(std::string const& id, std::chrono::milliseconds interval, int fires, action_type action) {
    std::shared_ptr<deadline_timer> previous;
    std::uint64_t generation;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      if (state_->shutdown) {
        MH_LOG(notice) << "timer_registry - schedule(" << id << ") ignored after shutdown";
        return;
      }
      generation = ++state_->generation;
      auto& e = state_->entries[id];
      previous = std::move(e.timer);
      e = entry{std::shared_ptr<deadline_timer>(), interval, fires, std::move(action), generation};
    }
    if (previous) {
      MH_LOG(trace) << "timer_registry - replace " << id;
      previous->cancel();
    }
    arm(state_, id, generation, interval);
  }

  /// Create the alarm for the entry @a id, the lock must not be held, the mocked queues may fire immediately.
  static void
  arm(std::shared_ptr<shared_state> const& state, std::string const& id, std::uint64_t generation,
      std::chrono::milliseconds interval) {
    std::weak_ptr<shared_state> w(state);
    auto timer = state->queue.make_relative_timer(
        interval, "timer_registry/" + id,
        [w, id, generation](deadline_timer const&, bool ok) { on_timer(w, id, generation, ok); });
    std::lock_guard<std::mutex> lock(state->mu);
    auto i = state->entries.find(id);
    if (i != state->entries.end() and i->second.generation == generation) {
      i->second.timer = std::move(timer);
      return;
    }
    // ... the entry was cancelled or replaced while we were not holding the lock ...
    timer->cancel();
  }

  static void on_timer(std::weak_ptr<shared_state> w, std::string const& id, std::uint64_t generation, bool ok) {
    if (not ok) {
      return;
    }
    auto state = w.lock();
    if (not state) {
      return;
    }
    action_type action;
    bool rearm = false;
    std::uint64_t next_generation = 0;
    std::chrono::milliseconds interval(0);
    {
      std::lock_guard<std::mutex> lock(state->mu);
      auto i = state->entries.find(id);
      if (i == state->entries.end() or i->second.generation != generation) {
        MH_LOG(trace) << "timer_registry - stale timer " << id << " ignored";
        return;
      }
      auto& e = i->second;
      action = e.action;
      if (e.remaining_fires != forever) {
        --e.remaining_fires;
      }
      if (e.remaining_fires == 0) {
        state->entries.erase(i);
      } else {
        next_generation = ++state->generation;
        e.generation = next_generation;
        e.timer.reset();
        interval = e.interval;
        rearm = true;
      }
    }
    // ... re-arm before running the action, so the action can cancel or replace its own timer ...
    if (rearm) {
      arm(state, id, next_generation, interval);
    }
    try {
      action();
    } catch (std::exception const& ex) {
      MH_LOG(error) << "timer_registry - action for " << id << " raised: " << ex.what();
    }
  }

private:
  std::shared_ptr<shared_state> state_;
};

template <typename completion_queue_type>
int constexpr timer_registry<completion_queue_type>::forever;

} // namespace detail
} // namespace mh

#endif // mh_detail_timer_registry_hpp
