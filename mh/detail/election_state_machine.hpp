#ifndef mh_detail_election_state_machine_hpp
#define mh_detail_election_state_machine_hpp

#include <mh/election_state.hpp>

#include <mutex>

namespace mh {
namespace detail {

/**
 * Implement the state machine for the host election.
 *
 * The idea is to have a small place to look at valid vs. invalid transitions and to centralize debug logging.  Once
 * closed (the coordinator shut down) the machine is back in @c idle and rejects every change.
 */
class election_state_machine {
public:
  election_state_machine();

  /// Return the current state.
  election_state current() const;

  /// Return true if close() was called.
  bool closed() const;

  /// Propose a state change, returns true if accepted.
  bool change_state(char const* where, election_state nstate);

  /// Propose a state change, returns true and calls @a functor if accepted.
  template <typename Functor>
  bool change_state_action(char const* where, election_state nstate, Functor& functor) {
    std::lock_guard<std::mutex> lock(mu_);
    if (not check_change_state(where, nstate)) {
      return false;
    }
    functor();
    state_ = nstate;
    return true;
  }

  /// Return to @c idle and reject all further changes, returns false if already closed.
  bool close(char const* where);

private:
  /// Checks if a state transition is acceptable, and logs the result.
  bool check_change_state(char const* where, election_state nstate) const;

private:
  mutable std::mutex mu_;
  election_state state_;
  bool closed_;
};

} // namespace detail
} // namespace mh

#endif // mh_detail_election_state_machine_hpp
