#include "mh/detail/election_state_machine.hpp"
#include <mh/log.hpp>

namespace mh {
namespace detail {

election_state_machine::election_state_machine()
    : mu_()
    , state_(election_state::idle)
    , closed_(false) {
}

election_state election_state_machine::current() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

bool election_state_machine::closed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

bool election_state_machine::change_state(char const* where, election_state nstate) {
  std::lock_guard<std::mutex> lock(mu_);
  if (not check_change_state(where, nstate)) {
    return false;
  }
  state_ = nstate;
  return true;
}

bool election_state_machine::close(char const* where) {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) {
    return false;
  }
  MH_LOG(trace) << where << " closing state machine in " << state_;
  closed_ = true;
  state_ = election_state::idle;
  return true;
}

bool election_state_machine::check_change_state(char const* where, election_state nstate) const {
  using s = election_state;
  bool valid = false;
  if (not closed_) {
    switch (state_) {
    case s::idle:
      valid = nstate == s::in_progress or nstate == s::completed;
      break;
    case s::in_progress:
      // ... a new round can replace a round in progress ...
      valid = true;
      break;
    case s::completed:
      valid = true;
      break;
    }
  }
  if (not valid) {
    MH_LOG(debug) << where << " rejected state change " << state_ << " -> " << nstate << (closed_ ? " (closed)" : "");
  } else {
    MH_LOG(trace) << where << " state change " << state_ << " -> " << nstate;
  }
  return valid;
}

} // namespace detail
} // namespace mh
