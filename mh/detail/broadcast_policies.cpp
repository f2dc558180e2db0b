#include <mh/detail/broadcast_policies.hpp>

#include <sstream>

namespace mh {
namespace detail {
std::chrono::milliseconds linear_backoff::on_failure() {
  ++failures_;
  return failures_ * base_;
}

std::unique_ptr<broadcast_backoff_policy> linear_backoff::clone() const {
  return std::unique_ptr<broadcast_backoff_policy>(new linear_backoff(base_));
}

void linear_backoff::validate_arguments() {
  if (base_.count() < 0) {
    std::ostringstream os;
    os << "linear_backoff() - base (" << base_.count() << "ms) should be >= 0";
    throw std::invalid_argument(os.str());
  }
}

bool limited_attempts::on_failure() {
  return ++failures_ < maximum_attempts_;
}

std::unique_ptr<broadcast_retry_policy> limited_attempts::clone() const {
  return std::unique_ptr<broadcast_retry_policy>(new limited_attempts(maximum_attempts_));
}

void limited_attempts::validate_arguments() {
  if (maximum_attempts_ <= 0) {
    std::ostringstream os;
    os << "limited_attempts() - maximum_attempts (" << maximum_attempts_ << ") should be > 0";
    throw std::invalid_argument(os.str());
  }
}

bool limited_time::on_failure() {
  return std::chrono::system_clock::now() < deadline_;
}

std::unique_ptr<broadcast_retry_policy> limited_time::clone() const {
  return std::unique_ptr<broadcast_retry_policy>(new limited_time(duration_));
}

} // namespace detail
} // namespace mh
