#ifndef mh_detail_broadcast_policies_hpp
#define mh_detail_broadcast_policies_hpp

#include <mh/detail/broadcast_backoff_policy.hpp>
#include <mh/detail/broadcast_retry_policy.hpp>

#include <chrono>
#include <stdexcept>

namespace mh {
namespace detail {
/**
 * Wait one more @a base period after each failure.
 *
 * The first failure waits 1 x base, the second 2 x base, and so on.
 */
class linear_backoff : public broadcast_backoff_policy {
public:
  template <typename Rep, typename Period>
  explicit linear_backoff(std::chrono::duration<Rep, Period> const& base)
      : base_(std::chrono::duration_cast<std::chrono::milliseconds>(base))
      , failures_(0) {
    validate_arguments();
  }

  std::chrono::milliseconds on_failure() override;
  std::unique_ptr<broadcast_backoff_policy> clone() const override;

private:
  void validate_arguments();

private:
  std::chrono::milliseconds base_;
  int failures_;
};

/**
 * Give up after a fixed number of attempts.
 *
 * The count includes the first attempt, with maximum_attempts == 3 the policy allows two retries.
 */
class limited_attempts : public broadcast_retry_policy {
public:
  explicit limited_attempts(int maximum_attempts)
      : maximum_attempts_(maximum_attempts)
      , failures_(0) {
    validate_arguments();
  }

  bool on_failure() override;
  std::unique_ptr<broadcast_retry_policy> clone() const override;

  int maximum_attempts() const {
    return maximum_attempts_;
  }

private:
  void validate_arguments();

private:
  int maximum_attempts_;
  int failures_;
};

/// Give up once a deadline, measured from the creation of the policy (or its clone), expires.
class limited_time : public broadcast_retry_policy {
public:
  template <typename Rep, typename Period>
  explicit limited_time(std::chrono::duration<Rep, Period> const& maximum_duration)
      : duration_(std::chrono::duration_cast<std::chrono::milliseconds>(maximum_duration))
      , deadline_(std::chrono::system_clock::now() + duration_) {
  }

  bool on_failure() override;
  std::unique_ptr<broadcast_retry_policy> clone() const override;

private:
  std::chrono::milliseconds duration_;
  std::chrono::system_clock::time_point deadline_;
};
} // namespace detail
} // namespace mh

#endif // mh_detail_broadcast_policies_hpp
