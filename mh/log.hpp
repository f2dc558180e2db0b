#ifndef mh_log_hpp
#define mh_log_hpp
/**
 * @file
 *
 * Define macros, types, and functions for logging in Mesh-Host.
 */
#include <mh/log_severity.hpp>
#include <mh/log_sink.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <sstream>

/// Concatenate two pre-processor tokens.
#define MH_PP_CAT(a, b) a##b

/**
 * Create a unique, or mostly-likely unique identifier.
 *
 * MH_LOG() needs an identifier for the logger, which must not collide with any variable the caller may want to log,
 * so it depends on the line number.
 */
#define MH_LOGGER_IDENTIFIER MH_PP_CAT(mh_log_, __LINE__)

/**
 * The main entry point for Mesh-Host logging facilities.
 *
 * Typically this used only in tests, applications should use MH_LOG().
 */
#define MH_LOG_I(level, sink)                                                                                          \
  for (auto MH_LOGGER_IDENTIFIER = mh::logger<mh::level_compile_time_disabled(mh::severity::level)>(                   \
           mh::severity::level, __func__, __FILE__, __LINE__, sink);                                                   \
       (bool)MH_LOGGER_IDENTIFIER; MH_LOGGER_IDENTIFIER.write_to(sink))                                                \
  MH_LOGGER_IDENTIFIER.get()

/**
 * Declare a logger named @a name.
 */
#define MH_LOGGER_DECL(level, sink, name)                                                                              \
  mh::logger<mh::level_compile_time_disabled(mh::severity::level)> name(                                               \
      mh::severity::level, __func__, __FILE__, __LINE__, sink)

#ifndef MH_LOG
#define MH_LOG(level) MH_LOG_I(level, mh::log::instance())
#endif // MH_LOG

/**
 * The main namespace for the Mesh-Host library.
 */
namespace mh {
namespace detail {
/**
 * Consume any iostream expression without effect.
 *
 * Returned by log lines disabled at compile-time, so trace messages in the election hot paths cost nothing.
 */
struct null_stream {
  template <typename T>
  null_stream& operator<<(T const&) {
    return *this;
  }

  null_stream& operator<<(char const*) {
    return *this;
  }
};
} // namespace detail

/**
 * The logging framework core.
 *
 * One wants to log from any point in the code, but one also wants to decouple the code from the log sinks and the
 * configuration of the logger, and inject a different logger in tests.  A logger template parameter on every class
 * would make the dependencies obvious, but it complicates every interface.
 *
 * We compromise by using a log class which is a singleton.
 */
class log {
public:
  /// Normally use @c mh::log::instance(), this is useful in testing.
  log()
      : min_severity_(severity::LOWEST)
      , sinks_()
      , next_token_(0) {
  }

  /// Return the singleton instance
  static log& instance();

  /**
   * Add a new sink to the core.
   *
   * @returns a token to remove this sink with remove_sink().
   */
  long add_sink(std::shared_ptr<log_sink> sink);

  /// Remove a single sink, unknown tokens are ignored.
  void remove_sink(long token);

  /// Remove all the current log sinks from the core.
  void clear_sinks();

  /// Write a new log message
  void write(severity sev, std::string&& msg);

  /// Set the minimum severity for the following messages, notice that each sink can implement its own filtering.
  void min_severity(severity sev) {
    std::lock_guard<std::mutex> guard(mu_);
    min_severity_ = sev;
  }

  /// Return the minimum run-time severity.
  severity min_severity() const {
    std::lock_guard<std::mutex> guard(mu_);
    return min_severity_;
  }

private:
  /// A mutex to protect access to the shared state
  mutable std::mutex mu_;
  /// The minimum run-time severity
  severity min_severity_;
  /// The sinks, indexed by the token returned from add_sink()
  std::map<long, std::shared_ptr<log_sink>> sinks_;
  long next_token_;

  /// The single instance used in the program ...
  static std::unique_ptr<log> singleton_;
};

/**
 * A compile-time disabled log message container, all streaming operations are no-ops.
 *
 * @tparam disabled if true, use a compile-time-disabled logger, which does not log anything.
 */
template <bool disabled>
class logger {
public:
  logger(severity s, char const* func, char const* file, int lineno, log& sink) {
  }

  explicit operator bool() const {
    return false;
  }

  /// Get the mh::detail::null_stream to consume the iostream expression.
  detail::null_stream& get() {
    return os;
  }

  void write_to(log& sink) {
  }

private:
  detail::null_stream os;
};

/**
 * A simple log message container.
 *
 * This specialization creates a message container that logs to a std::ostringstream and then sends that stream to
 * the configured sinks, if any.
 */
template <>
class logger<false> {
public:
  logger(severity s, char const* func, char const* file, int lineno, log& sink);

  explicit operator bool() const {
    return not closed;
  }

  /// Get the std::ostream where the message will be formatted.
  std::ostream& get() {
    return os;
  }

  /// Save the message to the log sink
  void write_to(mh::log& sink);

private:
  std::ostringstream os;
  severity sev;
  std::string function;
  std::string filename;
  int lineno;
  bool closed;
};

/**
 * Determine if a given severity level is disabled at compile-time.
 *
 * @param lvl the severity level to check.
 * @returns true if @a lvl is disabled at compile-time.
 */
bool constexpr level_compile_time_disabled(severity lvl) {
  return lvl < mh::severity::MH_MIN_SEVERITY;
}
} // namespace mh

#endif // mh_log_hpp
