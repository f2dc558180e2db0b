#ifndef mh_log_severity_hpp
#define mh_log_severity_hpp
/**
 * @file
 *
 * Define the log severity values and some macros associated with them.
 */

#include <iosfwd>
#include <string>

#ifndef MH_MIN_SEVERITY
/**
 * All log messages below this level are disabled at compile time.
 *
 * Mesh-Host disables some messages at compile-time, reducing them to very cheap no-op's that the optimizer should be
 * able to eliminate.  Developers can write lots of logging to debug election problems and still run efficiently on a
 * device.
 */
#define MH_MIN_SEVERITY info
#endif // MH_MIN_SEVERITY

namespace mh {
/**
 * Define the severity levels for Mesh-Host logging.
 *
 * These are modelled after the severity level in syslog(1) and many derived tools.
 */
enum class severity {
  /// Use this level for messages that indicate the code is entering and leaving functions.
  trace,
  /// Use this level for debug messages that should not be present in production.
  debug,
  /// Informational messages, such as a new host being elected.
  info,
  /// Informational messages, such as unusual, but expected conditions.
  notice,
  /// An indication of problems, such as a broadcast that could not be delivered.
  warning,
  /// An error has been detected.  Do not use for normal conditions, such as peers leaving the mesh.
  error,
  /// The system is in a critical state, such as running out of local resources.
  critical,
  /// The system is at risk of immediate failure.
  alert,
  /// The system is about to crash or terminate.
  fatal,
  /// The highest possible severity level.
  HIGHEST = int(fatal),
  /// The lowest possible severity level.
  LOWEST = int(trace),
  /// The lowest level that is enabled at compile-time.
  LOWEST_ENABLED = int(MH_MIN_SEVERITY),
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, severity x);

/**
 * Convert a severity name, as printed by operator<<, back to the enum.
 *
 * @throws std::invalid_argument if @a name is not a known severity.
 */
severity parse_severity(std::string const& name);

} // namespace mh

#endif // mh_log_severity_hpp
