#ifndef mh_errors_hpp
#define mh_errors_hpp
/**
 * @file
 *
 * Define the exceptions raised by Mesh-Host.
 *
 * None of these errors is fatal: the coordinator logs them and keeps running, possibly without a host until the
 * next election.  The exception is mh::invariant_violation, which indicates a bug.
 */

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace mh {

/// An election could not start, for example because the candidate set was empty.
class election_failed : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The transport could not deliver a message.
class transport_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The transport is not running, or has no connection to the mesh.
class transport_unavailable : public transport_error {
public:
  using transport_error::transport_error;
};

/// All the attempts to broadcast a message failed.
class broadcast_exhausted : public std::runtime_error {
public:
  broadcast_exhausted(std::string const& what, int attempts)
      : std::runtime_error(what)
      , attempts_(attempts) {
  }

  /// The number of attempts made before giving up.
  int attempts() const {
    return attempts_;
  }

private:
  int attempts_;
};

/// A game message could not be decoded, the buffer ended before a declared field.
class decode_error : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/// An internal invariant did not hold, raised by MH_ASSERT_THROW().
class invariant_violation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

namespace detail {
/// Stream each annotation into @a os, in order.
template <typename Stream>
inline void append_annotations(Stream& os) {
}

template <typename Stream, typename H, typename... Tail>
inline void append_annotations(Stream& os, H&& h, Tail&&... t) {
  os << std::forward<H>(h);
  append_annotations(os, std::forward<Tail>(t)...);
}

/**
 * Raise an exception of type @a exception_type with a message formed by the annotations.
 *
 * @code
 * raise<election_failed>("start_election(", self_id, ") - empty candidate set");
 * @endcode
 */
template <typename exception_type, typename... Annotations>
[[noreturn]] void raise(Annotations&&... a) {
  std::ostringstream os;
  append_annotations(os, std::forward<Annotations>(a)...);
  throw exception_type(os.str());
}
} // namespace detail

} // namespace mh

#ifndef MH_ASSERT_THROW
/**
 * Raise mh::invariant_violation if the predicate @a P is false.
 *
 * The message names the predicate and the source location.
 */
#define MH_ASSERT_THROW(P)                                                                                             \
  do {                                                                                                                 \
    if (not(P)) {                                                                                                      \
      mh::detail::raise<mh::invariant_violation>(                                                                     \
          "invariant (", #P, ") violated in ", __func__, " (", __FILE__, ":", __LINE__, ")");                          \
    }                                                                                                                  \
  } while (false)
#endif // MH_ASSERT_THROW

#endif // mh_errors_hpp
