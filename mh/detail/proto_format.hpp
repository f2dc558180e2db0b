/**
 * @file
 *
 * Helpers to log protobuf messages.
 */
#ifndef mh_detail_proto_format_hpp
#define mh_detail_proto_format_hpp

#include <google/protobuf/message.h>
#include <iosfwd>

namespace mh {
namespace detail {

/**
 * Print a protobuf on a std::ostream, in a single line.
 *
 * Uses google::protobuf::TextFormat to print a protobuf.  Typically one would use is as in:
 *
 * @code
 * mh::wire::HostAnnouncement const& proto = ...;
 * MH_LOG(info) << "received " << print_to_stream(proto);
 * @endcode
 */
struct print_to_stream {
  explicit print_to_stream(google::protobuf::Message const& m)
      : msg(m) {
  }

  google::protobuf::Message const& msg;
};

/// Streaming operator
std::ostream& operator<<(std::ostream& os, print_to_stream const& x);

} // namespace detail
} // namespace mh

#endif // mh_detail_proto_format_hpp
