#include "mh/detail/proto_format.hpp"

#include <google/protobuf/text_format.h>
#include <iostream>
#include <string>

namespace mh {
namespace detail {

std::ostream& operator<<(std::ostream& os, print_to_stream const& x) {
  google::protobuf::TextFormat::Printer printer;
  printer.SetSingleLineMode(true);
  // Print and ignore errors, on failure we just get an empty string ...
  std::string formatted;
  (void)printer.PrintToString(x.msg, &formatted);
  // ... single line mode leaves a separator after the last field ...
  auto end = formatted.find_last_not_of(' ');
  formatted.erase(end == std::string::npos ? 0 : end + 1);
  return os << formatted;
}

} // namespace detail
} // namespace mh
