#include "mh/log_severity.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {
char const* const names[] = {
    "trace", "debug", "info", "notice", "warning", "error", "critical", "alert", "fatal",
};
} // anonymous namespace

namespace mh {

std::ostream& operator<<(std::ostream& os, severity x) {
  return os << names[int(x)];
}

severity parse_severity(std::string const& name) {
  for (int i = int(severity::LOWEST); i <= int(severity::HIGHEST); ++i) {
    if (name == names[i]) {
      return severity(i);
    }
  }
  std::ostringstream os;
  os << "unknown log severity <" << name << ">";
  throw std::invalid_argument(os.str());
}

} // namespace mh
