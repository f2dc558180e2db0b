#include "mh/mesh_transport.hpp"

#include <iostream>

namespace mh {

std::ostream& operator<<(std::ostream& os, message_priority x) {
  char const* names[] = {"low", "normal", "high"};
  return os << names[int(x)];
}

} // namespace mh
