#include "mh/host_election.hpp"

namespace mh {
host_election::~host_election() {
}
} // namespace mh
