#include "mh/election_messages.hpp"
#include <mh/errors.hpp>

#include <initializer_list>

namespace mh {
namespace message_type {
char const election_start[] = "election_start";
char const host_announcement[] = "host_announcement";
char const host_heartbeat[] = "host_heartbeat";
char const peer_heartbeat[] = "peer_heartbeat";
} // namespace message_type

bool is_election_message(std::string const& type) {
  for (auto const* t : {message_type::election_start, message_type::host_announcement, message_type::host_heartbeat,
                        message_type::peer_heartbeat}) {
    if (type == t) {
      return true;
    }
  }
  return false;
}

wire::ElectionStart
make_election_start(std::string const& initiator, std::set<std::string> const& candidates, std::int64_t round) {
  wire::ElectionStart msg;
  msg.set_initiator(initiator);
  for (auto const& c : candidates) {
    msg.add_candidates(c);
  }
  msg.set_round(round);
  return msg;
}

wire::HostAnnouncement make_host_announcement(std::string const& host, std::int64_t round) {
  wire::HostAnnouncement msg;
  msg.set_host(host);
  msg.set_round(round);
  return msg;
}

wire::Heartbeat make_heartbeat(
    std::string const& peer_id, std::string const& device_name, wire::Role role,
    std::chrono::system_clock::time_point sent_at) {
  using namespace std::chrono;
  wire::Heartbeat msg;
  msg.set_peer_id(peer_id);
  msg.set_device_name(device_name);
  msg.set_role(role);
  msg.set_sent_at_ms(duration_cast<milliseconds>(sent_at.time_since_epoch()).count());
  return msg;
}

game_message wrap_election_message(
    std::string const& type, std::string const& room_id, std::string const& device_name,
    google::protobuf::Message const& payload) {
  if (not is_election_message(type)) {
    detail::raise<std::invalid_argument>("wrap_election_message() - <", type, "> is not an election message type");
  }
  game_message msg;
  msg.type = type;
  msg.room_id = room_id;
  msg.sender = device_name;
  if (not payload.SerializeToString(&msg.payload)) {
    detail::raise<std::invalid_argument>("wrap_election_message() - cannot serialize the ", type, " payload");
  }
  return msg;
}

void parse_election_payload(game_message const& msg, google::protobuf::Message& payload) {
  if (not payload.ParseFromString(msg.payload)) {
    detail::raise<decode_error>(
        "parse_election_payload() - invalid ", payload.GetTypeName(), " in <", msg.type, "> message from ",
        msg.sender);
  }
}

} // namespace mh
