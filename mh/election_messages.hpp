#ifndef mh_election_messages_hpp
#define mh_election_messages_hpp
/**
 * @file
 *
 * Build and parse the game messages used by the election.
 *
 * The election uses four dedicated message types, never shared with the application.  Their payloads are the
 * protobuf messages defined in mh/election.proto.  The sender field of the frame carries the device name, the peer
 * ids are in the payloads.
 */

#include <mh/election.pb.h>
#include <mh/game_message.hpp>

#include <chrono>
#include <cstdint>
#include <set>
#include <string>

namespace mh {

/// The game message types reserved for the election.
namespace message_type {
extern char const election_start[];
extern char const host_announcement[];
extern char const host_heartbeat[];
extern char const peer_heartbeat[];
} // namespace message_type

/// Return true if @a type is one of the types reserved for the election.
bool is_election_message(std::string const& type);

/// Create an election_start payload.
wire::ElectionStart
make_election_start(std::string const& initiator, std::set<std::string> const& candidates, std::int64_t round);

/// Create a host_announcement payload.
wire::HostAnnouncement make_host_announcement(std::string const& host, std::int64_t round);

/// Create a heartbeat payload, for both host_heartbeat and peer_heartbeat messages.
wire::Heartbeat make_heartbeat(
    std::string const& peer_id, std::string const& device_name, wire::Role role,
    std::chrono::system_clock::time_point sent_at);

/**
 * Wrap a protobuf payload in a game message.
 *
 * @throws std::invalid_argument if @a type is not an election message type.
 */
game_message wrap_election_message(
    std::string const& type, std::string const& room_id, std::string const& device_name,
    google::protobuf::Message const& payload);

/**
 * Parse the payload of an election message into @a payload.
 *
 * @throws mh::decode_error if the payload is not a valid serialized protobuf.
 */
void parse_election_payload(game_message const& msg, google::protobuf::Message& payload);

} // namespace mh

#endif // mh_election_messages_hpp
