#ifndef mh_game_message_hpp
#define mh_game_message_hpp

#include <cstddef>
#include <iosfwd>
#include <string>

namespace mh {

/**
 * A message exchanged between the peers of a game room.
 *
 * The wire format is:
 *
 * @code
 * [1 byte]  type length (0..255)      [type bytes]
 * [1 byte]  room id length (0..255)   [room id bytes]
 * [1 byte]  sender length (0..255)    [sender bytes]
 * [2 bytes] payload length, little-endian (0..65535)
 * [payload bytes]
 * @endcode
 *
 * The strings are encoded as raw bytes, longer than 255 bytes are silently truncated to their first 255 bytes.
 */
struct game_message {
  std::string type;
  std::string room_id;
  std::string sender;
  std::string payload;
};

/// The longest string field that fits in the wire format.
std::size_t constexpr max_field_length = 255;
/// The longest payload that fits in the wire format.
std::size_t constexpr max_payload_length = 65535;

/**
 * Encode a message in the wire format.
 *
 * @throws std::invalid_argument if the payload is longer than max_payload_length.
 */
std::string encode_game_message(game_message const& msg);

/**
 * Decode a message from the wire format.
 *
 * Trailing bytes after the payload are ignored.
 *
 * @throws mh::decode_error if the buffer ends before a declared field.
 */
game_message decode_game_message(std::string const& bytes);

bool operator==(game_message const& lhs, game_message const& rhs);
inline bool operator!=(game_message const& lhs, game_message const& rhs) {
  return not(lhs == rhs);
}

/// Streaming operator, the payload is summarized by its size.
std::ostream& operator<<(std::ostream& os, game_message const& x);

} // namespace mh

#endif // mh_game_message_hpp
