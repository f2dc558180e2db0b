#include "mh/game_message.hpp"
#include <mh/errors.hpp>

#include <algorithm>
#include <iostream>

namespace {
void append_field(std::string& out, std::string const& value) {
  auto length = std::min(value.size(), mh::max_field_length);
  out.push_back(static_cast<char>(static_cast<unsigned char>(length)));
  out.append(value, 0, length);
}

/// Consume @a length bytes starting at @a offset, checking the buffer is long enough.
std::string take(std::string const& bytes, std::size_t& offset, std::size_t length, char const* field) {
  if (bytes.size() - offset < length) {
    mh::detail::raise<mh::decode_error>(
        "decode_game_message() - buffer too short for ", field, ", need ", length, " bytes at offset ", offset,
        ", have ", bytes.size() - offset);
  }
  auto value = bytes.substr(offset, length);
  offset += length;
  return value;
}

std::string read_field(std::string const& bytes, std::size_t& offset, char const* field) {
  auto length = static_cast<unsigned char>(take(bytes, offset, 1, field)[0]);
  return take(bytes, offset, length, field);
}
} // anonymous namespace

namespace mh {

std::string encode_game_message(game_message const& msg) {
  if (msg.payload.size() > max_payload_length) {
    detail::raise<std::invalid_argument>(
        "encode_game_message() - payload has ", msg.payload.size(), " bytes, the maximum is ", max_payload_length);
  }
  std::string out;
  out.reserve(3 + msg.type.size() + msg.room_id.size() + msg.sender.size() + 2 + msg.payload.size());
  append_field(out, msg.type);
  append_field(out, msg.room_id);
  append_field(out, msg.sender);
  auto length = msg.payload.size();
  out.push_back(static_cast<char>(length & 0xFF));
  out.push_back(static_cast<char>((length >> 8) & 0xFF));
  out.append(msg.payload);
  return out;
}

game_message decode_game_message(std::string const& bytes) {
  std::size_t offset = 0;
  game_message msg;
  msg.type = read_field(bytes, offset, "type");
  msg.room_id = read_field(bytes, offset, "room_id");
  msg.sender = read_field(bytes, offset, "sender");
  auto length_bytes = take(bytes, offset, 2, "payload length");
  std::size_t length = static_cast<unsigned char>(length_bytes[0]) |
                       (static_cast<std::size_t>(static_cast<unsigned char>(length_bytes[1])) << 8);
  msg.payload = take(bytes, offset, length, "payload");
  return msg;
}

bool operator==(game_message const& lhs, game_message const& rhs) {
  return lhs.type == rhs.type and lhs.room_id == rhs.room_id and lhs.sender == rhs.sender and
         lhs.payload == rhs.payload;
}

std::ostream& operator<<(std::ostream& os, game_message const& x) {
  return os << "{type=" << x.type << ", room_id=" << x.room_id << ", sender=" << x.sender
            << ", payload=" << x.payload.size() << " bytes}";
}

} // namespace mh
