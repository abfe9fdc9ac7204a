#pragma once

#include <boost/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace duochat::chat {

enum class EventKind { CreateRoom, JoinRoom, Typing, Message, Seen, Unknown };

// One inbound frame: { "type": string, "payload": object }.
struct Envelope {
    EventKind kind = EventKind::Unknown;
    std::string type;
    boost::json::object payload;

    // String field of the payload; empty if absent or not a string.
    std::optional<std::string> string_field(std::string_view key) const;
    std::optional<bool> bool_field(std::string_view key) const;
};

EventKind kind_of(std::string_view type) noexcept;

// Empty when the frame is not a JSON object.
std::optional<Envelope> parse_envelope(std::string_view text);

std::string make_envelope(std::string_view type, boost::json::object payload);

// Server-originated envelopes.
namespace outbound {

std::string room_created(const std::string& room);
std::string joined(const std::string& room);
std::string user_count(std::size_t count, std::size_t max);
std::string error(std::string_view message);
std::string typing(bool typing);
std::string message(const std::string& id, const std::string& text);
std::string delivered(const std::string& id);
std::string seen(const std::string& id);

} // namespace outbound

namespace errors {

inline constexpr std::string_view kInvalidJson = "Invalid JSON format";
inline constexpr std::string_view kRoomNotFound = "Room does not exist";
inline constexpr std::string_view kRoomFull = "Room is full";
inline constexpr std::string_view kCreateFailed = "Unable to create room";

} // namespace errors

} // namespace duochat::chat
