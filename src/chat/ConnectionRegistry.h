#pragma once

#include <optional>
#include <unordered_map>

#include "chat/Types.hpp"

namespace duochat::chat {

// Connection -> room. A connection is assigned once and keeps its room
// until it closes.
class ConnectionRegistry {
public:
    // False if the connection already has a room.
    bool assign(ConnectionId conn, const RoomId& room);

    std::optional<RoomId> room_of(ConnectionId conn) const;
    bool has_room(ConnectionId conn) const;

    // Returns the room the connection was in, if any.
    std::optional<RoomId> remove(ConnectionId conn);

private:
    std::unordered_map<ConnectionId, RoomId> entries_;
};

} // namespace duochat::chat
