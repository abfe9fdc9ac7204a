#include "chat/ConnectionRegistry.h"

#include <utility>

namespace duochat::chat {

bool ConnectionRegistry::assign(ConnectionId conn, const RoomId& room) {
    return entries_.emplace(conn, room).second;
}

std::optional<RoomId> ConnectionRegistry::room_of(ConnectionId conn) const {
    auto it = entries_.find(conn);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool ConnectionRegistry::has_room(ConnectionId conn) const {
    return entries_.find(conn) != entries_.end();
}

std::optional<RoomId> ConnectionRegistry::remove(ConnectionId conn) {
    auto it = entries_.find(conn);
    if (it == entries_.end()) return std::nullopt;

    RoomId room = std::move(it->second);
    entries_.erase(it);
    return room;
}

} // namespace duochat::chat
