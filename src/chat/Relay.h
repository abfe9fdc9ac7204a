#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chat/ConnectionRegistry.h"
#include "chat/Envelope.h"
#include "chat/RoomTable.h"
#include "chat/Types.hpp"

namespace duochat::chat {

// Routes inbound envelopes between the connections of a room.
//
// Handlers may be called concurrently from any number of sessions. One
// mutex guards the room table and the registry together. Outbound frames
// are handed to SendFn before the lock is released so every recipient sees
// events in the order the state changed; SendFn must only enqueue.
class Relay {
public:
    using SendFn = std::function<void(ConnectionId /*dst*/, const std::string& /*frame*/)>;

    explicit Relay(SendFn send, std::size_t capacity = kDefaultRoomCapacity);
    Relay(SendFn send, std::size_t capacity, RoomTable::CodeSource codes);

    Relay(const Relay&) = delete;
    Relay& operator=(const Relay&) = delete;

    void on_connect(ConnectionId conn);
    void on_message(ConnectionId conn, const std::string& text);
    void on_disconnect(ConnectionId conn);

    std::optional<RoomId> room_of(ConnectionId conn) const;
    std::vector<ConnectionId> members_of(const RoomId& room) const;
    std::size_t room_count() const;

private:
    struct Outbound {
        ConnectionId dst;
        std::string frame;
    };
    using Outbox = std::vector<Outbound>;

    void handle_create(ConnectionId conn, Outbox& out);
    void handle_join(ConnectionId conn, const Envelope& env, Outbox& out);
    void handle_typing(ConnectionId conn, const RoomId& room, const Envelope& env, Outbox& out);
    void handle_message(ConnectionId conn, const RoomId& room, const Envelope& env, Outbox& out);
    void handle_seen(const RoomId& room, const Envelope& env, Outbox& out);

    // Queue `frame` for every member of `room`, optionally skipping one.
    void to_room(const RoomId& room, const std::string& frame, Outbox& out,
                 std::optional<ConnectionId> except = std::nullopt) const;
    void user_count_to_room(const RoomId& room, Outbox& out) const;

    void flush(Outbox& out) const;

    SendFn send_;

    mutable std::mutex mu_;
    RoomTable rooms_;
    ConnectionRegistry registry_;
};

} // namespace duochat::chat
