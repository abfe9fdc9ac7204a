#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "chat/RoomCodeGenerator.hpp"
#include "chat/Types.hpp"

namespace duochat::chat {

enum class JoinResult { Ok, RoomNotFound, RoomFull };

struct LeaveResult {
    bool room_deleted = false;
    std::size_t remaining = 0;
};

// Owns every open room and its member set. A room exists only while it
// has at least one member.
//
// Not synchronized: the caller serializes access (see Relay).
class RoomTable {
public:
    using CodeSource = std::function<std::string()>;

    static constexpr int kMaxRandomAttempts = 32;

    explicit RoomTable(std::size_t capacity = kDefaultRoomCapacity);

    // Tests inject a deterministic code source.
    RoomTable(std::size_t capacity, CodeSource codes);

    RoomTable(const RoomTable&) = delete;
    RoomTable& operator=(const RoomTable&) = delete;

    // Reserves a free code and opens a room with `creator` as its only
    // member. Empty when every code in the code space is live.
    std::optional<RoomId> create_room(ConnectionId creator);

    JoinResult join(const RoomId& room, ConnectionId conn);

    LeaveResult leave(const RoomId& room, ConnectionId conn);

    // Empty for a room that is not open.
    std::vector<ConnectionId> members_of(const RoomId& room) const;

    bool contains(const RoomId& room) const;
    std::size_t room_size(const RoomId& room) const;
    std::size_t room_count() const noexcept { return rooms_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::optional<RoomId> reserve_code();

    std::size_t capacity_;
    RoomCodeGenerator generator_;
    CodeSource codes_;
    std::unordered_map<RoomId, std::unordered_set<ConnectionId>> rooms_;
};

const char* to_string(JoinResult r) noexcept;

} // namespace duochat::chat
