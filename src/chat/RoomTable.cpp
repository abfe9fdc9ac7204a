#include "chat/RoomTable.h"

#include <stdexcept>
#include <utility>

namespace duochat::chat {

RoomTable::RoomTable(std::size_t capacity)
    : RoomTable(capacity, CodeSource{}) {}

RoomTable::RoomTable(std::size_t capacity, CodeSource codes)
    : capacity_(capacity),
      codes_(std::move(codes)) {
    if (capacity_ == 0) throw std::invalid_argument("room capacity must be at least 1");
    if (!codes_) {
        codes_ = [this] { return generator_.next(); };
    }
}

std::optional<RoomId> RoomTable::create_room(ConnectionId creator) {
    auto code = reserve_code();
    if (!code) return std::nullopt;

    rooms_[*code].insert(creator);
    return code;
}

std::optional<RoomId> RoomTable::reserve_code() {
    for (int attempt = 0; attempt < kMaxRandomAttempts; ++attempt) {
        RoomId code = codes_();
        if (!code.empty() && rooms_.find(code) == rooms_.end()) return code;
    }

    // Crowded table: walk the code space from a random start.
    const std::uint32_t start = generator_.next_offset();
    for (std::uint32_t i = 0; i < RoomCodeGenerator::kCodeSpace; ++i) {
        const std::uint32_t n = RoomCodeGenerator::kMinCode + (start + i) % RoomCodeGenerator::kCodeSpace;
        RoomId code = RoomCodeGenerator::format(n);
        if (rooms_.find(code) == rooms_.end()) return code;
    }
    return std::nullopt;
}

JoinResult RoomTable::join(const RoomId& room, ConnectionId conn) {
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return JoinResult::RoomNotFound;
    if (it->second.size() >= capacity_) return JoinResult::RoomFull;

    it->second.insert(conn);
    return JoinResult::Ok;
}

LeaveResult RoomTable::leave(const RoomId& room, ConnectionId conn) {
    LeaveResult out;
    auto it = rooms_.find(room);
    if (it == rooms_.end()) {
        out.room_deleted = true;
        return out;
    }

    it->second.erase(conn);
    if (it->second.empty()) {
        rooms_.erase(it);
        out.room_deleted = true;
        return out;
    }

    out.remaining = it->second.size();
    return out;
}

std::vector<ConnectionId> RoomTable::members_of(const RoomId& room) const {
    std::vector<ConnectionId> out;
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return out;

    out.reserve(it->second.size());
    for (ConnectionId c : it->second) out.push_back(c);
    return out;
}

bool RoomTable::contains(const RoomId& room) const {
    return rooms_.find(room) != rooms_.end();
}

std::size_t RoomTable::room_size(const RoomId& room) const {
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return 0;
    return it->second.size();
}

const char* to_string(JoinResult r) noexcept {
    switch (r) {
        case JoinResult::Ok:           return "ok";
        case JoinResult::RoomNotFound: return "room-not-found";
        case JoinResult::RoomFull:     return "room-full";
    }
    return "unknown";
}

} // namespace duochat::chat
