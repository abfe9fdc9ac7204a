#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace duochat::chat {

// Same value space as networking::ClientId.
using ConnectionId = std::uint64_t;
using RoomId = std::string;

static constexpr std::size_t kDefaultRoomCapacity = 2;

} // namespace duochat::chat
