#include "chat/Relay.h"

#include <iostream>
#include <utility>

namespace duochat::chat {

Relay::Relay(SendFn send, std::size_t capacity)
    : send_(std::move(send)),
      rooms_(capacity) {}

Relay::Relay(SendFn send, std::size_t capacity, RoomTable::CodeSource codes)
    : send_(std::move(send)),
      rooms_(capacity, std::move(codes)) {}

void Relay::on_connect(ConnectionId conn) {
    std::cout << "[DuoChat] client " << conn << " connected\n";
}

void Relay::on_message(ConnectionId conn, const std::string& text) {
    Outbox out;

    auto env = parse_envelope(text);
    if (!env) {
        out.push_back({conn, outbound::error(errors::kInvalidJson)});
        flush(out);
        return;
    }

    {
        std::lock_guard<std::mutex> lk(mu_);

        switch (env->kind) {
            case EventKind::CreateRoom:
                handle_create(conn, out);
                break;
            case EventKind::JoinRoom:
                handle_join(conn, *env, out);
                break;
            case EventKind::Typing:
            case EventKind::Message:
            case EventKind::Seen: {
                auto room = registry_.room_of(conn);
                if (!room) break; // not in a room: dropped

                if (env->kind == EventKind::Typing) handle_typing(conn, *room, *env, out);
                else if (env->kind == EventKind::Message) handle_message(conn, *room, *env, out);
                else handle_seen(*room, *env, out);
                break;
            }
            case EventKind::Unknown:
                break;
        }
        flush(out);
    }
}

void Relay::on_disconnect(ConnectionId conn) {
    Outbox out;
    {
        std::lock_guard<std::mutex> lk(mu_);

        auto room = registry_.remove(conn);
        if (room) {
            LeaveResult left = rooms_.leave(*room, conn);
            if (left.room_deleted) {
                std::cout << "[DuoChat] room " << *room << " dismissed\n";
            } else {
                user_count_to_room(*room, out);
            }
        }
        flush(out);
    }

    std::cout << "[DuoChat] client " << conn << " disconnected\n";
}

void Relay::handle_create(ConnectionId conn, Outbox& out) {
    if (registry_.has_room(conn)) return;

    auto room = rooms_.create_room(conn);
    if (!room) {
        std::cerr << "[DuoChat] no free room code for client " << conn << "\n";
        out.push_back({conn, outbound::error(errors::kCreateFailed)});
        return;
    }
    registry_.assign(conn, *room);

    std::cout << "[DuoChat] room " << *room << " created by client " << conn << "\n";
    out.push_back({conn, outbound::room_created(*room)});
    user_count_to_room(*room, out);
}

void Relay::handle_join(ConnectionId conn, const Envelope& env, Outbox& out) {
    if (registry_.has_room(conn)) return;

    auto room = env.string_field("room");
    if (!room || room->empty()) {
        out.push_back({conn, outbound::error(errors::kRoomNotFound)});
        return;
    }

    const JoinResult result = rooms_.join(*room, conn);
    if (result != JoinResult::Ok) {
        std::cout << "[DuoChat] client " << conn << " join " << *room << ": " << to_string(result) << "\n";
    }

    switch (result) {
        case JoinResult::RoomNotFound:
            out.push_back({conn, outbound::error(errors::kRoomNotFound)});
            return;
        case JoinResult::RoomFull:
            out.push_back({conn, outbound::error(errors::kRoomFull)});
            return;
        case JoinResult::Ok:
            break;
    }
    registry_.assign(conn, *room);

    out.push_back({conn, outbound::joined(*room)});
    user_count_to_room(*room, out);
}

void Relay::handle_typing(ConnectionId conn, const RoomId& room, const Envelope& env, Outbox& out) {
    auto typing = env.bool_field("typing");
    if (!typing) return;

    to_room(room, outbound::typing(*typing), out, conn);
}

void Relay::handle_message(ConnectionId conn, const RoomId& room, const Envelope& env, Outbox& out) {
    auto id = env.string_field("id");
    auto text = env.string_field("text");
    if (!id || id->empty() || !text || text->empty()) return;

    // The sender renders its own copy; it only gets the ack.
    to_room(room, outbound::message(*id, *text), out, conn);
    out.push_back({conn, outbound::delivered(*id)});
}

void Relay::handle_seen(const RoomId& room, const Envelope& env, Outbox& out) {
    auto id = env.string_field("id");
    if (!id || id->empty()) return;

    to_room(room, outbound::seen(*id), out);
}

void Relay::to_room(const RoomId& room, const std::string& frame, Outbox& out,
                    std::optional<ConnectionId> except) const {
    for (ConnectionId member : rooms_.members_of(room)) {
        if (except && member == *except) continue;
        out.push_back({member, frame});
    }
}

void Relay::user_count_to_room(const RoomId& room, Outbox& out) const {
    to_room(room, outbound::user_count(rooms_.room_size(room), rooms_.capacity()), out);
}

void Relay::flush(Outbox& out) const {
    if (!send_) return;
    for (const auto& o : out) send_(o.dst, o.frame);
}

std::optional<RoomId> Relay::room_of(ConnectionId conn) const {
    std::lock_guard<std::mutex> lk(mu_);
    return registry_.room_of(conn);
}

std::vector<ConnectionId> Relay::members_of(const RoomId& room) const {
    std::lock_guard<std::mutex> lk(mu_);
    return rooms_.members_of(room);
}

std::size_t Relay::room_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return rooms_.room_count();
}

} // namespace duochat::chat
