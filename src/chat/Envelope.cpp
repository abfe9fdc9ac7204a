#include "chat/Envelope.h"

#include <cstdint>
#include <utility>

namespace duochat::chat {

namespace json = boost::json;

std::optional<std::string> Envelope::string_field(std::string_view key) const {
    const json::value* v = payload.if_contains(key);
    if (!v) return std::nullopt;

    const json::string* s = v->if_string();
    if (!s) return std::nullopt;
    return std::string(s->data(), s->size());
}

std::optional<bool> Envelope::bool_field(std::string_view key) const {
    const json::value* v = payload.if_contains(key);
    if (!v) return std::nullopt;

    const bool* b = v->if_bool();
    if (!b) return std::nullopt;
    return *b;
}

EventKind kind_of(std::string_view type) noexcept {
    if (type == "create-room") return EventKind::CreateRoom;
    if (type == "join-room")   return EventKind::JoinRoom;
    if (type == "typing")      return EventKind::Typing;
    if (type == "message")     return EventKind::Message;
    if (type == "seen")        return EventKind::Seen;
    return EventKind::Unknown;
}

std::optional<Envelope> parse_envelope(std::string_view text) {
    json::error_code ec;
    json::value v = json::parse(text, ec);
    if (ec) return std::nullopt;

    json::object* obj = v.if_object();
    if (!obj) return std::nullopt;

    Envelope env;
    if (const json::value* t = obj->if_contains("type")) {
        if (const json::string* s = t->if_string()) {
            env.type.assign(s->data(), s->size());
            env.kind = kind_of(env.type);
        }
    }

    if (json::value* p = obj->if_contains("payload")) {
        if (json::object* po = p->if_object()) {
            env.payload = std::move(*po);
        }
    }
    return env;
}

std::string make_envelope(std::string_view type, json::object payload) {
    json::object out;
    out["type"] = type;
    out["payload"] = std::move(payload);
    return json::serialize(out);
}

namespace outbound {

std::string room_created(const std::string& room) {
    return make_envelope("room-created", json::object{{"room", room}});
}

std::string joined(const std::string& room) {
    return make_envelope("joined", json::object{{"room", room}});
}

std::string user_count(std::size_t count, std::size_t max) {
    return make_envelope("user-count", json::object{
        {"count", static_cast<std::uint64_t>(count)},
        {"max", static_cast<std::uint64_t>(max)}
    });
}

std::string error(std::string_view message) {
    return make_envelope("error", json::object{{"message", message}});
}

std::string typing(bool typing) {
    return make_envelope("typing", json::object{{"typing", typing}});
}

std::string message(const std::string& id, const std::string& text) {
    return make_envelope("message", json::object{{"id", id}, {"message", text}});
}

std::string delivered(const std::string& id) {
    return make_envelope("delivered", json::object{{"id", id}});
}

std::string seen(const std::string& id) {
    return make_envelope("seen", json::object{{"id", id}});
}

} // namespace outbound

} // namespace duochat::chat
