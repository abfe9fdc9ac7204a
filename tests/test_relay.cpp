#include "chat/Relay.h"

#include <boost/json.hpp>

#include <atomic>
#include <cassert>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace json = boost::json;

namespace duochat::chat {

// Collects every frame the relay sends, per recipient.
class Inbox {
public:
    Relay::SendFn sender() {
        return [this](ConnectionId dst, const std::string& frame) {
            std::lock_guard<std::mutex> lk(mu_);
            frames_[dst].push_back(json::parse(frame).as_object());
        };
    }

    std::vector<json::object> take(ConnectionId c) {
        std::lock_guard<std::mutex> lk(mu_);
        auto out = std::move(frames_[c]);
        frames_[c].clear();
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lk(mu_);
        frames_.clear();
    }

private:
    std::mutex mu_;
    std::map<ConnectionId, std::vector<json::object>> frames_;
};

static std::string type_of(const json::object& env) {
    return json::value_to<std::string>(env.at("type"));
}

static const json::object& payload_of(const json::object& env) {
    return env.at("payload").as_object();
}

static std::string str(const json::object& payload, const char* key) {
    return json::value_to<std::string>(payload.at(key));
}

static bool is_user_count(const json::object& env, std::int64_t count, std::int64_t max) {
    return type_of(env) == "user-count" &&
           payload_of(env).at("count").as_int64() == count &&
           payload_of(env).at("max").as_int64() == max;
}

static bool is_error(const json::object& env, const std::string& message) {
    return type_of(env) == "error" && str(payload_of(env), "message") == message;
}

static const std::string kRoom = "4821";
static constexpr ConnectionId A = 1, B = 2, C = 3;

static RoomTable::CodeSource fixed_code() {
    return [] { return kRoom; };
}

// Test 1: Scenarios 1-6 end to end
void test_scenarios() {
    std::cout << "\n=== Test 1: Room Lifecycle Scenarios ===" << std::endl;
    Inbox inbox;
    Relay relay(inbox.sender(), 2, fixed_code());
    relay.on_connect(A);
    relay.on_connect(B);
    relay.on_connect(C);

    // 1. A creates a room
    relay.on_message(A, R"({"type":"create-room"})");
    auto a = inbox.take(A);
    assert(a.size() == 2);
    assert(type_of(a[0]) == "room-created" && str(payload_of(a[0]), "room") == kRoom);
    assert(is_user_count(a[1], 1, 2));

    // 2. B joins
    relay.on_message(B, R"({"type":"join-room","payload":{"room":"4821"}})");
    auto b = inbox.take(B);
    assert(b.size() == 2);
    assert(type_of(b[0]) == "joined" && str(payload_of(b[0]), "room") == kRoom);
    assert(is_user_count(b[1], 2, 2));
    a = inbox.take(A);
    assert(a.size() == 1 && is_user_count(a[0], 2, 2));

    // 3. C is turned away
    relay.on_message(C, R"({"type":"join-room","payload":{"room":"4821"}})");
    auto c = inbox.take(C);
    assert(c.size() == 1 && is_error(c[0], "Room is full"));
    assert(inbox.take(A).empty() && inbox.take(B).empty());
    assert(relay.members_of(kRoom).size() == 2);
    assert(!relay.room_of(C));

    // 4. A sends a message
    relay.on_message(A, R"({"type":"message","payload":{"id":"m1","text":"hi"}})");
    b = inbox.take(B);
    assert(b.size() == 1 && type_of(b[0]) == "message");
    assert(str(payload_of(b[0]), "id") == "m1" && str(payload_of(b[0]), "message") == "hi");
    a = inbox.take(A);
    assert(a.size() == 1 && type_of(a[0]) == "delivered" && str(payload_of(a[0]), "id") == "m1");
    assert(inbox.take(C).empty());

    // 5. B leaves
    relay.on_disconnect(B);
    a = inbox.take(A);
    assert(a.size() == 1 && is_user_count(a[0], 1, 2));
    assert(relay.members_of(kRoom) == std::vector<ConnectionId>{A});

    // 6. A leaves; the room is gone
    relay.on_disconnect(A);
    assert(relay.room_count() == 0);
    assert(relay.members_of(kRoom).empty());
    relay.on_message(C, R"({"type":"join-room","payload":{"room":"4821"}})");
    c = inbox.take(C);
    assert(c.size() == 1 && is_error(c[0], "Room does not exist"));
    std::cout << "✓ Test 1 PASSED" << std::endl;
}

// Test 2: typing skips the sender, seen includes it
void test_typing_and_seen() {
    std::cout << "\n=== Test 2: Typing and Seen ===" << std::endl;
    Inbox inbox;
    Relay relay(inbox.sender(), 2, fixed_code());
    relay.on_message(A, R"({"type":"create-room"})");
    relay.on_message(B, R"({"type":"join-room","payload":{"room":"4821"}})");
    inbox.clear();

    relay.on_message(A, R"({"type":"typing","payload":{"typing":true}})");
    assert(inbox.take(A).empty());
    auto b = inbox.take(B);
    assert(b.size() == 1 && type_of(b[0]) == "typing" && payload_of(b[0]).at("typing").as_bool());

    relay.on_message(B, R"({"type":"seen","payload":{"id":"m1"}})");
    for (ConnectionId c : {A, B}) {
        auto got = inbox.take(c);
        assert(got.size() == 1 && type_of(got[0]) == "seen" && str(payload_of(got[0]), "id") == "m1");
    }
    std::cout << "✓ Test 2 PASSED" << std::endl;
}

// Test 3: malformed frames get an error, the connection keeps working
void test_malformed_json() {
    std::cout << "\n=== Test 3: Malformed JSON ===" << std::endl;
    Inbox inbox;
    Relay relay(inbox.sender(), 2, fixed_code());

    relay.on_message(A, "{not json");
    auto a = inbox.take(A);
    assert(a.size() == 1 && is_error(a[0], "Invalid JSON format"));

    relay.on_message(A, "[]");
    a = inbox.take(A);
    assert(a.size() == 1 && is_error(a[0], "Invalid JSON format"));

    relay.on_message(A, R"({"type":"create-room"})");
    a = inbox.take(A);
    assert(a.size() == 2 && type_of(a[0]) == "room-created");
    std::cout << "✓ Test 3 PASSED" << std::endl;
}

// Test 4: protocol violations are dropped without a reply
void test_silent_drops() {
    std::cout << "\n=== Test 4: Silent Drops ===" << std::endl;
    Inbox inbox;
    Relay relay(inbox.sender(), 2, fixed_code());

    // room-scoped events before joining
    relay.on_message(A, R"({"type":"typing","payload":{"typing":true}})");
    relay.on_message(A, R"({"type":"message","payload":{"id":"m1","text":"hi"}})");
    relay.on_message(A, R"({"type":"seen","payload":{"id":"m1"}})");
    relay.on_message(A, R"({"type":"what"})");
    assert(inbox.take(A).empty());

    relay.on_message(A, R"({"type":"create-room"})");
    relay.on_message(B, R"({"type":"join-room","payload":{"room":"4821"}})");
    inbox.clear();

    // already in a room: create and join are ignored
    relay.on_message(A, R"({"type":"create-room"})");
    relay.on_message(B, R"({"type":"join-room","payload":{"room":"4821"}})");
    assert(inbox.take(A).empty() && inbox.take(B).empty());
    assert(relay.room_count() == 1);

    // incomplete payloads
    relay.on_message(A, R"({"type":"message","payload":{"id":"m1"}})");
    relay.on_message(A, R"({"type":"message","payload":{"id":"","text":"hi"}})");
    relay.on_message(A, R"({"type":"message","payload":{"id":"m1","text":""}})");
    relay.on_message(A, R"({"type":"seen","payload":{}})");
    relay.on_message(A, R"({"type":"typing"})");
    assert(inbox.take(A).empty() && inbox.take(B).empty());
    std::cout << "✓ Test 4 PASSED" << std::endl;
}

// Test 5: join without a room code reports a missing room
void test_join_without_code() {
    std::cout << "\n=== Test 5: Join Without Code ===" << std::endl;
    Inbox inbox;
    Relay relay(inbox.sender(), 2, fixed_code());

    relay.on_message(C, R"({"type":"join-room"})");
    relay.on_message(C, R"({"type":"join-room","payload":{"room":4821}})");
    auto c = inbox.take(C);
    assert(c.size() == 2);
    assert(is_error(c[0], "Room does not exist") && is_error(c[1], "Room does not exist"));
    assert(!relay.room_of(C));
    std::cout << "✓ Test 5 PASSED" << std::endl;
}

// Test 6: traffic stays inside its room
void test_room_isolation() {
    std::cout << "\n=== Test 6: Room Isolation ===" << std::endl;
    Inbox inbox;
    Relay relay(inbox.sender());
    const ConnectionId D = 4;

    relay.on_message(A, R"({"type":"create-room"})");
    const std::string r1 = str(payload_of(inbox.take(A).at(0)), "room");
    relay.on_message(C, R"({"type":"create-room"})");
    const std::string r2 = str(payload_of(inbox.take(C).at(0)), "room");
    assert(r1 != r2);

    relay.on_message(B, R"({"type":"join-room","payload":{"room":")" + r1 + R"("}})");
    relay.on_message(D, R"({"type":"join-room","payload":{"room":")" + r2 + R"("}})");
    inbox.clear();

    relay.on_message(A, R"({"type":"message","payload":{"id":"x","text":"for B"}})");
    relay.on_message(A, R"({"type":"seen","payload":{"id":"x"}})");
    assert(inbox.take(C).empty() && inbox.take(D).empty());
    assert(inbox.take(B).size() == 2);
    std::cout << "✓ Test 6 PASSED" << std::endl;
}

// Test 7: disconnect of a connection that never joined is a no-op
void test_disconnect_without_room() {
    std::cout << "\n=== Test 7: Disconnect Without Room ===" << std::endl;
    Inbox inbox;
    Relay relay(inbox.sender(), 2, fixed_code());

    relay.on_message(A, R"({"type":"create-room"})");
    inbox.clear();

    relay.on_connect(C);
    relay.on_disconnect(C);
    assert(inbox.take(A).empty());
    assert(relay.members_of(kRoom) == std::vector<ConnectionId>{A});
    std::cout << "✓ Test 7 PASSED" << std::endl;
}

// Test 8: racing joins never overfill a room
void test_concurrent_joins() {
    std::cout << "\n=== Test 8: Concurrent Joins ===" << std::endl;
    Inbox inbox;
    Relay relay(inbox.sender(), 2, fixed_code());
    relay.on_message(A, R"({"type":"create-room"})");

    constexpr int kJoiners = 32;
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kJoiners; ++i) {
        threads.emplace_back([&relay, &go, i] {
            while (!go.load()) std::this_thread::yield();
            relay.on_message(100 + i, R"({"type":"join-room","payload":{"room":"4821"}})");
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    assert(relay.members_of(kRoom).size() == 2);

    int joined = 0, full = 0;
    for (int i = 0; i < kJoiners; ++i) {
        for (const auto& env : inbox.take(100 + i)) {
            if (type_of(env) == "joined") ++joined;
            else if (is_error(env, "Room is full")) ++full;
        }
    }
    assert(joined == 1);
    assert(full == kJoiners - 1);
    std::cout << "✓ Test 8 PASSED" << std::endl;
}

} // namespace duochat::chat

int main() {
    using namespace duochat::chat;

    test_scenarios();
    test_typing_and_seen();
    test_malformed_json();
    test_silent_drops();
    test_join_without_code();
    test_room_isolation();
    test_disconnect_without_room();
    test_concurrent_joins();

    std::cout << "\nAll relay tests passed." << std::endl;
    return 0;
}
