#pragma once

#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace duochat::networking {

using ClientId = std::uint64_t;

struct ListenOptions {
    std::string bind_address = "0.0.0.0";
    unsigned short port = 8080;
    std::size_t max_connections = 1024;
    std::size_t max_message_bytes = 64 * 1024;
};

class WebSocketServer {
public:
    using OnConnect    = std::function<void(ClientId)>;
    using OnDisconnect = std::function<void(ClientId)>;
    using OnMessage    = std::function<void(ClientId, const std::string&)>;

    // Throws boost::system::system_error if the address cannot be bound.
    WebSocketServer(boost::asio::io_context& ioc, const ListenOptions& opts);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Set before start(). Callbacks run on the session's strand, so
    // different clients call in concurrently when ioc runs on several threads.
    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active sessions

    // Queue a text frame. Dropped if the client is gone or closing.
    void send(ClientId client, const std::string& msg);

    // Bound port; resolves port 0 to the one the OS picked.
    unsigned short port() const;
    std::size_t session_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace duochat::networking
