#include "networking/WebSocketServer.h"
#include "chat/Relay.h"
#include "config/ServerConfig.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static constexpr const char* kDefaultConfigPath = "configs/duochat.conf";

static duochat::config::ServerConfig load_config(int argc, char* argv[]) {
    using duochat::config::ServerConfig;

    const bool explicit_path = argc > 1;
    const std::string path = explicit_path ? argv[1] : kDefaultConfigPath;

    ServerConfig cfg;
    if (explicit_path || std::ifstream(path)) {
        std::cout << "[DuoChat] loading config from " << path << "\n";
        cfg = ServerConfig::from_file(path);
    } else {
        std::cout << "[DuoChat] config not found, using defaults\n";
    }
    cfg.apply_env();
    return cfg;
}

int main(int argc, char* argv[]) {
    using namespace duochat;

    try {
        const config::ServerConfig cfg = load_config(argc, argv);

        boost::asio::io_context ioc{cfg.threads};

        networking::ListenOptions opts;
        opts.bind_address = cfg.bind_address;
        opts.port = static_cast<unsigned short>(cfg.port);
        opts.max_connections = static_cast<std::size_t>(cfg.max_connections);
        opts.max_message_bytes = cfg.max_message_bytes;

        networking::WebSocketServer server(ioc, opts);

        chat::Relay relay(
            [&server](chat::ConnectionId dst, const std::string& frame) { server.send(dst, frame); },
            cfg.room_capacity);

        server.set_on_connect([&relay](networking::ClientId id) { relay.on_connect(id); });
        server.set_on_disconnect([&relay](networking::ClientId id) { relay.on_disconnect(id); });
        server.set_on_message([&relay](networking::ClientId id, const std::string& msg) {
            relay.on_message(id, msg);
        });

        server.start();

        // Graceful shutdown on Ctrl+C / SIGTERM
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            std::cout << "\n[DuoChat] shutting down...\n";
            server.stop();
            ioc.stop();
        });

        std::cout << "[DuoChat] WS server running on " << cfg.bind_address << ":" << cfg.port
                  << " (" << cfg.threads << " threads, room capacity " << cfg.room_capacity << ")\n";

        std::vector<std::thread> workers;
        workers.reserve(static_cast<std::size_t>(cfg.threads - 1));
        for (int i = 1; i < cfg.threads; ++i) {
            workers.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();
        for (auto& t : workers) t.join();

        std::cout << "[DuoChat] exit.\n";
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
