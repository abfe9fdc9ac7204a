#pragma once

#include <cstddef>
#include <string>

namespace duochat::config {

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    int         port = 8080;
    int         threads = 1;
    int         max_connections = 1024;
    std::size_t max_message_bytes = 64 * 1024;
    std::size_t room_capacity = 2;

    // `key = value` lines, `#` comments. Throws std::runtime_error.
    static ServerConfig from_file(const std::string& path);

    // PORT from the environment wins over the file. An unusable value is
    // logged and the configured port kept.
    void apply_env();
};

} // namespace duochat::config
