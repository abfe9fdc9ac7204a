#include "config/ServerConfig.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace duochat::config {

static inline void trim(std::string& s) {
    std::size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    std::size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    s = s.substr(b, e - b);
}

static inline void strip_comment(std::string& s) {
    auto pos = s.find('#');
    if (pos != std::string::npos) s.erase(pos);
}

static inline std::string parse_string(std::string s) {
    trim(s);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

static inline std::string at_line(int lineno) {
    return " (line " + std::to_string(lineno) + ")";
}

// `where` is appended to every error, e.g. " (line 3)".
static inline long long parse_int(const std::string& raw, const std::string& key,
                                  const std::string& where) {
    std::string s = raw;
    trim(s);
    if (s.empty()) throw std::runtime_error("Empty int value for key: " + key + where);

    std::size_t idx = 0;
    long long v = 0;
    try {
        v = std::stoll(s, &idx, 10);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid int for key '" + key + "': " + s + where);
    }
    if (idx != s.size()) {
        throw std::runtime_error("Invalid trailing chars for key '" + key + "': " + s + where);
    }
    return v;
}

ServerConfig ServerConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    ServerConfig cfg{};
    std::string line;
    int lineno = 0;

    while (std::getline(in, line)) {
        ++lineno;

        strip_comment(line);
        trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Config parse error at line " + std::to_string(lineno) +
                                     ": expected 'key = value'");
        }

        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        trim(key);
        trim(val);

        if (key == "bind_address") {
            cfg.bind_address = parse_string(val);
            if (cfg.bind_address.empty())
                throw std::runtime_error("bind_address cannot be empty" + at_line(lineno));
        } else if (key == "port") {
            long long v = parse_int(val, key, at_line(lineno));
            if (v <= 0 || v > 65535)
                throw std::runtime_error("port out of range (1..65535)" + at_line(lineno));
            cfg.port = static_cast<int>(v);
        } else if (key == "threads") {
            long long v = parse_int(val, key, at_line(lineno));
            if (v < 1 || v > 256)
                throw std::runtime_error("threads out of range (1..256)" + at_line(lineno));
            cfg.threads = static_cast<int>(v);
        } else if (key == "max_connections") {
            long long v = parse_int(val, key, at_line(lineno));
            if (v < 1 || v > 1000000)
                throw std::runtime_error("max_connections out of range (1..1000000)" + at_line(lineno));
            cfg.max_connections = static_cast<int>(v);
        } else if (key == "max_message_bytes") {
            long long v = parse_int(val, key, at_line(lineno));
            if (v < 64 || v > 16 * 1024 * 1024)
                throw std::runtime_error("max_message_bytes out of range (64..16777216)" + at_line(lineno));
            cfg.max_message_bytes = static_cast<std::size_t>(v);
        } else if (key == "room_capacity") {
            long long v = parse_int(val, key, at_line(lineno));
            if (v < 1 || v > 16)
                throw std::runtime_error("room_capacity out of range (1..16)" + at_line(lineno));
            cfg.room_capacity = static_cast<std::size_t>(v);
        } else {
            // unknown key: ignore
        }
    }

    return cfg;
}

void ServerConfig::apply_env() {
    const char* raw = std::getenv("PORT");
    if (!raw || !*raw) return;

    long long v = 0;
    try {
        v = parse_int(raw, "PORT", " (environment)");
    } catch (const std::runtime_error& e) {
        std::cerr << "[DuoChat] ignoring PORT: " << e.what() << "\n";
        return;
    }
    if (v <= 0 || v > 65535) {
        std::cerr << "[DuoChat] ignoring PORT: out of range (1..65535): " << v << "\n";
        return;
    }
    port = static_cast<int>(v);
}

} // namespace duochat::config
