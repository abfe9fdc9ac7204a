#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace duochat::chat {

// Four-digit decimal room codes ("1000".."9999").
class RoomCodeGenerator {
public:
    static constexpr std::uint32_t kMinCode = 1000;
    static constexpr std::uint32_t kMaxCode = 9999;
    static constexpr std::uint32_t kCodeSpace = kMaxCode - kMinCode + 1;

    RoomCodeGenerator()
        : rng_(seed_engine_()) {}

    explicit RoomCodeGenerator(std::uint64_t seed)
        : rng_(seed) {}

    std::string next() {
        std::lock_guard<std::mutex> lk(mu_);
        return format(dist_(rng_));
    }

    // Random position in the code space, used as a scan start.
    std::uint32_t next_offset() {
        std::lock_guard<std::mutex> lk(mu_);
        return dist_(rng_) - kMinCode;
    }

    static std::string format(std::uint32_t code) {
        return std::to_string(code);
    }

    static bool is_valid(const std::string& code) {
        if (code.size() != 4 || code[0] == '0') return false;
        for (char c : code) {
            if (c < '0' || c > '9') return false;
        }
        return true;
    }

private:
    static std::mt19937_64 seed_engine_() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count()),
            static_cast<unsigned>(reinterpret_cast<std::uintptr_t>(&rd))
        };
        return std::mt19937_64(seq);
    }

    std::mutex mu_;
    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint32_t> dist_{kMinCode, kMaxCode};
};

} // namespace duochat::chat
