#pragma once

#include <cstdint>
#include <chrono>

namespace pqchat::utils {

// Wall-clock Unix timestamp in milliseconds, used for message sent_at
inline uint64_t unix_time_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

// Simple timer class
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] uint64_t elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

}  // namespace pqchat::utils
