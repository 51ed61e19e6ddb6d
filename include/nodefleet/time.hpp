#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace nodefleet {
    inline int64_t now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    // Local wall-clock time as "YYYY-MM-DD HH:MM:SS".
    inline std::string format_clock(int64_t unix_ms) {
        std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
        std::tm local{};
        localtime_r(&seconds, &local);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
        return buffer;
    }

    inline std::string format_time_ago(int64_t then_ms, int64_t current_ms) {
        if (then_ms <= 0) {
            return "never";
        }
        int64_t diff_ms = current_ms - then_ms;

        if (diff_ms < 1000) {
            return "just now";
        } else if (diff_ms < 60000) {
            return std::to_string(diff_ms / 1000) + "s ago";
        } else if (diff_ms < 3600000) {
            return std::to_string(diff_ms / 60000) + "m ago";
        } else {
            return std::to_string(diff_ms / 3600000) + "h ago";
        }
    }
} // namespace nodefleet
