#pragma once
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace nodefleet {
    // Writes one timestamped line. Monitor threads log concurrently, so the
    // whole line goes out under a single lock.
    void log_line(std::ostream& out, const std::string& message);

    template <typename... Args>
    void log_info(Args&&... args) {
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        log_line(std::cout, oss.str());
    }

    template <typename... Args>
    void log_error(Args&&... args) {
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        log_line(std::cerr, oss.str());
    }
} // namespace nodefleet
