#include "nodefleet/log.hpp"

#include <mutex>

#include "nodefleet/time.hpp"

namespace nodefleet {
    namespace {
        std::mutex g_log_mutex;
    }

    void log_line(std::ostream& out, const std::string& message) {
        std::string stamp = format_clock(now_ms());
        std::lock_guard<std::mutex> lock(g_log_mutex);
        out << stamp << " - " << message << std::endl;
    }
} // namespace nodefleet
