#pragma once
#include <cstdint>
#include <string>

namespace nodefleet {
    enum class NodeType : uint8_t {
        FAST = 0,
        LARGE = 1
    };

    enum class NodeStatus : uint8_t {
        BOOTING = 0,     // launched, waiting out the boot delay / first checks
        HEALTHY = 1,
        UNHEALTHY = 2,   // failed at least one poll check, not yet dead
        DEAD = 3,        // struck out, stopped by its monitor
        STOPPED = 4      // halted by shutdown
    };

    enum class HealthVerdict : uint8_t {
        HEALTHY = 0,
        UNHEALTHY = 1,
        TRANSPORT_ERROR = 2  // timeout, connection or auth failure
    };

    // What the provider hands back for a freshly launched node.
    struct NodeHandle {
        std::string id;
        std::string host;
        int64_t expires_ms{0};
    };

    struct Node {
        std::string id;
        std::string host;
        NodeType type{NodeType::FAST};
        NodeStatus status{NodeStatus::BOOTING};
        int consecutive_failures{0};
        int64_t launched_at_ms{0};
        int64_t expires_at_ms{0};
        int64_t last_checked_ms{0};

        bool is_live() const {
            return status == NodeStatus::BOOTING
                || status == NodeStatus::HEALTHY
                || status == NodeStatus::UNHEALTHY;
        }
    };

    struct DeathNotice {
        std::string node_id;
        NodeType type{NodeType::FAST};
        int failures{0};
    };

    inline std::string to_string(NodeType type) {
        switch (type) {
            case NodeType::FAST:  return "fast";
            case NodeType::LARGE: return "large";
            default:              return "unknown";
        }
    }

    inline std::string to_string(NodeStatus status) {
        switch (status) {
            case NodeStatus::BOOTING:   return "BOOTING";
            case NodeStatus::HEALTHY:   return "HEALTHY";
            case NodeStatus::UNHEALTHY: return "UNHEALTHY";
            case NodeStatus::DEAD:      return "DEAD";
            case NodeStatus::STOPPED:   return "STOPPED";
            default:                    return "INVALID";
        }
    }

} // namespace nodefleet
