#include "nodefleet/status_table.hpp"

#include <iomanip>

#include "nodefleet/time.hpp"

namespace nodefleet {
    std::string status_to_emoji(NodeStatus status) {
        switch (status) {
            case NodeStatus::BOOTING:   return "⏳";
            case NodeStatus::HEALTHY:   return "✅";
            case NodeStatus::UNHEALTHY: return "⚠️";
            case NodeStatus::DEAD:      return "💀";
            case NodeStatus::STOPPED:   return "🛑";
            default:                    return "❓";
        }
    }

    void print_fleet_table(std::ostream& out, const std::vector<Node>& nodes, int64_t current_ms) {
        if (nodes.empty()) {
            out << "\n📭 No nodes in the fleet\n" << std::endl;
            return;
        }

        out << "\n┌──────────────────────────────────────────────────────────────────────────────────────┐" << std::endl;
        out << "│                               🛰️  nodefleet Fleet Status                               │" << std::endl;
        out << "├──────────────────────────────────────────────────────────────────────────────────────┤" << std::endl;
        out << "│ Node ID          │ Host                 │ Type  │ Status        │ Strikes │ Last Check │" << std::endl;
        out << "├──────────────────────────────────────────────────────────────────────────────────────┤" << std::endl;

        for (const auto& node : nodes) {
            out << "│ "
                << std::left << std::setw(16) << node.id << " │ "
                << std::left << std::setw(20) << node.host << " │ "
                << std::left << std::setw(5) << to_string(node.type) << " │ "
                << status_to_emoji(node.status) << " " << std::left << std::setw(10) << to_string(node.status) << " │ "
                << std::left << std::setw(7) << node.consecutive_failures << " │ "
                << std::left << std::setw(10) << format_time_ago(node.last_checked_ms, current_ms) << " │"
                << std::endl;
        }

        out << "└──────────────────────────────────────────────────────────────────────────────────────┘" << std::endl;

        int booting = 0, healthy = 0, unhealthy = 0, other = 0;
        for (const auto& node : nodes) {
            switch (node.status) {
                case NodeStatus::BOOTING:   booting++; break;
                case NodeStatus::HEALTHY:   healthy++; break;
                case NodeStatus::UNHEALTHY: unhealthy++; break;
                default:                    other++; break;
            }
        }

        out << "📊 Summary: "
            << healthy << " healthy, "
            << unhealthy << " unhealthy, "
            << booting << " booting, "
            << other << " other"
            << " (total: " << nodes.size() << " nodes)\n" << std::endl;
    }
} // namespace nodefleet
