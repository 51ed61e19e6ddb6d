#include "nodefleet/shutdown_coordinator.hpp"

#include <memory>
#include <vector>

#include "nodefleet/health_monitor.hpp"
#include "nodefleet/log.hpp"
#include "nodefleet/time.hpp"

namespace nodefleet {
    ShutdownCoordinator::ShutdownCoordinator(ProviderClient& provider, FleetRegistry& registry,
                                             DeathQueue& deaths, bool keep_nodes)
        : provider_(provider), registry_(registry), deaths_(deaths), keep_nodes_(keep_nodes) {}

    ShutdownReport ShutdownCoordinator::shutdown() {
        ShutdownReport report;
        log_info("👋 Shutting down monitoring...");

        // Dying monitors must not block on a full queue nobody drains anymore.
        deaths_.close();

        std::vector<std::shared_ptr<HealthMonitor>> monitors = registry_.monitors();
        for (const auto& monitor : monitors) {
            monitor->request_stop();
        }
        for (const auto& monitor : monitors) {
            log_info("Waiting for ", monitor->node_id(), " monitoring to complete...");
            monitor->join();
            report.monitors_halted++;
        }

        std::vector<Node> nodes = registry_.snapshot();
        if (keep_nodes_) {
            log_info("Leaving all workloads running (--no-rm flag is set)");
        } else {
            log_info("🛑 Stopping all ", nodes.size(), " tracked nodes (use --no-rm to keep them running)...");
        }

        for (const auto& node : nodes) {
            if (node.status == NodeStatus::DEAD) {
                report.already_dead++;
            } else {
                registry_.set_status(node.id, NodeStatus::STOPPED);
                if (!keep_nodes_) {
                    log_info("🛑 Stopping ", node.host.empty() ? node.id : node.host, " (ID: ", node.id, ")...");
                    report.stop_calls++;
                    int64_t stopped_ms = 0;
                    grpc::Status status = provider_.stop_node(node.id, &stopped_ms);
                    if (status.ok()) {
                        log_info("✅ Successfully stopped ", node.id, " at ", format_clock(stopped_ms));
                    } else {
                        report.stop_failures++;
                        log_error("❌ Failed to stop ", node.id, ": ", status.error_message());
                    }
                }
            }
            registry_.remove(node.id);
        }

        if (!keep_nodes_) {
            log_info("✅ Stop requests sent for ", report.stop_calls, " nodes (", report.stop_failures, " failed)");
        }
        return report;
    }
} // namespace nodefleet
