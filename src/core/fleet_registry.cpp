#include "nodefleet/fleet_registry.hpp"

#include "nodefleet/health_monitor.hpp"

namespace nodefleet {
    FleetRegistry::~FleetRegistry() {
        std::vector<std::shared_ptr<HealthMonitor>> running = monitors();
        for (const auto& monitor : running) {
            monitor->request_stop();
        }
        for (const auto& monitor : running) {
            monitor->join();
        }
    }

    bool FleetRegistry::insert(const Node& node, std::shared_ptr<HealthMonitor> monitor) {
        // this acts as a lock/unlock with RAII
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.contains(node.id)) {
            return false;
        }
        if (monitor) {
            monitor->start();
        }
        entries_[node.id] = Entry{node, std::move(monitor)};
        return true;
    }
} // namespace nodefleet
