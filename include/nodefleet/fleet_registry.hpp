#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nodefleet/types.hpp"

namespace nodefleet {
    class HealthMonitor;

    // The single owned id -> Node map. Every entry carries the monitor that
    // supervises the node, so the two are inserted and removed together.
    class FleetRegistry {
    public:
        FleetRegistry() = default;
        // Halts and joins any monitor still tracked before the map goes away.
        ~FleetRegistry();

        FleetRegistry(const FleetRegistry&) = delete;
        FleetRegistry& operator=(const FleetRegistry&) = delete;

        // Stores the node and starts its monitor under the registry lock, so
        // nobody can see the node without a running monitor. Returns false if
        // the id is already tracked.
        bool insert(const Node& node, std::shared_ptr<HealthMonitor> monitor);

        // Applies mutate to the stored node atomically. Returns false if the
        // id is no longer tracked.
        bool update(const std::string& node_id, const std::function<void(Node&)>& mutate) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(node_id);
            if (it == entries_.end()) {
                return false;
            }
            mutate(it->second.node);
            return true;
        }

        void set_status(const std::string& node_id, NodeStatus status) {
            update(node_id, [status](Node& node) { node.status = status; });
        }

        std::optional<Node> get(const std::string& node_id) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(node_id);
            if (it == entries_.end()) {
                return std::nullopt;
            }
            return it->second.node;
        }

        // Drops the entry and hands its monitor back to the caller, who joins
        // it outside the registry lock. Null if the id was not tracked.
        std::shared_ptr<HealthMonitor> remove(const std::string& node_id) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(node_id);
            if (it == entries_.end()) {
                return nullptr;
            }
            std::shared_ptr<HealthMonitor> monitor = std::move(it->second.monitor);
            entries_.erase(it);
            return monitor;
        }

        bool exists(const std::string& node_id) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_.contains(node_id);
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_.size();
        }

        size_t live_count() const {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t live = 0;
            for (const auto& [_, entry] : entries_) {
                if (entry.node.is_live()) {
                    live++;
                }
            }
            return live;
        }

        std::vector<Node> snapshot() const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<Node> snapshot;
            snapshot.reserve(entries_.size());
            for (const auto& [_, entry] : entries_) {
                snapshot.push_back(entry.node);
            }
            return snapshot;
        }

        std::vector<std::shared_ptr<HealthMonitor>> monitors() const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<std::shared_ptr<HealthMonitor>> monitors;
            monitors.reserve(entries_.size());
            for (const auto& [_, entry] : entries_) {
                if (entry.monitor) {
                    monitors.push_back(entry.monitor);
                }
            }
            return monitors;
        }

    private:
        struct Entry {
            Node node;
            std::shared_ptr<HealthMonitor> monitor;
        };

        std::unordered_map<std::string, Entry> entries_;
        mutable std::mutex mutex_;
    };
} // namespace nodefleet
