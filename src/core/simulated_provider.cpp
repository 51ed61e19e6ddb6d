#include "nodefleet/simulated_provider.hpp"

#include <algorithm>

namespace nodefleet {
    SimulatedProvider::SimulatedProvider(double fail_rate, uint32_t seed)
        : fail_rate_(std::clamp(fail_rate, 0.0, 1.0)), rng_(seed) {}

    SimulatedNode SimulatedProvider::launch(NodeType type, int64_t lease_seconds, int64_t now_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        SimulatedNode node;
        node.id = "node-" + std::to_string(next_id_++);
        node.host = node.id + ".sim.local";
        node.type = type;
        node.launched_ms = now_ms;
        node.expires_ms = now_ms + lease_seconds * 1000;
        nodes_[node.id] = node;
        return node;
    }

    bool SimulatedProvider::stop(const std::string& node_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return nodes_.erase(node_id) > 0;
    }

    std::optional<bool> SimulatedProvider::check(const std::string& node_id, int64_t now_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(node_id);
        if (it == nodes_.end()) {
            return std::nullopt;
        }
        if (now_ms >= it->second.expires_ms) {
            return false;
        }
        if (fail_rate_ <= 0.0) {
            return true;
        }
        std::bernoulli_distribution fails(fail_rate_);
        return !fails(rng_);
    }

    size_t SimulatedProvider::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return nodes_.size();
    }
} // namespace nodefleet
