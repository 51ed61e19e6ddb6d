#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

#include "nodefleet/types.hpp"

namespace nodefleet {
    struct SimulatedNode {
        std::string id;
        std::string host;
        NodeType type{NodeType::FAST};
        int64_t launched_ms{0};
        int64_t expires_ms{0};
    };

    // In-memory stand-in for the provisioning backend used by
    // nodefleet-provider. Health checks fail at random with fail_rate.
    class SimulatedProvider {
    public:
        explicit SimulatedProvider(double fail_rate = 0.0, uint32_t seed = std::random_device{}());

        SimulatedNode launch(NodeType type, int64_t lease_seconds, int64_t now_ms);
        // Returns false for an unknown id.
        bool stop(const std::string& node_id);
        // Empty for an unknown id, otherwise whether the node answered.
        std::optional<bool> check(const std::string& node_id, int64_t now_ms);

        size_t size() const;

    private:
        double fail_rate_;
        uint64_t next_id_{1};
        std::mt19937 rng_;
        std::unordered_map<std::string, SimulatedNode> nodes_;
        mutable std::mutex mutex_;
    };
} // namespace nodefleet
