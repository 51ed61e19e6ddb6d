#pragma once
#include <chrono>
#include <optional>

#include "nodefleet/death_queue.hpp"
#include "nodefleet/fleet_registry.hpp"
#include "nodefleet/health_monitor.hpp"
#include "nodefleet/provider_client.hpp"
#include "nodefleet/type_alternator.hpp"
#include "nodefleet/types.hpp"

namespace nodefleet {
    class NodeLauncher {
    public:
        NodeLauncher(ProviderClient& provider, FleetRegistry& registry, DeathQueue& deaths,
                     TypeAlternator& alternator, MonitorPolicy policy,
                     std::chrono::seconds lease = std::chrono::seconds(3600));

        // Launches one node and puts it under supervision. Without a requested
        // type the alternator decides. Throws LaunchError if the provider fails.
        Node launch(std::optional<NodeType> requested = std::nullopt);

    private:
        ProviderClient& provider_;
        FleetRegistry& registry_;
        DeathQueue& deaths_;
        TypeAlternator& alternator_;
        MonitorPolicy policy_;
        std::chrono::seconds lease_;
    };
} // namespace nodefleet
