#pragma once
#include <cstddef>

#include "nodefleet/death_queue.hpp"
#include "nodefleet/fleet_registry.hpp"
#include "nodefleet/provider_client.hpp"

namespace nodefleet {
    struct ShutdownReport {
        size_t monitors_halted{0};
        size_t stop_calls{0};
        size_t stop_failures{0};
        size_t already_dead{0};
    };

    class ShutdownCoordinator {
    public:
        // keep_nodes corresponds to --no-rm: halt supervision but leave the
        // nodes running at the provider.
        ShutdownCoordinator(ProviderClient& provider, FleetRegistry& registry, DeathQueue& deaths, bool keep_nodes);

        // Halts every monitor, then stops every tracked node best-effort and
        // empties the registry. Nodes whose monitor already declared them dead
        // were stopped by that monitor and are only forgotten.
        ShutdownReport shutdown();

    private:
        ProviderClient& provider_;
        FleetRegistry& registry_;
        DeathQueue& deaths_;
        bool keep_nodes_;
    };
} // namespace nodefleet
