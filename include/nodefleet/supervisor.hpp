#pragma once
#include <atomic>

#include "nodefleet/config.hpp"
#include "nodefleet/provider_client.hpp"

namespace nodefleet {
    // Fills the fleet, supervises it until running turns false or no node is
    // left, then shuts it down. Returns the process exit code: 1 when the
    // initial fill failed, 0 otherwise. Launched nodes are stopped on both
    // paths unless config.no_rm is set.
    int run_supervisor(const SupervisorConfig& config, ProviderClient& provider, const std::atomic<bool>& running);
} // namespace nodefleet
