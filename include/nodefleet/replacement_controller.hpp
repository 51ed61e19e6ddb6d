#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>

#include "nodefleet/fleet_registry.hpp"
#include "nodefleet/node_launcher.hpp"
#include "nodefleet/types.hpp"

namespace nodefleet {
    struct FleetPolicy {
        int target_count{1};
        bool keep_running{false};
        std::chrono::milliseconds launch_spacing{2000};  // pause between launches in one pass
    };

    // Holds the fleet at target size. Runs on the main control flow only:
    // deaths are fed to it one at a time from the DeathQueue.
    class ReplacementController {
    public:
        // When running is given, launches stop as soon as it turns false.
        ReplacementController(NodeLauncher& launcher, FleetRegistry& registry, FleetPolicy policy,
                              const std::atomic<bool>* running = nullptr);

        // Initial fill. Throws StartupError if the credential is rejected or
        // no node at all could be launched. Returns the number launched, which
        // may be short of target when shutdown was requested part way.
        size_t fill();

        // Forgets the dead node and, with keep-running on, launches enough
        // nodes to get back to target. Launch failures are logged, not thrown.
        void handle_death(const DeathNotice& notice);

        size_t launches_attempted() const { return launches_attempted_; }
        size_t launch_failures() const { return launch_failures_; }

    private:
        size_t launch_batch(size_t count, const char* purpose);
        bool stopping() const;
        void pause(std::chrono::milliseconds delay) const;

        NodeLauncher& launcher_;
        FleetRegistry& registry_;
        FleetPolicy policy_;
        const std::atomic<bool>* running_;
        size_t launches_attempted_{0};
        size_t launch_failures_{0};
    };
} // namespace nodefleet
