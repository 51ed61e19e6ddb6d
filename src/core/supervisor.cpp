#include "nodefleet/supervisor.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

#include "nodefleet/death_queue.hpp"
#include "nodefleet/errors.hpp"
#include "nodefleet/fleet_registry.hpp"
#include "nodefleet/log.hpp"
#include "nodefleet/node_launcher.hpp"
#include "nodefleet/replacement_controller.hpp"
#include "nodefleet/shutdown_coordinator.hpp"
#include "nodefleet/status_table.hpp"
#include "nodefleet/time.hpp"
#include "nodefleet/type_alternator.hpp"

namespace nodefleet {
    namespace {
        constexpr std::chrono::milliseconds kDeathWait{500};
    }

    int run_supervisor(const SupervisorConfig& config, ProviderClient& provider, const std::atomic<bool>& running) {
        FleetRegistry registry;
        DeathQueue deaths;
        TypeAlternator alternator(config.fixed_type);
        NodeLauncher launcher(provider, registry, deaths, alternator, config.monitor_policy(), config.lease);
        ReplacementController controller(launcher, registry, config.fleet_policy(), &running);
        ShutdownCoordinator coordinator(provider, registry, deaths, config.no_rm);

        try {
            controller.fill();
        } catch (const StartupError& e) {
            log_error("💥 ", e.what());
            coordinator.shutdown();
            return 1;
        }

        auto status_period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(config.poll);
        auto next_status = std::chrono::steady_clock::now() + status_period;

        while (running.load(std::memory_order_relaxed)) {
            if (auto notice = deaths.pop_for(kDeathWait)) {
                controller.handle_death(*notice);
                continue;
            }

            if (registry.size() == 0 && deaths.size() == 0) {
                log_info("📭 No nodes left to supervise");
                break;
            }

            if (std::chrono::steady_clock::now() >= next_status) {
                std::ostringstream table;
                print_fleet_table(table, registry.snapshot(), now_ms());
                log_line(std::cout, table.str());
                next_status += status_period;
            }
        }

        if (!running.load(std::memory_order_relaxed)) {
            log_info("🛑 Shutdown requested, shutting down gracefully...");
        }
        coordinator.shutdown();
        return 0;
    }
} // namespace nodefleet
