#include "nodefleet/replacement_controller.hpp"

#include <algorithm>
#include <thread>
#include <vector>

#include "nodefleet/errors.hpp"
#include "nodefleet/health_monitor.hpp"
#include "nodefleet/log.hpp"
#include "nodefleet/time.hpp"

namespace nodefleet {
    namespace {
        constexpr std::chrono::milliseconds kPauseSlice{50};
    }

    ReplacementController::ReplacementController(NodeLauncher& launcher, FleetRegistry& registry, FleetPolicy policy,
                                                 const std::atomic<bool>* running)
        : launcher_(launcher), registry_(registry), policy_(policy), running_(running) {}

    bool ReplacementController::stopping() const {
        return running_ != nullptr && !running_->load(std::memory_order_relaxed);
    }

    // Sleeps for delay in short slices, returning early once shutdown is requested.
    void ReplacementController::pause(std::chrono::milliseconds delay) const {
        auto deadline = std::chrono::steady_clock::now() + delay;
        while (!stopping()) {
            auto left = deadline - std::chrono::steady_clock::now();
            if (left <= std::chrono::steady_clock::duration::zero()) {
                return;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(left, kPauseSlice));
        }
    }

    size_t ReplacementController::launch_batch(size_t count, const char* purpose) {
        size_t launched = 0;
        for (size_t i = 0; i < count; i++) {
            if (i > 0 && policy_.launch_spacing.count() > 0) {
                pause(policy_.launch_spacing);
            }
            if (stopping()) {
                log_info("🛑 Shutdown requested, skipping ", count - i, " remaining ", purpose, " launch",
                         count - i == 1 ? "" : "es");
                break;
            }
            log_info("🔄 Launching ", purpose, " node ", i + 1, "/", count, "...");
            launches_attempted_++;
            try {
                launcher_.launch();
                launched++;
            } catch (const LaunchError& e) {
                launch_failures_++;
                if (e.is_auth_failure()) {
                    throw;
                }
                log_error("❌ Failed to launch ", purpose, " node: ", e.what());
            }
        }
        return launched;
    }

    size_t ReplacementController::fill() {
        size_t target = static_cast<size_t>(policy_.target_count);
        log_info("🚀 Launching ", target, " nodes (keep running: ", policy_.keep_running ? "true" : "false", ")");

        size_t launched = 0;
        try {
            launched = launch_batch(target, "initial");
            if (policy_.keep_running && !stopping() && registry_.size() < target) {
                size_t missing = target - registry_.size();
                log_info("🔄 Current node count (", registry_.size(), ") is below target (", target,
                         "). Launching ", missing, " additional nodes...");
                launched += launch_batch(missing, "top-up");
            }
        } catch (const LaunchError& e) {
            throw StartupError(std::string("provider rejected the credential: ") + e.what());
        }

        if (launched == 0 && !stopping()) {
            throw StartupError("failed to launch any of the " + std::to_string(target) + " requested nodes");
        }

        std::vector<Node> nodes = registry_.snapshot();
        log_info("=== 📊 Launch Summary ===");
        log_info("Requested: ", target, " nodes");
        log_info("Successful: ", launched, " nodes");
        int idx = 0;
        for (const auto& node : nodes) {
            idx++;
            log_info(idx, ". ", node.host.empty() ? node.id : node.host, " (Type: ", to_string(node.type),
                     ", Expires: ", node.expires_at_ms > 0 ? format_clock(node.expires_at_ms) : "n/a", ")");
        }
        return launched;
    }

    void ReplacementController::handle_death(const DeathNotice& notice) {
        std::shared_ptr<HealthMonitor> monitor = registry_.remove(notice.node_id);
        if (monitor) {
            monitor->request_stop();
            monitor->join();
        }
        log_info("🔄 Removed failed node ", notice.node_id, " (", to_string(notice.type), "), ",
                 registry_.size(), " nodes remain");

        if (!policy_.keep_running || stopping()) {
            return;
        }

        size_t target = static_cast<size_t>(policy_.target_count);
        size_t tracked = registry_.size();
        if (tracked >= target) {
            return;
        }
        size_t missing = target - tracked;
        log_info("🔄 Current node count (", tracked, ") is below target (", target, "). Launching ",
                 missing, " replacement node", missing == 1 ? "" : "s", "...");
        try {
            launch_batch(missing, "replacement");
        } catch (const LaunchError& e) {
            log_error("❌ Replacement rejected by provider: ", e.what());
        }
    }
} // namespace nodefleet
