#include "nodefleet/health_monitor.hpp"

#include <utility>

#include "nodefleet/log.hpp"
#include "nodefleet/time.hpp"

namespace nodefleet {
    HealthMonitor::HealthMonitor(std::string node_id, NodeType type, MonitorPolicy policy,
                                 ProviderClient& provider, FleetRegistry& registry, DeathQueue& deaths)
        : node_id_(std::move(node_id)), type_(type), policy_(policy),
          provider_(provider), registry_(registry), deaths_(deaths) {}

    HealthMonitor::~HealthMonitor() {
        request_stop();
        join();
    }

    void HealthMonitor::start() {
        thread_ = std::thread([this] { run(); });
    }

    void HealthMonitor::request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        stop_cv_.notify_all();
    }

    void HealthMonitor::join() {
        if (!thread_.joinable()) {
            return;
        }
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }

    bool HealthMonitor::stop_requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stop_;
    }

    bool HealthMonitor::wait(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !stop_cv_.wait_for(lock, duration, [this] { return stop_; });
    }

    void HealthMonitor::run() {
        log_info("🔎 Monitoring ", node_id_, " (", to_string(type_), "), waiting ",
                 policy_.boot_delay.count(), "ms for it to initialize");

        if (!wait(policy_.boot_delay)) {
            halt();
            return;
        }

        bool alive = false;
        for (int attempt = 1; attempt <= policy_.burst_attempts; attempt++) {
            if (check_once(true)) {
                alive = true;
                break;
            }
            if (stop_requested()) {
                halt();
                return;
            }
            log_info("⚠️ Health check failed for ", node_id_, " (attempt ", attempt, "/",
                     policy_.burst_attempts, ")");
        }

        if (!alive) {
            declare_dead();
            return;
        }
        log_info("✅ Node ", node_id_, " is up and running");

        while (true) {
            if (!wait(policy_.poll_interval)) {
                halt();
                return;
            }
            bool healthy = check_once(false);
            if (stop_requested()) {
                halt();
                return;
            }
            if (!healthy) {
                log_info("⚠️ Node ", node_id_, " failed a poll check (strike ", failures_, "/",
                         policy_.strike_limit, ")");
                if (failures_ >= policy_.strike_limit) {
                    declare_dead();
                    return;
                }
            }
        }
    }

    bool HealthMonitor::check_once(bool burst_phase) {
        HealthVerdict verdict = provider_.check_health(node_id_, policy_.check_timeout);
        if (stop_requested()) {
            // result is stale, the node belongs to shutdown now
            return verdict == HealthVerdict::HEALTHY;
        }

        bool healthy = verdict == HealthVerdict::HEALTHY;
        failures_ = healthy ? 0 : failures_ + 1;

        int failures = failures_;
        int64_t checked_at = now_ms();
        registry_.update(node_id_, [&](Node& node) {
            node.consecutive_failures = failures;
            node.last_checked_ms = checked_at;
            if (healthy) {
                node.status = NodeStatus::HEALTHY;
            } else if (!burst_phase) {
                node.status = NodeStatus::UNHEALTHY;
            }
        });
        return healthy;
    }

    void HealthMonitor::declare_dead() {
        log_error("❌ Node ", node_id_, " failed ", failures_, " consecutive health checks, removing...");
        registry_.set_status(node_id_, NodeStatus::DEAD);

        int64_t stopped_ms = 0;
        grpc::Status status = provider_.stop_node(node_id_, &stopped_ms);
        if (status.ok()) {
            log_info("✅ Successfully stopped failed node ", node_id_, " at ", format_clock(stopped_ms));
        } else {
            log_error("⚠️ Failed to stop node ", node_id_, ": ", status.error_message(),
                      ", but continuing removal");
        }

        log_info("💀 Node ", node_id_, " is dead");
        if (!deaths_.push(DeathNotice{node_id_, type_, failures_})) {
            log_info("🛑 Shutdown in progress, death of ", node_id_, " left to the coordinator");
        }
        finished_.store(true);
    }

    void HealthMonitor::halt() {
        registry_.set_status(node_id_, NodeStatus::STOPPED);
        log_info("🛑 Monitoring stopped for node ", node_id_);
        finished_.store(true);
    }
} // namespace nodefleet
