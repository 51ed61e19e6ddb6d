#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "nodefleet/death_queue.hpp"
#include "nodefleet/fleet_registry.hpp"
#include "nodefleet/provider_client.hpp"
#include "nodefleet/types.hpp"

namespace nodefleet {
    struct MonitorPolicy {
        std::chrono::milliseconds boot_delay{5000};
        std::chrono::milliseconds poll_interval{30000};
        std::chrono::milliseconds check_timeout{5000};
        int burst_attempts{3};  // checks right after boot, back to back
        int strike_limit{3};    // consecutive failed poll checks before death
    };

    // Supervises one node on its own thread:
    //   BOOTING --boot delay--> burst of up to burst_attempts checks
    //     any success      -> HEALTHY, then one check per poll interval
    //     all fail         -> DEAD
    //   HEALTHY/UNHEALTHY: a failure is one strike, a success clears them;
    //     strike_limit strikes -> DEAD
    // On DEAD the monitor stops the node, posts a DeathNotice and exits.
    // request_stop() halts it at any point without touching the node (STOPPED).
    class HealthMonitor {
    public:
        HealthMonitor(std::string node_id, NodeType type, MonitorPolicy policy,
                      ProviderClient& provider, FleetRegistry& registry, DeathQueue& deaths);
        ~HealthMonitor();

        HealthMonitor(const HealthMonitor&) = delete;
        HealthMonitor& operator=(const HealthMonitor&) = delete;

        void start();
        void request_stop();
        void join();

        bool stop_requested() const;
        bool finished() const { return finished_.load(); }
        const std::string& node_id() const { return node_id_; }

    private:
        void run();
        // Returns false if a stop was requested before the wait ran out.
        bool wait(std::chrono::milliseconds duration);
        bool check_once(bool burst_phase);
        void declare_dead();
        void halt();

        const std::string node_id_;
        const NodeType type_;
        const MonitorPolicy policy_;
        ProviderClient& provider_;
        FleetRegistry& registry_;
        DeathQueue& deaths_;

        int failures_{0};
        std::atomic<bool> finished_{false};
        bool stop_{false};
        mutable std::mutex mutex_;
        std::condition_variable stop_cv_;
        std::thread thread_;
    };
} // namespace nodefleet
