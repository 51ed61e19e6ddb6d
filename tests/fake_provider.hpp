#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "nodefleet/health_monitor.hpp"
#include "nodefleet/provider_client.hpp"
#include "nodefleet/types.hpp"

// Scriptable in-memory provider. Launched ids are "node-1", "node-2", ... in
// launch order, so health scripts can be set up before the launch happens.
class FakeProvider : public nodefleet::ProviderClient {
public:
    // Stop time reported for every successful stop.
    static constexpr int64_t kStoppedAtMs = 1700000000000;

    grpc::Status launch_node(nodefleet::NodeType type, std::chrono::seconds lease,
                             nodefleet::NodeHandle* handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        launch_requests_.push_back(type);
        if (reject_credential_ || (reject_after_ >= 0 && next_id_ >= reject_after_)) {
            return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "invalid API key");
        }
        if (failing_launches_ > 0) {
            failing_launches_--;
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, "provider out of capacity");
        }
        next_id_++;
        handle->id = "node-" + std::to_string(next_id_);
        handle->host = handle->id + ".test";
        handle->expires_ms = 1700000000000 + lease.count() * 1000;
        launched_types_.push_back(type);
        return grpc::Status::OK;
    }

    grpc::Status stop_node(const std::string& node_id, int64_t* stopped_ms) override {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_calls_[node_id]++;
        if (failing_stops_) {
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, "provider unreachable");
        }
        *stopped_ms = kStoppedAtMs;
        return grpc::Status::OK;
    }

    nodefleet::HealthVerdict check_health(const std::string& node_id, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checks_[node_id]++;
        auto& script = scripts_[node_id];
        if (!script.empty()) {
            nodefleet::HealthVerdict verdict = script.front();
            script.pop_front();
            return verdict;
        }
        return default_verdict_;
    }

    void script(const std::string& node_id, std::vector<nodefleet::HealthVerdict> verdicts) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[node_id] = std::deque<nodefleet::HealthVerdict>(verdicts.begin(), verdicts.end());
    }

    void set_default_verdict(nodefleet::HealthVerdict verdict) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_verdict_ = verdict;
    }

    void fail_next_launches(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_launches_ = count;
    }

    void reject_credential(bool reject) {
        std::lock_guard<std::mutex> lock(mutex_);
        reject_credential_ = reject;
    }

    // Accepts the first `launches` launches, then rejects the credential.
    void reject_credential_after(int launches) {
        std::lock_guard<std::mutex> lock(mutex_);
        reject_after_ = launches;
    }

    void fail_stops(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_stops_ = fail;
    }

    int stop_calls(const std::string& node_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stop_calls_.find(node_id);
        return it == stop_calls_.end() ? 0 : it->second;
    }

    int total_stop_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& [_, calls] : stop_calls_) {
            total += calls;
        }
        return total;
    }

    int checks(const std::string& node_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = checks_.find(node_id);
        return it == checks_.end() ? 0 : it->second;
    }

    // Types of every launch request, successful or not.
    std::vector<nodefleet::NodeType> launch_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return launch_requests_;
    }

    std::vector<nodefleet::NodeType> launched_types() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return launched_types_;
    }

private:
    mutable std::mutex mutex_;
    int next_id_{0};
    int failing_launches_{0};
    bool reject_credential_{false};
    int reject_after_{-1};
    bool failing_stops_{false};
    nodefleet::HealthVerdict default_verdict_{nodefleet::HealthVerdict::HEALTHY};
    std::map<std::string, std::deque<nodefleet::HealthVerdict>> scripts_;
    std::map<std::string, int> stop_calls_;
    std::map<std::string, int> checks_;
    std::vector<nodefleet::NodeType> launch_requests_;
    std::vector<nodefleet::NodeType> launched_types_;
};

// Polls pred every couple of milliseconds until it holds or timeout passes.
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// Millisecond-scale timings so state machine tests finish quickly.
inline nodefleet::MonitorPolicy fast_policy() {
    nodefleet::MonitorPolicy policy;
    policy.boot_delay = std::chrono::milliseconds(10);
    policy.poll_interval = std::chrono::milliseconds(15);
    policy.check_timeout = std::chrono::milliseconds(10);
    return policy;
}

// Monitors that never get past the boot delay within a test.
inline nodefleet::MonitorPolicy parked_policy() {
    nodefleet::MonitorPolicy policy;
    policy.boot_delay = std::chrono::seconds(60);
    return policy;
}
