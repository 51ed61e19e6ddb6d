#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "nodefleet/health_monitor.hpp"
#include "nodefleet/replacement_controller.hpp"
#include "nodefleet/types.hpp"

namespace nodefleet {
    inline constexpr const char* kApiKeyEnv = "NODEFLEET_API_KEY";
    inline constexpr const char* kPollEnv = "NODEFLEET_POLL";

    // Upper bounds accepted by validate(): one day for poll, boot delay and
    // check timeout, thirty days for a lease.
    inline constexpr std::chrono::seconds kMaxInterval{86400};
    inline constexpr std::chrono::seconds kMaxLease{30 * 86400};

    struct SupervisorConfig {
        int nodes{1};
        bool keep_running{false};
        bool no_rm{false};
        std::optional<NodeType> fixed_type;  // empty means alternate
        std::chrono::seconds poll{30};
        bool poll_from_cli{false};
        std::chrono::seconds boot_delay{5};
        std::chrono::seconds check_timeout{5};
        std::chrono::seconds lease{3600};
        std::chrono::milliseconds launch_spacing{2000};
        int burst_attempts{3};
        int strike_limit{3};
        std::string provider_address{"localhost:50051"};
        std::string api_key;

        MonitorPolicy monitor_policy() const;
        FleetPolicy fleet_policy() const;

        // Throws std::invalid_argument on an out-of-range value.
        void validate() const;
    };

    enum class ParseOutcome {
        RUN,
        HELP,
        ERROR
    };

    using EnvLookup = std::function<const char*(const char*)>;

    // "fast" / "large" yield that type, "alternate" yields an empty optional.
    // Throws std::invalid_argument for anything else.
    std::optional<NodeType> parse_type_policy(const std::string& value);
    std::string type_policy_name(const std::optional<NodeType>& fixed_type);

    ParseOutcome parse_arguments(int argc, const char* const* argv, SupervisorConfig& config, std::ostream& err);

    // Reads the API key and, unless --poll was given, the poll override.
    // Throws std::invalid_argument on a malformed poll value.
    void apply_environment(SupervisorConfig& config, const EnvLookup& lookup);

    void print_usage(std::ostream& out, const char* program_name);
} // namespace nodefleet
