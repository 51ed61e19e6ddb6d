#include "nodefleet/config.hpp"

#include <limits>
#include <stdexcept>

namespace nodefleet {
    namespace {
        long parse_long(const std::string& option, const std::string& value) {
            size_t consumed = 0;
            long parsed = 0;
            try {
                parsed = std::stol(value, &consumed);
            } catch (const std::exception&) {
                throw std::invalid_argument(option + " expects an integer, got '" + value + "'");
            }
            if (consumed != value.size()) {
                throw std::invalid_argument(option + " expects an integer, got '" + value + "'");
            }
            return parsed;
        }

        int parse_int(const std::string& option, const std::string& value) {
            long parsed = parse_long(option, value);
            if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
                throw std::invalid_argument(option + " expects an integer in range, got '" + value + "'");
            }
            return static_cast<int>(parsed);
        }

        void check_bound(const char* what, std::chrono::seconds value, std::chrono::seconds limit) {
            if (value > limit) {
                throw std::invalid_argument(std::string(what) + " cannot exceed " + std::to_string(limit.count())
                                            + " seconds");
            }
        }
    }

    MonitorPolicy SupervisorConfig::monitor_policy() const {
        MonitorPolicy policy;
        policy.boot_delay = boot_delay;
        policy.poll_interval = poll;
        policy.check_timeout = check_timeout;
        policy.burst_attempts = burst_attempts;
        policy.strike_limit = strike_limit;
        return policy;
    }

    FleetPolicy SupervisorConfig::fleet_policy() const {
        FleetPolicy policy;
        policy.target_count = nodes;
        policy.keep_running = keep_running;
        policy.launch_spacing = launch_spacing;
        return policy;
    }

    void SupervisorConfig::validate() const {
        if (nodes < 1) {
            throw std::invalid_argument("Number of nodes must be at least 1");
        }
        if (poll.count() <= 0) {
            throw std::invalid_argument("Poll interval must be positive");
        }
        if (boot_delay.count() < 0) {
            throw std::invalid_argument("Boot delay cannot be negative");
        }
        if (check_timeout.count() <= 0) {
            throw std::invalid_argument("Health check timeout must be positive");
        }
        if (lease.count() <= 0) {
            throw std::invalid_argument("Lease must be positive");
        }
        check_bound("Poll interval", poll, kMaxInterval);
        check_bound("Boot delay", boot_delay, kMaxInterval);
        check_bound("Health check timeout", check_timeout, kMaxInterval);
        check_bound("Lease", lease, kMaxLease);
        if (burst_attempts < 1 || strike_limit < 1) {
            throw std::invalid_argument("Burst attempts and strike limit must be at least 1");
        }
        if (provider_address.empty()) {
            throw std::invalid_argument("Provider address cannot be empty");
        }
    }

    std::optional<NodeType> parse_type_policy(const std::string& value) {
        if (value == "fast") {
            return NodeType::FAST;
        }
        if (value == "large") {
            return NodeType::LARGE;
        }
        if (value == "alternate") {
            return std::nullopt;
        }
        throw std::invalid_argument("--type must be one of fast, large, alternate (got '" + value + "')");
    }

    std::string type_policy_name(const std::optional<NodeType>& fixed_type) {
        return fixed_type ? to_string(*fixed_type) : "alternate";
    }

    void print_usage(std::ostream& out, const char* program_name) {
        out << "🛰️  nodefleet supervisor - keeps a fleet of provider nodes alive\n" << std::endl;
        out << "Usage: " << program_name << " [OPTIONS]" << std::endl;
        out << "\nOptions:" << std::endl;
        out << "  -n, --nodes <count>         Number of nodes to keep (default: 1)" << std::endl;
        out << "  -k, --keep-running          Relaunch nodes when they die" << std::endl;
        out << "  -p, --poll <seconds>        Health check interval (default: 30, env " << kPollEnv << ")" << std::endl;
        out << "  -t, --type <type>           fast, large or alternate (default: alternate)" << std::endl;
        out << "      --no-rm                 Keep nodes running after the supervisor exits" << std::endl;
        out << "  -s, --provider <address>    Provisioning service (default: localhost:50051)" << std::endl;
        out << "      --boot-delay <seconds>  Wait before the first health check (default: 5)" << std::endl;
        out << "      --check-timeout <secs>  Health check timeout (default: 5)" << std::endl;
        out << "      --lease <seconds>       Lease requested per node (default: 3600)" << std::endl;
        out << "  -h, --help                  Show this help message" << std::endl;
        out << "\nEnvironment:" << std::endl;
        out << "  " << kApiKeyEnv << "           API credential (required)" << std::endl;
        out << "\nExamples:" << std::endl;
        out << "  " << program_name << " --nodes 3 --keep-running" << std::endl;
        out << "  " << program_name << " -n 2 -t large --poll 10 --no-rm\n" << std::endl;
    }

    ParseOutcome parse_arguments(int argc, const char* const* argv, SupervisorConfig& config, std::ostream& err) {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            auto value = [&](std::string* out) {
                if (i + 1 < argc) {
                    *out = argv[++i];
                    return true;
                }
                err << "❌ Error: " << arg << " requires a value" << std::endl;
                return false;
            };

            try {
                std::string v;
                if (arg == "-h" || arg == "--help") {
                    return ParseOutcome::HELP;
                }
                else if (arg == "-k" || arg == "--keep-running") {
                    config.keep_running = true;
                }
                else if (arg == "--no-rm") {
                    config.no_rm = true;
                }
                else if (arg == "-n" || arg == "--nodes") {
                    if (!value(&v)) return ParseOutcome::ERROR;
                    config.nodes = parse_int(arg, v);
                }
                else if (arg == "-p" || arg == "--poll") {
                    if (!value(&v)) return ParseOutcome::ERROR;
                    config.poll = std::chrono::seconds(parse_long(arg, v));
                    config.poll_from_cli = true;
                }
                else if (arg == "-t" || arg == "--type") {
                    if (!value(&v)) return ParseOutcome::ERROR;
                    config.fixed_type = parse_type_policy(v);
                }
                else if (arg == "-s" || arg == "--provider") {
                    if (!value(&v)) return ParseOutcome::ERROR;
                    config.provider_address = v;
                }
                else if (arg == "--boot-delay") {
                    if (!value(&v)) return ParseOutcome::ERROR;
                    config.boot_delay = std::chrono::seconds(parse_long(arg, v));
                }
                else if (arg == "--check-timeout") {
                    if (!value(&v)) return ParseOutcome::ERROR;
                    config.check_timeout = std::chrono::seconds(parse_long(arg, v));
                }
                else if (arg == "--lease") {
                    if (!value(&v)) return ParseOutcome::ERROR;
                    config.lease = std::chrono::seconds(parse_long(arg, v));
                }
                else {
                    err << "❌ Error: Unknown argument '" << arg << "'" << std::endl;
                    return ParseOutcome::ERROR;
                }
            } catch (const std::invalid_argument& e) {
                err << "❌ Error: " << e.what() << std::endl;
                return ParseOutcome::ERROR;
            }
        }
        return ParseOutcome::RUN;
    }

    void apply_environment(SupervisorConfig& config, const EnvLookup& lookup) {
        if (const char* key = lookup(kApiKeyEnv)) {
            config.api_key = key;
        }
        if (config.poll_from_cli) {
            return;
        }
        if (const char* poll = lookup(kPollEnv)) {
            std::string value = poll;
            if (!value.empty()) {
                config.poll = std::chrono::seconds(parse_long(kPollEnv, value));
            }
        }
    }
} // namespace nodefleet
