#include <iostream>
#include <memory>
#include <string>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <stdexcept>
#include <grpcpp/grpcpp.h>

#include "nodefleet/config.hpp"
#include "nodefleet/log.hpp"
#include "nodefleet/provider_client.hpp"
#include "nodefleet/supervisor.hpp"

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

void signal_handler(int signal) {
    g_signal = signal;
    g_running.store(false, std::memory_order_relaxed);
}

int main(int argc, char* argv[]) {
    nodefleet::SupervisorConfig config;

    switch (nodefleet::parse_arguments(argc, argv, config, std::cerr)) {
        case nodefleet::ParseOutcome::HELP:
            nodefleet::print_usage(std::cout, argv[0]);
            return 0;
        case nodefleet::ParseOutcome::ERROR:
            nodefleet::print_usage(std::cerr, argv[0]);
            return 1;
        case nodefleet::ParseOutcome::RUN:
            break;
    }

    try {
        nodefleet::apply_environment(config, [](const char* name) -> const char* { return std::getenv(name); });
        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "❌ Error: " << e.what() << std::endl;
        return 1;
    }

    if (config.api_key.empty()) {
        std::cerr << "❌ Error: " << nodefleet::kApiKeyEnv << " is not set" << std::endl;
        std::cerr << "Please export your provider API key: " << nodefleet::kApiKeyEnv << "=your_key_here" << std::endl;
        return 1;
    }

    nodefleet::log_info("🛰️  nodefleet supervisor starting...");
    nodefleet::log_info("🎯 Provider: ", config.provider_address);
    nodefleet::log_info("📊 Node health polling interval: ", config.poll.count(), " seconds");
    nodefleet::log_info("🧬 Node type policy: ", nodefleet::type_policy_name(config.fixed_type));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto channel = grpc::CreateChannel(config.provider_address, grpc::InsecureChannelCredentials());
    nodefleet::GrpcProviderClient provider(channel, config.api_key);

    int code = nodefleet::run_supervisor(config, provider, g_running);
    if (g_signal != 0) {
        nodefleet::log_info("🛑 Received signal ", static_cast<int>(g_signal));
    }
    if (code != 0) {
        return code;
    }

    nodefleet::log_info("Bye! 👋");
    return 0;
}
