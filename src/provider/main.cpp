#include <iostream>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include <thread>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <chrono>
#include <optional>

#include "provisioner.grpc.pb.h"
#include "provisioner.pb.h"

#include "nodefleet/provider_client.hpp"
#include "nodefleet/simulated_provider.hpp"
#include "nodefleet/time.hpp"

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;

std::atomic<bool> g_running{true};
std::unique_ptr<Server> g_server;

class ProvisionerServiceImpl final : public nodefleet::Provisioner::Service {
public:
    ProvisionerServiceImpl(double fail_rate, std::string api_key)
        : provider_(fail_rate), api_key_(std::move(api_key)) {}

    Status Launch(ServerContext* context,
                  const nodefleet::LaunchRequest* request,
                  nodefleet::LaunchResponse* response) override {
        if (!authorized(context)) {
            std::cout << "🚫 Launch rejected: bad credential from " << context->peer() << std::endl;
            return Status(grpc::StatusCode::UNAUTHENTICATED, "invalid API key");
        }

        nodefleet::NodeType type;
        if (!nodefleet::from_kind(request->kind(), &type)) {
            return Status(grpc::StatusCode::INVALID_ARGUMENT, "node kind must be fast or large");
        }
        if (request->lease_seconds() <= 0) {
            return Status(grpc::StatusCode::INVALID_ARGUMENT, "lease must be positive");
        }

        nodefleet::SimulatedNode node = provider_.launch(type, request->lease_seconds(), nodefleet::now_ms());
        response->set_node_id(node.id);
        response->set_host(node.host);
        response->set_expires_unix(node.expires_ms / 1000);

        std::cout << "🚀 Launched " << nodefleet::to_string(type) << " node " << node.id
                  << " (expires " << nodefleet::format_clock(node.expires_ms) << ", total: "
                  << provider_.size() << " nodes)" << std::endl;
        return Status::OK;
    }

    Status Stop(ServerContext* context,
                const nodefleet::StopRequest* request,
                nodefleet::StopResponse* response) override {
        if (!authorized(context)) {
            return Status(grpc::StatusCode::UNAUTHENTICATED, "invalid API key");
        }
        if (!provider_.stop(request->node_id())) {
            std::cout << "⚠️ Stop requested for unknown node " << request->node_id() << std::endl;
            return Status(grpc::StatusCode::NOT_FOUND, "no such node: " + request->node_id());
        }
        response->set_stopped_unix(nodefleet::now_ms() / 1000);
        std::cout << "🛑 Stopped node " << request->node_id() << " (total: " << provider_.size()
                  << " nodes)" << std::endl;
        return Status::OK;
    }

    Status CheckHealth(ServerContext* context,
                       const nodefleet::HealthRequest* request,
                       nodefleet::HealthResponse* response) override {
        if (!authorized(context)) {
            return Status(grpc::StatusCode::UNAUTHENTICATED, "invalid API key");
        }
        std::optional<bool> healthy = provider_.check(request->node_id(), nodefleet::now_ms());
        if (!healthy) {
            return Status(grpc::StatusCode::NOT_FOUND, "no such node: " + request->node_id());
        }
        response->set_healthy(*healthy);
        std::cout << (*healthy ? "💗 " : "💔 ") << request->node_id()
                  << (*healthy ? " is healthy" : " failed its health check") << std::endl;
        return Status::OK;
    }

private:
    bool authorized(ServerContext* context) const {
        if (api_key_.empty()) {
            return true;
        }
        const auto& metadata = context->client_metadata();
        auto it = metadata.find(nodefleet::kApiKeyHeader);
        if (it == metadata.end()) {
            return false;
        }
        return std::string(it->second.data(), it->second.size()) == api_key_;
    }

    nodefleet::SimulatedProvider provider_;
    std::string api_key_;
};

void signal_handler(int signal) {
    (void)signal;
    g_running.store(false);
}

void print_usage(const char* program_name) {
    std::cout << "🏭 nodefleet provider - local simulated provisioning service\n" << std::endl;
    std::cout << "Usage: " << program_name << " [OPTIONS]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  -l, --listen <address>    Listen address (default: 0.0.0.0:50051)" << std::endl;
    std::cout << "      --fail-rate <0..1>    Probability a health check fails (default: 0)" << std::endl;
    std::cout << "      --api-key <key>       Expected credential (default: $NODEFLEET_API_KEY)" << std::endl;
    std::cout << "  -h, --help                Show this help message\n" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string server_address("0.0.0.0:50051");
    double fail_rate = 0.0;
    std::string api_key;
    if (const char* env_key = std::getenv("NODEFLEET_API_KEY")) {
        api_key = env_key;
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else if ((arg == "-l" || arg == "--listen") && i + 1 < argc) {
            server_address = argv[++i];
        }
        else if (arg == "--fail-rate" && i + 1 < argc) {
            try {
                fail_rate = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "❌ Error: --fail-rate expects a number" << std::endl;
                return 1;
            }
            if (fail_rate < 0.0 || fail_rate > 1.0) {
                std::cerr << "❌ Error: --fail-rate must be between 0 and 1" << std::endl;
                return 1;
            }
        }
        else if (arg == "--api-key" && i + 1 < argc) {
            api_key = argv[++i];
        }
        else {
            std::cerr << "❌ Error: Unknown or incomplete argument '" << arg << "'" << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ProvisionerServiceImpl service(fail_rate, api_key);

    ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    g_server = builder.BuildAndStart();
    if (!g_server) {
        std::cerr << "❌ Failed to listen on " << server_address << std::endl;
        return 1;
    }

    std::cout << "🚀 nodefleet provider listening on " << server_address << std::endl;
    std::cout << "🎲 Health check failure rate: " << fail_rate << std::endl;
    if (api_key.empty()) {
        std::cout << "⚠️ No API key configured, accepting every caller" << std::endl;
    }
    std::cout << "🛑 Press Ctrl+C to stop" << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::thread server_thread([&]{ g_server->Wait(); });
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n🛑 Shutting down gracefully..." << std::endl;
    g_server->Shutdown();
    server_thread.join();

    std::cout << "👋 Provider shutdown complete" << std::endl;
    return 0;
}
