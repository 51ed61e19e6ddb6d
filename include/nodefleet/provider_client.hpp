#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "provisioner.grpc.pb.h"
#include "provisioner.pb.h"

#include "nodefleet/types.hpp"

namespace nodefleet {
    // The provisioning API as the supervisor sees it. Launch and stop report
    // through grpc::Status; health checks never fail, they yield a verdict.
    // A successful stop sets stopped_ms to the provider's stop time.
    class ProviderClient {
    public:
        virtual ~ProviderClient() = default;

        virtual grpc::Status launch_node(NodeType type, std::chrono::seconds lease, NodeHandle* handle) = 0;
        virtual grpc::Status stop_node(const std::string& node_id, int64_t* stopped_ms) = 0;
        virtual HealthVerdict check_health(const std::string& node_id, std::chrono::milliseconds timeout) = 0;
    };

    NodeKind to_kind(NodeType type);
    bool from_kind(NodeKind kind, NodeType* type);

    class GrpcProviderClient final : public ProviderClient {
    public:
        GrpcProviderClient(std::shared_ptr<grpc::Channel> channel, std::string api_key);

        grpc::Status launch_node(NodeType type, std::chrono::seconds lease, NodeHandle* handle) override;
        grpc::Status stop_node(const std::string& node_id, int64_t* stopped_ms) override;
        HealthVerdict check_health(const std::string& node_id, std::chrono::milliseconds timeout) override;

    private:
        void authorize(grpc::ClientContext* context) const;

        std::unique_ptr<Provisioner::Stub> stub_;
        std::string api_key_;
    };

    inline constexpr const char* kApiKeyHeader = "x-api-key";
} // namespace nodefleet
