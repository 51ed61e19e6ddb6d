#include "nodefleet/provider_client.hpp"

#include <utility>

#include "nodefleet/log.hpp"

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;

namespace nodefleet {
    namespace {
        // Deadline for launch and stop calls.
        constexpr auto kControlCallDeadline = std::chrono::seconds(60);
    }

    NodeKind to_kind(NodeType type) {
        switch (type) {
            case NodeType::FAST:  return NODE_KIND_FAST;
            case NodeType::LARGE: return NODE_KIND_LARGE;
            default:              return NODE_KIND_UNSPECIFIED;
        }
    }

    bool from_kind(NodeKind kind, NodeType* type) {
        switch (kind) {
            case NODE_KIND_FAST:  *type = NodeType::FAST;  return true;
            case NODE_KIND_LARGE: *type = NodeType::LARGE; return true;
            default:              return false;
        }
    }

    GrpcProviderClient::GrpcProviderClient(std::shared_ptr<Channel> channel, std::string api_key)
        : stub_(Provisioner::NewStub(channel)), api_key_(std::move(api_key)) {}

    void GrpcProviderClient::authorize(ClientContext* context) const {
        context->AddMetadata(kApiKeyHeader, api_key_);
    }

    Status GrpcProviderClient::launch_node(NodeType type, std::chrono::seconds lease, NodeHandle* handle) {
        LaunchRequest request;
        request.set_kind(to_kind(type));
        request.set_lease_seconds(lease.count());

        LaunchResponse response;
        ClientContext context;
        authorize(&context);
        context.set_deadline(std::chrono::system_clock::now() + kControlCallDeadline);

        Status status = stub_->Launch(&context, request, &response);
        if (!status.ok()) {
            return status;
        }
        if (response.node_id().empty()) {
            return Status(grpc::StatusCode::INTERNAL, "provider returned an empty node id");
        }

        handle->id = response.node_id();
        handle->host = response.host();
        handle->expires_ms = response.expires_unix() * 1000;
        return Status::OK;
    }

    Status GrpcProviderClient::stop_node(const std::string& node_id, int64_t* stopped_ms) {
        StopRequest request;
        request.set_node_id(node_id);

        StopResponse response;
        ClientContext context;
        authorize(&context);
        context.set_deadline(std::chrono::system_clock::now() + kControlCallDeadline);

        Status status = stub_->Stop(&context, request, &response);
        if (status.ok()) {
            *stopped_ms = response.stopped_unix() * 1000;
        }
        return status;
    }

    HealthVerdict GrpcProviderClient::check_health(const std::string& node_id, std::chrono::milliseconds timeout) {
        HealthRequest request;
        request.set_node_id(node_id);

        HealthResponse response;
        ClientContext context;
        authorize(&context);
        context.set_deadline(std::chrono::system_clock::now() + timeout);

        Status status = stub_->CheckHealth(&context, request, &response);
        if (!status.ok()) {
            log_error("🔍 Health check failed for ", node_id, ": ", status.error_message(),
                      " (code ", static_cast<int>(status.error_code()), ")");
            return HealthVerdict::TRANSPORT_ERROR;
        }
        return response.healthy() ? HealthVerdict::HEALTHY : HealthVerdict::UNHEALTHY;
    }
} // namespace nodefleet
