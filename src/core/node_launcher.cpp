#include "nodefleet/node_launcher.hpp"

#include <memory>

#include "nodefleet/errors.hpp"
#include "nodefleet/log.hpp"
#include "nodefleet/time.hpp"

namespace nodefleet {
    NodeLauncher::NodeLauncher(ProviderClient& provider, FleetRegistry& registry, DeathQueue& deaths,
                               TypeAlternator& alternator, MonitorPolicy policy, std::chrono::seconds lease)
        : provider_(provider), registry_(registry), deaths_(deaths),
          alternator_(alternator), policy_(policy), lease_(lease) {}

    Node NodeLauncher::launch(std::optional<NodeType> requested) {
        NodeType type = requested ? *requested : alternator_.next();

        NodeHandle handle;
        grpc::Status status = provider_.launch_node(type, lease_, &handle);
        if (!status.ok()) {
            log_error("❌ Error launching ", to_string(type), " node: ", status.error_message());
            throw LaunchError(status.error_code(), "launch of " + to_string(type) + " node failed: "
                              + status.error_message());
        }

        Node node;
        node.id = handle.id;
        node.host = handle.host;
        node.type = type;
        node.status = NodeStatus::BOOTING;
        node.consecutive_failures = 0;
        node.launched_at_ms = now_ms();
        node.expires_at_ms = handle.expires_ms;

        auto monitor = std::make_shared<HealthMonitor>(node.id, type, policy_, provider_, registry_, deaths_);
        if (!registry_.insert(node, monitor)) {
            throw LaunchError(grpc::StatusCode::ALREADY_EXISTS,
                              "provider returned node id " + node.id + " which is already tracked");
        }

        log_info("✅ Launched ", to_string(type), " node ", node.id, " (", node.host, ")");
        return node;
    }
} // namespace nodefleet
