#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

#include "fake_provider.hpp"
#include "nodefleet/death_queue.hpp"
#include "nodefleet/errors.hpp"
#include "nodefleet/fleet_registry.hpp"
#include "nodefleet/node_launcher.hpp"
#include "nodefleet/replacement_controller.hpp"
#include "nodefleet/type_alternator.hpp"

using namespace std::chrono_literals;
using nodefleet::HealthVerdict;
using nodefleet::NodeType;

namespace {
    nodefleet::FleetPolicy fleet(int target, bool keep_running) {
        nodefleet::FleetPolicy policy;
        policy.target_count = target;
        policy.keep_running = keep_running;
        policy.launch_spacing = 0ms;
        return policy;
    }

    nodefleet::DeathNotice notice_for(const std::string& id) {
        return nodefleet::DeathNotice{id, NodeType::FAST, 3};
    }
}

class ReplacementControllerTest : public ::testing::Test {
protected:
    nodefleet::ReplacementController& controller(int target, bool keep_running,
                                                 nodefleet::MonitorPolicy policy = parked_policy()) {
        launcher_.emplace(provider, registry, deaths, alternator, policy);
        controller_.emplace(*launcher_, registry, fleet(target, keep_running));
        return *controller_;
    }

    FakeProvider provider;
    nodefleet::DeathQueue deaths;
    nodefleet::TypeAlternator alternator;
    nodefleet::FleetRegistry registry;

private:
    std::optional<nodefleet::NodeLauncher> launcher_;
    std::optional<nodefleet::ReplacementController> controller_;
};

TEST_F(ReplacementControllerTest, FillAssignsAlternatingTypes) {
    auto& rc = controller(3, false);
    EXPECT_EQ(rc.fill(), 3u);
    EXPECT_EQ(registry.size(), 3u);
    EXPECT_EQ(provider.launched_types(),
              (std::vector<NodeType>{NodeType::FAST, NodeType::LARGE, NodeType::FAST}));
}

TEST_F(ReplacementControllerTest, FillWithNoLaunchesIsStartupError) {
    auto& rc = controller(2, true);
    provider.fail_next_launches(10);
    EXPECT_THROW(rc.fill(), nodefleet::StartupError);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ReplacementControllerTest, RejectedCredentialIsStartupError) {
    auto& rc = controller(3, true);
    provider.reject_credential(true);
    EXPECT_THROW(rc.fill(), nodefleet::StartupError);
    // the first rejection aborts the fill
    EXPECT_EQ(provider.launch_requests().size(), 1u);
}

TEST_F(ReplacementControllerTest, PartialFillWithoutKeepRunningIsAccepted) {
    auto& rc = controller(2, false);
    provider.fail_next_launches(1);
    EXPECT_EQ(rc.fill(), 1u);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(provider.launch_requests().size(), 2u);
}

TEST_F(ReplacementControllerTest, PartialFillWithKeepRunningTopsUp) {
    auto& rc = controller(2, true);
    provider.fail_next_launches(1);
    EXPECT_EQ(rc.fill(), 2u);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(provider.launch_requests(),
              (std::vector<NodeType>{NodeType::FAST, NodeType::LARGE, NodeType::FAST}));
}

TEST_F(ReplacementControllerTest, DeadNodeIsReplacedWithNextAlternatorType) {
    auto& rc = controller(2, true, fast_policy());
    provider.script("node-1", {HealthVerdict::UNHEALTHY, HealthVerdict::UNHEALTHY, HealthVerdict::UNHEALTHY});
    rc.fill();

    auto notice = deaths.pop_for(3000ms);
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->node_id, "node-1");
    rc.handle_death(*notice);

    EXPECT_FALSE(registry.exists("node-1"));
    EXPECT_EQ(provider.stop_calls("node-1"), 1);
    EXPECT_EQ(registry.size(), 2u);
    auto replacement = registry.get("node-3");
    ASSERT_TRUE(replacement.has_value());
    EXPECT_EQ(replacement->type, NodeType::FAST);
    EXPECT_EQ(provider.launched_types(),
              (std::vector<NodeType>{NodeType::FAST, NodeType::LARGE, NodeType::FAST}));
}

TEST_F(ReplacementControllerTest, EachDeathGetsExactlyOneReplacement) {
    auto& rc = controller(3, true);
    rc.fill();
    size_t before = provider.launch_requests().size();

    rc.handle_death(notice_for("node-2"));
    EXPECT_EQ(provider.launch_requests().size(), before + 1);
    rc.handle_death(notice_for("node-1"));
    EXPECT_EQ(provider.launch_requests().size(), before + 2);

    EXPECT_EQ(registry.size(), 3u);
    // alternation is fleet-wide, independent of which slot died
    EXPECT_EQ(provider.launched_types(),
              (std::vector<NodeType>{NodeType::FAST, NodeType::LARGE, NodeType::FAST,
                                     NodeType::LARGE, NodeType::FAST}));
}

TEST_F(ReplacementControllerTest, ConcurrentDeathsAreEachReplacedOnce) {
    auto& rc = controller(3, true, fast_policy());
    provider.script("node-1", {HealthVerdict::UNHEALTHY, HealthVerdict::UNHEALTHY, HealthVerdict::UNHEALTHY});
    provider.script("node-2", {HealthVerdict::UNHEALTHY, HealthVerdict::UNHEALTHY, HealthVerdict::UNHEALTHY});
    rc.fill();

    for (int i = 0; i < 2; i++) {
        auto notice = deaths.pop_for(3000ms);
        ASSERT_TRUE(notice.has_value());
        rc.handle_death(*notice);
    }

    EXPECT_EQ(registry.size(), 3u);
    EXPECT_EQ(provider.launch_requests().size(), 5u);
    EXPECT_FALSE(registry.exists("node-1"));
    EXPECT_FALSE(registry.exists("node-2"));
    EXPECT_TRUE(registry.exists("node-3"));
}

TEST_F(ReplacementControllerTest, WithoutKeepRunningFleetShrinks) {
    auto& rc = controller(2, false, fast_policy());
    provider.script("node-2", {HealthVerdict::UNHEALTHY, HealthVerdict::UNHEALTHY, HealthVerdict::UNHEALTHY});
    rc.fill();

    auto notice = deaths.pop_for(3000ms);
    ASSERT_TRUE(notice.has_value());
    rc.handle_death(*notice);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.exists("node-1"));
    EXPECT_EQ(provider.launch_requests().size(), 2u);
    EXPECT_FALSE(deaths.pop_for(50ms).has_value());
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ReplacementControllerTest, FailedReplacementIsRetriedOnNextDeath) {
    auto& rc = controller(2, true);
    rc.fill();

    provider.fail_next_launches(1);
    rc.handle_death(notice_for("node-1"));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(rc.launch_failures(), 1u);

    rc.handle_death(notice_for("node-2"));
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(rc.launches_attempted(), 5u);
}

TEST_F(ReplacementControllerTest, RejectedReplacementDoesNotThrow) {
    auto& rc = controller(2, true);
    rc.fill();

    provider.reject_credential(true);
    EXPECT_NO_THROW(rc.handle_death(notice_for("node-1")));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ReplacementControllerTest, ShutdownCutsLaunchSpacingShort) {
    std::atomic<bool> running{true};
    nodefleet::FleetPolicy policy = fleet(3, true);
    policy.launch_spacing = 10s;
    nodefleet::NodeLauncher launcher(provider, registry, deaths, alternator, parked_policy());
    nodefleet::ReplacementController rc(launcher, registry, policy, &running);

    std::thread stopper([&] {
        wait_until([&] { return provider.launch_requests().size() == 1u; });
        running.store(false);
    });

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(rc.fill(), 1u);
    auto elapsed = std::chrono::steady_clock::now() - started;
    stopper.join();

    EXPECT_LT(elapsed, 2s);
    EXPECT_EQ(provider.launch_requests().size(), 1u);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ReplacementControllerTest, NoLaunchesOnceShutdownRequested) {
    std::atomic<bool> running{false};
    nodefleet::NodeLauncher launcher(provider, registry, deaths, alternator, parked_policy());
    nodefleet::ReplacementController rc(launcher, registry, fleet(2, true), &running);

    EXPECT_EQ(rc.fill(), 0u);
    EXPECT_TRUE(provider.launch_requests().empty());
}

TEST_F(ReplacementControllerTest, NoReplacementAfterShutdownRequested) {
    std::atomic<bool> running{true};
    nodefleet::NodeLauncher launcher(provider, registry, deaths, alternator, parked_policy());
    nodefleet::ReplacementController rc(launcher, registry, fleet(2, true), &running);
    rc.fill();

    running.store(false);
    rc.handle_death(notice_for("node-1"));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(provider.launch_requests().size(), 2u);
}
