/**
 * @file topology_manager_test.cpp
 * @brief Tests for agent registration, clustering, health and lifecycle
 */

#include <gtest/gtest.h>
#include "topology/topology_manager.h"
#include "events/event_bus.h"
#include "network/in_memory_transport.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <thread>

namespace swarmnet {
namespace tests {

using namespace std::chrono_literals;
using events::DomainEventType;
using topology::NodeState;
using topology::TopologyConfig;
using topology::TopologyManager;

namespace {

bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

} // namespace

class TopologyManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = std::make_shared<network::InMemoryNetwork>();
        transport_config_.heartbeat_interval = std::chrono::hours(1);
        transport_config_.discovery_interval = std::chrono::hours(1);

        config_.metrics_interval = std::chrono::hours(1);
        config_.health_check_interval = std::chrono::hours(1);
    }

    void TearDown() override {
        if (manager_) {
            manager_->stop();
        }
        manager_.reset();
    }

    TopologyManager& manager() {
        if (!manager_) {
            manager_ = std::make_unique<TopologyManager>(bus_, config_);
        }
        return *manager_;
    }

    std::shared_ptr<agents::P2PAgent> makeAgent(const std::string& id, uint16_t port,
                                                agents::AgentRole role = agents::AgentRole::DEVELOPER) {
        agents::AgentCapabilities caps;
        caps.specialized_skills = {"implementation"};
        caps.can_execute_code = true;
        auto transport = std::make_shared<network::InMemoryTransport>(network_, id, "127.0.0.1", port,
                                                                      transport_config_);
        return std::make_shared<agents::P2PAgent>(id, role, caps, transport, bus_);
    }

    void registerAgents(size_t count) {
        for (size_t i = 0; i < count; ++i) {
            manager().registerAgent(makeAgent("agent_" + std::to_string(i), static_cast<uint16_t>(7100 + i)));
        }
    }

    size_t managerEvents(DomainEventType type) {
        size_t count = 0;
        for (const auto& event : bus_.getHistory(type, 1000)) {
            if (event.source == "topology_manager") {
                count++;
            }
        }
        return count;
    }

    std::shared_ptr<network::InMemoryNetwork> network_;
    network::TransportConfig transport_config_;
    TopologyConfig config_;
    events::EventBus bus_;
    std::unique_ptr<TopologyManager> manager_;
};

TEST(NetworkHealthTest, Formula) {
    EXPECT_DOUBLE_EQ(topology::computeNetworkHealth(0, 0, 0, 3.0), 100.0);
    EXPECT_DOUBLE_EQ(topology::computeNetworkHealth(4, 6, 1, 3.0), 75.0);
    EXPECT_DOUBLE_EQ(topology::computeNetworkHealth(3, 0, 0, 3.0), 25.0);
    EXPECT_DOUBLE_EQ(topology::computeNetworkHealth(2, 12, 1, 3.0), 100.0);
    EXPECT_DOUBLE_EQ(topology::computeNetworkHealth(2, 2, 1, 0.0), 100.0);
}

TEST_F(TopologyManagerTest, StartAndStopPublishLifecycleEvents) {
    EXPECT_TRUE(manager().start());
    EXPECT_FALSE(manager().start());
    EXPECT_TRUE(manager().isRunning());
    EXPECT_EQ(managerEvents(DomainEventType::SYSTEM_STARTUP), 1u);

    registerAgents(2);
    auto agent = manager().getAgent("agent_0");

    manager().stop();
    EXPECT_FALSE(manager().isRunning());
    EXPECT_EQ(manager().nodeCount(), 0u);
    EXPECT_TRUE(manager().getTopology().connections.empty());
    EXPECT_FALSE(agent->isRunning());
    EXPECT_EQ(managerEvents(DomainEventType::SYSTEM_SHUTDOWN), 1u);

    manager().stop();
    EXPECT_EQ(managerEvents(DomainEventType::SYSTEM_SHUTDOWN), 1u);
}

TEST_F(TopologyManagerTest, RegistrationConnectsToFirstSeeds) {
    registerAgents(5);

    EXPECT_EQ(manager().nodeCount(), 5u);
    EXPECT_EQ(manager().getNodeIds(), (std::vector<std::string>{"agent_0", "agent_1", "agent_2", "agent_3", "agent_4"}));

    auto info = manager().getNodeInfo("agent_4");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, NodeState::CONNECTED);
    EXPECT_EQ(info->port, 7104);
    EXPECT_EQ(info->connections, (std::vector<std::string>{"agent_0", "agent_1", "agent_2"}));

    auto first = manager().getNodeInfo("agent_0");
    EXPECT_EQ(first->connections, (std::vector<std::string>{"agent_1", "agent_2", "agent_3", "agent_4"}));

    // 1 + 2 + 3 + 3 seed links, each stored in both directions
    EXPECT_EQ(manager().getTopology().connections.size(), 18u);
    EXPECT_EQ(manager().getAgent("agent_4")->getConnectedPeers().size(), 3u);
    EXPECT_EQ(manager().getNodeState("agent_9"), NodeState::UNREGISTERED);
}

TEST_F(TopologyManagerTest, RegistrationPublishesEvent) {
    registerAgents(2);

    auto registered = bus_.getHistory(DomainEventType::AGENT_REGISTERED, 1000);
    std::vector<nlohmann::json> from_manager;
    for (const auto& event : registered) {
        if (event.source == "topology_manager") {
            from_manager.push_back(event.payload);
        }
    }
    ASSERT_EQ(from_manager.size(), 2u);
    EXPECT_EQ(from_manager[1]["agentId"], "agent_1");
    EXPECT_EQ(from_manager[1]["seedConnections"], nlohmann::json::array({"agent_0"}));
}

TEST_F(TopologyManagerTest, RegistrationRejectsNullAndDuplicates) {
    EXPECT_THROW(manager().registerAgent(nullptr), std::invalid_argument);

    registerAgents(1);
    auto duplicate = makeAgent("agent_0", 7199);
    EXPECT_THROW(manager().registerAgent(duplicate), std::invalid_argument);
    EXPECT_FALSE(duplicate->isRunning());
    EXPECT_EQ(manager().nodeCount(), 1u);
}

TEST_F(TopologyManagerTest, RegistrationFailsWhenAgentCannotStart) {
    registerAgents(1);

    auto clash = makeAgent("agent_clash", 7100);
    EXPECT_THROW(manager().registerAgent(clash), std::runtime_error);
    EXPECT_EQ(manager().nodeCount(), 1u);
    EXPECT_EQ(manager().getNodeState("agent_clash"), NodeState::UNREGISTERED);
}

TEST_F(TopologyManagerTest, ClustersChangedOnlyOnChange) {
    registerAgents(1);
    EXPECT_EQ(managerEvents(DomainEventType::CLUSTERS_CHANGED), 0u);

    manager().registerAgent(makeAgent("agent_1", 7101));
    EXPECT_EQ(managerEvents(DomainEventType::CLUSTERS_CHANGED), 1u);

    auto topology = manager().getTopology();
    ASSERT_EQ(topology.clusters.size(), 1u);
    EXPECT_EQ(topology.clusters[0].id, "cluster_0");

    manager().updateClusters();
    EXPECT_EQ(managerEvents(DomainEventType::CLUSTERS_CHANGED), 1u);

    manager().registerAgent(makeAgent("agent_2", 7102));
    EXPECT_EQ(managerEvents(DomainEventType::CLUSTERS_CHANGED), 2u);
    EXPECT_EQ(manager().getTopology().clusters[0].members.size(), 3u);
}

TEST_F(TopologyManagerTest, UnregisterRemovesNodeAndEdges) {
    registerAgents(3);
    auto agent = manager().getAgent("agent_2");

    EXPECT_TRUE(manager().unregisterAgent("agent_2"));
    EXPECT_FALSE(manager().unregisterAgent("agent_2"));
    EXPECT_FALSE(agent->isRunning());
    EXPECT_EQ(manager().nodeCount(), 2u);

    auto removed = bus_.getHistory(DomainEventType::NODE_REMOVED);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].payload["nodeId"], "agent_2");
    EXPECT_EQ(removed[0].payload["edgesRemoved"], 4);

    auto topology = manager().getTopology();
    for (const auto& connection : topology.connections) {
        EXPECT_NE(connection.from, "agent_2");
        EXPECT_NE(connection.to, "agent_2");
    }
    ASSERT_EQ(topology.clusters.size(), 1u);
    EXPECT_EQ(topology.clusters[0].members, (std::set<std::string>{"agent_0", "agent_1"}));
    EXPECT_EQ(topology.bridges.count("agent_2"), 0u);

    EXPECT_FALSE(manager().getNodeInfo("agent_2").has_value());
    EXPECT_EQ(manager().getNodeState("agent_2"), NodeState::UNREGISTERED);
    EXPECT_FALSE(manager().findPath("agent_0", "agent_2").has_value());
}

TEST_F(TopologyManagerTest, FindPathOverRegisteredNodes) {
    config_.max_seed_peers = 1;
    registerAgents(3);

    auto path = manager().findPath("agent_1", "agent_2");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, (std::vector<std::string>{"agent_1", "agent_0", "agent_2"}));

    auto self = manager().findPath("agent_1", "agent_1");
    ASSERT_TRUE(self.has_value());
    EXPECT_EQ(self->size(), 1u);

    EXPECT_FALSE(manager().findPath("agent_1", "agent_7").has_value());
}

TEST_F(TopologyManagerTest, ConnectAndDisconnectNodes) {
    config_.max_seed_peers = 1;
    registerAgents(3);

    ASSERT_TRUE(manager().connectNodes("agent_1", "agent_2"));
    EXPECT_EQ(manager().findPath("agent_1", "agent_2")->size(), 2u);
    EXPECT_FALSE(manager().connectNodes("agent_1", "agent_1"));
    EXPECT_FALSE(manager().connectNodes("agent_1", "agent_9"));

    ASSERT_TRUE(manager().disconnectNodes("agent_1", "agent_2"));
    EXPECT_EQ(manager().findPath("agent_1", "agent_2")->size(), 3u);
    EXPECT_FALSE(manager().getAgent("agent_1")->getTransport().isConnectedTo("agent_2"));
}

TEST_F(TopologyManagerTest, CuttingOffMiddleNodeSplitsChain) {
    config_.max_seed_peers = 0;
    manager().registerAgent(makeAgent("agent_a", 7201));
    manager().registerAgent(makeAgent("agent_b", 7202));
    manager().registerAgent(makeAgent("agent_c", 7203));

    ASSERT_TRUE(manager().connectNodes("agent_a", "agent_b"));
    ASSERT_TRUE(manager().connectNodes("agent_b", "agent_c"));
    ASSERT_EQ(manager().getTopology().clusters.size(), 1u);
    EXPECT_EQ(manager().findPath("agent_a", "agent_c")->size(), 3u);

    ASSERT_TRUE(manager().disconnectNodes("agent_a", "agent_b"));
    ASSERT_TRUE(manager().disconnectNodes("agent_b", "agent_c"));

    auto topology = manager().getTopology();
    EXPECT_TRUE(topology.clusters.empty());
    EXPECT_TRUE(topology.connections.empty());
    EXPECT_TRUE(topology.bridges.empty());
    EXPECT_FALSE(manager().findPath("agent_a", "agent_c").has_value());
    EXPECT_EQ(manager().updateNetworkMetrics().cluster_count, 0u);
}

TEST_F(TopologyManagerTest, JoiningTwoPairsFormsOneCluster) {
    config_.max_seed_peers = 0;
    for (const auto& [id, port] : std::vector<std::pair<std::string, uint16_t>>{
             {"agent_a", 7201}, {"agent_b", 7202}, {"agent_c", 7203}, {"agent_d", 7204}, {"agent_e", 7205}}) {
        manager().registerAgent(makeAgent(id, port));
    }

    ASSERT_TRUE(manager().connectNodes("agent_a", "agent_b"));
    ASSERT_TRUE(manager().connectNodes("agent_c", "agent_d"));
    EXPECT_EQ(manager().getTopology().clusters.size(), 2u);

    ASSERT_TRUE(manager().connectNodes("agent_b", "agent_c"));

    auto topology = manager().getTopology();
    ASSERT_EQ(topology.clusters.size(), 1u);
    EXPECT_EQ(topology.clusters[0].members,
              (std::set<std::string>{"agent_a", "agent_b", "agent_c", "agent_d"}));
    EXPECT_TRUE(topology.bridges.empty());
    EXPECT_EQ(manager().findPath("agent_a", "agent_d")->size(), 4u);
    EXPECT_FALSE(manager().findPath("agent_a", "agent_e").has_value());
}

TEST_F(TopologyManagerTest, ReconcileEdgesFollowsTransports) {
    config_.max_seed_peers = 1;
    registerAgents(3);
    EXPECT_FALSE(manager().reconcileEdges());

    // A link made behind the manager's back shows up after reconciliation
    auto agent_2 = manager().getAgent("agent_2");
    ASSERT_TRUE(agent_2->connectToPeer("agent_1", "127.0.0.1", 7101));
    EXPECT_TRUE(manager().reconcileEdges());
    EXPECT_EQ(manager().findPath("agent_2", "agent_1")->size(), 2u);
    EXPECT_EQ(manager().findPath("agent_1", "agent_2")->size(), 2u);

    // And a link closed behind its back disappears
    agent_2->disconnectFromPeer("agent_0");
    ASSERT_TRUE(waitUntil([&] {
        return !manager().getAgent("agent_0")->getTransport().isConnectedTo("agent_2");
    }));
    EXPECT_TRUE(manager().reconcileEdges());
    auto info = manager().getNodeInfo("agent_2");
    EXPECT_EQ(info->connections, std::vector<std::string>{"agent_1"});
}

TEST_F(TopologyManagerTest, HealthCheckRestartsStoppedNode) {
    registerAgents(3);
    auto agent = manager().getAgent("agent_2");
    agent->shutdown();
    ASSERT_FALSE(agent->isRunning());

    manager().performHealthChecks();

    EXPECT_TRUE(agent->isRunning());
    EXPECT_EQ(manager().getNodeState("agent_2"), NodeState::CONNECTED);
    EXPECT_EQ(manager().nodeCount(), 3u);
    EXPECT_TRUE(agent->getTransport().isConnectedTo("agent_0"));
    EXPECT_TRUE(manager().findPath("agent_2", "agent_0").has_value());
}

TEST_F(TopologyManagerTest, HealthCheckRemovesNodeThatCannotRestart) {
    registerAgents(2);
    auto agent = manager().getAgent("agent_1");
    agent->shutdown();

    // Another transport takes the endpoint, so the restart cannot bind
    auto squatter = std::make_shared<network::InMemoryTransport>(network_, "squatter", "127.0.0.1", 7101,
                                                                 transport_config_);
    ASSERT_TRUE(squatter->start());

    manager().performHealthChecks();

    EXPECT_EQ(manager().getNodeState("agent_1"), NodeState::UNREGISTERED);
    EXPECT_EQ(manager().nodeCount(), 1u);
    EXPECT_EQ(bus_.countEvents(DomainEventType::NODE_REMOVED), 1u);
    squatter->stop();
}

TEST_F(TopologyManagerTest, MetricsSnapshot) {
    registerAgents(4);

    topology::NetworkMetrics metrics = manager().updateNetworkMetrics();
    EXPECT_EQ(metrics.total_nodes, 4u);
    EXPECT_EQ(metrics.active_connections, 12u);
    EXPECT_EQ(metrics.cluster_count, 1u);
    EXPECT_DOUBLE_EQ(metrics.network_health, 100.0);
    EXPECT_DOUBLE_EQ(metrics.error_rate, 0.0);
    EXPECT_GT(metrics.timestamp, 0u);

    EXPECT_EQ(manager().getMetrics().total_nodes, 4u);
    EXPECT_EQ(managerEvents(DomainEventType::PERFORMANCE_METRIC), 1u);
    EXPECT_EQ(managerEvents(DomainEventType::HEALTH_DEGRADED), 0u);
}

TEST_F(TopologyManagerTest, IsolatedNodesDegradeHealth) {
    config_.max_seed_peers = 0;
    registerAgents(3);

    topology::NetworkMetrics metrics = manager().updateNetworkMetrics();
    EXPECT_EQ(metrics.active_connections, 0u);
    EXPECT_DOUBLE_EQ(metrics.network_health, 25.0);

    auto degraded = bus_.getHistory(DomainEventType::HEALTH_DEGRADED);
    ASSERT_EQ(degraded.size(), 1u);
    EXPECT_EQ(degraded[0].payload["threshold"], 40.0);
}

TEST_F(TopologyManagerTest, BroadcastReachesEveryLink) {
    registerAgents(3);

    std::atomic<int> received{0};
    for (const auto& id : manager().getNodeIds()) {
        manager().getAgent(id)->getTransport().onMessage("status_update",
                                                         [&received](const network::Message&) { received++; });
    }

    EXPECT_EQ(manager().broadcastMessage("status_update", nlohmann::json{{"phase", "build"}}), 6u);
    EXPECT_TRUE(waitUntil([&] { return received == 6; }));
}

TEST_F(TopologyManagerTest, BroadcastSkipsDisconnectedAndRemovedNodes) {
    config_.max_seed_peers = 0;
    manager().registerAgent(makeAgent("agent_a", 7201));
    manager().registerAgent(makeAgent("agent_b", 7202));
    manager().registerAgent(makeAgent("agent_c", 7203));

    std::map<std::string, std::shared_ptr<std::atomic<int>>> received;
    for (const auto& id : manager().getNodeIds()) {
        auto counter = std::make_shared<std::atomic<int>>(0);
        received[id] = counter;
        manager().getAgent(id)->getTransport().onMessage("status_update",
                                                         [counter](const network::Message&) { (*counter)++; });
    }

    ASSERT_TRUE(manager().connectNodes("agent_a", "agent_b"));
    ASSERT_TRUE(manager().connectNodes("agent_a", "agent_c"));
    ASSERT_TRUE(manager().disconnectNodes("agent_a", "agent_c"));

    EXPECT_EQ(manager().broadcastMessage("status_update", nlohmann::json{{"phase", "review"}}), 2u);
    ASSERT_TRUE(waitUntil([&] { return *received["agent_a"] == 1 && *received["agent_b"] == 1; }));

    auto agent_b = manager().getAgent("agent_b");
    ASSERT_TRUE(manager().unregisterAgent("agent_b"));
    EXPECT_EQ(manager().broadcastMessage("status_update", nlohmann::json{{"phase", "deploy"}}), 0u);

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(received["agent_a"]->load(), 1);
    EXPECT_EQ(received["agent_b"]->load(), 1);
    EXPECT_EQ(received["agent_c"]->load(), 0);
    EXPECT_FALSE(agent_b->isRunning());
}

TEST_F(TopologyManagerTest, SnapshotJson) {
    registerAgents(2);

    nlohmann::json json = manager().getTopology().toJson();
    EXPECT_EQ(json["nodes"].size(), 2u);
    EXPECT_EQ(json["connections"].size(), 2u);
    EXPECT_EQ(json["clusters"][0]["members"], nlohmann::json::array({"agent_0", "agent_1"}));
    EXPECT_TRUE(json["bridges"].empty());

    nlohmann::json node = manager().getNodeInfo("agent_1")->toJson();
    EXPECT_EQ(node["state"], "connected");
    EXPECT_EQ(node["role"], "developer");
}

} // namespace tests
} // namespace swarmnet
