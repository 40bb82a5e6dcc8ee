/**
 * @file topology_manager.h
 * @brief Registry of local agents and the graph connecting them
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>

#include "topology/network_graph.h"
#include "agents/p2p_agent.h"
#include "events/event_publisher.h"
#include "utils/periodic_task.h"
#include "utils/config.h"

namespace swarmnet {
namespace topology {

/**
 * @brief Topology manager tuning
 */
struct TopologyConfig {
    size_t max_seed_peers = 3;                                         ///< Connections made on registration
    std::chrono::milliseconds metrics_interval{10000};
    std::chrono::milliseconds health_check_interval{30000};
    double target_fan_out = 3.0;                                       ///< Connections per node scoring 100
    double health_alert_threshold = 40.0;                              ///< HEALTH_DEGRADED below this

    /**
     * @brief Read the [topology] section, keeping defaults for missing or invalid keys
     */
    static TopologyConfig fromConfig(const utils::Config& config);
};

/**
 * @brief Per-node lifecycle state
 */
enum class NodeState {
    UNREGISTERED,
    REGISTERED,     ///< Added, connecting to seed peers
    CONNECTED,
    RECONNECTING    ///< Restarting after a failed health check
};

/**
 * @brief Aggregate health snapshot
 */
struct NetworkMetrics {
    size_t total_nodes = 0;
    size_t active_connections = 0;      ///< Directed edges
    double average_latency_ms = 0.0;    ///< Mean heartbeat round trip, 0 without samples
    double network_health = 100.0;      ///< 0-100
    size_t cluster_count = 0;
    size_t bridge_count = 0;
    double message_throughput = 0.0;    ///< Messages sent and received per second
    double error_rate = 0.0;            ///< Percent of failed sends and connection attempts
    uint64_t timestamp = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Read-only copy of the topology
 */
struct TopologySnapshot {
    std::vector<network::Node> nodes;
    std::vector<network::Connection> connections;
    std::vector<Cluster> clusters;
    std::map<std::string, Bridge> bridges;

    nlohmann::json toJson() const;
};

/**
 * @brief Everything known about one registered node
 */
struct NodeInfo {
    std::string id;
    agents::AgentRole role = agents::AgentRole::COORDINATOR;
    NodeState state = NodeState::UNREGISTERED;
    std::string address;
    uint16_t port = 0;
    std::vector<std::string> connections;
    network::TransportStats network_stats;
    agents::AgentCapabilities capabilities;

    nlohmann::json toJson() const;
};

/**
 * @brief Health score from cluster presence and fan-out
 *
 * Average of 100 (any cluster) or 50 (none) and the average connection
 * count as a percentage of the target, capped at 100. An empty network
 * scores 100.
 */
double computeNetworkHealth(size_t node_count, size_t edge_count, size_t cluster_count, double target_fan_out);

/**
 * @brief Registry of local agents, their connections and derived clusters
 *
 * One shared mutex guards the registry; mutations hold it exclusively and
 * queries hold it shared. Agent I/O (start, connect, restart) happens
 * outside the lock. Events are published after the lock is released.
 */
class TopologyManager {
public:
    explicit TopologyManager(events::EventPublisher& publisher,
                             const TopologyConfig& config = TopologyConfig());
    ~TopologyManager();

    TopologyManager(const TopologyManager&) = delete;
    TopologyManager& operator=(const TopologyManager&) = delete;

    /**
     * @brief Start the metrics and health-check tasks
     * @return False if already running
     */
    bool start();

    /**
     * @brief Stop periodic tasks, shut every agent down and clear the registry
     *
     * Also clears a registry that was populated without start().
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * @brief Add an agent, start it and connect it to seed peers
     *
     * Seeds are the first max_seed_peers nodes in registration order.
     *
     * @throws std::invalid_argument if the agent is null or its id is taken
     * @throws std::runtime_error if the agent cannot start
     */
    void registerAgent(std::shared_ptr<agents::P2PAgent> agent);

    /**
     * @brief Stop an agent and remove it from every structure
     * @return False if the node was not registered
     */
    bool unregisterAgent(const std::string& node_id);

    /**
     * @brief Connect two registered nodes through their transports
     */
    bool connectNodes(const std::string& from, const std::string& to);

    /**
     * @brief Close the link between two nodes in both directions
     */
    bool disconnectNodes(const std::string& from, const std::string& to);

    /**
     * @brief Recompute clusters and bridges from the current edge set
     */
    void updateClusters();

    /**
     * @brief Recompute bridges against the current clusters
     */
    void identifyBridgeNodes();

    std::optional<std::vector<std::string>> findPath(const std::string& from, const std::string& to) const;

    /**
     * @brief Take a fresh metrics snapshot and publish it
     */
    NetworkMetrics updateNetworkMetrics();

    /**
     * @brief Reconcile edges, then restart or remove nodes whose transport is down
     */
    void performHealthChecks();

    /**
     * @brief Bring the edge set in line with what the transports report
     * @return True if any edge was added or removed
     */
    bool reconcileEdges();

    /**
     * @brief Broadcast through every registered agent
     * @return Total number of peers reached
     */
    size_t broadcastMessage(const std::string& type, const nlohmann::json& payload);

    TopologySnapshot getTopology() const;
    NetworkMetrics getMetrics() const;
    std::optional<NodeInfo> getNodeInfo(const std::string& node_id) const;
    NodeState getNodeState(const std::string& node_id) const;
    std::shared_ptr<agents::P2PAgent> getAgent(const std::string& node_id) const;
    std::vector<std::string> getNodeIds() const;
    size_t nodeCount() const;

    const TopologyConfig& getConfig() const { return config_; }

private:
    struct NodeRecord {
        std::shared_ptr<agents::P2PAgent> agent;
        network::Node node;
        NodeState state = NodeState::REGISTERED;
    };

    struct Endpoint {
        std::string id;
        std::string address;
        uint16_t port = 0;
    };

    events::EventPublisher& publisher_;
    TopologyConfig config_;

    mutable std::shared_mutex registry_mutex_;
    std::map<std::string, NodeRecord> nodes_;
    NetworkGraph graph_;
    std::vector<Cluster> clusters_;
    std::map<std::string, Bridge> bridges_;

    mutable std::mutex metrics_mutex_;
    NetworkMetrics metrics_;
    uint64_t last_message_total_;
    std::chrono::steady_clock::time_point last_metrics_time_;

    std::atomic<bool> running_;
    std::mutex lifecycle_mutex_;
    std::unique_ptr<utils::PeriodicTask> metrics_task_;
    std::unique_ptr<utils::PeriodicTask> health_task_;

    std::vector<Endpoint> seedPeersLocked(const std::string& node_id) const;
    std::vector<std::pair<std::string, std::shared_ptr<agents::P2PAgent>>> agentSnapshot() const;
    bool recomputeLocked();
    void connectToSeeds(const std::shared_ptr<agents::P2PAgent>& agent, const std::vector<Endpoint>& seeds,
                        std::vector<std::string>& connected);
    bool restartNode(const std::string& node_id, const std::shared_ptr<agents::P2PAgent>& agent);
    void publishClustersChanged();
    void publishEvent(events::DomainEventType type, const nlohmann::json& payload);
};

std::string nodeStateName(NodeState state);

} // namespace topology
} // namespace swarmnet
