/**
 * @file topology_manager.cpp
 * @brief Topology manager implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "topology/topology_manager.h"
#include "utils/logger.h"
#include "utils/error_handler.h"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace swarmnet {
namespace topology {

namespace {

const char* MANAGER_SOURCE = "topology_manager";

std::vector<std::set<std::string>> membershipOf(const std::vector<Cluster>& clusters) {
    std::vector<std::set<std::string>> result;
    result.reserve(clusters.size());
    for (const auto& cluster : clusters) {
        result.push_back(cluster.members);
    }
    return result;
}

} // anonymous namespace

TopologyConfig TopologyConfig::fromConfig(const utils::Config& config) {
    TopologyConfig result;

    int seed_peers = config.get<int>("topology", "max_seed_peers", 3);
    int metrics_ms = config.get<int>("topology", "metrics_interval_ms", 10000);
    int health_ms = config.get<int>("topology", "health_check_interval_ms", 30000);
    double fan_out = config.get<double>("topology", "target_fan_out", 3.0);
    double threshold = config.get<double>("topology", "health_alert_threshold", 40.0);

    if (seed_peers >= 0) {
        result.max_seed_peers = static_cast<size_t>(seed_peers);
    } else {
        SWARMNET_LOG_WARNING(CONFIGURATION, "Ignoring negative topology.max_seed_peers");
    }
    if (metrics_ms > 0) {
        result.metrics_interval = std::chrono::milliseconds(metrics_ms);
    } else {
        SWARMNET_LOG_WARNING(CONFIGURATION, "Ignoring non-positive topology.metrics_interval_ms");
    }
    if (health_ms > 0) {
        result.health_check_interval = std::chrono::milliseconds(health_ms);
    } else {
        SWARMNET_LOG_WARNING(CONFIGURATION, "Ignoring non-positive topology.health_check_interval_ms");
    }
    if (fan_out > 0.0) {
        result.target_fan_out = fan_out;
    }
    if (threshold >= 0.0 && threshold <= 100.0) {
        result.health_alert_threshold = threshold;
    }

    return result;
}

nlohmann::json NetworkMetrics::toJson() const {
    nlohmann::json json;
    json["totalNodes"] = total_nodes;
    json["activeConnections"] = active_connections;
    json["averageLatency"] = average_latency_ms;
    json["networkHealth"] = network_health;
    json["clusterCount"] = cluster_count;
    json["bridgeCount"] = bridge_count;
    json["messageThroughput"] = message_throughput;
    json["errorRate"] = error_rate;
    json["timestamp"] = timestamp;
    return json;
}

nlohmann::json TopologySnapshot::toJson() const {
    nlohmann::json json;

    json["nodes"] = nlohmann::json::array();
    for (const auto& node : nodes) {
        json["nodes"].push_back(node.toJson());
    }

    json["connections"] = nlohmann::json::array();
    for (const auto& connection : connections) {
        json["connections"].push_back(connection.toJson());
    }

    json["clusters"] = nlohmann::json::array();
    for (const auto& cluster : clusters) {
        json["clusters"].push_back(cluster.toJson());
    }

    json["bridges"] = nlohmann::json::array();
    for (const auto& [node_id, bridge] : bridges) {
        json["bridges"].push_back(bridge.toJson());
    }
    return json;
}

nlohmann::json NodeInfo::toJson() const {
    nlohmann::json json;
    json["id"] = id;
    json["role"] = agents::agentRoleName(role);
    json["state"] = nodeStateName(state);
    json["address"] = address;
    json["port"] = port;
    json["connections"] = connections;
    json["networkStats"] = network_stats.toJson();
    json["capabilities"] = capabilities.toJson();
    return json;
}

double computeNetworkHealth(size_t node_count, size_t edge_count, size_t cluster_count, double target_fan_out) {
    if (node_count == 0) {
        return 100.0;
    }

    double average_connections = static_cast<double>(edge_count) / static_cast<double>(node_count);
    double cluster_health = cluster_count > 0 ? 100.0 : 50.0;
    double connectivity_health = target_fan_out > 0.0
        ? std::min(100.0, average_connections / target_fan_out * 100.0)
        : 100.0;

    return std::clamp((cluster_health + connectivity_health) / 2.0, 0.0, 100.0);
}

TopologyManager::TopologyManager(events::EventPublisher& publisher, const TopologyConfig& config)
    : publisher_(publisher)
    , config_(config)
    , last_message_total_(0)
    , last_metrics_time_(std::chrono::steady_clock::now())
    , running_(false) {
    metrics_.timestamp = network::currentTimeMillis();
}

TopologyManager::~TopologyManager() {
    stop();
}

bool TopologyManager::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (running_) {
        SWARMNET_LOG_WARNING(TOPOLOGY, "Topology manager already running");
        return false;
    }

    metrics_task_ = std::make_unique<utils::PeriodicTask>(
        "topology-metrics", config_.metrics_interval, [this]() { updateNetworkMetrics(); });
    health_task_ = std::make_unique<utils::PeriodicTask>(
        "topology-health", config_.health_check_interval, [this]() { performHealthChecks(); });

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        last_metrics_time_ = std::chrono::steady_clock::now();
    }

    running_ = true;
    metrics_task_->start();
    health_task_->start();

    SWARMNET_LOG_INFO(TOPOLOGY, "Topology manager started");
    publishEvent(events::DomainEventType::SYSTEM_STARTUP,
                 {{"component", MANAGER_SOURCE}, {"status", "started"}});
    return true;
}

void TopologyManager::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    bool was_running = running_.exchange(false);

    if (metrics_task_) {
        metrics_task_->stop();
        metrics_task_.reset();
    }
    if (health_task_) {
        health_task_->stop();
        health_task_.reset();
    }

    auto agents = agentSnapshot();
    if (!was_running && agents.empty()) {
        return;
    }
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        nodes_.clear();
        graph_.clear();
        clusters_.clear();
        bridges_.clear();
    }

    for (const auto& [node_id, agent] : agents) {
        try {
            agent->shutdown();
        } catch (const std::exception& e) {
            SWARMNET_ERROR(TOPOLOGY, "Failed to stop agent " + node_id + ": " + e.what());
        }
    }

    SWARMNET_LOG_INFO(TOPOLOGY, "Topology manager stopped");
    if (was_running) {
        publishEvent(events::DomainEventType::SYSTEM_SHUTDOWN,
                     {{"component", MANAGER_SOURCE}, {"status", "stopped"}});
    }
}

void TopologyManager::registerAgent(std::shared_ptr<agents::P2PAgent> agent) {
    if (!agent) {
        throw std::invalid_argument("Cannot register a null agent");
    }

    const std::string node_id = agent->getId();
    std::vector<Endpoint> seeds;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        if (nodes_.count(node_id) > 0) {
            throw std::invalid_argument("Agent already registered: " + node_id);
        }

        NodeRecord record;
        record.agent = agent;
        record.node.id = node_id;
        record.node.capabilities = agent->getCapabilities().advertisedCapabilities();
        record.node.status = network::NodeStatus::OFFLINE;
        record.state = NodeState::REGISTERED;
        nodes_.emplace(node_id, std::move(record));
        graph_.addNode(node_id);

        seeds = seedPeersLocked(node_id);
    }

    if (!agent->initialize()) {
        {
            std::unique_lock<std::shared_mutex> lock(registry_mutex_);
            nodes_.erase(node_id);
            graph_.removeNode(node_id);
        }
        SWARMNET_ERROR(TOPOLOGY, "Agent " + node_id + " failed to start and was not registered");
        throw std::runtime_error("Agent " + node_id + " failed to start its transport");
    }

    std::vector<std::string> connected;
    connectToSeeds(agent, seeds, connected);

    bool clusters_changed = false;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = nodes_.find(node_id);
        if (it == nodes_.end()) {
            SWARMNET_LOG_WARNING(TOPOLOGY, "Agent " + node_id + " was removed while registering");
            return;
        }

        uint64_t now = network::currentTimeMillis();
        NodeRecord& record = it->second;
        record.node.address = agent->getTransport().address();
        record.node.port = agent->getTransport().port();
        record.node.status = network::NodeStatus::ONLINE;
        record.node.last_seen = now;
        record.state = NodeState::CONNECTED;

        for (const auto& peer_id : connected) {
            graph_.addEdge(node_id, peer_id, now);
            graph_.addEdge(peer_id, node_id, now);
        }
        clusters_changed = recomputeLocked();
    }

    SWARMNET_LOG_INFO(TOPOLOGY, "P2P agent registered: " + node_id + " with " +
                      std::to_string(connected.size()) + " seed connections");

    nlohmann::json payload;
    payload["agentId"] = node_id;
    payload["role"] = agents::agentRoleName(agent->getRole());
    payload["capabilities"] = agent->getCapabilities().specialized_skills;
    payload["seedConnections"] = connected;
    publishEvent(events::DomainEventType::AGENT_REGISTERED, payload);

    if (clusters_changed) {
        publishClustersChanged();
    }
}

bool TopologyManager::unregisterAgent(const std::string& node_id) {
    std::shared_ptr<agents::P2PAgent> agent;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = nodes_.find(node_id);
        if (it == nodes_.end()) {
            return false;
        }
        agent = it->second.agent;
    }

    try {
        agent->shutdown();
    } catch (const std::exception& e) {
        SWARMNET_ERROR(TOPOLOGY, "Failed to stop agent " + node_id + ": " + e.what());
    }

    size_t edges_removed = 0;
    bool clusters_changed = false;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        if (nodes_.erase(node_id) == 0) {
            return false;
        }
        edges_removed = graph_.removeNode(node_id);
        clusters_changed = recomputeLocked();
    }

    SWARMNET_LOG_INFO(TOPOLOGY, "P2P agent unregistered: " + node_id);
    publishEvent(events::DomainEventType::NODE_REMOVED,
                 {{"nodeId", node_id}, {"edgesRemoved", edges_removed}});
    if (clusters_changed) {
        publishClustersChanged();
    }
    return true;
}

bool TopologyManager::connectNodes(const std::string& from, const std::string& to) {
    std::shared_ptr<agents::P2PAgent> agent;
    Endpoint target;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        auto from_it = nodes_.find(from);
        auto to_it = nodes_.find(to);
        if (from_it == nodes_.end() || to_it == nodes_.end() || from == to) {
            return false;
        }
        agent = from_it->second.agent;
        target = Endpoint{to, to_it->second.node.address, to_it->second.node.port};
    }

    if (!agent->connectToPeer(target.id, target.address, target.port)) {
        return false;
    }

    bool clusters_changed = false;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        uint64_t now = network::currentTimeMillis();
        if (graph_.addEdge(from, to, now) && graph_.addEdge(to, from, now)) {
            clusters_changed = recomputeLocked();
        }
    }

    if (clusters_changed) {
        publishClustersChanged();
    }
    return true;
}

bool TopologyManager::disconnectNodes(const std::string& from, const std::string& to) {
    std::shared_ptr<agents::P2PAgent> from_agent;
    std::shared_ptr<agents::P2PAgent> to_agent;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        auto from_it = nodes_.find(from);
        auto to_it = nodes_.find(to);
        if (from_it == nodes_.end() || to_it == nodes_.end()) {
            return false;
        }
        from_agent = from_it->second.agent;
        to_agent = to_it->second.agent;
    }

    from_agent->disconnectFromPeer(to);
    to_agent->disconnectFromPeer(from);

    bool clusters_changed = false;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        bool removed = graph_.removeEdge(from, to);
        removed = graph_.removeEdge(to, from) || removed;
        if (removed) {
            clusters_changed = recomputeLocked();
        }
    }

    if (clusters_changed) {
        publishClustersChanged();
    }
    return true;
}

void TopologyManager::updateClusters() {
    bool clusters_changed = false;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        clusters_changed = recomputeLocked();
    }

    if (clusters_changed) {
        publishClustersChanged();
    }
}

void TopologyManager::identifyBridgeNodes() {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    bridges_ = graph_.computeBridges(clusters_);
}

std::optional<std::vector<std::string>> TopologyManager::findPath(const std::string& from,
                                                                  const std::string& to) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return graph_.findPath(from, to);
}

NetworkMetrics TopologyManager::updateNetworkMetrics() {
    auto agents = agentSnapshot();

    NetworkMetrics metrics;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        metrics.total_nodes = nodes_.size();
        metrics.active_connections = graph_.edgeCount();
        metrics.cluster_count = clusters_.size();
        metrics.bridge_count = bridges_.size();
    }

    network::TransportStats total;
    double latency_sum = 0.0;
    for (const auto& [node_id, agent] : agents) {
        network::TransportStats stats = agent->getNetworkStats();
        total.messages_sent += stats.messages_sent;
        total.messages_received += stats.messages_received;
        total.send_failures += stats.send_failures;
        total.connection_attempts += stats.connection_attempts;
        total.connection_failures += stats.connection_failures;
        total.latency_samples += stats.latency_samples;
        latency_sum += stats.average_latency_ms * static_cast<double>(stats.latency_samples);
    }

    metrics.average_latency_ms = total.latency_samples > 0
        ? latency_sum / static_cast<double>(total.latency_samples)
        : 0.0;
    metrics.network_health = computeNetworkHealth(metrics.total_nodes, metrics.active_connections,
                                                  metrics.cluster_count, config_.target_fan_out);
    metrics.error_rate = total.errorRate();
    metrics.timestamp = network::currentTimeMillis();

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - last_metrics_time_).count();
        uint64_t message_total = total.messages_sent + total.messages_received;
        uint64_t delta = message_total >= last_message_total_ ? message_total - last_message_total_ : 0;

        metrics.message_throughput = elapsed > 0.0 ? static_cast<double>(delta) / elapsed : 0.0;
        last_message_total_ = message_total;
        last_metrics_time_ = now;
        metrics_ = metrics;
    }

    SWARMNET_LOG_DEBUG(PERFORMANCE, "Network metrics: " + metrics.toJson().dump());
    publishEvent(events::DomainEventType::PERFORMANCE_METRIC, metrics.toJson());

    if (metrics.network_health < config_.health_alert_threshold) {
        SWARMNET_LOG_WARNING(TOPOLOGY, "Network health degraded to " + std::to_string(metrics.network_health));
        nlohmann::json payload = metrics.toJson();
        payload["threshold"] = config_.health_alert_threshold;
        publishEvent(events::DomainEventType::HEALTH_DEGRADED, payload);
    }

    return metrics;
}

void TopologyManager::performHealthChecks() {
    reconcileEdges();

    for (const auto& [node_id, agent] : agentSnapshot()) {
        bool healthy = false;
        try {
            healthy = agent->isRunning();
        } catch (const std::exception& e) {
            SWARMNET_ERROR(TOPOLOGY, "Health check failed for node " + node_id + ": " + e.what());
        }

        if (healthy) {
            continue;
        }

        SWARMNET_LOG_WARNING(TOPOLOGY, "Node " + node_id + " is not running");
        if (!restartNode(node_id, agent)) {
            SWARMNET_ERROR(TOPOLOGY, "Node " + node_id + " could not be restarted; removing it");
            unregisterAgent(node_id);
        }
    }
}

bool TopologyManager::reconcileEdges() {
    std::map<std::string, std::set<std::string>> reported;
    for (const auto& [node_id, agent] : agentSnapshot()) {
        std::vector<std::string> peers = agent->getConnectedPeers();
        reported[node_id] = std::set<std::string>(peers.begin(), peers.end());
    }

    bool edges_changed = false;
    bool clusters_changed = false;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);

        std::set<std::pair<std::string, std::string>> live;
        for (const auto& [node_id, peers] : reported) {
            if (!graph_.hasNode(node_id)) {
                continue;
            }
            for (const auto& peer_id : peers) {
                if (graph_.hasNode(peer_id) && peer_id != node_id) {
                    live.insert(std::minmax(node_id, peer_id));
                }
            }
        }

        for (const auto& edge : graph_.edges()) {
            // Only judge edges whose endpoints were both sampled
            if (reported.count(edge.from) == 0 || reported.count(edge.to) == 0) {
                continue;
            }
            if (live.count(std::minmax(edge.from, edge.to)) == 0) {
                graph_.removeEdge(edge.from, edge.to);
                edges_changed = true;
            }
        }

        uint64_t now = network::currentTimeMillis();
        for (const auto& [a, b] : live) {
            if (!graph_.hasEdge(a, b)) {
                graph_.addEdge(a, b, now);
                edges_changed = true;
            }
            if (!graph_.hasEdge(b, a)) {
                graph_.addEdge(b, a, now);
                edges_changed = true;
            }
        }

        if (edges_changed) {
            clusters_changed = recomputeLocked();
        }
    }

    if (edges_changed) {
        SWARMNET_LOG_DEBUG(TOPOLOGY, "Edge set reconciled with transports");
    }
    if (clusters_changed) {
        publishClustersChanged();
    }
    return edges_changed;
}

size_t TopologyManager::broadcastMessage(const std::string& type, const nlohmann::json& payload) {
    size_t total_sent = 0;
    for (const auto& [node_id, agent] : agentSnapshot()) {
        try {
            total_sent += agent->broadcastToPeers(type, payload);
        } catch (const std::exception& e) {
            SWARMNET_LOG_ERROR(TOPOLOGY, "Broadcast from " + node_id + " failed: " + e.what());
        }
    }
    return total_sent;
}

TopologySnapshot TopologyManager::getTopology() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);

    TopologySnapshot snapshot;
    for (const auto& node_id : graph_.nodes()) {
        auto it = nodes_.find(node_id);
        if (it != nodes_.end()) {
            snapshot.nodes.push_back(it->second.node);
        }
    }
    snapshot.connections = graph_.edges();
    snapshot.clusters = clusters_;
    snapshot.bridges = bridges_;
    return snapshot;
}

NetworkMetrics TopologyManager::getMetrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

std::optional<NodeInfo> TopologyManager::getNodeInfo(const std::string& node_id) const {
    NodeInfo info;
    std::shared_ptr<agents::P2PAgent> agent;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = nodes_.find(node_id);
        if (it == nodes_.end()) {
            return std::nullopt;
        }

        agent = it->second.agent;
        info.id = node_id;
        info.state = it->second.state;
        info.address = it->second.node.address;
        info.port = it->second.node.port;
        info.connections = graph_.outNeighbours(node_id);
    }

    info.role = agent->getRole();
    info.capabilities = agent->getCapabilities();
    info.network_stats = agent->getNetworkStats();
    return info;
}

NodeState TopologyManager::getNodeState(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = nodes_.find(node_id);
    return it == nodes_.end() ? NodeState::UNREGISTERED : it->second.state;
}

std::shared_ptr<agents::P2PAgent> TopologyManager::getAgent(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = nodes_.find(node_id);
    return it == nodes_.end() ? nullptr : it->second.agent;
}

std::vector<std::string> TopologyManager::getNodeIds() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return graph_.nodes();
}

size_t TopologyManager::nodeCount() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return nodes_.size();
}

std::vector<TopologyManager::Endpoint> TopologyManager::seedPeersLocked(const std::string& node_id) const {
    std::vector<Endpoint> seeds;
    for (const auto& candidate : graph_.nodes()) {
        if (seeds.size() >= config_.max_seed_peers) {
            break;
        }
        if (candidate == node_id) {
            continue;
        }

        auto it = nodes_.find(candidate);
        if (it != nodes_.end() && it->second.state == NodeState::CONNECTED) {
            seeds.push_back(Endpoint{candidate, it->second.node.address, it->second.node.port});
        }
    }
    return seeds;
}

std::vector<std::pair<std::string, std::shared_ptr<agents::P2PAgent>>> TopologyManager::agentSnapshot() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    std::vector<std::pair<std::string, std::shared_ptr<agents::P2PAgent>>> agents;
    agents.reserve(nodes_.size());
    for (const auto& node_id : graph_.nodes()) {
        auto it = nodes_.find(node_id);
        if (it != nodes_.end()) {
            agents.emplace_back(node_id, it->second.agent);
        }
    }
    return agents;
}

bool TopologyManager::recomputeLocked() {
    std::vector<Cluster> clusters = graph_.computeClusters();
    std::map<std::string, Bridge> bridges = graph_.computeBridges(clusters);

    bool changed = membershipOf(clusters) != membershipOf(clusters_) || bridges.size() != bridges_.size();

    clusters_ = std::move(clusters);
    bridges_ = std::move(bridges);
    return changed;
}

void TopologyManager::connectToSeeds(const std::shared_ptr<agents::P2PAgent>& agent,
                                     const std::vector<Endpoint>& seeds,
                                     std::vector<std::string>& connected) {
    for (const auto& seed : seeds) {
        try {
            if (agent->connectToPeer(seed.id, seed.address, seed.port)) {
                connected.push_back(seed.id);
            }
        } catch (const std::exception& e) {
            SWARMNET_LOG_ERROR(TOPOLOGY, "Failed to connect " + agent->getId() + " to " + seed.id + ": " + e.what());
        }
    }
}

bool TopologyManager::restartNode(const std::string& node_id, const std::shared_ptr<agents::P2PAgent>& agent) {
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = nodes_.find(node_id);
        if (it == nodes_.end()) {
            return true;
        }
        it->second.state = NodeState::RECONNECTING;
        it->second.node.status = network::NodeStatus::OFFLINE;
    }

    SWARMNET_LOG_INFO(TOPOLOGY, "Restarting unhealthy node " + node_id);

    try {
        agent->shutdown();
        if (!agent->initialize()) {
            return false;
        }
    } catch (const std::exception& e) {
        SWARMNET_ERROR(TOPOLOGY, "Failed to restart node " + node_id + ": " + e.what());
        return false;
    }

    std::vector<Endpoint> seeds;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        seeds = seedPeersLocked(node_id);
    }

    std::vector<std::string> connected;
    connectToSeeds(agent, seeds, connected);

    bool clusters_changed = false;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = nodes_.find(node_id);
        if (it == nodes_.end()) {
            return true;
        }

        uint64_t now = network::currentTimeMillis();
        it->second.node.address = agent->getTransport().address();
        it->second.node.port = agent->getTransport().port();
        it->second.node.status = network::NodeStatus::ONLINE;
        it->second.node.last_seen = now;
        it->second.state = NodeState::CONNECTED;

        for (const auto& peer_id : connected) {
            graph_.addEdge(node_id, peer_id, now);
            graph_.addEdge(peer_id, node_id, now);
        }
        clusters_changed = recomputeLocked();
    }

    SWARMNET_LOG_INFO(TOPOLOGY, "Node " + node_id + " reconnected to " + std::to_string(connected.size()) + " peers");
    if (clusters_changed) {
        publishClustersChanged();
    }
    return true;
}

void TopologyManager::publishClustersChanged() {
    nlohmann::json payload;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        payload["clusterCount"] = clusters_.size();
        payload["bridgeCount"] = bridges_.size();
        payload["clusters"] = nlohmann::json::array();
        for (const auto& cluster : clusters_) {
            payload["clusters"].push_back(cluster.toJson());
        }
    }
    publishEvent(events::DomainEventType::CLUSTERS_CHANGED, payload);
}

void TopologyManager::publishEvent(events::DomainEventType type, const nlohmann::json& payload) {
    try {
        publisher_.publish(events::DomainEvent::create(type, MANAGER_SOURCE, payload));
    } catch (const std::exception& e) {
        SWARMNET_LOG_ERROR(TOPOLOGY, "Failed to publish " + events::domainEventTypeName(type) + ": " + e.what());
    }
}

std::string nodeStateName(NodeState state) {
    switch (state) {
        case NodeState::UNREGISTERED: return "unregistered";
        case NodeState::REGISTERED: return "registered";
        case NodeState::CONNECTED: return "connected";
        case NodeState::RECONNECTING: return "reconnecting";
        default: return "unknown";
    }
}

} // namespace topology
} // namespace swarmnet
