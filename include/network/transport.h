/**
 * @file transport.h
 * @brief Per-node messaging endpoint interface
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>
#include <set>
#include <map>
#include <functional>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "network/message.h"

namespace swarmnet {
namespace network {

/**
 * @brief Node liveness status
 */
enum class NodeStatus {
    ONLINE,
    OFFLINE,
    BUSY
};

/**
 * @brief A node known to this endpoint through discovery or heartbeats
 */
struct Node {
    std::string id;
    std::string address;
    uint16_t port = 0;
    std::set<std::string> capabilities;
    NodeStatus status = NodeStatus::ONLINE;
    uint64_t last_seen = 0;                         ///< Milliseconds since epoch
    std::map<std::string, std::string> metadata;

    nlohmann::json toJson() const;
};

/**
 * @brief Connection status
 */
enum class ConnectionStatus {
    CONNECTING,
    CONNECTED,
    DISCONNECTED
};

/**
 * @brief Directed edge from this node to a peer
 */
struct Connection {
    std::string from;
    std::string to;
    ConnectionStatus status = ConnectionStatus::CONNECTING;
    uint64_t last_activity = 0;                     ///< Milliseconds since epoch

    nlohmann::json toJson() const;
};

/**
 * @brief Transport statistics
 */
struct TransportStats {
    uint64_t messages_sent = 0;
    uint64_t messages_received = 0;
    uint64_t messages_dropped = 0;      ///< Duplicates, own broadcasts, expired
    uint64_t messages_expired = 0;
    uint64_t send_failures = 0;
    uint64_t connection_attempts = 0;
    uint64_t connection_failures = 0;
    uint64_t latency_samples = 0;
    double average_latency_ms = 0.0;
    size_t active_connections = 0;
    size_t known_nodes = 0;

    /**
     * @brief Failed sends and connection attempts over all attempts, 0-100
     */
    double errorRate() const;

    nlohmann::json toJson() const;
};

/**
 * @brief Connection lifecycle notifications
 */
enum class TransportEventType {
    PEER_CONNECTED,
    PEER_DISCONNECTED,
    CONNECTION_FAILED
};

struct TransportEvent {
    TransportEventType type;
    std::string peer_id;
    std::string address;
    uint16_t port = 0;
    std::string reason;
};

using MessageHandler = std::function<void(const Message&)>;
using TransportEventListener = std::function<void(const TransportEvent&)>;

/**
 * @brief Per-node messaging endpoint
 *
 * Delivery is at-most-once, unordered, without acknowledgment or retry.
 * Failures are reported through return values and never thrown.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Start the endpoint and its heartbeat and discovery tasks
     * @return True if running afterwards
     */
    virtual bool start() = 0;

    /**
     * @brief Stop periodic tasks and close every connection
     */
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

    /**
     * @brief Connect to a peer
     * @return False on failure; a connection_failed event is emitted
     */
    virtual bool connect(const std::string& peer_id, const std::string& address, uint16_t port) = 0;

    virtual void disconnect(const std::string& peer_id) = 0;

    /**
     * @brief Send a direct message
     * @return False if no connection to the peer exists or the write failed
     */
    virtual bool sendMessage(const std::string& to, const std::string& type, const nlohmann::json& payload) = 0;

    /**
     * @brief Send one message to every connected peer
     * @return Number of peers the message was delivered to
     */
    virtual size_t broadcast(const std::string& type, const nlohmann::json& payload) = 0;

    /**
     * @brief Register the handler for a payload type, replacing any previous one
     */
    virtual void onMessage(const std::string& type, MessageHandler handler) = 0;

    virtual std::vector<std::string> getConnectedPeers() const = 0;
    virtual bool isConnectedTo(const std::string& peer_id) const = 0;
    virtual std::vector<Connection> getConnections() const = 0;
    virtual std::vector<Node> getKnownNodes() const = 0;
    virtual TransportStats getNetworkStats() const = 0;

    virtual void setEventListener(TransportEventListener listener) = 0;

    /**
     * @brief Capabilities advertised in discovery announcements
     */
    virtual void setCapabilities(const std::set<std::string>& capabilities) = 0;

    virtual const std::string& nodeId() const = 0;
    virtual std::string address() const = 0;
    virtual uint16_t port() const = 0;
};

std::string nodeStatusName(NodeStatus status);
std::string connectionStatusName(ConnectionStatus status);
std::string transportEventTypeName(TransportEventType type);

} // namespace network
} // namespace swarmnet
