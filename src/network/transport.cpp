/**
 * @file transport.cpp
 * @brief Transport data types and configuration
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "network/transport.h"
#include "network/transport_config.h"
#include "utils/config.h"
#include "utils/logger.h"

#include <algorithm>

namespace swarmnet {
namespace network {

nlohmann::json Node::toJson() const {
    nlohmann::json json;
    json["id"] = id;
    json["address"] = address;
    json["port"] = port;
    json["capabilities"] = capabilities;
    json["status"] = nodeStatusName(status);
    json["last_seen"] = last_seen;
    json["metadata"] = metadata;
    return json;
}

nlohmann::json Connection::toJson() const {
    nlohmann::json json;
    json["from"] = from;
    json["to"] = to;
    json["status"] = connectionStatusName(status);
    json["last_activity"] = last_activity;
    return json;
}

double TransportStats::errorRate() const {
    uint64_t attempts = messages_sent + send_failures + connection_attempts;
    if (attempts == 0) {
        return 0.0;
    }
    double rate = static_cast<double>(send_failures + connection_failures) * 100.0 / static_cast<double>(attempts);
    return std::min(rate, 100.0);
}

nlohmann::json TransportStats::toJson() const {
    nlohmann::json json;
    json["messages_sent"] = messages_sent;
    json["messages_received"] = messages_received;
    json["messages_dropped"] = messages_dropped;
    json["messages_expired"] = messages_expired;
    json["send_failures"] = send_failures;
    json["connection_attempts"] = connection_attempts;
    json["connection_failures"] = connection_failures;
    json["latency_samples"] = latency_samples;
    json["average_latency_ms"] = average_latency_ms;
    json["active_connections"] = active_connections;
    json["known_nodes"] = known_nodes;
    json["error_rate"] = errorRate();
    return json;
}

std::string nodeStatusName(NodeStatus status) {
    switch (status) {
        case NodeStatus::ONLINE: return "online";
        case NodeStatus::OFFLINE: return "offline";
        case NodeStatus::BUSY: return "busy";
        default: return "unknown";
    }
}

std::string connectionStatusName(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::CONNECTING: return "connecting";
        case ConnectionStatus::CONNECTED: return "connected";
        case ConnectionStatus::DISCONNECTED: return "disconnected";
        default: return "unknown";
    }
}

std::string transportEventTypeName(TransportEventType type) {
    switch (type) {
        case TransportEventType::PEER_CONNECTED: return "peer_connected";
        case TransportEventType::PEER_DISCONNECTED: return "peer_disconnected";
        case TransportEventType::CONNECTION_FAILED: return "connection_failed";
        default: return "unknown";
    }
}

TransportConfig TransportConfig::fromConfig(const utils::Config& config) {
    TransportConfig result;

    int heartbeat_ms = config.get<int>("network", "heartbeat_interval_ms", 30000);
    int discovery_ms = config.get<int>("network", "discovery_interval_ms", 60000);
    int connect_timeout_ms = config.get<int>("network", "connect_timeout_ms", 2000);
    int ttl_s = config.get<int>("network", "message_ttl_s", 300);
    int seen_cache = config.get<int>("network", "seen_cache_size", 4096);

    if (heartbeat_ms > 0) {
        result.heartbeat_interval = std::chrono::milliseconds(heartbeat_ms);
    } else {
        SWARMNET_LOG_WARNING(CONFIGURATION, "Ignoring non-positive network.heartbeat_interval_ms");
    }
    if (discovery_ms > 0) {
        result.discovery_interval = std::chrono::milliseconds(discovery_ms);
    } else {
        SWARMNET_LOG_WARNING(CONFIGURATION, "Ignoring non-positive network.discovery_interval_ms");
    }
    if (connect_timeout_ms > 0) {
        result.connect_timeout = std::chrono::milliseconds(connect_timeout_ms);
    }
    if (ttl_s > 0) {
        result.message_ttl_seconds = static_cast<uint32_t>(ttl_s);
    }
    if (seen_cache > 0) {
        result.seen_cache_size = static_cast<size_t>(seen_cache);
    }

    result.enforce_ttl = config.get<bool>("network", "enforce_ttl", false);
    result.listen_address = config.get<std::string>("network", "listen_address", "0.0.0.0");
    return result;
}

} // namespace network
} // namespace swarmnet
