/**
 * @file event_publisher.cpp
 * @brief Domain event helpers
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "events/event_publisher.h"

#include <chrono>

namespace swarmnet {
namespace events {

DomainEvent DomainEvent::create(DomainEventType type, const std::string& source, nlohmann::json payload) {
    DomainEvent event;
    event.type = type;
    event.source = source;
    event.payload = std::move(payload);
    event.timestamp = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    return event;
}

nlohmann::json DomainEvent::toJson() const {
    nlohmann::json json;
    json["type"] = domainEventTypeName(type);
    json["source"] = source;
    json["payload"] = payload;
    json["timestamp"] = timestamp;
    return json;
}

std::string domainEventTypeName(DomainEventType type) {
    switch (type) {
        case DomainEventType::AGENT_REGISTERED: return "AGENT_REGISTERED";
        case DomainEventType::NODE_REMOVED: return "NODE_REMOVED";
        case DomainEventType::CLUSTERS_CHANGED: return "CLUSTERS_CHANGED";
        case DomainEventType::HEALTH_DEGRADED: return "HEALTH_DEGRADED";
        case DomainEventType::SYSTEM_STARTUP: return "SYSTEM_STARTUP";
        case DomainEventType::SYSTEM_SHUTDOWN: return "SYSTEM_SHUTDOWN";
        case DomainEventType::PERFORMANCE_METRIC: return "PERFORMANCE_METRIC";
        case DomainEventType::COLLABORATION_REQUEST: return "COLLABORATION_REQUEST";
        case DomainEventType::CONNECTION_FAILED: return "CONNECTION_FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace events
} // namespace swarmnet
