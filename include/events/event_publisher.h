/**
 * @file event_publisher.h
 * @brief Domain events emitted by agents and the topology manager
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace swarmnet {
namespace events {

/**
 * @brief Typed domain event set
 */
enum class DomainEventType {
    AGENT_REGISTERED,       ///< Agent initialized or added to the topology
    NODE_REMOVED,           ///< Node removed from the topology
    CLUSTERS_CHANGED,       ///< Cluster map recomputed with a different shape
    HEALTH_DEGRADED,        ///< Network health fell below the alert threshold
    SYSTEM_STARTUP,         ///< Topology manager started
    SYSTEM_SHUTDOWN,        ///< Topology manager stopped
    PERFORMANCE_METRIC,     ///< Fresh metrics snapshot
    COLLABORATION_REQUEST,  ///< Agent asked a peer for collaboration
    CONNECTION_FAILED       ///< Transport could not reach a peer
};

/**
 * @brief Domain event
 */
struct DomainEvent {
    DomainEventType type;
    std::string source;         ///< Node or component id that emitted the event
    nlohmann::json payload;
    uint64_t timestamp;         ///< Milliseconds since epoch

    DomainEvent() : type(DomainEventType::PERFORMANCE_METRIC), payload(nlohmann::json::object()), timestamp(0) {}

    /**
     * @brief Create an event stamped with the current time
     */
    static DomainEvent create(DomainEventType type, const std::string& source,
                              nlohmann::json payload = nlohmann::json::object());

    nlohmann::json toJson() const;
};

std::string domainEventTypeName(DomainEventType type);

/**
 * @brief Sink for domain events
 *
 * The only thing agents and the topology manager require from an event
 * system.
 */
class EventPublisher {
public:
    virtual ~EventPublisher() = default;

    virtual void publish(const DomainEvent& event) = 0;
};

/**
 * @brief Publisher that discards every event
 */
class NullEventPublisher : public EventPublisher {
public:
    void publish(const DomainEvent&) override {}
};

} // namespace events
} // namespace swarmnet
