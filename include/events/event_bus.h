/**
 * @file event_bus.h
 * @brief In-process synchronous event bus
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include "events/event_publisher.h"

#include <functional>
#include <map>
#include <mutex>
#include <deque>
#include <vector>
#include <optional>
#include <atomic>

namespace swarmnet {
namespace events {

using EventHandler = std::function<void(const DomainEvent&)>;
using EventFilter = std::function<bool(const DomainEvent&)>;

/**
 * @brief Event bus statistics
 */
struct EventBusStats {
    uint64_t events_published = 0;
    uint64_t deliveries = 0;
    uint64_t handler_failures = 0;
    size_t active_subscriptions = 0;
};

/**
 * @brief Priority-ordered publish/subscribe bus
 *
 * Handlers run on the publishing thread, higher priority first; equal
 * priorities run in subscription order. A throwing handler is reported and
 * does not stop delivery to the remaining subscribers.
 */
class EventBus : public EventPublisher {
public:
    /**
     * @param history_limit Maximum number of events kept for getHistory()
     */
    explicit EventBus(size_t history_limit = 1000);
    ~EventBus() override = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to one event type
     * @param type Event type
     * @param handler Handler invoked for each matching event
     * @param priority Higher runs first
     * @param filter Optional predicate; events it rejects are skipped
     * @return Subscription id
     */
    std::string subscribe(DomainEventType type, EventHandler handler,
                          int priority = 0, EventFilter filter = nullptr);

    /**
     * @brief Subscribe to every event type
     */
    std::string subscribeAll(EventHandler handler, int priority = 0);

    /**
     * @return True if the subscription existed
     */
    bool unsubscribe(const std::string& subscription_id);

    void publish(const DomainEvent& event) override;

    /**
     * @brief Recent events, oldest first
     * @param type Restrict to one type, or all when empty
     * @param limit Maximum number of events returned
     */
    std::vector<DomainEvent> getHistory(std::optional<DomainEventType> type = std::nullopt,
                                        size_t limit = 100) const;

    size_t countEvents(DomainEventType type) const;
    void clearHistory();
    EventBusStats getStats() const;

private:
    struct Subscription {
        std::string id;
        std::optional<DomainEventType> type;    ///< Empty for wildcard subscriptions
        EventHandler handler;
        EventFilter filter;
        int priority;
        uint64_t sequence;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    std::deque<DomainEvent> history_;
    size_t history_limit_;
    uint64_t next_sequence_;
    EventBusStats stats_;

    std::string addSubscription(std::optional<DomainEventType> type, EventHandler handler,
                                int priority, EventFilter filter);
};

} // namespace events
} // namespace swarmnet
