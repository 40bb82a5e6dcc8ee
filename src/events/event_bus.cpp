/**
 * @file event_bus.cpp
 * @brief In-process synchronous event bus implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "events/event_bus.h"
#include "utils/logger.h"
#include "utils/error_handler.h"

#include <algorithm>

namespace swarmnet {
namespace events {

EventBus::EventBus(size_t history_limit)
    : history_limit_(history_limit)
    , next_sequence_(1) {
}

std::string EventBus::subscribe(DomainEventType type, EventHandler handler,
                                int priority, EventFilter filter) {
    return addSubscription(type, std::move(handler), priority, std::move(filter));
}

std::string EventBus::subscribeAll(EventHandler handler, int priority) {
    return addSubscription(std::nullopt, std::move(handler), priority, nullptr);
}

std::string EventBus::addSubscription(std::optional<DomainEventType> type, EventHandler handler,
                                      int priority, EventFilter filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    Subscription subscription;
    subscription.sequence = next_sequence_++;
    subscription.id = "sub_" + std::to_string(subscription.sequence);
    subscription.type = type;
    subscription.handler = std::move(handler);
    subscription.filter = std::move(filter);
    subscription.priority = priority;
    std::string id = subscription.id;

    subscriptions_.push_back(std::move(subscription));
    std::stable_sort(subscriptions_.begin(), subscriptions_.end(),
                     [](const Subscription& a, const Subscription& b) {
                         return a.priority > b.priority;
                     });
    stats_.active_subscriptions = subscriptions_.size();

    SWARMNET_LOG_DEBUG(EVENTS, "Subscription created: " + id +
                       (type ? " for " + domainEventTypeName(*type) : std::string(" for all events")));
    return id;
}

bool EventBus::unsubscribe(const std::string& subscription_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [&](const Subscription& s) { return s.id == subscription_id; });
    if (it == subscriptions_.end()) {
        return false;
    }

    subscriptions_.erase(it);
    stats_.active_subscriptions = subscriptions_.size();
    return true;
}

void EventBus::publish(const DomainEvent& event) {
    std::vector<Subscription> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.events_published++;

        history_.push_back(event);
        while (history_.size() > history_limit_) {
            history_.pop_front();
        }

        for (const auto& subscription : subscriptions_) {
            if (!subscription.type || *subscription.type == event.type) {
                targets.push_back(subscription);
            }
        }
    }

    SWARMNET_LOG_TRACE(EVENTS, "Event published: " + domainEventTypeName(event.type) +
                       " from " + event.source);

    uint64_t delivered = 0;
    uint64_t failed = 0;
    for (const auto& subscription : targets) {
        try {
            if (subscription.filter && !subscription.filter(event)) {
                continue;
            }
            subscription.handler(event);
            ++delivered;
        } catch (const std::exception& e) {
            ++failed;
            SWARMNET_ERROR(EVENTS, "Handler " + subscription.id + " failed on " +
                           domainEventTypeName(event.type) + ": " + e.what());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.deliveries += delivered;
    stats_.handler_failures += failed;
}

std::vector<DomainEvent> EventBus::getHistory(std::optional<DomainEventType> type, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<DomainEvent> result;
    for (auto it = history_.rbegin(); it != history_.rend() && result.size() < limit; ++it) {
        if (!type || it->type == *type) {
            result.push_back(*it);
        }
    }
    std::reverse(result.begin(), result.end());
    return result;
}

size_t EventBus::countEvents(DomainEventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(history_.begin(), history_.end(),
                                              [type](const DomainEvent& e) { return e.type == type; }));
}

void EventBus::clearHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

EventBusStats EventBus::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace events
} // namespace swarmnet
