/**
 * @file in_memory_transport.cpp
 * @brief Process-local transport implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "network/in_memory_transport.h"
#include "utils/logger.h"

namespace swarmnet {
namespace network {

bool InMemoryNetwork::bind(const std::string& address, uint16_t port, InMemoryTransport* transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = endpointKey(address, port);
    if (!endpoints_.emplace(key, transport).second) {
        SWARMNET_LOG_WARNING(NETWORKING, "In-memory endpoint already bound: " + key);
        return false;
    }
    return true;
}

void InMemoryNetwork::unbind(const std::string& address, uint16_t port, const InMemoryTransport* transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = endpoints_.find(endpointKey(address, port));
    if (it != endpoints_.end() && it->second == transport) {
        endpoints_.erase(it);
    }
}

std::shared_ptr<Link> InMemoryNetwork::connect(InMemoryTransport& from,
                                               const std::string& peer_id,
                                               const std::string& address,
                                               uint16_t port,
                                               std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string key = endpointKey(address, port);
    if (unreachable_.count(key) > 0) {
        reason = "endpoint unreachable: " + key;
        return nullptr;
    }

    auto it = endpoints_.find(key);
    if (it == endpoints_.end()) {
        reason = "connection refused: " + key;
        return nullptr;
    }

    InMemoryTransport* target = it->second;
    if (target == &from) {
        reason = "endpoint is the caller";
        return nullptr;
    }
    if (target->nodeId() != peer_id) {
        reason = "endpoint " + key + " belongs to " + target->nodeId();
        return nullptr;
    }

    auto channel = std::make_shared<InMemoryChannel>();
    std::string from_key = endpointKey(from.address(), from.port());
    auto local = std::make_shared<InMemoryLink>(shared_from_this(), key, channel);
    auto remote = std::make_shared<InMemoryLink>(shared_from_this(), from_key, channel);

    if (!target->acceptLink(from.nodeId(), remote, from.address(), from.port())) {
        reason = "connection refused: " + key + " is stopping";
        return nullptr;
    }
    return local;
}

bool InMemoryNetwork::deliver(const std::string& endpoint, const Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = endpoints_.find(endpoint);
    if (it == endpoints_.end()) {
        return false;
    }
    it->second->deliverLocal(message);
    return true;
}

void InMemoryNetwork::notifyClosed(const std::string& endpoint, const std::shared_ptr<InMemoryChannel>& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = endpoints_.find(endpoint);
    if (it != endpoints_.end()) {
        it->second->remoteClosed(channel);
    }
}

void InMemoryNetwork::setUnreachable(const std::string& address, uint16_t port, bool unreachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = endpointKey(address, port);
    if (unreachable) {
        unreachable_.insert(key);
    } else {
        unreachable_.erase(key);
    }
}

size_t InMemoryNetwork::endpointCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoints_.size();
}

std::string InMemoryNetwork::endpointKey(const std::string& address, uint16_t port) {
    return address + ":" + std::to_string(port);
}

InMemoryLink::InMemoryLink(std::shared_ptr<InMemoryNetwork> network,
                           std::string remote_endpoint,
                           std::shared_ptr<InMemoryChannel> channel)
    : network_(std::move(network))
    , remote_endpoint_(std::move(remote_endpoint))
    , channel_(std::move(channel)) {
}

bool InMemoryLink::send(const Message& message) {
    if (!channel_->open) {
        return false;
    }
    if (!network_->deliver(remote_endpoint_, message)) {
        channel_->open = false;
        return false;
    }
    return true;
}

void InMemoryLink::close() {
    if (channel_->open.exchange(false)) {
        network_->notifyClosed(remote_endpoint_, channel_);
    }
}

InMemoryTransport::InMemoryTransport(std::shared_ptr<InMemoryNetwork> network,
                                     const std::string& node_id,
                                     const std::string& address,
                                     uint16_t port,
                                     const TransportConfig& config)
    : BasicTransport(node_id, address, port, config)
    , network_(std::move(network)) {
}

InMemoryTransport::~InMemoryTransport() {
    stop();
}

bool InMemoryTransport::startEndpoint() {
    return network_->bind(address(), port(), this);
}

void InMemoryTransport::stopEndpoint() {
    network_->unbind(address(), port(), this);
}

std::shared_ptr<Link> InMemoryTransport::openLink(const std::string& peer_id,
                                                  const std::string& address,
                                                  uint16_t port,
                                                  std::string& reason) {
    return network_->connect(*this, peer_id, address, port, reason);
}

bool InMemoryTransport::acceptLink(const std::string& peer_id,
                                   const std::shared_ptr<InMemoryLink>& link,
                                   const std::string& address,
                                   uint16_t port) {
    std::shared_ptr<Link> previous;
    if (!attachLink(peer_id, link, address, port, previous)) {
        link->detach();
        SWARMNET_LOG_DEBUG(NETWORKING, nodeId() + " is stopping, refused in-memory link from " + peer_id);
        return false;
    }
    if (auto stale = std::dynamic_pointer_cast<InMemoryLink>(previous)) {
        // The network lock is held here, so the old channel is closed quietly
        stale->detach();
    }
    SWARMNET_LOG_DEBUG(NETWORKING, nodeId() + " accepted in-memory link from " + peer_id);
    return true;
}

void InMemoryTransport::deliverLocal(const Message& message) {
    receive(message);
}

void InMemoryTransport::remoteClosed(const std::shared_ptr<InMemoryChannel>& channel) {
    for (const auto& [peer_id, link] : linkSnapshot()) {
        auto in_memory = std::dynamic_pointer_cast<InMemoryLink>(link);
        if (in_memory && in_memory->channel() == channel) {
            handleLinkClosed(link);
            return;
        }
    }
}

} // namespace network
} // namespace swarmnet
