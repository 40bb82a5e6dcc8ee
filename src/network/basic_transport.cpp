/**
 * @file basic_transport.cpp
 * @brief Shared transport logic implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "network/basic_transport.h"
#include "utils/logger.h"
#include "utils/error_handler.h"

namespace swarmnet {
namespace network {

BasicTransport::BasicTransport(const std::string& node_id,
                               const std::string& address,
                               uint16_t port,
                               const TransportConfig& config)
    : node_id_(node_id)
    , address_(address)
    , port_(port)
    , config_(config)
    , running_(false)
    , latency_total_ms_(0.0)
    , dispatcher_running_(false) {
}

BasicTransport::~BasicTransport() {
    heartbeat_task_.reset();
    discovery_task_.reset();
    stopDispatcher();
}

bool BasicTransport::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (running_) {
        SWARMNET_LOG_INFO(TRANSPORT, "Transport " + node_id_ + " is already running");
        return true;
    }

    startDispatcher();
    running_ = true;

    if (!startEndpoint()) {
        running_ = false;
        stopDispatcher();
        SWARMNET_ERROR(TRANSPORT, "Failed to start endpoint for " + node_id_ + " on " +
                       address_ + ":" + std::to_string(port_));
        return false;
    }

    heartbeat_task_ = std::make_unique<utils::PeriodicTask>(
        node_id_ + ":heartbeat", config_.heartbeat_interval, [this]() { sendHeartbeat(); });
    discovery_task_ = std::make_unique<utils::PeriodicTask>(
        node_id_ + ":discovery", config_.discovery_interval, [this]() { sendDiscovery(); });
    heartbeat_task_->start();
    discovery_task_->start();

    SWARMNET_LOG_INFO(TRANSPORT, "Transport " + node_id_ + " started on " +
                      address_ + ":" + std::to_string(port_));
    return true;
}

void BasicTransport::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (!running_) {
        return;
    }

    SWARMNET_LOG_INFO(TRANSPORT, "Stopping transport " + node_id_);
    running_ = false;

    if (heartbeat_task_) {
        heartbeat_task_->stop();
        heartbeat_task_.reset();
    }
    if (discovery_task_) {
        discovery_task_->stop();
        discovery_task_.reset();
    }

    stopEndpoint();

    std::map<std::string, PeerEntry> peers;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        peers.swap(peers_);
        known_nodes_.clear();
    }

    for (auto& [peer_id, entry] : peers) {
        entry.link->close();
    }

    stopDispatcher();

    SWARMNET_LOG_INFO(TRANSPORT, "Transport " + node_id_ + " stopped, closed " +
                      std::to_string(peers.size()) + " connections");
}

bool BasicTransport::connect(const std::string& peer_id, const std::string& address, uint16_t port) {
    if (isConnectedTo(peer_id)) {
        SWARMNET_LOG_DEBUG(TRANSPORT, node_id_ + " already connected to " + peer_id);
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.connection_attempts++;
    }

    std::string reason;
    std::shared_ptr<Link> link;
    if (!running_) {
        reason = "transport not running";
    } else if (peer_id == node_id_) {
        reason = "cannot connect to self";
    } else {
        link = openLink(peer_id, address, port, reason);
    }

    std::shared_ptr<Link> previous;
    if (link && !attachLink(peer_id, link, address, port, previous)) {
        // stop() ran while the link was being opened
        link->close();
        link.reset();
        reason = "transport stopped while connecting";
    }

    if (!link) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.connection_failures++;
        }
        SWARMNET_LOG_WARNING(TRANSPORT, node_id_ + " failed to connect to " + peer_id + " at " +
                             address + ":" + std::to_string(port) + ": " + reason);
        emit(TransportEvent{TransportEventType::CONNECTION_FAILED, peer_id, address, port, reason});
        return false;
    }

    if (previous) {
        previous->close();
    }

    // Self-introduction; lets the accepting side learn our node id
    try {
        Message announcement = Message::create(node_id_, peer_id, MessageKind::DISCOVERY,
                                               payload_types::DISCOVERY, discoveryPayload(),
                                               config_.message_ttl_seconds);
        deliver(peer_id, announcement);
    } catch (const std::exception& e) {
        SWARMNET_ERROR(TRANSPORT, "Failed to build discovery announcement: " + std::string(e.what()));
    }

    SWARMNET_LOG_INFO(TRANSPORT, node_id_ + " connected to " + peer_id + " at " +
                      address + ":" + std::to_string(port));
    return true;
}

void BasicTransport::disconnect(const std::string& peer_id) {
    PeerEntry removed;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return;
        }
        removed = it->second;
        peers_.erase(it);
    }

    removed.link->close();
    SWARMNET_LOG_INFO(TRANSPORT, node_id_ + " disconnected from " + peer_id);
    emit(TransportEvent{TransportEventType::PEER_DISCONNECTED, peer_id, removed.address, removed.port, "local disconnect"});
}

bool BasicTransport::sendMessage(const std::string& to, const std::string& type, const nlohmann::json& payload) {
    if (!running_) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.send_failures++;
        return false;
    }

    try {
        Message message = Message::create(node_id_, to, MessageKind::DIRECT, type, payload,
                                          config_.message_ttl_seconds);
        return deliver(to, message);
    } catch (const std::exception& e) {
        SWARMNET_ERROR(TRANSPORT, "Failed to build message " + type + ": " + e.what());
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.send_failures++;
        return false;
    }
}

size_t BasicTransport::broadcast(const std::string& type, const nlohmann::json& payload) {
    return fanOut(MessageKind::BROADCAST, type, payload);
}

void BasicTransport::onMessage(const std::string& type, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    if (handlers_.count(type) > 0) {
        SWARMNET_LOG_DEBUG(TRANSPORT, node_id_ + " replacing handler for " + type);
    }
    handlers_[type] = std::move(handler);
}

std::vector<std::string> BasicTransport::getConnectedPeers() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    std::vector<std::string> peers;
    for (const auto& [peer_id, entry] : peers_) {
        if (entry.link->isOpen()) {
            peers.push_back(peer_id);
        }
    }
    return peers;
}

bool BasicTransport::isConnectedTo(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = peers_.find(peer_id);
    return it != peers_.end() && it->second.link->isOpen();
}

std::vector<Connection> BasicTransport::getConnections() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    std::vector<Connection> connections;
    for (const auto& [peer_id, entry] : peers_) {
        Connection connection = entry.connection;
        connection.status = entry.link->isOpen() ? ConnectionStatus::CONNECTED : ConnectionStatus::DISCONNECTED;
        connections.push_back(connection);
    }
    return connections;
}

std::vector<Node> BasicTransport::getKnownNodes() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    std::vector<Node> nodes;
    nodes.reserve(known_nodes_.size());
    for (const auto& [node_id, node] : known_nodes_) {
        nodes.push_back(node);
    }
    return nodes;
}

TransportStats BasicTransport::getNetworkStats() const {
    TransportStats stats;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats = stats_;
        if (stats.latency_samples > 0) {
            stats.average_latency_ms = latency_total_ms_ / static_cast<double>(stats.latency_samples);
        }
    }

    std::lock_guard<std::mutex> lock(peers_mutex_);
    stats.active_connections = 0;
    for (const auto& [peer_id, entry] : peers_) {
        if (entry.link->isOpen()) {
            stats.active_connections++;
        }
    }
    stats.known_nodes = known_nodes_.size();
    return stats;
}

void BasicTransport::setEventListener(TransportEventListener listener) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    event_listener_ = std::move(listener);
}

void BasicTransport::setCapabilities(const std::set<std::string>& capabilities) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    capabilities_ = capabilities;
}

double BasicTransport::getPeerLatency(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    auto it = peer_latency_.find(peer_id);
    return it != peer_latency_.end() ? it->second : -1.0;
}

size_t BasicTransport::sendHeartbeat() {
    nlohmann::json payload;
    payload["nodeId"] = node_id_;
    payload["timestamp"] = currentTimeMillis();
    payload["status"] = nodeStatusName(NodeStatus::ONLINE);
    size_t sent = fanOut(MessageKind::HEARTBEAT, payload_types::HEARTBEAT, payload);
    SWARMNET_LOG_TRACE(TRANSPORT, node_id_ + " heartbeat sent to " + std::to_string(sent) + " peers");
    return sent;
}

size_t BasicTransport::sendDiscovery() {
    size_t sent = fanOut(MessageKind::DISCOVERY, payload_types::DISCOVERY, discoveryPayload());
    SWARMNET_LOG_TRACE(TRANSPORT, node_id_ + " discovery sent to " + std::to_string(sent) + " peers");
    return sent;
}

bool BasicTransport::attachLink(const std::string& peer_id,
                                std::shared_ptr<Link> link,
                                const std::string& address,
                                uint16_t port,
                                std::shared_ptr<Link>& previous) {
    previous.reset();
    {
        // stop() clears running_ before it takes this lock to close the table
        std::lock_guard<std::mutex> lock(peers_mutex_);
        if (!running_) {
            return false;
        }
        auto it = peers_.find(peer_id);
        if (it != peers_.end() && it->second.link != link) {
            previous = it->second.link;
        }

        PeerEntry entry;
        entry.link = std::move(link);
        entry.connection.from = node_id_;
        entry.connection.to = peer_id;
        entry.connection.status = ConnectionStatus::CONNECTED;
        entry.connection.last_activity = currentTimeMillis();
        entry.address = address;
        entry.port = port;
        peers_[peer_id] = std::move(entry);
    }

    emit(TransportEvent{TransportEventType::PEER_CONNECTED, peer_id, address, port, ""});
    return true;
}

void BasicTransport::receive(const Message& message, const std::shared_ptr<Link>& via) {
    if (!running_) {
        return;
    }

    if (via && message.from != node_id_) {
        bool bound = false;
        std::string address;
        uint16_t port = 0;
        {
            std::lock_guard<std::mutex> lock(peers_mutex_);
            auto it = peers_.find(message.from);
            if (running_ && (it == peers_.end() || !it->second.link->isOpen())) {
                const nlohmann::json& data = message.data;
                if (data.is_object() && data.contains("address") && data["address"].is_string()) {
                    address = data["address"].get<std::string>();
                }
                if (data.is_object() && data.contains("port") && data["port"].is_number_unsigned()) {
                    port = data["port"].get<uint16_t>();
                }

                PeerEntry entry;
                entry.link = via;
                entry.connection.from = node_id_;
                entry.connection.to = message.from;
                entry.connection.status = ConnectionStatus::CONNECTED;
                entry.connection.last_activity = currentTimeMillis();
                entry.address = address;
                entry.port = port;
                peers_[message.from] = std::move(entry);
                bound = true;
            }
        }

        if (bound) {
            SWARMNET_LOG_INFO(TRANSPORT, node_id_ + " accepted connection from " + message.from);
            emit(TransportEvent{TransportEventType::PEER_CONNECTED, message.from, address, port, "inbound"});
        }
    }

    if (!post([this, message]() { process(message); })) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_dropped++;
    }
}

void BasicTransport::handleLinkClosed(const std::shared_ptr<Link>& link) {
    std::string peer_id;
    PeerEntry removed;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        for (auto it = peers_.begin(); it != peers_.end(); ++it) {
            if (it->second.link == link) {
                peer_id = it->first;
                removed = it->second;
                peers_.erase(it);
                break;
            }
        }
    }

    if (peer_id.empty()) {
        return;
    }

    SWARMNET_LOG_INFO(TRANSPORT, node_id_ + " lost connection to " + peer_id);
    emit(TransportEvent{TransportEventType::PEER_DISCONNECTED, peer_id, removed.address, removed.port, "link closed"});
}

std::vector<std::pair<std::string, std::shared_ptr<Link>>> BasicTransport::linkSnapshot() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    std::vector<std::pair<std::string, std::shared_ptr<Link>>> links;
    for (const auto& [peer_id, entry] : peers_) {
        links.emplace_back(peer_id, entry.link);
    }
    return links;
}

bool BasicTransport::deliver(const std::string& peer_id, const Message& message) {
    std::shared_ptr<Link> link;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(peer_id);
        if (it != peers_.end()) {
            link = it->second.link;
        }
    }

    if (!link) {
        SWARMNET_LOG_DEBUG(TRANSPORT, node_id_ + " has no connection to " + peer_id +
                           ", dropping " + message.type);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.send_failures++;
        return false;
    }

    if (!link->send(message)) {
        SWARMNET_LOG_WARNING(TRANSPORT, node_id_ + " failed to send " + message.type + " to " + peer_id);
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.send_failures++;
        }
        if (!link->isOpen()) {
            handleLinkClosed(link);
        }
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_sent++;
    }
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(peer_id);
        if (it != peers_.end() && it->second.link == link) {
            it->second.connection.last_activity = message.timestamp;
        }
    }
    return true;
}

size_t BasicTransport::fanOut(MessageKind kind, const std::string& type, const nlohmann::json& payload) {
    if (!running_) {
        return 0;
    }

    Message message;
    try {
        message = Message::create(node_id_, BROADCAST_TARGET, kind, type, payload, config_.message_ttl_seconds);
    } catch (const std::exception& e) {
        SWARMNET_ERROR(TRANSPORT, "Failed to build broadcast " + type + ": " + e.what());
        return 0;
    }

    size_t delivered = 0;
    for (const auto& [peer_id, link] : linkSnapshot()) {
        if (!link->isOpen()) {
            continue;
        }
        if (link->send(message)) {
            delivered++;
            continue;
        }

        SWARMNET_LOG_WARNING(TRANSPORT, node_id_ + " broadcast of " + type + " to " + peer_id + " failed");
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.send_failures++;
        }
        if (!link->isOpen()) {
            handleLinkClosed(link);
        }
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.messages_sent += delivered;
    return delivered;
}

void BasicTransport::process(const Message& message) {
    if (message.from == node_id_) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_dropped++;
        return;
    }

    if (!markSeen(message.id)) {
        SWARMNET_LOG_TRACE(TRANSPORT, node_id_ + " dropping duplicate " + message.id);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_dropped++;
        return;
    }

    uint64_t now = currentTimeMillis();
    if (config_.enforce_ttl && message.isExpired(now)) {
        SWARMNET_LOG_DEBUG(TRANSPORT, node_id_ + " dropping expired " + message.type + " from " + message.from);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_expired++;
        stats_.messages_dropped++;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_received++;
    }
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(message.from);
        if (it != peers_.end()) {
            it->second.connection.last_activity = now;
        }
    }

    if (message.kind == MessageKind::DISCOVERY || message.kind == MessageKind::HEARTBEAT) {
        updateKnownNode(message);
    }

    if (message.kind == MessageKind::HEARTBEAT && message.type == payload_types::HEARTBEAT &&
        isConnectedTo(message.from)) {
        nlohmann::json ack;
        ack["nodeId"] = node_id_;
        ack["echo_timestamp"] = message.timestamp;
        sendMessage(message.from, payload_types::HEARTBEAT_ACK, ack);
    } else if (message.type == payload_types::HEARTBEAT_ACK && message.data.is_object()) {
        uint64_t echo = message.data.value("echo_timestamp", static_cast<uint64_t>(0));
        if (echo > 0 && now >= echo) {
            recordLatency(message.from, static_cast<double>(now - echo));
        }
    }

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(message.type);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        SWARMNET_LOG_TRACE(TRANSPORT, node_id_ + " has no handler for " + message.type);
        return;
    }

    try {
        handler(message);
    } catch (const std::exception& e) {
        SWARMNET_ERROR(TRANSPORT, "Handler for " + message.type + " on " + node_id_ + " threw: " + e.what());
    }
}

bool BasicTransport::markSeen(const std::string& message_id) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (!seen_ids_.insert(message_id).second) {
        return false;
    }

    seen_order_.push_back(message_id);
    while (seen_order_.size() > config_.seen_cache_size) {
        seen_ids_.erase(seen_order_.front());
        seen_order_.pop_front();
    }
    return true;
}

void BasicTransport::updateKnownNode(const Message& message) {
    const nlohmann::json& data = message.data;
    std::string id = message.from;
    if (data.is_object() && data.contains("nodeId") && data["nodeId"].is_string()) {
        id = data["nodeId"].get<std::string>();
    }

    std::lock_guard<std::mutex> lock(peers_mutex_);
    Node& node = known_nodes_[id];

    // Last write wins on last_seen
    if (message.timestamp < node.last_seen) {
        return;
    }

    node.id = id;
    node.last_seen = message.timestamp;
    node.metadata["last_announcement"] = messageKindName(message.kind);

    if (!data.is_object()) {
        return;
    }

    if (data.contains("address") && data["address"].is_string()) {
        node.address = data["address"].get<std::string>();
    }
    if (data.contains("port") && data["port"].is_number_unsigned()) {
        node.port = data["port"].get<uint16_t>();
    }
    if (data.contains("capabilities") && data["capabilities"].is_array()) {
        node.capabilities.clear();
        for (const auto& capability : data["capabilities"]) {
            if (capability.is_string()) {
                node.capabilities.insert(capability.get<std::string>());
            }
        }
    }

    std::string status = data.value("status", std::string("online"));
    if (status == "busy") {
        node.status = NodeStatus::BUSY;
    } else if (status == "offline") {
        node.status = NodeStatus::OFFLINE;
    } else {
        node.status = NodeStatus::ONLINE;
    }
}

void BasicTransport::recordLatency(const std::string& peer_id, double latency_ms) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.latency_samples++;
    latency_total_ms_ += latency_ms;
    peer_latency_[peer_id] = latency_ms;
}

bool BasicTransport::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!dispatcher_running_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    queue_condition_.notify_one();
    return true;
}

void BasicTransport::emit(TransportEvent event) {
    auto notify = [this, event]() {
        TransportEventListener listener;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            listener = event_listener_;
        }
        if (!listener) {
            return;
        }
        try {
            listener(event);
        } catch (const std::exception& e) {
            SWARMNET_ERROR(TRANSPORT, "Transport event listener threw: " + std::string(e.what()));
        }
    };

    // Deliver inline when no dispatcher is running (e.g. connect on a stopped transport)
    if (!post(notify)) {
        notify();
    }
}

void BasicTransport::dispatcherLoop() {
    SWARMNET_LOG_DEBUG(TRANSPORT, "Dispatcher for " + node_id_ + " started");

    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] { return !queue_.empty() || !dispatcher_running_; });
            if (queue_.empty()) {
                break;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            SWARMNET_ERROR(TRANSPORT, "Dispatcher task on " + node_id_ + " threw: " + e.what());
        }
    }

    SWARMNET_LOG_DEBUG(TRANSPORT, "Dispatcher for " + node_id_ + " stopped");
}

void BasicTransport::startDispatcher() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dispatcher_running_ = true;
        queue_.clear();
    }
    dispatcher_thread_ = std::thread(&BasicTransport::dispatcherLoop, this);
}

void BasicTransport::stopDispatcher() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dispatcher_running_ = false;
    }
    queue_condition_.notify_all();

    if (!dispatcher_thread_.joinable()) {
        return;
    }
    if (dispatcher_thread_.get_id() == std::this_thread::get_id()) {
        dispatcher_thread_.detach();
    } else {
        dispatcher_thread_.join();
    }
}

nlohmann::json BasicTransport::discoveryPayload() const {
    nlohmann::json payload;
    payload["nodeId"] = node_id_;
    payload["timestamp"] = currentTimeMillis();
    payload["address"] = address_;
    payload["port"] = port_.load();
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        payload["capabilities"] = capabilities_;
    }
    return payload;
}

} // namespace network
} // namespace swarmnet
