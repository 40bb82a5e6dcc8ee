/**
 * @file basic_transport.h
 * @brief Shared transport logic on top of pluggable links
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>
#include <set>
#include <map>
#include <unordered_set>
#include <deque>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>

#include "network/transport.h"
#include "network/transport_config.h"
#include "utils/periodic_task.h"

namespace swarmnet {
namespace network {

/**
 * @brief One established channel to a peer
 */
class Link {
public:
    virtual ~Link() = default;

    /**
     * @brief Write one message to the peer
     * @return False if the link is closed or the write failed
     */
    virtual bool send(const Message& message) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

/**
 * @brief Transport implementation shared by every concrete link type
 *
 * Owns the connection table, handler table, known nodes, statistics, the
 * heartbeat and discovery tasks and a dispatcher thread. Inbound messages and
 * connection events are queued and handled on the dispatcher thread, so
 * handlers never run while a link or table lock is held.
 *
 * Subclasses provide the endpoint (startEndpoint/stopEndpoint) and outbound
 * links (openLink), and must call stop() from their destructor.
 */
class BasicTransport : public Transport {
public:
    BasicTransport(const std::string& node_id,
                   const std::string& address,
                   uint16_t port,
                   const TransportConfig& config);
    ~BasicTransport() override;

    BasicTransport(const BasicTransport&) = delete;
    BasicTransport& operator=(const BasicTransport&) = delete;

    bool start() override;
    void stop() override;
    bool isRunning() const override { return running_; }

    bool connect(const std::string& peer_id, const std::string& address, uint16_t port) override;
    void disconnect(const std::string& peer_id) override;

    bool sendMessage(const std::string& to, const std::string& type, const nlohmann::json& payload) override;
    size_t broadcast(const std::string& type, const nlohmann::json& payload) override;
    void onMessage(const std::string& type, MessageHandler handler) override;

    std::vector<std::string> getConnectedPeers() const override;
    bool isConnectedTo(const std::string& peer_id) const override;
    std::vector<Connection> getConnections() const override;
    std::vector<Node> getKnownNodes() const override;
    TransportStats getNetworkStats() const override;

    void setEventListener(TransportEventListener listener) override;
    void setCapabilities(const std::set<std::string>& capabilities) override;

    const std::string& nodeId() const override { return node_id_; }
    std::string address() const override { return address_; }
    uint16_t port() const override { return port_; }

    /**
     * @brief Most recent heartbeat round trip to a peer in milliseconds, or -1
     */
    double getPeerLatency(const std::string& peer_id) const;

    /**
     * @brief Announce liveness to every connected peer now
     */
    size_t sendHeartbeat();

    /**
     * @brief Announce capabilities to every connected peer now
     */
    size_t sendDiscovery();

    const TransportConfig& getConfig() const { return config_; }

protected:
    virtual bool startEndpoint() = 0;
    virtual void stopEndpoint() = 0;

    /**
     * @brief Open an outbound link
     * @return Open link, or nullptr on failure (reason describes why)
     */
    virtual std::shared_ptr<Link> openLink(const std::string& peer_id,
                                           const std::string& address,
                                           uint16_t port,
                                           std::string& reason) = 0;

    /**
     * @brief Record a link whose peer id is already known
     * @param previous Receives the link it replaced, if any; the caller decides how to close it
     * @return False when the transport has stopped; the link is not recorded
     */
    bool attachLink(const std::string& peer_id,
                    std::shared_ptr<Link> link,
                    const std::string& address,
                    uint16_t port,
                    std::shared_ptr<Link>& previous);

    /**
     * @brief Queue an inbound message for dispatch
     * @param via Link the message arrived on; binds the link to the sender
     *            when the sender has no connection entry yet
     */
    void receive(const Message& message, const std::shared_ptr<Link>& via = nullptr);

    /**
     * @brief Remove the connection entry that uses this link
     */
    void handleLinkClosed(const std::shared_ptr<Link>& link);

    std::vector<std::pair<std::string, std::shared_ptr<Link>>> linkSnapshot() const;

    void setBoundPort(uint16_t port) { port_ = port; }

private:
    struct PeerEntry {
        std::shared_ptr<Link> link;
        Connection connection;
        std::string address;
        uint16_t port = 0;
    };

    std::string node_id_;
    std::string address_;
    std::atomic<uint16_t> port_;
    TransportConfig config_;

    std::atomic<bool> running_;
    std::mutex lifecycle_mutex_;

    mutable std::mutex peers_mutex_;
    std::map<std::string, PeerEntry> peers_;
    std::map<std::string, Node> known_nodes_;
    std::set<std::string> capabilities_;

    mutable std::mutex handlers_mutex_;
    std::map<std::string, MessageHandler> handlers_;
    TransportEventListener event_listener_;

    mutable std::mutex stats_mutex_;
    TransportStats stats_;
    double latency_total_ms_;
    std::map<std::string, double> peer_latency_;

    std::unordered_set<std::string> seen_ids_;
    std::deque<std::string> seen_order_;

    std::thread dispatcher_thread_;
    std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::deque<std::function<void()>> queue_;
    bool dispatcher_running_;

    std::unique_ptr<utils::PeriodicTask> heartbeat_task_;
    std::unique_ptr<utils::PeriodicTask> discovery_task_;

    bool deliver(const std::string& peer_id, const Message& message);
    size_t fanOut(MessageKind kind, const std::string& type, const nlohmann::json& payload);
    void process(const Message& message);
    bool markSeen(const std::string& message_id);
    void updateKnownNode(const Message& message);
    void recordLatency(const std::string& peer_id, double latency_ms);
    bool post(std::function<void()> task);
    void emit(TransportEvent event);
    void dispatcherLoop();
    void startDispatcher();
    void stopDispatcher();
    nlohmann::json discoveryPayload() const;
};

} // namespace network
} // namespace swarmnet
