/**
 * @file in_memory_transport.h
 * @brief Process-local transport for tests and simulations
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <atomic>

#include "network/basic_transport.h"

namespace swarmnet {
namespace network {

class InMemoryTransport;

/**
 * @brief Open/closed state shared by both ends of an in-memory link
 */
struct InMemoryChannel {
    std::atomic<bool> open{true};
};

/**
 * @brief Address registry connecting in-memory transports
 *
 * Must be owned by a std::shared_ptr; links keep the network alive.
 */
class InMemoryNetwork : public std::enable_shared_from_this<InMemoryNetwork> {
public:
    InMemoryNetwork() = default;

    InMemoryNetwork(const InMemoryNetwork&) = delete;
    InMemoryNetwork& operator=(const InMemoryNetwork&) = delete;

    /**
     * @brief Register a listening transport
     * @return False if the address is already taken
     */
    bool bind(const std::string& address, uint16_t port, InMemoryTransport* transport);
    void unbind(const std::string& address, uint16_t port, const InMemoryTransport* transport);

    /**
     * @brief Connect a transport to the one listening at address:port
     *
     * The acceptor receives the other end of the link immediately, so both
     * sides hold a connection entry when this returns.
     *
     * @return Caller's end of the link, or nullptr with reason set
     */
    std::shared_ptr<Link> connect(InMemoryTransport& from,
                                  const std::string& peer_id,
                                  const std::string& address,
                                  uint16_t port,
                                  std::string& reason);

    /**
     * @brief Hand a message to the transport listening at an endpoint
     * @return False if nothing listens there
     */
    bool deliver(const std::string& endpoint, const Message& message);

    /**
     * @brief Tell the transport at an endpoint that a shared channel closed
     */
    void notifyClosed(const std::string& endpoint, const std::shared_ptr<InMemoryChannel>& channel);

    /**
     * @brief Make an endpoint refuse new connections
     */
    void setUnreachable(const std::string& address, uint16_t port, bool unreachable);

    size_t endpointCount() const;

    static std::string endpointKey(const std::string& address, uint16_t port);

private:
    mutable std::mutex mutex_;
    std::map<std::string, InMemoryTransport*> endpoints_;
    std::set<std::string> unreachable_;
};

/**
 * @brief One end of an in-memory link
 */
class InMemoryLink : public Link {
public:
    InMemoryLink(std::shared_ptr<InMemoryNetwork> network,
                 std::string remote_endpoint,
                 std::shared_ptr<InMemoryChannel> channel);

    bool send(const Message& message) override;
    void close() override;
    bool isOpen() const override { return channel_->open; }

    /**
     * @brief Close without notifying the remote end
     */
    void detach() { channel_->open = false; }

    const std::shared_ptr<InMemoryChannel>& channel() const { return channel_; }

private:
    std::shared_ptr<InMemoryNetwork> network_;
    std::string remote_endpoint_;
    std::shared_ptr<InMemoryChannel> channel_;
};

/**
 * @brief Transport whose links live in an InMemoryNetwork
 */
class InMemoryTransport : public BasicTransport {
public:
    InMemoryTransport(std::shared_ptr<InMemoryNetwork> network,
                      const std::string& node_id,
                      const std::string& address,
                      uint16_t port,
                      const TransportConfig& config = TransportConfig());
    ~InMemoryTransport() override;

    const std::shared_ptr<InMemoryNetwork>& network() const { return network_; }

protected:
    bool startEndpoint() override;
    void stopEndpoint() override;
    std::shared_ptr<Link> openLink(const std::string& peer_id,
                                   const std::string& address,
                                   uint16_t port,
                                   std::string& reason) override;

private:
    friend class InMemoryNetwork;

    std::shared_ptr<InMemoryNetwork> network_;

    bool acceptLink(const std::string& peer_id,
                    const std::shared_ptr<InMemoryLink>& link,
                    const std::string& address,
                    uint16_t port);
    void deliverLocal(const Message& message);
    void remoteClosed(const std::shared_ptr<InMemoryChannel>& channel);
};

} // namespace network
} // namespace swarmnet
