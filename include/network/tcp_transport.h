/**
 * @file tcp_transport.h
 * @brief TCP transport with length-prefixed JSON frames
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <thread>
#include <mutex>
#include <atomic>

#include "network/basic_transport.h"

namespace swarmnet {
namespace network {

/**
 * @brief TCP link to a single peer
 *
 * Frames are a 4-byte big-endian length followed by the JSON encoded
 * message. The socket is closed when the last reference goes away;
 * close() only shuts it down so a blocked reader wakes up.
 */
class TcpLink : public Link {
public:
    static constexpr uint32_t MAX_FRAME_SIZE = 1024 * 1024;

    TcpLink(int socket_fd, const std::string& remote_address, uint16_t remote_port);
    ~TcpLink() override;

    TcpLink(const TcpLink&) = delete;
    TcpLink& operator=(const TcpLink&) = delete;

    bool send(const Message& message) override;
    void close() override;
    bool isOpen() const override { return open_; }

    /**
     * @brief Block until one frame has been read
     * @param payload Frame body
     * @return False on EOF, socket error or oversized frame
     */
    bool readFrame(std::string& payload);

    const std::string& getRemoteAddress() const { return remote_address_; }
    uint16_t getRemotePort() const { return remote_port_; }

private:
    int socket_fd_;
    std::string remote_address_;
    uint16_t remote_port_;
    std::mutex send_mutex_;
    std::atomic<bool> open_;

    bool writeFully(const char* data, size_t length);
    bool readFully(char* data, size_t length);
};

/**
 * @brief Transport over POSIX TCP sockets
 *
 * A listener thread accepts inbound connections; every link gets its own
 * reader thread, joined when the link is replaced or the endpoint stops. An inbound link is bound to a peer id by the first message
 * that arrives on it (normally the connecting side's discovery announcement).
 */
class TcpTransport : public BasicTransport {
public:
    /**
     * @param node_id Node id
     * @param address Address advertised to peers
     * @param port Listen port; 0 picks an ephemeral port (see port())
     * @param config Transport configuration; listen_address selects the bind address
     */
    TcpTransport(const std::string& node_id,
                 const std::string& address,
                 uint16_t port,
                 const TransportConfig& config = TransportConfig());
    ~TcpTransport() override;

protected:
    bool startEndpoint() override;
    void stopEndpoint() override;
    std::shared_ptr<Link> openLink(const std::string& peer_id,
                                   const std::string& address,
                                   uint16_t port,
                                   std::string& reason) override;

private:
    int listen_socket_;
    std::thread listener_thread_;
    std::atomic<bool> listening_;

    std::mutex links_mutex_;
    std::map<std::shared_ptr<TcpLink>, std::thread> readers_;
    std::vector<std::shared_ptr<TcpLink>> finished_readers_;

    void listenerLoop();
    void handleNewConnection(int client_socket, const std::string& client_address, uint16_t client_port);

    /**
     * @brief Start the reader thread for a link
     * @return False once the endpoint is stopping; the link is left to the caller
     */
    bool startReader(const std::shared_ptr<TcpLink>& link);
    void readerLoop(std::shared_ptr<TcpLink> link);
    void joinFinishedReaders();

    static bool setSocketNonBlocking(int socket_fd, bool enabled);
    static void configureSocket(int socket_fd);
};

} // namespace network
} // namespace swarmnet
