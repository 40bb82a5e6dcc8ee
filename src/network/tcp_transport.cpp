/**
 * @file tcp_transport.cpp
 * @brief TCP transport implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "network/tcp_transport.h"
#include "utils/logger.h"
#include "utils/error_handler.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>

#include <cstring>
#include <vector>
#include <chrono>

namespace swarmnet {
namespace network {

TcpLink::TcpLink(int socket_fd, const std::string& remote_address, uint16_t remote_port)
    : socket_fd_(socket_fd)
    , remote_address_(remote_address)
    , remote_port_(remote_port)
    , open_(true) {
}

TcpLink::~TcpLink() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

bool TcpLink::send(const Message& message) {
    std::lock_guard<std::mutex> lock(send_mutex_);

    if (!open_) {
        return false;
    }

    std::string serialized;
    try {
        serialized = message.toJson().dump();
    } catch (const std::exception& e) {
        SWARMNET_LOG_ERROR(NETWORKING, "Failed to serialize message for " + remote_address_ + ": " + e.what());
        return false;
    }

    if (serialized.size() > MAX_FRAME_SIZE) {
        SWARMNET_LOG_ERROR(NETWORKING, "Message too large for " + remote_address_ + ": " +
                           std::to_string(serialized.size()));
        return false;
    }

    uint32_t message_length = htonl(static_cast<uint32_t>(serialized.size()));
    if (!writeFully(reinterpret_cast<const char*>(&message_length), sizeof(message_length)) ||
        !writeFully(serialized.data(), serialized.size())) {
        SWARMNET_LOG_WARNING(NETWORKING, "Failed to write frame to " + remote_address_ + ":" +
                             std::to_string(remote_port_) + ": " + std::strerror(errno));
        close();
        return false;
    }

    return true;
}

void TcpLink::close() {
    if (open_.exchange(false)) {
        ::shutdown(socket_fd_, SHUT_RDWR);
        SWARMNET_LOG_DEBUG(NETWORKING, "Closed TCP link to " + remote_address_ + ":" + std::to_string(remote_port_));
    }
}

bool TcpLink::readFrame(std::string& payload) {
    uint32_t message_length = 0;
    if (!readFully(reinterpret_cast<char*>(&message_length), sizeof(message_length))) {
        return false;
    }

    message_length = ntohl(message_length);
    if (message_length > MAX_FRAME_SIZE) {
        SWARMNET_LOG_ERROR(NETWORKING, "Message too large from " + remote_address_ + ": " +
                           std::to_string(message_length));
        return false;
    }

    payload.assign(message_length, '\0');
    return message_length == 0 || readFully(&payload[0], message_length);
}

bool TcpLink::writeFully(const char* data, size_t length) {
    size_t written = 0;
    while (written < length) {
        ssize_t sent = ::send(socket_fd_, data + written, length - written, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        written += static_cast<size_t>(sent);
    }
    return true;
}

bool TcpLink::readFully(char* data, size_t length) {
    size_t received = 0;
    while (received < length) {
        ssize_t count = ::recv(socket_fd_, data + received, length - received, 0);
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count <= 0) {
            return false;
        }
        received += static_cast<size_t>(count);
    }
    return true;
}

TcpTransport::TcpTransport(const std::string& node_id,
                           const std::string& address,
                           uint16_t port,
                           const TransportConfig& config)
    : BasicTransport(node_id, address, port, config)
    , listen_socket_(-1)
    , listening_(false) {
}

TcpTransport::~TcpTransport() {
    stop();
}

bool TcpTransport::startEndpoint() {
    const std::string& bind_address = getConfig().listen_address;

    listen_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_socket_ < 0) {
        SWARMNET_LOG_ERROR(NETWORKING, "Failed to create listening socket: " + std::string(std::strerror(errno)));
        return false;
    }

    int opt = 1;
    if (setsockopt(listen_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        SWARMNET_LOG_ERROR(NETWORKING, "Failed to set socket options");
        ::close(listen_socket_);
        listen_socket_ = -1;
        return false;
    }

    struct sockaddr_in server_addr;
    std::memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(port());
    if (inet_pton(AF_INET, bind_address.c_str(), &server_addr.sin_addr) <= 0) {
        SWARMNET_LOG_ERROR(NETWORKING, "Invalid listen address: " + bind_address);
        ::close(listen_socket_);
        listen_socket_ = -1;
        return false;
    }

    if (bind(listen_socket_, reinterpret_cast<struct sockaddr*>(&server_addr), sizeof(server_addr)) < 0) {
        SWARMNET_LOG_ERROR(NETWORKING, "Failed to bind to " + bind_address + ":" + std::to_string(port()) +
                           ": " + std::strerror(errno));
        ::close(listen_socket_);
        listen_socket_ = -1;
        return false;
    }

    if (listen(listen_socket_, 16) < 0) {
        SWARMNET_LOG_ERROR(NETWORKING, "Failed to start listening");
        ::close(listen_socket_);
        listen_socket_ = -1;
        return false;
    }

    // Port 0 asks the kernel for an ephemeral port
    struct sockaddr_in bound_addr;
    socklen_t bound_len = sizeof(bound_addr);
    if (getsockname(listen_socket_, reinterpret_cast<struct sockaddr*>(&bound_addr), &bound_len) == 0) {
        setBoundPort(ntohs(bound_addr.sin_port));
    }

    if (!setSocketNonBlocking(listen_socket_, true)) {
        SWARMNET_LOG_ERROR(NETWORKING, "Failed to set listening socket to non-blocking");
        ::close(listen_socket_);
        listen_socket_ = -1;
        return false;
    }

    listening_ = true;
    listener_thread_ = std::thread(&TcpTransport::listenerLoop, this);

    SWARMNET_LOG_INFO(NETWORKING, nodeId() + " listening on " + bind_address + ":" + std::to_string(port()));
    return true;
}

void TcpTransport::stopEndpoint() {
    listening_ = false;
    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
    if (listen_socket_ >= 0) {
        ::close(listen_socket_);
        listen_socket_ = -1;
    }

    // listening_ is already false, so startReader() admits no new links
    std::map<std::shared_ptr<TcpLink>, std::thread> readers;
    {
        std::lock_guard<std::mutex> lock(links_mutex_);
        readers.swap(readers_);
        finished_readers_.clear();
    }

    for (auto& [link, reader] : readers) {
        link->close();
    }
    for (auto& [link, reader] : readers) {
        if (reader.joinable()) {
            reader.join();
        }
    }

    SWARMNET_LOG_DEBUG(NETWORKING, nodeId() + " joined " + std::to_string(readers.size()) + " reader threads");
}

std::shared_ptr<Link> TcpTransport::openLink(const std::string& peer_id,
                                             const std::string& address,
                                             uint16_t port,
                                             std::string& reason) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    int rc = getaddrinfo(address.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (rc != 0 || !result) {
        reason = "cannot resolve " + address + ": " + gai_strerror(rc);
        return nullptr;
    }

    struct sockaddr_in peer_addr;
    std::memcpy(&peer_addr, result->ai_addr, sizeof(peer_addr));
    freeaddrinfo(result);

    int socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        reason = "socket: " + std::string(std::strerror(errno));
        return nullptr;
    }

    if (!setSocketNonBlocking(socket_fd, true)) {
        reason = "failed to set socket to non-blocking";
        ::close(socket_fd);
        return nullptr;
    }

    rc = ::connect(socket_fd, reinterpret_cast<struct sockaddr*>(&peer_addr), sizeof(peer_addr));
    if (rc < 0 && errno != EINPROGRESS) {
        reason = std::strerror(errno);
        ::close(socket_fd);
        return nullptr;
    }

    if (rc < 0) {
        struct pollfd pfd;
        pfd.fd = socket_fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int timeout_ms = static_cast<int>(getConfig().connect_timeout.count());
        int ready = poll(&pfd, 1, timeout_ms);
        if (ready <= 0) {
            reason = ready == 0 ? "connect timed out after " + std::to_string(timeout_ms) + " ms"
                                : "poll: " + std::string(std::strerror(errno));
            ::close(socket_fd);
            return nullptr;
        }

        int socket_error = 0;
        socklen_t error_len = sizeof(socket_error);
        if (getsockopt(socket_fd, SOL_SOCKET, SO_ERROR, &socket_error, &error_len) < 0 || socket_error != 0) {
            reason = std::strerror(socket_error != 0 ? socket_error : errno);
            ::close(socket_fd);
            return nullptr;
        }
    }

    if (!setSocketNonBlocking(socket_fd, false)) {
        reason = "failed to restore blocking mode";
        ::close(socket_fd);
        return nullptr;
    }
    configureSocket(socket_fd);

    auto link = std::make_shared<TcpLink>(socket_fd, address, port);
    if (!startReader(link)) {
        reason = "transport stopped while connecting";
        return nullptr;
    }

    SWARMNET_LOG_DEBUG(NETWORKING, nodeId() + " opened TCP link to " + peer_id + " at " +
                       address + ":" + std::to_string(port));
    return link;
}

void TcpTransport::listenerLoop() {
    SWARMNET_LOG_DEBUG(NETWORKING, "TCP listener thread started for " + nodeId());

    while (listening_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_socket = accept(listen_socket_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);
        if (client_socket >= 0) {
            char client_address[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &client_addr.sin_addr, client_address, INET_ADDRSTRLEN);
            handleNewConnection(client_socket, std::string(client_address), ntohs(client_addr.sin_port));
            continue;
        }

        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR && listening_) {
            SWARMNET_LOG_ERROR(NETWORKING, "Accept failed: " + std::string(std::strerror(errno)));
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    SWARMNET_LOG_DEBUG(NETWORKING, "TCP listener thread stopped for " + nodeId());
}

void TcpTransport::handleNewConnection(int client_socket, const std::string& client_address, uint16_t client_port) {
    if (!setSocketNonBlocking(client_socket, false)) {
        SWARMNET_LOG_ERROR(NETWORKING, "Failed to configure client socket from " + client_address);
        ::close(client_socket);
        return;
    }
    configureSocket(client_socket);

    auto link = std::make_shared<TcpLink>(client_socket, client_address, client_port);
    if (!startReader(link)) {
        return;
    }

    SWARMNET_LOG_DEBUG(NETWORKING, nodeId() + " accepted connection from " + client_address + ":" +
                       std::to_string(client_port));
}

bool TcpTransport::startReader(const std::shared_ptr<TcpLink>& link) {
    joinFinishedReaders();

    std::lock_guard<std::mutex> lock(links_mutex_);
    if (!listening_) {
        return false;
    }
    readers_.emplace(link, std::thread(&TcpTransport::readerLoop, this, link));
    return true;
}

void TcpTransport::readerLoop(std::shared_ptr<TcpLink> link) {
    std::string frame;
    while (link->readFrame(frame)) {
        nlohmann::json json = nlohmann::json::parse(frame, nullptr, false);
        if (json.is_discarded()) {
            SWARMNET_LOG_WARNING(NETWORKING, "Discarding malformed frame from " + link->getRemoteAddress());
            continue;
        }

        Message message;
        if (!message.fromJson(json)) {
            continue;
        }

        receive(message, link);
    }

    link->close();
    handleLinkClosed(link);

    std::lock_guard<std::mutex> lock(links_mutex_);
    if (readers_.count(link) > 0) {
        finished_readers_.push_back(link);
    }
}

void TcpTransport::joinFinishedReaders() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(links_mutex_);
        for (const auto& link : finished_readers_) {
            auto it = readers_.find(link);
            if (it != readers_.end()) {
                done.push_back(std::move(it->second));
                readers_.erase(it);
            }
        }
        finished_readers_.clear();
    }

    for (auto& reader : done) {
        if (reader.joinable()) {
            reader.join();
        }
    }
}

bool TcpTransport::setSocketNonBlocking(int socket_fd, bool enabled) {
    int flags = fcntl(socket_fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(socket_fd, F_SETFL, flags) >= 0;
}

void TcpTransport::configureSocket(int socket_fd) {
    int opt = 1;
    setsockopt(socket_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
}

} // namespace network
} // namespace swarmnet
