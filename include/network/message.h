/**
 * @file message.h
 * @brief Transport message envelope
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace swarmnet {
namespace network {

/**
 * @brief Message kinds carried by the transport
 */
enum class MessageKind : uint8_t {
    DIRECT = 0x01,      ///< Point-to-point message
    BROADCAST = 0x02,   ///< Sent to every connected peer
    DISCOVERY = 0x03,   ///< Capability announcement
    HEARTBEAT = 0x04    ///< Liveness announcement
};

/// Destination used for broadcast messages
constexpr const char* BROADCAST_TARGET = "broadcast";

/// Default message time-to-live in seconds
constexpr uint32_t DEFAULT_MESSAGE_TTL_SECONDS = 300;

/**
 * @brief Transport-level payload types
 */
namespace payload_types {
constexpr const char* HEARTBEAT = "heartbeat";
constexpr const char* HEARTBEAT_ACK = "heartbeat_ack";
constexpr const char* DISCOVERY = "discovery";
} // namespace payload_types

/**
 * @brief Message envelope
 *
 * The payload is split into a handler key (type) and arbitrary JSON data.
 * Messages are immutable once sent.
 */
struct Message {
    std::string id;                 ///< Unique random id
    std::string from;               ///< Sender node id
    std::string to;                 ///< Recipient node id or BROADCAST_TARGET
    MessageKind kind;
    std::string type;               ///< Payload type, selects the handler
    nlohmann::json data;            ///< Payload data
    uint64_t timestamp;             ///< Milliseconds since epoch
    uint32_t ttl;                   ///< Seconds the message stays valid

    Message() : kind(MessageKind::DIRECT), data(nlohmann::json::object()), timestamp(0), ttl(DEFAULT_MESSAGE_TTL_SECONDS) {}

    /**
     * @brief Create a message with a fresh id and the current timestamp
     */
    static Message create(const std::string& from,
                          const std::string& to,
                          MessageKind kind,
                          const std::string& type,
                          nlohmann::json data,
                          uint32_t ttl = DEFAULT_MESSAGE_TTL_SECONDS);

    nlohmann::json toJson() const;

    /**
     * @brief Deserialize message from JSON
     * @param json JSON representation
     * @return True if successful
     */
    bool fromJson(const nlohmann::json& json);

    bool validate() const;

    /**
     * @brief Check whether the TTL has elapsed
     * @param now_ms Current time in milliseconds since epoch
     */
    bool isExpired(uint64_t now_ms) const;

    bool isBroadcast() const { return to == BROADCAST_TARGET; }
};

std::string messageKindName(MessageKind kind);
std::optional<MessageKind> parseMessageKind(const std::string& name);

/**
 * @brief Current wall-clock time in milliseconds since epoch
 */
uint64_t currentTimeMillis();

} // namespace network
} // namespace swarmnet
