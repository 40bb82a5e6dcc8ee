/**
 * @file message.cpp
 * @brief Transport message envelope implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "network/message.h"
#include "utils/id_generator.h"
#include "utils/logger.h"

#include <chrono>

namespace swarmnet {
namespace network {

Message Message::create(const std::string& from,
                        const std::string& to,
                        MessageKind kind,
                        const std::string& type,
                        nlohmann::json data,
                        uint32_t ttl) {
    Message message;
    message.id = utils::IdGenerator::messageId();
    message.from = from;
    message.to = to;
    message.kind = kind;
    message.type = type;
    message.data = std::move(data);
    message.timestamp = currentTimeMillis();
    message.ttl = ttl;
    return message;
}

nlohmann::json Message::toJson() const {
    nlohmann::json json;
    json["id"] = id;
    json["from"] = from;
    json["to"] = to;
    json["kind"] = messageKindName(kind);
    json["payload"] = {{"type", type}, {"data", data}};
    json["timestamp"] = timestamp;
    json["ttl"] = ttl;
    return json;
}

bool Message::fromJson(const nlohmann::json& json) {
    try {
        auto parsed_kind = parseMessageKind(json.at("kind").get<std::string>());
        if (!parsed_kind) {
            SWARMNET_LOG_WARNING(TRANSPORT, "Unknown message kind: " + json.at("kind").dump());
            return false;
        }

        id = json.at("id").get<std::string>();
        from = json.at("from").get<std::string>();
        to = json.at("to").get<std::string>();
        kind = *parsed_kind;

        const auto& payload = json.at("payload");
        type = payload.at("type").get<std::string>();
        data = payload.contains("data") ? payload.at("data") : nlohmann::json::object();

        timestamp = json.at("timestamp").get<uint64_t>();
        ttl = json.value("ttl", DEFAULT_MESSAGE_TTL_SECONDS);
        return validate();
    } catch (const std::exception& e) {
        SWARMNET_LOG_ERROR(TRANSPORT, "Failed to deserialize message: " + std::string(e.what()));
        return false;
    }
}

bool Message::validate() const {
    return !id.empty() && !from.empty() && !to.empty() && !type.empty();
}

bool Message::isExpired(uint64_t now_ms) const {
    return now_ms > timestamp + static_cast<uint64_t>(ttl) * 1000;
}

std::string messageKindName(MessageKind kind) {
    switch (kind) {
        case MessageKind::DIRECT: return "direct";
        case MessageKind::BROADCAST: return "broadcast";
        case MessageKind::DISCOVERY: return "discovery";
        case MessageKind::HEARTBEAT: return "heartbeat";
        default: return "unknown";
    }
}

std::optional<MessageKind> parseMessageKind(const std::string& name) {
    if (name == "direct") return MessageKind::DIRECT;
    if (name == "broadcast") return MessageKind::BROADCAST;
    if (name == "discovery") return MessageKind::DISCOVERY;
    if (name == "heartbeat") return MessageKind::HEARTBEAT;
    return std::nullopt;
}

uint64_t currentTimeMillis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace network
} // namespace swarmnet
