/**
 * @file p2p_agent.cpp
 * @brief Agent wrapper implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "agents/p2p_agent.h"
#include "utils/id_generator.h"
#include "utils/logger.h"
#include "utils/error_handler.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace swarmnet {
namespace agents {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

P2PAgent::P2PAgent(const std::string& id,
                   AgentRole role,
                   const AgentCapabilities& capabilities,
                   std::shared_ptr<network::Transport> transport,
                   events::EventPublisher& publisher,
                   TaskExecutor executor)
    : id_(id)
    , role_(role)
    , capabilities_(capabilities)
    , transport_(std::move(transport))
    , publisher_(publisher)
    , executor_(std::move(executor)) {

    if (!transport_) {
        throw std::invalid_argument("P2PAgent " + id_ + " requires a transport");
    }
    if (transport_->nodeId() != id_) {
        throw std::invalid_argument("Transport node id " + transport_->nodeId() +
                                    " does not match agent id " + id_);
    }

    if (!executor_) {
        std::string agent_id = id_;
        executor_ = [agent_id](const Task& task) { return defaultExecutor(agent_id, task); };
    }

    transport_->setCapabilities(capabilities_.advertisedCapabilities());
    setupHandlers();
}

P2PAgent::~P2PAgent() {
    transport_->stop();
}

bool P2PAgent::initialize() {
    if (!transport_->start()) {
        SWARMNET_LOG_ERROR(AGENT, "Agent " + id_ + " could not start its transport");
        return false;
    }

    nlohmann::json payload;
    payload["agentId"] = id_;
    payload["role"] = agentRoleName(role_);
    payload["capabilities"] = capabilities_.specialized_skills;
    payload["address"] = transport_->address();
    payload["port"] = transport_->port();
    publishEvent(events::DomainEventType::AGENT_REGISTERED, payload);

    SWARMNET_LOG_INFO(AGENT, "P2P agent initialized: " + id_ + " (" + agentRoleName(role_) + ")");
    return true;
}

void P2PAgent::shutdown() {
    transport_->stop();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [peer_id, peer] : peers_) {
        peer.connected = false;
    }
    SWARMNET_LOG_INFO(AGENT, "P2P agent stopped: " + id_);
}

bool P2PAgent::isRunning() const {
    return transport_->isRunning();
}

bool P2PAgent::connectToPeer(const std::string& peer_id, const std::string& address, uint16_t port) {
    if (!transport_->connect(peer_id, address, port)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        PeerInfo& peer = peers_[peer_id];
        peer.peer_id = peer_id;
        peer.address = address;
        peer.port = port;
        peer.connected = true;
        peer.last_seen = network::currentTimeMillis();
    }

    announceCapabilities(peer_id);
    return true;
}

void P2PAgent::disconnectFromPeer(const std::string& peer_id) {
    transport_->disconnect(peer_id);

    std::lock_guard<std::mutex> lock(mutex_);
    peers_.erase(peer_id);
}

bool P2PAgent::sendToPeer(const std::string& peer_id, const std::string& type, const nlohmann::json& payload) {
    return transport_->sendMessage(peer_id, type, payload);
}

size_t P2PAgent::broadcastToPeers(const std::string& type, const nlohmann::json& payload) {
    return transport_->broadcast(type, payload);
}

bool P2PAgent::requestCollaboration(const std::string& peer_id,
                                    CollaborationType type,
                                    const nlohmann::json& context,
                                    std::string* collaboration_id) {
    CollaborationRecord record;
    try {
        record.id = utils::IdGenerator::collaborationId();
    } catch (const std::exception& e) {
        SWARMNET_ERROR(AGENT, "Failed to allocate collaboration id: " + std::string(e.what()));
        return false;
    }
    record.requesting_agent = id_;
    record.target_agent = peer_id;
    record.type = type;
    record.context = context;
    record.timestamp = network::currentTimeMillis();

    nlohmann::json request;
    request["collaborationId"] = record.id;
    request["requestingAgent"] = id_;
    request["targetAgent"] = peer_id;
    request["requestType"] = collaborationTypeName(type);
    request["context"] = context;
    request["timestamp"] = record.timestamp;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        collaborations_[record.id] = record;
    }

    if (!sendToPeer(peer_id, message_types::COLLABORATION_REQUEST, request)) {
        SWARMNET_LOG_WARNING(AGENT, id_ + " could not send collaboration request to " + peer_id);
        std::lock_guard<std::mutex> lock(mutex_);
        collaborations_.erase(record.id);
        return false;
    }

    if (collaboration_id) {
        *collaboration_id = record.id;
    }

    publishEvent(events::DomainEventType::COLLABORATION_REQUEST, request);
    SWARMNET_LOG_DEBUG(AGENT, id_ + " requested " + collaborationTypeName(type) + " from " + peer_id);
    return true;
}

bool P2PAgent::delegateTask(const std::string& peer_id, const Task& task) {
    nlohmann::json delegation = task.toDelegationJson();
    delegation["timestamp"] = network::currentTimeMillis();

    DelegationOutcome outcome;
    outcome.task_id = task.id;
    outcome.peer_id = peer_id;
    outcome.status = DelegationStatus::DELEGATED;
    outcome.updated_at = network::currentTimeMillis();

    // Recorded before sending; the reply may arrive before sendToPeer returns
    std::optional<DelegationOutcome> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = delegations_.find(task.id);
        if (it != delegations_.end()) {
            previous = it->second;
        }
        delegations_[task.id] = outcome;
    }

    if (!sendToPeer(peer_id, message_types::TASK_DELEGATION, delegation)) {
        SWARMNET_LOG_WARNING(AGENT, id_ + " could not delegate task " + task.id + " to " + peer_id);
        std::lock_guard<std::mutex> lock(mutex_);
        if (previous) {
            delegations_[task.id] = *previous;
        } else {
            delegations_.erase(task.id);
        }
        return false;
    }

    return true;
}

TaskResult P2PAgent::processTask(const Task& task) {
    if (task.estimated_complexity > capabilities_.max_complexity) {
        std::optional<std::string> peer_id = findCapablePeer(task);
        if (peer_id && delegateTask(*peer_id, task)) {
            TaskResult result;
            result.task_id = task.id;
            result.agent_id = id_;
            result.status = TaskStatus::DELEGATED;
            result.delegated_to = *peer_id;
            result.content = "Task delegated to " + *peer_id;
            SWARMNET_LOG_INFO(AGENT, id_ + " delegated task " + task.id + " to " + *peer_id);
            return result;
        }

        SWARMNET_LOG_WARNING(AGENT, "Task " + task.id + " complexity " + std::to_string(task.estimated_complexity) +
                             " exceeds " + id_ + " ceiling " + std::to_string(capabilities_.max_complexity) +
                             "; no capable peer, executing locally");
    }

    return executeLocally(task);
}

std::optional<PeerInfo> P2PAgent::getPeerInfo(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PeerInfo> P2PAgent::getPeers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerInfo> result;
    result.reserve(peers_.size());
    for (const auto& [peer_id, peer] : peers_) {
        result.push_back(peer);
    }
    return result;
}

std::vector<std::string> P2PAgent::getConnectedPeers() const {
    return transport_->getConnectedPeers();
}

network::TransportStats P2PAgent::getNetworkStats() const {
    return transport_->getNetworkStats();
}

std::optional<CollaborationRecord> P2PAgent::getCollaboration(const std::string& collaboration_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collaborations_.find(collaboration_id);
    if (it == collaborations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<CollaborationRecord> P2PAgent::getCollaborations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CollaborationRecord> result;
    for (const auto& [collaboration_id, record] : collaborations_) {
        result.push_back(record);
    }
    return result;
}

std::optional<DelegationOutcome> P2PAgent::getDelegationOutcome(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = delegations_.find(task_id);
    if (it == delegations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void P2PAgent::setTaskExecutor(TaskExecutor executor) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (executor) {
        executor_ = std::move(executor);
    } else {
        std::string agent_id = id_;
        executor_ = [agent_id](const Task& task) { return defaultExecutor(agent_id, task); };
    }
}

bool P2PAgent::canHandleTask(const Task& task) const {
    if (task.estimated_complexity > capabilities_.max_complexity) {
        return false;
    }

    std::string title = toLower(task.title);
    std::string description = toLower(task.description);
    for (const auto& skill : capabilities_.specialized_skills) {
        std::string needle = toLower(skill);
        if (needle.empty()) {
            continue;
        }
        if (title.find(needle) != std::string::npos || description.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool P2PAgent::evaluateCollaborationRequest(CollaborationType type, const nlohmann::json& context) const {
    switch (type) {
        case CollaborationType::HELP: {
            if (!context.is_object()) {
                return false;
            }
            auto required = context.find("requiredSkills");
            if (required == context.end() || !required->is_array()) {
                return false;
            }
            for (const auto& skill : capabilities_.specialized_skills) {
                for (const auto& wanted : *required) {
                    if (wanted.is_string() && wanted.get<std::string>() == skill) {
                        return true;
                    }
                }
            }
            return false;
        }
        case CollaborationType::REVIEW:
            return capabilities_.can_review;
        case CollaborationType::DELEGATION:
            return capabilities_.can_execute_code;
        case CollaborationType::CONSULTATION:
            return capabilities_.can_analyze_requirements;
        default:
            return false;
    }
}

void P2PAgent::setupHandlers() {
    using network::Message;

    transport_->onMessage(message_types::COLLABORATION_REQUEST,
                          [this](const Message& message) { handleCollaborationRequest(message); });
    transport_->onMessage(message_types::COLLABORATION_RESPONSE,
                          [this](const Message& message) { handleCollaborationResponse(message); });
    transport_->onMessage(message_types::TASK_DELEGATION,
                          [this](const Message& message) { handleTaskDelegation(message); });
    transport_->onMessage(message_types::TASK_COMPLETED, [this](const Message& message) {
        handleDelegationReply(message, DelegationStatus::COMPLETED);
    });
    transport_->onMessage(message_types::TASK_FAILED, [this](const Message& message) {
        handleDelegationReply(message, DelegationStatus::FAILED);
    });
    transport_->onMessage(message_types::TASK_DECLINED, [this](const Message& message) {
        handleDelegationReply(message, DelegationStatus::DECLINED);
    });
    transport_->onMessage(message_types::CAPABILITY_ANNOUNCEMENT,
                          [this](const Message& message) { handleCapabilityAnnouncement(message); });
    transport_->onMessage(network::payload_types::HEARTBEAT,
                          [this](const Message& message) { handleHeartbeat(message); });
    transport_->onMessage(message_types::DISCOVERY_REQUEST,
                          [this](const Message& message) { handleDiscoveryRequest(message); });
    transport_->onMessage(message_types::DISCOVERY_RESPONSE, [this](const Message& message) {
        cachePeerProfile(message.from, message.data);
    });

    transport_->setEventListener([this](const network::TransportEvent& event) { handleTransportEvent(event); });
}

void P2PAgent::handleTransportEvent(const network::TransportEvent& event) {
    switch (event.type) {
        case network::TransportEventType::PEER_CONNECTED: {
            std::lock_guard<std::mutex> lock(mutex_);
            PeerInfo& peer = peers_[event.peer_id];
            peer.peer_id = event.peer_id;
            peer.connected = true;
            if (!event.address.empty()) {
                peer.address = event.address;
                peer.port = event.port;
            }
            peer.last_seen = network::currentTimeMillis();
            break;
        }
        case network::TransportEventType::PEER_DISCONNECTED: {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = peers_.find(event.peer_id);
            if (it != peers_.end()) {
                it->second.connected = false;
            }
            break;
        }
        case network::TransportEventType::CONNECTION_FAILED: {
            nlohmann::json payload;
            payload["peerId"] = event.peer_id;
            payload["address"] = event.address;
            payload["port"] = event.port;
            payload["reason"] = event.reason;
            publishEvent(events::DomainEventType::CONNECTION_FAILED, payload);
            break;
        }
    }
}

void P2PAgent::handleCollaborationRequest(const network::Message& message) {
    const nlohmann::json& data = message.data;
    if (!data.is_object() || !data.contains("collaborationId")) {
        SWARMNET_LOG_WARNING(AGENT, id_ + " ignoring malformed collaboration request from " + message.from);
        return;
    }

    std::string collaboration_id = data.value("collaborationId", std::string());
    std::string request_type = data.value("requestType", std::string());
    nlohmann::json context = data.contains("context") ? data.at("context") : nlohmann::json::object();

    std::optional<CollaborationType> type = parseCollaborationType(request_type);
    bool can_help = type && evaluateCollaborationRequest(*type, context);

    SWARMNET_LOG_INFO(AGENT, "Collaboration request from " + message.from + " to " + id_ + ": " + request_type +
                      (can_help ? " (accepted)" : " (declined)"));

    nlohmann::json response;
    response["collaborationId"] = collaboration_id;
    response["requestingAgent"] = message.from;
    response["respondingAgent"] = id_;
    response["canHelp"] = can_help;
    response["response"] = can_help ? "accepted" : "declined";
    response["capabilities"] = capabilities_.specialized_skills;
    response["estimatedTime"] = can_help ? estimateCollaborationTime(context) : 0;
    response["timestamp"] = network::currentTimeMillis();

    if (!sendToPeer(message.from, message_types::COLLABORATION_RESPONSE, response)) {
        SWARMNET_LOG_WARNING(AGENT, id_ + " could not answer collaboration " + collaboration_id);
    }
}

void P2PAgent::handleCollaborationResponse(const network::Message& message) {
    const nlohmann::json& data = message.data;
    if (!data.is_object()) {
        return;
    }

    std::string collaboration_id = data.value("collaborationId", std::string());

    CollaborationResponse reply;
    reply.agent = data.value("respondingAgent", message.from);
    reply.can_help = data.value("canHelp", false);
    reply.response = data.value("response", std::string("declined"));
    reply.estimated_time_minutes = data.value("estimatedTime", 0);
    reply.timestamp = network::currentTimeMillis();
    if (data.contains("capabilities") && data["capabilities"].is_array()) {
        for (const auto& skill : data["capabilities"]) {
            if (skill.is_string()) {
                reply.skills.push_back(skill.get<std::string>());
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collaborations_.find(collaboration_id);
    if (it == collaborations_.end()) {
        SWARMNET_LOG_DEBUG(AGENT, id_ + " got a response for unknown collaboration " + collaboration_id);
        return;
    }

    CollaborationRecord& record = it->second;
    record.responses.push_back(reply);
    if (reply.response == "accepted") {
        record.status = CollaborationStatus::ACCEPTED;
        SWARMNET_LOG_INFO(AGENT, "Collaboration " + collaboration_id + " accepted by " + reply.agent);
    } else if (record.status == CollaborationStatus::PENDING) {
        record.status = CollaborationStatus::DECLINED;
    }
}

void P2PAgent::handleTaskDelegation(const network::Message& message) {
    Task task;
    if (!Task::fromDelegationJson(message.data, task)) {
        SWARMNET_LOG_WARNING(AGENT, id_ + " ignoring malformed task delegation from " + message.from);
        return;
    }
    task.delegator = message.from;

    SWARMNET_LOG_INFO(AGENT, id_ + " received task delegation: " + task.title);

    nlohmann::json reply;
    reply["taskId"] = task.id;
    std::string reply_type;

    if (canHandleTask(task)) {
        TaskResult result = executeLocally(task);
        if (result.status == TaskStatus::FAILED) {
            reply_type = message_types::TASK_FAILED;
            reply["error"] = result.error.empty() ? std::string("Unknown error") : result.error;
        } else {
            reply_type = message_types::TASK_COMPLETED;
            reply["result"] = result.content.empty() ? std::string("completed") : result.content;
        }
    } else {
        reply_type = message_types::TASK_DECLINED;
        reply["reason"] = "Cannot handle this type of task";
    }
    reply["timestamp"] = network::currentTimeMillis();

    if (!sendToPeer(message.from, reply_type, reply)) {
        SWARMNET_LOG_WARNING(AGENT, id_ + " could not report " + reply_type + " for task " + task.id);
    }
}

void P2PAgent::handleDelegationReply(const network::Message& message, DelegationStatus status) {
    if (!message.data.is_object()) {
        return;
    }

    std::string task_id = message.data.value("taskId", std::string());

    std::string detail;
    switch (status) {
        case DelegationStatus::COMPLETED:
            detail = message.data.value("result", std::string());
            break;
        case DelegationStatus::FAILED:
            detail = message.data.value("error", std::string());
            break;
        case DelegationStatus::DECLINED:
            detail = message.data.value("reason", std::string());
            break;
        default:
            break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = delegations_.find(task_id);
    if (it == delegations_.end() || it->second.peer_id != message.from) {
        SWARMNET_LOG_DEBUG(AGENT, id_ + " got an unexpected reply for task " + task_id + " from " + message.from);
        return;
    }

    it->second.status = status;
    it->second.detail = detail;
    it->second.updated_at = network::currentTimeMillis();

    SWARMNET_LOG_INFO(AGENT, "Task " + task_id + " delegated to " + message.from + " is " +
                      delegationStatusName(status));
}

void P2PAgent::handleCapabilityAnnouncement(const network::Message& message) {
    cachePeerProfile(message.from, message.data);
    SWARMNET_LOG_DEBUG(AGENT, id_ + " cached capability announcement from " + message.from);
}

void P2PAgent::handleHeartbeat(const network::Message& message) {
    if (!message.data.is_object()) {
        return;
    }

    std::string node_id = message.data.value("nodeId", message.from);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(node_id);
    if (it != peers_.end()) {
        it->second.last_seen = message.data.value("timestamp", message.timestamp);
        it->second.status = message.data.value("status", std::string("online"));
    }
}

void P2PAgent::handleDiscoveryRequest(const network::Message& message) {
    nlohmann::json response = profilePayload();
    response["status"] = "online";
    response["timestamp"] = network::currentTimeMillis();

    if (!sendToPeer(message.from, message_types::DISCOVERY_RESPONSE, response)) {
        SWARMNET_LOG_DEBUG(AGENT, id_ + " could not answer discovery request from " + message.from);
    }
}

void P2PAgent::announceCapabilities(const std::string& peer_id) {
    if (!sendToPeer(peer_id, message_types::CAPABILITY_ANNOUNCEMENT, profilePayload())) {
        SWARMNET_LOG_WARNING(AGENT, id_ + " could not announce capabilities to " + peer_id);
    }
}

nlohmann::json P2PAgent::profilePayload() const {
    nlohmann::json payload;
    payload["nodeId"] = id_;
    payload["capabilities"] = capabilities_.specialized_skills;
    payload["domains"] = capabilities_.domains;
    payload["languages"] = capabilities_.languages;
    payload["frameworks"] = capabilities_.frameworks;
    payload["maxComplexity"] = capabilities_.max_complexity;
    payload["parallelTasks"] = capabilities_.parallel_tasks;
    payload["collaborationStyle"] = collaborationStyleName(capabilities_.collaboration_style);
    return payload;
}

void P2PAgent::cachePeerProfile(const std::string& peer_id, const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    PeerInfo& peer = peers_[peer_id];
    peer.peer_id = peer_id;
    peer.profile = PeerProfile::fromAnnouncement(payload);
    peer.last_seen = network::currentTimeMillis();
}

std::optional<std::string> P2PAgent::findCapablePeer(const Task& task) const {
    std::vector<std::string> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [peer_id, peer] : peers_) {
            if (peer.profile && peer.profile->max_complexity >= task.estimated_complexity) {
                candidates.push_back(peer_id);
            }
        }
    }

    for (const auto& peer_id : candidates) {
        if (transport_->isConnectedTo(peer_id)) {
            return peer_id;
        }
    }
    return std::nullopt;
}

TaskResult P2PAgent::executeLocally(const Task& task) {
    TaskExecutor executor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        executor = executor_;
    }

    TaskResult result;
    try {
        result = executor(task);
    } catch (const std::exception& e) {
        SWARMNET_ERROR(AGENT, "Task " + task.id + " failed on " + id_ + ": " + e.what());
        result.status = TaskStatus::FAILED;
        result.error = e.what();
    }

    if (result.task_id.empty()) {
        result.task_id = task.id;
    }
    if (result.agent_id.empty()) {
        result.agent_id = id_;
    }
    return result;
}

int P2PAgent::estimateCollaborationTime(const nlohmann::json& context) const {
    double complexity = 1.0;
    if (context.is_object()) {
        auto it = context.find("complexity");
        if (it != context.end() && it->is_number()) {
            complexity = std::max(1.0, it->get<double>());
        }
    }
    return static_cast<int>(std::lround(30.0 * complexity));
}

void P2PAgent::publishEvent(events::DomainEventType type, const nlohmann::json& payload) {
    try {
        publisher_.publish(events::DomainEvent::create(type, id_, payload));
    } catch (const std::exception& e) {
        SWARMNET_LOG_ERROR(AGENT, "Failed to publish " + events::domainEventTypeName(type) + " from " + id_ +
                           ": " + e.what());
    }
}

TaskResult P2PAgent::defaultExecutor(const std::string& agent_id, const Task& task) {
    TaskResult result;
    result.task_id = task.id;
    result.agent_id = agent_id;
    result.status = TaskStatus::COMPLETED;
    result.content = "Task " + task.title + " completed by " + agent_id;
    return result;
}

} // namespace agents
} // namespace swarmnet
