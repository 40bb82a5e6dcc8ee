/**
 * @file p2p_agent.h
 * @brief Agent bound to one transport, speaking the collaboration protocol
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

#include "agents/agent_types.h"
#include "network/transport.h"
#include "events/event_publisher.h"

namespace swarmnet {
namespace agents {

/**
 * @brief Local task execution back-end
 *
 * May throw; the agent reports the exception as a failed task.
 */
using TaskExecutor = std::function<TaskResult(const Task&)>;

/**
 * @brief Agent wrapper translating domain intents into transport messages
 *
 * Inbound handlers run on the transport's dispatcher thread. The agent
 * stops its transport on destruction so no handler outlives it.
 */
class P2PAgent {
public:
    /**
     * @param id Agent id; must equal the transport's node id
     * @param role Agent role
     * @param capabilities Capability profile
     * @param transport Transport owned by this agent
     * @param publisher Sink for domain events; must outlive the agent
     * @param executor Local execution back-end; a default that reports
     *                 completion is used when empty
     * @throws std::invalid_argument if transport is null or ids differ
     */
    P2PAgent(const std::string& id,
             AgentRole role,
             const AgentCapabilities& capabilities,
             std::shared_ptr<network::Transport> transport,
             events::EventPublisher& publisher,
             TaskExecutor executor = nullptr);
    ~P2PAgent();

    P2PAgent(const P2PAgent&) = delete;
    P2PAgent& operator=(const P2PAgent&) = delete;

    /**
     * @brief Start the transport and announce the agent
     * @return False if the transport could not start
     */
    bool initialize();

    void shutdown();
    bool isRunning() const;

    /**
     * @brief Connect and introduce ourselves with a capability announcement
     */
    bool connectToPeer(const std::string& peer_id, const std::string& address, uint16_t port);
    void disconnectFromPeer(const std::string& peer_id);

    bool sendToPeer(const std::string& peer_id, const std::string& type, const nlohmann::json& payload);
    size_t broadcastToPeers(const std::string& type, const nlohmann::json& payload);

    /**
     * @brief Ask a peer for collaboration
     *
     * A pending record is created before sending and collects the replies.
     * For HELP requests the context may carry "requiredSkills"; "complexity"
     * scales the responder's time estimate.
     *
     * @param collaboration_id Receives the record id when not null
     * @return True if the request was sent
     */
    bool requestCollaboration(const std::string& peer_id,
                              CollaborationType type,
                              const nlohmann::json& context,
                              std::string* collaboration_id = nullptr);

    /**
     * @brief Hand a task to a peer
     * @return True if the delegation message was sent
     */
    bool delegateTask(const std::string& peer_id, const Task& task);

    /**
     * @brief Execute a task, forwarding it when it exceeds our ceiling
     *
     * Tasks above max_complexity go to the first connected peer whose
     * announced ceiling suffices. Without such a peer the task runs
     * locally regardless of the mismatch.
     */
    TaskResult processTask(const Task& task);

    std::optional<PeerInfo> getPeerInfo(const std::string& peer_id) const;
    std::vector<PeerInfo> getPeers() const;
    std::vector<std::string> getConnectedPeers() const;
    network::TransportStats getNetworkStats() const;

    std::optional<CollaborationRecord> getCollaboration(const std::string& collaboration_id) const;
    std::vector<CollaborationRecord> getCollaborations() const;
    std::optional<DelegationOutcome> getDelegationOutcome(const std::string& task_id) const;

    const std::string& getId() const { return id_; }
    AgentRole getRole() const { return role_; }
    const AgentCapabilities& getCapabilities() const { return capabilities_; }

    network::Transport& getTransport() { return *transport_; }
    const network::Transport& getTransport() const { return *transport_; }

    void setTaskExecutor(TaskExecutor executor);

    /**
     * @brief Whether a task falls within our ceiling and matches a skill
     */
    bool canHandleTask(const Task& task) const;

    /**
     * @brief Whether we would accept a collaboration request
     */
    bool evaluateCollaborationRequest(CollaborationType type, const nlohmann::json& context) const;

private:
    std::string id_;
    AgentRole role_;
    AgentCapabilities capabilities_;
    std::shared_ptr<network::Transport> transport_;
    events::EventPublisher& publisher_;

    mutable std::mutex mutex_;
    TaskExecutor executor_;
    std::map<std::string, PeerInfo> peers_;
    std::map<std::string, CollaborationRecord> collaborations_;
    std::map<std::string, DelegationOutcome> delegations_;

    void setupHandlers();
    void handleTransportEvent(const network::TransportEvent& event);

    void handleCollaborationRequest(const network::Message& message);
    void handleCollaborationResponse(const network::Message& message);
    void handleTaskDelegation(const network::Message& message);
    void handleDelegationReply(const network::Message& message, DelegationStatus status);
    void handleCapabilityAnnouncement(const network::Message& message);
    void handleHeartbeat(const network::Message& message);
    void handleDiscoveryRequest(const network::Message& message);

    void announceCapabilities(const std::string& peer_id);
    nlohmann::json profilePayload() const;
    void cachePeerProfile(const std::string& peer_id, const nlohmann::json& payload);
    std::optional<std::string> findCapablePeer(const Task& task) const;
    TaskResult executeLocally(const Task& task);
    int estimateCollaborationTime(const nlohmann::json& context) const;
    void publishEvent(events::DomainEventType type, const nlohmann::json& payload);

    static TaskResult defaultExecutor(const std::string& agent_id, const Task& task);
};

} // namespace agents
} // namespace swarmnet
