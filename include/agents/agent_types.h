/**
 * @file agent_types.h
 * @brief Agent roles, capability profiles, tasks and collaboration records
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace swarmnet {
namespace agents {

/**
 * @brief Payload types exchanged between agents
 */
namespace message_types {
    constexpr const char* COLLABORATION_REQUEST = "collaboration_request";
    constexpr const char* COLLABORATION_RESPONSE = "collaboration_response";
    constexpr const char* TASK_DELEGATION = "task_delegation";
    constexpr const char* TASK_COMPLETED = "task_completed";
    constexpr const char* TASK_FAILED = "task_failed";
    constexpr const char* TASK_DECLINED = "task_declined";
    constexpr const char* CAPABILITY_ANNOUNCEMENT = "capability_announcement";
    constexpr const char* DISCOVERY_REQUEST = "discovery_request";
    constexpr const char* DISCOVERY_RESPONSE = "discovery_response";
}

/**
 * @brief Agent specialisation
 */
enum class AgentRole {
    COORDINATOR,
    ARCHITECT,
    ANALYST,
    ENGINEER,
    DEVELOPER,
    REVIEWER,
    OPTIMIZER,
    DEVOPS,
    SECURITY,
    TESTING,
    UI_UX,
    DATABASE,
    API_SPECIALIST,
    PERFORMANCE,
    DOCUMENTATION,
    DEPLOYMENT,
    MONITORING,
    AI_ML,
    BLOCKCHAIN,
    MOBILE,
    GAME_DEV
};

enum class CollaborationStyle {
    ANALYTICAL,
    CREATIVE,
    SYSTEMATIC,
    ADAPTIVE
};

/**
 * @brief What an agent can do, announced to peers on connect
 */
struct AgentCapabilities {
    bool can_coordinate = false;
    bool can_execute_code = false;
    bool can_analyze_requirements = false;
    bool can_review = false;
    bool can_optimize = false;
    bool can_test = false;
    bool can_document = false;
    bool can_deploy = false;

    std::vector<std::string> specialized_skills;
    std::vector<std::string> domains;
    std::vector<std::string> languages;
    std::vector<std::string> frameworks;
    std::vector<std::string> tools;

    int max_complexity = 5;             ///< 1-10
    int parallel_tasks = 1;
    CollaborationStyle collaboration_style = CollaborationStyle::ADAPTIVE;

    nlohmann::json toJson() const;
    static AgentCapabilities fromJson(const nlohmann::json& json);

    /**
     * @brief Flat capability set advertised by the transport's discovery task
     */
    std::set<std::string> advertisedCapabilities() const;
};

enum class TaskPriority {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

/**
 * @brief Unit of work an agent executes or delegates
 */
struct Task {
    std::string id;
    std::string title;
    std::string description;
    TaskPriority priority = TaskPriority::MEDIUM;
    int estimated_complexity = 1;
    std::vector<std::string> requirements;
    std::vector<std::string> constraints;
    std::optional<uint64_t> deadline;           ///< Milliseconds since epoch
    std::optional<std::string> delegator;       ///< Set on tasks received from a peer

    /**
     * @brief Wire form carried by a task_delegation message
     */
    nlohmann::json toDelegationJson() const;

    /**
     * @brief Parse a task_delegation payload
     * @return False if id or title is missing
     */
    static bool fromDelegationJson(const nlohmann::json& json, Task& task);
};

enum class TaskStatus {
    COMPLETED,
    FAILED,
    DELEGATED
};

struct TaskResult {
    std::string task_id;
    std::string agent_id;
    TaskStatus status = TaskStatus::COMPLETED;
    std::string content;
    std::string delegated_to;   ///< Peer id when status is DELEGATED
    std::string error;          ///< Failure description when status is FAILED

    bool succeeded() const { return status != TaskStatus::FAILED; }

    nlohmann::json toJson() const;
};

enum class CollaborationType {
    HELP,
    REVIEW,
    DELEGATION,
    CONSULTATION
};

enum class CollaborationStatus {
    PENDING,
    ACCEPTED,
    DECLINED
};

/**
 * @brief One peer's answer to a collaboration request
 */
struct CollaborationResponse {
    std::string agent;
    bool can_help = false;
    std::string response;                   ///< "accepted" or "declined"
    std::vector<std::string> skills;
    int estimated_time_minutes = 0;
    uint64_t timestamp = 0;
};

/**
 * @brief Outgoing collaboration request and the replies it collected
 */
struct CollaborationRecord {
    std::string id;
    std::string requesting_agent;
    std::string target_agent;
    CollaborationType type = CollaborationType::HELP;
    nlohmann::json context;
    CollaborationStatus status = CollaborationStatus::PENDING;
    std::vector<CollaborationResponse> responses;
    uint64_t timestamp = 0;

    nlohmann::json toJson() const;
};

enum class DelegationStatus {
    DELEGATED,
    COMPLETED,
    FAILED,
    DECLINED
};

/**
 * @brief Fate of a task handed to a peer
 */
struct DelegationOutcome {
    std::string task_id;
    std::string peer_id;
    DelegationStatus status = DelegationStatus::DELEGATED;
    std::string detail;         ///< Result, error or decline reason
    uint64_t updated_at = 0;
};

/**
 * @brief Capability profile a peer announced
 */
struct PeerProfile {
    std::vector<std::string> skills;
    std::vector<std::string> domains;
    std::vector<std::string> languages;
    std::vector<std::string> frameworks;
    int max_complexity = 0;
    int parallel_tasks = 0;
    std::string collaboration_style;

    static PeerProfile fromAnnouncement(const nlohmann::json& json);
    nlohmann::json toJson() const;
};

/**
 * @brief What an agent knows about one peer
 */
struct PeerInfo {
    std::string peer_id;
    std::string address;
    uint16_t port = 0;
    bool connected = false;
    std::string status = "online";
    uint64_t last_seen = 0;
    std::optional<PeerProfile> profile;

    nlohmann::json toJson() const;
};

std::string agentRoleName(AgentRole role);
std::optional<AgentRole> parseAgentRole(const std::string& name);

std::string collaborationStyleName(CollaborationStyle style);
std::optional<CollaborationStyle> parseCollaborationStyle(const std::string& name);

std::string taskPriorityName(TaskPriority priority);
std::optional<TaskPriority> parseTaskPriority(const std::string& name);

std::string taskStatusName(TaskStatus status);

std::string collaborationTypeName(CollaborationType type);
std::optional<CollaborationType> parseCollaborationType(const std::string& name);

std::string collaborationStatusName(CollaborationStatus status);
std::string delegationStatusName(DelegationStatus status);

} // namespace agents
} // namespace swarmnet
