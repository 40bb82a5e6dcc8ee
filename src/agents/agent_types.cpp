/**
 * @file agent_types.cpp
 * @brief Agent type conversions and JSON mapping
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "agents/agent_types.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace swarmnet {
namespace agents {

namespace {

const std::vector<std::pair<AgentRole, const char*>> ROLE_NAMES = {
    {AgentRole::COORDINATOR, "coordinator"},
    {AgentRole::ARCHITECT, "architect"},
    {AgentRole::ANALYST, "analyst"},
    {AgentRole::ENGINEER, "engineer"},
    {AgentRole::DEVELOPER, "developer"},
    {AgentRole::REVIEWER, "reviewer"},
    {AgentRole::OPTIMIZER, "optimizer"},
    {AgentRole::DEVOPS, "devops"},
    {AgentRole::SECURITY, "security"},
    {AgentRole::TESTING, "testing"},
    {AgentRole::UI_UX, "ui_ux"},
    {AgentRole::DATABASE, "database"},
    {AgentRole::API_SPECIALIST, "api_specialist"},
    {AgentRole::PERFORMANCE, "performance"},
    {AgentRole::DOCUMENTATION, "documentation"},
    {AgentRole::DEPLOYMENT, "deployment"},
    {AgentRole::MONITORING, "monitoring"},
    {AgentRole::AI_ML, "ai_ml"},
    {AgentRole::BLOCKCHAIN, "blockchain"},
    {AgentRole::MOBILE, "mobile"},
    {AgentRole::GAME_DEV, "game_dev"}
};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> stringList(const nlohmann::json& json, const char* key) {
    std::vector<std::string> values;
    auto it = json.find(key);
    if (it == json.end() || !it->is_array()) {
        return values;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

int intField(const nlohmann::json& json, const char* key, int fallback) {
    auto it = json.find(key);
    return (it != json.end() && it->is_number_integer()) ? it->get<int>() : fallback;
}

std::string stringField(const nlohmann::json& json, const char* key, const std::string& fallback = "") {
    auto it = json.find(key);
    return (it != json.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

} // anonymous namespace

nlohmann::json AgentCapabilities::toJson() const {
    nlohmann::json json;
    json["canCoordinate"] = can_coordinate;
    json["canExecuteCode"] = can_execute_code;
    json["canAnalyzeRequirements"] = can_analyze_requirements;
    json["canReview"] = can_review;
    json["canOptimize"] = can_optimize;
    json["canTest"] = can_test;
    json["canDocument"] = can_document;
    json["canDeploy"] = can_deploy;
    json["specializedSkills"] = specialized_skills;
    json["domains"] = domains;
    json["languages"] = languages;
    json["frameworks"] = frameworks;
    json["tools"] = tools;
    json["maxComplexity"] = max_complexity;
    json["parallelTasks"] = parallel_tasks;
    json["collaborationStyle"] = collaborationStyleName(collaboration_style);
    return json;
}

AgentCapabilities AgentCapabilities::fromJson(const nlohmann::json& json) {
    AgentCapabilities caps;
    if (!json.is_object()) {
        return caps;
    }

    caps.can_coordinate = json.value("canCoordinate", false);
    caps.can_execute_code = json.value("canExecuteCode", false);
    caps.can_analyze_requirements = json.value("canAnalyzeRequirements", false);
    caps.can_review = json.value("canReview", false);
    caps.can_optimize = json.value("canOptimize", false);
    caps.can_test = json.value("canTest", false);
    caps.can_document = json.value("canDocument", false);
    caps.can_deploy = json.value("canDeploy", false);
    caps.specialized_skills = stringList(json, "specializedSkills");
    caps.domains = stringList(json, "domains");
    caps.languages = stringList(json, "languages");
    caps.frameworks = stringList(json, "frameworks");
    caps.tools = stringList(json, "tools");
    caps.max_complexity = std::clamp(intField(json, "maxComplexity", caps.max_complexity), 1, 10);
    caps.parallel_tasks = std::max(1, intField(json, "parallelTasks", caps.parallel_tasks));
    caps.collaboration_style = parseCollaborationStyle(stringField(json, "collaborationStyle"))
                                   .value_or(CollaborationStyle::ADAPTIVE);
    return caps;
}

std::set<std::string> AgentCapabilities::advertisedCapabilities() const {
    std::set<std::string> result(specialized_skills.begin(), specialized_skills.end());
    if (can_coordinate) result.insert("coordinate");
    if (can_execute_code) result.insert("execute_code");
    if (can_analyze_requirements) result.insert("analyze_requirements");
    if (can_review) result.insert("review");
    if (can_optimize) result.insert("optimize");
    if (can_test) result.insert("test");
    if (can_document) result.insert("document");
    if (can_deploy) result.insert("deploy");
    return result;
}

nlohmann::json Task::toDelegationJson() const {
    nlohmann::json json;
    json["taskId"] = id;
    json["taskTitle"] = title;
    json["taskDescription"] = description;
    json["priority"] = taskPriorityName(priority);
    json["complexity"] = estimated_complexity;
    json["requirements"] = requirements;
    json["constraints"] = constraints;
    if (deadline) {
        json["deadline"] = *deadline;
    } else {
        json["deadline"] = nullptr;
    }
    return json;
}

bool Task::fromDelegationJson(const nlohmann::json& json, Task& task) {
    if (!json.is_object()) {
        return false;
    }

    task.id = stringField(json, "taskId");
    task.title = stringField(json, "taskTitle");
    if (task.id.empty() || task.title.empty()) {
        return false;
    }

    task.description = stringField(json, "taskDescription");
    task.priority = parseTaskPriority(stringField(json, "priority")).value_or(TaskPriority::MEDIUM);
    task.estimated_complexity = intField(json, "complexity", 1);
    task.requirements = stringList(json, "requirements");
    task.constraints = stringList(json, "constraints");

    auto deadline = json.find("deadline");
    if (deadline != json.end() && deadline->is_number_unsigned()) {
        task.deadline = deadline->get<uint64_t>();
    } else {
        task.deadline.reset();
    }
    return true;
}

nlohmann::json TaskResult::toJson() const {
    nlohmann::json json;
    json["taskId"] = task_id;
    json["agentId"] = agent_id;
    json["status"] = taskStatusName(status);
    json["content"] = content;
    if (!delegated_to.empty()) {
        json["delegatedTo"] = delegated_to;
    }
    if (!error.empty()) {
        json["error"] = error;
    }
    return json;
}

nlohmann::json CollaborationRecord::toJson() const {
    nlohmann::json json;
    json["collaborationId"] = id;
    json["requestingAgent"] = requesting_agent;
    json["targetAgent"] = target_agent;
    json["requestType"] = collaborationTypeName(type);
    json["context"] = context;
    json["status"] = collaborationStatusName(status);
    json["timestamp"] = timestamp;

    nlohmann::json replies = nlohmann::json::array();
    for (const auto& response : responses) {
        replies.push_back({
            {"agent", response.agent},
            {"canHelp", response.can_help},
            {"response", response.response},
            {"capabilities", response.skills},
            {"estimatedTime", response.estimated_time_minutes},
            {"timestamp", response.timestamp}
        });
    }
    json["responses"] = replies;
    return json;
}

PeerProfile PeerProfile::fromAnnouncement(const nlohmann::json& json) {
    PeerProfile profile;
    if (!json.is_object()) {
        return profile;
    }
    profile.skills = stringList(json, "capabilities");
    profile.domains = stringList(json, "domains");
    profile.languages = stringList(json, "languages");
    profile.frameworks = stringList(json, "frameworks");
    profile.max_complexity = intField(json, "maxComplexity", 0);
    profile.parallel_tasks = intField(json, "parallelTasks", 0);
    profile.collaboration_style = stringField(json, "collaborationStyle");
    return profile;
}

nlohmann::json PeerProfile::toJson() const {
    nlohmann::json json;
    json["capabilities"] = skills;
    json["domains"] = domains;
    json["languages"] = languages;
    json["frameworks"] = frameworks;
    json["maxComplexity"] = max_complexity;
    json["parallelTasks"] = parallel_tasks;
    json["collaborationStyle"] = collaboration_style;
    return json;
}

nlohmann::json PeerInfo::toJson() const {
    nlohmann::json json;
    json["peerId"] = peer_id;
    json["address"] = address;
    json["port"] = port;
    json["connected"] = connected;
    json["status"] = status;
    json["lastSeen"] = last_seen;
    json["profile"] = profile ? profile->toJson() : nlohmann::json(nullptr);
    return json;
}

std::string agentRoleName(AgentRole role) {
    for (const auto& entry : ROLE_NAMES) {
        if (entry.first == role) {
            return entry.second;
        }
    }
    return "unknown";
}

std::optional<AgentRole> parseAgentRole(const std::string& name) {
    std::string lowered = toLower(name);
    for (const auto& entry : ROLE_NAMES) {
        if (lowered == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

std::string collaborationStyleName(CollaborationStyle style) {
    switch (style) {
        case CollaborationStyle::ANALYTICAL: return "analytical";
        case CollaborationStyle::CREATIVE: return "creative";
        case CollaborationStyle::SYSTEMATIC: return "systematic";
        case CollaborationStyle::ADAPTIVE: return "adaptive";
        default: return "adaptive";
    }
}

std::optional<CollaborationStyle> parseCollaborationStyle(const std::string& name) {
    std::string lowered = toLower(name);
    if (lowered == "analytical") return CollaborationStyle::ANALYTICAL;
    if (lowered == "creative") return CollaborationStyle::CREATIVE;
    if (lowered == "systematic") return CollaborationStyle::SYSTEMATIC;
    if (lowered == "adaptive") return CollaborationStyle::ADAPTIVE;
    return std::nullopt;
}

std::string taskPriorityName(TaskPriority priority) {
    switch (priority) {
        case TaskPriority::LOW: return "low";
        case TaskPriority::MEDIUM: return "medium";
        case TaskPriority::HIGH: return "high";
        case TaskPriority::CRITICAL: return "critical";
        default: return "medium";
    }
}

std::optional<TaskPriority> parseTaskPriority(const std::string& name) {
    std::string lowered = toLower(name);
    if (lowered == "low") return TaskPriority::LOW;
    if (lowered == "medium") return TaskPriority::MEDIUM;
    if (lowered == "high") return TaskPriority::HIGH;
    if (lowered == "critical") return TaskPriority::CRITICAL;
    return std::nullopt;
}

std::string taskStatusName(TaskStatus status) {
    switch (status) {
        case TaskStatus::COMPLETED: return "completed";
        case TaskStatus::FAILED: return "failed";
        case TaskStatus::DELEGATED: return "delegated";
        default: return "unknown";
    }
}

std::string collaborationTypeName(CollaborationType type) {
    switch (type) {
        case CollaborationType::HELP: return "help";
        case CollaborationType::REVIEW: return "review";
        case CollaborationType::DELEGATION: return "delegation";
        case CollaborationType::CONSULTATION: return "consultation";
        default: return "unknown";
    }
}

std::optional<CollaborationType> parseCollaborationType(const std::string& name) {
    std::string lowered = toLower(name);
    if (lowered == "help") return CollaborationType::HELP;
    if (lowered == "review") return CollaborationType::REVIEW;
    if (lowered == "delegation") return CollaborationType::DELEGATION;
    if (lowered == "consultation") return CollaborationType::CONSULTATION;
    return std::nullopt;
}

std::string collaborationStatusName(CollaborationStatus status) {
    switch (status) {
        case CollaborationStatus::PENDING: return "pending";
        case CollaborationStatus::ACCEPTED: return "accepted";
        case CollaborationStatus::DECLINED: return "declined";
        default: return "unknown";
    }
}

std::string delegationStatusName(DelegationStatus status) {
    switch (status) {
        case DelegationStatus::DELEGATED: return "delegated";
        case DelegationStatus::COMPLETED: return "completed";
        case DelegationStatus::FAILED: return "failed";
        case DelegationStatus::DECLINED: return "declined";
        default: return "unknown";
    }
}

} // namespace agents
} // namespace swarmnet
