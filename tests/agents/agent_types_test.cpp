/**
 * @file agent_types_test.cpp
 * @brief Tests for agent capability, task and collaboration types
 */

#include <gtest/gtest.h>
#include "agents/agent_types.h"

namespace swarmnet {
namespace tests {

using namespace agents;

TEST(AgentTypesTest, RoleNamesParseBack) {
    EXPECT_EQ(agentRoleName(AgentRole::API_SPECIALIST), "api_specialist");
    EXPECT_EQ(agentRoleName(AgentRole::UI_UX), "ui_ux");
    EXPECT_EQ(parseAgentRole("Game_Dev"), AgentRole::GAME_DEV);
    EXPECT_EQ(parseAgentRole("coordinator"), AgentRole::COORDINATOR);
    EXPECT_FALSE(parseAgentRole("manager").has_value());
}

TEST(AgentTypesTest, CapabilitiesJsonUsesWireKeys) {
    AgentCapabilities caps;
    caps.can_review = true;
    caps.specialized_skills = {"code-review"};
    caps.max_complexity = 7;
    caps.collaboration_style = CollaborationStyle::ANALYTICAL;

    nlohmann::json json = caps.toJson();
    EXPECT_EQ(json["canReview"], true);
    EXPECT_EQ(json["canDeploy"], false);
    EXPECT_EQ(json["specializedSkills"][0], "code-review");
    EXPECT_EQ(json["maxComplexity"], 7);
    EXPECT_EQ(json["collaborationStyle"], "analytical");

    AgentCapabilities parsed = AgentCapabilities::fromJson(json);
    EXPECT_TRUE(parsed.can_review);
    EXPECT_EQ(parsed.max_complexity, 7);
    EXPECT_EQ(parsed.collaboration_style, CollaborationStyle::ANALYTICAL);
}

TEST(AgentTypesTest, CapabilitiesFromJsonClampsAndDefaults) {
    AgentCapabilities caps = AgentCapabilities::fromJson({
        {"maxComplexity", 42},
        {"parallelTasks", 0},
        {"collaborationStyle", "chaotic"},
        {"specializedSkills", {"cpp", 3, "rust"}}
    });

    EXPECT_EQ(caps.max_complexity, 10);
    EXPECT_EQ(caps.parallel_tasks, 1);
    EXPECT_EQ(caps.collaboration_style, CollaborationStyle::ADAPTIVE);
    ASSERT_EQ(caps.specialized_skills.size(), 2u);
    EXPECT_EQ(caps.specialized_skills[1], "rust");

    EXPECT_EQ(AgentCapabilities::fromJson({{"maxComplexity", -3}}).max_complexity, 1);
    EXPECT_EQ(AgentCapabilities::fromJson(nlohmann::json::array()).max_complexity, 5);
}

TEST(AgentTypesTest, AdvertisedCapabilitiesMergeSkillsAndFlags) {
    AgentCapabilities caps;
    caps.specialized_skills = {"caching"};
    caps.can_execute_code = true;
    caps.can_optimize = true;

    std::set<std::string> advertised = caps.advertisedCapabilities();
    EXPECT_EQ(advertised, (std::set<std::string>{"caching", "execute_code", "optimize"}));
}

TEST(AgentTypesTest, TaskDelegationJson) {
    Task task;
    task.id = "task_1";
    task.title = "Add caching";
    task.priority = TaskPriority::CRITICAL;
    task.estimated_complexity = 6;
    task.requirements = {"p99 under 10ms"};

    nlohmann::json json = task.toDelegationJson();
    EXPECT_EQ(json["taskId"], "task_1");
    EXPECT_EQ(json["taskTitle"], "Add caching");
    EXPECT_EQ(json["priority"], "critical");
    EXPECT_EQ(json["complexity"], 6);
    EXPECT_TRUE(json["deadline"].is_null());

    task.deadline = 1700000000000ULL;
    Task parsed;
    ASSERT_TRUE(Task::fromDelegationJson(task.toDelegationJson(), parsed));
    EXPECT_EQ(parsed.priority, TaskPriority::CRITICAL);
    EXPECT_EQ(parsed.requirements, task.requirements);
    ASSERT_TRUE(parsed.deadline.has_value());
    EXPECT_EQ(*parsed.deadline, 1700000000000ULL);
}

TEST(AgentTypesTest, TaskDelegationJsonNeedsIdAndTitle) {
    Task parsed;
    EXPECT_FALSE(Task::fromDelegationJson({{"taskTitle", "no id"}}, parsed));
    EXPECT_FALSE(Task::fromDelegationJson({{"taskId", "task_2"}}, parsed));
    EXPECT_FALSE(Task::fromDelegationJson("task", parsed));

    ASSERT_TRUE(Task::fromDelegationJson({{"taskId", "task_3"}, {"taskTitle", "t"}, {"priority", "urgent"}}, parsed));
    EXPECT_EQ(parsed.priority, TaskPriority::MEDIUM);
    EXPECT_EQ(parsed.estimated_complexity, 1);
}

TEST(AgentTypesTest, TaskResultJsonOmitsEmptyFields) {
    TaskResult result;
    result.task_id = "task_1";
    result.agent_id = "agent_0";
    result.content = "done";

    nlohmann::json json = result.toJson();
    EXPECT_EQ(json["status"], "completed");
    EXPECT_FALSE(json.contains("error"));
    EXPECT_FALSE(json.contains("delegatedTo"));

    result.status = TaskStatus::FAILED;
    result.error = "boom";
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.toJson()["error"], "boom");
}

TEST(AgentTypesTest, PeerProfileFromAnnouncement) {
    PeerProfile profile = PeerProfile::fromAnnouncement({
        {"capabilities", nlohmann::json::array({"threat-modeling"})},
        {"maxComplexity", 8},
        {"parallelTasks", 2},
        {"collaborationStyle", "systematic"}
    });

    ASSERT_EQ(profile.skills.size(), 1u);
    EXPECT_EQ(profile.max_complexity, 8);
    EXPECT_EQ(profile.collaboration_style, "systematic");
    EXPECT_EQ(PeerProfile::fromAnnouncement(nlohmann::json()).max_complexity, 0);
}

TEST(AgentTypesTest, CollaborationNames) {
    EXPECT_EQ(parseCollaborationType("REVIEW"), CollaborationType::REVIEW);
    EXPECT_FALSE(parseCollaborationType("pairing").has_value());
    EXPECT_EQ(collaborationStatusName(CollaborationStatus::DECLINED), "declined");
    EXPECT_EQ(delegationStatusName(DelegationStatus::DECLINED), "declined");
}

} // namespace tests
} // namespace swarmnet
