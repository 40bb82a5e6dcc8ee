/**
 * @file p2p_agent_test.cpp
 * @brief Tests for the agent collaboration and delegation protocol
 */

#include <gtest/gtest.h>
#include "agents/p2p_agent.h"
#include "events/event_bus.h"
#include "network/in_memory_transport.h"

#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

namespace swarmnet {
namespace tests {

using namespace std::chrono_literals;
using namespace agents;
using events::DomainEventType;

namespace {

bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

AgentCapabilities reviewerCapabilities() {
    AgentCapabilities caps;
    caps.can_review = true;
    caps.specialized_skills = {"code-review", "static-analysis"};
    caps.max_complexity = 6;
    return caps;
}

AgentCapabilities architectCapabilities() {
    AgentCapabilities caps;
    caps.can_analyze_requirements = true;
    caps.specialized_skills = {"architecture", "scalability"};
    caps.max_complexity = 9;
    caps.collaboration_style = CollaborationStyle::ANALYTICAL;
    return caps;
}

AgentCapabilities coordinatorCapabilities() {
    AgentCapabilities caps;
    caps.can_coordinate = true;
    caps.specialized_skills = {"planning"};
    caps.max_complexity = 4;
    return caps;
}

Task makeTask(const std::string& id, const std::string& title, int complexity) {
    Task task;
    task.id = id;
    task.title = title;
    task.estimated_complexity = complexity;
    return task;
}

} // namespace

class P2PAgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = std::make_shared<network::InMemoryNetwork>();
        config_.heartbeat_interval = std::chrono::hours(1);
        config_.discovery_interval = std::chrono::hours(1);
    }

    void TearDown() override {
        for (auto& agent : agents_) {
            agent->shutdown();
        }
        agents_.clear();
    }

    std::shared_ptr<network::InMemoryTransport> makeTransport(const std::string& id, uint16_t port) {
        return std::make_shared<network::InMemoryTransport>(network_, id, "127.0.0.1", port, config_);
    }

    std::shared_ptr<P2PAgent> startAgent(const std::string& id, uint16_t port, AgentRole role,
                                         const AgentCapabilities& caps, TaskExecutor executor = nullptr) {
        auto agent = std::make_shared<P2PAgent>(id, role, caps, makeTransport(id, port), bus_, executor);
        agents_.push_back(agent);
        EXPECT_TRUE(agent->initialize());
        return agent;
    }

    /// Connect both ways so each side caches the other's announcement
    void link(P2PAgent& a, P2PAgent& b) {
        ASSERT_TRUE(a.connectToPeer(b.getId(), b.getTransport().address(), b.getTransport().port()));
        ASSERT_TRUE(b.connectToPeer(a.getId(), a.getTransport().address(), a.getTransport().port()));
        ASSERT_TRUE(waitUntil([&] {
            auto a_view = a.getPeerInfo(b.getId());
            auto b_view = b.getPeerInfo(a.getId());
            return a_view && a_view->profile && b_view && b_view->profile;
        }));
    }

    std::shared_ptr<network::InMemoryNetwork> network_;
    network::TransportConfig config_;
    events::EventBus bus_;
    std::vector<std::shared_ptr<P2PAgent>> agents_;
};

TEST_F(P2PAgentTest, ConstructorRejectsBadTransport) {
    EXPECT_THROW(P2PAgent("agent_a", AgentRole::DEVELOPER, AgentCapabilities(), nullptr, bus_),
                 std::invalid_argument);
    EXPECT_THROW(P2PAgent("agent_a", AgentRole::DEVELOPER, AgentCapabilities(), makeTransport("agent_b", 7001), bus_),
                 std::invalid_argument);
}

TEST_F(P2PAgentTest, InitializePublishesRegistration) {
    auto agent = startAgent("agent_a", 7001, AgentRole::REVIEWER, reviewerCapabilities());

    EXPECT_TRUE(agent->isRunning());
    auto history = bus_.getHistory(DomainEventType::AGENT_REGISTERED);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].source, "agent_a");
    EXPECT_EQ(history[0].payload["role"], "reviewer");
    EXPECT_EQ(history[0].payload["port"], 7001);
}

TEST_F(P2PAgentTest, InitializeFailsOnTakenEndpoint) {
    startAgent("agent_a", 7001, AgentRole::REVIEWER, reviewerCapabilities());

    auto clash = std::make_shared<P2PAgent>("agent_b", AgentRole::DEVELOPER, AgentCapabilities(),
                                            makeTransport("agent_b", 7001), bus_);
    agents_.push_back(clash);
    EXPECT_FALSE(clash->initialize());
    EXPECT_EQ(bus_.countEvents(DomainEventType::AGENT_REGISTERED), 1u);
}

TEST_F(P2PAgentTest, ConnectAnnouncesCapabilities) {
    auto a = startAgent("agent_a", 7001, AgentRole::COORDINATOR, coordinatorCapabilities());
    auto b = startAgent("agent_b", 7002, AgentRole::ARCHITECT, architectCapabilities());

    ASSERT_TRUE(a->connectToPeer("agent_b", "127.0.0.1", 7002));

    auto a_view = a->getPeerInfo("agent_b");
    ASSERT_TRUE(a_view.has_value());
    EXPECT_TRUE(a_view->connected);
    EXPECT_EQ(a_view->port, 7002);

    ASSERT_TRUE(waitUntil([&] {
        auto b_view = b->getPeerInfo("agent_a");
        return b_view && b_view->profile.has_value();
    }));
    auto b_view = b->getPeerInfo("agent_a");
    EXPECT_TRUE(b_view->connected);
    EXPECT_EQ(b_view->profile->max_complexity, 4);
    EXPECT_EQ(b_view->profile->skills, std::vector<std::string>{"planning"});
    EXPECT_EQ(b->getConnectedPeers(), std::vector<std::string>{"agent_a"});
}

TEST_F(P2PAgentTest, FailedConnectPublishesEvent) {
    auto a = startAgent("agent_a", 7001, AgentRole::DEVELOPER, AgentCapabilities());

    EXPECT_FALSE(a->connectToPeer("agent_ghost", "127.0.0.1", 7999));
    EXPECT_FALSE(a->getPeerInfo("agent_ghost").has_value());

    ASSERT_TRUE(waitUntil([&] { return bus_.countEvents(DomainEventType::CONNECTION_FAILED) == 1; }));
    auto history = bus_.getHistory(DomainEventType::CONNECTION_FAILED);
    EXPECT_EQ(history[0].payload["peerId"], "agent_ghost");
    EXPECT_EQ(history[0].payload["port"], 7999);
}

TEST_F(P2PAgentTest, ReviewRequestAcceptedByReviewer) {
    auto a = startAgent("agent_a", 7001, AgentRole::DEVELOPER, AgentCapabilities());
    auto b = startAgent("agent_b", 7002, AgentRole::REVIEWER, reviewerCapabilities());
    ASSERT_TRUE(a->connectToPeer("agent_b", "127.0.0.1", 7002));

    std::string collaboration_id;
    ASSERT_TRUE(a->requestCollaboration("agent_b", CollaborationType::REVIEW,
                                        nlohmann::json{{"complexity", 3}}, &collaboration_id));
    EXPECT_EQ(collaboration_id.rfind("collab_", 0), 0u);
    EXPECT_EQ(bus_.countEvents(DomainEventType::COLLABORATION_REQUEST), 1u);

    ASSERT_TRUE(waitUntil([&] {
        auto record = a->getCollaboration(collaboration_id);
        return record && record->status != CollaborationStatus::PENDING;
    }));

    auto record = a->getCollaboration(collaboration_id);
    EXPECT_EQ(record->status, CollaborationStatus::ACCEPTED);
    ASSERT_EQ(record->responses.size(), 1u);
    EXPECT_EQ(record->responses[0].agent, "agent_b");
    EXPECT_TRUE(record->responses[0].can_help);
    EXPECT_EQ(record->responses[0].estimated_time_minutes, 90);
    EXPECT_EQ(record->responses[0].skills, reviewerCapabilities().specialized_skills);
}

TEST_F(P2PAgentTest, EstimateScalesWithFractionalComplexity) {
    auto a = startAgent("agent_a", 7001, AgentRole::DEVELOPER, AgentCapabilities());
    auto b = startAgent("agent_b", 7002, AgentRole::REVIEWER, reviewerCapabilities());
    ASSERT_TRUE(a->connectToPeer("agent_b", "127.0.0.1", 7002));

    std::string half_id;
    ASSERT_TRUE(a->requestCollaboration("agent_b", CollaborationType::REVIEW,
                                        nlohmann::json{{"complexity", 2.5}}, &half_id));
    std::string small_id;
    ASSERT_TRUE(a->requestCollaboration("agent_b", CollaborationType::REVIEW,
                                        nlohmann::json{{"complexity", 0.2}}, &small_id));

    ASSERT_TRUE(waitUntil([&] {
        auto half = a->getCollaboration(half_id);
        auto small = a->getCollaboration(small_id);
        return half && small && !half->responses.empty() && !small->responses.empty();
    }));

    EXPECT_EQ(a->getCollaboration(half_id)->responses[0].estimated_time_minutes, 75);
    EXPECT_EQ(a->getCollaboration(small_id)->responses[0].estimated_time_minutes, 30);
}

TEST_F(P2PAgentTest, HelpRequestDependsOnRequiredSkills) {
    auto a = startAgent("agent_a", 7001, AgentRole::DEVELOPER, AgentCapabilities());
    auto b = startAgent("agent_b", 7002, AgentRole::REVIEWER, reviewerCapabilities());
    ASSERT_TRUE(a->connectToPeer("agent_b", "127.0.0.1", 7002));

    std::string declined_id;
    ASSERT_TRUE(a->requestCollaboration("agent_b", CollaborationType::HELP,
                                        nlohmann::json{{"requiredSkills", {"kubernetes", "helm"}}}, &declined_id));
    std::string accepted_id;
    ASSERT_TRUE(a->requestCollaboration("agent_b", CollaborationType::HELP,
                                        nlohmann::json{{"requiredSkills", {"helm", "static-analysis"}}},
                                        &accepted_id));

    ASSERT_TRUE(waitUntil([&] {
        auto declined = a->getCollaboration(declined_id);
        auto accepted = a->getCollaboration(accepted_id);
        return declined && accepted && !declined->responses.empty() && !accepted->responses.empty();
    }));

    auto declined = a->getCollaboration(declined_id);
    EXPECT_EQ(declined->status, CollaborationStatus::DECLINED);
    EXPECT_FALSE(declined->responses[0].can_help);
    EXPECT_EQ(declined->responses[0].estimated_time_minutes, 0);

    auto accepted = a->getCollaboration(accepted_id);
    EXPECT_EQ(accepted->status, CollaborationStatus::ACCEPTED);
    EXPECT_EQ(accepted->responses[0].estimated_time_minutes, 30);
}

TEST_F(P2PAgentTest, CollaborationToUnknownPeerIsNotRecorded) {
    auto a = startAgent("agent_a", 7001, AgentRole::DEVELOPER, AgentCapabilities());

    std::string collaboration_id;
    EXPECT_FALSE(a->requestCollaboration("agent_nobody", CollaborationType::REVIEW, nlohmann::json::object(),
                                         &collaboration_id));
    EXPECT_TRUE(collaboration_id.empty());
    EXPECT_TRUE(a->getCollaborations().empty());
    EXPECT_EQ(bus_.countEvents(DomainEventType::COLLABORATION_REQUEST), 0u);
}

TEST_F(P2PAgentTest, DelegationCompletes) {
    auto a = startAgent("agent_a", 7001, AgentRole::COORDINATOR, coordinatorCapabilities());
    auto b = startAgent("agent_b", 7002, AgentRole::ARCHITECT, architectCapabilities());
    ASSERT_TRUE(a->connectToPeer("agent_b", "127.0.0.1", 7002));

    Task task = makeTask("task_1", "Scalability plan", 5);
    ASSERT_TRUE(a->delegateTask("agent_b", task));

    ASSERT_TRUE(waitUntil([&] {
        auto outcome = a->getDelegationOutcome("task_1");
        return outcome && outcome->status != DelegationStatus::DELEGATED;
    }));
    auto outcome = a->getDelegationOutcome("task_1");
    EXPECT_EQ(outcome->status, DelegationStatus::COMPLETED);
    EXPECT_EQ(outcome->peer_id, "agent_b");
    EXPECT_EQ(outcome->detail, "Task Scalability plan completed by agent_b");
}

TEST_F(P2PAgentTest, DelegationDeclinedWithoutMatchingSkill) {
    auto a = startAgent("agent_a", 7001, AgentRole::COORDINATOR, coordinatorCapabilities());
    auto b = startAgent("agent_b", 7002, AgentRole::ARCHITECT, architectCapabilities());
    ASSERT_TRUE(a->connectToPeer("agent_b", "127.0.0.1", 7002));

    ASSERT_TRUE(a->delegateTask("agent_b", makeTask("task_ui", "Polish the login form", 2)));
    ASSERT_TRUE(a->delegateTask("agent_b", makeTask("task_big", "Architecture rewrite", 10)));

    ASSERT_TRUE(waitUntil([&] {
        auto ui = a->getDelegationOutcome("task_ui");
        auto big = a->getDelegationOutcome("task_big");
        return ui && big && ui->status != DelegationStatus::DELEGATED && big->status != DelegationStatus::DELEGATED;
    }));
    auto ui = a->getDelegationOutcome("task_ui");
    EXPECT_EQ(ui->status, DelegationStatus::DECLINED);
    EXPECT_EQ(ui->detail, "Cannot handle this type of task");
    EXPECT_EQ(a->getDelegationOutcome("task_big")->status, DelegationStatus::DECLINED);
}

TEST_F(P2PAgentTest, DelegationFailsWhenExecutorThrows) {
    auto a = startAgent("agent_a", 7001, AgentRole::COORDINATOR, coordinatorCapabilities());
    auto b = startAgent("agent_b", 7002, AgentRole::ARCHITECT, architectCapabilities(),
                        [](const Task&) -> TaskResult { throw std::runtime_error("out of memory"); });
    ASSERT_TRUE(a->connectToPeer("agent_b", "127.0.0.1", 7002));

    ASSERT_TRUE(a->delegateTask("agent_b", makeTask("task_1", "Scalability plan", 5)));

    ASSERT_TRUE(waitUntil([&] {
        auto outcome = a->getDelegationOutcome("task_1");
        return outcome && outcome->status != DelegationStatus::DELEGATED;
    }));
    auto outcome = a->getDelegationOutcome("task_1");
    EXPECT_EQ(outcome->status, DelegationStatus::FAILED);
    EXPECT_EQ(outcome->detail, "out of memory");
}

TEST_F(P2PAgentTest, DelegationToUnknownPeerLeavesNoOutcome) {
    auto a = startAgent("agent_a", 7001, AgentRole::COORDINATOR, coordinatorCapabilities());

    EXPECT_FALSE(a->delegateTask("agent_nobody", makeTask("task_1", "Anything", 1)));
    EXPECT_FALSE(a->getDelegationOutcome("task_1").has_value());
}

TEST_F(P2PAgentTest, ProcessTaskRunsLocallyWithinCeiling) {
    auto a = startAgent("agent_a", 7001, AgentRole::COORDINATOR, coordinatorCapabilities());

    TaskResult result = a->processTask(makeTask("task_1", "Sprint planning", 4));
    EXPECT_EQ(result.status, TaskStatus::COMPLETED);
    EXPECT_EQ(result.task_id, "task_1");
    EXPECT_EQ(result.agent_id, "agent_a");
    EXPECT_EQ(result.content, "Task Sprint planning completed by agent_a");
}

TEST_F(P2PAgentTest, ProcessTaskDelegatesAboveCeiling) {
    auto a = startAgent("agent_a", 7001, AgentRole::COORDINATOR, coordinatorCapabilities());
    auto r = startAgent("agent_r", 7002, AgentRole::REVIEWER, reviewerCapabilities());
    auto b = startAgent("agent_b", 7003, AgentRole::ARCHITECT, architectCapabilities());
    link(*a, *r);
    link(*a, *b);

    TaskResult result = a->processTask(makeTask("task_1", "Scalability of the cache tier", 8));
    EXPECT_EQ(result.status, TaskStatus::DELEGATED);
    EXPECT_EQ(result.delegated_to, "agent_b");

    ASSERT_TRUE(waitUntil([&] {
        auto outcome = a->getDelegationOutcome("task_1");
        return outcome && outcome->status == DelegationStatus::COMPLETED;
    }));
}

TEST_F(P2PAgentTest, ProcessTaskFallsBackToLocalExecution) {
    auto a = startAgent("agent_a", 7001, AgentRole::COORDINATOR, coordinatorCapabilities());
    auto r = startAgent("agent_r", 7002, AgentRole::REVIEWER, reviewerCapabilities());
    link(*a, *r);

    TaskResult result = a->processTask(makeTask("task_1", "Code-review of everything", 8));
    EXPECT_EQ(result.status, TaskStatus::COMPLETED);
    EXPECT_EQ(result.agent_id, "agent_a");
    EXPECT_FALSE(a->getDelegationOutcome("task_1").has_value());
}

TEST_F(P2PAgentTest, ProcessTaskReportsExecutorFailure) {
    auto a = startAgent("agent_a", 7001, AgentRole::DEVELOPER, AgentCapabilities());
    a->setTaskExecutor([](const Task&) -> TaskResult { throw std::runtime_error("compiler crashed"); });

    TaskResult result = a->processTask(makeTask("task_1", "Build", 1));
    EXPECT_EQ(result.status, TaskStatus::FAILED);
    EXPECT_EQ(result.error, "compiler crashed");
    EXPECT_EQ(result.task_id, "task_1");
    EXPECT_FALSE(result.succeeded());

    a->setTaskExecutor(nullptr);
    EXPECT_EQ(a->processTask(makeTask("task_2", "Build", 1)).status, TaskStatus::COMPLETED);
}

TEST_F(P2PAgentTest, DiscoveryRequestIsAnswered) {
    auto a = startAgent("agent_a", 7001, AgentRole::COORDINATOR, coordinatorCapabilities());
    auto b = startAgent("agent_b", 7002, AgentRole::ARCHITECT, architectCapabilities());
    ASSERT_TRUE(a->connectToPeer("agent_b", "127.0.0.1", 7002));
    EXPECT_FALSE(a->getPeerInfo("agent_b")->profile.has_value());

    ASSERT_TRUE(a->sendToPeer("agent_b", message_types::DISCOVERY_REQUEST, nlohmann::json::object()));

    ASSERT_TRUE(waitUntil([&] {
        auto peer = a->getPeerInfo("agent_b");
        return peer && peer->profile.has_value();
    }));
    auto profile = *a->getPeerInfo("agent_b")->profile;
    EXPECT_EQ(profile.max_complexity, 9);
    EXPECT_EQ(profile.collaboration_style, "analytical");
}

TEST_F(P2PAgentTest, DisconnectForgetsPeer) {
    auto a = startAgent("agent_a", 7001, AgentRole::COORDINATOR, coordinatorCapabilities());
    auto b = startAgent("agent_b", 7002, AgentRole::ARCHITECT, architectCapabilities());
    link(*a, *b);

    a->disconnectFromPeer("agent_b");
    EXPECT_FALSE(a->getPeerInfo("agent_b").has_value());
    EXPECT_TRUE(a->getConnectedPeers().empty());

    ASSERT_TRUE(waitUntil([&] {
        auto peer = b->getPeerInfo("agent_a");
        return peer && !peer->connected;
    }));
}

TEST_F(P2PAgentTest, ShutdownMarksPeersDisconnected) {
    auto a = startAgent("agent_a", 7001, AgentRole::COORDINATOR, coordinatorCapabilities());
    auto b = startAgent("agent_b", 7002, AgentRole::ARCHITECT, architectCapabilities());
    link(*a, *b);

    a->shutdown();
    EXPECT_FALSE(a->isRunning());
    for (const auto& peer : a->getPeers()) {
        EXPECT_FALSE(peer.connected);
    }
    EXPECT_FALSE(a->sendToPeer("agent_b", "ping", nlohmann::json::object()));
}

TEST_F(P2PAgentTest, CanHandleTaskMatchesSkillsCaseInsensitively) {
    auto b = startAgent("agent_b", 7002, AgentRole::ARCHITECT, architectCapabilities());

    Task task = makeTask("task_1", "Improve SCALABILITY", 9);
    EXPECT_TRUE(b->canHandleTask(task));

    task.estimated_complexity = 10;
    EXPECT_FALSE(b->canHandleTask(task));

    Task described = makeTask("task_2", "Cache work", 3);
    described.description = "Needs an Architecture review";
    EXPECT_TRUE(b->canHandleTask(described));
    EXPECT_FALSE(b->canHandleTask(makeTask("task_3", "Write docs", 1)));
}

TEST_F(P2PAgentTest, EvaluateCollaborationByType) {
    auto b = startAgent("agent_b", 7002, AgentRole::ARCHITECT, architectCapabilities());

    EXPECT_TRUE(b->evaluateCollaborationRequest(CollaborationType::CONSULTATION, nlohmann::json::object()));
    EXPECT_FALSE(b->evaluateCollaborationRequest(CollaborationType::REVIEW, nlohmann::json::object()));
    EXPECT_FALSE(b->evaluateCollaborationRequest(CollaborationType::DELEGATION, nlohmann::json::object()));
    EXPECT_FALSE(b->evaluateCollaborationRequest(CollaborationType::HELP, nlohmann::json::object()));
    EXPECT_TRUE(b->evaluateCollaborationRequest(CollaborationType::HELP,
                                                nlohmann::json{{"requiredSkills", nlohmann::json::array({"architecture"})}}));
}

} // namespace tests
} // namespace swarmnet
