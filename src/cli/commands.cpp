/**
 * @file commands.cpp
 * @brief Command implementations for the swarmnet CLI
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "cli/commands.h"
#include "network/tcp_transport.h"
#include "utils/id_generator.h"
#include "utils/logger.h"
#include "utils/error_handler.h"

#include <iostream>
#include <stdexcept>
#include <thread>

namespace swarmnet {
namespace cli {

namespace {

int parseInteger(const std::map<std::string, std::string>& args, const std::string& name, int default_value) {
    auto it = args.find(name);
    if (it == args.end()) {
        return default_value;
    }

    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(it->second, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("--" + name + " expects an integer, got '" + it->second + "'");
    }
    if (consumed != it->second.size()) {
        throw std::invalid_argument("--" + name + " expects an integer, got '" + it->second + "'");
    }
    return value;
}

std::string argumentOr(const std::map<std::string, std::string>& args, const std::string& name,
                       const std::string& default_value) {
    auto it = args.find(name);
    return it != args.end() ? it->second : default_value;
}

struct RoleProfile {
    agents::AgentRole role;
    std::vector<std::string> skills;
    std::vector<std::string> domains;
    int max_complexity;
};

const std::vector<RoleProfile>& roleProfiles() {
    static const std::vector<RoleProfile> profiles = {
        {agents::AgentRole::COORDINATOR, {"planning", "task-routing", "coordination"}, {"project-management"}, 6},
        {agents::AgentRole::ARCHITECT, {"system-design", "architecture", "scalability"}, {"backend", "distributed-systems"}, 9},
        {agents::AgentRole::DEVELOPER, {"implementation", "refactoring", "debugging"}, {"backend", "frontend"}, 7},
        {agents::AgentRole::REVIEWER, {"code-review", "static-analysis", "standards"}, {"quality"}, 6},
        {agents::AgentRole::TESTING, {"unit-testing", "integration-testing", "test-automation"}, {"quality"}, 5},
        {agents::AgentRole::SECURITY, {"vulnerability-analysis", "threat-modeling", "compliance"}, {"security"}, 8},
        {agents::AgentRole::DEVOPS, {"ci-cd", "containerization", "infrastructure"}, {"operations"}, 7},
        {agents::AgentRole::DATABASE, {"schema-design", "query-optimization", "migrations"}, {"data"}, 7},
        {agents::AgentRole::API_SPECIALIST, {"api-design", "rest-architecture", "graphql"}, {"backend"}, 6},
        {agents::AgentRole::PERFORMANCE, {"performance-profiling", "optimization", "caching"}, {"operations"}, 8}
    };
    return profiles;
}

} // namespace

agents::AgentRole roleForIndex(size_t index) {
    const auto& profiles = roleProfiles();
    return profiles[index % profiles.size()].role;
}

agents::AgentCapabilities capabilitiesForRole(agents::AgentRole role) {
    agents::AgentCapabilities capabilities;
    capabilities.languages = {"cpp", "python", "typescript"};

    for (const auto& profile : roleProfiles()) {
        if (profile.role == role) {
            capabilities.specialized_skills = profile.skills;
            capabilities.domains = profile.domains;
            capabilities.max_complexity = profile.max_complexity;
            break;
        }
    }

    switch (role) {
        case agents::AgentRole::COORDINATOR:
            capabilities.can_coordinate = true;
            capabilities.can_analyze_requirements = true;
            capabilities.parallel_tasks = 4;
            capabilities.collaboration_style = agents::CollaborationStyle::SYSTEMATIC;
            break;
        case agents::AgentRole::ARCHITECT:
            capabilities.can_analyze_requirements = true;
            capabilities.can_review = true;
            capabilities.collaboration_style = agents::CollaborationStyle::ANALYTICAL;
            break;
        case agents::AgentRole::REVIEWER:
        case agents::AgentRole::SECURITY:
            capabilities.can_review = true;
            capabilities.collaboration_style = agents::CollaborationStyle::ANALYTICAL;
            break;
        case agents::AgentRole::TESTING:
            capabilities.can_test = true;
            capabilities.can_execute_code = true;
            break;
        case agents::AgentRole::DEVOPS:
            capabilities.can_deploy = true;
            capabilities.can_execute_code = true;
            capabilities.tools = {"docker", "kubernetes"};
            break;
        case agents::AgentRole::PERFORMANCE:
            capabilities.can_optimize = true;
            capabilities.can_execute_code = true;
            break;
        default:
            capabilities.can_execute_code = true;
            capabilities.parallel_tasks = 2;
            capabilities.collaboration_style = agents::CollaborationStyle::CREATIVE;
            break;
    }

    return capabilities;
}

SwarmOptions SwarmOptions::fromArguments(const std::map<std::string, std::string>& args) {
    SwarmOptions options;

    options.agents = parseInteger(args, "agents", options.agents);
    if (options.agents < 1 || options.agents > 1000) {
        throw std::invalid_argument("--agents must be between 1 and 1000");
    }

    options.transport = argumentOr(args, "transport", options.transport);
    if (options.transport != "memory" && options.transport != "tcp") {
        throw std::invalid_argument("--transport must be 'memory' or 'tcp', got '" + options.transport + "'");
    }

    options.address = argumentOr(args, "address", options.address);

    int base_port = parseInteger(args, "base-port", options.base_port);
    if (base_port < 1 || base_port + options.agents - 1 > 65535) {
        throw std::invalid_argument("--base-port leaves no room for " + std::to_string(options.agents) + " agents");
    }
    options.base_port = static_cast<uint16_t>(base_port);

    int settle_ms = parseInteger(args, "settle-ms", static_cast<int>(options.settle_time.count()));
    if (settle_ms < 0) {
        throw std::invalid_argument("--settle-ms must not be negative");
    }
    options.settle_time = std::chrono::milliseconds(settle_ms);

    return options;
}

Swarm::Swarm(const utils::Config& config, const SwarmOptions& options)
    : options_(options)
    , transport_config_(network::TransportConfig::fromConfig(config))
    , bus_(std::make_unique<events::EventBus>())
    , memory_network_(std::make_shared<network::InMemoryNetwork>())
    , manager_(std::make_unique<topology::TopologyManager>(*bus_, topology::TopologyConfig::fromConfig(config))) {

    if (options_.transport == "tcp" && transport_config_.listen_address == "0.0.0.0") {
        transport_config_.listen_address = options_.address;
    }

    manager_->start();
}

Swarm::~Swarm() {
    manager_->stop();
    agents_.clear();
}

size_t Swarm::populate() {
    for (int i = 0; i < options_.agents; ++i) {
        std::string node_id = "agent_" + std::to_string(i);
        uint16_t port = static_cast<uint16_t>(options_.base_port + i);
        agents::AgentRole role = roleForIndex(static_cast<size_t>(i));

        auto agent = std::make_shared<agents::P2PAgent>(node_id, role, capabilitiesForRole(role),
                                                        createTransport(node_id, port), *bus_);
        manager_->registerAgent(agent);
        agents_.push_back(agent);
    }

    SWARMNET_LOG_INFO(CLI, "Swarm populated with " + std::to_string(agents_.size()) + " agents over " +
                      options_.transport + " transport");
    return agents_.size();
}

void Swarm::settle() const {
    if (options_.settle_time.count() > 0) {
        std::this_thread::sleep_for(options_.settle_time);
    }
}

std::shared_ptr<agents::P2PAgent> Swarm::agent(size_t index) const {
    return index < agents_.size() ? agents_[index] : nullptr;
}

std::shared_ptr<network::Transport> Swarm::createTransport(const std::string& node_id, uint16_t port) {
    if (options_.transport == "tcp") {
        return std::make_shared<network::TcpTransport>(node_id, options_.address, port, transport_config_);
    }
    return std::make_shared<network::InMemoryTransport>(memory_network_, node_id, options_.address, port,
                                                        transport_config_);
}

Commands::Commands(const utils::Config& config) : config_(config) {
    SWARMNET_LOG_DEBUG(CLI, "Commands created");
}

int Commands::execute(const CommandResult& result) {
    SWARMNET_LOG_DEBUG(CLI, "Executing command: " + result.command);

    if (result.command == "simulate") {
        return simulate(result.args);
    } else if (result.command == "path") {
        return path(result.args);
    }

    SWARMNET_ERROR(CLI, "Unknown command: " + result.command);
    std::cerr << "Unknown command: " << result.command << std::endl;
    return 1;
}

int Commands::simulate(const std::map<std::string, std::string>& args) {
    SwarmOptions options = SwarmOptions::fromArguments(args);
    Swarm swarm(config_, options);

    swarm.populate();
    swarm.settle();

    nlohmann::json output;
    output["collaboration"] = demonstrateCollaboration(swarm);
    output["task"] = demonstrateTask(swarm);

    swarm.manager().performHealthChecks();
    topology::NetworkMetrics metrics = swarm.manager().updateNetworkMetrics();

    output["transport"] = options.transport;
    output["topology"] = swarm.manager().getTopology().toJson();
    output["metrics"] = metrics.toJson();
    output["events"] = swarm.bus().getStats().events_published;

    std::cout << output.dump(2) << std::endl;
    return 0;
}

int Commands::path(const std::map<std::string, std::string>& args) {
    SwarmOptions options = SwarmOptions::fromArguments(args);
    std::string from = argumentOr(args, "from", "agent_0");
    std::string to = argumentOr(args, "to", "agent_" + std::to_string(options.agents - 1));

    Swarm swarm(config_, options);
    swarm.populate();

    auto route = swarm.manager().findPath(from, to);

    nlohmann::json output;
    output["from"] = from;
    output["to"] = to;
    output["path"] = route ? nlohmann::json(*route) : nlohmann::json(nullptr);
    std::cout << output.dump(2) << std::endl;

    if (!route) {
        SWARMNET_LOG_WARNING(CLI, "No path from " + from + " to " + to);
        return 1;
    }
    return 0;
}

nlohmann::json Commands::demonstrateCollaboration(Swarm& swarm) {
    auto requester = swarm.agent(swarm.size() - 1);
    if (!requester || swarm.size() < 2) {
        return nullptr;
    }

    auto peers = requester->getConnectedPeers();
    if (peers.empty()) {
        return nullptr;
    }

    nlohmann::json context;
    context["topic"] = "interface review";
    context["complexity"] = 2;

    std::string collaboration_id;
    if (!requester->requestCollaboration(peers.front(), agents::CollaborationType::REVIEW, context, &collaboration_id)) {
        SWARMNET_WARNING(AGENT, "Collaboration request to " + peers.front() + " was not sent");
        return nullptr;
    }
    swarm.settle();

    auto record = requester->getCollaboration(collaboration_id);
    return record ? record->toJson() : nlohmann::json(nullptr);
}

nlohmann::json Commands::demonstrateTask(Swarm& swarm) {
    auto coordinator = swarm.agent(0);
    if (!coordinator) {
        return nullptr;
    }

    agents::Task task;
    task.id = utils::IdGenerator::taskId();
    task.title = "Scalability review of the query cache";
    task.description = "Propose an architecture for caching the hot read path";
    task.priority = agents::TaskPriority::HIGH;
    task.estimated_complexity = 8;

    agents::TaskResult result = coordinator->processTask(task);

    nlohmann::json output;
    output["result"] = result.toJson();
    if (result.status == agents::TaskStatus::DELEGATED) {
        swarm.settle();
        auto outcome = coordinator->getDelegationOutcome(task.id);
        if (outcome) {
            output["delegation"] = {
                {"peer", outcome->peer_id},
                {"status", agents::delegationStatusName(outcome->status)},
                {"detail", outcome->detail}
            };
        }
    }
    return output;
}

} // namespace cli
} // namespace swarmnet
