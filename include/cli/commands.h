/**
 * @file commands.h
 * @brief Command implementations for the swarmnet CLI
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <chrono>
#include <nlohmann/json.hpp>

#include "agents/p2p_agent.h"
#include "events/event_bus.h"
#include "network/in_memory_transport.h"
#include "topology/topology_manager.h"
#include "utils/config.h"

namespace swarmnet {
namespace cli {

/**
 * @brief Command result structure
 */
struct CommandResult {
    std::string command;                     ///< Command name
    std::map<std::string, std::string> args; ///< Command arguments
};

/**
 * @brief Swarm construction options shared by every command
 */
struct SwarmOptions {
    int agents = 5;
    std::string transport = "memory";       ///< "memory" or "tcp"
    std::string address = "127.0.0.1";
    uint16_t base_port = 7400;
    std::chrono::milliseconds settle_time{200};

    /**
     * @brief Read options from parsed arguments
     * @throws std::invalid_argument on out-of-range or unknown values
     */
    static SwarmOptions fromArguments(const std::map<std::string, std::string>& args);
};

/**
 * @brief A running local swarm
 *
 * Owns the event bus and the topology manager. The manager is stopped
 * before the bus is destroyed.
 */
class Swarm {
public:
    Swarm(const utils::Config& config, const SwarmOptions& options);
    ~Swarm();

    Swarm(const Swarm&) = delete;
    Swarm& operator=(const Swarm&) = delete;

    /**
     * @brief Create and register the configured number of agents
     * @return Number of agents registered
     */
    size_t populate();

    /**
     * @brief Give in-flight announcements and replies time to land
     */
    void settle() const;

    events::EventBus& bus() { return *bus_; }
    topology::TopologyManager& manager() { return *manager_; }
    std::shared_ptr<agents::P2PAgent> agent(size_t index) const;
    size_t size() const { return agents_.size(); }

private:
    SwarmOptions options_;
    network::TransportConfig transport_config_;
    std::unique_ptr<events::EventBus> bus_;
    std::shared_ptr<network::InMemoryNetwork> memory_network_;
    std::unique_ptr<topology::TopologyManager> manager_;
    std::vector<std::shared_ptr<agents::P2PAgent>> agents_;

    std::shared_ptr<network::Transport> createTransport(const std::string& node_id, uint16_t port);
};

/**
 * @brief Role and capability set given to the n-th simulated agent
 */
agents::AgentRole roleForIndex(size_t index);
agents::AgentCapabilities capabilitiesForRole(agents::AgentRole role);

/**
 * @brief Command implementations for the swarmnet CLI
 */
class Commands {
public:
    explicit Commands(const utils::Config& config);
    ~Commands() = default;

    Commands(const Commands&) = delete;
    Commands& operator=(const Commands&) = delete;

    /**
     * @brief Execute a command
     * @param result Command result to execute
     * @return Exit code
     */
    int execute(const CommandResult& result);

    /**
     * @brief Build a swarm, exercise it once and print topology and metrics
     */
    int simulate(const std::map<std::string, std::string>& args);

    /**
     * @brief Build a swarm and print the path between two agents
     */
    int path(const std::map<std::string, std::string>& args);

private:
    const utils::Config& config_;

    nlohmann::json demonstrateCollaboration(Swarm& swarm);
    nlohmann::json demonstrateTask(Swarm& swarm);
};

} // namespace cli
} // namespace swarmnet
