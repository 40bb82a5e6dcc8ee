/**
 * @file main.cpp
 * @brief Main entry point for the swarmnet CLI
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/command_parser.h"
#include "cli/commands.h"
#include "utils/logger.h"
#include "utils/config.h"
#include "utils/error_handler.h"

using namespace swarmnet;

namespace {

std::string findConfigPath(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--config" && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    return "";
}

std::vector<cli::Argument> swarmArguments() {
    return {
        cli::Argument("agents", cli::ArgumentType::INTEGER, "Number of agents to create", "5"),
        cli::Argument("transport", cli::ArgumentType::STRING, "Transport: memory or tcp", "memory"),
        cli::Argument("base-port", cli::ArgumentType::INTEGER, "Port of the first agent", "7400"),
        cli::Argument("address", cli::ArgumentType::STRING, "Address every agent advertises", "127.0.0.1"),
        cli::Argument("settle-ms", cli::ArgumentType::INTEGER, "Wait for in-flight messages", "200"),
        cli::Argument("config", cli::ArgumentType::STRING, "JSON or INI configuration file")
    };
}

} // namespace

/**
 * @brief Main entry point for the swarmnet CLI
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code
 */
int main(int argc, char* argv[]) {
    try {
        utils::Logger::initialize(utils::LogLevel::WARNING);

        auto config = std::make_unique<utils::Config>();
        std::string config_path = findConfigPath(argc, argv);
        if (!config_path.empty() && !config->load(config_path)) {
            std::cerr << "Could not load configuration from " << config_path << std::endl;
            return 1;
        }
        config->loadFromEnvironment();
        config->loadFromCommandLine(argc, argv);

        if (config->get<std::string>("logging", "format", "text") == "json") {
            utils::Logger::setFormatter(std::make_unique<utils::JsonFormatter>());
        }
        utils::Logger::initialize(
            utils::Logger::parseLevel(config->get<std::string>("logging", "level", "warning"),
                                      utils::LogLevel::WARNING),
            config->get<std::string>("logging", "file_path", ""),
            config->get<bool>("logging", "async", false));

        SWARMNET_LOG_INFO(GENERAL, "SwarmNet v1.0.0 starting...");

        auto parser = std::make_unique<cli::CommandParser>(argc, argv);
        auto commands = std::make_unique<cli::Commands>(*config);

        parser->registerCommand("simulate", "Build a local swarm, exercise it and print topology and metrics",
            [&commands](const std::map<std::string, std::string>& args) -> int {
                cli::CommandResult result;
                result.command = "simulate";
                result.args = args;
                return commands->execute(result);
            }, swarmArguments());

        std::vector<cli::Argument> path_arguments = swarmArguments();
        path_arguments.emplace_back("from", cli::ArgumentType::STRING, "Source agent id", "agent_0");
        path_arguments.emplace_back("to", cli::ArgumentType::STRING, "Destination agent id", "last agent");

        parser->registerCommand("path", "Build a local swarm and print the path between two agents",
            [&commands](const std::map<std::string, std::string>& args) -> int {
                cli::CommandResult result;
                result.command = "path";
                result.args = args;
                return commands->execute(result);
            }, path_arguments);

        int exit_code = parser->execute();

        utils::Logger::shutdown();
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        SWARMNET_CRITICAL(SYSTEM, std::string("Unhandled exception: ") + e.what());
        return 1;
    }
}
