/**
 * @file command_parser.cpp
 * @brief Command line parser implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "cli/command_parser.h"
#include "utils/logger.h"
#include "utils/error_handler.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <iostream>

namespace swarmnet {
namespace cli {

CommandParser::CommandParser(int argc, char* argv[])
    : program_name_("swarmnet")
    , program_version_("1.0.0")
    , program_description_("SwarmNet - peer-to-peer agent network")
    , parsed_(false)
    , valid_(false)
    , information_shown_(false) {

    if (argc > 0 && argv[0]) {
        program_name_ = argv[0];
    }

    for (int i = 1; i < argc; ++i) {
        raw_args_.push_back(argv[i]);
    }

    SWARMNET_LOG_DEBUG(CLI, "Command parser created with " + std::to_string(raw_args_.size()) + " arguments");
}

void CommandParser::registerCommand(const Command& command) {
    commands_[command.name] = command;

    for (const auto& alias : command.aliases) {
        commands_[alias] = command;
    }

    SWARMNET_LOG_DEBUG(CLI, "Registered command: " + command.name);
}

void CommandParser::registerCommand(const std::string& name,
                                    const std::string& description,
                                    CommandHandler handler,
                                    const std::vector<Argument>& arguments) {
    Command command;
    command.name = name;
    command.description = description;
    command.handler = std::move(handler);
    command.arguments = arguments;

    registerCommand(command);
}

bool CommandParser::parse() {
    parsed_ = true;
    valid_ = false;
    information_shown_ = false;
    command_.clear();
    arguments_.clear();

    if (raw_args_.empty()) {
        showHelp();
        information_shown_ = true;
        valid_ = true;
        return true;
    }

    if (raw_args_[0] == "--version" || raw_args_[0] == "-v") {
        showVersion();
        information_shown_ = true;
        valid_ = true;
        return true;
    }

    bool wants_help = std::find(raw_args_.begin(), raw_args_.end(), "--help") != raw_args_.end() ||
                      std::find(raw_args_.begin(), raw_args_.end(), "-h") != raw_args_.end();
    if (wants_help) {
        const std::string& first = raw_args_[0];
        showHelp(first.compare(0, 1, "-") == 0 ? "" : first);
        information_shown_ = true;
        valid_ = true;
        return true;
    }

    if (!parseArguments()) {
        return false;
    }

    valid_ = validateArguments();
    return valid_;
}

int CommandParser::execute() {
    bool valid = parsed_ ? valid_ : parse();
    if (!valid) {
        SWARMNET_ERROR(CLI, "Failed to parse command line arguments");
        return 1;
    }

    if (information_shown_) {
        return 0;
    }

    SWARMNET_LOG_DEBUG(CLI, "Executing command: " + command_);

    const Command* cmd = findCommand(command_);
    if (!cmd) {
        std::cerr << "Unknown command: " << command_ << std::endl;
        SWARMNET_ERROR(CLI, "Unknown command: " + command_);
        return 1;
    }

    try {
        int result = cmd->handler(arguments_);
        SWARMNET_LOG_DEBUG(CLI, "Command executed with result: " + std::to_string(result));
        return result;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        SWARMNET_ERROR(CLI, "Command execution failed: " + std::string(e.what()));
        return 1;
    }
}

std::string CommandParser::getArgument(const std::string& name, const std::string& default_value) const {
    auto it = arguments_.find(name);
    if (it != arguments_.end()) {
        return it->second;
    }
    return default_value;
}

bool CommandParser::hasArgument(const std::string& name) const {
    return arguments_.find(name) != arguments_.end();
}

void CommandParser::showHelp(const std::string& command_name) const {
    if (command_name.empty()) {
        std::cout << generateGeneralHelp() << std::endl;
        return;
    }

    const Command* cmd = findCommand(command_name);
    if (cmd) {
        std::cout << generateCommandHelp(*cmd) << std::endl;
    } else {
        std::cout << "Unknown command: " << command_name << std::endl;
    }
}

void CommandParser::showVersion() const {
    std::cout << program_name_ << " version " << program_version_ << std::endl;
}

std::vector<std::string> CommandParser::getCommands() const {
    std::vector<std::string> command_names;
    for (const auto& pair : commands_) {
        if (pair.first == pair.second.name) {
            command_names.push_back(pair.first);
        }
    }
    return command_names;
}

const Command* CommandParser::getCommandInfo(const std::string& command_name) const {
    return findCommand(command_name);
}

bool CommandParser::parseArguments() {
    command_ = raw_args_[0];
    if (command_.compare(0, 1, "-") == 0) {
        std::cerr << "Expected a command before " << command_ << std::endl;
        SWARMNET_ERROR(CLI, "Missing command name");
        return false;
    }

    for (size_t i = 1; i < raw_args_.size(); ++i) {
        const std::string& arg = raw_args_[i];

        if (arg.compare(0, 2, "--") == 0 && arg.size() > 2) {
            std::string key = arg.substr(2);
            std::string value = "true";

            size_t equals = key.find('=');
            if (equals != std::string::npos) {
                value = key.substr(equals + 1);
                key = key.substr(0, equals);
            } else if (i + 1 < raw_args_.size() && raw_args_[i + 1].compare(0, 1, "-") != 0) {
                value = raw_args_[i + 1];
                i++;
            }

            arguments_[key] = value;
        } else {
            arguments_["positional_" + std::to_string(i)] = arg;
        }
    }

    return true;
}

bool CommandParser::validateArguments() const {
    const Command* cmd = findCommand(command_);
    if (!cmd) {
        return true;
    }

    for (const auto& arg : cmd->arguments) {
        auto it = arguments_.find(arg.name);
        if (it == arguments_.end()) {
            if (arg.required) {
                std::cerr << "Required argument missing: --" << arg.name << std::endl;
                SWARMNET_ERROR(CLI, "Required argument missing: " + arg.name);
                return false;
            }
            continue;
        }

        if (arg.type == ArgumentType::INTEGER) {
            const std::string& value = it->second;
            bool numeric = !value.empty() &&
                           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
            if (!numeric) {
                std::cerr << "Argument --" << arg.name << " expects an integer, got '" << value << "'" << std::endl;
                SWARMNET_ERROR(CLI, "Invalid integer for " + arg.name + ": " + value);
                return false;
            }
        }
    }

    return true;
}

const Command* CommandParser::findCommand(const std::string& name) const {
    auto it = commands_.find(name);
    if (it != commands_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::string CommandParser::generateCommandHelp(const Command& command) const {
    std::stringstream ss;

    ss << "Usage: " << program_name_ << " " << command.name;
    for (const auto& arg : command.arguments) {
        if (arg.required) {
            ss << " --" << arg.name << " <" << argumentTypeToString(arg.type) << ">";
        } else {
            ss << " [--" << arg.name << "]";
        }
    }

    ss << "\n\n" << command.description << "\n\n";

    if (!command.arguments.empty()) {
        ss << "Arguments:\n";
        for (const auto& arg : command.arguments) {
            ss << "  --" << arg.name << "    " << arg.description;
            if (!arg.default_value.empty()) {
                ss << " (default: " << arg.default_value << ")";
            } else if (!arg.required) {
                ss << " (optional)";
            }
            ss << "\n";
        }
    }

    return ss.str();
}

std::string CommandParser::generateGeneralHelp() const {
    std::stringstream ss;

    ss << program_description_ << "\n\n";
    ss << "Usage: " << program_name_ << " <command> [options] [--section.key=value ...]\n\n";
    ss << "Commands:\n";

    for (const auto& pair : commands_) {
        if (pair.first == pair.second.name) {
            ss << "  " << pair.second.name << "    " << pair.second.description << "\n";
        }
    }

    ss << "\nUse '" << program_name_ << " <command> --help' for more information about a command.\n";

    return ss.str();
}

std::string CommandParser::argumentTypeToString(ArgumentType type) {
    switch (type) {
        case ArgumentType::STRING: return "string";
        case ArgumentType::INTEGER: return "integer";
        case ArgumentType::BOOLEAN: return "boolean";
        case ArgumentType::FLAG: return "flag";
        default: return "unknown";
    }
}

} // namespace cli
} // namespace swarmnet
