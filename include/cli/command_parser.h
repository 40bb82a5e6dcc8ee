/**
 * @file command_parser.h
 * @brief Command line parser for the swarmnet tool
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>

namespace swarmnet {
namespace cli {

/**
 * @brief Command line argument types
 */
enum class ArgumentType {
    STRING,     ///< String argument
    INTEGER,    ///< Integer argument
    BOOLEAN,    ///< Boolean argument
    FLAG        ///< Flag argument (no value)
};

/**
 * @brief Command line argument definition
 */
struct Argument {
    std::string name;           ///< Argument name, matched against --name
    ArgumentType type;          ///< Argument type
    std::string description;    ///< Argument description
    std::string default_value;  ///< Shown in help
    bool required;              ///< Whether argument is required

    Argument() : type(ArgumentType::STRING), required(false) {}
    Argument(std::string arg_name, ArgumentType arg_type, std::string arg_description,
             std::string arg_default = "", bool arg_required = false)
        : name(std::move(arg_name))
        , type(arg_type)
        , description(std::move(arg_description))
        , default_value(std::move(arg_default))
        , required(arg_required) {}
};

using CommandHandler = std::function<int(const std::map<std::string, std::string>&)>;

/**
 * @brief Command definition
 */
struct Command {
    std::string name;                           ///< Command name
    std::string description;                    ///< Command description
    std::vector<Argument> arguments;            ///< Command arguments
    CommandHandler handler;                     ///< Command handler
    std::vector<std::string> aliases;           ///< Command aliases
};

/**
 * @brief Command line interface parser
 *
 * The first argument names the command. Options are "--name value",
 * "--name=value" or a bare "--name" flag, which parses as "true".
 * Dotted options such as --network.heartbeat_interval_ms=500 are kept
 * as-is so they can be fed to Config::loadFromCommandLine.
 */
class CommandParser {
public:
    CommandParser(int argc, char* argv[]);
    ~CommandParser() = default;

    CommandParser(const CommandParser&) = delete;
    CommandParser& operator=(const CommandParser&) = delete;

    void registerCommand(const Command& command);
    void registerCommand(const std::string& name,
                         const std::string& description,
                         CommandHandler handler,
                         const std::vector<Argument>& arguments = {});

    /**
     * @brief Parse command line arguments
     * @return False on a parse or validation error
     */
    bool parse();

    /**
     * @brief Run the parsed command
     * @return Exit code
     */
    int execute();

    const std::string& getCommand() const { return command_; }
    const std::map<std::string, std::string>& getArguments() const { return arguments_; }
    std::string getArgument(const std::string& name, const std::string& default_value = "") const;
    bool hasArgument(const std::string& name) const;

    const std::string& getProgramName() const { return program_name_; }
    void setProgramVersion(const std::string& version) { program_version_ = version; }
    void setProgramDescription(const std::string& description) { program_description_ = description; }

    /**
     * @brief True if parse() printed help or version instead of selecting a command
     */
    bool informationShown() const { return information_shown_; }

    void showHelp(const std::string& command_name = "") const;
    void showVersion() const;

    std::vector<std::string> getCommands() const;
    const Command* getCommandInfo(const std::string& command_name) const;

private:
    std::string program_name_;
    std::string program_version_;
    std::string program_description_;
    std::vector<std::string> raw_args_;
    std::map<std::string, Command> commands_;
    std::string command_;
    std::map<std::string, std::string> arguments_;
    bool parsed_;
    bool valid_;
    bool information_shown_;

    bool parseArguments();
    bool validateArguments() const;
    const Command* findCommand(const std::string& name) const;
    std::string generateCommandHelp(const Command& command) const;
    std::string generateGeneralHelp() const;
    static std::string argumentTypeToString(ArgumentType type);
};

} // namespace cli
} // namespace swarmnet
