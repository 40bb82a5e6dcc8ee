/**
 * @file config.cpp
 * @brief Sectioned configuration implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "utils/config.h"
#include "utils/logger.h"
#include "utils/error_handler.h"
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>

extern char** environ;

namespace swarmnet {
namespace utils {

namespace {

std::string trim(const std::string& value) {
    size_t begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

ConfigValue fromJsonValue(const nlohmann::json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return static_cast<int>(value.get<int64_t>());
    }
    if (value.is_number_float()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_array()) {
        std::vector<std::string> items;
        for (const auto& item : value) {
            items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
        }
        return items;
    }
    return value.dump();
}

nlohmann::json toJsonValue(const ConfigValue& value) {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

} // namespace

bool convertConfigValue(const ConfigValue& value, bool& out) {
    if (auto b = std::get_if<bool>(&value)) {
        out = *b;
        return true;
    }
    if (auto i = std::get_if<int>(&value)) {
        out = *i != 0;
        return true;
    }
    if (auto s = std::get_if<std::string>(&value)) {
        std::string lowered = toLower(trim(*s));
        if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
            out = true;
            return true;
        }
        if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
            out = false;
            return true;
        }
    }
    return false;
}

bool convertConfigValue(const ConfigValue& value, int& out) {
    if (auto i = std::get_if<int>(&value)) {
        out = *i;
        return true;
    }
    if (auto d = std::get_if<double>(&value)) {
        out = static_cast<int>(*d);
        return true;
    }
    if (auto s = std::get_if<std::string>(&value)) {
        try {
            size_t consumed = 0;
            std::string text = trim(*s);
            int parsed = std::stoi(text, &consumed);
            if (consumed != text.size()) {
                return false;
            }
            out = parsed;
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }
    return false;
}

bool convertConfigValue(const ConfigValue& value, double& out) {
    if (auto d = std::get_if<double>(&value)) {
        out = *d;
        return true;
    }
    if (auto i = std::get_if<int>(&value)) {
        out = static_cast<double>(*i);
        return true;
    }
    if (auto s = std::get_if<std::string>(&value)) {
        try {
            size_t consumed = 0;
            std::string text = trim(*s);
            double parsed = std::stod(text, &consumed);
            if (consumed != text.size()) {
                return false;
            }
            out = parsed;
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }
    return false;
}

bool convertConfigValue(const ConfigValue& value, std::string& out) {
    if (auto s = std::get_if<std::string>(&value)) {
        out = *s;
        return true;
    }
    if (auto b = std::get_if<bool>(&value)) {
        out = *b ? "true" : "false";
        return true;
    }
    if (auto i = std::get_if<int>(&value)) {
        out = std::to_string(*i);
        return true;
    }
    if (auto d = std::get_if<double>(&value)) {
        out = std::to_string(*d);
        return true;
    }
    return false;
}

bool convertConfigValue(const ConfigValue& value, std::vector<std::string>& out) {
    if (auto list = std::get_if<std::vector<std::string>>(&value)) {
        out = *list;
        return true;
    }
    if (auto s = std::get_if<std::string>(&value)) {
        out.clear();
        std::stringstream ss(*s);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty()) {
                out.push_back(item);
            }
        }
        return true;
    }
    return false;
}

Config::Config() : change_notifications_enabled_(true) {
}

bool Config::load(const std::string& filename) {
    SWARMNET_LOG_INFO(CONFIGURATION, "Loading configuration from: " + filename);

    std::string content = readFile(filename);
    if (content.empty()) {
        SWARMNET_ERROR(CONFIGURATION, "Failed to read configuration file: " + filename);
        return false;
    }

    std::string extension = getFileExtension(filename);
    bool success = false;

    if (extension == "json") {
        success = parseJson(content);
    } else if (extension == "ini" || extension == "conf") {
        success = parseIni(content);
    } else {
        SWARMNET_ERROR(CONFIGURATION, "Unsupported configuration file format: " + extension);
        return false;
    }

    if (success) {
        SWARMNET_LOG_INFO(CONFIGURATION, "Configuration loaded successfully from: " + filename);
    } else {
        SWARMNET_ERROR(CONFIGURATION, "Failed to parse configuration file: " + filename);
    }

    return success;
}

bool Config::save(const std::string& filename) const {
    bool success = writeFile(filename, toJson());
    if (success) {
        SWARMNET_LOG_INFO(CONFIGURATION, "Configuration saved to: " + filename);
    } else {
        SWARMNET_ERROR(CONFIGURATION, "Failed to save configuration file: " + filename);
    }
    return success;
}

size_t Config::loadFromEnvironment(const std::string& prefix) {
    size_t loaded = 0;

    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        if (entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        size_t equal_pos = entry.find('=');
        if (equal_pos == std::string::npos) {
            continue;
        }

        // PREFIX_SECTION_KEY: the section is the first token, the key is the rest
        std::string name = entry.substr(prefix.size(), equal_pos - prefix.size());
        size_t separator = name.find('_');
        if (separator == std::string::npos || separator == 0 || separator + 1 >= name.size()) {
            continue;
        }

        std::string section = toLower(name.substr(0, separator));
        std::string key = toLower(name.substr(separator + 1));
        if (setValue(section, key, ConfigValue(entry.substr(equal_pos + 1)))) {
            ++loaded;
        }
    }

    if (loaded > 0) {
        SWARMNET_LOG_INFO(CONFIGURATION, "Loaded " + std::to_string(loaded) +
                          " values from environment with prefix " + prefix);
    }
    return loaded;
}

size_t Config::loadFromCommandLine(int argc, char* argv[]) {
    size_t loaded = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg.rfind("--", 0) != 0) {
            continue;
        }

        size_t equal_pos = arg.find('=');
        size_t dot_pos = arg.find('.');
        if (equal_pos == std::string::npos || dot_pos == std::string::npos || dot_pos > equal_pos) {
            continue;
        }

        std::string section = arg.substr(2, dot_pos - 2);
        std::string key = arg.substr(dot_pos + 1, equal_pos - dot_pos - 1);
        if (section.empty() || key.empty()) {
            continue;
        }

        if (setValue(section, key, ConfigValue(arg.substr(equal_pos + 1)))) {
            ++loaded;
        }
    }

    if (loaded > 0) {
        SWARMNET_LOG_DEBUG(CONFIGURATION, "Loaded " + std::to_string(loaded) +
                           " values from command line");
    }
    return loaded;
}

bool Config::hasSection(const std::string& section_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sections_.find(section_name) != sections_.end();
}

bool Config::hasKey(const std::string& section_name, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section_name);
    return it != sections_.end() && it->second.has(key);
}

std::vector<std::string> Config::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& pair : sections_) {
        names.push_back(pair.first);
    }
    return names;
}

ConfigSection Config::getSection(const std::string& section_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section_name);
    if (it != sections_.end()) {
        return it->second;
    }
    return ConfigSection(section_name);
}

bool Config::removeKey(const std::string& section_name, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section_name);
    return it != sections_.end() && it->second.remove(key);
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
}

std::string Config::toJson() const {
    nlohmann::json root = nlohmann::json::object();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [section_name, section] : sections_) {
        nlohmann::json values = nlohmann::json::object();
        for (const auto& key : section.getKeys()) {
            values[key] = toJsonValue(*section.find(key));
        }
        root[section_name] = values;
    }

    return root.dump(2);
}

bool Config::fromJson(const std::string& json) {
    return parseJson(json);
}

bool Config::validate() const {
    return getValidationErrors().empty();
}

std::vector<std::string> Config::getValidationErrors() const {
    std::vector<std::string> errors;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [full_key, validator] : validators_) {
        size_t dot_pos = full_key.find('.');
        std::string section_name = full_key.substr(0, dot_pos);
        std::string key = full_key.substr(dot_pos + 1);

        auto it = sections_.find(section_name);
        if (it == sections_.end()) {
            continue;
        }
        const ConfigValue* value = it->second.find(key);
        if (value && !validator(*value)) {
            errors.push_back("Invalid value for " + full_key);
        }
    }

    return errors;
}

void Config::setValidator(const std::string& section_name,
                          const std::string& key,
                          ConfigValidator validator) {
    std::lock_guard<std::mutex> lock(mutex_);
    validators_[section_name + "." + key] = std::move(validator);
}

void Config::registerChangeCallback(ConfigChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_callbacks_.push_back(std::move(callback));
}

void Config::setChangeNotificationsEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_notifications_enabled_ = enabled;
}

bool Config::setValue(const std::string& section_name, const std::string& key, const ConfigValue& value) {
    bool valid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        valid = validateValue(section_name, key, value);
        if (valid) {
            auto it = sections_.find(section_name);
            if (it == sections_.end()) {
                it = sections_.emplace(section_name, ConfigSection(section_name)).first;
            }
            it->second.set(key, value);
        }
    }

    if (!valid) {
        SWARMNET_WARNING(CONFIGURATION, "Rejected invalid value for " + section_name + "." + key);
        return false;
    }

    notifyChange(section_name, key, value);
    return true;
}

bool Config::parseJson(const std::string& json) {
    try {
        nlohmann::json config = nlohmann::json::parse(json);
        if (!config.is_object()) {
            SWARMNET_ERROR(CONFIGURATION, "Configuration root must be a JSON object");
            return false;
        }

        for (const auto& [section_name, section] : config.items()) {
            if (!section.is_object()) {
                SWARMNET_LOG_WARNING(CONFIGURATION, "Ignoring non-object section: " + section_name);
                continue;
            }
            for (const auto& [key, value] : section.items()) {
                setValue(section_name, key, fromJsonValue(value));
            }
        }

        SWARMNET_LOG_DEBUG(CONFIGURATION, "JSON configuration parsed successfully");
        return true;

    } catch (const nlohmann::json::exception& e) {
        SWARMNET_ERROR(CONFIGURATION, "JSON parsing error: " + std::string(e.what()));
        return false;
    }
}

bool Config::parseIni(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    std::string current_section;
    size_t line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t equal_pos = line.find('=');
        if (equal_pos == std::string::npos) {
            SWARMNET_LOG_WARNING(CONFIGURATION, "Malformed INI line " + std::to_string(line_number));
            continue;
        }

        std::string key = trim(line.substr(0, equal_pos));
        std::string value = trim(line.substr(equal_pos + 1));

        if (!current_section.empty() && !key.empty()) {
            setValue(current_section, key, ConfigValue(value));
        }
    }

    SWARMNET_LOG_DEBUG(CONFIGURATION, "INI configuration parsed successfully");
    return true;
}

void Config::notifyChange(const std::string& section_name, const std::string& key, const ConfigValue& value) {
    std::vector<ConfigChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!change_notifications_enabled_) {
            return;
        }
        callbacks = change_callbacks_;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(section_name, key, value);
        } catch (const std::exception& e) {
            SWARMNET_ERROR(CONFIGURATION, "Error in configuration change callback: " + std::string(e.what()));
        }
    }
}

bool Config::validateValue(const std::string& section_name, const std::string& key, const ConfigValue& value) const {
    auto it = validators_.find(section_name + "." + key);
    if (it != validators_.end()) {
        return it->second(value);
    }
    return true;
}

std::string Config::getFileExtension(const std::string& filename) const {
    size_t dot_pos = filename.find_last_of('.');
    if (dot_pos != std::string::npos) {
        return toLower(filename.substr(dot_pos + 1));
    }
    return "";
}

std::string Config::readFile(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return "";
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool Config::writeFile(const std::string& filename, const std::string& content) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << content;
    return file.good();
}

} // namespace utils
} // namespace swarmnet
