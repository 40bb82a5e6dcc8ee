/**
 * @file config.h
 * @brief Sectioned configuration for SwarmNet
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <vector>
#include <variant>
#include <functional>
#include <type_traits>

namespace swarmnet {
namespace utils {

/**
 * @brief Configuration value types
 */
using ConfigValue = std::variant<bool, int, double, std::string, std::vector<std::string>>;

/**
 * @brief Convert a stored value to the requested type
 *
 * Values read from INI files, the environment or the command line arrive as
 * strings, so numeric and boolean lookups fall back to parsing them.
 *
 * @return True if the value could be represented as T
 */
bool convertConfigValue(const ConfigValue& value, bool& out);
bool convertConfigValue(const ConfigValue& value, int& out);
bool convertConfigValue(const ConfigValue& value, double& out);
bool convertConfigValue(const ConfigValue& value, std::string& out);
bool convertConfigValue(const ConfigValue& value, std::vector<std::string>& out);

/**
 * @brief Configuration section
 */
class ConfigSection {
public:
    ConfigSection() : name_("") {}
    explicit ConfigSection(const std::string& name) : name_(name) {}

    /**
     * @brief Get a configuration value
     * @param key Configuration key
     * @param default_value Default value if key not found or not convertible
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& default_value = T{}) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }
        T result{};
        if (!convertConfigValue(it->second, result)) {
            return default_value;
        }
        return result;
    }

    void set(const std::string& key, const ConfigValue& value) {
        values_[key] = value;
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    bool remove(const std::string& key) {
        return values_.erase(key) > 0;
    }

    const ConfigValue* find(const std::string& key) const {
        auto it = values_.find(key);
        return it != values_.end() ? &it->second : nullptr;
    }

    std::vector<std::string> getKeys() const {
        std::vector<std::string> keys;
        for (const auto& pair : values_) {
            keys.push_back(pair.first);
        }
        return keys;
    }

    const std::string& getName() const { return name_; }

    void clear() {
        values_.clear();
    }

private:
    std::string name_;
    std::map<std::string, ConfigValue> values_;
};

/**
 * @brief Configuration change callback (section, key, new value)
 */
using ConfigChangeCallback = std::function<void(const std::string&, const std::string&, const ConfigValue&)>;

/**
 * @brief Configuration value validator
 */
using ConfigValidator = std::function<bool(const ConfigValue&)>;

/**
 * @brief Configuration management system
 *
 * Values are grouped in named sections and can be loaded from JSON or INI
 * files, from environment variables (PREFIX_SECTION_KEY) and from
 * command line arguments of the form --section.key=value. Later sources
 * override earlier ones.
 */
class Config {
public:
    Config();
    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) = delete;
    Config& operator=(Config&&) = delete;

    /**
     * @brief Load configuration from a file
     * @param filename Configuration file path (.json or .ini)
     * @return True if loading was successful
     */
    bool load(const std::string& filename);

    /**
     * @brief Save configuration to a JSON file
     * @param filename Configuration file path
     * @return True if saving was successful
     */
    bool save(const std::string& filename) const;

    /**
     * @brief Load configuration from environment variables
     * @param prefix Environment variable prefix
     * @return Number of values loaded
     */
    size_t loadFromEnvironment(const std::string& prefix = "SWARMNET_");

    /**
     * @brief Load --section.key=value overrides from command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return Number of values loaded
     */
    size_t loadFromCommandLine(int argc, char* argv[]);

    /**
     * @brief Get a configuration value
     * @param section_name Section name
     * @param key Configuration key
     * @param default_value Default value if key not found
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& section_name, const std::string& key, const T& default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sections_.find(section_name);
        if (it != sections_.end()) {
            return it->second.get<T>(key, default_value);
        }
        return default_value;
    }

    /**
     * @brief Set a configuration value
     * @return False if a registered validator rejected the value
     */
    template<typename T>
    bool set(const std::string& section_name, const std::string& key, const T& value) {
        if constexpr (std::is_same_v<std::decay_t<T>, const char*> || std::is_array_v<T>) {
            return setValue(section_name, key, ConfigValue(std::string(value)));
        } else {
            return setValue(section_name, key, ConfigValue(value));
        }
    }

    bool hasSection(const std::string& section_name) const;
    bool hasKey(const std::string& section_name, const std::string& key) const;
    std::vector<std::string> getSectionNames() const;
    ConfigSection getSection(const std::string& section_name) const;
    bool removeKey(const std::string& section_name, const std::string& key);
    void clear();

    /**
     * @brief Get configuration as JSON string
     */
    std::string toJson() const;

    /**
     * @brief Load configuration from JSON string
     * @param json JSON object of sections
     * @return True if loading was successful
     */
    bool fromJson(const std::string& json);

    /**
     * @brief Validate every value that has a validator
     */
    bool validate() const;

    std::vector<std::string> getValidationErrors() const;

    void setValidator(const std::string& section_name,
                      const std::string& key,
                      ConfigValidator validator);

    void registerChangeCallback(ConfigChangeCallback callback);
    void setChangeNotificationsEnabled(bool enabled);

private:
    mutable std::mutex mutex_;
    std::map<std::string, ConfigSection> sections_;
    std::map<std::string, ConfigValidator> validators_;
    std::vector<ConfigChangeCallback> change_callbacks_;
    bool change_notifications_enabled_;

    bool setValue(const std::string& section_name, const std::string& key, const ConfigValue& value);
    bool parseJson(const std::string& json);
    bool parseIni(const std::string& content);
    void notifyChange(const std::string& section_name, const std::string& key, const ConfigValue& value);
    bool validateValue(const std::string& section_name, const std::string& key, const ConfigValue& value) const;
    std::string getFileExtension(const std::string& filename) const;
    std::string readFile(const std::string& filename) const;
    bool writeFile(const std::string& filename, const std::string& content) const;
};

} // namespace utils
} // namespace swarmnet
