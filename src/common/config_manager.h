#ifndef MENDER_CONFIG_MANAGER_H
#define MENDER_CONFIG_MANAGER_H

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "types.h"

namespace mender {

class ConfigManager {
public:
    static ConfigManager& getInstance();

    /**
     * @brief Load a JSON configuration file on top of the defaults
     * @return false if the file exists but cannot be parsed; defaults stay in effect
     */
    bool loadConfig(const std::string& configPath = "config/mender.json");

    // Merge overrides (RFC 7386 merge patch) into the current configuration
    void applyOverrides(const nlohmann::json& overrides);
    void resetToDefaults();

    // Retry Configuration
    RetryConfig getRetryConfig() const;

    // Dispatch Configuration
    DispatchSettings getDispatchSettings() const;

    // Healing Configuration
    HealingSettings getHealingSettings() const;

    // Logging Configuration
    std::string getLogLevel() const;
    std::string getLogFile() const;
    std::string getLogFormat() const;
    int getLogMaxSizeMb() const;
    int getLogMaxFiles() const;

    // Apply the logging section to the StructuredLogger singleton
    void configureLogging() const;

    std::string getConfigPath() const;
    const nlohmann::json& raw() const { return m_config; }

    template<typename T>
    T get(const std::string& section, const std::string& key) const;

    template<typename T>
    void set(const std::string& section, const std::string& key, const T& value);

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    nlohmann::json m_config;
    std::string m_configPath;

    void setDefaults();
    const nlohmann::json& section(const std::string& name) const;
    std::string getEnvironmentVariable(const std::string& name) const;
};

template<typename T>
T ConfigManager::get(const std::string& sectionName, const std::string& key) const {
    const nlohmann::json& values = section(sectionName);
    if (values.contains(key)) {
        return values[key].get<T>();
    }
    throw std::runtime_error("Configuration key not found: " + sectionName + "." + key);
}

template<typename T>
void ConfigManager::set(const std::string& sectionName, const std::string& key, const T& value) {
    m_config[sectionName][key] = value;
}

} // namespace mender

#endif // MENDER_CONFIG_MANAGER_H
