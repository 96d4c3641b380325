#include "config_manager.h"
#include "structured_logger.h"
#include "json_utils.h"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <algorithm>

namespace mender {

ConfigManager::ConfigManager() {
    setDefaults();
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& configPath) {
    m_configPath = configPath;

    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        SLOG_WARNING().message("Config file not found, using defaults").context("config_path", configPath);
        setDefaults();
        return true;
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        SLOG_ERROR().message("Failed to open config file").context("config_path", configPath);
        setDefaults();
        return false;
    }

    try {
        nlohmann::json loaded = nlohmann::json::parse(file);
        setDefaults();
        applyOverrides(loaded);
        SLOG_INFO().message("Configuration loaded").context("config_path", configPath);
        return true;
    } catch (const nlohmann::json::exception& e) {
        SLOG_ERROR().message("Failed to parse config").context("config_path", configPath).context("error", e.what());
        setDefaults();
        return false;
    }
}

void ConfigManager::applyOverrides(const nlohmann::json& overrides) {
    if (!overrides.is_object()) {
        SLOG_WARNING().message("Ignoring configuration overrides that are not an object");
        return;
    }
    m_config.merge_patch(overrides);
}

void ConfigManager::resetToDefaults() {
    setDefaults();
    m_configPath.clear();
}

void ConfigManager::setDefaults() {
    m_config = nlohmann::json{
        {"retry", {
            {"max_attempts", 3},
            {"backoff_ms", 500},
            {"strategy", "exponential"}
        }},
        {"dispatch", {
            {"default_timeout_ms", 30000},
            {"visibility_probe_ms", 100},
            {"poll_interval_ms", 100},
            {"sequence_delay_ms", 0}
        }},
        {"healing", {
            {"similarity_threshold", 2},
            {"ui_change_confidence", 0.7},
            {"min_vision_confidence", 0.0},
            {"proximity_threshold_px", 50.0}
        }},
        {"logging", {
            {"level", "INFO"},
            {"file", ""},
            {"format", "text"},
            {"max_size_mb", 10},
            {"max_files", 5}
        }}
    };
}

const nlohmann::json& ConfigManager::section(const std::string& name) const {
    static const nlohmann::json empty = nlohmann::json::object();
    if (m_config.is_object() && m_config.contains(name) && m_config[name].is_object()) {
        return m_config[name];
    }
    return empty;
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

RetryConfig ConfigManager::getRetryConfig() const {
    const nlohmann::json& retry = section("retry");
    RetryConfig config;

    config.maxAttempts = std::max(1, utils::JsonUtils::getIntField(retry, "max_attempts", config.maxAttempts));
    config.backoffMs = std::max(0, utils::JsonUtils::getIntField(retry, "backoff_ms", config.backoffMs));

    std::string strategy = utils::JsonUtils::getStringField(retry, "strategy", "exponential");
    if (auto parsed = parseBackoffStrategy(strategy)) {
        config.strategy = *parsed;
    } else {
        SLOG_WARNING().message("Unknown backoff strategy, using exponential").context("strategy", strategy);
    }
    return config;
}

DispatchSettings ConfigManager::getDispatchSettings() const {
    const nlohmann::json& dispatch = section("dispatch");
    DispatchSettings settings;

    settings.defaultTimeoutMs = utils::JsonUtils::getIntField(dispatch, "default_timeout_ms", settings.defaultTimeoutMs);
    settings.visibilityProbeMs = utils::JsonUtils::getIntField(dispatch, "visibility_probe_ms", settings.visibilityProbeMs);
    settings.pollIntervalMs = std::max(1, utils::JsonUtils::getIntField(dispatch, "poll_interval_ms", settings.pollIntervalMs));
    settings.sequenceDelayMs = std::max(0, utils::JsonUtils::getIntField(dispatch, "sequence_delay_ms", settings.sequenceDelayMs));
    return settings;
}

HealingSettings ConfigManager::getHealingSettings() const {
    const nlohmann::json& healing = section("healing");
    HealingSettings settings;

    settings.similarityThreshold = utils::JsonUtils::getIntField(healing, "similarity_threshold", settings.similarityThreshold);
    settings.uiChangeConfidence = std::clamp(
        utils::JsonUtils::getDoubleField(healing, "ui_change_confidence", settings.uiChangeConfidence), 0.0, 1.0);
    settings.minVisionConfidence = std::clamp(
        utils::JsonUtils::getDoubleField(healing, "min_vision_confidence", settings.minVisionConfidence), 0.0, 1.0);
    settings.proximityThresholdPx = std::max(0.0,
        utils::JsonUtils::getDoubleField(healing, "proximity_threshold_px", settings.proximityThresholdPx));
    return settings;
}

// Logging Configuration
std::string ConfigManager::getLogLevel() const {
    std::string fromEnv = getEnvironmentVariable("MENDER_LOG_LEVEL");
    if (!fromEnv.empty()) {
        return fromEnv;
    }
    return utils::JsonUtils::getStringField(section("logging"), "level", "INFO");
}

std::string ConfigManager::getLogFile() const {
    return utils::JsonUtils::getStringField(section("logging"), "file", "");
}

std::string ConfigManager::getLogFormat() const {
    return utils::JsonUtils::getStringField(section("logging"), "format", "text");
}

int ConfigManager::getLogMaxSizeMb() const {
    return utils::JsonUtils::getIntField(section("logging"), "max_size_mb", 10);
}

int ConfigManager::getLogMaxFiles() const {
    return utils::JsonUtils::getIntField(section("logging"), "max_files", 5);
}

void ConfigManager::configureLogging() const {
    auto& logger = StructuredLogger::getInstance();
    logger.setLogLevel(parseLogLevel(getLogLevel()));

    std::string logFile = getLogFile();
    if (logFile.empty()) {
        return;
    }

    std::shared_ptr<ILogFormatter> formatter;
    if (getLogFormat() == "json") {
        formatter = std::make_shared<JsonLogFormatter>();
    } else {
        formatter = std::make_shared<TextLogFormatter>();
    }

    RotatingFileLogSink::Config sinkConfig;
    sinkConfig.base_path = logFile;
    sinkConfig.max_file_size = static_cast<size_t>(std::max(1, getLogMaxSizeMb())) * 1024 * 1024;
    sinkConfig.max_files = static_cast<size_t>(std::max(1, getLogMaxFiles()));
    logger.addSink(std::make_shared<RotatingFileLogSink>(sinkConfig, formatter));
}

std::string ConfigManager::getConfigPath() const {
    return m_configPath;
}

} // namespace mender
