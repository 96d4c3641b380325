#include <iostream>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include "common/config_manager.h"
#include "common/structured_logger.h"
#include "engine/engine_factory.h"
#include "test_support.h"
#include "test_fakes.h"

using namespace mender;
using namespace mender::test;
namespace fs = std::filesystem;

namespace {

fs::path writeConfig(const std::string& name, const std::string& contents) {
    fs::path dir = fs::temp_directory_path() / "mender_config_test";
    fs::create_directories(dir);
    fs::path path = dir / name;
    std::ofstream out(path.string());
    out << contents;
    return path;
}

} // anonymous namespace

void testDefaults() {
    std::cout << "[TEST] Default Configuration\n";

    auto& config = ConfigManager::getInstance();
    config.resetToDefaults();

    RetryConfig retry = config.getRetryConfig();
    MENDER_CHECK(retry.maxAttempts == 3);
    MENDER_CHECK(retry.backoffMs == 500);
    MENDER_CHECK(retry.strategy == BackoffStrategy::EXPONENTIAL);

    DispatchSettings dispatch = config.getDispatchSettings();
    MENDER_CHECK(dispatch.defaultTimeoutMs == 30000);
    MENDER_CHECK(dispatch.visibilityProbeMs == 100);

    HealingSettings healing = config.getHealingSettings();
    MENDER_CHECK(healing.similarityThreshold == 2);
    MENDER_CHECK_NEAR(healing.uiChangeConfidence, 0.7, 1e-9);

    MENDER_CHECK(config.getLogFile().empty());
    MENDER_CHECK(config.getLogFormat() == "text");

    std::cout << "[OK] Default configuration test passed\n\n";
}

void testLoadFromFile() {
    std::cout << "[TEST] Load From File\n";

    auto& config = ConfigManager::getInstance();
    fs::path path = writeConfig("mender.json", R"({
        "retry": {"max_attempts": 5, "backoff_ms": 250, "strategy": "linear"},
        "healing": {"ui_change_confidence": 1.5, "min_vision_confidence": 0.6}
    })");

    MENDER_CHECK(config.loadConfig(path.string()));
    MENDER_CHECK(config.getConfigPath() == path.string());

    RetryConfig retry = config.getRetryConfig();
    MENDER_CHECK(retry.maxAttempts == 5);
    MENDER_CHECK(retry.backoffMs == 250);
    MENDER_CHECK(retry.strategy == BackoffStrategy::LINEAR);

    HealingSettings healing = config.getHealingSettings();
    MENDER_CHECK_NEAR(healing.uiChangeConfidence, 1.0, 1e-9);
    MENDER_CHECK_NEAR(healing.minVisionConfidence, 0.6, 1e-9);
    // Untouched keys keep their defaults.
    MENDER_CHECK(healing.similarityThreshold == 2);
    MENDER_CHECK(config.getDispatchSettings().pollIntervalMs == 100);

    MENDER_CHECK(config.loadConfig((path.parent_path() / "absent.json").string()));
    MENDER_CHECK(config.getRetryConfig().maxAttempts == 3);

    fs::path broken = writeConfig("broken.json", "{ \"retry\": { \"max_attempts\": ");
    MENDER_CHECK(!config.loadConfig(broken.string()));
    MENDER_CHECK(config.getRetryConfig().maxAttempts == 3);

    fs::remove_all(path.parent_path());
    config.resetToDefaults();

    std::cout << "[OK] Load from file test passed\n\n";
}

void testOverridesAndAccessors() {
    std::cout << "[TEST] Overrides and Accessors\n";

    auto& config = ConfigManager::getInstance();
    config.resetToDefaults();

    config.applyOverrides({{"retry", {{"strategy", "fibonacci"}, {"max_attempts", 0}}},
                           {"dispatch", {{"sequence_delay_ms", 75}}}});

    RetryConfig retry = config.getRetryConfig();
    MENDER_CHECK(retry.strategy == BackoffStrategy::EXPONENTIAL);
    MENDER_CHECK(retry.maxAttempts == 1);
    MENDER_CHECK(config.getDispatchSettings().sequenceDelayMs == 75);

    config.applyOverrides(nlohmann::json::array({1, 2}));
    MENDER_CHECK(config.getDispatchSettings().sequenceDelayMs == 75);

    MENDER_CHECK(config.get<int>("dispatch", "sequence_delay_ms") == 75);
    config.set<std::string>("logging", "level", "DEBUG");
    MENDER_CHECK(config.get<std::string>("logging", "level") == "DEBUG");

    bool missing = false;
    try {
        config.get<int>("dispatch", "no_such_key");
    } catch (const std::runtime_error&) {
        missing = true;
    }
    MENDER_CHECK(missing);

    config.resetToDefaults();

    std::cout << "[OK] Overrides and accessors test passed\n\n";
}

void testLoggingConfiguration() {
    std::cout << "[TEST] Logging Configuration\n";

    auto& config = ConfigManager::getInstance();
    auto& logger = StructuredLogger::getInstance();
    config.resetToDefaults();

    setenv("MENDER_LOG_LEVEL", "debug", 1);
    MENDER_CHECK(config.getLogLevel() == "debug");
    config.configureLogging();
    MENDER_CHECK(logger.getLogLevel() == LogLevel::DEBUG);
    unsetenv("MENDER_LOG_LEVEL");

    fs::path dir = fs::temp_directory_path() / "mender_config_log_test";
    fs::remove_all(dir);
    config.applyOverrides({{"logging", {{"level", "warning"},
                                        {"file", (dir / "mender.log").string()},
                                        {"format", "json"}}}});
    MENDER_CHECK(config.getLogLevel() == "warning");
    config.configureLogging();
    MENDER_CHECK(logger.getLogLevel() == LogLevel::WARNING);

    SLOG_WARNING().message("Configured sink check").context("component", "config_test");
    logger.flush();

    std::ifstream logFile((dir / "mender.log").string());
    std::string line;
    MENDER_CHECK(std::getline(logFile, line));
    MENDER_CHECK(nlohmann::json::parse(line)["message"] == "Configured sink check");

    logger.clearSinks();
    logger.setLogLevel(LogLevel::INFO);
    fs::remove_all(dir);
    config.resetToDefaults();

    std::cout << "[OK] Logging configuration test passed\n\n";
}

void testEngineFactory() {
    std::cout << "[TEST] Engine Factory\n";

    auto& config = ConfigManager::getInstance();
    config.resetToDefaults();
    config.applyOverrides({{"retry", {{"max_attempts", 2}, {"backoff_ms", 40}}},
                           {"dispatch", {{"sequence_delay_ms", 30}}},
                           {"healing", {{"ui_change_confidence", 0.9}}}});

    auto agent = std::make_shared<FakePageAgent>();
    auto clock = std::make_shared<FakeClock>();
    agent->onAction = [](const nlohmann::json&) { return FakePageAgent::failure("timeout"); };

    Engine engine = EngineFactory::create("factory-session", agent, std::make_shared<FakeScreenshotCapture>(),
                                          clock, std::make_shared<FixedJitterSource>(0.0));

    MENDER_CHECK(engine.session->id() == "factory-session");
    MENDER_CHECK(engine.executor->getDefaultRetryConfig().maxAttempts == 2);
    MENDER_CHECK(engine.executor->getSequenceDelayMs() == 30);
    MENDER_CHECK_NEAR(engine.resolver->settings().uiChangeConfidence, 0.9, 1e-9);

    ActionResult result = engine.executor->executeWithRetry(Action::click(SelectorTarget{"#go"}));
    MENDER_CHECK(!result.success);
    MENDER_CHECK(agent->actions.size() == 2);
    MENDER_CHECK(clock->sleeps == std::vector<int>({40}));

    MENDER_CHECK_THROWS_KIND(EngineFactory::create("broken", nullptr, std::make_shared<FakeScreenshotCapture>()),
                             ErrorKind::CONTRACT_VIOLATION);

    MENDER_CHECK(EngineFactory::initialize((fs::temp_directory_path() / "mender_missing.json").string()));
    MENDER_CHECK(config.getRetryConfig().maxAttempts == 3);

    config.resetToDefaults();

    std::cout << "[OK] Engine factory test passed\n\n";
}

int main() {
    std::cout << "=== Mender Config Manager Test Suite ===\n\n";

    try {
        testDefaults();
        testLoadFromFile();
        testOverridesAndAccessors();
        testLoggingConfiguration();
        testEngineFactory();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
