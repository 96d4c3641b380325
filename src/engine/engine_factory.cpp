#include "engine_factory.h"
#include "../common/config_manager.h"
#include "../common/structured_logger.h"

namespace mender {

bool EngineFactory::initialize(const std::string& configPath) {
    auto& config = ConfigManager::getInstance();
    bool loaded = config.loadConfig(configPath);
    config.configureLogging();
    return loaded;
}

Engine EngineFactory::create(const std::string& sessionId,
                             std::shared_ptr<IPageAgent> agent,
                             std::shared_ptr<IScreenshotCapture> capture,
                             std::shared_ptr<SessionClock> clock,
                             std::shared_ptr<JitterSource> jitter) {
    const auto& config = ConfigManager::getInstance();
    DispatchSettings dispatchSettings = config.getDispatchSettings();

    Engine engine;
    engine.session = std::make_unique<PageSession>(sessionId, std::move(agent), std::move(capture), std::move(clock));
    engine.dispatcher = std::make_unique<ActionDispatcher>(*engine.session, dispatchSettings);
    engine.executor = std::make_unique<ActionExecutor>(*engine.dispatcher, config.getRetryConfig(), std::move(jitter));
    engine.executor->setSequenceDelayMs(dispatchSettings.sequenceDelayMs);
    engine.resolver = std::make_unique<SelfHealingResolver>(*engine.dispatcher, *engine.executor,
                                                            config.getHealingSettings());

    SLOG_INFO().message("Engine created").context("session_id", sessionId);
    return engine;
}

} // namespace mender
