#ifndef MENDER_ENGINE_FACTORY_H
#define MENDER_ENGINE_FACTORY_H

#include <memory>
#include <string>
#include "../dispatcher/page_session.h"
#include "../dispatcher/action_dispatcher.h"
#include "../executor/action_executor.h"
#include "../healing/self_healing.h"

namespace mender {

/**
 * @brief One fully wired engine bound to a single page session
 *
 * Members are declared in dependency order so the session outlives the
 * components that reference it.
 */
struct Engine {
    std::unique_ptr<PageSession> session;
    std::unique_ptr<ActionDispatcher> dispatcher;
    std::unique_ptr<ActionExecutor> executor;
    std::unique_ptr<SelfHealingResolver> resolver;
};

/**
 * @brief Creates engines configured from the ConfigManager singleton
 */
class EngineFactory {
public:
    /**
     * @brief Load configuration and apply its logging section
     * @param configPath Path to configuration file
     * @return false if the file exists but could not be parsed
     */
    static bool initialize(const std::string& configPath = "config/mender.json");

    /**
     * @brief Wire a session, dispatcher, executor and resolver
     * @throws MenderException CONTRACT_VIOLATION for missing collaborators,
     *         CONFIGURATION for an invalid retry section
     */
    static Engine create(const std::string& sessionId,
                         std::shared_ptr<IPageAgent> agent,
                         std::shared_ptr<IScreenshotCapture> capture,
                         std::shared_ptr<SessionClock> clock = nullptr,
                         std::shared_ptr<JitterSource> jitter = nullptr);
};

} // namespace mender

#endif // MENDER_ENGINE_FACTORY_H
