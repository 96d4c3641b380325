#ifndef MENDER_ACTION_DISPATCHER_H
#define MENDER_ACTION_DISPATCHER_H

#include <string>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>
#include "page_session.h"
#include "../common/types.h"

namespace mender {

/**
 * @class ActionDispatcher
 * @brief Routes one action to the session's page agent and normalizes the outcome
 *
 * Every runtime failure comes back as a failed ActionResult carrying a
 * human-readable error and its ErrorKind. Only evaluate() throws, for an empty
 * script or an agent error; executeAction() folds those into results too.
 */
class ActionDispatcher : public IActionDispatcher {
public:
    explicit ActionDispatcher(PageSession& session, DispatchSettings settings = DispatchSettings());
    ~ActionDispatcher() override = default;

    ActionResult executeAction(const Action& action) override;

    /**
     * @brief Short-timeout visibility probe used for healing decisions
     * @return false on any failure, including a throwing agent
     */
    bool isElementVisible(const std::string& selector) override;

    /**
     * @brief Poll isElementVisible at the configured cadence until the deadline
     * @param timeoutMs defaults to the configured default timeout
     */
    bool waitForSelector(const std::string& selector, std::optional<int> timeoutMs = std::nullopt);

    // @throws MenderException (AGENT_FAILURE) when the agent cannot produce a snapshot
    DomSnapshot getDomSnapshot() override;

    // @throws MenderException (AGENT_FAILURE) when capture fails
    Screenshot captureScreenshot(const ScreenshotOptions& options = ScreenshotOptions()) override;

    /**
     * @brief Run a script in the page and return the agent's payload
     * @throws MenderException CONTRACT_VIOLATION for an empty script; the
     *         classified kind (or AGENT_FAILURE) when the agent reports an error
     */
    nlohmann::json evaluate(const std::string& script);

    PageSession& session() override { return m_session; }
    const DispatchSettings& settings() const { return m_settings; }

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    PageSession& m_session;
    DispatchSettings m_settings;

    ActionResult route(const Action& action, TimePoint start);
    ActionResult dispatchTargeted(const Action& action, TimePoint start);
    ActionResult dispatchWait(const Action& action, TimePoint start);
    ActionResult dispatchScreenshot(const Action& action, TimePoint start);
    ActionResult dispatchEvaluate(const Action& action, TimePoint start);
    ActionResult sendToAgent(const Action& action, const nlohmann::json& payload, TimePoint start);

    ActionResult fail(const Action& action, const std::string& error, ErrorKind kind, TimePoint start);
    long long elapsedMs(TimePoint start) const;
};

} // namespace mender

#endif // MENDER_ACTION_DISPATCHER_H
