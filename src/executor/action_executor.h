#ifndef MENDER_ACTION_EXECUTOR_H
#define MENDER_ACTION_EXECUTOR_H

#include <memory>
#include <vector>
#include "retry_policy.h"
#include "../dispatcher/page_session.h"
#include "../common/types.h"

namespace mender {

struct SequenceOptions {
    bool stopOnError = true;   // truncate the result list at the first failure
};

/**
 * @class ActionExecutor
 * @brief Executes actions through a dispatcher with classification-driven retries
 *
 * A failed attempt is retried only while attempts remain and the failure is
 * classified as retryable; non-retryable messages ("invalid selector",
 * "permission denied", "cancelled") win over retryable ones. Exceptions thrown
 * by the dispatcher never escape: they become failed results with a zero
 * duration. All sleeping goes through the session clock.
 */
class ActionExecutor {
public:
    /**
     * @throws MenderException (CONFIGURATION) if @p defaultConfig is invalid
     */
    explicit ActionExecutor(IActionDispatcher& dispatcher,
                            RetryConfig defaultConfig = RetryConfig(),
                            std::shared_ptr<JitterSource> jitter = nullptr);
    ~ActionExecutor() = default;

    // Single dispatch, no retry.
    ActionResult executeAction(const Action& action);

    /**
     * @brief Retry with the default config, or retries + 1 attempts when the
     * action carries a retry count hint
     */
    ActionResult executeWithRetry(const Action& action);

    // @throws MenderException (CONFIGURATION) if @p config is invalid
    ActionResult executeWithRetry(const Action& action, const RetryConfig& config);

    std::vector<ActionResult> executeSequence(const std::vector<Action>& actions,
                                              SequenceOptions options = SequenceOptions());

    // Configuration
    void setSequenceDelayMs(int delayMs);
    int getSequenceDelayMs() const { return m_sequenceDelayMs; }
    const RetryConfig& getDefaultRetryConfig() const { return m_defaultConfig; }

private:
    IActionDispatcher& m_dispatcher;
    RetryConfig m_defaultConfig;
    std::shared_ptr<JitterSource> m_jitter;
    int m_sequenceDelayMs;

    ActionResult attemptOnce(const Action& action);
    RetryConfig configFor(const Action& action) const;
    void sleepMs(int delayMs);
};

} // namespace mender

#endif // MENDER_ACTION_EXECUTOR_H
