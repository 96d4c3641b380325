#include "action_executor.h"
#include "../common/error_classifier.h"
#include "../common/structured_logger.h"
#include <algorithm>
#include <limits>

namespace mender {

ActionExecutor::ActionExecutor(IActionDispatcher& dispatcher,
                               RetryConfig defaultConfig,
                               std::shared_ptr<JitterSource> jitter)
    : m_dispatcher(dispatcher)
    , m_defaultConfig(defaultConfig)
    , m_jitter(jitter ? std::move(jitter) : std::make_shared<RandomJitterSource>())
    , m_sequenceDelayMs(0) {
    validateRetryConfig(m_defaultConfig);
    SLOG_DEBUG().message("ActionExecutor initialized")
        .context("session_id", m_dispatcher.session().id())
        .context("max_attempts", m_defaultConfig.maxAttempts)
        .context("backoff_ms", m_defaultConfig.backoffMs)
        .context("strategy", backoffStrategyToString(m_defaultConfig.strategy));
}

void ActionExecutor::setSequenceDelayMs(int delayMs) {
    m_sequenceDelayMs = std::max(0, delayMs);
}

ActionResult ActionExecutor::executeAction(const Action& action) {
    return attemptOnce(action);
}

ActionResult ActionExecutor::executeWithRetry(const Action& action) {
    return executeWithRetry(action, configFor(action));
}

ActionResult ActionExecutor::executeWithRetry(const Action& action, const RetryConfig& config) {
    validateRetryConfig(config);

    const std::string& sessionId = m_dispatcher.session().id();
    std::string actionType = actionKindToString(action.kind());
    ActionResult lastResult;

    for (int attempt = 1; attempt <= config.maxAttempts; ++attempt) {
        SLOG_DEBUG().message("Executing attempt")
            .context("session_id", sessionId)
            .context("action_type", actionType)
            .context("attempt", attempt)
            .context("max_attempts", config.maxAttempts);

        lastResult = attemptOnce(action);
        if (lastResult.success) {
            return lastResult;
        }

        if (!ErrorClassifier::shouldRetry(lastResult)) {
            SLOG_INFO().message("Non-retryable failure, giving up")
                .context("session_id", sessionId)
                .context("action_type", actionType)
                .context("attempt", attempt)
                .context("error", lastResult.error)
                .context("error_kind", errorKindToString(lastResult.errorKind));
            return lastResult;
        }

        if (attempt < config.maxAttempts) {
            int delay = computeBackoff(attempt, config, *m_jitter);
            SLOG_INFO().message("Retrying action")
                .context("session_id", sessionId)
                .context("action_type", actionType)
                .context("attempt", attempt)
                .context("delay_ms", delay)
                .context("error", lastResult.error);
            sleepMs(delay);
        }
    }

    SLOG_WARNING().message("Retry attempts exhausted")
        .context("session_id", sessionId)
        .context("action_type", actionType)
        .context("attempts", config.maxAttempts)
        .context("error", lastResult.error);
    return lastResult;
}

std::vector<ActionResult> ActionExecutor::executeSequence(const std::vector<Action>& actions, SequenceOptions options) {
    SCOPED_TIMER("ActionExecutor::executeSequence");
    std::vector<ActionResult> results;
    results.reserve(actions.size());

    for (size_t i = 0; i < actions.size(); ++i) {
        ActionResult result;
        try {
            result = executeWithRetry(actions[i]);
        } catch (const MenderException& e) {
            result = ActionResult::failure(e.what(), e.kind(), 0);
        }
        results.push_back(result);

        if (!result.success && options.stopOnError) {
            SLOG_INFO().message("Stopping sequence due to error")
                .context("session_id", m_dispatcher.session().id())
                .context("index", i)
                .context("action_type", actionKindToString(actions[i].kind()))
                .context("error", result.error);
            break;
        }

        if (m_sequenceDelayMs > 0 && i + 1 < actions.size()) {
            sleepMs(m_sequenceDelayMs);
        }
    }

    return results;
}

ActionResult ActionExecutor::attemptOnce(const Action& action) {
    try {
        return m_dispatcher.executeAction(action);
    } catch (const MenderException& e) {
        return ActionResult::failure(e.what(), e.kind(), 0);
    } catch (const std::exception& e) {
        ErrorKind kind = ErrorClassifier::classify(e.what());
        if (kind == ErrorKind::NONE) {
            kind = ErrorKind::UNKNOWN;
        }
        return ActionResult::failure(e.what(), kind, 0);
    } catch (...) {
        return ActionResult::failure("Unknown exception during dispatch", ErrorKind::UNKNOWN, 0);
    }
}

RetryConfig ActionExecutor::configFor(const Action& action) const {
    RetryConfig config = m_defaultConfig;
    if (action.options.retries) {
        int retries = std::min(*action.options.retries, std::numeric_limits<int>::max() - 1);
        config.maxAttempts = std::max(1, retries + 1);
    }
    return config;
}

void ActionExecutor::sleepMs(int delayMs) {
    if (delayMs > 0) {
        m_dispatcher.session().clock().sleepFor(std::chrono::milliseconds(delayMs));
    }
}

} // namespace mender
