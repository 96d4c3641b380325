#include "action_dispatcher.h"
#include "action_codec.h"
#include "../common/error_classifier.h"
#include "../common/structured_logger.h"
#include <algorithm>
#include <cctype>

namespace mender {

namespace {

// Classified kind of a message, or the fallback when no pattern matches.
ErrorKind kindFor(const std::string& message, ErrorKind fallback) {
    ErrorKind kind = ErrorClassifier::classify(message);
    return (kind == ErrorKind::NONE || kind == ErrorKind::UNKNOWN) ? fallback : kind;
}

std::string capitalized(std::string word) {
    if (!word.empty()) {
        word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
    }
    return word;
}

} // anonymous namespace

ActionDispatcher::ActionDispatcher(PageSession& session, DispatchSettings settings)
    : m_session(session)
    , m_settings(settings) {
    SLOG_DEBUG().message("ActionDispatcher initialized")
        .context("session_id", m_session.id())
        .context("default_timeout_ms", m_settings.defaultTimeoutMs);
}

ActionResult ActionDispatcher::executeAction(const Action& action) {
    TimePoint start = m_session.clock().now();

    SLOG_DEBUG().message("Dispatching action")
        .context("session_id", m_session.id())
        .context("action_type", actionKindToString(action.kind()))
        .context("target", action.target ? describeTarget(*action.target) : std::string("none"));

    ActionResult result;
    try {
        result = route(action, start);
    } catch (const MenderException& e) {
        return fail(action, e.what(), e.kind(), start);
    } catch (const std::exception& e) {
        std::string message = std::string("Agent call failed: ") + e.what();
        return fail(action, message, kindFor(message, ErrorKind::AGENT_FAILURE), start);
    } catch (...) {
        return fail(action, "Agent call failed: unknown exception", ErrorKind::AGENT_FAILURE, start);
    }

    if (result.success && action.options.waitAfterMs > 0) {
        m_session.clock().sleepFor(std::chrono::milliseconds(action.options.waitAfterMs));
        result.durationMs = elapsedMs(start);
    }
    return result;
}

ActionResult ActionDispatcher::route(const Action& action, TimePoint start) {
    switch (action.kind()) {
        case ActionKind::CLICK:
        case ActionKind::TYPE:
        case ActionKind::HOVER:
        case ActionKind::UPLOAD:
            return dispatchTargeted(action, start);

        case ActionKind::WAIT:
            return dispatchWait(action, start);

        case ActionKind::SCREENSHOT:
            return dispatchScreenshot(action, start);

        case ActionKind::EVALUATE:
            return dispatchEvaluate(action, start);

        case ActionKind::SCROLL:
            if (std::get<ScrollParams>(action.params).direction == ScrollDirection::TO_ELEMENT) {
                return dispatchTargeted(action, start);
            }
            return sendToAgent(action, actionToJson(action), start);

        case ActionKind::NAVIGATE:
            if (std::get<NavigateParams>(action.params).url.empty()) {
                return fail(action, "Navigate action requires a URL", ErrorKind::CONTRACT_VIOLATION, start);
            }
            return sendToAgent(action, actionToJson(action), start);

        case ActionKind::PRESS_KEY:
            return sendToAgent(action, actionToJson(action), start);
    }

    return fail(action, "Unsupported action type: " + actionKindToString(action.kind()),
                ErrorKind::UNSUPPORTED_ACTION_KIND, start);
}

ActionResult ActionDispatcher::dispatchTargeted(const Action& action, TimePoint start) {
    std::string kindName = actionKindToString(action.kind());

    if (!action.target) {
        return fail(action, capitalized(kindName) + " action requires a target", ErrorKind::TARGET_MISSING, start);
    }

    if (const auto* semantic = std::get_if<SemanticTarget>(&*action.target)) {
        return fail(action,
                    "Semantic target \"" + semantic->description + "\" cannot be routed directly; "
                    "resolve it through the self-healing resolver first",
                    ErrorKind::NEEDS_RESOLUTION, start);
    }

    const auto* selector = std::get_if<SelectorTarget>(&*action.target);
    if (action.options.scrollIntoView && selector && action.kind() != ActionKind::SCROLL) {
        Action scroll = Action::scrollTo(selector->selector);
        ActionResult scrolled = sendToAgent(scroll, actionToJson(scroll), start);
        if (!scrolled.success) {
            return scrolled;
        }
    }

    return sendToAgent(action, actionToJson(action), start);
}

ActionResult ActionDispatcher::dispatchWait(const Action& action, TimePoint start) {
    const WaitCondition& condition = std::get<WaitParams>(action.params).condition;

    if (const auto* delay = std::get_if<Delay>(&condition)) {
        m_session.clock().sleepFor(std::chrono::milliseconds(std::max(0, delay->durationMs)));
        return ActionResult::ok(elapsedMs(start));
    }

    int timeoutMs = m_settings.defaultTimeoutMs;
    if (action.options.timeoutMs) {
        timeoutMs = *action.options.timeoutMs;
    } else if (const auto* idle = std::get_if<NetworkIdle>(&condition)) {
        timeoutMs = idle->timeoutMs.value_or(timeoutMs);
    }

    nlohmann::json payload = actionToJson(action);
    payload["timeout"] = timeoutMs;
    payload["options"]["timeout"] = timeoutMs;
    return sendToAgent(action, payload, start);
}

ActionResult ActionDispatcher::dispatchScreenshot(const Action& action, TimePoint start) {
    Screenshot screenshot = captureScreenshot(std::get<ScreenshotParams>(action.params).options);
    if (!screenshot.isValid()) {
        return fail(action, "Screenshot capture returned no image data", ErrorKind::AGENT_FAILURE, start);
    }

    nlohmann::json data = {
        {"format", screenshot.format == ImageFormat::JPEG ? "jpeg" : "png"},
        {"width", screenshot.width},
        {"height", screenshot.height},
        {"size", screenshot.data.size()}
    };
    return ActionResult::ok(elapsedMs(start), data);
}

ActionResult ActionDispatcher::dispatchEvaluate(const Action& action, TimePoint start) {
    nlohmann::json data = evaluate(std::get<EvaluateParams>(action.params).script);
    return ActionResult::ok(elapsedMs(start), data);
}

ActionResult ActionDispatcher::sendToAgent(const Action& action, const nlohmann::json& payload, TimePoint start) {
    AgentResponse response = m_session.agent().execute(payload);
    if (response.success) {
        return ActionResult::ok(elapsedMs(start), response.data);
    }

    std::string error = response.error;
    if (error.empty()) {
        error = "Agent reported a failed " + actionKindToString(action.kind()) + " action";
    }
    return fail(action, error, kindFor(error, ErrorKind::UNKNOWN), start);
}

nlohmann::json ActionDispatcher::evaluate(const std::string& script) {
    if (script.empty()) {
        MENDER_THROW(ErrorKind::CONTRACT_VIOLATION, "evaluate requires a non-empty script string",
                     "", m_session.id());
    }

    AgentResponse response = m_session.agent().execute(actionToJson(Action::evaluate(script)));
    if (!response.success) {
        std::string message = "evaluate failed: " + response.error;
        MENDER_THROW(kindFor(message, ErrorKind::AGENT_FAILURE), message, "", m_session.id());
    }
    return response.data;
}

bool ActionDispatcher::isElementVisible(const std::string& selector) {
    nlohmann::json probe = actionToJson(Action::wait(ElementVisible{selector}));
    probe["timeout"] = m_settings.visibilityProbeMs;
    probe["options"]["timeout"] = m_settings.visibilityProbeMs;

    try {
        return m_session.agent().execute(probe).success;
    } catch (const std::exception& e) {
        SLOG_DEBUG().message("Visibility probe failed")
            .context("session_id", m_session.id())
            .context("selector", selector)
            .context("error", e.what());
        return false;
    }
}

bool ActionDispatcher::waitForSelector(const std::string& selector, std::optional<int> timeoutMs) {
    SessionClock& clock = m_session.clock();
    TimePoint deadline = clock.now() + std::chrono::milliseconds(timeoutMs.value_or(m_settings.defaultTimeoutMs));

    while (clock.now() < deadline) {
        if (isElementVisible(selector)) {
            return true;
        }
        clock.sleepFor(std::chrono::milliseconds(m_settings.pollIntervalMs));
    }

    SLOG_DEBUG().message("Selector did not become visible before the deadline")
        .context("session_id", m_session.id())
        .context("selector", selector);
    return false;
}

DomSnapshot ActionDispatcher::getDomSnapshot() {
    try {
        return m_session.agent().snapshot();
    } catch (const MenderException&) {
        throw;
    } catch (const std::exception& e) {
        MENDER_THROW(ErrorKind::AGENT_FAILURE, std::string("Failed to get DOM snapshot: ") + e.what(),
                     "", m_session.id());
    }
}

Screenshot ActionDispatcher::captureScreenshot(const ScreenshotOptions& options) {
    try {
        return m_session.screenshots().capture(options);
    } catch (const MenderException&) {
        throw;
    } catch (const std::exception& e) {
        MENDER_THROW(ErrorKind::AGENT_FAILURE, std::string("Screenshot capture failed: ") + e.what(),
                     "", m_session.id());
    }
}

ActionResult ActionDispatcher::fail(const Action& action, const std::string& error, ErrorKind kind, TimePoint start) {
    SLOG_WARNING().message("Action failed")
        .context("session_id", m_session.id())
        .context("action_type", actionKindToString(action.kind()))
        .context("error", error)
        .context("error_kind", errorKindToString(kind));
    return ActionResult::failure(error, kind, elapsedMs(start));
}

long long ActionDispatcher::elapsedMs(TimePoint start) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(m_session.clock().now() - start).count();
}

} // namespace mender
