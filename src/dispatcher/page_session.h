#ifndef MENDER_PAGE_SESSION_H
#define MENDER_PAGE_SESSION_H

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <nlohmann/json.hpp>
#include "../common/types.h"

namespace mender {

// ---------------------------------------------------------------------------
// Collaborator contracts
// ---------------------------------------------------------------------------

/**
 * @class IPageAgent
 * @brief Page-automation agent living next to the page
 *
 * execute() receives the normalized JSON form of an action (see action_codec.h)
 * and reports success or a free-form error message. Implementations may also
 * throw; callers treat a thrown exception like a failed response.
 */
class IPageAgent {
public:
    virtual ~IPageAgent() = default;

    virtual AgentResponse execute(const nlohmann::json& action) = 0;
    virtual DomSnapshot snapshot() = 0;
};

class IScreenshotCapture {
public:
    virtual ~IScreenshotCapture() = default;

    virtual Screenshot capture(const ScreenshotOptions& options) = 0;
};

class IVisionCollaborator {
public:
    virtual ~IVisionCollaborator() = default;

    virtual ElementLocation locateElement(const Screenshot& screenshot, const std::string& description) = 0;
    virtual std::vector<DetectedElement> detectElements(const Screenshot& screenshot) = 0;
    virtual VerificationResult verify(const Screenshot& screenshot, const std::string& prompt) = 0;
};

// Time source for every sleep and deadline in the engine.
class SessionClock {
public:
    virtual ~SessionClock() = default;

    virtual std::chrono::steady_clock::time_point now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public SessionClock {
public:
    std::chrono::steady_clock::time_point now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

// ---------------------------------------------------------------------------
// Session handle
// ---------------------------------------------------------------------------

/**
 * @class PageSession
 * @brief Binds one page agent, one screenshot capture and one clock under a session id
 *
 * Owned by the caller and shared by every component working on the page.
 * Healing resolutions take the session's healing lock with try-lock semantics;
 * a second concurrent resolution is refused instead of waiting.
 */
class PageSession {
public:
    PageSession(std::string sessionId,
                std::shared_ptr<IPageAgent> agent,
                std::shared_ptr<IScreenshotCapture> capture,
                std::shared_ptr<SessionClock> clock = nullptr);

    PageSession(const PageSession&) = delete;
    PageSession& operator=(const PageSession&) = delete;

    const std::string& id() const { return m_sessionId; }
    IPageAgent& agent() const { return *m_agent; }
    IScreenshotCapture& screenshots() const { return *m_capture; }
    SessionClock& clock() const { return *m_clock; }

    // Returned lock owns the mutex only if no other resolution holds it.
    std::unique_lock<std::mutex> tryAcquireHealing();

private:
    std::string m_sessionId;
    std::shared_ptr<IPageAgent> m_agent;
    std::shared_ptr<IScreenshotCapture> m_capture;
    std::shared_ptr<SessionClock> m_clock;
    std::mutex m_healingMutex;
};

// ---------------------------------------------------------------------------
// Dispatch seam
// ---------------------------------------------------------------------------

/**
 * @class IActionDispatcher
 * @brief Single-attempt execution of actions against a session
 *
 * Implemented by ActionDispatcher; the executor and the resolver depend only
 * on this interface.
 */
class IActionDispatcher {
public:
    virtual ~IActionDispatcher() = default;

    // Never throws for runtime failures; they come back as failed results.
    virtual ActionResult executeAction(const Action& action) = 0;

    // Short visibility probe; false on any failure.
    virtual bool isElementVisible(const std::string& selector) = 0;

    virtual DomSnapshot getDomSnapshot() = 0;
    virtual Screenshot captureScreenshot(const ScreenshotOptions& options = ScreenshotOptions()) = 0;

    virtual PageSession& session() = 0;
};

} // namespace mender

#endif // MENDER_PAGE_SESSION_H
