#include "page_session.h"
#include "../common/structured_logger.h"
#include <thread>

namespace mender {

std::chrono::steady_clock::time_point SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

PageSession::PageSession(std::string sessionId,
                         std::shared_ptr<IPageAgent> agent,
                         std::shared_ptr<IScreenshotCapture> capture,
                         std::shared_ptr<SessionClock> clock)
    : m_sessionId(std::move(sessionId))
    , m_agent(std::move(agent))
    , m_capture(std::move(capture))
    , m_clock(clock ? std::move(clock) : std::make_shared<SystemClock>()) {
    if (!m_agent) {
        MENDER_THROW(ErrorKind::CONTRACT_VIOLATION, "PageSession requires a page agent", "", m_sessionId);
    }
    if (!m_capture) {
        MENDER_THROW(ErrorKind::CONTRACT_VIOLATION, "PageSession requires a screenshot capture", "", m_sessionId);
    }
    SLOG_DEBUG().message("Page session opened").context("session_id", m_sessionId);
}

std::unique_lock<std::mutex> PageSession::tryAcquireHealing() {
    return std::unique_lock<std::mutex>(m_healingMutex, std::try_to_lock);
}

} // namespace mender
