#include "vision_fallback.h"
#include "../geometry/geometry.h"
#include "../common/structured_logger.h"

namespace mender {

VisionFallback::VisionFallback(IActionDispatcher& dispatcher,
                               IVisionCollaborator& vision,
                               HealingSettings settings)
    : m_dispatcher(dispatcher)
    , m_vision(vision)
    , m_settings(settings) {
}

std::optional<CoordinateTarget> VisionFallback::locate(const std::string& description) {
    const std::string& sessionId = m_dispatcher.session().id();

    try {
        Screenshot screenshot = m_dispatcher.captureScreenshot();
        ElementLocation location = m_vision.locateElement(screenshot, description);

        if (!location.found || !location.bbox) {
            SLOG_INFO().message("Vision could not locate element")
                .context("session_id", sessionId)
                .context("description", description);
            return std::nullopt;
        }

        if (location.confidence < m_settings.minVisionConfidence) {
            SLOG_INFO().message("Vision location rejected for low confidence")
                .context("session_id", sessionId)
                .context("description", description)
                .context("confidence", location.confidence)
                .context("min_confidence", m_settings.minVisionConfidence);
            return std::nullopt;
        }

        Point center = geometry::centerOf(*location.bbox);
        SLOG_INFO().message("Element located visually")
            .context("session_id", sessionId)
            .context("description", description)
            .context("x", center.x)
            .context("y", center.y)
            .context("confidence", location.confidence);
        return CoordinateTarget{center.x, center.y};
    } catch (const std::exception& e) {
        SLOG_WARNING().message("Vision fallback failed")
            .context("session_id", sessionId)
            .context("description", description)
            .context("error", e.what());
        return std::nullopt;
    }
}

std::optional<DetectedElement> VisionFallback::snapToNearestElement(const Point& point) {
    std::vector<DetectedElement> elements;
    try {
        elements = detect();
    } catch (const MenderException& e) {
        SLOG_WARNING().message("Element detection failed")
            .context("session_id", m_dispatcher.session().id())
            .context("error", e.what());
        return std::nullopt;
    }

    const DetectedElement* nearest = geometry::findNearest(point, elements);
    if (nearest == nullptr) {
        return std::nullopt;
    }
    return *nearest;
}

VerificationResult VisionFallback::verifyOutcome(const std::string& prompt) {
    try {
        Screenshot screenshot = m_dispatcher.captureScreenshot();
        return m_vision.verify(screenshot, prompt);
    } catch (const std::exception& e) {
        SLOG_WARNING().message("Outcome verification failed")
            .context("session_id", m_dispatcher.session().id())
            .context("error", e.what());

        VerificationResult result;
        result.success = false;
        result.reasoning = std::string("Verification failed: ") + e.what();
        result.issues.push_back(e.what());
        return result;
    }
}

std::vector<std::vector<DetectedElement>> VisionFallback::describeLayout() {
    std::vector<DetectedElement> elements = geometry::sortByConfidence(detect());
    return geometry::groupByProximity(elements, m_settings.proximityThresholdPx);
}

std::vector<DetectedElement> VisionFallback::detect() {
    Screenshot screenshot = m_dispatcher.captureScreenshot();
    try {
        return m_vision.detectElements(screenshot);
    } catch (const MenderException&) {
        throw;
    } catch (const std::exception& e) {
        MENDER_THROW(ErrorKind::AGENT_FAILURE, std::string("Element detection failed: ") + e.what(),
                     "", m_dispatcher.session().id());
    }
}

} // namespace mender
