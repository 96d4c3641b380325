#ifndef MENDER_VISION_FALLBACK_H
#define MENDER_VISION_FALLBACK_H

#include <string>
#include <vector>
#include <optional>
#include "../dispatcher/page_session.h"
#include "../common/types.h"

namespace mender {

/**
 * @class VisionFallback
 * @brief Boundary to the vision collaborator
 *
 * Every call captures a fresh screenshot through the dispatcher. Locations are
 * turned into coordinate targets at the center of the reported box.
 */
class VisionFallback {
public:
    VisionFallback(IActionDispatcher& dispatcher,
                   IVisionCollaborator& vision,
                   HealingSettings settings = HealingSettings());

    /**
     * @brief Locate an element by description
     * @return nullopt when nothing was found, the box is missing, confidence is
     *         below the configured minimum, or capture/vision failed
     */
    std::optional<CoordinateTarget> locate(const std::string& description);

    // Nearest detected element to @p point by center distance.
    std::optional<DetectedElement> snapToNearestElement(const Point& point);

    // Never throws; a failed capture or vision call is an unsuccessful verification.
    VerificationResult verifyOutcome(const std::string& prompt);

    /**
     * @brief Detected elements clustered by proximity, highest confidence first
     * @throws MenderException (AGENT_FAILURE) when capture or detection fails
     */
    std::vector<std::vector<DetectedElement>> describeLayout();

private:
    IActionDispatcher& m_dispatcher;
    IVisionCollaborator& m_vision;
    HealingSettings m_settings;

    std::vector<DetectedElement> detect();
};

} // namespace mender

#endif // MENDER_VISION_FALLBACK_H
