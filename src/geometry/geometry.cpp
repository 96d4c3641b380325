#include "geometry.h"
#include <algorithm>
#include <iterator>
#include <sstream>

namespace mender {
namespace geometry {

namespace {

void requireViewport(double viewportWidth, double viewportHeight) {
    if (viewportWidth <= 0.0 || viewportHeight <= 0.0) {
        std::ostringstream oss;
        oss << viewportWidth << "x" << viewportHeight;
        MENDER_THROW(ErrorKind::CONTRACT_VIOLATION, "Viewport dimensions must be positive",
                     oss.str(), "geometry");
    }
}

} // anonymous namespace

BoundingBox percentToPx(const BoundingBox& box, double viewportWidth, double viewportHeight) {
    requireViewport(viewportWidth, viewportHeight);
    return BoundingBox(box.x / 100.0 * viewportWidth,
                       box.y / 100.0 * viewportHeight,
                       box.width / 100.0 * viewportWidth,
                       box.height / 100.0 * viewportHeight);
}

BoundingBox pxToPercent(const BoundingBox& box, double viewportWidth, double viewportHeight) {
    requireViewport(viewportWidth, viewportHeight);
    return BoundingBox(box.x / viewportWidth * 100.0,
                       box.y / viewportHeight * 100.0,
                       box.width / viewportWidth * 100.0,
                       box.height / viewportHeight * 100.0);
}

Point centerOf(const BoundingBox& box) {
    return Point(box.x + box.width / 2.0, box.y + box.height / 2.0);
}

double distance(const Point& a, const Point& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

std::vector<DetectedElement> filterByType(const std::vector<DetectedElement>& elements, ElementType type) {
    std::vector<DetectedElement> filtered;
    std::copy_if(elements.begin(), elements.end(), std::back_inserter(filtered),
                 [type](const DetectedElement& element) { return element.type == type; });
    return filtered;
}

std::vector<DetectedElement> sortByConfidence(std::vector<DetectedElement> elements) {
    std::stable_sort(elements.begin(), elements.end(),
                     [](const DetectedElement& a, const DetectedElement& b) {
                         return a.confidence > b.confidence;
                     });
    return elements;
}

} // namespace geometry
} // namespace mender
