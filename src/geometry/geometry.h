#ifndef MENDER_GEOMETRY_H
#define MENDER_GEOMETRY_H

#include <vector>
#include <cmath>
#include "../common/types.h"

namespace mender {
namespace geometry {

/**
 * @brief Convert a box expressed in percentages of the viewport to pixels
 * @throws MenderException (CONTRACT_VIOLATION) if width or height is not positive
 */
BoundingBox percentToPx(const BoundingBox& box, double viewportWidth, double viewportHeight);

/**
 * @brief Convert a pixel box to percentages of the viewport
 * @throws MenderException (CONTRACT_VIOLATION) if width or height is not positive
 */
BoundingBox pxToPercent(const BoundingBox& box, double viewportWidth, double viewportHeight);

Point centerOf(const BoundingBox& box);
double distance(const Point& a, const Point& b);

// Element types below only need a public BoundingBox member named bbox.

/**
 * @brief Linear search for the element whose center is closest to a point
 * @return nullptr for an empty list; on ties the earliest element wins
 */
template<typename Element>
const Element* findNearest(const Point& point, const std::vector<Element>& elements) {
    const Element* nearest = nullptr;
    double bestDistance = 0.0;

    for (const auto& element : elements) {
        double d = distance(point, centerOf(element.bbox));
        if (nearest == nullptr || d < bestDistance) {
            nearest = &element;
            bestDistance = d;
        }
    }
    return nearest;
}

/**
 * @brief Single-pass proximity clustering
 *
 * Each unassigned element seeds a group and absorbs every later unassigned
 * element whose center lies strictly closer than @p threshold to the seed's
 * center. Membership is not transitive. A threshold of 0 yields singletons.
 */
template<typename Element>
std::vector<std::vector<Element>> groupByProximity(const std::vector<Element>& elements, double threshold) {
    std::vector<std::vector<Element>> groups;
    std::vector<bool> assigned(elements.size(), false);

    for (size_t i = 0; i < elements.size(); ++i) {
        if (assigned[i]) continue;

        std::vector<Element> group{elements[i]};
        assigned[i] = true;
        Point seed = centerOf(elements[i].bbox);

        for (size_t j = i + 1; j < elements.size(); ++j) {
            if (assigned[j]) continue;
            if (distance(seed, centerOf(elements[j].bbox)) < threshold) {
                group.push_back(elements[j]);
                assigned[j] = true;
            }
        }
        groups.push_back(std::move(group));
    }
    return groups;
}

std::vector<DetectedElement> filterByType(const std::vector<DetectedElement>& elements, ElementType type);

// Stable: equal confidences keep their input order.
std::vector<DetectedElement> sortByConfidence(std::vector<DetectedElement> elements);

} // namespace geometry
} // namespace mender

#endif // MENDER_GEOMETRY_H
