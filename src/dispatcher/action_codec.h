#ifndef MENDER_ACTION_CODEC_H
#define MENDER_ACTION_CODEC_H

#include <nlohmann/json.hpp>
#include "../common/types.h"

namespace mender {

/**
 * @brief Normalized JSON form of an action, as handed to the page agent
 *
 * Shape: {"type": "<kind>", "target": {"type": "css"|"coordinates"|"semantic", ...},
 * "options": {...}, <kind-specific fields>}. The target and options objects are
 * omitted when absent or empty.
 */
nlohmann::json actionToJson(const Action& action);

/**
 * @brief Decode an action produced by an upstream planner
 *
 * Accepts the output of actionToJson and the legacy "value" field for the
 * kind's primary payload (text, url, key, file path, script).
 * @throws MenderException UNSUPPORTED_ACTION_KIND for an unknown "type",
 *         CONTRACT_VIOLATION for a missing type or a malformed target/condition
 */
Action actionFromJson(const nlohmann::json& json);

nlohmann::json targetToJson(const Target& target);
nlohmann::json waitConditionToJson(const WaitCondition& condition);

} // namespace mender

#endif // MENDER_ACTION_CODEC_H
