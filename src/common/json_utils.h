#ifndef MENDER_JSON_UTILS_H
#define MENDER_JSON_UTILS_H

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace mender {
namespace utils {

/**
 * @brief Tolerant field extraction for JSON coming from configuration files
 * and from upstream planners
 */
class JsonUtils {
public:
    /**
     * @brief Get string field from JSON with default value
     * @param json JSON object to extract from
     * @param fieldName Name of field to extract
     * @param defaultValue Default value if field missing or not a string
     * @return Field value, or default value if not found/invalid
     */
    static std::string getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue = "");

    /**
     * @brief Get integer field from JSON with default value
     * @param json JSON object to extract from
     * @param fieldName Name of field to extract
     * @param defaultValue Default value if field missing or invalid
     * @return Field value as integer; floats are truncated, numeric strings parsed
     */
    static int getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue = 0);

    /**
     * @brief Get integer field only when present
     * @return The value, or std::nullopt when missing or not numeric
     */
    static std::optional<int> getOptionalIntField(const nlohmann::json& json, const std::string& fieldName);

    /**
     * @brief Get boolean field from JSON with default value
     * @param json JSON object to extract from
     * @param fieldName Name of field to extract
     * @param defaultValue Default value if field missing or invalid
     * @return Field value; "true"/"false"/"1"/"0" strings are accepted
     */
    static bool getBoolField(const nlohmann::json& json, const std::string& fieldName, bool defaultValue = false);

    /**
     * @brief Get floating point field from JSON with default value
     */
    static double getDoubleField(const nlohmann::json& json, const std::string& fieldName, double defaultValue = 0.0);

    /**
     * @brief Get an array of strings; non-string members are skipped
     */
    static std::vector<std::string> getStringArrayField(const nlohmann::json& json, const std::string& fieldName);

    /**
     * @brief Get a string field that must be present
     * @throws MenderException (CONTRACT_VIOLATION) when the field is missing
     *         or not a string
     */
    static std::string requireStringField(const nlohmann::json& json, const std::string& fieldName);
};

} // namespace utils
} // namespace mender

#endif // MENDER_JSON_UTILS_H
