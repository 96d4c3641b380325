#include "json_utils.h"
#include "error_handler.h"
#include "structured_logger.h"
#include "string_utils.h"

namespace mender {
namespace utils {

std::string JsonUtils::getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_string()) {
        return field.get<std::string>();
    }
    SLOG_WARNING().message("Field is not a string, returning default value").context("field", fieldName);
    return defaultValue;
}

int JsonUtils::getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue) {
    std::optional<int> value = getOptionalIntField(json, fieldName);
    return value ? *value : defaultValue;
}

std::optional<int> JsonUtils::getOptionalIntField(const nlohmann::json& json, const std::string& fieldName) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return std::nullopt;
    }

    const auto& field = json[fieldName];
    if (field.is_number_integer()) {
        return field.get<int>();
    } else if (field.is_number_float()) {
        return static_cast<int>(field.get<double>());
    } else if (field.is_string()) {
        try {
            return std::stoi(field.get<std::string>());
        } catch (const std::exception&) {
            SLOG_WARNING().message("Cannot convert string field to integer").context("field", fieldName);
            return std::nullopt;
        }
    }
    if (!field.is_null()) {
        SLOG_WARNING().message("Field is not a number").context("field", fieldName);
    }
    return std::nullopt;
}

bool JsonUtils::getBoolField(const nlohmann::json& json, const std::string& fieldName, bool defaultValue) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_boolean()) {
        return field.get<bool>();
    } else if (field.is_string()) {
        std::string strValue = StringUtils::toLowerCase(field.get<std::string>());
        if (strValue == "true" || strValue == "1" || strValue == "yes") {
            return true;
        } else if (strValue == "false" || strValue == "0" || strValue == "no") {
            return false;
        }
    } else if (field.is_number()) {
        return field.get<double>() != 0.0;
    }
    SLOG_WARNING().message("Field is not a boolean, returning default value").context("field", fieldName);
    return defaultValue;
}

double JsonUtils::getDoubleField(const nlohmann::json& json, const std::string& fieldName, double defaultValue) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_number()) {
        return field.get<double>();
    } else if (field.is_string()) {
        try {
            return std::stod(field.get<std::string>());
        } catch (const std::exception&) {
            SLOG_WARNING().message("Cannot convert string field to double").context("field", fieldName);
            return defaultValue;
        }
    }
    SLOG_WARNING().message("Field is not a number, returning default value").context("field", fieldName);
    return defaultValue;
}

std::vector<std::string> JsonUtils::getStringArrayField(const nlohmann::json& json, const std::string& fieldName) {
    std::vector<std::string> result;
    if (!json.is_object() || !json.contains(fieldName) || !json[fieldName].is_array()) {
        return result;
    }

    for (const auto& item : json[fieldName]) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

std::string JsonUtils::requireStringField(const nlohmann::json& json, const std::string& fieldName) {
    if (!json.is_object() || !json.contains(fieldName) || !json[fieldName].is_string()) {
        MENDER_THROW(ErrorKind::CONTRACT_VIOLATION,
                     "Missing required string field: " + fieldName,
                     json.dump(), "JsonUtils::requireStringField");
    }
    return json[fieldName].get<std::string>();
}

} // namespace utils
} // namespace mender
