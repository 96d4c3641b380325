#include "error_classifier.h"
#include "types.h"
#include "string_utils.h"

namespace mender {

const std::vector<ErrorPattern>& ErrorClassifier::nonRetryablePatterns() {
    static const std::vector<ErrorPattern> patterns = {
        {"invalid selector", ErrorKind::INVALID_SELECTOR},
        {"permission denied", ErrorKind::PERMISSION_DENIED},
        {"cancelled", ErrorKind::CANCELLED}
    };
    return patterns;
}

const std::vector<ErrorPattern>& ErrorClassifier::retryablePatterns() {
    static const std::vector<ErrorPattern> patterns = {
        {"not found", ErrorKind::TARGET_MISSING},
        {"timeout", ErrorKind::TIMEOUT},
        {"rate limit", ErrorKind::TRANSIENT_RATE_OR_STALE},
        {"stale", ErrorKind::TRANSIENT_RATE_OR_STALE}
    };
    return patterns;
}

ErrorKind ErrorClassifier::classify(const std::string& message) {
    if (message.empty()) {
        return ErrorKind::NONE;
    }

    std::string lower = utils::StringUtils::toLowerCase(message);
    for (const auto& pattern : nonRetryablePatterns()) {
        if (lower.find(pattern.fragment) != std::string::npos) {
            return pattern.kind;
        }
    }
    for (const auto& pattern : retryablePatterns()) {
        if (lower.find(pattern.fragment) != std::string::npos) {
            return pattern.kind;
        }
    }
    return ErrorKind::UNKNOWN;
}

bool ErrorClassifier::isRetryable(const std::string& message) {
    return isRetryableKind(classify(message));
}

bool ErrorClassifier::shouldRetry(const ActionResult& result) {
    if (result.success || result.error.empty()) {
        return false;
    }
    if (isTerminalTypedKind(result.errorKind)) {
        return false;
    }
    return isRetryable(result.error);
}

} // namespace mender
