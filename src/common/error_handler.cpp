#include "error_handler.h"
#include "structured_logger.h"

namespace mender {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::TARGET_MISSING: return "TARGET_MISSING";
        case ErrorKind::TIMEOUT: return "TIMEOUT";
        case ErrorKind::INVALID_SELECTOR: return "INVALID_SELECTOR";
        case ErrorKind::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case ErrorKind::CANCELLED: return "CANCELLED";
        case ErrorKind::TRANSIENT_RATE_OR_STALE: return "TRANSIENT_RATE_OR_STALE";
        case ErrorKind::NEEDS_RESOLUTION: return "NEEDS_RESOLUTION";
        case ErrorKind::HEALING_EXHAUSTED: return "HEALING_EXHAUSTED";
        case ErrorKind::UNSUPPORTED_ACTION_KIND: return "UNSUPPORTED_ACTION_KIND";
        case ErrorKind::CONTRACT_VIOLATION: return "CONTRACT_VIOLATION";
        case ErrorKind::CONFIGURATION: return "CONFIGURATION";
        case ErrorKind::AGENT_FAILURE: return "AGENT_FAILURE";
        case ErrorKind::UNKNOWN: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

bool isRetryableKind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TARGET_MISSING:
        case ErrorKind::TIMEOUT:
        case ErrorKind::TRANSIENT_RATE_OR_STALE:
            return true;
        default:
            return false;
    }
}

bool isTerminalTypedKind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NEEDS_RESOLUTION:
        case ErrorKind::HEALING_EXHAUSTED:
        case ErrorKind::UNSUPPORTED_ACTION_KIND:
        case ErrorKind::CONTRACT_VIOLATION:
        case ErrorKind::CONFIGURATION:
            return true;
        default:
            return false;
    }
}

void reportError(const ErrorInfo& error) {
    std::string text = "[" + errorKindToString(error.kind) + "] " + error.message;
    if (!error.details.empty()) {
        text += " - Details: " + error.details;
    }
    SLOG_ERROR().message(text)
        .context("error_kind", errorKindToString(error.kind))
        .context("context", error.context);
}

} // namespace mender
