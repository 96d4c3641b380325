#ifndef MENDER_ERROR_HANDLER_H
#define MENDER_ERROR_HANDLER_H

#include <string>
#include <exception>
#include <chrono>

namespace mender {

enum class ErrorKind {
    NONE,
    TARGET_MISSING,            // selector matched nothing
    TIMEOUT,                   // wait/condition exceeded its deadline
    INVALID_SELECTOR,
    PERMISSION_DENIED,
    CANCELLED,
    TRANSIENT_RATE_OR_STALE,   // rate limiting, stale element handles
    NEEDS_RESOLUTION,          // semantic target handed to the dispatcher
    HEALING_EXHAUSTED,
    UNSUPPORTED_ACTION_KIND,
    CONTRACT_VIOLATION,
    CONFIGURATION,
    AGENT_FAILURE,
    UNKNOWN
};

struct ErrorInfo {
    ErrorKind kind;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorKind k, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "")
        : kind(k), message(msg), details(det), context(ctx),
          timestamp(std::chrono::system_clock::now()) {}
};

class MenderException : public std::exception {
public:
    explicit MenderException(const ErrorInfo& error) : m_errorInfo(error) {}

    const char* what() const noexcept override {
        return m_errorInfo.message.c_str();
    }

    const ErrorInfo& getErrorInfo() const { return m_errorInfo; }
    ErrorKind kind() const { return m_errorInfo.kind; }

private:
    ErrorInfo m_errorInfo;
};

std::string errorKindToString(ErrorKind kind);

/**
 * @brief Whether failures of this kind are transient and may be retried
 *
 * Only TARGET_MISSING, TIMEOUT and TRANSIENT_RATE_OR_STALE are retryable.
 */
bool isRetryableKind(ErrorKind kind);

/**
 * @brief Whether the kind was assigned by the engine itself (not derived from
 * an agent message) and must never be retried
 */
bool isTerminalTypedKind(ErrorKind kind);

// Logs a terminal failure at ERROR level with its kind, details and context.
void reportError(const ErrorInfo& error);

} // namespace mender

#define MENDER_THROW(kind, message, details, context) \
    throw ::mender::MenderException(::mender::ErrorInfo(kind, message, details, context))

#endif // MENDER_ERROR_HANDLER_H
