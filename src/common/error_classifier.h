#ifndef MENDER_ERROR_CLASSIFIER_H
#define MENDER_ERROR_CLASSIFIER_H

#include <string>
#include <vector>
#include "error_handler.h"

namespace mender {

struct ActionResult;

// One row of the message-to-kind translation table.
struct ErrorPattern {
    std::string fragment;   // lowercase substring
    ErrorKind kind;
};

/**
 * @class ErrorClassifier
 * @brief Maps free-form failure messages to an ErrorKind
 *
 * Matching is a case-insensitive substring test. Non-retryable fragments are
 * checked first, so "invalid selector (timeout)" is INVALID_SELECTOR and is
 * never retried.
 */
class ErrorClassifier {
public:
    static ErrorKind classify(const std::string& message);
    static bool isRetryable(const std::string& message);

    /**
     * @brief Retry decision for a failed result
     *
     * Successful results and failures without a message are never retried.
     * Kinds assigned by the engine itself (NEEDS_RESOLUTION, CONTRACT_VIOLATION,
     * ...) are terminal; everything else is decided from the message.
     */
    static bool shouldRetry(const ActionResult& result);

    static const std::vector<ErrorPattern>& nonRetryablePatterns();
    static const std::vector<ErrorPattern>& retryablePatterns();
};

} // namespace mender

#endif // MENDER_ERROR_CLASSIFIER_H
