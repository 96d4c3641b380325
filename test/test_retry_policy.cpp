#include <iostream>
#include <cmath>
#include <climits>
#include <vector>
#include "executor/retry_policy.h"
#include "common/error_classifier.h"
#include "test_support.h"
#include "test_fakes.h"

using namespace mender;
using mender::test::FixedJitterSource;

void testClassification() {
    std::cout << "[TEST] Error Classification\n";

    MENDER_CHECK(ErrorClassifier::classify("") == ErrorKind::NONE);
    MENDER_CHECK(ErrorClassifier::classify("Element not found: #go") == ErrorKind::TARGET_MISSING);
    MENDER_CHECK(ErrorClassifier::classify("Timeout waiting for selector") == ErrorKind::TIMEOUT);
    MENDER_CHECK(ErrorClassifier::classify("429: Rate Limit exceeded") == ErrorKind::TRANSIENT_RATE_OR_STALE);
    MENDER_CHECK(ErrorClassifier::classify("stale element reference") == ErrorKind::TRANSIENT_RATE_OR_STALE);
    MENDER_CHECK(ErrorClassifier::classify("Invalid selector: ##") == ErrorKind::INVALID_SELECTOR);
    MENDER_CHECK(ErrorClassifier::classify("Permission denied by page") == ErrorKind::PERMISSION_DENIED);
    MENDER_CHECK(ErrorClassifier::classify("Operation cancelled") == ErrorKind::CANCELLED);
    MENDER_CHECK(ErrorClassifier::classify("Something odd happened") == ErrorKind::UNKNOWN);

    // Non-retryable vocabulary wins over retryable vocabulary in the same message.
    MENDER_CHECK(ErrorClassifier::classify("invalid selector (timeout after 100ms)") == ErrorKind::INVALID_SELECTOR);
    MENDER_CHECK(!ErrorClassifier::isRetryable("invalid selector (timeout after 100ms)"));
    MENDER_CHECK(!ErrorClassifier::isRetryable("Request cancelled: element not found"));
    MENDER_CHECK(ErrorClassifier::isRetryable("TIMEOUT"));
    MENDER_CHECK(!ErrorClassifier::isRetryable("Something odd happened"));

    std::cout << "[OK] Error classification test passed\n\n";
}

void testRetryDecision() {
    std::cout << "[TEST] Retry Decision\n";

    MENDER_CHECK(!ErrorClassifier::shouldRetry(ActionResult::ok(5)));
    MENDER_CHECK(!ErrorClassifier::shouldRetry(ActionResult::failure("", ErrorKind::UNKNOWN, 5)));
    MENDER_CHECK(ErrorClassifier::shouldRetry(ActionResult::failure("timeout", ErrorKind::TIMEOUT, 5)));
    MENDER_CHECK(ErrorClassifier::shouldRetry(ActionResult::failure("Agent call failed: stale", ErrorKind::AGENT_FAILURE, 5)));

    // Kinds assigned by the engine are terminal whatever the message says.
    MENDER_CHECK(!ErrorClassifier::shouldRetry(ActionResult::failure("not found", ErrorKind::NEEDS_RESOLUTION, 0)));
    MENDER_CHECK(!ErrorClassifier::shouldRetry(ActionResult::failure("Element not found after healing", ErrorKind::HEALING_EXHAUSTED, 0)));
    MENDER_CHECK(!ErrorClassifier::shouldRetry(ActionResult::failure("timeout", ErrorKind::CONTRACT_VIOLATION, 0)));

    std::cout << "[OK] Retry decision test passed\n\n";
}

void testBackoffStrategies() {
    std::cout << "[TEST] Backoff Strategies\n";

    FixedJitterSource noJitter(0.0);
    RetryConfig config;
    config.backoffMs = 500;

    config.strategy = BackoffStrategy::IMMEDIATE;
    MENDER_CHECK(computeBackoff(1, config, noJitter) == 0);
    MENDER_CHECK(computeBackoff(4, config, noJitter) == 0);

    config.strategy = BackoffStrategy::LINEAR;
    MENDER_CHECK(computeBackoff(1, config, noJitter) == 500);
    MENDER_CHECK(computeBackoff(3, config, noJitter) == 1500);

    config.strategy = BackoffStrategy::EXPONENTIAL;
    MENDER_CHECK(computeBackoff(1, config, noJitter) == 500);
    MENDER_CHECK(computeBackoff(2, config, noJitter) == 1000);
    MENDER_CHECK(computeBackoff(4, config, noJitter) == 4000);

    FixedJitterSource high(1.0);
    FixedJitterSource low(-1.0);
    MENDER_CHECK(computeBackoff(2, config, high) == 1250);
    MENDER_CHECK(computeBackoff(2, config, low) == 750);

    MENDER_CHECK(applyJitter(0.0, -1.0) == 0);
    MENDER_CHECK(applyJitter(100.0, 7.0) == 125);
    MENDER_CHECK(applyJitter(100.0, -7.0) == 75);

    std::cout << "[OK] Backoff strategies test passed\n\n";
}

void testExponentialJitterBounds() {
    std::cout << "[TEST] Exponential Jitter Bounds\n";

    RandomJitterSource jitter;
    RetryConfig config;
    config.backoffMs = 300;
    config.strategy = BackoffStrategy::EXPONENTIAL;

    for (int attempt = 1; attempt <= 6; ++attempt) {
        double base = config.backoffMs * std::pow(2.0, attempt - 1);
        for (int i = 0; i < 200; ++i) {
            int delay = computeBackoff(attempt, config, jitter);
            MENDER_CHECK(delay >= 0);
            MENDER_CHECK(delay >= std::floor(base * 0.75));
            MENDER_CHECK(delay <= std::ceil(base * 1.25));
        }
    }

    std::cout << "[OK] Exponential jitter bounds test passed\n\n";
}

void testSeededJitterIsDeterministic() {
    std::cout << "[TEST] Seeded Jitter Determinism\n";

    RandomJitterSource first(42);
    RandomJitterSource second(42);
    RetryConfig config;

    for (int attempt = 1; attempt <= 5; ++attempt) {
        double a = first.next();
        double b = second.next();
        MENDER_CHECK(a == b);
        MENDER_CHECK(a >= -1.0 && a <= 1.0);
    }

    RandomJitterSource third(7);
    RandomJitterSource fourth(7);
    for (int attempt = 1; attempt <= 5; ++attempt) {
        MENDER_CHECK(computeBackoff(attempt, config, third) == computeBackoff(attempt, config, fourth));
    }

    std::cout << "[OK] Seeded jitter determinism test passed\n\n";
}

void testLateAttemptsStayBounded() {
    std::cout << "[TEST] Late Attempts Stay Bounded\n";

    FixedJitterSource noJitter(0.0);
    FixedJitterSource high(1.0);
    RetryConfig config;
    config.maxAttempts = 40;
    config.backoffMs = 500;
    config.strategy = BackoffStrategy::EXPONENTIAL;

    // 500 * 2^22 still fits; from attempt 24 on the delay saturates.
    MENDER_CHECK(computeBackoff(23, config, noJitter) == 500 * (1 << 22));
    for (int attempt : {24, 30, 35, 64, 2000}) {
        MENDER_CHECK(computeBackoff(attempt, config, noJitter) == INT_MAX);
        MENDER_CHECK(computeBackoff(attempt, config, high) == INT_MAX);
    }

    RetryConfig linear;
    linear.backoffMs = INT_MAX / 2;
    linear.strategy = BackoffStrategy::LINEAR;
    MENDER_CHECK(computeBackoff(1, linear, noJitter) == INT_MAX / 2);
    MENDER_CHECK(computeBackoff(3, linear, noJitter) == INT_MAX);

    MENDER_CHECK(applyJitter(1e12, -1.0) == INT_MAX);

    std::cout << "[OK] Late attempts bounded test passed\n\n";
}

void testConfigValidation() {
    std::cout << "[TEST] Retry Config Validation\n";

    RetryConfig valid;
    validateRetryConfig(valid);

    RetryConfig zeroAttempts;
    zeroAttempts.maxAttempts = 0;
    MENDER_CHECK_THROWS_KIND(validateRetryConfig(zeroAttempts), ErrorKind::CONFIGURATION);

    RetryConfig negativeBackoff;
    negativeBackoff.backoffMs = -1;
    MENDER_CHECK_THROWS_KIND(validateRetryConfig(negativeBackoff), ErrorKind::CONFIGURATION);

    MENDER_CHECK(parseBackoffStrategy("Linear") == BackoffStrategy::LINEAR);
    MENDER_CHECK(!parseBackoffStrategy("fibonacci"));

    std::cout << "[OK] Retry config validation test passed\n\n";
}

int main() {
    std::cout << "=== Mender Retry Policy Test Suite ===\n\n";

    try {
        testClassification();
        testRetryDecision();
        testBackoffStrategies();
        testExponentialJitterBounds();
        testSeededJitterIsDeterministic();
        testLateAttemptsStayBounded();
        testConfigValidation();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
