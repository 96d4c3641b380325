#include "retry_policy.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace mender {

RandomJitterSource::RandomJitterSource()
    : m_engine(std::random_device{}())
    , m_distribution(-1.0, 1.0) {
}

RandomJitterSource::RandomJitterSource(uint32_t seed)
    : m_engine(seed)
    , m_distribution(-1.0, 1.0) {
}

double RandomJitterSource::next() {
    return m_distribution(m_engine);
}

namespace {

// Rounds and clamps to [0, INT_MAX] before narrowing.
int toDelayMs(double delay) {
    const double ceiling = static_cast<double>(std::numeric_limits<int>::max());
    return static_cast<int>(std::clamp(std::round(delay), 0.0, ceiling));
}

} // anonymous namespace

int applyJitter(double baseMs, double factor) {
    factor = std::clamp(factor, -1.0, 1.0);
    return toDelayMs(baseMs + baseMs * 0.25 * factor);
}

int computeBackoff(int attempt, const RetryConfig& config, JitterSource& jitter) {
    switch (config.strategy) {
        case BackoffStrategy::IMMEDIATE:
            return 0;

        case BackoffStrategy::LINEAR:
            return toDelayMs(static_cast<double>(config.backoffMs) * attempt);

        case BackoffStrategy::EXPONENTIAL: {
            double base = static_cast<double>(config.backoffMs) * std::pow(2.0, attempt - 1);
            return applyJitter(base, jitter.next());
        }
    }
    return config.backoffMs;
}

void validateRetryConfig(const RetryConfig& config) {
    if (config.maxAttempts < 1) {
        MENDER_THROW(ErrorKind::CONFIGURATION, "RetryConfig.maxAttempts must be at least 1",
                     "maxAttempts=" + std::to_string(config.maxAttempts), "validateRetryConfig");
    }
    if (config.backoffMs < 0) {
        MENDER_THROW(ErrorKind::CONFIGURATION, "RetryConfig.backoffMs must not be negative",
                     "backoffMs=" + std::to_string(config.backoffMs), "validateRetryConfig");
    }
}

} // namespace mender
