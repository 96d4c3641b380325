#ifndef MENDER_RETRY_POLICY_H
#define MENDER_RETRY_POLICY_H

#include <random>
#include <cstdint>
#include "../common/types.h"

namespace mender {

// Source of jitter factors, each uniform in [-1, 1].
class JitterSource {
public:
    virtual ~JitterSource() = default;
    virtual double next() = 0;
};

/**
 * @class RandomJitterSource
 * @brief Mersenne-twister backed jitter; the same seed gives the same sequence
 */
class RandomJitterSource : public JitterSource {
public:
    RandomJitterSource();
    explicit RandomJitterSource(uint32_t seed);

    double next() override;

private:
    std::mt19937 m_engine;
    std::uniform_real_distribution<double> m_distribution;
};

/**
 * @brief Scale a base delay by (1 + 0.25 * factor), floored at 0 and rounded
 * @param factor clamped to [-1, 1]
 */
int applyJitter(double baseMs, double factor);

/**
 * @brief Delay before the retry that follows @p attempt (1-based)
 *
 * immediate: 0; linear: backoffMs * attempt; exponential:
 * backoffMs * 2^(attempt-1) with +/-25% jitter drawn from @p jitter.
 */
int computeBackoff(int attempt, const RetryConfig& config, JitterSource& jitter);

// @throws MenderException (CONFIGURATION) if maxAttempts < 1 or backoffMs < 0
void validateRetryConfig(const RetryConfig& config);

} // namespace mender

#endif // MENDER_RETRY_POLICY_H
