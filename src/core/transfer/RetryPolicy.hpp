#pragma once

/**
 * RetryPolicy.hpp
 *
 * Retry decisions for failed transfer attempts.
 */

#include "DownloadTask.hpp"

#include <chrono>
#include <optional>

namespace qsde::core::transfer {

/**
 * Retry tuning
 */
struct RetrySettings {
    // Total attempts allowed per task, first one included
    int maxAttempts{3};

    // Attempts allowed when the digest keeps mismatching, first one included
    int maxIntegrityAttempts{2};

    std::chrono::milliseconds initialDelay{1000};
    double multiplier{2.0};

    // Upper bound of the random extra delay, as a fraction of the base delay.
    // Clamped to multiplier - 1 so delays never shrink between attempts.
    double jitterRatio{0.25};

    std::chrono::milliseconds maxDelay{30000};
};

/**
 * Result of a retry decision. Holds a delay when a retry is granted.
 */
struct RetryDecision {
    std::optional<std::chrono::milliseconds> delay;

    bool shouldRetry() const { return delay.has_value(); }

    static RetryDecision retryAfter(std::chrono::milliseconds d) { return RetryDecision{d}; }
    static RetryDecision giveUp() { return RetryDecision{}; }
};

/**
 * Per-task retry bookkeeping, owned by the worker running the task
 */
struct RetryContext {
    int attempt{0};              // attempts started so far
    int integrityFailures{0};
    std::chrono::milliseconds totalBackoff{0};
    std::chrono::milliseconds lastDelay{0};
    std::optional<ErrorClass> lastError;

    void reset() { *this = RetryContext{}; }
};

/**
 * RetryPolicy - stateless decision function
 *
 * delay(n) = min(maxDelay, initialDelay * multiplier^(n-1) * (1 + jitter)),
 * jitter drawn uniformly from [0, jitterRatio).
 */
class RetryPolicy {
public:
    explicit RetryPolicy(RetrySettings settings = {});

    /**
     * Decide what to do after a failed attempt
     * @param errorClass Classification of the failure
     * @param attempt Number of attempts counted against the class cap:
     *        attempts made so far, or integrity failures so far for
     *        IntegrityMismatch
     * @return Retry with delay, or give up
     */
    RetryDecision decide(ErrorClass errorClass, int attempt) const;

    /**
     * Same decision with an explicit jitter sample in [0, 1)
     */
    RetryDecision decide(ErrorClass errorClass, int attempt, double jitterSample) const;

    /**
     * Backoff before the retry that follows attempt number `attempt`
     * @param jitterSample Uniform sample in [0, 1)
     */
    std::chrono::milliseconds backoffFor(int attempt, double jitterSample) const;

    static bool isRetryable(ErrorClass errorClass);

    const RetrySettings& settings() const { return m_settings; }

private:
    int capFor(ErrorClass errorClass) const;

    RetrySettings m_settings;
};

} // namespace qsde::core::transfer
