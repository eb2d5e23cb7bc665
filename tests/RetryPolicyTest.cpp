#include <gtest/gtest.h>

#include "core/transfer/RetryPolicy.hpp"

#include <random>

using namespace qsde::core::transfer;
using std::chrono::milliseconds;

namespace {

RetrySettings defaults() {
    RetrySettings settings;
    settings.maxAttempts = 5;
    settings.maxIntegrityAttempts = 2;
    settings.initialDelay = milliseconds(1000);
    settings.multiplier = 2.0;
    settings.jitterRatio = 0.25;
    settings.maxDelay = milliseconds(30000);
    return settings;
}

} // namespace

TEST(RetryPolicyTest, TransientFailuresBackOffExponentially) {
    RetryPolicy policy(defaults());

    EXPECT_EQ(*policy.decide(ErrorClass::Transient, 1, 0.0).delay, milliseconds(1000));
    EXPECT_EQ(*policy.decide(ErrorClass::Transient, 2, 0.0).delay, milliseconds(2000));
    EXPECT_EQ(*policy.decide(ErrorClass::Transient, 3, 0.0).delay, milliseconds(4000));
    EXPECT_EQ(*policy.decide(ErrorClass::Transient, 4, 0.0).delay, milliseconds(8000));
}

TEST(RetryPolicyTest, GivesUpAtAttemptCap) {
    RetryPolicy policy(defaults());
    EXPECT_TRUE(policy.decide(ErrorClass::Transient, 4).shouldRetry());
    EXPECT_FALSE(policy.decide(ErrorClass::Transient, 5).shouldRetry());
    EXPECT_FALSE(policy.decide(ErrorClass::Transient, 9).shouldRetry());
}

TEST(RetryPolicyTest, PermanentAndLocalFailuresNeverRetry) {
    RetryPolicy policy(defaults());
    EXPECT_FALSE(policy.decide(ErrorClass::PermanentRemote, 1).shouldRetry());
    EXPECT_FALSE(policy.decide(ErrorClass::LocalResource, 1).shouldRetry());
    EXPECT_FALSE(RetryPolicy::isRetryable(ErrorClass::PermanentRemote));
    EXPECT_FALSE(RetryPolicy::isRetryable(ErrorClass::LocalResource));
    EXPECT_TRUE(RetryPolicy::isRetryable(ErrorClass::Transient));
    EXPECT_TRUE(RetryPolicy::isRetryable(ErrorClass::IntegrityMismatch));
}

TEST(RetryPolicyTest, IntegrityMismatchHasItsOwnCap) {
    RetryPolicy policy(defaults());
    EXPECT_TRUE(policy.decide(ErrorClass::IntegrityMismatch, 1).shouldRetry());
    EXPECT_FALSE(policy.decide(ErrorClass::IntegrityMismatch, 2).shouldRetry());
}

TEST(RetryPolicyTest, IntegrityCapNeverExceedsAttemptCap) {
    RetrySettings settings = defaults();
    settings.maxAttempts = 2;
    settings.maxIntegrityAttempts = 10;
    RetryPolicy policy(settings);

    EXPECT_EQ(policy.settings().maxIntegrityAttempts, 2);
    EXPECT_FALSE(policy.decide(ErrorClass::IntegrityMismatch, 2).shouldRetry());
}

TEST(RetryPolicyTest, DelayIsCappedAtMaximum) {
    RetrySettings settings = defaults();
    settings.maxAttempts = 20;
    RetryPolicy policy(settings);

    EXPECT_EQ(policy.backoffFor(10, 0.0), milliseconds(30000));
    EXPECT_EQ(policy.backoffFor(15, 0.99), milliseconds(30000));
}

TEST(RetryPolicyTest, JitterStaysWithinRatio) {
    RetryPolicy policy(defaults());
    for (double sample : {0.0, 0.1, 0.5, 0.9, 0.999}) {
        const auto delay = policy.backoffFor(2, sample);
        EXPECT_GE(delay, milliseconds(2000));
        EXPECT_LE(delay, milliseconds(2500));
    }
}

TEST(RetryPolicyTest, JitterRatioClampedSoDelaysNeverShrink) {
    RetrySettings settings = defaults();
    settings.multiplier = 1.5;
    settings.jitterRatio = 2.0;
    RetryPolicy policy(settings);

    EXPECT_DOUBLE_EQ(policy.settings().jitterRatio, 0.5);
    // Worst case: maximum jitter followed by none
    EXPECT_LE(policy.backoffFor(1, 1.0), policy.backoffFor(2, 0.0));
}

TEST(RetryPolicyTest, BackoffIsMonotonicUnderRandomJitter) {
    RetrySettings settings = defaults();
    settings.maxAttempts = 12;
    RetryPolicy policy(settings);

    std::mt19937 engine(42);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    for (int run = 0; run < 200; ++run) {
        milliseconds previous{0};
        for (int attempt = 1; attempt < settings.maxAttempts; ++attempt) {
            auto decision = policy.decide(ErrorClass::Transient, attempt, unit(engine));
            ASSERT_TRUE(decision.shouldRetry());
            EXPECT_GE(*decision.delay, previous) << "attempt " << attempt;
            previous = *decision.delay;
        }
    }
}

TEST(RetryPolicyTest, ContextResetClearsBookkeeping) {
    RetryContext context;
    context.attempt = 3;
    context.integrityFailures = 1;
    context.totalBackoff = milliseconds(500);
    context.lastDelay = milliseconds(250);
    context.lastError = ErrorClass::Transient;

    context.reset();
    EXPECT_EQ(context.attempt, 0);
    EXPECT_EQ(context.integrityFailures, 0);
    EXPECT_EQ(context.totalBackoff, milliseconds(0));
    EXPECT_FALSE(context.lastError.has_value());
}
