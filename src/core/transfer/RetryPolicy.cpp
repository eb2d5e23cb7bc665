#include "RetryPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace qsde::core::transfer {

RetryPolicy::RetryPolicy(RetrySettings settings)
    : m_settings(settings) {
    m_settings.maxAttempts = std::max(1, m_settings.maxAttempts);
    m_settings.maxIntegrityAttempts = std::clamp(m_settings.maxIntegrityAttempts, 1, m_settings.maxAttempts);
    m_settings.multiplier = std::max(1.0, m_settings.multiplier);
    m_settings.jitterRatio = std::clamp(m_settings.jitterRatio, 0.0, m_settings.multiplier - 1.0);
    m_settings.initialDelay = std::max(std::chrono::milliseconds{0}, m_settings.initialDelay);
    m_settings.maxDelay = std::max(m_settings.initialDelay, m_settings.maxDelay);
}

RetryDecision RetryPolicy::decide(ErrorClass errorClass, int attempt) const {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    return decide(errorClass, attempt, unit(engine));
}

RetryDecision RetryPolicy::decide(ErrorClass errorClass, int attempt, double jitterSample) const {
    if (!isRetryable(errorClass)) {
        return RetryDecision::giveUp();
    }
    if (attempt >= capFor(errorClass)) {
        return RetryDecision::giveUp();
    }
    return RetryDecision::retryAfter(backoffFor(attempt, jitterSample));
}

std::chrono::milliseconds RetryPolicy::backoffFor(int attempt, double jitterSample) const {
    const double sample = std::clamp(jitterSample, 0.0, 1.0);
    const double exponent = static_cast<double>(std::max(1, attempt) - 1);
    const double base = static_cast<double>(m_settings.initialDelay.count()) *
                        std::pow(m_settings.multiplier, exponent);
    const double withJitter = base * (1.0 + m_settings.jitterRatio * sample);
    const double capped = std::min(withJitter, static_cast<double>(m_settings.maxDelay.count()));
    return std::chrono::milliseconds{static_cast<long long>(std::llround(capped))};
}

bool RetryPolicy::isRetryable(ErrorClass errorClass) {
    switch (errorClass) {
        case ErrorClass::Transient:
        case ErrorClass::IntegrityMismatch:
            return true;
        case ErrorClass::PermanentRemote:
        case ErrorClass::LocalResource:
            return false;
    }
    return false;
}

int RetryPolicy::capFor(ErrorClass errorClass) const {
    return errorClass == ErrorClass::IntegrityMismatch
        ? m_settings.maxIntegrityAttempts
        : m_settings.maxAttempts;
}

} // namespace qsde::core::transfer
