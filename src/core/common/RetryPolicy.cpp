#include "RetryPolicy.hpp"
#include <QtCore/QRandomGenerator>
#include <algorithm>
#include <cmath>

namespace Ferry {

RetryBackoff::RetryBackoff(const RetryConfig& config)
    : config_(config) {
}

void RetryBackoff::setConfig(const RetryConfig& config) {
    config_ = config;
}

std::chrono::milliseconds RetryBackoff::delayForRetry(int retryCount) const {
    const int count = std::max(0, retryCount);
    double delayMs = 0.0;

    if (config_.calculateDelay) {
        delayMs = static_cast<double>(config_.calculateDelay(count).count());
    } else {
        switch (config_.policy) {
            case RetryPolicy::None:
                delayMs = 0.0;
                break;

            case RetryPolicy::Linear:
                delayMs = static_cast<double>(config_.initialDelay.count());
                break;

            case RetryPolicy::Exponential:
                // pow() overflows to inf for large counts; the cap below handles it
                delayMs = static_cast<double>(config_.initialDelay.count()) *
                          std::pow(config_.backoffMultiplier, count);
                break;
        }
    }

    if (config_.enableJitter && config_.jitterFactor > 0.0) {
        double jitterRange = delayMs * config_.jitterFactor;
        double jitter = (QRandomGenerator::global()->generateDouble() - 0.5) * 2.0 * jitterRange;
        delayMs = std::max(0.0, delayMs + jitter);
    }

    const double maxMs = static_cast<double>(config_.maxDelay.count());
    if (!std::isfinite(delayMs) || delayMs > maxMs) {
        delayMs = maxMs;
    }

    return std::chrono::milliseconds(static_cast<long long>(delayMs));
}

} // namespace Ferry
