#pragma once

#include <chrono>
#include <functional>

namespace Ferry {

enum class RetryPolicy {
    None,           // Retry immediately
    Linear,         // Fixed delay between retries
    Exponential     // initialDelay * multiplier^retryCount
};

struct RetryConfig {
    RetryPolicy policy = RetryPolicy::Exponential;
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{300000};
    double backoffMultiplier = 2.0;
    double jitterFactor = 0.1;
    bool enableJitter = false;

    // Overrides the policy when set
    std::function<std::chrono::milliseconds(int retryCount)> calculateDelay = nullptr;
};

/**
 * @brief Computes the wait before the next attempt of a failed operation.
 *
 * retryCount is the number of failures so far. With the exponential policy the
 * delay is initialDelay * backoffMultiplier^retryCount, capped at maxDelay.
 * Jitter, when enabled, is applied before the cap.
 */
class RetryBackoff {
public:
    RetryBackoff() = default;
    explicit RetryBackoff(const RetryConfig& config);

    void setConfig(const RetryConfig& config);
    const RetryConfig& config() const { return config_; }

    std::chrono::milliseconds delayForRetry(int retryCount) const;

private:
    RetryConfig config_;
};

namespace RetryConfigs {
    inline RetryConfig transfer() {
        RetryConfig config;
        config.policy = RetryPolicy::Exponential;
        config.initialDelay = std::chrono::milliseconds(1000);
        config.maxDelay = std::chrono::milliseconds(300000); // 5 minutes
        config.backoffMultiplier = 2.0;
        config.enableJitter = false;
        return config;
    }
}

} // namespace Ferry
