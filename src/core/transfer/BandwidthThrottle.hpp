#pragma once

#include "CancellationToken.hpp"
#include "../common/Clock.hpp"
#include "../common/Expected.hpp"

#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QWaitCondition>
#include <chrono>
#include <memory>

namespace Ferry {

enum class ThrottleError {
    Cancelled
};

enum class BandwidthPreset {
    Limit256K,
    Limit512K,
    Limit1M,
    Limit5M,
    Limit10M,
    Unlimited
};

qint64 bytesPerSecond(BandwidthPreset preset);
QString toString(BandwidthPreset preset);

struct ThrottleStats {
    qint64 bytesPerSecond = 0;
    qint64 burstSize = 0;
    double availableTokens = 0.0;
    qint64 totalBytesConsumed = 0;
    qint64 totalWaitMs = 0;
    qint64 throttledCalls = 0;
    bool paused = false;
};

/**
 * @brief Token bucket shared by every running transfer.
 *
 * The bucket starts full and refills at bytesPerSecond up to burstSize.
 * consume(n) deducts n immediately; when that leaves the bucket in debt the
 * caller sleeps for debt / rate. A rate of 0 disables throttling. While
 * paused, consume() blocks until resume() or until the caller's token asks it
 * to stop.
 */
class BandwidthThrottle {
public:
    explicit BandwidthThrottle(qint64 bytesPerSecond = 0, qint64 burstSize = 0,
                               std::shared_ptr<Clock> clock = Clock::system());

    // Returns how long the caller was held back by the rate limit
    Expected<std::chrono::milliseconds, ThrottleError> consume(qint64 bytes,
                                                               const CancellationToken* token = nullptr);

    void setRate(qint64 bytesPerSecond);
    void setBurstSize(qint64 burstSize);   // 0 restores the default of twice the rate
    void applyPreset(BandwidthPreset preset);

    void pause();
    void resume();

    qint64 rate() const;
    qint64 burstSize() const;
    bool isPaused() const;
    bool isUnlimited() const;

    ThrottleStats stats() const;
    void resetStats();

private:
    void refillLocked();
    bool waitWhilePausedLocked(const CancellationToken* token);
    qint64 effectiveBurstLocked() const;

    std::shared_ptr<Clock> clock_;

    mutable QMutex mutex_;
    QWaitCondition resumed_;
    qint64 bytesPerSecond_;
    qint64 configuredBurst_;
    double tokens_;
    qint64 lastRefillMs_;
    bool paused_ = false;

    qint64 totalBytesConsumed_ = 0;
    qint64 totalWaitMs_ = 0;
    qint64 throttledCalls_ = 0;
};

} // namespace Ferry
