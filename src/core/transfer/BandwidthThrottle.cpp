#include "BandwidthThrottle.hpp"
#include "../common/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace Ferry {

namespace {
constexpr qint64 kSleepSliceMs = 100;
}

qint64 bytesPerSecond(BandwidthPreset preset) {
    switch (preset) {
        case BandwidthPreset::Limit256K: return 256 * 1024;
        case BandwidthPreset::Limit512K: return 512 * 1024;
        case BandwidthPreset::Limit1M: return 1024 * 1024;
        case BandwidthPreset::Limit5M: return 5 * 1024 * 1024;
        case BandwidthPreset::Limit10M: return 10 * 1024 * 1024;
        case BandwidthPreset::Unlimited: return 0;
    }
    return 0;
}

QString toString(BandwidthPreset preset) {
    switch (preset) {
        case BandwidthPreset::Limit256K: return QStringLiteral("256 KB/s");
        case BandwidthPreset::Limit512K: return QStringLiteral("512 KB/s");
        case BandwidthPreset::Limit1M: return QStringLiteral("1 MB/s");
        case BandwidthPreset::Limit5M: return QStringLiteral("5 MB/s");
        case BandwidthPreset::Limit10M: return QStringLiteral("10 MB/s");
        case BandwidthPreset::Unlimited: return QStringLiteral("Unlimited");
    }
    return QStringLiteral("Unlimited");
}

BandwidthThrottle::BandwidthThrottle(qint64 bytesPerSecond, qint64 burstSize, std::shared_ptr<Clock> clock)
    : clock_(clock ? std::move(clock) : Clock::system())
    , bytesPerSecond_(std::max<qint64>(0, bytesPerSecond))
    , configuredBurst_(std::max<qint64>(0, burstSize))
    , tokens_(0.0)
    , lastRefillMs_(0) {
    tokens_ = static_cast<double>(effectiveBurstLocked());
    lastRefillMs_ = clock_->nowMs();
}

Expected<std::chrono::milliseconds, ThrottleError> BandwidthThrottle::consume(qint64 bytes,
                                                                              const CancellationToken* token) {
    QMutexLocker locker(&mutex_);

    if (!waitWhilePausedLocked(token)) {
        return makeUnexpected(ThrottleError::Cancelled);
    }

    if (bytes <= 0) {
        return std::chrono::milliseconds(0);
    }

    totalBytesConsumed_ += bytes;
    if (bytesPerSecond_ <= 0) {
        return std::chrono::milliseconds(0);
    }

    refillLocked();
    tokens_ -= static_cast<double>(bytes);
    if (tokens_ >= 0.0) {
        return std::chrono::milliseconds(0);
    }

    const qint64 waitMs = static_cast<qint64>(std::ceil(-tokens_ * 1000.0 / static_cast<double>(bytesPerSecond_)));
    ++throttledCalls_;
    totalWaitMs_ += waitMs;
    locker.unlock();

    qint64 slept = 0;
    while (slept < waitMs) {
        if (token && token->stopRequested()) {
            return makeUnexpected(ThrottleError::Cancelled);
        }
        {
            // Paused time does not pay off the debt
            QMutexLocker pauseLocker(&mutex_);
            if (!waitWhilePausedLocked(token)) {
                return makeUnexpected(ThrottleError::Cancelled);
            }
        }
        const qint64 slice = std::min(kSleepSliceMs, waitMs - slept);
        clock_->sleepFor(slice);
        slept += slice;
    }

    return std::chrono::milliseconds(waitMs);
}

void BandwidthThrottle::setRate(qint64 bytesPerSecond) {
    QMutexLocker locker(&mutex_);
    const bool wasUnlimited = bytesPerSecond_ <= 0;
    refillLocked();
    bytesPerSecond_ = std::max<qint64>(0, bytesPerSecond);
    if (wasUnlimited) {
        // Nothing accrued while unlimited; start the new limit with a full bucket
        tokens_ = static_cast<double>(effectiveBurstLocked());
        lastRefillMs_ = clock_->nowMs();
    } else {
        tokens_ = std::min(tokens_, static_cast<double>(effectiveBurstLocked()));
    }
    FERRY_INFO("BandwidthThrottle: rate set to {} B/s (burst {})", bytesPerSecond_, effectiveBurstLocked());
}

void BandwidthThrottle::setBurstSize(qint64 burstSize) {
    QMutexLocker locker(&mutex_);
    refillLocked();
    configuredBurst_ = std::max<qint64>(0, burstSize);
    tokens_ = std::min(tokens_, static_cast<double>(effectiveBurstLocked()));
}

void BandwidthThrottle::applyPreset(BandwidthPreset preset) {
    setRate(bytesPerSecond(preset));
}

void BandwidthThrottle::pause() {
    QMutexLocker locker(&mutex_);
    if (!paused_) {
        refillLocked();
        paused_ = true;
        FERRY_INFO("BandwidthThrottle: paused");
    }
}

void BandwidthThrottle::resume() {
    QMutexLocker locker(&mutex_);
    if (paused_) {
        paused_ = false;
        lastRefillMs_ = clock_->nowMs();
        resumed_.wakeAll();
        FERRY_INFO("BandwidthThrottle: resumed");
    }
}

qint64 BandwidthThrottle::rate() const {
    QMutexLocker locker(&mutex_);
    return bytesPerSecond_;
}

qint64 BandwidthThrottle::burstSize() const {
    QMutexLocker locker(&mutex_);
    return effectiveBurstLocked();
}

bool BandwidthThrottle::isPaused() const {
    QMutexLocker locker(&mutex_);
    return paused_;
}

bool BandwidthThrottle::isUnlimited() const {
    QMutexLocker locker(&mutex_);
    return bytesPerSecond_ <= 0;
}

ThrottleStats BandwidthThrottle::stats() const {
    QMutexLocker locker(&mutex_);
    ThrottleStats snapshot;
    snapshot.bytesPerSecond = bytesPerSecond_;
    snapshot.burstSize = effectiveBurstLocked();
    snapshot.totalBytesConsumed = totalBytesConsumed_;
    snapshot.totalWaitMs = totalWaitMs_;
    snapshot.throttledCalls = throttledCalls_;
    snapshot.paused = paused_;

    double available = tokens_;
    if (!paused_ && bytesPerSecond_ > 0) {
        const qint64 elapsed = std::max<qint64>(0, clock_->nowMs() - lastRefillMs_);
        available = std::min(static_cast<double>(snapshot.burstSize),
                             tokens_ + static_cast<double>(elapsed) * static_cast<double>(bytesPerSecond_) / 1000.0);
    }
    snapshot.availableTokens = available;
    return snapshot;
}

void BandwidthThrottle::resetStats() {
    QMutexLocker locker(&mutex_);
    totalBytesConsumed_ = 0;
    totalWaitMs_ = 0;
    throttledCalls_ = 0;
}

void BandwidthThrottle::refillLocked() {
    const qint64 now = clock_->nowMs();
    const qint64 elapsed = std::max<qint64>(0, now - lastRefillMs_);
    lastRefillMs_ = now;

    if (paused_ || bytesPerSecond_ <= 0) {
        return;
    }

    tokens_ += static_cast<double>(elapsed) * static_cast<double>(bytesPerSecond_) / 1000.0;
    tokens_ = std::min(tokens_, static_cast<double>(effectiveBurstLocked()));
}

bool BandwidthThrottle::waitWhilePausedLocked(const CancellationToken* token) {
    while (paused_) {
        if (token && token->stopRequested()) {
            return false;
        }
        resumed_.wait(&mutex_, static_cast<unsigned long>(kSleepSliceMs));
    }
    return true;
}

qint64 BandwidthThrottle::effectiveBurstLocked() const {
    if (configuredBurst_ > 0) {
        return configuredBurst_;
    }
    return bytesPerSecond_ * 2;
}

} // namespace Ferry
