#include "RateLimiter.hpp"
#include "../common/Logger.hpp"
#include <algorithm>

namespace Ferry {

namespace {
// Upper bound on a single blocking wait so cancellation is noticed promptly
constexpr qint64 kPollIntervalMs = 50;
}

RateLimiter::Permit::Permit(Permit&& other) noexcept
    : limiter_(std::exchange(other.limiter_, nullptr)) {
}

RateLimiter::Permit& RateLimiter::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        limiter_ = std::exchange(other.limiter_, nullptr);
    }
    return *this;
}

RateLimiter::Permit::~Permit() {
    release();
}

void RateLimiter::Permit::release() {
    if (!limiter_) {
        return;
    }
    auto result = std::exchange(limiter_, nullptr)->release();
    if (result.hasError()) {
        FERRY_ERROR("RateLimiter: scoped permit released into an empty pool");
    }
}

RateLimiter::RateLimiter(int maxConcurrent, qint64 minDelayMs, std::shared_ptr<Clock> clock, QObject* parent)
    : QObject(parent)
    , clock_(clock ? std::move(clock) : Clock::system())
    , maxConcurrent_(std::max(1, maxConcurrent))
    , minDelayMs_(std::max<qint64>(0, minDelayMs)) {
    stats_.maxConcurrent = maxConcurrent_;
    stats_.minDelayMs = minDelayMs_;
    FERRY_DEBUG("RateLimiter created: {} permits, {} ms min delay", maxConcurrent_, minDelayMs_);
}

RateLimiter::~RateLimiter() {
    QMutexLocker locker(&mutex_);
    if (!queue_.empty() || active_ > 0) {
        FERRY_WARN("RateLimiter destroyed with {} active permits and {} waiters",
                   active_, queue_.size());
    }
}

Expected<void, RateLimiterError> RateLimiter::acquire(const CancellationToken* token) {
    Waiter self;
    bool delayed = false;

    QMutexLocker locker(&mutex_);
    queue_.push_back(&self);

    const bool mustWait = queue_.front() != &self || active_ >= maxConcurrent_;
    if (mustWait) {
        ++stats_.queuedWaits;
        const int depth = static_cast<int>(queue_.size());
        FERRY_DEBUG("RateLimiter: waiting for permit, queue depth {}", depth);
        locker.unlock();
        emit queueDepthChanged(depth);
        locker.relock();
    }

    while (true) {
        if (token && token->stopRequested()) {
            removeWaiterLocked(&self);
            wakeHeadLocked();
            const int depth = static_cast<int>(queue_.size());
            locker.unlock();
            emit queueDepthChanged(depth);
            return makeUnexpected(RateLimiterError::Cancelled);
        }

        if (queue_.front() == &self && active_ < maxConcurrent_) {
            if (minDelayMs_ > 0 && lastAcquireMs_ >= 0) {
                const qint64 remaining = lastAcquireMs_ + minDelayMs_ - clock_->nowMs();
                if (remaining > 0) {
                    if (!delayed) {
                        delayed = true;
                        ++stats_.delayedAcquires;
                    }
                    // Stay at the head while sleeping; later callers keep queueing behind
                    locker.unlock();
                    clock_->sleepFor(std::min(remaining, kPollIntervalMs));
                    locker.relock();
                    continue;
                }
            }

            queue_.pop_front();
            ++active_;
            ++stats_.acquires;
            lastAcquireMs_ = clock_->nowMs();
            wakeHeadLocked();

            if (mustWait) {
                const int depth = static_cast<int>(queue_.size());
                locker.unlock();
                emit queueDepthChanged(depth);
            }
            return {};
        }

        self.wakeup.wait(&mutex_, static_cast<unsigned long>(kPollIntervalMs));
    }
}

Expected<void, RateLimiterError> RateLimiter::release() {
    QMutexLocker locker(&mutex_);

    if (active_ <= 0) {
        ++stats_.unmatchedReleases;
        locker.unlock();
        FERRY_ERROR("RateLimiter: release() called without a matching acquire()");
        emit unmatchedRelease();
        return makeUnexpected(RateLimiterError::UnmatchedRelease);
    }

    --active_;
    ++stats_.releases;
    wakeHeadLocked();
    return {};
}

Expected<RateLimiter::Permit, RateLimiterError> RateLimiter::acquirePermit(const CancellationToken* token) {
    auto result = acquire(token);
    if (result.hasError()) {
        return makeUnexpected(result.error());
    }
    return Permit(this);
}

void RateLimiter::setMaxConcurrent(int maxConcurrent) {
    QMutexLocker locker(&mutex_);
    maxConcurrent_ = std::max(1, maxConcurrent);
    stats_.maxConcurrent = maxConcurrent_;
    wakeHeadLocked();
    FERRY_INFO("RateLimiter: max concurrent set to {}", maxConcurrent_);
}

void RateLimiter::setMinDelay(qint64 minDelayMs) {
    QMutexLocker locker(&mutex_);
    minDelayMs_ = std::max<qint64>(0, minDelayMs);
    stats_.minDelayMs = minDelayMs_;
    wakeHeadLocked();
}

int RateLimiter::maxConcurrent() const {
    QMutexLocker locker(&mutex_);
    return maxConcurrent_;
}

qint64 RateLimiter::minDelayMs() const {
    QMutexLocker locker(&mutex_);
    return minDelayMs_;
}

int RateLimiter::activeCount() const {
    QMutexLocker locker(&mutex_);
    return active_;
}

int RateLimiter::queueDepth() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(queue_.size());
}

RateLimiterStats RateLimiter::stats() const {
    QMutexLocker locker(&mutex_);
    RateLimiterStats snapshot = stats_;
    snapshot.active = active_;
    snapshot.queued = static_cast<int>(queue_.size());
    return snapshot;
}

void RateLimiter::resetStats() {
    QMutexLocker locker(&mutex_);
    stats_ = RateLimiterStats();
    stats_.maxConcurrent = maxConcurrent_;
    stats_.minDelayMs = minDelayMs_;
}

void RateLimiter::removeWaiterLocked(Waiter* waiter) {
    auto it = std::find(queue_.begin(), queue_.end(), waiter);
    if (it != queue_.end()) {
        queue_.erase(it);
    }
}

void RateLimiter::wakeHeadLocked() {
    if (!queue_.empty()) {
        queue_.front()->wakeup.wakeOne();
    }
}

} // namespace Ferry
