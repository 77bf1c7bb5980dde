#pragma once

#include "CancellationToken.hpp"
#include "../common/Clock.hpp"
#include "../common/Expected.hpp"

#include <QtCore/QObject>
#include <QtCore/QMutex>
#include <QtCore/QWaitCondition>
#include <deque>
#include <memory>
#include <type_traits>
#include <utility>

namespace Ferry {

enum class RateLimiterError {
    Cancelled,
    UnmatchedRelease
};

struct RateLimiterStats {
    qint64 acquires = 0;
    qint64 releases = 0;
    qint64 unmatchedReleases = 0;
    qint64 delayedAcquires = 0;   // waited for minDelay
    qint64 queuedWaits = 0;       // had to wait behind other callers
    int active = 0;
    int queued = 0;
    int maxConcurrent = 0;
    qint64 minDelayMs = 0;
};

/**
 * @brief Counting semaphore with strict FIFO hand-off and request spacing.
 *
 * acquire() blocks the calling worker thread until it is at the head of the
 * wait queue and a permit is free, so late arrivals never overtake waiters.
 * When minDelay is set, successive acquisitions are additionally spaced by at
 * least that long. Shared by every subsystem that issues network calls.
 */
class RateLimiter : public QObject {
    Q_OBJECT

public:
    class Permit {
    public:
        Permit() = default;
        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        ~Permit();

        bool isValid() const { return limiter_ != nullptr; }
        void release();

    private:
        friend class RateLimiter;
        explicit Permit(RateLimiter* limiter) : limiter_(limiter) {}

        RateLimiter* limiter_ = nullptr;
    };

    explicit RateLimiter(int maxConcurrent = 3, qint64 minDelayMs = 150,
                         std::shared_ptr<Clock> clock = Clock::system(),
                         QObject* parent = nullptr);
    ~RateLimiter() override;

    Expected<void, RateLimiterError> acquire(const CancellationToken* token = nullptr);
    Expected<void, RateLimiterError> release();

    // Acquire wrapped in a guard that releases on destruction
    Expected<Permit, RateLimiterError> acquirePermit(const CancellationToken* token = nullptr);

    template<typename F>
    auto execute(F&& operation, const CancellationToken* token = nullptr)
        -> Expected<std::invoke_result_t<F>, RateLimiterError>;

    void setMaxConcurrent(int maxConcurrent);
    void setMinDelay(qint64 minDelayMs);

    int maxConcurrent() const;
    qint64 minDelayMs() const;
    int activeCount() const;
    int queueDepth() const;

    RateLimiterStats stats() const;
    void resetStats();

signals:
    void queueDepthChanged(int depth);
    void unmatchedRelease();

private:
    struct Waiter {
        QWaitCondition wakeup;
    };

    void removeWaiterLocked(Waiter* waiter);
    void wakeHeadLocked();

    std::shared_ptr<Clock> clock_;

    mutable QMutex mutex_;
    std::deque<Waiter*> queue_;
    int maxConcurrent_;
    qint64 minDelayMs_;
    int active_ = 0;
    qint64 lastAcquireMs_ = -1;
    RateLimiterStats stats_;
};

template<typename F>
auto RateLimiter::execute(F&& operation, const CancellationToken* token)
    -> Expected<std::invoke_result_t<F>, RateLimiterError> {
    using Result = std::invoke_result_t<F>;

    auto permit = acquirePermit(token);
    if (permit.hasError()) {
        return makeUnexpected(permit.error());
    }

    if constexpr (std::is_void_v<Result>) {
        std::forward<F>(operation)();
        return {};
    } else {
        return Expected<Result, RateLimiterError>(std::forward<F>(operation)());
    }
}

} // namespace Ferry
