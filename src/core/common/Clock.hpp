#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QElapsedTimer>
#include <memory>

namespace Ferry {

/**
 * @brief Time source shared by the limiter, throttle and scheduler.
 *
 * nowMs() is monotonic and only meaningful as a difference. currentDateTime()
 * is wall-clock time used for persisted timestamps. Tests substitute a manual
 * implementation whose sleepFor() advances time instead of blocking.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual qint64 nowMs() const = 0;
    virtual QDateTime currentDateTime() const = 0;
    virtual void sleepFor(qint64 ms) = 0;

    static std::shared_ptr<Clock> system();
};

class SystemClock : public Clock {
public:
    SystemClock();

    qint64 nowMs() const override;
    QDateTime currentDateTime() const override;
    void sleepFor(qint64 ms) override;

private:
    QElapsedTimer monotonic_;
};

} // namespace Ferry
