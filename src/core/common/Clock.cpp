#include "Clock.hpp"
#include <QtCore/QThread>

namespace Ferry {

std::shared_ptr<Clock> Clock::system() {
    static std::shared_ptr<Clock> instance = std::make_shared<SystemClock>();
    return instance;
}

SystemClock::SystemClock() {
    monotonic_.start();
}

qint64 SystemClock::nowMs() const {
    return monotonic_.elapsed();
}

QDateTime SystemClock::currentDateTime() const {
    return QDateTime::currentDateTimeUtc();
}

void SystemClock::sleepFor(qint64 ms) {
    if (ms > 0) {
        QThread::msleep(static_cast<unsigned long>(ms));
    }
}

} // namespace Ferry
