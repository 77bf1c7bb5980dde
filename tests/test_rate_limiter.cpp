#include <QtTest/QtTest>
#include <QtCore/QThread>
#include <QtConcurrent/QtConcurrent>
#include <atomic>

#include "utils/TestUtils.hpp"
#include "../src/core/transfer/RateLimiter.hpp"

using namespace Ferry;
using namespace Ferry::Test;

/**
 * @brief Unit tests for RateLimiter
 *
 * Concurrency bound, FIFO hand-off, request spacing and error reporting.
 */
class TestRateLimiter : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void testAcquireAndRelease();
    void testConcurrencyNeverExceedsLimit();
    void testWaitersServedInArrivalOrder();
    void testMinDelaySpacesAcquisitions();
    void testUnmatchedReleaseReported();
    void testCancelWhileWaiting();
    void testExecuteReleasesPermit();
    void testPermitReleasedOnScopeExit();
    void testRaisingLimitWakesWaiters();
};

void TestRateLimiter::initTestCase() {
    TestUtils::initializeTestEnvironment();
}

void TestRateLimiter::testAcquireAndRelease() {
    RateLimiter limiter(2, 0);

    QVERIFY(limiter.acquire().hasValue());
    QVERIFY(limiter.acquire().hasValue());
    QCOMPARE(limiter.activeCount(), 2);

    QVERIFY(limiter.release().hasValue());
    QVERIFY(limiter.release().hasValue());
    QCOMPARE(limiter.activeCount(), 0);

    const RateLimiterStats stats = limiter.stats();
    QCOMPARE(stats.acquires, qint64(2));
    QCOMPARE(stats.releases, qint64(2));

    limiter.resetStats();
    QCOMPARE(limiter.stats().acquires, qint64(0));
    QCOMPARE(limiter.stats().maxConcurrent, 2);
}

void TestRateLimiter::testConcurrencyNeverExceedsLimit() {
    const int limit = 3;
    RateLimiter limiter(limit, 0);

    std::atomic<int> inside{0};
    std::atomic<int> peak{0};
    std::atomic<int> failures{0};
    QThreadPool pool;
    pool.setMaxThreadCount(12);

    QList<QFuture<void>> futures;
    for (int i = 0; i < 24; ++i) {
        futures.append(QtConcurrent::run(&pool, [&]() {
            auto result = limiter.execute([&]() {
                const int now = ++inside;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                QThread::msleep(5);
                --inside;
            });
            if (result.hasError()) {
                ++failures;
            }
        }));
    }

    for (auto& future : futures) {
        future.waitForFinished();
    }

    QCOMPARE(failures.load(), 0);
    QVERIFY(peak.load() <= limit);
    QVERIFY(peak.load() >= 1);
    QCOMPARE(limiter.activeCount(), 0);
    QCOMPARE(limiter.stats().acquires, qint64(24));
}

void TestRateLimiter::testWaitersServedInArrivalOrder() {
    RateLimiter limiter(1, 0);
    QVERIFY(limiter.acquire().hasValue());

    QMutex orderMutex;
    QStringList order;
    std::atomic<int> failures{0};
    QThreadPool pool;
    pool.setMaxThreadCount(4);

    QList<QFuture<void>> futures;
    for (int i = 0; i < 4; ++i) {
        const QString name = QString("waiter-%1").arg(i);
        futures.append(QtConcurrent::run(&pool, [&, name]() {
            if (limiter.acquire().hasError()) {
                ++failures;
                return;
            }
            {
                QMutexLocker locker(&orderMutex);
                order.append(name);
            }
            if (limiter.release().hasError()) {
                ++failures;
            }
        }));
        // Make arrival order deterministic
        QVERIFY(TestUtils::waitForCondition([&]() { return limiter.queueDepth() == i + 1; }, 2000, 2));
    }

    QVERIFY(limiter.release().hasValue());
    for (auto& future : futures) {
        future.waitForFinished();
    }

    QCOMPARE(failures.load(), 0);
    QCOMPARE(order, QStringList({"waiter-0", "waiter-1", "waiter-2", "waiter-3"}));
}

void TestRateLimiter::testMinDelaySpacesAcquisitions() {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(5, 150, clock);

    QVERIFY(limiter.acquire().hasValue());
    QCOMPARE(clock->totalSleptMs(), qint64(0));

    const qint64 firstAt = clock->nowMs();
    QVERIFY(limiter.acquire().hasValue());
    QVERIFY(clock->nowMs() - firstAt >= 150);

    clock->advance(1000);
    const qint64 sleptBefore = clock->totalSleptMs();
    QVERIFY(limiter.acquire().hasValue());
    QCOMPARE(clock->totalSleptMs(), sleptBefore);

    QCOMPARE(limiter.stats().delayedAcquires, qint64(1));
}

void TestRateLimiter::testUnmatchedReleaseReported() {
    RateLimiter limiter(2, 0);
    QSignalSpy spy(&limiter, &RateLimiter::unmatchedRelease);

    auto result = limiter.release();
    ASSERT_EXPECTED_ERROR(result, RateLimiterError::UnmatchedRelease);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(limiter.activeCount(), 0);
    QCOMPARE(limiter.stats().unmatchedReleases, qint64(1));
}

void TestRateLimiter::testCancelWhileWaiting() {
    RateLimiter limiter(1, 0);
    QVERIFY(limiter.acquire().hasValue());

    CancellationToken token;
    auto future = QtConcurrent::run([&]() { return limiter.acquire(&token); });
    QVERIFY(TestUtils::waitForCondition([&]() { return limiter.queueDepth() == 1; }, 2000, 2));

    token.requestCancel();
    future.waitForFinished();
    auto result = future.result();
    ASSERT_EXPECTED_ERROR(result, RateLimiterError::Cancelled);

    QCOMPARE(limiter.queueDepth(), 0);
    QCOMPARE(limiter.activeCount(), 1);
    QVERIFY(limiter.release().hasValue());
}

void TestRateLimiter::testExecuteReleasesPermit() {
    RateLimiter limiter(1, 0);

    auto value = limiter.execute([]() { return 41 + 1; });
    ASSERT_EXPECTED_VALUE(value);
    QCOMPARE(value.value(), 42);
    QCOMPARE(limiter.activeCount(), 0);

    bool threw = false;
    try {
        limiter.execute([]() -> int { throw std::runtime_error("boom"); });
    } catch (const std::runtime_error&) {
        threw = true;
    }
    QVERIFY(threw);
    QCOMPARE(limiter.activeCount(), 0);
}

void TestRateLimiter::testPermitReleasedOnScopeExit() {
    RateLimiter limiter(1, 0);
    {
        auto permit = limiter.acquirePermit();
        QVERIFY(permit.hasValue());
        QVERIFY(permit.value().isValid());
        QCOMPARE(limiter.activeCount(), 1);
    }
    QCOMPARE(limiter.activeCount(), 0);
    QCOMPARE(limiter.stats().unmatchedReleases, qint64(0));
}

void TestRateLimiter::testRaisingLimitWakesWaiters() {
    RateLimiter limiter(1, 0);
    QVERIFY(limiter.acquire().hasValue());

    auto future = QtConcurrent::run([&]() { return limiter.acquire(); });
    QVERIFY(TestUtils::waitForCondition([&]() { return limiter.queueDepth() == 1; }, 2000, 2));

    limiter.setMaxConcurrent(2);
    future.waitForFinished();
    QVERIFY(future.result().hasValue());
    QCOMPARE(limiter.activeCount(), 2);

    QVERIFY(limiter.release().hasValue());
    QVERIFY(limiter.release().hasValue());
}

int runTestRateLimiter(int argc, char** argv) {
    TestRateLimiter test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_rate_limiter.moc"
