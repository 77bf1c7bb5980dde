#pragma once

#include <QtTest/QtTest>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTemporaryDir>
#include <QtCore/QTimer>
#include <QtCore/QEventLoop>
#include <QtCore/QMutex>
#include <QtCore/QWaitCondition>
#include <QtTest/QSignalSpy>
#include <QtConcurrent/QtConcurrent>
#include <atomic>
#include <functional>
#include <memory>
#include <type_traits>

#include "../../src/core/common/Clock.hpp"
#include "../../src/core/common/Expected.hpp"
#include "../../src/core/common/Logger.hpp"
#include "../../src/core/transfer/TransferExecutor.hpp"

QT_BEGIN_NAMESPACE
class QTcpServer;
class QTcpSocket;
QT_END_NAMESPACE

namespace Ferry {
namespace Test {

/**
 * @brief Test utilities for the Ferry transfer core
 *
 * Temporary directories, async waiting helpers and Expected assertions shared
 * by every suite.
 */
class TestUtils : public QObject {
    Q_OBJECT

public:
    explicit TestUtils(QObject* parent = nullptr);
    ~TestUtils();

    // Test environment setup
    static void initializeTestEnvironment();
    static void cleanupTestEnvironment();

    // Temporary directory management
    static QString createTempDirectory(const QString& prefix = "ferry_test");
    static void cleanupTempDirectory(const QString& path);

    // Async testing utilities
    template<typename T>
    static T waitForFuture(QFuture<T> future, int timeoutMs = 5000);

    static bool waitForCondition(std::function<bool()> condition, int timeoutMs = 5000, int checkIntervalMs = 10);

    // Data helpers
    static QByteArray generateRandomData(qint64 size);
    static bool writeFile(const QString& filePath, const QByteArray& data);
    static QByteArray readFile(const QString& filePath);

    // Test assertions with better error messages
    template<typename T, typename E>
    static void assertExpectedValue(const Expected<T, E>& result, const QString& context = QString());

    template<typename T, typename E>
    static void assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context = QString());

    static void assertFileExists(const QString& filePath, const QString& context = QString());
    static void assertFileNotExists(const QString& filePath, const QString& context = QString());

    // Public logging for test utilities
    static void logMessage(const QString& message);

private:
    static QTemporaryDir* tempDir_;
};

/**
 * @brief RAII helper for test scope management
 */
class TestScope {
public:
    explicit TestScope(const QString& testName);
    ~TestScope();

    QString filePath(const QString& name) const;

private:
    QString testName_;
    QString tempDirectory_;
};

/**
 * @brief Clock that only moves when told to
 *
 * sleepFor() advances time instantly and records how long the caller asked
 * to wait, so throttle and limiter delays can be asserted without real sleeps.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(const QDateTime& start = QDateTime::fromMSecsSinceEpoch(1700000000000LL, Qt::UTC));

    qint64 nowMs() const override { return now_.load(); }
    QDateTime currentDateTime() const override { return start_.addMSecs(now_.load()); }
    void sleepFor(qint64 ms) override;

    void advance(qint64 ms) { now_.fetch_add(ms); }
    qint64 totalSleptMs() const { return slept_.load(); }

private:
    QDateTime start_;
    std::atomic<qint64> now_{0};
    std::atomic<qint64> slept_{0};
};

/**
 * @brief Minimal HTTP/1.1 server on 127.0.0.1 for executor tests
 *
 * Serves in-memory resources with Range and If-Range support. Failures are
 * injected per path: error statuses with Retry-After, connections closed at
 * a given byte, responses that stall after the headers, ranges ignored. Runs
 * on the thread that created it, so the code under test must run elsewhere.
 */
class LocalHttpServer : public QObject {
    Q_OBJECT

public:
    struct RecordedRequest {
        QByteArray method;
        QString path;
        QHash<QByteArray, QByteArray> headers;  // lower-case names

        QByteArray header(const QByteArray& name) const { return headers.value(name.toLower()); }
    };

    explicit LocalHttpServer(QObject* parent = nullptr);
    ~LocalHttpServer() override;

    bool start();
    void stop();
    QUrl url(const QString& path) const;

    void setResource(const QString& path, const QByteArray& body, const QByteArray& etag = QByteArray());

    // The next count requests for path get this status and no body
    void failNext(const QString& path, int status, int count = 1, const QByteArray& retryAfter = QByteArray());
    // The next count responses for path close the connection once the body reaches absolute byte offset
    void truncateNextAt(const QString& path, qint64 offset, int count = 1);
    void setIgnoreRange(const QString& path, bool ignore);
    void setStallAfterHeaders(const QString& path, bool stall);
    // Deliver the body bytesPerTick at a time every intervalMs
    void setSlowDelivery(const QString& path, qint64 bytesPerTick, int intervalMs);

    QList<RecordedRequest> requests() const { return requests_; }
    QList<RecordedRequest> requestsFor(const QString& path) const;

private:
    struct Resource {
        QByteArray body;
        QByteArray etag;
        int failStatus = 0;
        int failRemaining = 0;
        QByteArray retryAfter;
        qint64 truncateAt = -1;
        int truncateRemaining = 0;
        bool ignoreRange = false;
        bool stall = false;
        qint64 bytesPerTick = 0;
        int intervalMs = 0;
    };

    void onNewConnection();
    void onReadyRead(QTcpSocket* socket);
    void respond(QTcpSocket* socket, const RecordedRequest& request);
    void sendSlowly(QTcpSocket* socket, const QByteArray& payload, qint64 bytesPerTick, int intervalMs);
    static QByteArray reasonPhrase(int status);

    QTcpServer* server_ = nullptr;
    QHash<QString, Resource> resources_;
    QHash<QTcpSocket*, QByteArray> buffers_;
    QList<RecordedRequest> requests_;
};

/**
 * @brief Scripted executor for scheduler tests
 *
 * Each execute() pops the next step queued for the task (or uses the default
 * step): complete immediately, fail with a given error, or hold until the
 * token asks to stop or the test releases it. Start order and concurrency are
 * recorded.
 */
class MockTransferExecutor : public TransferExecutor {
public:
    enum class Action {
        Complete,
        Fail,
        Hold
    };

    struct Step {
        Action action = Action::Complete;
        TransferError error;
        qint64 bytes = 1024;
    };

    static Step complete(qint64 bytes = 1024);
    static Step fail(const TransferError& error, qint64 bytes = 0);
    static Step hold(qint64 bytes = 512);

    TransferOutcome execute(const TransferTask& task,
                            const CancellationToken& token,
                            const ProgressCallback& onProgress) override;

    void setDefaultStep(const Step& step);
    void addSteps(const QString& taskId, const QList<Step>& steps);

    // Lets every held transfer complete
    void releaseAll();

    QStringList startedIds() const;
    QList<TransferTask> startedTasks() const;
    int startCount(const QString& taskId) const;
    int runningNow() const { return running_.load(); }
    int maxObserved() const { return maxObserved_.load(); }

private:
    Step nextStep(const QString& taskId);

    mutable QMutex mutex_;
    QWaitCondition released_;
    bool releaseAll_ = false;
    Step defaultStep_;
    QHash<QString, QList<Step>> steps_;
    QList<TransferTask> started_;
    std::atomic<int> running_{0};
    std::atomic<int> maxObserved_{0};
};

// Template implementations
template<typename T>
T TestUtils::waitForFuture(QFuture<T> future, int timeoutMs) {
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);

    QFutureWatcher<T> watcher;
    QObject::connect(&watcher, &QFutureWatcher<T>::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    watcher.setFuture(future);
    timer.start(timeoutMs);

    if (!future.isFinished()) {
        loop.exec();
    }

    if (!future.isFinished()) {
        logMessage(QString("waitForFuture timeout after %1ms").arg(timeoutMs));
        // The worker still refers to state owned by the caller
        future.waitForFinished();
    }

    return future.result();
}

template<typename T, typename E>
void TestUtils::assertExpectedValue(const Expected<T, E>& result, const QString& context) {
    if (result.hasError()) {
        QString message = QString("Expected value but got error");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        message += QString(": error code %1").arg(static_cast<int>(result.error()));
        QFAIL(qPrintable(message));
    }
}

template<typename T, typename E>
void TestUtils::assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context) {
    if (result.hasValue()) {
        QString message = QString("Expected error but got value");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }

    if (result.error() != expectedError) {
        QString message = QString("Expected error %1 but got error %2")
                         .arg(static_cast<int>(expectedError))
                         .arg(static_cast<int>(result.error()));
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

// Convenience macros for testing
#define ASSERT_EXPECTED_VALUE(result) TestUtils::assertExpectedValue(result, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_EXPECTED_ERROR(result, error) TestUtils::assertExpectedError(result, error, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_FILE_EXISTS(path) TestUtils::assertFileExists(path, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_FILE_NOT_EXISTS(path) TestUtils::assertFileNotExists(path, QString("%1:%2").arg(__FILE__).arg(__LINE__))

} // namespace Test
} // namespace Ferry
