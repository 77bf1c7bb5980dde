#include "TestUtils.hpp"
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QCoreApplication>
#include <QtCore/QRandomGenerator>
#include <QtCore/QRegularExpression>
#include <QtCore/QPointer>
#include <QtCore/QThread>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QNetworkProxyFactory>
#include <QtNetwork/QTcpServer>
#include <QtNetwork/QTcpSocket>
#include <QtTest/QTest>
#include <algorithm>

namespace Ferry {
namespace Test {

// Static member initialization
QTemporaryDir* TestUtils::tempDir_ = nullptr;

TestUtils::TestUtils(QObject* parent) : QObject(parent) {
}

TestUtils::~TestUtils() {
}

void TestUtils::initializeTestEnvironment() {
    if (!tempDir_) {
        tempDir_ = new QTemporaryDir();
        if (!tempDir_->isValid()) {
            qFatal("Failed to create temporary directory for tests");
        }
    }

    // Requests to 127.0.0.1 must never go through a proxy from the environment
    QNetworkProxyFactory::setUseSystemConfiguration(false);
    qputenv("FERRY_TEST_MODE", "1");

    logMessage("Test environment initialized");
}

void TestUtils::cleanupTestEnvironment() {
    if (tempDir_) {
        delete tempDir_;
        tempDir_ = nullptr;
    }

    logMessage("Test environment cleaned up");
}

QString TestUtils::createTempDirectory(const QString& prefix) {
    if (!tempDir_) {
        initializeTestEnvironment();
    }

    QString basePath = tempDir_->path();
    QString dirName = QString("%1_%2_%3")
                     .arg(prefix)
                     .arg(QDateTime::currentMSecsSinceEpoch())
                     .arg(QRandomGenerator::global()->generate());

    QString fullPath = basePath + "/" + dirName;

    QDir dir;
    if (!dir.mkpath(fullPath)) {
        return QString();
    }

    return fullPath;
}

void TestUtils::cleanupTempDirectory(const QString& path) {
    QDir dir(path);
    if (dir.exists()) {
        dir.removeRecursively();
    }
}

bool TestUtils::waitForCondition(std::function<bool()> condition, int timeoutMs, int checkIntervalMs) {
    QElapsedTimer timer;
    timer.start();

    while (timer.elapsed() < timeoutMs) {
        if (condition()) {
            return true;
        }
        QTest::qWait(checkIntervalMs);
    }

    return condition();
}

QByteArray TestUtils::generateRandomData(qint64 size) {
    QByteArray data;
    data.resize(static_cast<int>(size));
    auto* generator = QRandomGenerator::global();
    for (qint64 i = 0; i < size; ++i) {
        data[static_cast<int>(i)] = static_cast<char>(generator->bounded(256));
    }
    return data;
}

bool TestUtils::writeFile(const QString& filePath, const QByteArray& data) {
    QDir().mkpath(QFileInfo(filePath).absolutePath());
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(data) == data.size();
}

QByteArray TestUtils::readFile(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

void TestUtils::assertFileExists(const QString& filePath, const QString& context) {
    if (!QFileInfo::exists(filePath)) {
        QString message = QString("File does not exist: %1").arg(filePath);
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

void TestUtils::assertFileNotExists(const QString& filePath, const QString& context) {
    if (QFileInfo::exists(filePath)) {
        QString message = QString("File should not exist: %1").arg(filePath);
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

void TestUtils::logMessage(const QString& message) {
    FERRY_DEBUG("[test] {}", message.toStdString());
}

// TestScope implementation
TestScope::TestScope(const QString& testName)
    : testName_(testName) {
    tempDirectory_ = TestUtils::createTempDirectory("test_" + testName);
    TestUtils::logMessage(QString("Starting test scope: %1").arg(testName));
}

TestScope::~TestScope() {
    if (!tempDirectory_.isEmpty()) {
        TestUtils::cleanupTempDirectory(tempDirectory_);
    }

    TestUtils::logMessage(QString("Finished test scope: %1").arg(testName_));
}

QString TestScope::filePath(const QString& name) const {
    return QDir(tempDirectory_).filePath(name);
}

// ManualClock implementation
ManualClock::ManualClock(const QDateTime& start)
    : start_(start) {
}

void ManualClock::sleepFor(qint64 ms) {
    if (ms <= 0) {
        return;
    }
    slept_.fetch_add(ms);
    now_.fetch_add(ms);
    // Let other threads observe progress as if time had passed
    QThread::yieldCurrentThread();
}

// LocalHttpServer implementation
LocalHttpServer::LocalHttpServer(QObject* parent)
    : QObject(parent)
    , server_(new QTcpServer(this)) {
    connect(server_, &QTcpServer::newConnection, this, &LocalHttpServer::onNewConnection);
}

LocalHttpServer::~LocalHttpServer() {
    stop();
}

bool LocalHttpServer::start() {
    if (server_->isListening()) {
        return true;
    }
    return server_->listen(QHostAddress::LocalHost, 0);
}

void LocalHttpServer::stop() {
    const auto sockets = buffers_.keys();
    for (QTcpSocket* socket : sockets) {
        socket->abort();
    }
    buffers_.clear();
    server_->close();
}

QUrl LocalHttpServer::url(const QString& path) const {
    QUrl result;
    result.setScheme("http");
    result.setHost("127.0.0.1");
    result.setPort(server_->serverPort());
    result.setPath(path.startsWith('/') ? path : "/" + path);
    return result;
}

void LocalHttpServer::setResource(const QString& path, const QByteArray& body, const QByteArray& etag) {
    Resource& resource = resources_[path];
    resource.body = body;
    resource.etag = etag;
}

void LocalHttpServer::failNext(const QString& path, int status, int count, const QByteArray& retryAfter) {
    Resource& resource = resources_[path];
    resource.failStatus = status;
    resource.failRemaining = count;
    resource.retryAfter = retryAfter;
}

void LocalHttpServer::truncateNextAt(const QString& path, qint64 offset, int count) {
    Resource& resource = resources_[path];
    resource.truncateAt = offset;
    resource.truncateRemaining = count;
}

void LocalHttpServer::setIgnoreRange(const QString& path, bool ignore) {
    resources_[path].ignoreRange = ignore;
}

void LocalHttpServer::setStallAfterHeaders(const QString& path, bool stall) {
    resources_[path].stall = stall;
}

void LocalHttpServer::setSlowDelivery(const QString& path, qint64 bytesPerTick, int intervalMs) {
    Resource& resource = resources_[path];
    resource.bytesPerTick = bytesPerTick;
    resource.intervalMs = intervalMs;
}

QList<LocalHttpServer::RecordedRequest> LocalHttpServer::requestsFor(const QString& path) const {
    QList<RecordedRequest> result;
    for (const RecordedRequest& request : requests_) {
        if (request.path == path) {
            result.append(request);
        }
    }
    return result;
}

void LocalHttpServer::onNewConnection() {
    while (QTcpSocket* socket = server_->nextPendingConnection()) {
        buffers_.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            buffers_.remove(socket);
            socket->deleteLater();
        });
    }
}

void LocalHttpServer::onReadyRead(QTcpSocket* socket) {
    auto it = buffers_.find(socket);
    if (it == buffers_.end()) {
        return;
    }

    it.value().append(socket->readAll());
    const int headerEnd = it.value().indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return;
    }

    const QList<QByteArray> lines = it.value().left(headerEnd).split('\n');
    it.value().clear();

    RecordedRequest request;
    const QList<QByteArray> requestLine = lines.value(0).trimmed().split(' ');
    request.method = requestLine.value(0);
    request.path = QUrl(QString::fromLatin1(requestLine.value(1))).path();
    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        const int colon = line.indexOf(':');
        if (colon > 0) {
            request.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
        }
    }

    requests_.append(request);
    respond(socket, request);
}

void LocalHttpServer::respond(QTcpSocket* socket, const RecordedRequest& request) {
    auto writeHead = [socket](int status, const QList<QPair<QByteArray, QByteArray>>& headers) {
        QByteArray head = "HTTP/1.1 " + QByteArray::number(status) + " " + reasonPhrase(status) + "\r\n";
        for (const auto& header : headers) {
            head += header.first + ": " + header.second + "\r\n";
        }
        head += "Connection: close\r\n\r\n";
        socket->write(head);
    };

    auto it = resources_.find(request.path);
    if (it == resources_.end() || (it->body.isEmpty() && it->failRemaining == 0)) {
        const QByteArray body = "not found";
        writeHead(404, {{"Content-Length", QByteArray::number(body.size())}});
        socket->write(body);
        socket->disconnectFromHost();
        return;
    }

    Resource& resource = it.value();

    if (resource.failRemaining > 0) {
        --resource.failRemaining;
        const QByteArray body = "injected failure";
        QList<QPair<QByteArray, QByteArray>> headers{{"Content-Length", QByteArray::number(body.size())}};
        if (!resource.retryAfter.isEmpty()) {
            headers.append({"Retry-After", resource.retryAfter});
        }
        writeHead(resource.failStatus, headers);
        socket->write(body);
        socket->disconnectFromHost();
        return;
    }

    const qint64 size = resource.body.size();
    qint64 start = 0;
    bool partial = false;

    static const QRegularExpression rangePattern(R"(^bytes=(\d+)-$)");
    const QRegularExpressionMatch range = rangePattern.match(QString::fromLatin1(request.header("Range")));
    // If-Range uses strong comparison, so a weak tag on either side never matches
    const QByteArray ifRange = request.header("If-Range");
    const bool ifRangeMatches = ifRange.isEmpty() ||
        (ifRange == resource.etag && !ifRange.startsWith("W/"));
    if (range.hasMatch() && !resource.ignoreRange && ifRangeMatches) {
        start = range.captured(1).toLongLong();
        partial = true;
    }

    QList<QPair<QByteArray, QByteArray>> headers;
    if (!resource.etag.isEmpty()) {
        headers.append({"ETag", resource.etag});
    }
    headers.append({"Accept-Ranges", "bytes"});

    if (partial && start >= size) {
        headers.append({"Content-Range", "bytes */" + QByteArray::number(size)});
        headers.append({"Content-Length", "0"});
        writeHead(416, headers);
        socket->disconnectFromHost();
        return;
    }

    QByteArray payload = resource.body.mid(static_cast<int>(start));
    headers.append({"Content-Length", QByteArray::number(payload.size())});
    if (partial) {
        headers.append({"Content-Range", "bytes " + QByteArray::number(start) + "-" +
                                         QByteArray::number(size - 1) + "/" + QByteArray::number(size)});
    }
    writeHead(partial ? 206 : 200, headers);

    if (resource.stall) {
        socket->flush();
        return;
    }

    if (resource.truncateRemaining > 0 && resource.truncateAt > start) {
        --resource.truncateRemaining;
        payload = payload.left(static_cast<int>(resource.truncateAt - start));
    }

    if (resource.bytesPerTick > 0) {
        sendSlowly(socket, payload, resource.bytesPerTick, resource.intervalMs);
        return;
    }

    socket->write(payload);
    socket->disconnectFromHost();
}

void LocalHttpServer::sendSlowly(QTcpSocket* socket, const QByteArray& payload, qint64 bytesPerTick, int intervalMs) {
    auto* timer = new QTimer(socket);
    auto offset = std::make_shared<qint64>(0);
    QPointer<QTcpSocket> guard(socket);

    connect(timer, &QTimer::timeout, socket, [guard, timer, payload, offset, bytesPerTick]() {
        if (!guard || guard->state() != QAbstractSocket::ConnectedState) {
            timer->stop();
            return;
        }
        const qint64 count = std::min<qint64>(bytesPerTick, payload.size() - *offset);
        guard->write(payload.constData() + *offset, count);
        *offset += count;
        if (*offset >= payload.size()) {
            timer->stop();
            guard->disconnectFromHost();
        }
    });
    timer->start(intervalMs);
}

QByteArray LocalHttpServer::reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 416: return "Range Not Satisfiable";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default: return "Status";
    }
}

// MockTransferExecutor implementation
MockTransferExecutor::Step MockTransferExecutor::complete(qint64 bytes) {
    Step step;
    step.action = Action::Complete;
    step.bytes = bytes;
    return step;
}

MockTransferExecutor::Step MockTransferExecutor::fail(const TransferError& error, qint64 bytes) {
    Step step;
    step.action = Action::Fail;
    step.error = error;
    step.bytes = bytes;
    return step;
}

MockTransferExecutor::Step MockTransferExecutor::hold(qint64 bytes) {
    Step step;
    step.action = Action::Hold;
    step.bytes = bytes;
    return step;
}

void MockTransferExecutor::setDefaultStep(const Step& step) {
    QMutexLocker locker(&mutex_);
    defaultStep_ = step;
}

void MockTransferExecutor::addSteps(const QString& taskId, const QList<Step>& steps) {
    QMutexLocker locker(&mutex_);
    steps_[taskId].append(steps);
}

void MockTransferExecutor::releaseAll() {
    QMutexLocker locker(&mutex_);
    releaseAll_ = true;
    released_.wakeAll();
}

QStringList MockTransferExecutor::startedIds() const {
    QMutexLocker locker(&mutex_);
    QStringList ids;
    for (const TransferTask& task : started_) {
        ids.append(task.id);
    }
    return ids;
}

QList<TransferTask> MockTransferExecutor::startedTasks() const {
    QMutexLocker locker(&mutex_);
    return started_;
}

int MockTransferExecutor::startCount(const QString& taskId) const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(std::count_if(started_.cbegin(), started_.cend(),
                                          [&taskId](const TransferTask& task) { return task.id == taskId; }));
}

MockTransferExecutor::Step MockTransferExecutor::nextStep(const QString& taskId) {
    auto it = steps_.find(taskId);
    if (it != steps_.end() && !it.value().isEmpty()) {
        return it.value().takeFirst();
    }
    return defaultStep_;
}

TransferOutcome MockTransferExecutor::execute(const TransferTask& task,
                                              const CancellationToken& token,
                                              const ProgressCallback& onProgress) {
    Step step;
    {
        QMutexLocker locker(&mutex_);
        started_.append(task);
        step = nextStep(task.id);
    }

    const int running = running_.fetch_add(1) + 1;
    int observed = maxObserved_.load();
    while (running > observed && !maxObserved_.compare_exchange_weak(observed, running)) {
    }

    TransferOutcome outcome;
    outcome.etag = task.etag;
    outcome.totalSize = task.totalSize;
    outcome.bytesTransferred = task.bytesTransferred;

    switch (step.action) {
        case Action::Complete:
            outcome.result = TransferOutcome::Result::Completed;
            outcome.bytesTransferred = step.bytes;
            outcome.totalSize = step.bytes;
            TestUtils::writeFile(task.destinationPath, QByteArray(static_cast<int>(step.bytes), 'x'));
            break;

        case Action::Fail:
            outcome.result = TransferOutcome::Result::Failed;
            outcome.error = step.error;
            outcome.bytesTransferred = std::max(task.bytesTransferred, step.bytes);
            break;

        case Action::Hold: {
            const qint64 bytes = std::max(task.bytesTransferred, step.bytes);
            TestUtils::writeFile(task.tempPath(), QByteArray(static_cast<int>(bytes), 'x'));
            if (onProgress) {
                TransferProgress progress;
                progress.taskId = task.id;
                progress.bytesTransferred = bytes;
                progress.totalSize = task.totalSize;
                onProgress(progress);
            }

            QMutexLocker locker(&mutex_);
            while (!releaseAll_ && !token.stopRequested()) {
                released_.wait(&mutex_, 10);
            }
            outcome.bytesTransferred = bytes;
            if (token.isCancelled()) {
                outcome.result = TransferOutcome::Result::Cancelled;
                outcome.error = TransferError::cancelled();
            } else if (token.isPauseRequested()) {
                outcome.result = TransferOutcome::Result::Paused;
            } else {
                outcome.result = TransferOutcome::Result::Completed;
                outcome.totalSize = bytes;
            }
            break;
        }
    }

    running_.fetch_sub(1);
    return outcome;
}

} // namespace Test
} // namespace Ferry
