#include "ResumableTransferExecutor.hpp"
#include "BandwidthThrottle.hpp"
#include "../storage/TaskStore.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QEventLoop>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QRegularExpression>
#include <QtCore/QStorageInfo>
#include <QtCore/QTimer>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>
#include <algorithm>
#include <cmath>

namespace Ferry {

namespace {
constexpr int kPollIntervalMs = 100;

bool isWeakEtag(const QString& etag) {
    return etag.startsWith(QLatin1String("W/"));
}

// Weak comparison: opaque tags match regardless of the W/ prefix
bool etagsMatchWeakly(const QString& a, const QString& b) {
    const QString left = isWeakEtag(a) ? a.mid(2) : a;
    const QString right = isWeakEtag(b) ? b.mid(2) : b;
    return left == right;
}
}

struct ResumableTransferExecutor::Attempt {
    TransferTask task;
    qint64 offset = 0;              // first byte requested from the server
    qint64 bytes = 0;               // bytes present in the temp file
    qint64 totalSize = -1;
    QString etag;
    bool alreadyComplete = false;   // 416 at the known end of the resource
    TransferError error;
    double speed = 0.0;
    qint64 lastChunkMs = 0;
};

ResumableTransferExecutor::ResumableTransferExecutor(BandwidthThrottle* throttle,
                                                     TaskStore* store,
                                                     ExecutorConfig config,
                                                     std::shared_ptr<Clock> clock)
    : throttle_(throttle)
    , store_(store)
    , config_(std::move(config))
    , clock_(clock ? std::move(clock) : Clock::system()) {
    config_.chunkSize = std::max<qint64>(1, config_.chunkSize);
    config_.requestTimeoutMs = std::max(1, config_.requestTimeoutMs);
    config_.speedSmoothing = std::clamp(config_.speedSmoothing, 0.01, 1.0);
}

ResumableTransferExecutor::~ResumableTransferExecutor() = default;

TransferOutcome ResumableTransferExecutor::execute(const TransferTask& task,
                                                   const CancellationToken& token,
                                                   const ProgressCallback& onProgress) {
    Attempt attempt;
    attempt.task = task;
    attempt.totalSize = task.totalSize;
    attempt.etag = task.etag;
    attempt.lastChunkMs = clock_->nowMs();

    const QString scheme = task.url.scheme().toLower();
    if (!task.url.isValid() || (scheme != "http" && scheme != "https")) {
        return failed(attempt, TransferError::http(0, QString("Unsupported URL: %1").arg(task.url.toString())));
    }

    if (task.destinationPath.trimmed().isEmpty()) {
        return failed(attempt, TransferError::localIO("No destination path"));
    }

    if (token.stopRequested()) {
        return stopped(attempt, token);
    }

    QFile file(task.tempPath());
    TransferError prepareError = prepareTempFile(attempt, file);
    if (!prepareError.isNone()) {
        return failed(attempt, prepareError);
    }

    TransferError spaceError = checkDiskSpace(attempt);
    if (!spaceError.isNone()) {
        file.close();
        return failed(attempt, spaceError);
    }

    QNetworkAccessManager manager;
    manager.setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);

    QNetworkRequest request(task.url);
    request.setRawHeader("User-Agent", config_.userAgent.toUtf8());
    // Byte offsets refer to the stored representation, so no transparent decompression
    request.setRawHeader("Accept-Encoding", "identity");
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);
    if (attempt.offset > 0) {
        request.setRawHeader("Range", QString("bytes=%1-").arg(attempt.offset).toUtf8());
        // If-Range only accepts strong validators; weak ones are checked against the 206 reply
        if (!attempt.etag.isEmpty() && !isWeakEtag(attempt.etag)) {
            request.setRawHeader("If-Range", attempt.etag.toUtf8());
        }
    }

    Logger::instance().info("Transfer {}: requesting {} from byte {}",
                            task.id.toStdString(), task.url.toString().toStdString(), attempt.offset);

    std::unique_ptr<QNetworkReply> reply(manager.get(request));
    reply->setReadBufferSize(config_.chunkSize * 2);

    QEventLoop loop;
    bool timedOut = false;

    QTimer idleTimer;
    idleTimer.setSingleShot(true);
    idleTimer.setInterval(config_.requestTimeoutMs);
    QObject::connect(&idleTimer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    QTimer pollTimer;
    pollTimer.setInterval(kPollIntervalMs);
    QObject::connect(&pollTimer, &QTimer::timeout, &loop, &QEventLoop::quit);

    QObject::connect(reply.get(), &QNetworkReply::metaDataChanged, &loop, &QEventLoop::quit);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(reply.get(), &QNetworkReply::readyRead, &loop, [&]() {
        idleTimer.start();
        loop.quit();
    });

    idleTimer.start();
    pollTimer.start();

    bool headersSeen = false;
    QByteArray pending;
    pending.reserve(static_cast<int>(config_.chunkSize));

    while (true) {
        if (token.stopRequested()) {
            reply->abort();
            file.close();
            return stopped(attempt, token);
        }

        if (!headersSeen && reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).isValid()) {
            headersSeen = true;
            if (!inspectResponse(attempt, reply.get())) {
                reply->abort();
                if (attempt.alreadyComplete) {
                    return finalize(attempt, file);
                }
                file.close();
                return failed(attempt, attempt.error);
            }

            TransferError error = checkDiskSpace(attempt);
            if (!error.isNone()) {
                reply->abort();
                file.close();
                return failed(attempt, error);
            }
        }

        if (headersSeen) {
            while (reply->bytesAvailable() > 0 && !token.stopRequested()) {
                pending.append(reply->read(config_.chunkSize - pending.size()));
                if (pending.size() < config_.chunkSize) {
                    continue;
                }

                TransferError error = writeChunk(attempt, file, pending, token, onProgress);
                pending.clear();
                if (error.category == TransferErrorCategory::Cancelled) {
                    break;
                }
                if (!error.isNone()) {
                    reply->abort();
                    file.close();
                    return failed(attempt, error);
                }
                idleTimer.start();
            }
        }

        if (token.stopRequested()) {
            continue;
        }

        if (reply->isFinished() && reply->bytesAvailable() == 0) {
            break;
        }

        if (timedOut) {
            reply->abort();
            file.close();
            return failed(attempt, TransferError::network(
                QString("No data received for %1 ms").arg(config_.requestTimeoutMs)));
        }

        loop.exec();
    }

    if (!headersSeen) {
        file.close();
        return failed(attempt, TransferError::network(reply->errorString()));
    }

    if (!pending.isEmpty()) {
        TransferError error = writeChunk(attempt, file, pending, token, onProgress);
        if (error.category == TransferErrorCategory::Cancelled) {
            file.close();
            return stopped(attempt, token);
        }
        if (!error.isNone()) {
            file.close();
            return failed(attempt, error);
        }
    }

    const bool bodyComplete = attempt.totalSize < 0 || attempt.bytes == attempt.totalSize;
    if (reply->error() != QNetworkReply::NoError && !bodyComplete) {
        file.close();
        return failed(attempt, TransferError::network(reply->errorString()));
    }

    if (!bodyComplete) {
        file.close();
        return failed(attempt, TransferError::network(
            QString("Connection closed after %1 of %2 bytes").arg(attempt.bytes).arg(attempt.totalSize)));
    }

    if (reply->error() != QNetworkReply::NoError) {
        // Unknown length: an error means the body may be truncated
        file.close();
        return failed(attempt, TransferError::network(reply->errorString()));
    }

    return finalize(attempt, file);
}

int ResumableTransferExecutor::parseRetryAfter(const QByteArray& value, const QDateTime& now) {
    const QByteArray trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return 0;
    }

    bool ok = false;
    const int seconds = trimmed.toInt(&ok);
    if (ok) {
        return std::max(0, seconds);
    }

    // HTTP-dates name the zone "GMT"; the RFC 2822 parser wants a numeric offset
    QString date = QString::fromLatin1(trimmed);
    if (date.endsWith(QLatin1String(" GMT"))) {
        date.chop(4);
        date.append(QLatin1String(" +0000"));
    }

    const QDateTime when = QDateTime::fromString(date, Qt::RFC2822Date);
    if (!when.isValid() || !now.isValid()) {
        return 0;
    }
    return static_cast<int>(std::max<qint64>(0, now.secsTo(when)));
}

TransferError ResumableTransferExecutor::prepareTempFile(Attempt& attempt, QFile& file) {
    const QFileInfo destination(attempt.task.destinationPath);
    if (!QDir().mkpath(destination.absolutePath())) {
        return TransferError::localIO(QString("Cannot create directory %1").arg(destination.absolutePath()));
    }

    qint64 offset = std::max<qint64>(0, attempt.task.bytesTransferred);
    if (attempt.task.hasKnownSize()) {
        offset = std::min(offset, attempt.task.totalSize);
    }

    const QFileInfo partial(file.fileName());
    if (offset > 0 && (!partial.exists() || partial.size() < offset)) {
        Logger::instance().warn("Transfer {}: partial file has {} bytes, {} recorded; restarting from zero",
                                attempt.task.id.toStdString(), partial.exists() ? partial.size() : 0, offset);
        offset = 0;
        attempt.etag.clear();
    }

    if (!file.open(QIODevice::ReadWrite)) {
        return TransferError::localIO(QString("Cannot open %1: %2").arg(file.fileName(), file.errorString()));
    }

    // Drop anything written after the last persisted offset
    if (!file.resize(offset) || !file.seek(offset)) {
        const QString reason = file.errorString();
        file.close();
        return TransferError::localIO(QString("Cannot position %1 at %2: %3").arg(file.fileName()).arg(offset).arg(reason));
    }

    attempt.offset = offset;
    attempt.bytes = offset;
    if (offset != attempt.task.bytesTransferred) {
        persistProgress(attempt);
    }
    return TransferError();
}

TransferError ResumableTransferExecutor::checkDiskSpace(const Attempt& attempt) const {
    if (attempt.totalSize < 0) {
        return TransferError();
    }

    const qint64 needed = attempt.totalSize - attempt.bytes;
    if (needed <= 0) {
        return TransferError();
    }

    QStorageInfo storage(QFileInfo(attempt.task.destinationPath).absolutePath());
    if (!storage.isValid() || !storage.isReady()) {
        return TransferError();
    }

    const qint64 available = storage.bytesAvailable();
    if (available >= 0 && available < needed) {
        return TransferError::localIO(QString("Insufficient disk space: %1 bytes needed, %2 available")
                                          .arg(needed).arg(available));
    }
    return TransferError();
}

bool ResumableTransferExecutor::inspectResponse(Attempt& attempt, QNetworkReply* reply) {
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray etag = reply->rawHeader("ETag");
    const QString contentRange = QString::fromLatin1(reply->rawHeader("Content-Range")).trimmed();

    Logger::instance().debug("Transfer {}: HTTP {} (Content-Range '{}')",
                             attempt.task.id.toStdString(), status, contentRange.toStdString());

    if (status == 206) {
        static const QRegularExpression partialRange(R"(^bytes\s+(\d+)-(\d+)/(\d+|\*)$)");
        const QRegularExpressionMatch match = partialRange.match(contentRange);
        if (!match.hasMatch()) {
            attempt.error = TransferError::rangeNotSatisfiable("Partial response without a usable Content-Range");
            return false;
        }

        const qint64 start = match.captured(1).toLongLong();
        if (start != attempt.offset) {
            attempt.error = TransferError::rangeNotSatisfiable(
                QString("Server resumed at byte %1 instead of %2").arg(start).arg(attempt.offset));
            return false;
        }

        if (match.captured(3) != "*") {
            const qint64 total = match.captured(3).toLongLong();
            if (attempt.task.hasKnownSize() && attempt.offset > 0 && total != attempt.task.totalSize) {
                attempt.error = TransferError::rangeNotSatisfiable(
                    QString("Remote size changed from %1 to %2").arg(attempt.task.totalSize).arg(total));
                return false;
            }
            attempt.totalSize = total;
        }

        if (!etag.isEmpty()) {
            const QString received = QString::fromLatin1(etag);
            if (attempt.offset > 0 && !attempt.etag.isEmpty() && !etagsMatchWeakly(attempt.etag, received)) {
                attempt.error = TransferError::rangeNotSatisfiable(
                    QString("Entity tag changed from %1 to %2").arg(attempt.etag, received));
                return false;
            }
            attempt.etag = received;
        }
        return true;
    }

    if (status >= 200 && status < 300) {
        if (attempt.offset > 0) {
            attempt.error = TransferError::rangeNotSatisfiable(
                QString("Server sent the full body (HTTP %1) for a request from byte %2").arg(status).arg(attempt.offset));
            return false;
        }

        const QVariant length = reply->header(QNetworkRequest::ContentLengthHeader);
        attempt.totalSize = length.isValid() ? length.toLongLong() : -1;
        attempt.etag = QString::fromLatin1(etag);
        return true;
    }

    if (status == 416) {
        static const QRegularExpression unsatisfiedRange(R"(^bytes\s+\*/(\d+)$)");
        const QRegularExpressionMatch match = unsatisfiedRange.match(contentRange);
        const qint64 serverTotal = match.hasMatch() ? match.captured(1).toLongLong() : attempt.task.totalSize;

        if (attempt.offset > 0 && serverTotal >= 0 && attempt.offset == serverTotal) {
            Logger::instance().info("Transfer {}: all {} bytes already present", attempt.task.id.toStdString(), serverTotal);
            attempt.totalSize = serverTotal;
            attempt.alreadyComplete = true;
            return false;
        }

        attempt.error = TransferError::rangeNotSatisfiable(
            QString("Server rejected resume offset %1").arg(attempt.offset));
        return false;
    }

    const QString reason = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
    attempt.error = TransferError::http(status,
                                        reason.isEmpty() ? reply->errorString() : reason,
                                        parseRetryAfter(reply->rawHeader("Retry-After"), clock_->currentDateTime()));
    return false;
}

TransferError ResumableTransferExecutor::writeChunk(Attempt& attempt, QFile& file, const QByteArray& chunk,
                                                    const CancellationToken& token,
                                                    const ProgressCallback& onProgress) {
    const qint64 size = chunk.size();
    if (attempt.totalSize >= 0 && attempt.bytes + size > attempt.totalSize) {
        return TransferError::network(
            QString("Server sent more than the declared %1 bytes").arg(attempt.totalSize));
    }

    if (throttle_) {
        auto waited = throttle_->consume(size, &token);
        if (waited.hasError()) {
            return TransferError::cancelled();
        }
    }

    if (file.write(chunk) != size || !file.flush()) {
        return TransferError::localIO(QString("Failed to write %1: %2").arg(file.fileName(), file.errorString()));
    }

    attempt.bytes += size;
    persistProgress(attempt);

    const qint64 now = clock_->nowMs();
    const qint64 elapsedMs = std::max<qint64>(1, now - attempt.lastChunkMs);
    attempt.lastChunkMs = now;

    const double instant = static_cast<double>(size) * 1000.0 / static_cast<double>(elapsedMs);
    attempt.speed = attempt.speed <= 0.0
        ? instant
        : config_.speedSmoothing * instant + (1.0 - config_.speedSmoothing) * attempt.speed;

    if (onProgress) {
        TransferProgress progress;
        progress.taskId = attempt.task.id;
        progress.status = TaskStatus::Active;
        progress.bytesTransferred = attempt.bytes;
        progress.totalSize = attempt.totalSize;
        progress.bytesPerSecond = attempt.speed;
        if (attempt.totalSize >= 0 && attempt.speed > 0.0) {
            progress.etaSeconds = static_cast<qint64>(
                std::ceil(static_cast<double>(attempt.totalSize - attempt.bytes) / attempt.speed));
        }
        onProgress(progress);
    }

    return TransferError();
}

TransferOutcome ResumableTransferExecutor::finalize(Attempt& attempt, QFile& file) {
    file.close();

    if (attempt.totalSize < 0) {
        attempt.totalSize = attempt.bytes;
    }

    const QString destination = attempt.task.destinationPath;
    if (QFile::exists(destination) && !QFile::remove(destination)) {
        return failed(attempt, TransferError::localIO(QString("Cannot replace existing file %1").arg(destination)));
    }

    if (!QFile::rename(attempt.task.tempPath(), destination)) {
        return failed(attempt, TransferError::localIO(
            QString("Cannot rename %1 to %2").arg(attempt.task.tempPath(), destination)));
    }

    persistProgress(attempt);
    Logger::instance().info("Transfer {} complete: {} bytes -> {}",
                            attempt.task.id.toStdString(), attempt.bytes, destination.toStdString());

    TransferOutcome outcome;
    outcome.result = TransferOutcome::Result::Completed;
    outcome.bytesTransferred = attempt.bytes;
    outcome.totalSize = attempt.totalSize;
    outcome.etag = attempt.etag;
    return outcome;
}

TransferOutcome ResumableTransferExecutor::stopped(Attempt& attempt, const CancellationToken& token) const {
    TransferOutcome outcome;
    if (token.isCancelled()) {
        outcome.result = TransferOutcome::Result::Cancelled;
        outcome.error = TransferError::cancelled();
    } else {
        outcome.result = TransferOutcome::Result::Paused;
    }
    outcome.bytesTransferred = attempt.bytes;
    outcome.totalSize = attempt.totalSize;
    outcome.etag = attempt.etag;

    Logger::instance().info("Transfer {} stopped at byte {} ({})", attempt.task.id.toStdString(), attempt.bytes,
                            token.isCancelled() ? "cancelled" : "paused");
    return outcome;
}

TransferOutcome ResumableTransferExecutor::failed(Attempt& attempt, const TransferError& error) const {
    Logger::instance().warn("Transfer {} failed at byte {}: {}",
                            attempt.task.id.toStdString(), attempt.bytes, error.describe().toStdString());

    TransferOutcome outcome;
    outcome.result = TransferOutcome::Result::Failed;
    outcome.error = error;
    outcome.bytesTransferred = attempt.bytes;
    outcome.totalSize = attempt.totalSize;
    outcome.etag = attempt.etag;
    return outcome;
}

void ResumableTransferExecutor::persistProgress(const Attempt& attempt) {
    if (!store_) {
        return;
    }

    auto result = store_->updateProgress(attempt.task.id, attempt.bytes, attempt.totalSize, attempt.etag);
    if (result.hasError()) {
        Logger::instance().error("Transfer {}: failed to persist offset {}: {}",
                                 attempt.task.id.toStdString(), attempt.bytes,
                                 toString(result.error()).toStdString());
    }
}

} // namespace Ferry
