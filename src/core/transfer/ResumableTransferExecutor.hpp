#pragma once

#include "TransferExecutor.hpp"
#include "../common/Clock.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QDateTime>
#include <QtCore/QString>
#include <memory>

QT_BEGIN_NAMESPACE
class QFile;
class QNetworkReply;
QT_END_NAMESPACE

namespace Ferry {

class BandwidthThrottle;
class TaskStore;

struct ExecutorConfig {
    qint64 chunkSize = 1024 * 1024;
    int requestTimeoutMs = 300000;     // without receiving any data
    QString userAgent = QStringLiteral("Ferry/1.0");
    double speedSmoothing = 0.3;       // weight of the newest chunk in the speed average
};

/**
 * @brief HTTP(S) executor that resumes from the last persisted byte offset
 *
 * Bytes are written to "<destination>.part" and renamed into place once the
 * whole body has arrived. Each chunk passes through the shared bandwidth
 * throttle, is flushed, and its offset is persisted before the next read, so
 * a crash loses at most one chunk.
 *
 * Resume requests carry "Range: bytes=N-" and, when the server supplied an
 * ETag, "If-Range". A full 200 body in answer to a range request is reported
 * as rangeNotSatisfiable without touching the partial file.
 */
class ResumableTransferExecutor : public TransferExecutor {
public:
    ResumableTransferExecutor(BandwidthThrottle* throttle,
                              TaskStore* store,
                              ExecutorConfig config = ExecutorConfig(),
                              std::shared_ptr<Clock> clock = Clock::system());
    ~ResumableTransferExecutor() override;

    TransferOutcome execute(const TransferTask& task,
                            const CancellationToken& token,
                            const ProgressCallback& onProgress) override;

    const ExecutorConfig& config() const { return config_; }

    // Seconds from a Retry-After value (delta-seconds or HTTP-date), 0 when absent or invalid
    static int parseRetryAfter(const QByteArray& value, const QDateTime& now);

private:
    struct Attempt;

    TransferError prepareTempFile(Attempt& attempt, QFile& file);
    TransferError checkDiskSpace(const Attempt& attempt) const;
    bool inspectResponse(Attempt& attempt, QNetworkReply* reply);
    TransferError writeChunk(Attempt& attempt, QFile& file, const QByteArray& chunk,
                             const CancellationToken& token, const ProgressCallback& onProgress);
    TransferOutcome finalize(Attempt& attempt, QFile& file);
    TransferOutcome stopped(Attempt& attempt, const CancellationToken& token) const;
    TransferOutcome failed(Attempt& attempt, const TransferError& error) const;
    void persistProgress(const Attempt& attempt);

    BandwidthThrottle* throttle_;
    TaskStore* store_;
    ExecutorConfig config_;
    std::shared_ptr<Clock> clock_;
};

} // namespace Ferry
