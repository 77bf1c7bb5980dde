#include "DownloadScheduler.hpp"
#include "RateLimiter.hpp"
#include "TransferExecutor.hpp"
#include "../storage/TaskStore.hpp"
#include "../common/Logger.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QUuid>
#include <algorithm>

namespace Ferry {

QString toString(SchedulerError error) {
    switch (error) {
        case SchedulerError::NotFound: return QStringLiteral("task not found");
        case SchedulerError::InvalidState: return QStringLiteral("invalid state for this operation");
        case SchedulerError::InvalidArgument: return QStringLiteral("invalid argument");
        case SchedulerError::StorageFailure: return QStringLiteral("storage failure");
    }
    return QStringLiteral("unknown scheduler error");
}

SchedulerConfig SchedulerConfig::fromSettings(const Config::TransferSettings& settings) {
    SchedulerConfig config;
    config.maxConcurrent = std::max(1, settings.maxConcurrent);
    config.defaultMaxRetries = std::max(0, settings.maxRetries);
    config.tickInterval = std::chrono::milliseconds(std::max(100, settings.tickIntervalMs));
    config.retry.initialDelay = std::chrono::milliseconds(std::max(0, settings.backoffBaseMs));
    config.retry.maxDelay = std::chrono::milliseconds(std::max(settings.backoffBaseMs, settings.backoffMaxMs));
    config.deletePartialOnCancel = settings.deletePartialOnCancel;
    return config;
}

DownloadScheduler::DownloadScheduler(TaskStore& store,
                                     TransferExecutor& executor,
                                     RateLimiter& limiter,
                                     SchedulerConfig config,
                                     std::shared_ptr<Clock> clock,
                                     QObject* parent)
    : QObject(parent)
    , store_(store)
    , executor_(executor)
    , limiter_(limiter)
    , config_(std::move(config))
    , clock_(clock ? std::move(clock) : Clock::system())
    , backoff_(config_.retry) {

    qRegisterMetaType<Ferry::TaskStatus>("Ferry::TaskStatus");
    qRegisterMetaType<Ferry::TaskPriority>("Ferry::TaskPriority");
    qRegisterMetaType<Ferry::NetworkClass>("Ferry::NetworkClass");
    qRegisterMetaType<Ferry::TransferError>("Ferry::TransferError");
    qRegisterMetaType<Ferry::TransferProgress>("Ferry::TransferProgress");
    qRegisterMetaType<Ferry::TransferOutcome>("Ferry::TransferOutcome");
    qRegisterMetaType<Ferry::SchedulerState>("Ferry::SchedulerState");

    config_.maxConcurrent = std::max(1, config_.maxConcurrent);

    // Worker threads keep their task store connection for the life of the pool
    pool_.setMaxThreadCount(config_.maxConcurrent);
    pool_.setExpiryTimeout(-1);

    tickTimer_.setInterval(static_cast<int>(config_.tickInterval.count()));
    connect(&tickTimer_, &QTimer::timeout, this, &DownloadScheduler::tick);

    wakeTimer_.setSingleShot(true);
    connect(&wakeTimer_, &QTimer::timeout, this, &DownloadScheduler::tick);
}

DownloadScheduler::~DownloadScheduler() {
    shutdown();
}

Expected<int, SchedulerError> DownloadScheduler::initialize() {
    if (started_) {
        return static_cast<int>(tasks_.size());
    }

    if (!store_.isOpen()) {
        Logger::instance().error("Scheduler: task store is not open");
        return makeUnexpected(SchedulerError::StorageFailure);
    }

    auto recovered = recoverInterruptedTasks();
    if (recovered.hasError()) {
        return makeUnexpected(recovered.error());
    }

    auto loaded = store_.listAll();
    if (loaded.hasError()) {
        Logger::instance().error("Scheduler: failed to load tasks: {}", toString(loaded.error()).toStdString());
        return makeUnexpected(SchedulerError::StorageFailure);
    }

    tasks_.clear();
    queue_.clear();
    for (TransferTask task : loaded.value()) {
        task.sequence = ++nextSequence_;
        if (task.status == TaskStatus::Queued) {
            queue_.upsert(task);
        }
        tasks_.insert(task.id, task);
    }

    started_ = true;
    tickTimer_.start();
    scheduleTick();

    Logger::instance().info("Scheduler initialized: {} tasks, {} queued, max {} concurrent",
                            tasks_.size(), queue_.size(), config_.maxConcurrent);
    return static_cast<int>(tasks_.size());
}

Expected<void, SchedulerError> DownloadScheduler::recoverInterruptedTasks() {
    auto interrupted = store_.listByStatus(TaskStatus::Active);
    if (interrupted.hasError()) {
        Logger::instance().error("Scheduler: failed to list interrupted tasks: {}",
                                 toString(interrupted.error()).toStdString());
        return makeUnexpected(SchedulerError::StorageFailure);
    }

    for (TransferTask task : interrupted.value()) {
        const QFileInfo partial(task.tempPath());
        if (task.bytesTransferred > 0 && partial.exists() && partial.size() >= task.bytesTransferred) {
            Logger::instance().info("Recovering task {}: resuming from byte {}",
                                    task.id.toStdString(), task.bytesTransferred);
        } else {
            Logger::instance().info("Recovering task {}: no usable partial file, restarting from zero",
                                    task.id.toStdString());
            resetProgress(task);
        }

        task.status = TaskStatus::Queued;
        task.updatedAt = clock_->currentDateTime();
        if (!persistRecord(task)) {
            return makeUnexpected(SchedulerError::StorageFailure);
        }
    }

    return {};
}

void DownloadScheduler::shutdown() {
    if (!started_) {
        return;
    }
    started_ = false;
    tickTimer_.stop();
    wakeTimer_.stop();

    for (auto it = running_.begin(); it != running_.end(); ++it) {
        it.value().token->requestPause();
    }

    const QStringList runningIds = running_.keys();
    for (const QString& taskId : runningIds) {
        RunningTransfer transfer = running_.take(taskId);
        transfer.watcher->disconnect(this);
        transfer.watcher->waitForFinished();
        const TransferOutcome outcome = transfer.watcher->result();
        delete transfer.watcher;

        auto it = tasks_.find(taskId);
        if (it == tasks_.end()) {
            continue;
        }

        TransferTask& task = it.value();
        if (outcome.bytesTransferred >= 0) {
            task.bytesTransferred = outcome.bytesTransferred;
            task.totalSize = outcome.totalSize;
            task.etag = outcome.etag;
        }

        if (outcome.result == TransferOutcome::Result::Completed) {
            task.status = TaskStatus::Completed;
            task.completedAt = clock_->currentDateTime();
        } else if (task.status == TaskStatus::Active) {
            task.status = TaskStatus::Queued;
        } else if (task.status == TaskStatus::Cancelled && config_.deletePartialOnCancel) {
            removePartialFile(task);
        }
        persistState(task);
    }

    pool_.waitForDone();
    Logger::instance().info("Scheduler stopped");
}

Expected<QString, SchedulerError> DownloadScheduler::enqueue(const TransferRequest& request) {
    TransferTask task;
    task.id = request.id;
    task.url = request.url;
    task.destinationPath = request.destinationPath;
    task.priority = request.priority;
    task.notBefore = request.notBefore;
    task.networkRequirement = request.networkRequirement;
    task.maxRetries = request.maxRetries.value_or(config_.defaultMaxRetries);
    return enqueue(task);
}

Expected<QString, SchedulerError> DownloadScheduler::enqueue(const TransferTask& request) {
    if (!request.url.isValid() || request.url.isEmpty() || request.destinationPath.trimmed().isEmpty()) {
        Logger::instance().warn("Scheduler: rejected task with url '{}' and destination '{}'",
                                request.url.toString().toStdString(), request.destinationPath.toStdString());
        return makeUnexpected(SchedulerError::InvalidArgument);
    }

    if (request.maxRetries < 0) {
        return makeUnexpected(SchedulerError::InvalidArgument);
    }

    const QDateTime now = clock_->currentDateTime();
    const QString taskId = request.id.isEmpty() ? QUuid::createUuid().toString(QUuid::WithoutBraces) : request.id;

    auto existing = tasks_.find(taskId);
    if (existing != tasks_.end()) {
        TransferTask& task = existing.value();
        task.priority = request.priority;
        // A pending retry backoff is never shortened by re-enqueueing
        const bool backingOff = task.status == TaskStatus::Queued && task.retryCount > 0 &&
                                task.notBefore.isValid() && task.notBefore > now;
        if (!backingOff || (request.notBefore.isValid() && request.notBefore > task.notBefore)) {
            task.notBefore = request.notBefore;
        }
        task.networkRequirement = request.networkRequirement;
        task.maxRetries = request.maxRetries;
        task.updatedAt = now;

        const bool running = running_.contains(taskId);
        if (!running) {
            task.url = request.url;
            task.destinationPath = request.destinationPath;
        } else if (task.url != request.url || task.destinationPath != request.destinationPath) {
            Logger::instance().warn("Scheduler: task {} is running; source and destination left unchanged",
                                    taskId.toStdString());
        }

        if (!(running ? persistState(task) : persistRecord(task))) {
            return makeUnexpected(SchedulerError::StorageFailure);
        }

        if (task.status == TaskStatus::Queued) {
            queue_.upsert(task);
        }

        Logger::instance().info("Task {} updated in place (priority {})",
                                taskId.toStdString(), toString(task.priority).toStdString());
        scheduleTick();
        return taskId;
    }

    TransferTask task = request;
    task.id = taskId;
    task.status = TaskStatus::Queued;
    task.createdAt = now;
    task.updatedAt = now;
    task.completedAt = QDateTime();
    task.sequence = ++nextSequence_;

    if (!persistRecord(task)) {
        return makeUnexpected(SchedulerError::StorageFailure);
    }

    tasks_.insert(task.id, task);
    queue_.upsert(task);
    idleReported_ = false;

    Logger::instance().info("Task {} enqueued: {} -> {} ({})", task.id.toStdString(),
                            task.url.toString().toStdString(), task.destinationPath.toStdString(),
                            toString(task.priority).toStdString());

    emit taskEnqueued(task.id);
    emit taskStatusChanged(task.id, TaskStatus::Queued);
    scheduleTick();
    publishState();
    return task.id;
}

Expected<void, SchedulerError> DownloadScheduler::remove(const QString& taskId) {
    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        return makeUnexpected(SchedulerError::NotFound);
    }

    TransferTask& task = it.value();
    if (task.status == TaskStatus::Cancelled) {
        return {};
    }
    if (task.status == TaskStatus::Completed) {
        return makeUnexpected(SchedulerError::InvalidState);
    }

    queue_.remove(taskId);
    pausedByNetwork_.remove(taskId);

    const TransferError cancelled = TransferError::cancelled();
    task.lastErrorCategory = cancelled.category;
    task.lastHttpStatus = 0;
    task.lastErrorMessage = cancelled.message;
    task.completedAt = clock_->currentDateTime();
    setStatus(task, TaskStatus::Cancelled);

    auto running = running_.find(taskId);
    if (running != running_.end()) {
        // Partial file is cleaned up once the worker has let go of it
        running.value().token->requestCancel();
    } else if (config_.deletePartialOnCancel) {
        removePartialFile(task);
    }

    Logger::instance().info("Task {} cancelled", taskId.toStdString());
    emit taskCancelled(taskId);
    scheduleTick();
    publishState();
    return {};
}

Expected<void, SchedulerError> DownloadScheduler::pause(const QString& taskId) {
    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        return makeUnexpected(SchedulerError::NotFound);
    }

    TransferTask& task = it.value();
    switch (task.status) {
        case TaskStatus::Paused:
            // An explicit pause keeps the task paused when the network comes back
            pausedByNetwork_.remove(taskId);
            return {};
        case TaskStatus::Active:
        case TaskStatus::Queued:
            pauseTask(task, false);
            publishState();
            return {};
        default:
            return makeUnexpected(SchedulerError::InvalidState);
    }
}

Expected<void, SchedulerError> DownloadScheduler::resume(const QString& taskId) {
    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        return makeUnexpected(SchedulerError::NotFound);
    }

    TransferTask& task = it.value();
    switch (task.status) {
        case TaskStatus::Paused:
            resumeTask(task);
            publishState();
            return {};
        case TaskStatus::Active:
        case TaskStatus::Queued:
            return {};
        default:
            return makeUnexpected(SchedulerError::InvalidState);
    }
}

int DownloadScheduler::pauseAll() {
    int paused = 0;
    for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
        TransferTask& task = it.value();
        if (task.status == TaskStatus::Active || task.status == TaskStatus::Queued) {
            pauseTask(task, false);
            ++paused;
        }
    }

    Logger::instance().info("Paused {} tasks", paused);
    publishState();
    return paused;
}

int DownloadScheduler::resumeAll() {
    int resumed = 0;
    for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
        TransferTask& task = it.value();
        if (task.status == TaskStatus::Paused) {
            resumeTask(task);
            ++resumed;
        }
    }

    Logger::instance().info("Resumed {} tasks", resumed);
    publishState();
    return resumed;
}

Expected<void, SchedulerError> DownloadScheduler::setPriority(const QString& taskId, TaskPriority priority) {
    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        return makeUnexpected(SchedulerError::NotFound);
    }

    TransferTask& task = it.value();
    if (task.isTerminal()) {
        return makeUnexpected(SchedulerError::InvalidState);
    }
    if (task.priority == priority) {
        return {};
    }

    task.priority = priority;
    task.updatedAt = clock_->currentDateTime();
    if (!persistState(task)) {
        return makeUnexpected(SchedulerError::StorageFailure);
    }

    // Running transfers keep going; only the queue position changes
    if (queue_.contains(taskId)) {
        queue_.upsert(task);
        scheduleTick();
    }

    Logger::instance().info("Task {} priority set to {}", taskId.toStdString(), toString(priority).toStdString());
    return {};
}

Expected<void, SchedulerError> DownloadScheduler::retry(const QString& taskId) {
    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        return makeUnexpected(SchedulerError::NotFound);
    }

    TransferTask& task = it.value();
    if (task.status != TaskStatus::Failed) {
        return makeUnexpected(SchedulerError::InvalidState);
    }

    task.retryCount = 0;
    task.lastRetryAt = QDateTime();
    task.notBefore = QDateTime();
    task.rangeRestartUsed = false;
    task.lastErrorCategory = TransferErrorCategory::None;
    task.lastHttpStatus = 0;
    task.lastErrorMessage.clear();

    Logger::instance().info("Task {} manually retried from byte {}", taskId.toStdString(), task.bytesTransferred);
    requeue(task);
    publishState();
    return {};
}

Expected<void, SchedulerError> DownloadScheduler::purge(const QString& taskId) {
    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        return makeUnexpected(SchedulerError::NotFound);
    }

    if (!it.value().isTerminal() || running_.contains(taskId)) {
        return makeUnexpected(SchedulerError::InvalidState);
    }

    auto removed = store_.remove(taskId);
    if (removed.hasError() && removed.error() != StorageError::DataNotFound) {
        Logger::instance().error("Failed to purge task {}: {}", taskId.toStdString(),
                                 toString(removed.error()).toStdString());
        return makeUnexpected(SchedulerError::StorageFailure);
    }

    if (it.value().status != TaskStatus::Completed) {
        removePartialFile(it.value());
    }

    tasks_.erase(it);
    pausedByNetwork_.remove(taskId);

    Logger::instance().info("Task {} purged", taskId.toStdString());
    emit taskPurged(taskId);
    return {};
}

Expected<int, SchedulerError> DownloadScheduler::purgeFinished(std::chrono::milliseconds olderThan) {
    if (olderThan.count() < 0) {
        return makeUnexpected(SchedulerError::InvalidArgument);
    }

    const QDateTime cutoff = clock_->currentDateTime().addMSecs(-olderThan.count());
    auto purged = store_.purgeFinishedBefore(cutoff);
    if (purged.hasError()) {
        Logger::instance().error("Failed to purge finished tasks: {}", toString(purged.error()).toStdString());
        return makeUnexpected(SchedulerError::StorageFailure);
    }

    QStringList removedIds;
    for (auto it = tasks_.cbegin(); it != tasks_.cend(); ++it) {
        const TransferTask& task = it.value();
        if (task.status != TaskStatus::Completed && task.status != TaskStatus::Cancelled) {
            continue;
        }
        const QDateTime finishedAt = task.completedAt.isValid() ? task.completedAt : task.updatedAt;
        if (finishedAt.isValid() && finishedAt < cutoff) {
            removedIds.append(task.id);
        }
    }

    for (const QString& taskId : removedIds) {
        tasks_.remove(taskId);
        emit taskPurged(taskId);
    }

    return purged.value();
}

void DownloadScheduler::setMaxConcurrent(int maxConcurrent) {
    const int value = std::max(1, maxConcurrent);
    if (value == config_.maxConcurrent) {
        return;
    }

    config_.maxConcurrent = value;
    pool_.setMaxThreadCount(std::max(value, pool_.maxThreadCount()));
    Logger::instance().info("Scheduler: max concurrent set to {}", value);

    scheduleTick();
    publishState();
}

std::optional<TransferTask> DownloadScheduler::task(const QString& taskId) const {
    auto it = tasks_.constFind(taskId);
    if (it == tasks_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

QList<TransferTask> DownloadScheduler::tasks() const {
    QList<TransferTask> result = tasks_.values();
    std::sort(result.begin(), result.end(), [](const TransferTask& a, const TransferTask& b) {
        return a.sequence < b.sequence;
    });
    return result;
}

QList<TransferTask> DownloadScheduler::tasksWithStatus(TaskStatus status) const {
    QList<TransferTask> result;
    for (const TransferTask& task : tasks()) {
        if (task.status == status) {
            result.append(task);
        }
    }
    return result;
}

SchedulerState DownloadScheduler::state() const {
    SchedulerState snapshot;
    for (const TransferTask& task : tasks_) {
        switch (task.status) {
            case TaskStatus::Queued: ++snapshot.queued; break;
            case TaskStatus::Active: ++snapshot.active; break;
            case TaskStatus::Paused: ++snapshot.paused; break;
            default: break;
        }
    }
    snapshot.maxConcurrent = config_.maxConcurrent;
    snapshot.networkClass = networkClass_;
    snapshot.networkUsable = networkClass_ != NetworkClass::Offline;
    return snapshot;
}

void DownloadScheduler::setNetworkClass(Ferry::NetworkClass networkClass) {
    if (networkClass == networkClass_) {
        return;
    }

    Logger::instance().info("Network changed: {} -> {}",
                            toString(networkClass_).toStdString(), toString(networkClass).toStdString());
    networkClass_ = networkClass;

    for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
        TransferTask& task = it.value();
        if (task.status == TaskStatus::Active && !networkSatisfies(task.networkRequirement, networkClass_)) {
            Logger::instance().info("Pausing task {}: requires {} network",
                                    task.id.toStdString(), toString(task.networkRequirement).toStdString());
            pauseTask(task, true);
        }
    }

    const QSet<QString> waiting = pausedByNetwork_;
    for (const QString& taskId : waiting) {
        auto it = tasks_.find(taskId);
        if (it == tasks_.end() || it.value().status != TaskStatus::Paused) {
            pausedByNetwork_.remove(taskId);
            continue;
        }
        if (networkSatisfies(it.value().networkRequirement, networkClass_)) {
            Logger::instance().info("Resuming task {} after network change", taskId.toStdString());
            resumeTask(it.value());
        }
    }

    scheduleTick();
    publishState();
}

void DownloadScheduler::tick() {
    tickPending_ = false;
    if (!started_) {
        return;
    }

    const QDateTime now = clock_->currentDateTime();
    const QStringList ordered = queue_.orderedIds();

    for (const QString& taskId : ordered) {
        if (running_.size() >= config_.maxConcurrent) {
            break;
        }

        // Still winding down from a pause that was resumed before the worker returned
        if (running_.contains(taskId)) {
            continue;
        }

        auto it = tasks_.find(taskId);
        if (it == tasks_.end()) {
            queue_.remove(taskId);
            continue;
        }

        if (!isEligible(it.value(), now)) {
            continue;
        }

        startTransfer(it.value());
    }

    armWakeTimer(now);
    publishState();
    checkIdle();
}

bool DownloadScheduler::isEligible(const TransferTask& task, const QDateTime& now) const {
    if (task.status != TaskStatus::Queued) {
        return false;
    }
    const QDateTime ready = readyAt(task);
    if (ready.isValid() && ready > now) {
        return false;
    }
    return networkSatisfies(task.networkRequirement, networkClass_);
}

// handleFailure() folds the backoff it drew into notBefore
QDateTime DownloadScheduler::readyAt(const TransferTask& task) const {
    return task.notBefore;
}

void DownloadScheduler::startTransfer(TransferTask& task) {
    queue_.remove(task.id);
    pausedByNetwork_.remove(task.id);
    setStatus(task, TaskStatus::Active);

    RunningTransfer transfer;
    transfer.token = std::make_shared<CancellationToken>();
    transfer.watcher = new QFutureWatcher<TransferOutcome>(this);

    const QString taskId = task.id;
    connect(transfer.watcher, &QFutureWatcherBase::finished, this, [this, taskId]() {
        onTransferFinished(taskId);
    });

    auto progressCallback = [this](const TransferProgress& progress) {
        QMetaObject::invokeMethod(this, [this, progress]() {
            onTransferProgress(progress);
        }, Qt::QueuedConnection);
    };

    const TransferTask snapshot = task;
    std::shared_ptr<CancellationToken> token = transfer.token;
    TransferExecutor* executor = &executor_;
    RateLimiter* limiter = &limiter_;

    QFuture<TransferOutcome> future = QtConcurrent::run(&pool_,
        [executor, limiter, snapshot, token, progressCallback]() -> TransferOutcome {
            auto permit = limiter->acquirePermit(token.get());
            if (permit.hasError()) {
                TransferOutcome outcome;
                outcome.result = token->isCancelled() ? TransferOutcome::Result::Cancelled
                                                      : TransferOutcome::Result::Paused;
                if (token->isCancelled()) {
                    outcome.error = TransferError::cancelled();
                }
                outcome.bytesTransferred = snapshot.bytesTransferred;
                outcome.totalSize = snapshot.totalSize;
                outcome.etag = snapshot.etag;
                return outcome;
            }
            return executor->execute(snapshot, *token, progressCallback);
        });

    running_.insert(taskId, transfer);
    transfer.watcher->setFuture(future);
    idleReported_ = false;

    Logger::instance().info("Task {} started at byte {} (attempt {}, priority {})",
                            taskId.toStdString(), task.bytesTransferred, task.retryCount + 1,
                            toString(task.priority).toStdString());
    emit taskStarted(taskId);
}

void DownloadScheduler::onTransferProgress(const TransferProgress& progress) {
    auto it = tasks_.find(progress.taskId);
    if (it == tasks_.end() || !running_.contains(progress.taskId)) {
        return;
    }

    TransferTask& task = it.value();
    if (progress.bytesTransferred >= task.bytesTransferred) {
        task.bytesTransferred = progress.bytesTransferred;
    }
    if (progress.totalSize >= 0) {
        task.totalSize = progress.totalSize;
    }

    TransferProgress forwarded = progress;
    forwarded.status = task.status;
    emit taskProgress(forwarded);
}

void DownloadScheduler::onTransferFinished(const QString& taskId) {
    auto running = running_.find(taskId);
    if (running == running_.end()) {
        return;
    }

    QFutureWatcher<TransferOutcome>* watcher = running.value().watcher;
    const TransferOutcome outcome = watcher->result();
    running_.erase(running);
    watcher->deleteLater();

    auto it = tasks_.find(taskId);
    if (it != tasks_.end()) {
        applyOutcome(it.value(), outcome);
    }

    scheduleTick();
    publishState();
}

void DownloadScheduler::applyOutcome(TransferTask& task, const TransferOutcome& outcome) {
    task.bytesTransferred = outcome.bytesTransferred;
    task.totalSize = outcome.totalSize;
    task.etag = outcome.etag;

    switch (outcome.result) {
        case TransferOutcome::Result::Completed:
            if (task.status != TaskStatus::Active) {
                Logger::instance().info("Task {} finished before its {} request took effect",
                                        task.id.toStdString(), toString(task.status).toStdString());
            }
            queue_.remove(task.id);
            pausedByNetwork_.remove(task.id);
            task.completedAt = clock_->currentDateTime();
            task.lastErrorCategory = TransferErrorCategory::None;
            task.lastHttpStatus = 0;
            task.lastErrorMessage.clear();
            setStatus(task, TaskStatus::Completed);
            emit taskCompleted(task.id);
            return;

        case TransferOutcome::Result::Paused:
            if (task.status == TaskStatus::Queued) {
                // Resumed while the worker was stopping
                queue_.upsert(task);
            } else if (task.status == TaskStatus::Active) {
                requeue(task);
            } else if (task.status == TaskStatus::Cancelled && config_.deletePartialOnCancel) {
                removePartialFile(task);
            }
            return;

        case TransferOutcome::Result::Cancelled:
            if (task.status != TaskStatus::Cancelled) {
                task.completedAt = clock_->currentDateTime();
                setStatus(task, TaskStatus::Cancelled);
                emit taskCancelled(task.id);
            }
            if (config_.deletePartialOnCancel) {
                removePartialFile(task);
            }
            return;

        case TransferOutcome::Result::Failed:
            if (task.status == TaskStatus::Cancelled) {
                if (config_.deletePartialOnCancel) {
                    removePartialFile(task);
                }
                return;
            }
            if (task.status == TaskStatus::Paused) {
                task.lastErrorCategory = outcome.error.category;
                task.lastHttpStatus = outcome.error.httpStatus;
                task.lastErrorMessage = outcome.error.message;
                persistState(task);
                return;
            }
            handleFailure(task, outcome.error);
            return;
    }
}

void DownloadScheduler::handleFailure(TransferTask& task, const TransferError& error) {
    const QDateTime now = clock_->currentDateTime();
    task.lastErrorCategory = error.category;
    task.lastHttpStatus = error.httpStatus;
    task.lastErrorMessage = error.message;

    if (error.category == TransferErrorCategory::Cancelled) {
        task.completedAt = now;
        setStatus(task, TaskStatus::Cancelled);
        emit taskCancelled(task.id);
        return;
    }

    // The first rejected resume offset restarts from zero without using up a retry
    if (error.category == TransferErrorCategory::RangeNotSatisfiable && !task.rangeRestartUsed) {
        Logger::instance().warn("Task {}: {}; restarting from zero", task.id.toStdString(),
                                error.describe().toStdString());
        task.rangeRestartUsed = true;
        resetProgress(task);
        task.notBefore = QDateTime();
        task.status = TaskStatus::Queued;
        task.updatedAt = now;
        persistRecord(task);
        queue_.upsert(task);
        emit taskStatusChanged(task.id, TaskStatus::Queued);
        return;
    }

    if (!error.isRetryable()) {
        Logger::instance().error("Task {} failed: {}", task.id.toStdString(), error.describe().toStdString());
        setStatus(task, TaskStatus::Failed);
        emit taskFailed(task.id, error);
        return;
    }

    task.retryCount += 1;
    task.lastRetryAt = now;

    const bool restart = error.category == TransferErrorCategory::RangeNotSatisfiable;
    if (restart) {
        resetProgress(task);
    }

    if (task.retryCount >= task.maxRetries) {
        TransferError exhausted;
        exhausted.category = TransferErrorCategory::ExhaustedRetries;
        exhausted.httpStatus = error.httpStatus;
        exhausted.message = QString("Gave up after %1 attempts: %2").arg(task.retryCount).arg(error.describe());

        task.lastErrorCategory = exhausted.category;
        task.lastErrorMessage = exhausted.message;
        Logger::instance().error("Task {} failed: {}", task.id.toStdString(), exhausted.message.toStdString());

        task.status = TaskStatus::Failed;
        task.updatedAt = now;
        if (restart) {
            persistRecord(task);
        } else {
            persistState(task);
        }
        emit taskStatusChanged(task.id, TaskStatus::Failed);
        emit taskFailed(task.id, exhausted);
        return;
    }

    const qint64 backoffMs = backoff_.delayForRetry(task.retryCount).count();
    const qint64 delayMs = std::max<qint64>(backoffMs, static_cast<qint64>(error.retryAfterSeconds) * 1000);
    task.notBefore = now.addMSecs(delayMs);
    task.status = TaskStatus::Queued;
    task.updatedAt = now;
    if (restart) {
        persistRecord(task);
    } else {
        persistState(task);
    }
    queue_.upsert(task);

    Logger::instance().warn("Task {} attempt {} failed ({}); retrying in {} ms",
                            task.id.toStdString(), task.retryCount, error.describe().toStdString(), delayMs);
    emit taskStatusChanged(task.id, TaskStatus::Queued);
    emit taskRetryScheduled(task.id, task.retryCount, delayMs);
}

void DownloadScheduler::pauseTask(TransferTask& task, bool byNetwork) {
    queue_.remove(task.id);
    if (byNetwork) {
        pausedByNetwork_.insert(task.id);
    } else {
        pausedByNetwork_.remove(task.id);
    }

    auto running = running_.find(task.id);
    if (running != running_.end()) {
        running.value().token->requestPause();
    }

    setStatus(task, TaskStatus::Paused);
    Logger::instance().info("Task {} paused at byte {}", task.id.toStdString(), task.bytesTransferred);
}

void DownloadScheduler::resumeTask(TransferTask& task) {
    pausedByNetwork_.remove(task.id);
    Logger::instance().info("Task {} resumed from byte {}", task.id.toStdString(), task.bytesTransferred);
    requeue(task);
}

void DownloadScheduler::requeue(TransferTask& task) {
    setStatus(task, TaskStatus::Queued);
    queue_.upsert(task);
    idleReported_ = false;
    scheduleTick();
}

void DownloadScheduler::resetProgress(TransferTask& task) {
    removePartialFile(task);
    task.bytesTransferred = 0;
    task.totalSize = -1;
    task.etag.clear();
}

void DownloadScheduler::removePartialFile(const TransferTask& task) const {
    const QString partial = task.tempPath();
    if (QFile::exists(partial) && !QFile::remove(partial)) {
        Logger::instance().warn("Could not delete partial file {}", partial.toStdString());
    }
}

bool DownloadScheduler::persistState(TransferTask& task) {
    if (!task.updatedAt.isValid()) {
        task.updatedAt = clock_->currentDateTime();
    }

    auto result = store_.updateState(task);
    if (result.hasError()) {
        Logger::instance().error("Failed to persist state of task {}: {}",
                                 task.id.toStdString(), toString(result.error()).toStdString());
        return false;
    }
    return true;
}

bool DownloadScheduler::persistRecord(TransferTask& task) {
    auto result = store_.upsert(task);
    if (result.hasError()) {
        Logger::instance().error("Failed to persist task {}: {}",
                                 task.id.toStdString(), toString(result.error()).toStdString());
        return false;
    }
    return true;
}

void DownloadScheduler::setStatus(TransferTask& task, TaskStatus status) {
    const bool changed = task.status != status;
    task.status = status;
    task.updatedAt = clock_->currentDateTime();
    persistState(task);

    if (changed) {
        emit taskStatusChanged(task.id, status);
    }
}

void DownloadScheduler::scheduleTick() {
    if (!started_ || tickPending_) {
        return;
    }
    tickPending_ = true;
    QTimer::singleShot(0, this, &DownloadScheduler::tick);
}

void DownloadScheduler::armWakeTimer(const QDateTime& now) {
    if (running_.size() >= config_.maxConcurrent) {
        wakeTimer_.stop();
        return;
    }

    qint64 earliestMs = -1;
    for (const QString& taskId : queue_.orderedIds()) {
        auto it = tasks_.constFind(taskId);
        if (it == tasks_.constEnd() || !networkSatisfies(it.value().networkRequirement, networkClass_)) {
            continue;
        }
        const QDateTime ready = readyAt(it.value());
        if (ready.isValid() && ready > now) {
            const qint64 waitMs = now.msecsTo(ready);
            if (earliestMs < 0 || waitMs < earliestMs) {
                earliestMs = waitMs;
            }
        }
    }

    if (earliestMs < 0 || earliestMs >= config_.tickInterval.count()) {
        wakeTimer_.stop();
        return;
    }
    wakeTimer_.start(static_cast<int>(earliestMs) + 1);
}

void DownloadScheduler::publishState() {
    const SchedulerState current = state();
    if (lastState_ &&
        lastState_->queued == current.queued &&
        lastState_->active == current.active &&
        lastState_->paused == current.paused &&
        lastState_->maxConcurrent == current.maxConcurrent &&
        lastState_->networkClass == current.networkClass) {
        return;
    }
    lastState_ = current;
    emit stateChanged(current);
}

void DownloadScheduler::checkIdle() {
    if (!running_.isEmpty()) {
        idleReported_ = false;
        return;
    }

    for (const TransferTask& task : tasks_) {
        if (task.status == TaskStatus::Queued || task.status == TaskStatus::Active) {
            idleReported_ = false;
            return;
        }
    }

    if (!idleReported_) {
        idleReported_ = true;
        Logger::instance().info("Scheduler idle");
        emit idle();
    }
}

} // namespace Ferry
