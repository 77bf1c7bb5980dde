#pragma once

#include "CancellationToken.hpp"
#include "TaskQueue.hpp"
#include "TransferTypes.hpp"
#include "../common/Clock.hpp"
#include "../common/Config.hpp"
#include "../common/Expected.hpp"
#include "../common/RetryPolicy.hpp"

#include <QtCore/QFutureWatcher>
#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QSet>
#include <QtCore/QThreadPool>
#include <QtCore/QTimer>
#include <chrono>
#include <memory>
#include <optional>

namespace Ferry {

class RateLimiter;
class TaskStore;
class TransferExecutor;

enum class SchedulerError {
    NotFound,
    InvalidState,
    InvalidArgument,
    StorageFailure
};

QString toString(SchedulerError error);

struct SchedulerConfig {
    int maxConcurrent = 3;
    int defaultMaxRetries = 5;
    std::chrono::milliseconds tickInterval{5000};
    RetryConfig retry = RetryConfigs::transfer();
    bool deletePartialOnCancel = true;

    static SchedulerConfig fromSettings(const Config::TransferSettings& settings);
};

/**
 * @brief Decides which transfers run, in what order, and what happens when
 * they stop.
 *
 * Every task lives in memory and in the TaskStore. Queued tasks wait in a
 * TaskQueue ordered by priority tier, not-before time and creation order. A
 * tick, run periodically and whenever a slot frees up, starts eligible tasks
 * until maxConcurrent transfers are running. A task is eligible when its
 * not-before time has passed, its retry backoff has elapsed and the current
 * network class satisfies its requirement.
 *
 * Transfers run on a private thread pool. Each one first takes a permit from
 * the shared RateLimiter and then hands the task to the executor. Pause and
 * cancel are cooperative through a per-transfer CancellationToken. A running
 * task is never interrupted to make room for a higher-priority one.
 *
 * All public methods must be called from the thread that owns the scheduler.
 */
class DownloadScheduler : public QObject {
    Q_OBJECT

public:
    DownloadScheduler(TaskStore& store,
                      TransferExecutor& executor,
                      RateLimiter& limiter,
                      SchedulerConfig config = SchedulerConfig(),
                      std::shared_ptr<Clock> clock = Clock::system(),
                      QObject* parent = nullptr);
    ~DownloadScheduler() override;

    // Loads persisted tasks, recovers those left active by a crash and starts ticking.
    // Returns the number of tasks loaded.
    Expected<int, SchedulerError> initialize();

    // Stops all running transfers; those still active are stored as queued
    void shutdown();
    bool isRunning() const { return started_; }

    // Task control
    Expected<QString, SchedulerError> enqueue(const TransferRequest& request);
    Expected<QString, SchedulerError> enqueue(const TransferTask& task);
    Expected<void, SchedulerError> remove(const QString& taskId);
    Expected<void, SchedulerError> pause(const QString& taskId);
    Expected<void, SchedulerError> resume(const QString& taskId);
    int pauseAll();
    int resumeAll();
    Expected<void, SchedulerError> setPriority(const QString& taskId, TaskPriority priority);
    Expected<void, SchedulerError> retry(const QString& taskId);
    Expected<void, SchedulerError> purge(const QString& taskId);
    Expected<int, SchedulerError> purgeFinished(std::chrono::milliseconds olderThan);

    void setMaxConcurrent(int maxConcurrent);
    int maxConcurrent() const { return config_.maxConcurrent; }
    NetworkClass networkClass() const { return networkClass_; }

    // Observation
    std::optional<TransferTask> task(const QString& taskId) const;
    QList<TransferTask> tasks() const;
    QList<TransferTask> tasksWithStatus(TaskStatus status) const;
    QStringList queuedOrder() const { return queue_.orderedIds(); }
    SchedulerState state() const;
    int runningCount() const { return static_cast<int>(running_.size()); }

public slots:
    void setNetworkClass(Ferry::NetworkClass networkClass);
    void tick();

signals:
    void taskEnqueued(const QString& taskId);
    void taskStarted(const QString& taskId);
    void taskStatusChanged(const QString& taskId, Ferry::TaskStatus status);
    void taskProgress(const Ferry::TransferProgress& progress);
    void taskCompleted(const QString& taskId);
    void taskFailed(const QString& taskId, const Ferry::TransferError& error);
    void taskRetryScheduled(const QString& taskId, int retryCount, qint64 delayMs);
    void taskCancelled(const QString& taskId);
    void taskPurged(const QString& taskId);
    void stateChanged(const Ferry::SchedulerState& state);
    void idle();

private:
    struct RunningTransfer {
        std::shared_ptr<CancellationToken> token;
        QFutureWatcher<TransferOutcome>* watcher = nullptr;
    };

    bool isEligible(const TransferTask& task, const QDateTime& now) const;
    QDateTime readyAt(const TransferTask& task) const;
    void startTransfer(TransferTask& task);
    void onTransferProgress(const TransferProgress& progress);
    void onTransferFinished(const QString& taskId);
    void applyOutcome(TransferTask& task, const TransferOutcome& outcome);
    void handleFailure(TransferTask& task, const TransferError& error);

    void pauseTask(TransferTask& task, bool byNetwork);
    void resumeTask(TransferTask& task);
    void requeue(TransferTask& task);
    void resetProgress(TransferTask& task);
    void removePartialFile(const TransferTask& task) const;

    bool persistState(TransferTask& task);
    bool persistRecord(TransferTask& task);
    void setStatus(TransferTask& task, TaskStatus status);

    Expected<void, SchedulerError> recoverInterruptedTasks();
    void scheduleTick();
    void armWakeTimer(const QDateTime& now);
    void publishState();
    void checkIdle();

    TaskStore& store_;
    TransferExecutor& executor_;
    RateLimiter& limiter_;
    SchedulerConfig config_;
    std::shared_ptr<Clock> clock_;
    RetryBackoff backoff_;

    QHash<QString, TransferTask> tasks_;
    TaskQueue queue_;
    QHash<QString, RunningTransfer> running_;
    QSet<QString> pausedByNetwork_;
    quint64 nextSequence_ = 0;

    NetworkClass networkClass_ = NetworkClass::Unmetered;
    bool started_ = false;
    bool tickPending_ = false;
    bool idleReported_ = false;
    std::optional<SchedulerState> lastState_;

    QThreadPool pool_;
    QTimer tickTimer_;
    QTimer wakeTimer_;
};

} // namespace Ferry

Q_DECLARE_METATYPE(Ferry::SchedulerError)
