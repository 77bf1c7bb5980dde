#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <optional>

namespace Ferry {

enum class TaskStatus {
    Queued,
    Active,
    Paused,
    Completed,
    Failed,
    Cancelled
};

enum class TaskPriority {
    Low = 0,
    Normal = 1,
    High = 2
};

enum class NetworkRequirement {
    Any,
    UnmeteredOnly,
    LocalOnly
};

enum class NetworkClass {
    Unmetered,
    Metered,
    Offline
};

enum class TransferErrorCategory {
    None,
    Network,
    HttpError,
    LocalIO,
    RangeNotSatisfiable,
    Cancelled,
    ExhaustedRetries
};

struct TransferError {
    TransferErrorCategory category = TransferErrorCategory::None;
    int httpStatus = 0;
    QString message;
    int retryAfterSeconds = 0;  // from a Retry-After header, 0 when absent

    static TransferError network(const QString& message);
    static TransferError http(int status, const QString& message, int retryAfterSeconds = 0);
    static TransferError localIO(const QString& message);
    static TransferError rangeNotSatisfiable(const QString& message);
    static TransferError cancelled();

    // network, 5xx, 429 and range restarts go through backoff; everything
    // else is terminal on first occurrence
    bool isRetryable() const;
    bool isNone() const { return category == TransferErrorCategory::None; }
    QString describe() const;
};

struct TransferTask {
    QString id;

    QUrl url;
    QString destinationPath;
    qint64 totalSize = -1;          // -1 until the server reports it
    qint64 bytesTransferred = 0;
    TaskStatus status = TaskStatus::Queued;

    TaskPriority priority = TaskPriority::Normal;
    QDateTime notBefore;
    NetworkRequirement networkRequirement = NetworkRequirement::Any;

    int retryCount = 0;
    QDateTime lastRetryAt;
    int maxRetries = 5;

    QDateTime createdAt;
    QDateTime updatedAt;
    QDateTime completedAt;

    QString etag;
    TransferErrorCategory lastErrorCategory = TransferErrorCategory::None;
    int lastHttpStatus = 0;
    QString lastErrorMessage;
    bool rangeRestartUsed = false;

    // Creation order tiebreak for tasks created within the same millisecond;
    // assigned by the scheduler, not persisted.
    quint64 sequence = 0;

    QString tempPath() const { return destinationPath + QStringLiteral(".part"); }
    bool hasKnownSize() const { return totalSize >= 0; }
    bool isTerminal() const;
    TransferError lastError() const;
};

struct TransferRequest {
    QUrl url;
    QString destinationPath;
    TaskPriority priority = TaskPriority::Normal;
    QDateTime notBefore;
    NetworkRequirement networkRequirement = NetworkRequirement::Any;
    std::optional<int> maxRetries;
    QString id;  // generated when empty
};

struct TransferProgress {
    QString taskId;
    TaskStatus status = TaskStatus::Active;
    qint64 bytesTransferred = 0;
    qint64 totalSize = -1;
    double bytesPerSecond = 0.0;
    qint64 etaSeconds = -1;         // -1 when unknown
};

struct TransferOutcome {
    enum class Result {
        Completed,
        Paused,
        Cancelled,
        Failed
    };

    Result result = Result::Failed;
    TransferError error;
    qint64 bytesTransferred = 0;
    qint64 totalSize = -1;
    QString etag;
};

struct SchedulerState {
    int queued = 0;
    int active = 0;
    int paused = 0;
    int maxConcurrent = 0;
    NetworkClass networkClass = NetworkClass::Unmetered;
    bool networkUsable = true;
};

QString toString(TaskStatus status);
QString toString(TaskPriority priority);
QString toString(NetworkRequirement requirement);
QString toString(NetworkClass networkClass);
QString toString(TransferErrorCategory category);

std::optional<TaskStatus> taskStatusFromString(const QString& value);
std::optional<TaskPriority> taskPriorityFromString(const QString& value);
std::optional<NetworkRequirement> networkRequirementFromString(const QString& value);
std::optional<NetworkClass> networkClassFromString(const QString& value);
std::optional<TransferErrorCategory> errorCategoryFromString(const QString& value);

bool networkSatisfies(NetworkRequirement requirement, NetworkClass networkClass);

} // namespace Ferry

Q_DECLARE_METATYPE(Ferry::TaskStatus)
Q_DECLARE_METATYPE(Ferry::TaskPriority)
Q_DECLARE_METATYPE(Ferry::NetworkClass)
Q_DECLARE_METATYPE(Ferry::TransferError)
Q_DECLARE_METATYPE(Ferry::TransferProgress)
Q_DECLARE_METATYPE(Ferry::TransferOutcome)
Q_DECLARE_METATYPE(Ferry::SchedulerState)
