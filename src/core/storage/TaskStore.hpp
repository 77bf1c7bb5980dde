#pragma once

#include <QObject>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QMutex>
#include <QHash>
#include <QThreadStorage>
#include <QDateTime>
#include <QVariant>
#include <atomic>
#include <memory>
#include "../common/Clock.hpp"
#include "../common/Expected.hpp"
#include "../transfer/TransferTypes.hpp"

namespace Ferry {

enum class StorageError {
    DatabaseNotOpen,
    ConnectionFailed,
    QueryFailed,
    DataNotFound,
    InvalidData,
    ConstraintViolation
};

QString toString(StorageError error);

/**
 * @brief SQLite-backed persistence for transfer task records
 *
 * Qt SQL connections are bound to the thread that opened them, so every
 * calling thread gets its own connection to the same WAL-mode database. The
 * connection is held in thread-local storage and removed when its thread
 * exits. Writes to one record are serialized through a per-task lock;
 * writes to different records proceed independently.
 *
 * The executor owns the byte-progress columns of an active task and writes
 * them through updateProgress(). The scheduler owns every other column and
 * writes them through updateState(); upsert() rewrites the whole record and is
 * only used for tasks that are not running.
 */
class TaskStore : public QObject {
    Q_OBJECT

public:
    explicit TaskStore(std::shared_ptr<Clock> clock = nullptr, QObject* parent = nullptr);
    ~TaskStore();

    // Database lifecycle
    Expected<bool, StorageError> initialize(const QString& databasePath = QString());
    void close();
    bool isOpen() const;
    QString databasePath() const;

    // Full-record operations
    Expected<bool, StorageError> upsert(const TransferTask& task);
    Expected<TransferTask, StorageError> get(const QString& taskId);
    Expected<QList<TransferTask>, StorageError> listAll();
    Expected<QList<TransferTask>, StorageError> listByStatus(TaskStatus status);
    Expected<bool, StorageError> remove(const QString& taskId);

    // Column-scoped updates
    Expected<bool, StorageError> updateProgress(const QString& taskId, qint64 bytesTransferred,
                                                qint64 totalSize, const QString& etag);
    Expected<bool, StorageError> updateState(const TransferTask& task);

    // Maintenance
    Expected<int, StorageError> purgeFinishedBefore(const QDateTime& cutoff);
    Expected<int, StorageError> count();
    int openConnectionCount() const;

signals:
    void databaseError(Ferry::StorageError error, const QString& description);

private:
    Expected<QSqlDatabase, StorageError> connection();
    Expected<bool, StorageError> createTables(QSqlDatabase& db);
    void configureConnection(QSqlDatabase& db);

    // SQL helpers
    Expected<QSqlQuery, StorageError> prepareQuery(const QString& sql);
    Expected<bool, StorageError> executeQuery(QSqlQuery& query);
    Expected<QList<TransferTask>, StorageError> selectTasks(const QString& sql, const QVariantList& params = {});

    // Record conversion
    TransferTask taskFromQuery(const QSqlQuery& query) const;
    void bindTaskParams(QSqlQuery& query, const TransferTask& task) const;

    Expected<bool, StorageError> validateTask(const TransferTask& task) const;
    std::shared_ptr<QMutex> lockFor(const QString& taskId);
    StorageError mapSqlError(const QSqlError& error) const;
    void reportError(StorageError error, const QString& description);

    // Owns one thread's named connection and removes it when the thread exits
    struct ThreadConnection {
        explicit ThreadConnection(const QString& connectionName) : name(connectionName) {}
        ~ThreadConnection();

        QString name;
    };

    void pruneConnectionNames();

    std::shared_ptr<Clock> clock_;
    QString connectionPrefix_;
    QString databasePath_;
    std::atomic<bool> open_{false};
    std::atomic<quint64> nextConnectionId_{0};
    QThreadStorage<ThreadConnection*> threadConnections_;

    // Guards databasePath_, connectionNames_ and taskLocks_
    mutable QMutex registryMutex_;
    QStringList connectionNames_;
    QHash<QString, std::shared_ptr<QMutex>> taskLocks_;

    QString sqlUpsertTask_;
    QString sqlSelectTask_;
    QString sqlSelectAll_;
    QString sqlSelectByStatus_;
    QString sqlUpdateProgress_;
    QString sqlUpdateState_;
    QString sqlDeleteTask_;
    QString sqlPurgeFinished_;

    static const int BUSY_TIMEOUT_MS = 5000;
};

} // namespace Ferry

Q_DECLARE_METATYPE(Ferry::StorageError)
