#include "TaskStore.hpp"
#include "../common/Logger.hpp"

#include <QSqlQuery>
#include <QSqlError>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QMutexLocker>
#include <algorithm>

namespace Ferry {

namespace {

std::atomic<quint64> storeSerial{0};

QVariant msOrNull(const QDateTime& dateTime) {
    if (!dateTime.isValid()) {
        return QVariant(QMetaType::fromType<qint64>());
    }
    return dateTime.toMSecsSinceEpoch();
}

QDateTime dateTimeFromColumn(const QVariant& value) {
    if (value.isNull()) {
        return QDateTime();
    }
    return QDateTime::fromMSecsSinceEpoch(value.toLongLong());
}

} // namespace

QString toString(StorageError error) {
    switch (error) {
        case StorageError::DatabaseNotOpen: return QStringLiteral("database not open");
        case StorageError::ConnectionFailed: return QStringLiteral("connection failed");
        case StorageError::QueryFailed: return QStringLiteral("query failed");
        case StorageError::DataNotFound: return QStringLiteral("not found");
        case StorageError::InvalidData: return QStringLiteral("invalid data");
        case StorageError::ConstraintViolation: return QStringLiteral("constraint violation");
    }
    return QStringLiteral("unknown storage error");
}

TaskStore::ThreadConnection::~ThreadConnection() {
    if (QSqlDatabase::contains(name)) {
        {
            QSqlDatabase db = QSqlDatabase::database(name, false);
            if (db.isOpen()) {
                db.close();
            }
        }
        QSqlDatabase::removeDatabase(name);
    }
}

TaskStore::TaskStore(std::shared_ptr<Clock> clock, QObject* parent)
    : QObject(parent)
    , clock_(clock ? std::move(clock) : Clock::system())
    , connectionPrefix_(QString("FerryTasks_%1").arg(++storeSerial)) {

    qRegisterMetaType<Ferry::StorageError>("Ferry::StorageError");

    sqlUpsertTask_ = R"(
        INSERT INTO transfer_tasks (id, url, destination_path, total_size, bytes_transferred,
                                    status, priority, not_before, network_requirement,
                                    retry_count, last_retry_at, max_retries, created_at,
                                    updated_at, completed_at, etag, last_error_category,
                                    last_http_status, last_error_message, range_restart_used)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            url = excluded.url,
            destination_path = excluded.destination_path,
            total_size = excluded.total_size,
            bytes_transferred = excluded.bytes_transferred,
            status = excluded.status,
            priority = excluded.priority,
            not_before = excluded.not_before,
            network_requirement = excluded.network_requirement,
            retry_count = excluded.retry_count,
            last_retry_at = excluded.last_retry_at,
            max_retries = excluded.max_retries,
            updated_at = excluded.updated_at,
            completed_at = excluded.completed_at,
            etag = excluded.etag,
            last_error_category = excluded.last_error_category,
            last_http_status = excluded.last_http_status,
            last_error_message = excluded.last_error_message,
            range_restart_used = excluded.range_restart_used
    )";

    sqlSelectTask_ = R"(
        SELECT id, url, destination_path, total_size, bytes_transferred, status, priority,
               not_before, network_requirement, retry_count, last_retry_at, max_retries,
               created_at, updated_at, completed_at, etag, last_error_category,
               last_http_status, last_error_message, range_restart_used
        FROM transfer_tasks WHERE id = ?
    )";

    sqlSelectAll_ = R"(
        SELECT * FROM transfer_tasks ORDER BY created_at ASC, id ASC
    )";

    sqlSelectByStatus_ = R"(
        SELECT * FROM transfer_tasks WHERE status = ?
        ORDER BY priority DESC, created_at ASC, id ASC
    )";

    sqlUpdateProgress_ = R"(
        UPDATE transfer_tasks SET bytes_transferred = ?, total_size = ?, etag = ?, updated_at = ?
        WHERE id = ?
    )";

    sqlUpdateState_ = R"(
        UPDATE transfer_tasks SET status = ?, priority = ?, not_before = ?,
                                  network_requirement = ?, retry_count = ?, last_retry_at = ?,
                                  max_retries = ?, updated_at = ?, completed_at = ?,
                                  last_error_category = ?, last_http_status = ?,
                                  last_error_message = ?, range_restart_used = ?
        WHERE id = ?
    )";

    sqlDeleteTask_ = "DELETE FROM transfer_tasks WHERE id = ?";

    sqlPurgeFinished_ = R"(
        DELETE FROM transfer_tasks
        WHERE status IN ('completed', 'cancelled')
          AND COALESCE(completed_at, updated_at) < ?
    )";
}

TaskStore::~TaskStore() {
    close();
}

Expected<bool, StorageError> TaskStore::initialize(const QString& databasePath) {
    QString dbPath = databasePath;
    if (dbPath.isEmpty()) {
        QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        QDir().mkpath(dataDir);
        dbPath = QDir(dataDir).filePath("transfers.db");
    }

    QFileInfo dbInfo(dbPath);
    if (!QDir().mkpath(dbInfo.absolutePath())) {
        Logger::instance().error("Cannot create database directory: {}", dbInfo.absolutePath().toStdString());
        return makeUnexpected(StorageError::ConnectionFailed);
    }

    if (open_.load()) {
        close();
    }

    {
        QMutexLocker locker(&registryMutex_);
        databasePath_ = dbInfo.absoluteFilePath();
    }
    open_.store(true);

    auto dbResult = connection();
    if (dbResult.hasError()) {
        open_.store(false);
        return makeUnexpected(dbResult.error());
    }

    auto createResult = createTables(dbResult.value());
    if (createResult.hasError()) {
        close();
        return createResult;
    }

    Logger::instance().info("Task store initialized: {}", dbInfo.absoluteFilePath().toStdString());
    return true;
}

void TaskStore::close() {
    QMutexLocker locker(&registryMutex_);
    open_.store(false);
    threadConnections_.setLocalData(nullptr);

    for (const QString& name : connectionNames_) {
        {
            QSqlDatabase db = QSqlDatabase::database(name, false);
            if (db.isOpen()) {
                db.close();
            }
        }
        QSqlDatabase::removeDatabase(name);
    }
    connectionNames_.clear();
}

bool TaskStore::isOpen() const {
    return open_.load();
}

QString TaskStore::databasePath() const {
    QMutexLocker locker(&registryMutex_);
    return databasePath_;
}

Expected<bool, StorageError> TaskStore::upsert(const TransferTask& task) {
    auto validateResult = validateTask(task);
    if (validateResult.hasError()) {
        return validateResult;
    }

    auto taskLock = lockFor(task.id);
    QMutexLocker locker(taskLock.get());

    auto queryResult = prepareQuery(sqlUpsertTask_);
    if (queryResult.hasError()) {
        return makeUnexpected(queryResult.error());
    }

    QSqlQuery query = std::move(queryResult.value());
    bindTaskParams(query, task);

    return executeQuery(query);
}

Expected<TransferTask, StorageError> TaskStore::get(const QString& taskId) {
    if (taskId.trimmed().isEmpty()) {
        return makeUnexpected(StorageError::InvalidData);
    }

    auto queryResult = prepareQuery(sqlSelectTask_);
    if (queryResult.hasError()) {
        return makeUnexpected(queryResult.error());
    }

    QSqlQuery query = std::move(queryResult.value());
    query.bindValue(0, taskId);

    auto executeResult = executeQuery(query);
    if (executeResult.hasError()) {
        return makeUnexpected(executeResult.error());
    }

    if (!query.next()) {
        return makeUnexpected(StorageError::DataNotFound);
    }

    return taskFromQuery(query);
}

Expected<QList<TransferTask>, StorageError> TaskStore::listAll() {
    return selectTasks(sqlSelectAll_);
}

Expected<QList<TransferTask>, StorageError> TaskStore::listByStatus(TaskStatus status) {
    return selectTasks(sqlSelectByStatus_, {toString(status)});
}

Expected<bool, StorageError> TaskStore::remove(const QString& taskId) {
    if (taskId.trimmed().isEmpty()) {
        return makeUnexpected(StorageError::InvalidData);
    }

    auto taskLock = lockFor(taskId);
    {
        QMutexLocker locker(taskLock.get());

        auto queryResult = prepareQuery(sqlDeleteTask_);
        if (queryResult.hasError()) {
            return makeUnexpected(queryResult.error());
        }

        QSqlQuery query = std::move(queryResult.value());
        query.bindValue(0, taskId);

        auto executeResult = executeQuery(query);
        if (executeResult.hasError()) {
            return executeResult;
        }

        if (query.numRowsAffected() == 0) {
            return makeUnexpected(StorageError::DataNotFound);
        }
    }

    QMutexLocker registryLocker(&registryMutex_);
    taskLocks_.remove(taskId);
    return true;
}

Expected<bool, StorageError> TaskStore::updateProgress(const QString& taskId, qint64 bytesTransferred,
                                                       qint64 totalSize, const QString& etag) {
    if (taskId.trimmed().isEmpty() || bytesTransferred < 0) {
        return makeUnexpected(StorageError::InvalidData);
    }

    if (totalSize >= 0 && bytesTransferred > totalSize) {
        Logger::instance().error("Rejected progress for {}: {} bytes exceeds total {}",
                                 taskId.toStdString(), bytesTransferred, totalSize);
        return makeUnexpected(StorageError::InvalidData);
    }

    auto taskLock = lockFor(taskId);
    QMutexLocker locker(taskLock.get());

    auto queryResult = prepareQuery(sqlUpdateProgress_);
    if (queryResult.hasError()) {
        return makeUnexpected(queryResult.error());
    }

    QSqlQuery query = std::move(queryResult.value());
    query.bindValue(0, bytesTransferred);
    query.bindValue(1, totalSize >= 0 ? QVariant(totalSize) : QVariant(QMetaType::fromType<qint64>()));
    query.bindValue(2, etag);
    query.bindValue(3, clock_->currentDateTime().toMSecsSinceEpoch());
    query.bindValue(4, taskId);

    auto executeResult = executeQuery(query);
    if (executeResult.hasError()) {
        return executeResult;
    }

    if (query.numRowsAffected() == 0) {
        return makeUnexpected(StorageError::DataNotFound);
    }

    return true;
}

Expected<bool, StorageError> TaskStore::updateState(const TransferTask& task) {
    if (task.id.trimmed().isEmpty() || task.retryCount < 0 || task.maxRetries < 0) {
        return makeUnexpected(StorageError::InvalidData);
    }

    auto taskLock = lockFor(task.id);
    QMutexLocker locker(taskLock.get());

    auto queryResult = prepareQuery(sqlUpdateState_);
    if (queryResult.hasError()) {
        return makeUnexpected(queryResult.error());
    }

    QSqlQuery query = std::move(queryResult.value());
    const QDateTime updatedAt = task.updatedAt.isValid() ? task.updatedAt : clock_->currentDateTime();

    query.bindValue(0, toString(task.status));
    query.bindValue(1, static_cast<int>(task.priority));
    query.bindValue(2, msOrNull(task.notBefore));
    query.bindValue(3, toString(task.networkRequirement));
    query.bindValue(4, task.retryCount);
    query.bindValue(5, msOrNull(task.lastRetryAt));
    query.bindValue(6, task.maxRetries);
    query.bindValue(7, updatedAt.toMSecsSinceEpoch());
    query.bindValue(8, msOrNull(task.completedAt));
    query.bindValue(9, toString(task.lastErrorCategory));
    query.bindValue(10, task.lastHttpStatus);
    query.bindValue(11, task.lastErrorMessage);
    query.bindValue(12, task.rangeRestartUsed ? 1 : 0);
    query.bindValue(13, task.id);  // WHERE condition

    auto executeResult = executeQuery(query);
    if (executeResult.hasError()) {
        return executeResult;
    }

    if (query.numRowsAffected() == 0) {
        return makeUnexpected(StorageError::DataNotFound);
    }

    return true;
}

Expected<int, StorageError> TaskStore::purgeFinishedBefore(const QDateTime& cutoff) {
    if (!cutoff.isValid()) {
        return makeUnexpected(StorageError::InvalidData);
    }

    auto queryResult = prepareQuery(sqlPurgeFinished_);
    if (queryResult.hasError()) {
        return makeUnexpected(queryResult.error());
    }

    QSqlQuery query = std::move(queryResult.value());
    query.bindValue(0, cutoff.toMSecsSinceEpoch());

    auto executeResult = executeQuery(query);
    if (executeResult.hasError()) {
        return makeUnexpected(executeResult.error());
    }

    const int purged = query.numRowsAffected();
    if (purged > 0) {
        Logger::instance().info("Purged {} finished transfer records", purged);
    }
    return purged;
}

Expected<int, StorageError> TaskStore::count() {
    auto queryResult = prepareQuery("SELECT COUNT(*) FROM transfer_tasks");
    if (queryResult.hasError()) {
        return makeUnexpected(queryResult.error());
    }

    QSqlQuery query = std::move(queryResult.value());
    auto executeResult = executeQuery(query);
    if (executeResult.hasError()) {
        return makeUnexpected(executeResult.error());
    }

    if (!query.next()) {
        return makeUnexpected(StorageError::QueryFailed);
    }
    return query.value(0).toInt();
}

Expected<QSqlDatabase, StorageError> TaskStore::connection() {
    if (!open_.load()) {
        return makeUnexpected(StorageError::DatabaseNotOpen);
    }

    QMutexLocker locker(&registryMutex_);

    // close() removes every connection, so a stale thread-local entry is replaced
    if (threadConnections_.hasLocalData()) {
        const QString name = threadConnections_.localData()->name;
        if (QSqlDatabase::contains(name)) {
            QSqlDatabase db = QSqlDatabase::database(name, false);
            if (db.isOpen() || db.open()) {
                return db;
            }
            Logger::instance().error("Failed to reopen database connection {}: {}",
                                     name.toStdString(), db.lastError().text().toStdString());
            return makeUnexpected(StorageError::ConnectionFailed);
        }
    }

    const QString name = QString("%1_%2").arg(connectionPrefix_).arg(++nextConnectionId_);
    QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", name);
    db.setDatabaseName(databasePath_);
    db.setConnectOptions(QString("QSQLITE_BUSY_TIMEOUT=%1").arg(BUSY_TIMEOUT_MS));

    if (!db.open()) {
        Logger::instance().error("Failed to open database: {}", db.lastError().text().toStdString());
        db = QSqlDatabase();
        QSqlDatabase::removeDatabase(name);
        return makeUnexpected(StorageError::ConnectionFailed);
    }

    configureConnection(db);
    threadConnections_.setLocalData(new ThreadConnection(name));
    pruneConnectionNames();
    connectionNames_.append(name);
    Logger::instance().debug("Opened task store connection {}", name.toStdString());
    return db;
}

int TaskStore::openConnectionCount() const {
    QMutexLocker locker(&registryMutex_);
    int count = 0;
    for (const QString& name : connectionNames_) {
        if (QSqlDatabase::contains(name)) {
            ++count;
        }
    }
    return count;
}

void TaskStore::pruneConnectionNames() {
    connectionNames_.erase(std::remove_if(connectionNames_.begin(), connectionNames_.end(),
                                          [](const QString& name) { return !QSqlDatabase::contains(name); }),
                           connectionNames_.end());
}

void TaskStore::configureConnection(QSqlDatabase& db) {
    QSqlQuery config(db);

    const QStringList pragmas = {
        "PRAGMA journal_mode = WAL",
        "PRAGMA synchronous = NORMAL",
        QString("PRAGMA busy_timeout = %1").arg(BUSY_TIMEOUT_MS)
    };

    for (const QString& pragma : pragmas) {
        if (!config.exec(pragma)) {
            Logger::instance().warn("{} failed: {}", pragma.toStdString(),
                                    config.lastError().text().toStdString());
        }
    }
}

Expected<bool, StorageError> TaskStore::createTables(QSqlDatabase& db) {
    QStringList createStatements = {
        R"(CREATE TABLE IF NOT EXISTS transfer_tasks (
            id TEXT PRIMARY KEY CHECK(length(trim(id)) > 0),
            url TEXT NOT NULL CHECK(length(trim(url)) > 0),
            destination_path TEXT NOT NULL CHECK(length(trim(destination_path)) > 0),
            total_size INTEGER NULL CHECK(total_size IS NULL OR total_size >= 0),
            bytes_transferred INTEGER NOT NULL DEFAULT 0 CHECK(bytes_transferred >= 0),
            status TEXT NOT NULL DEFAULT 'queued' CHECK(status IN ('queued', 'active', 'paused', 'completed', 'failed', 'cancelled')),
            priority INTEGER NOT NULL DEFAULT 1 CHECK(priority BETWEEN 0 AND 2),
            not_before INTEGER NULL,
            network_requirement TEXT NOT NULL DEFAULT 'any' CHECK(network_requirement IN ('any', 'unmetered', 'local')),
            retry_count INTEGER NOT NULL DEFAULT 0 CHECK(retry_count >= 0),
            last_retry_at INTEGER NULL,
            max_retries INTEGER NOT NULL DEFAULT 5 CHECK(max_retries >= 0),
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            completed_at INTEGER NULL,
            etag TEXT NOT NULL DEFAULT '',
            last_error_category TEXT NOT NULL DEFAULT 'none',
            last_http_status INTEGER NOT NULL DEFAULT 0,
            last_error_message TEXT NOT NULL DEFAULT '',
            range_restart_used INTEGER NOT NULL DEFAULT 0,
            CHECK(total_size IS NULL OR bytes_transferred <= total_size)
        ))",

        "CREATE INDEX IF NOT EXISTS idx_transfer_tasks_status ON transfer_tasks(status)",
        "CREATE INDEX IF NOT EXISTS idx_transfer_tasks_not_before ON transfer_tasks(not_before)",
        "CREATE INDEX IF NOT EXISTS idx_transfer_tasks_priority ON transfer_tasks(priority DESC, created_at ASC)"
    };

    for (const QString& statement : createStatements) {
        QSqlQuery query(db);
        if (!query.exec(statement)) {
            Logger::instance().error("Failed to create table: {}", query.lastError().text().toStdString());
            return makeUnexpected(StorageError::QueryFailed);
        }
    }

    return true;
}

Expected<QSqlQuery, StorageError> TaskStore::prepareQuery(const QString& sql) {
    auto dbResult = connection();
    if (dbResult.hasError()) {
        return makeUnexpected(dbResult.error());
    }

    QSqlQuery query(dbResult.value());
    if (!query.prepare(sql)) {
        Logger::instance().error("Failed to prepare query: {}", query.lastError().text().toStdString());
        reportError(StorageError::QueryFailed, query.lastError().text());
        return makeUnexpected(StorageError::QueryFailed);
    }

    return query;
}

Expected<bool, StorageError> TaskStore::executeQuery(QSqlQuery& query) {
    if (!query.exec()) {
        Logger::instance().error("Query execution failed: {}", query.lastError().text().toStdString());
        const StorageError error = mapSqlError(query.lastError());
        reportError(error, query.lastError().text());
        return makeUnexpected(error);
    }

    return true;
}

Expected<QList<TransferTask>, StorageError> TaskStore::selectTasks(const QString& sql, const QVariantList& params) {
    auto queryResult = prepareQuery(sql);
    if (queryResult.hasError()) {
        return makeUnexpected(queryResult.error());
    }

    QSqlQuery query = std::move(queryResult.value());
    for (int i = 0; i < params.size(); ++i) {
        query.bindValue(i, params[i]);
    }

    auto executeResult = executeQuery(query);
    if (executeResult.hasError()) {
        return makeUnexpected(executeResult.error());
    }

    QList<TransferTask> tasks;
    while (query.next()) {
        tasks.append(taskFromQuery(query));
    }

    return tasks;
}

TransferTask TaskStore::taskFromQuery(const QSqlQuery& query) const {
    TransferTask task;

    task.id = query.value("id").toString();
    task.url = QUrl(query.value("url").toString());
    task.destinationPath = query.value("destination_path").toString();

    const QVariant totalSize = query.value("total_size");
    task.totalSize = totalSize.isNull() ? -1 : totalSize.toLongLong();
    task.bytesTransferred = query.value("bytes_transferred").toLongLong();

    const QString status = query.value("status").toString();
    task.status = taskStatusFromString(status).value_or(TaskStatus::Queued);

    const int priority = query.value("priority").toInt();
    task.priority = static_cast<TaskPriority>(qBound(0, priority, 2));

    task.notBefore = dateTimeFromColumn(query.value("not_before"));
    task.networkRequirement = networkRequirementFromString(query.value("network_requirement").toString())
                                  .value_or(NetworkRequirement::Any);

    task.retryCount = query.value("retry_count").toInt();
    task.lastRetryAt = dateTimeFromColumn(query.value("last_retry_at"));
    task.maxRetries = query.value("max_retries").toInt();

    task.createdAt = dateTimeFromColumn(query.value("created_at"));
    task.updatedAt = dateTimeFromColumn(query.value("updated_at"));
    task.completedAt = dateTimeFromColumn(query.value("completed_at"));

    task.etag = query.value("etag").toString();
    task.lastErrorCategory = errorCategoryFromString(query.value("last_error_category").toString())
                                 .value_or(TransferErrorCategory::None);
    task.lastHttpStatus = query.value("last_http_status").toInt();
    task.lastErrorMessage = query.value("last_error_message").toString();
    task.rangeRestartUsed = query.value("range_restart_used").toInt() != 0;

    return task;
}

void TaskStore::bindTaskParams(QSqlQuery& query, const TransferTask& task) const {
    const QDateTime createdAt = task.createdAt.isValid() ? task.createdAt : QDateTime::currentDateTimeUtc();
    const QDateTime updatedAt = task.updatedAt.isValid() ? task.updatedAt : createdAt;

    query.bindValue(0, task.id);
    query.bindValue(1, task.url.toString());
    query.bindValue(2, task.destinationPath);
    query.bindValue(3, task.hasKnownSize() ? QVariant(task.totalSize) : QVariant(QMetaType::fromType<qint64>()));
    query.bindValue(4, task.bytesTransferred);
    query.bindValue(5, toString(task.status));
    query.bindValue(6, static_cast<int>(task.priority));
    query.bindValue(7, msOrNull(task.notBefore));
    query.bindValue(8, toString(task.networkRequirement));
    query.bindValue(9, task.retryCount);
    query.bindValue(10, msOrNull(task.lastRetryAt));
    query.bindValue(11, task.maxRetries);
    query.bindValue(12, createdAt.toMSecsSinceEpoch());
    query.bindValue(13, updatedAt.toMSecsSinceEpoch());
    query.bindValue(14, msOrNull(task.completedAt));
    query.bindValue(15, task.etag);
    query.bindValue(16, toString(task.lastErrorCategory));
    query.bindValue(17, task.lastHttpStatus);
    query.bindValue(18, task.lastErrorMessage);
    query.bindValue(19, task.rangeRestartUsed ? 1 : 0);
}

Expected<bool, StorageError> TaskStore::validateTask(const TransferTask& task) const {
    if (task.id.trimmed().isEmpty() || task.id.length() > 255) {
        return makeUnexpected(StorageError::InvalidData);
    }

    if (!task.url.isValid() || task.url.isEmpty() || task.destinationPath.trimmed().isEmpty()) {
        return makeUnexpected(StorageError::InvalidData);
    }

    if (task.bytesTransferred < 0 || task.retryCount < 0 || task.maxRetries < 0) {
        return makeUnexpected(StorageError::InvalidData);
    }

    // Known size bounds the progress
    if (task.hasKnownSize() && task.bytesTransferred > task.totalSize) {
        return makeUnexpected(StorageError::InvalidData);
    }

    return true;
}

std::shared_ptr<QMutex> TaskStore::lockFor(const QString& taskId) {
    QMutexLocker locker(&registryMutex_);
    auto it = taskLocks_.find(taskId);
    if (it == taskLocks_.end()) {
        it = taskLocks_.insert(taskId, std::make_shared<QMutex>());
    }
    return it.value();
}

StorageError TaskStore::mapSqlError(const QSqlError& error) const {
    QString errorText = error.text().toLower();

    if (errorText.contains("unique constraint") ||
        errorText.contains("check constraint") ||
        errorText.contains("not null constraint") ||
        errorText.contains("constraint failed")) {
        return StorageError::ConstraintViolation;
    }

    switch (error.type()) {
        case QSqlError::ConnectionError:
            return StorageError::ConnectionFailed;
        case QSqlError::StatementError:
        case QSqlError::TransactionError:
        case QSqlError::UnknownError:
        default:
            return StorageError::QueryFailed;
    }
}

void TaskStore::reportError(StorageError error, const QString& description) {
    emit databaseError(error, description);
}

} // namespace Ferry
