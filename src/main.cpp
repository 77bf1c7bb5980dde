#include <QtCore/QCoreApplication>
#include <QtCore/QCommandLineParser>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QTextStream>
#include <QtCore/QUrl>
#include <algorithm>

#include "core/common/Logger.hpp"
#include "core/common/Config.hpp"
#include "core/storage/TaskStore.hpp"
#include "core/transfer/BandwidthThrottle.hpp"
#include "core/transfer/DownloadScheduler.hpp"
#include "core/transfer/RateLimiter.hpp"
#include "core/transfer/ResumableTransferExecutor.hpp"

namespace {

// Accepts plain bytes or a K/M/G suffix (binary multiples)
qint64 parseByteRate(const QString& text, bool* ok) {
    QString value = text.trimmed().toUpper();
    qint64 multiplier = 1;
    if (value.endsWith('G')) {
        multiplier = 1024LL * 1024 * 1024;
    } else if (value.endsWith('M')) {
        multiplier = 1024LL * 1024;
    } else if (value.endsWith('K')) {
        multiplier = 1024LL;
    }
    if (multiplier != 1) {
        value.chop(1);
    }

    const qint64 number = value.toLongLong(ok);
    if (!*ok || number < 0) {
        *ok = false;
        return 0;
    }
    return number * multiplier;
}

QString destinationFor(const QUrl& url, const QString& directory) {
    QString name = QFileInfo(url.path()).fileName();
    if (name.isEmpty()) {
        name = url.host().isEmpty() ? QStringLiteral("download") : url.host();
    }
    return QDir(directory).filePath(name);
}

QString formatBytes(qint64 bytes) {
    if (bytes < 0) {
        return QStringLiteral("?");
    }
    if (bytes >= 1024LL * 1024 * 1024) {
        return QString::number(bytes / (1024.0 * 1024.0 * 1024.0), 'f', 2) + " GiB";
    }
    if (bytes >= 1024LL * 1024) {
        return QString::number(bytes / (1024.0 * 1024.0), 'f', 1) + " MiB";
    }
    if (bytes >= 1024) {
        return QString::number(bytes / 1024.0, 'f', 1) + " KiB";
    }
    return QString::number(bytes) + " B";
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("Ferry");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Ferry");

    QCommandLineParser parser;
    parser.setApplicationDescription("Queued, resumable HTTP downloads");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("urls", "URLs to download. Without any, stored unfinished tasks are resumed.", "[urls...]");

    QCommandLineOption dirOption({"d", "dir"}, "Download directory.", "path");
    QCommandLineOption dbOption("db", "Task database file.", "path");
    QCommandLineOption rateOption({"r", "rate"}, "Bandwidth limit in bytes per second (K, M, G suffixes), 0 for unlimited.", "rate");
    QCommandLineOption burstOption("burst", "Bandwidth burst size in bytes (K, M, G suffixes).", "bytes");
    QCommandLineOption concurrentOption({"c", "concurrent"}, "Maximum simultaneous transfers.", "count");
    QCommandLineOption priorityOption({"p", "priority"}, "Priority of new tasks: low, normal or high.", "priority", "normal");
    QCommandLineOption networkOption("network", "Network requirement of new tasks: any, unmetered or local.", "requirement", "any");
    QCommandLineOption configOption("config", "Settings file (INI).", "path");
    QCommandLineOption listOption({"l", "list"}, "List stored tasks and exit.");
    QCommandLineOption verboseOption({"v", "verbose"}, "Debug logging.");
    QCommandLineOption resumeOption("resume-paused", "Resume paused tasks from earlier runs.");

    parser.addOptions({dirOption, dbOption, rateOption, burstOption, concurrentOption,
                       priorityOption, networkOption, configOption, listOption, verboseOption,
                       resumeOption});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    Ferry::Config::instance().initialize("Ferry", "Ferry", parser.value(configOption));
    auto& config = Ferry::Config::instance();

    const QString logPath = QDir(config.getDataPath()).filePath("ferry.log");
    Ferry::Logger::instance().initialize(logPath.toStdString(),
                                         parser.isSet(verboseOption) ? Ferry::Logger::Level::Debug
                                                                     : Ferry::Logger::Level::Info,
                                         parser.isSet(verboseOption));
    Ferry::Logger::instance().info("Starting Ferry v{}", app.applicationVersion().toStdString());

    auto transferSettings = config.getTransferSettings();
    auto limiterSettings = config.getRateLimiterSettings();
    auto throttleSettings = config.getThrottleSettings();
    auto storageSettings = config.getStorageSettings();

    if (parser.isSet(concurrentOption)) {
        bool ok = false;
        const int value = parser.value(concurrentOption).toInt(&ok);
        if (!ok || value < 1) {
            err << "Invalid --concurrent value: " << parser.value(concurrentOption) << Qt::endl;
            return 2;
        }
        transferSettings.maxConcurrent = value;
        limiterSettings.maxConcurrent = std::max(limiterSettings.maxConcurrent, value);
    }
    if (parser.isSet(rateOption)) {
        bool ok = false;
        throttleSettings.bytesPerSecond = parseByteRate(parser.value(rateOption), &ok);
        if (!ok) {
            err << "Invalid --rate value: " << parser.value(rateOption) << Qt::endl;
            return 2;
        }
    }
    if (parser.isSet(burstOption)) {
        bool ok = false;
        throttleSettings.burstBytes = parseByteRate(parser.value(burstOption), &ok);
        if (!ok) {
            err << "Invalid --burst value: " << parser.value(burstOption) << Qt::endl;
            return 2;
        }
    }

    const auto priority = Ferry::taskPriorityFromString(parser.value(priorityOption).toLower());
    if (!priority) {
        err << "Invalid --priority value: " << parser.value(priorityOption) << Qt::endl;
        return 2;
    }
    const auto requirement = Ferry::networkRequirementFromString(parser.value(networkOption).toLower());
    if (!requirement) {
        err << "Invalid --network value: " << parser.value(networkOption) << Qt::endl;
        return 2;
    }

    const QString downloadDir = parser.isSet(dirOption) ? parser.value(dirOption) : transferSettings.downloadPath;
    if (!QDir().mkpath(downloadDir)) {
        err << "Cannot create download directory " << downloadDir << Qt::endl;
        return 1;
    }

    Ferry::TaskStore store;
    const QString dbPath = parser.isSet(dbOption) ? parser.value(dbOption) : storageSettings.databasePath;
    auto opened = store.initialize(dbPath);
    if (opened.hasError()) {
        err << "Cannot open task database: " << Ferry::toString(opened.error()) << Qt::endl;
        return 1;
    }

    if (parser.isSet(listOption)) {
        auto all = store.listAll();
        if (all.hasError()) {
            err << "Cannot read tasks: " << Ferry::toString(all.error()) << Qt::endl;
            return 1;
        }
        for (const auto& task : all.value()) {
            out << task.id << "  " << Ferry::toString(task.status).leftJustified(9)
                << "  " << formatBytes(task.bytesTransferred) << "/" << formatBytes(task.totalSize)
                << "  " << task.url.toString() << Qt::endl;
        }
        return 0;
    }

    Ferry::BandwidthThrottle throttle(throttleSettings.bytesPerSecond, throttleSettings.burstBytes);
    Ferry::RateLimiter limiter(limiterSettings.maxConcurrent, limiterSettings.minDelayMs);

    Ferry::ExecutorConfig executorConfig;
    executorConfig.chunkSize = transferSettings.chunkSize;
    executorConfig.requestTimeoutMs = transferSettings.requestTimeoutMs;
    executorConfig.userAgent = QString("Ferry/%1").arg(app.applicationVersion());
    Ferry::ResumableTransferExecutor executor(&throttle, &store, executorConfig);

    Ferry::DownloadScheduler scheduler(store, executor, limiter,
                                       Ferry::SchedulerConfig::fromSettings(transferSettings));

    QObject::connect(&scheduler, &Ferry::DownloadScheduler::taskProgress,
                     [&out](const Ferry::TransferProgress& progress) {
        QString line = QString("%1  %2 / %3  %4/s")
                           .arg(progress.taskId.left(8))
                           .arg(formatBytes(progress.bytesTransferred))
                           .arg(formatBytes(progress.totalSize))
                           .arg(formatBytes(static_cast<qint64>(progress.bytesPerSecond)));
        if (progress.etaSeconds >= 0) {
            line += QString("  eta %1s").arg(progress.etaSeconds);
        }
        out << line << Qt::endl;
    });
    QObject::connect(&scheduler, &Ferry::DownloadScheduler::taskCompleted, [&out, &scheduler](const QString& taskId) {
        const auto task = scheduler.task(taskId);
        out << "done    " << (task ? task->destinationPath : taskId) << Qt::endl;
    });
    QObject::connect(&scheduler, &Ferry::DownloadScheduler::taskFailed,
                     [&err](const QString& taskId, const Ferry::TransferError& error) {
        err << "failed  " << taskId << ": " << error.describe() << Qt::endl;
    });
    QObject::connect(&scheduler, &Ferry::DownloadScheduler::taskRetryScheduled,
                     [&err](const QString& taskId, int retryCount, qint64 delayMs) {
        err << "retry   " << taskId.left(8) << " #" << retryCount << " in " << delayMs << " ms" << Qt::endl;
    });
    QObject::connect(&scheduler, &Ferry::DownloadScheduler::idle, &app, &QCoreApplication::quit);
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &scheduler, &Ferry::DownloadScheduler::shutdown);

    auto loaded = scheduler.initialize();
    if (loaded.hasError()) {
        err << "Scheduler failed to start: " << Ferry::toString(loaded.error()) << Qt::endl;
        return 1;
    }

    if (parser.isSet(resumeOption)) {
        out << "resumed " << scheduler.resumeAll() << " paused tasks" << Qt::endl;
    }

    for (const QString& argument : parser.positionalArguments()) {
        const QUrl url = QUrl::fromUserInput(argument);
        Ferry::TransferRequest request;
        request.url = url;
        request.destinationPath = destinationFor(url, downloadDir);
        request.priority = *priority;
        request.networkRequirement = *requirement;

        auto enqueued = scheduler.enqueue(request);
        if (enqueued.hasError()) {
            err << "Cannot enqueue " << argument << ": " << Ferry::toString(enqueued.error()) << Qt::endl;
            continue;
        }
        out << "queued  " << enqueued.value() << "  " << request.destinationPath << Qt::endl;
    }

    app.exec();

    int unfinished = 0;
    for (const auto& task : scheduler.tasks()) {
        if (task.status == Ferry::TaskStatus::Failed) {
            ++unfinished;
        }
    }

    Ferry::Logger::instance().info("Ferry exiting, {} failed tasks", unfinished);
    Ferry::Logger::instance().flush();
    return unfinished == 0 ? 0 : 1;
}
