#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QStringList>

namespace Ferry {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName,
                        const QString& settingsPath) {
    if (settingsPath.isEmpty()) {
        settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    } else {
        settings_ = std::make_unique<QSettings>(settingsPath, QSettings::IniFormat);
    }
    ensureDirectoriesExist();
    FERRY_INFO("Config initialized for {}/{} ({})",
               organizationName.toStdString(), applicationName.toStdString(),
               settings_->fileName().toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    bool ok = false;
    int value = getValue(key, defaultValue).toInt(&ok);
    if (!ok) {
        FERRY_WARN("Config value for {} is not an integer, using {}", key.toStdString(), defaultValue);
        return defaultValue;
    }
    return value;
}

qint64 Config::getInt64(const QString& key, qint64 defaultValue) const {
    bool ok = false;
    qint64 value = getValue(key, defaultValue).toLongLong(&ok);
    if (!ok) {
        FERRY_WARN("Config value for {} is not an integer, using {}", key.toStdString(), defaultValue);
        return defaultValue;
    }
    return value;
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

double Config::getDouble(const QString& key, double defaultValue) const {
    return getValue(key, defaultValue).toDouble();
}

Config::TransferSettings Config::getTransferSettings() const {
    TransferSettings settings;
    settings.downloadPath = getString("transfer/downloadPath", getDownloadPath());
    settings.maxConcurrent = getInt("transfer/maxConcurrent", settings.maxConcurrent);
    settings.maxRetries = getInt("transfer/maxRetries", settings.maxRetries);
    settings.tickIntervalMs = getInt("transfer/tickIntervalMs", settings.tickIntervalMs);
    settings.backoffBaseMs = getInt("transfer/backoffBaseMs", settings.backoffBaseMs);
    settings.backoffMaxMs = getInt("transfer/backoffMaxMs", settings.backoffMaxMs);
    settings.chunkSize = getInt64("transfer/chunkSize", settings.chunkSize);
    settings.requestTimeoutMs = getInt("transfer/requestTimeoutMs", settings.requestTimeoutMs);
    settings.deletePartialOnCancel = getBool("transfer/deletePartialOnCancel", settings.deletePartialOnCancel);

    if (settings.maxConcurrent < 1) {
        FERRY_WARN("transfer/maxConcurrent must be at least 1, got {}", settings.maxConcurrent);
        settings.maxConcurrent = 1;
    }
    if (settings.chunkSize < 4096) {
        FERRY_WARN("transfer/chunkSize too small ({}), using 4096", settings.chunkSize);
        settings.chunkSize = 4096;
    }
    return settings;
}

Config::RateLimiterSettings Config::getRateLimiterSettings() const {
    RateLimiterSettings settings;
    settings.maxConcurrent = qMax(1, getInt("rateLimiter/maxConcurrent", settings.maxConcurrent));
    settings.minDelayMs = qMax(0, getInt("rateLimiter/minDelayMs", settings.minDelayMs));
    return settings;
}

Config::ThrottleSettings Config::getThrottleSettings() const {
    ThrottleSettings settings;
    settings.bytesPerSecond = qMax<qint64>(0, getInt64("throttle/bytesPerSecond", settings.bytesPerSecond));
    settings.burstBytes = qMax<qint64>(0, getInt64("throttle/burstBytes", settings.burstBytes));
    return settings;
}

Config::StorageSettings Config::getStorageSettings() const {
    StorageSettings settings;
    settings.databasePath = getString("storage/databasePath",
        QDir(getDataPath()).filePath("transfers.db"));
    return settings;
}

void Config::setTransferSettings(const TransferSettings& settings) {
    setValue("transfer/downloadPath", settings.downloadPath);
    setValue("transfer/maxConcurrent", settings.maxConcurrent);
    setValue("transfer/maxRetries", settings.maxRetries);
    setValue("transfer/tickIntervalMs", settings.tickIntervalMs);
    setValue("transfer/backoffBaseMs", settings.backoffBaseMs);
    setValue("transfer/backoffMaxMs", settings.backoffMaxMs);
    setValue("transfer/chunkSize", settings.chunkSize);
    setValue("transfer/requestTimeoutMs", settings.requestTimeoutMs);
    setValue("transfer/deletePartialOnCancel", settings.deletePartialOnCancel);
}

void Config::setRateLimiterSettings(const RateLimiterSettings& settings) {
    setValue("rateLimiter/maxConcurrent", settings.maxConcurrent);
    setValue("rateLimiter/minDelayMs", settings.minDelayMs);
}

void Config::setThrottleSettings(const ThrottleSettings& settings) {
    setValue("throttle/bytesPerSecond", settings.bytesPerSecond);
    setValue("throttle/burstBytes", settings.burstBytes);
}

void Config::setStorageSettings(const StorageSettings& settings) {
    setValue("storage/databasePath", settings.databasePath);
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getDownloadPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
        if (settings_->status() != QSettings::NoError) {
            FERRY_ERROR("Failed to write settings to {}", settings_->fileName().toStdString());
        }
    }
}

void Config::ensureDirectoriesExist() {
    QStringList paths = {
        getDataPath(),
        getString("transfer/downloadPath", getDownloadPath())
    };

    for (const QString& path : paths) {
        if (path.isEmpty()) {
            continue;
        }
        QDir dir;
        if (!dir.mkpath(path)) {
            FERRY_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace Ferry
