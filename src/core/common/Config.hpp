#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace Ferry {

class Config {
public:
    static Config& instance();

    // With an empty settingsPath the platform default location for
    // organization/application is used; otherwise an INI file at that path.
    void initialize(const QString& organizationName = "Ferry",
                   const QString& applicationName = "Ferry",
                   const QString& settingsPath = QString());

    bool isInitialized() const { return settings_ != nullptr; }

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    qint64 getInt64(const QString& key, qint64 defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;
    double getDouble(const QString& key, double defaultValue = 0.0) const;

    struct TransferSettings {
        QString downloadPath;
        int maxConcurrent = 3;
        int maxRetries = 5;
        int tickIntervalMs = 5000;
        int backoffBaseMs = 1000;
        int backoffMaxMs = 300000;
        qint64 chunkSize = 1024 * 1024;
        int requestTimeoutMs = 300000;
        bool deletePartialOnCancel = true;
    };

    struct RateLimiterSettings {
        int maxConcurrent = 3;
        int minDelayMs = 150;
    };

    struct ThrottleSettings {
        qint64 bytesPerSecond = 0;  // 0 = unlimited
        qint64 burstBytes = 0;      // 0 = twice the rate
    };

    struct StorageSettings {
        QString databasePath;
    };

    TransferSettings getTransferSettings() const;
    RateLimiterSettings getRateLimiterSettings() const;
    ThrottleSettings getThrottleSettings() const;
    StorageSettings getStorageSettings() const;

    void setTransferSettings(const TransferSettings& settings);
    void setRateLimiterSettings(const RateLimiterSettings& settings);
    void setThrottleSettings(const ThrottleSettings& settings);
    void setStorageSettings(const StorageSettings& settings);

    QString getDataPath() const;
    QString getDownloadPath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

} // namespace Ferry
