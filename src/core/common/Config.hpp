#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>
#include <memory>

namespace Rbum {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "dev.mpy",
                   const QString& applicationName = "rBUM");

    // Backs the settings with an explicit ini file (helper --config, tests)
    void initializeFromFile(const QString& filePath);
    bool isInitialized() const;

    // General settings
    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    // Typed convenience methods
    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    qint64 getInt64(const QString& key, qint64 defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;
    double getDouble(const QString& key, double defaultValue = 0.0) const;

    void setString(const QString& key, const QString& value);
    void setInt(const QString& key, int value);
    void setBool(const QString& key, bool value);
    void setDouble(const QString& key, double value);

    // Application-specific settings
    struct ResticSettings {
        QString executablePath = "/usr/local/bin/restic";
        QString cacheDirectoryName = "ResticCache";
        QStringList unsafeArguments = {"--no-cache", "--no-lock", "--force"};
        QStringList requiredEnvironment = {"RESTIC_PASSWORD", "RESTIC_REPOSITORY"};
        int terminateGraceMs = 5000;
    };

    struct ResourceSettings {
        qint64 minimumMemory = 512LL * 1024 * 1024;
        qint64 minimumDiskSpace = 1024LL * 1024 * 1024;
        double maxCpuUsage = 80.0;
        qint64 maxMemoryUsage = 1024LL * 1024 * 1024;
        int maxFileHandles = 1000;
        int maxConnections = 10;
    };

    struct QueueSettings {
        int maxRetries = 3;
        int retryDelayMs = 1000;
        int processIntervalMs = 100;
    };

    struct HealthSettings {
        int intervalMs = 30000;
    };

    struct ConnectionSettings {
        QString serviceName = "dev.mpy.rBUM.ResticService";
        QString queueLabel = "dev.mpy.rBUM.xpc.queue";
        int interfaceVersion = 1;
        int requestTimeoutMs = 30000;
        int connectTimeoutMs = 5000;
        int maxRecoveryAttempts = 3;
        int recoveryDelayMs = 2000;
    };

    struct SecuritySettings {
        QString mode = "production";  // "production" or "development"
        bool simulateBookmarkFailures = false;
        bool simulateAccessFailures = false;
        bool simulatePermissionFailures = false;
        int artificialDelayMs = 0;
    };

    ResticSettings getResticSettings() const;
    ResourceSettings getResourceSettings() const;
    QueueSettings getQueueSettings() const;
    HealthSettings getHealthSettings() const;
    ConnectionSettings getConnectionSettings() const;
    SecuritySettings getSecuritySettings() const;

    void setResticSettings(const ResticSettings& settings);
    void setResourceSettings(const ResourceSettings& settings);
    void setQueueSettings(const QueueSettings& settings);
    void setHealthSettings(const HealthSettings& settings);
    void setConnectionSettings(const ConnectionSettings& settings);
    void setSecuritySettings(const SecuritySettings& settings);

    // Paths
    QString getDataPath() const;
    QString getCachePath() const;
    QString getConfigPath() const;
    QString getResticCachePath() const;
    QString getLogFilePath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

} // namespace Rbum
