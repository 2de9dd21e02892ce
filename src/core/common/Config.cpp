#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QStringList>

namespace Rbum {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    RBUM_INFO("Config initialized for {}/{}",
              organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& filePath) {
    settings_ = std::make_unique<QSettings>(filePath, QSettings::IniFormat);
    ensureDirectoriesExist();
    RBUM_INFO("Config initialized from {}", filePath.toStdString());
}

bool Config::isInitialized() const {
    return static_cast<bool>(settings_);
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
    return getValue(key, defaultValue).toInt();
}

qint64 Config::getInt64(const QString& key, qint64 defaultValue) const {
    return getValue(key, defaultValue).toLongLong();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

double Config::getDouble(const QString& key, double defaultValue) const {
    return getValue(key, defaultValue).toDouble();
}

void Config::setString(const QString& key, const QString& value) {
    setValue(key, value);
}

void Config::setInt(const QString& key, int value) {
    setValue(key, value);
}

void Config::setBool(const QString& key, bool value) {
    setValue(key, value);
}

void Config::setDouble(const QString& key, double value) {
    setValue(key, value);
}

Config::ResticSettings Config::getResticSettings() const {
    ResticSettings defaults;
    ResticSettings settings;
    settings.executablePath = getString("restic/executablePath", defaults.executablePath);
    settings.cacheDirectoryName = getString("restic/cacheDirectoryName", defaults.cacheDirectoryName);
    settings.unsafeArguments = getValue("restic/unsafeArguments", defaults.unsafeArguments).toStringList();
    settings.requiredEnvironment = getValue("restic/requiredEnvironment", defaults.requiredEnvironment).toStringList();
    settings.terminateGraceMs = getInt("restic/terminateGraceMs", defaults.terminateGraceMs);
    return settings;
}

Config::ResourceSettings Config::getResourceSettings() const {
    ResourceSettings defaults;
    ResourceSettings settings;
    settings.minimumMemory = getInt64("resources/minimumMemory", defaults.minimumMemory);
    settings.minimumDiskSpace = getInt64("resources/minimumDiskSpace", defaults.minimumDiskSpace);
    settings.maxCpuUsage = getDouble("resources/maxCpuUsage", defaults.maxCpuUsage);
    settings.maxMemoryUsage = getInt64("resources/maxMemoryUsage", defaults.maxMemoryUsage);
    settings.maxFileHandles = getInt("resources/maxFileHandles", defaults.maxFileHandles);
    settings.maxConnections = getInt("resources/maxConnections", defaults.maxConnections);
    return settings;
}

Config::QueueSettings Config::getQueueSettings() const {
    QueueSettings settings;
    settings.maxRetries = getInt("queue/maxRetries", 3);
    settings.retryDelayMs = getInt("queue/retryDelayMs", 1000);
    settings.processIntervalMs = getInt("queue/processIntervalMs", 100);
    return settings;
}

Config::HealthSettings Config::getHealthSettings() const {
    HealthSettings settings;
    settings.intervalMs = getInt("health/intervalMs", 30000);
    return settings;
}

Config::ConnectionSettings Config::getConnectionSettings() const {
    ConnectionSettings defaults;
    ConnectionSettings settings;
    settings.serviceName = getString("connection/serviceName", defaults.serviceName);
    settings.queueLabel = getString("connection/queueLabel", defaults.queueLabel);
    settings.interfaceVersion = getInt("connection/interfaceVersion", defaults.interfaceVersion);
    settings.requestTimeoutMs = getInt("connection/requestTimeoutMs", defaults.requestTimeoutMs);
    settings.connectTimeoutMs = getInt("connection/connectTimeoutMs", defaults.connectTimeoutMs);
    settings.maxRecoveryAttempts = getInt("connection/maxRecoveryAttempts", defaults.maxRecoveryAttempts);
    settings.recoveryDelayMs = getInt("connection/recoveryDelayMs", defaults.recoveryDelayMs);
    return settings;
}

Config::SecuritySettings Config::getSecuritySettings() const {
    SecuritySettings settings;
    settings.mode = getString("security/mode", "production");
    settings.simulateBookmarkFailures = getBool("security/simulateBookmarkFailures", false);
    settings.simulateAccessFailures = getBool("security/simulateAccessFailures", false);
    settings.simulatePermissionFailures = getBool("security/simulatePermissionFailures", false);
    settings.artificialDelayMs = getInt("security/artificialDelayMs", 0);
    return settings;
}

void Config::setResticSettings(const ResticSettings& settings) {
    setValue("restic/executablePath", settings.executablePath);
    setValue("restic/cacheDirectoryName", settings.cacheDirectoryName);
    setValue("restic/unsafeArguments", settings.unsafeArguments);
    setValue("restic/requiredEnvironment", settings.requiredEnvironment);
    setValue("restic/terminateGraceMs", settings.terminateGraceMs);
}

void Config::setResourceSettings(const ResourceSettings& settings) {
    setValue("resources/minimumMemory", settings.minimumMemory);
    setValue("resources/minimumDiskSpace", settings.minimumDiskSpace);
    setValue("resources/maxCpuUsage", settings.maxCpuUsage);
    setValue("resources/maxMemoryUsage", settings.maxMemoryUsage);
    setValue("resources/maxFileHandles", settings.maxFileHandles);
    setValue("resources/maxConnections", settings.maxConnections);
}

void Config::setQueueSettings(const QueueSettings& settings) {
    setValue("queue/maxRetries", settings.maxRetries);
    setValue("queue/retryDelayMs", settings.retryDelayMs);
    setValue("queue/processIntervalMs", settings.processIntervalMs);
}

void Config::setHealthSettings(const HealthSettings& settings) {
    setValue("health/intervalMs", settings.intervalMs);
}

void Config::setConnectionSettings(const ConnectionSettings& settings) {
    setValue("connection/serviceName", settings.serviceName);
    setValue("connection/queueLabel", settings.queueLabel);
    setValue("connection/interfaceVersion", settings.interfaceVersion);
    setValue("connection/requestTimeoutMs", settings.requestTimeoutMs);
    setValue("connection/connectTimeoutMs", settings.connectTimeoutMs);
    setValue("connection/maxRecoveryAttempts", settings.maxRecoveryAttempts);
    setValue("connection/recoveryDelayMs", settings.recoveryDelayMs);
}

void Config::setSecuritySettings(const SecuritySettings& settings) {
    setValue("security/mode", settings.mode);
    setValue("security/simulateBookmarkFailures", settings.simulateBookmarkFailures);
    setValue("security/simulateAccessFailures", settings.simulateAccessFailures);
    setValue("security/simulatePermissionFailures", settings.simulatePermissionFailures);
    setValue("security/artificialDelayMs", settings.artificialDelayMs);
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getCachePath() const {
    return QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
}

QString Config::getConfigPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::ConfigLocation);
}

QString Config::getResticCachePath() const {
    return getCachePath() + "/" + getResticSettings().cacheDirectoryName;
}

QString Config::getLogFilePath() const {
    return getDataPath() + "/rbum-helper.log";
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    QStringList paths = {
        getDataPath(),
        getCachePath()
    };

    for (const QString& path : paths) {
        QDir dir;
        if (!dir.mkpath(path)) {
            RBUM_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace Rbum
