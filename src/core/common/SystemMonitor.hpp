#pragma once

#include <QtCore/QDataStream>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "Config.hpp"

namespace Rbum {

struct ResourceLimits {
    double maxCpuUsage = 80.0;                          // percent
    qint64 maxMemoryUsage = 1024LL * 1024 * 1024;       // process RSS
    qint64 minimumMemory = 512LL * 1024 * 1024;         // system MemAvailable
    qint64 minimumDiskSpace = 1024LL * 1024 * 1024;
    int maxFileHandles = 1000;
    int maxConnections = 10;

    static ResourceLimits fromSettings(const Config::ResourceSettings& settings);
};

struct SystemResources {
    double cpuUsage = 0.0;
    qint64 memoryUsage = 0;
    qint64 availableMemory = 0;
    qint64 availableDiskSpace = 0;
    int activeFileHandles = 0;
    int activeConnections = 0;

    bool isWithinLimits(const ResourceLimits& limits = ResourceLimits()) const;

    // Names of the limits this sample violates, empty when within limits
    QStringList exceededLimits(const ResourceLimits& limits = ResourceLimits()) const;

    bool operator==(const SystemResources& other) const;
};

QDataStream& operator<<(QDataStream& stream, const SystemResources& resources);
QDataStream& operator>>(QDataStream& stream, SystemResources& resources);

/**
 * @brief Samples CPU, memory, disk and file-handle usage
 *
 * Linux values come from /proc; other platforms fall back to
 * getrusage and QStorageInfo. Subclasses override sample() to
 * simulate resource pressure.
 */
class SystemMonitor {
public:
    SystemMonitor() = default;
    virtual ~SystemMonitor() = default;

    SystemMonitor(const SystemMonitor&) = delete;
    SystemMonitor& operator=(const SystemMonitor&) = delete;

    // Disk space is measured on the volume holding path
    virtual SystemResources sample(const QString& path, int activeConnections = 0);

    static qint64 currentProcessMemory();
    static qint64 availableSystemMemory();
    static qint64 availableDiskSpace(const QString& path);
    static int openFileHandles();

protected:
    double cpuUsage();

private:
    QMutex cpuMutex_;
    quint64 lastTotalTime_ = 0;
    quint64 lastIdleTime_ = 0;
    double lastCpuUsage_ = 0.0;
};

} // namespace Rbum
