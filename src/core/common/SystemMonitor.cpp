#include "SystemMonitor.hpp"
#include "Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QRegularExpression>
#include <QtCore/QStorageInfo>
#include <QtCore/QTextStream>

#ifdef Q_OS_UNIX
#include <sys/resource.h>
#endif

namespace Rbum {

ResourceLimits ResourceLimits::fromSettings(const Config::ResourceSettings& settings) {
    ResourceLimits limits;
    limits.maxCpuUsage = settings.maxCpuUsage;
    limits.maxMemoryUsage = settings.maxMemoryUsage;
    limits.minimumMemory = settings.minimumMemory;
    limits.minimumDiskSpace = settings.minimumDiskSpace;
    limits.maxFileHandles = settings.maxFileHandles;
    limits.maxConnections = settings.maxConnections;
    return limits;
}

bool SystemResources::isWithinLimits(const ResourceLimits& limits) const {
    return exceededLimits(limits).isEmpty();
}

QStringList SystemResources::exceededLimits(const ResourceLimits& limits) const {
    QStringList exceeded;
    if (cpuUsage >= limits.maxCpuUsage) {
        exceeded << "cpu";
    }
    if (memoryUsage >= limits.maxMemoryUsage) {
        exceeded << "memory usage";
    }
    if (availableMemory < limits.minimumMemory) {
        exceeded << "available memory";
    }
    if (availableDiskSpace < limits.minimumDiskSpace) {
        exceeded << "disk space";
    }
    if (activeFileHandles >= limits.maxFileHandles) {
        exceeded << "file handles";
    }
    if (activeConnections >= limits.maxConnections) {
        exceeded << "connections";
    }
    return exceeded;
}

bool SystemResources::operator==(const SystemResources& other) const {
    return qFuzzyCompare(1.0 + cpuUsage, 1.0 + other.cpuUsage) &&
           memoryUsage == other.memoryUsage &&
           availableMemory == other.availableMemory &&
           availableDiskSpace == other.availableDiskSpace &&
           activeFileHandles == other.activeFileHandles &&
           activeConnections == other.activeConnections;
}

QDataStream& operator<<(QDataStream& stream, const SystemResources& resources) {
    stream << resources.cpuUsage
           << resources.memoryUsage
           << resources.availableMemory
           << resources.availableDiskSpace
           << static_cast<qint32>(resources.activeFileHandles)
           << static_cast<qint32>(resources.activeConnections);
    return stream;
}

QDataStream& operator>>(QDataStream& stream, SystemResources& resources) {
    qint32 fileHandles = 0;
    qint32 connections = 0;
    stream >> resources.cpuUsage
           >> resources.memoryUsage
           >> resources.availableMemory
           >> resources.availableDiskSpace
           >> fileHandles
           >> connections;
    resources.activeFileHandles = fileHandles;
    resources.activeConnections = connections;
    return stream;
}

SystemResources SystemMonitor::sample(const QString& path, int activeConnections) {
    SystemResources resources;
    resources.cpuUsage = cpuUsage();
    resources.memoryUsage = currentProcessMemory();
    resources.availableMemory = availableSystemMemory();
    resources.availableDiskSpace = availableDiskSpace(path);
    resources.activeFileHandles = openFileHandles();
    resources.activeConnections = activeConnections;

    RBUM_TRACE("Sampled resources: cpu={:.1f}% rss={} availMem={} disk={} fds={} conns={}",
               resources.cpuUsage, resources.memoryUsage, resources.availableMemory,
               resources.availableDiskSpace, resources.activeFileHandles,
               resources.activeConnections);
    return resources;
}

double SystemMonitor::cpuUsage() {
    QMutexLocker locker(&cpuMutex_);

#ifdef Q_OS_LINUX
    QFile statFile("/proc/stat");
    if (!statFile.open(QIODevice::ReadOnly)) {
        return lastCpuUsage_;
    }

    // cpu  user nice system idle iowait irq softirq steal
    const QString line = QString::fromLatin1(statFile.readLine()).simplified();
    const QStringList fields = line.split(' ');
    if (fields.size() < 9 || fields.first() != "cpu") {
        return lastCpuUsage_;
    }

    quint64 total = 0;
    for (int i = 1; i <= 8; ++i) {
        total += fields.at(i).toULongLong();
    }
    const quint64 idle = fields.at(4).toULongLong() + fields.at(5).toULongLong();

    if (lastTotalTime_ != 0 && total > lastTotalTime_) {
        const quint64 totalDiff = total - lastTotalTime_;
        const quint64 idleDiff = idle - lastIdleTime_;
        lastCpuUsage_ = 100.0 * static_cast<double>(totalDiff - idleDiff) / static_cast<double>(totalDiff);
    }

    lastTotalTime_ = total;
    lastIdleTime_ = idle;
#endif

    return lastCpuUsage_;
}

qint64 SystemMonitor::currentProcessMemory() {
#ifdef Q_OS_LINUX
    QFile statusFile("/proc/self/status");
    if (statusFile.open(QIODevice::ReadOnly)) {
        QTextStream stream(&statusFile);
        QString line;
        while (stream.readLineInto(&line)) {
            if (line.startsWith("VmRSS:")) {
                const QStringList parts = line.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
                if (parts.size() >= 2) {
                    bool ok = false;
                    const qint64 memoryKB = parts[1].toLongLong(&ok);
                    if (ok) {
                        return memoryKB * 1024;
                    }
                }
                break;
            }
        }
    }
#endif

#ifdef Q_OS_UNIX
    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
#ifdef Q_OS_MACOS
        return static_cast<qint64>(usage.ru_maxrss);
#else
        return static_cast<qint64>(usage.ru_maxrss) * 1024;
#endif
    }
#endif
    return 0;
}

qint64 SystemMonitor::availableSystemMemory() {
#ifdef Q_OS_LINUX
    QFile meminfo("/proc/meminfo");
    if (meminfo.open(QIODevice::ReadOnly)) {
        const QString content = QString::fromLatin1(meminfo.readAll());
        static const QRegularExpression regex("MemAvailable:\\s+(\\d+)\\s+kB");
        const auto match = regex.match(content);
        if (match.hasMatch()) {
            return match.captured(1).toLongLong() * 1024;
        }
    }
    RBUM_WARN("Unable to read available memory from /proc/meminfo");
#endif
    return 0;
}

qint64 SystemMonitor::availableDiskSpace(const QString& path) {
    // Walk up to the nearest existing directory so not-yet-created
    // repositories are measured on their parent volume
    QFileInfo info(path.isEmpty() ? QDir::rootPath() : path);
    while (!info.exists() && info.absolutePath() != info.absoluteFilePath()) {
        info = QFileInfo(info.absolutePath());
    }

    QStorageInfo storage(info.absoluteFilePath());
    if (!storage.isValid()) {
        RBUM_WARN("Unable to query storage for {}", path.toStdString());
        return 0;
    }
    return storage.bytesAvailable();
}

int SystemMonitor::openFileHandles() {
#ifdef Q_OS_LINUX
    QDir fdDir("/proc/self/fd");
    if (fdDir.exists()) {
        return static_cast<int>(fdDir.entryList(QDir::AllEntries | QDir::System | QDir::NoDotAndDotDot).size());
    }
#endif
    return 0;
}

} // namespace Rbum
