#include "XPCTypes.hpp"
#include "core/common/Logger.hpp"

namespace Rbum {

QDataStream& operator<<(QDataStream& stream, const ProcessResult& result) {
    stream << result.output << result.error << static_cast<qint32>(result.exitCode);
    return stream;
}

QDataStream& operator>>(QDataStream& stream, ProcessResult& result) {
    qint32 exitCode = 0;
    stream >> result.output >> result.error >> exitCode;
    result.exitCode = exitCode;
    return stream;
}

QDataStream& operator<<(QDataStream& stream, const XPCCommandConfig& config) {
    stream << config.command
           << config.arguments
           << config.environment
           << config.workingDirectory
           << config.bookmarks
           << static_cast<qint32>(config.timeoutSeconds)
           << config.auditSessionId;
    return stream;
}

QDataStream& operator>>(QDataStream& stream, XPCCommandConfig& config) {
    qint32 timeout = 0;
    stream >> config.command
           >> config.arguments
           >> config.environment
           >> config.workingDirectory
           >> config.bookmarks
           >> timeout
           >> config.auditSessionId;
    config.timeoutSeconds = timeout;
    return stream;
}

QDataStream& operator<<(QDataStream& stream, const XPCInterface& descriptor) {
    stream << descriptor.name << static_cast<qint32>(descriptor.version) << descriptor.operations;
    return stream;
}

QDataStream& operator>>(QDataStream& stream, XPCInterface& descriptor) {
    qint32 version = 0;
    stream >> descriptor.name >> version >> descriptor.operations;
    descriptor.version = version;
    return stream;
}

Expected<void, XPCError> validateResourceMinimums(const SystemResources& resources,
                                                  const ResourceLimits& limits) {
    if (resources.availableMemory < limits.minimumMemory) {
        RBUM_ERROR("Insufficient memory available: {} bytes (minimum {})",
                   resources.availableMemory, limits.minimumMemory);
        return makeUnexpected(XPCError::InsufficientMemory);
    }

    if (resources.availableDiskSpace < limits.minimumDiskSpace) {
        RBUM_ERROR("Insufficient disk space: {} bytes (minimum {})",
                   resources.availableDiskSpace, limits.minimumDiskSpace);
        return makeUnexpected(XPCError::InsufficientDiskSpace);
    }

    return Expected<void, XPCError>();
}

} // namespace Rbum
