#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QMap>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QUuid>
#include <optional>

#include "core/xpc/XPCError.hpp"

namespace Rbum {

enum class ResticOperationType {
    Init,
    Backup,
    Snapshots,
    Restore,
    Check,
    Custom
};

enum class ResticOperationStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

// Command line ready to hand to QProcess
struct PreparedCommand {
    QString executable;
    QStringList arguments;
    QMap<QString, QString> environment;
    QString workingDirectory;
    int timeoutSeconds = 30;
};

struct ResticOperationRecord {
    QUuid id;
    ResticOperationType type = ResticOperationType::Custom;
    ResticOperationStatus status = ResticOperationStatus::Pending;
    QString command;
    QDateTime started;
    QDateTime finished;
    std::optional<XPCError> error;
};

QString toString(ResticOperationType type);
QString toString(ResticOperationStatus status);
ResticOperationType operationTypeForCommand(const QString& command);

// Per-verb timeouts, in seconds
constexpr int kShortOperationTimeout = 30;
constexpr int kLongOperationTimeout = 3600;

} // namespace Rbum
