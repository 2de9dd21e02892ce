#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QDataStream>
#include <QtCore/QMap>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"
#include "core/common/SystemMonitor.hpp"
#include "XPCError.hpp"

namespace Rbum {

struct ProcessResult {
    QString output;
    QString error;
    int exitCode = 0;

    bool succeeded() const { return exitCode == 0; }
    bool operator==(const ProcessResult& other) const {
        return output == other.output && error == other.error && exitCode == other.exitCode;
    }
};

struct XPCCommandConfig {
    QString command;
    QStringList arguments;
    QMap<QString, QString> environment;
    QString workingDirectory;
    QMap<QString, QByteArray> bookmarks;
    int timeoutSeconds = 30;
    qint64 auditSessionId = 0;
};

// Operations one side of the channel answers; exchanged in the handshake
struct XPCInterface {
    QString name;
    int version = 0;
    QStringList operations;

    bool isValid() const { return !name.isEmpty() && version > 0; }
};

QDataStream& operator<<(QDataStream& stream, const ProcessResult& result);
QDataStream& operator>>(QDataStream& stream, ProcessResult& result);
QDataStream& operator<<(QDataStream& stream, const XPCCommandConfig& config);
QDataStream& operator>>(QDataStream& stream, XPCCommandConfig& config);
QDataStream& operator<<(QDataStream& stream, const XPCInterface& descriptor);
QDataStream& operator>>(QDataStream& stream, XPCInterface& descriptor);

// Memory and disk minimums checked before a command is issued
Expected<void, XPCError> validateResourceMinimums(const SystemResources& resources,
                                                  const ResourceLimits& limits);

} // namespace Rbum
