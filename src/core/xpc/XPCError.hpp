#pragma once

#include <QtCore/QString>
#include <string>

namespace Rbum {

enum class XPCError {
    // Connection
    ConnectionNotEstablished,
    ConnectionInvalidated,
    ConnectionInterrupted,
    InvalidationHandlerMissing,
    ExportedInterfaceMissing,
    RemoteInterfaceMissing,
    RemoteProxyUnavailable,
    InvalidInterface,
    InvalidAuditSession,
    ServiceUnavailable,
    RequestTimeout,
    InvalidMessage,
    MessageTooLarge,

    // Validation
    InvalidCommand,
    UnsafeArguments,
    MissingEnvironment,
    InvalidConfiguration,
    MessageNotFound,

    // Resource
    InsufficientMemory,
    InsufficientDiskSpace,
    ResourceUnavailable,

    // Security
    InvalidURL,
    FileNotFound,
    AccessDenied,
    BookmarkStale,
    BookmarkInvalid,
    BookmarkResolutionFailed,

    // Execution
    LaunchFailed,
    NonZeroExit,
    ExecutionTimeout,
    Cancelled,
    OperationInProgress
};

enum class XPCErrorKind {
    Connection,
    Validation,
    Resource,
    Security,
    Execution
};

XPCErrorKind errorKind(XPCError error);
QString errorString(XPCError error);
QString errorKindString(XPCErrorKind kind);

// Transport failures the message queue may retry
bool isTransient(XPCError error);

// Wire conversion; unknown codes map to InvalidMessage
quint32 toWireCode(XPCError error);
XPCError fromWireCode(quint32 code);

inline std::string toStdString(XPCError error) {
    return errorString(error).toStdString();
}

} // namespace Rbum
