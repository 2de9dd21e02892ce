#include "XPCError.hpp"

namespace Rbum {

XPCErrorKind errorKind(XPCError error) {
    switch (error) {
        case XPCError::ConnectionNotEstablished:
        case XPCError::ConnectionInvalidated:
        case XPCError::ConnectionInterrupted:
        case XPCError::InvalidationHandlerMissing:
        case XPCError::ExportedInterfaceMissing:
        case XPCError::RemoteInterfaceMissing:
        case XPCError::RemoteProxyUnavailable:
        case XPCError::InvalidInterface:
        case XPCError::InvalidAuditSession:
        case XPCError::ServiceUnavailable:
        case XPCError::RequestTimeout:
        case XPCError::InvalidMessage:
        case XPCError::MessageTooLarge:
            return XPCErrorKind::Connection;

        case XPCError::InvalidCommand:
        case XPCError::UnsafeArguments:
        case XPCError::MissingEnvironment:
        case XPCError::InvalidConfiguration:
        case XPCError::MessageNotFound:
            return XPCErrorKind::Validation;

        case XPCError::InsufficientMemory:
        case XPCError::InsufficientDiskSpace:
        case XPCError::ResourceUnavailable:
            return XPCErrorKind::Resource;

        case XPCError::InvalidURL:
        case XPCError::FileNotFound:
        case XPCError::AccessDenied:
        case XPCError::BookmarkStale:
        case XPCError::BookmarkInvalid:
        case XPCError::BookmarkResolutionFailed:
            return XPCErrorKind::Security;

        case XPCError::LaunchFailed:
        case XPCError::NonZeroExit:
        case XPCError::ExecutionTimeout:
        case XPCError::Cancelled:
        case XPCError::OperationInProgress:
            return XPCErrorKind::Execution;
    }
    return XPCErrorKind::Connection;
}

QString errorString(XPCError error) {
    switch (error) {
        case XPCError::ConnectionNotEstablished: return "Connection not established";
        case XPCError::ConnectionInvalidated: return "Connection invalidated";
        case XPCError::ConnectionInterrupted: return "Connection interrupted";
        case XPCError::InvalidationHandlerMissing: return "Invalid interface: invalidation handler not set";
        case XPCError::ExportedInterfaceMissing: return "Invalid interface: exported interface not set";
        case XPCError::RemoteInterfaceMissing: return "Invalid interface: remote interface not set";
        case XPCError::RemoteProxyUnavailable: return "Service unavailable: remote proxy not available";
        case XPCError::InvalidInterface: return "Invalid interface: version mismatch";
        case XPCError::InvalidAuditSession: return "Invalid audit session";
        case XPCError::ServiceUnavailable: return "Service unavailable";
        case XPCError::RequestTimeout: return "Request timed out";
        case XPCError::InvalidMessage: return "Invalid message";
        case XPCError::MessageTooLarge: return "Message too large";
        case XPCError::InvalidCommand: return "Invalid command";
        case XPCError::UnsafeArguments: return "Command contains unsafe arguments";
        case XPCError::MissingEnvironment: return "Missing required environment variable";
        case XPCError::InvalidConfiguration: return "Invalid configuration";
        case XPCError::MessageNotFound: return "Message not found";
        case XPCError::InsufficientMemory: return "Insufficient memory available";
        case XPCError::InsufficientDiskSpace: return "Insufficient disk space";
        case XPCError::ResourceUnavailable: return "Required resources are not available";
        case XPCError::InvalidURL: return "Invalid URL";
        case XPCError::FileNotFound: return "File not found";
        case XPCError::AccessDenied: return "Access denied";
        case XPCError::BookmarkStale: return "Bookmark validation failed: bookmark is stale";
        case XPCError::BookmarkInvalid: return "Bookmark is invalid";
        case XPCError::BookmarkResolutionFailed: return "Bookmark resolution failed";
        case XPCError::LaunchFailed: return "Process launch failed";
        case XPCError::NonZeroExit: return "Process exited with non-zero status";
        case XPCError::ExecutionTimeout: return "Operation timed out";
        case XPCError::Cancelled: return "Operation cancelled";
        case XPCError::OperationInProgress: return "Another operation is in progress";
    }
    return "Unknown error";
}

QString errorKindString(XPCErrorKind kind) {
    switch (kind) {
        case XPCErrorKind::Connection: return "connection";
        case XPCErrorKind::Validation: return "validation";
        case XPCErrorKind::Resource: return "resource";
        case XPCErrorKind::Security: return "security";
        case XPCErrorKind::Execution: return "execution";
    }
    return "unknown";
}

bool isTransient(XPCError error) {
    switch (error) {
        case XPCError::ConnectionNotEstablished:
        case XPCError::ConnectionInvalidated:
        case XPCError::ConnectionInterrupted:
        case XPCError::RemoteProxyUnavailable:
        case XPCError::ServiceUnavailable:
        case XPCError::RequestTimeout:
            return true;
        default:
            return false;
    }
}

quint32 toWireCode(XPCError error) {
    return static_cast<quint32>(error);
}

XPCError fromWireCode(quint32 code) {
    if (code > static_cast<quint32>(XPCError::OperationInProgress)) {
        return XPCError::InvalidMessage;
    }
    return static_cast<XPCError>(code);
}

} // namespace Rbum
