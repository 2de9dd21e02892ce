#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <optional>

namespace Rbum {

enum class SecurityOperationType {
    Bookmark,
    Access,
    XPC
};

enum class SecurityOperationStatus {
    Success,
    Failure
};

struct SecurityOperationRecord {
    QString path;
    SecurityOperationType type = SecurityOperationType::Access;
    SecurityOperationStatus status = SecurityOperationStatus::Success;
    std::optional<QString> error;
    QDateTime timestamp;
};

QString toString(SecurityOperationType type);
QString toString(SecurityOperationStatus status);

/**
 * @brief Append-only audit trail of bookmark, access and XPC operations
 *
 * Safe to call from any thread. Every record is also written to the log.
 */
class SecurityOperationRecorder {
public:
    SecurityOperationRecorder() = default;

    void recordOperation(const QString& path,
                         SecurityOperationType type,
                         SecurityOperationStatus status,
                         const std::optional<QString>& error = std::nullopt);

    QList<SecurityOperationRecord> records() const;
    int recordCount() const;
    int failureCount() const;

private:
    mutable QMutex mutex_;
    QList<SecurityOperationRecord> records_;
};

} // namespace Rbum
