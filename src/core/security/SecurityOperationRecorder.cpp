#include "SecurityOperationRecorder.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QMutexLocker>

namespace Rbum {

QString toString(SecurityOperationType type) {
    switch (type) {
        case SecurityOperationType::Bookmark: return "bookmark";
        case SecurityOperationType::Access: return "access";
        case SecurityOperationType::XPC: return "xpc";
    }
    return "unknown";
}

QString toString(SecurityOperationStatus status) {
    switch (status) {
        case SecurityOperationStatus::Success: return "success";
        case SecurityOperationStatus::Failure: return "failure";
    }
    return "unknown";
}

void SecurityOperationRecorder::recordOperation(const QString& path,
                                                SecurityOperationType type,
                                                SecurityOperationStatus status,
                                                const std::optional<QString>& error) {
    SecurityOperationRecord record;
    record.path = path;
    record.type = type;
    record.status = status;
    record.error = error;
    record.timestamp = QDateTime::currentDateTimeUtc();

    {
        QMutexLocker locker(&mutex_);
        records_.append(record);
    }

    if (error) {
        RBUM_WARN("Recorded operation: {} to URL: {} with status: {} ({})",
                  toString(type).toStdString(), path.toStdString(),
                  toString(status).toStdString(), error->toStdString());
    } else {
        RBUM_INFO("Recorded operation: {} to URL: {} with status: {}",
                  toString(type).toStdString(), path.toStdString(),
                  toString(status).toStdString());
    }
}

QList<SecurityOperationRecord> SecurityOperationRecorder::records() const {
    QMutexLocker locker(&mutex_);
    return records_;
}

int SecurityOperationRecorder::recordCount() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(records_.size());
}

int SecurityOperationRecorder::failureCount() const {
    QMutexLocker locker(&mutex_);
    int failures = 0;
    for (const auto& record : records_) {
        if (record.status == SecurityOperationStatus::Failure) {
            ++failures;
        }
    }
    return failures;
}

} // namespace Rbum
