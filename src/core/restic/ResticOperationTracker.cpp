#include "ResticOperationTracker.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QMutexLocker>
#include <algorithm>

namespace Rbum {

namespace {
bool isFinished(ResticOperationStatus status) {
    return status == ResticOperationStatus::Completed ||
           status == ResticOperationStatus::Failed ||
           status == ResticOperationStatus::Cancelled;
}
}

ResticOperationTracker::ResticOperationTracker(int maxHistory)
    : maxHistory_(qMax(1, maxHistory)) {
}

QUuid ResticOperationTracker::begin(ResticOperationType type, const QString& command) {
    ResticOperationRecord record;
    record.id = QUuid::createUuid();
    record.type = type;
    record.command = command;
    record.started = QDateTime::currentDateTimeUtc();

    QMutexLocker locker(&mutex_);
    records_.append(record);
    trim();
    return record.id;
}

void ResticOperationTracker::markRunning(const QUuid& id) {
    QMutexLocker locker(&mutex_);
    for (auto& record : records_) {
        if (record.id == id) {
            record.status = ResticOperationStatus::Running;
            return;
        }
    }
}

void ResticOperationTracker::finish(const QUuid& id, ResticOperationStatus status,
                                    std::optional<XPCError> error) {
    QMutexLocker locker(&mutex_);
    for (auto& record : records_) {
        if (record.id == id) {
            record.status = status;
            record.error = error;
            record.finished = QDateTime::currentDateTimeUtc();
            Logger::instance().debug("Operation {} ({}) {} after {}ms",
                                     record.id.toString(QUuid::WithoutBraces).toStdString(),
                                     toString(record.type).toStdString(),
                                     toString(status).toStdString(),
                                     record.started.msecsTo(record.finished));
            return;
        }
    }
}

std::optional<ResticOperationRecord> ResticOperationTracker::record(const QUuid& id) const {
    QMutexLocker locker(&mutex_);
    for (const auto& record : records_) {
        if (record.id == id) {
            return record;
        }
    }
    return std::nullopt;
}

QList<ResticOperationRecord> ResticOperationTracker::records() const {
    QMutexLocker locker(&mutex_);
    return records_;
}

int ResticOperationTracker::activeCount() const {
    QMutexLocker locker(&mutex_);
    int active = 0;
    for (const auto& record : records_) {
        if (!isFinished(record.status)) {
            ++active;
        }
    }
    return active;
}

void ResticOperationTracker::trim() {
    while (records_.size() > maxHistory_) {
        auto it = std::find_if(records_.begin(), records_.end(), [](const ResticOperationRecord& record) {
            return isFinished(record.status);
        });
        if (it == records_.end()) {
            break;
        }
        records_.erase(it);
    }
}

} // namespace Rbum
