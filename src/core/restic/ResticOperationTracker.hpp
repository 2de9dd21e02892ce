#pragma once

#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QUuid>
#include <optional>

#include "ResticTypes.hpp"

namespace Rbum {

/**
 * @brief History of restic operations run by the helper
 *
 * Bounded to maxHistory entries; the oldest finished records are
 * dropped first.
 */
class ResticOperationTracker {
public:
    explicit ResticOperationTracker(int maxHistory = 1000);

    QUuid begin(ResticOperationType type, const QString& command);
    void markRunning(const QUuid& id);
    void finish(const QUuid& id, ResticOperationStatus status,
                std::optional<XPCError> error = std::nullopt);

    std::optional<ResticOperationRecord> record(const QUuid& id) const;
    QList<ResticOperationRecord> records() const;
    int activeCount() const;

private:
    void trim();

    int maxHistory_;
    mutable QMutex mutex_;
    QList<ResticOperationRecord> records_;
};

} // namespace Rbum
