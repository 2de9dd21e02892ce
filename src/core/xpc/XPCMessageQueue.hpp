#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QUuid>
#include <chrono>
#include <optional>

#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"
#include "core/common/RetryScheduler.hpp"
#include "XPCError.hpp"
#include "XPCTypes.hpp"

namespace Rbum {

enum class QueuedMessageStatus {
    Pending,
    InProgress,
    Completed,
    Failed
};

struct QueuedMessage {
    QUuid id;
    XPCCommandConfig command;
    QueuedMessageStatus status = QueuedMessageStatus::Pending;
    int attempts = 0;                   // failed attempts so far
    QDateTime enqueuedAt;
    QDateTime lastAttempt;
    std::optional<XPCError> lastError;
};

struct XPCQueueStatus {
    int pending = 0;
    int inProgress = 0;
    int completed = 0;
    int failed = 0;

    int total() const { return pending + inProgress + completed + failed; }
};

enum class CompletionOutcome {
    Completed,
    RetryScheduled,
    Failed
};

struct XPCMessageQueueConfig {
    int maxRetries = 3;
    std::chrono::milliseconds retryDelay{1000};

    static XPCMessageQueueConfig fromSettings(const Config::QueueSettings& settings);
};

QString toString(QueuedMessageStatus status);

/**
 * @brief FIFO command queue with bounded retry
 *
 * Per message: pending -> inProgress -> {completed | pending (retry) | failed}.
 * While a retry delay runs the message stays inProgress so no consumer
 * can pull it early; the scheduler flips it back to pending.
 */
class XPCMessageQueue : public QObject {
    Q_OBJECT

public:
    // scheduler may be null, in which case retries become pending immediately
    explicit XPCMessageQueue(const XPCMessageQueueConfig& config = XPCMessageQueueConfig(),
                             RetryScheduler* scheduler = nullptr,
                             QObject* parent = nullptr);
    ~XPCMessageQueue() override;

    QUuid enqueue(const XPCCommandConfig& command);

    // Oldest pending message, moved to inProgress
    std::optional<QueuedMessage> nextPendingMessage();

    Expected<CompletionOutcome, XPCError> completeMessage(const QUuid& id,
                                                          std::optional<XPCError> error = std::nullopt);

    // Fails a pending or inProgress message with Cancelled; no retry follows
    Expected<void, XPCError> cancelMessage(const QUuid& id);

    XPCQueueStatus queueStatus() const;
    std::optional<QueuedMessage> message(const QUuid& id) const;

    // Drops completed and failed messages, returns how many were removed
    int cleanup();

    const XPCMessageQueueConfig& config() const { return config_; }

signals:
    void messageEnqueued(const QUuid& id);
    void messageCompleted(const QUuid& id);
    void messageRetryScheduled(const QUuid& id, int attempt);
    void messageReady(const QUuid& id);
    void messageFailed(const QUuid& id, const QString& reason);

private:
    void returnToPending(const QUuid& id);
    int indexOf(const QUuid& id) const;

    XPCMessageQueueConfig config_;
    RetryScheduler* scheduler_;

    mutable QMutex mutex_;
    QList<QueuedMessage> messages_;
};

} // namespace Rbum
