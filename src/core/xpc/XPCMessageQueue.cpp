#include "XPCMessageQueue.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QMutexLocker>
#include <QtCore/QPointer>

namespace Rbum {

XPCMessageQueueConfig XPCMessageQueueConfig::fromSettings(const Config::QueueSettings& settings) {
    XPCMessageQueueConfig config;
    config.maxRetries = settings.maxRetries;
    config.retryDelay = std::chrono::milliseconds(settings.retryDelayMs);
    return config;
}

QString toString(QueuedMessageStatus status) {
    switch (status) {
        case QueuedMessageStatus::Pending: return "pending";
        case QueuedMessageStatus::InProgress: return "inProgress";
        case QueuedMessageStatus::Completed: return "completed";
        case QueuedMessageStatus::Failed: return "failed";
    }
    return "unknown";
}

XPCMessageQueue::XPCMessageQueue(const XPCMessageQueueConfig& config,
                                 RetryScheduler* scheduler,
                                 QObject* parent)
    : QObject(parent)
    , config_(config)
    , scheduler_(scheduler) {
    if (config_.maxRetries < 0) {
        RBUM_WARN("Negative maxRetries {} clamped to 0", config_.maxRetries);
        config_.maxRetries = 0;
    }
}

XPCMessageQueue::~XPCMessageQueue() = default;

int XPCMessageQueue::indexOf(const QUuid& id) const {
    for (int i = 0; i < messages_.size(); ++i) {
        if (messages_.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

QUuid XPCMessageQueue::enqueue(const XPCCommandConfig& command) {
    QueuedMessage message;
    message.id = QUuid::createUuid();
    message.command = command;
    message.enqueuedAt = QDateTime::currentDateTimeUtc();

    {
        QMutexLocker locker(&mutex_);
        messages_.append(message);
    }

    RBUM_DEBUG("Enqueued message {} ({})",
               message.id.toString(QUuid::WithoutBraces).toStdString(),
               command.command.toStdString());
    emit messageEnqueued(message.id);
    return message.id;
}

std::optional<QueuedMessage> XPCMessageQueue::nextPendingMessage() {
    QMutexLocker locker(&mutex_);
    for (auto& message : messages_) {
        if (message.status == QueuedMessageStatus::Pending) {
            message.status = QueuedMessageStatus::InProgress;
            message.lastAttempt = QDateTime::currentDateTimeUtc();
            return message;
        }
    }
    return std::nullopt;
}

Expected<CompletionOutcome, XPCError> XPCMessageQueue::completeMessage(const QUuid& id,
                                                                       std::optional<XPCError> error) {
    const std::string idText = id.toString(QUuid::WithoutBraces).toStdString();
    CompletionOutcome outcome = CompletionOutcome::Completed;
    int attempts = 0;

    {
        QMutexLocker locker(&mutex_);
        const int index = indexOf(id);
        if (index < 0) {
            RBUM_ERROR("Message {} not found for completion", idText);
            return makeUnexpected(XPCError::MessageNotFound);
        }

        QueuedMessage& message = messages_[index];
        if (message.status == QueuedMessageStatus::Completed ||
            message.status == QueuedMessageStatus::Failed) {
            RBUM_WARN("Message {} is already {}", idText, toString(message.status).toStdString());
            return makeUnexpected(XPCError::InvalidMessage);
        }

        if (!error) {
            message.status = QueuedMessageStatus::Completed;
            message.lastError.reset();
            outcome = CompletionOutcome::Completed;
        } else {
            message.attempts++;
            message.lastError = error;
            attempts = message.attempts;

            if (message.attempts < config_.maxRetries) {
                // Stays inProgress until the retry delay elapses
                message.status = QueuedMessageStatus::InProgress;
                outcome = CompletionOutcome::RetryScheduled;
            } else {
                message.status = QueuedMessageStatus::Failed;
                outcome = CompletionOutcome::Failed;
            }
        }
    }

    switch (outcome) {
        case CompletionOutcome::Completed:
            RBUM_DEBUG("Message {} completed successfully", idText);
            emit messageCompleted(id);
            break;

        case CompletionOutcome::RetryScheduled:
            RBUM_WARN("Message {} failed ({}), scheduling retry {}/{} in {}ms",
                      idText, toStdString(*error), attempts, config_.maxRetries,
                      config_.retryDelay.count());
            emit messageRetryScheduled(id, attempts);
            if (scheduler_) {
                QPointer<XPCMessageQueue> self(this);
                scheduler_->schedule(config_.retryDelay, [self, id]() {
                    if (self) {
                        self->returnToPending(id);
                    }
                });
            } else {
                returnToPending(id);
            }
            break;

        case CompletionOutcome::Failed:
            RBUM_ERROR("Message {} failed after {} attempts: {}",
                       idText, attempts, toStdString(*error));
            emit messageFailed(id, errorString(*error));
            break;
    }

    return outcome;
}

Expected<void, XPCError> XPCMessageQueue::cancelMessage(const QUuid& id) {
    const std::string idText = id.toString(QUuid::WithoutBraces).toStdString();
    {
        QMutexLocker locker(&mutex_);
        const int index = indexOf(id);
        if (index < 0) {
            RBUM_ERROR("Message {} not found for cancellation", idText);
            return makeUnexpected(XPCError::MessageNotFound);
        }

        QueuedMessage& message = messages_[index];
        if (message.status == QueuedMessageStatus::Completed ||
            message.status == QueuedMessageStatus::Failed) {
            RBUM_WARN("Message {} is already {}", idText, toString(message.status).toStdString());
            return makeUnexpected(XPCError::InvalidMessage);
        }

        // A pending retry sees Failed and leaves the message alone
        message.status = QueuedMessageStatus::Failed;
        message.lastError = XPCError::Cancelled;
    }

    RBUM_INFO("Message {} cancelled", idText);
    emit messageFailed(id, errorString(XPCError::Cancelled));
    return Expected<void, XPCError>();
}

void XPCMessageQueue::returnToPending(const QUuid& id) {
    {
        QMutexLocker locker(&mutex_);
        const int index = indexOf(id);
        // Cleaned up or otherwise finished while the delay ran
        if (index < 0 || messages_[index].status != QueuedMessageStatus::InProgress) {
            return;
        }
        messages_[index].status = QueuedMessageStatus::Pending;
    }

    RBUM_DEBUG("Message {} is pending again", id.toString(QUuid::WithoutBraces).toStdString());
    emit messageReady(id);
}

XPCQueueStatus XPCMessageQueue::queueStatus() const {
    QMutexLocker locker(&mutex_);
    XPCQueueStatus status;
    for (const auto& message : messages_) {
        switch (message.status) {
            case QueuedMessageStatus::Pending: status.pending++; break;
            case QueuedMessageStatus::InProgress: status.inProgress++; break;
            case QueuedMessageStatus::Completed: status.completed++; break;
            case QueuedMessageStatus::Failed: status.failed++; break;
        }
    }
    return status;
}

std::optional<QueuedMessage> XPCMessageQueue::message(const QUuid& id) const {
    QMutexLocker locker(&mutex_);
    const int index = indexOf(id);
    if (index < 0) {
        return std::nullopt;
    }
    return messages_.at(index);
}

int XPCMessageQueue::cleanup() {
    QMutexLocker locker(&mutex_);
    const auto removed = messages_.removeIf([](const QueuedMessage& message) {
        return message.status == QueuedMessageStatus::Completed ||
               message.status == QueuedMessageStatus::Failed;
    });
    if (removed > 0) {
        RBUM_DEBUG("Removed {} finished messages from queue", removed);
    }
    return static_cast<int>(removed);
}

} // namespace Rbum
