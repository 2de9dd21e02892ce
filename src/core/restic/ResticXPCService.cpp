#include "ResticXPCService.hpp"
#include "ResticTypes.hpp"
#include "core/common/Logger.hpp"
#include "core/xpc/XPCFuture.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QFutureWatcher>
#include <QtCore/QHash>
#include <QtCore/QPromise>
#include <QtCore/QTimer>
#include <algorithm>

namespace Rbum {

namespace {
ResticXPCService::Result failed(XPCError error) {
    return makeUnexpected(error);
}

// Slack on top of the command's own timeout for process start and reply transport
constexpr int kReplyGraceMs = 10000;
}

class ResticXPCService::ResticXPCServicePrivate {
public:
    XPCConnectionManager* connection = nullptr;
    XPCMessageQueue* queue = nullptr;
    XPCHealthMonitor* health = nullptr;
    std::shared_ptr<SecurityService> security;

    QTimer processTimer;
    QHash<QUuid, std::shared_ptr<QPromise<Result>>> promises;
    QHash<QUuid, QFutureWatcher<Result>*> watchers;
    QUuid inFlight;
};

ResticXPCService::ResticXPCService(XPCConnectionManager* connection,
                                   XPCMessageQueue* queue,
                                   XPCHealthMonitor* health,
                                   std::shared_ptr<SecurityService> security,
                                   std::chrono::milliseconds processInterval,
                                   QObject* parent)
    : QObject(parent)
    , d(std::make_unique<ResticXPCServicePrivate>()) {
    d->connection = connection;
    d->queue = queue;
    d->health = health;
    d->security = std::move(security);

    if (d->connection) {
        connect(d->connection, &XPCConnectionManager::progressReceived,
                this, &ResticXPCService::progressReceived);
    }

    d->processTimer.setInterval(processInterval);
    connect(&d->processTimer, &QTimer::timeout, this, &ResticXPCService::processQueue);
    startProcessing();
}

ResticXPCService::~ResticXPCService() {
    stopProcessing();
    const auto ids = d->promises.keys();
    for (const QUuid& id : ids) {
        resolve(id, failed(XPCError::Cancelled));
    }
}

QFuture<ResticXPCService::Result> ResticXPCService::initializeRepository(const QString& repositoryPath,
                                                                         const QString& password) {
    auto config = buildConfig("init", {}, repositoryPath, password, kShortOperationTimeout);
    if (config.hasError()) {
        return makeFinishedFuture(failed(config.error()));
    }
    return executeCommand(config.value());
}

QFuture<ResticXPCService::Result> ResticXPCService::createBackup(const QString& repositoryPath,
                                                                 const QStringList& sourcePaths,
                                                                 const QString& password,
                                                                 const QStringList& excludes) {
    if (sourcePaths.isEmpty()) {
        Logger::instance().error("Backup requested without source paths");
        return makeFinishedFuture(failed(XPCError::InvalidCommand));
    }

    QStringList arguments;
    for (const QString& pattern : excludes) {
        arguments << "--exclude" << pattern;
    }
    arguments << sourcePaths;

    auto config = buildConfig("backup", arguments, repositoryPath, password, kLongOperationTimeout);
    if (config.hasError()) {
        return makeFinishedFuture(failed(config.error()));
    }

    for (int i = 0; i < sourcePaths.size(); ++i) {
        const QString& source = sourcePaths.at(i);
        auto added = addBookmark(config.value(), QString("source%1").arg(i), source, QFileInfo(source).isDir());
        if (added.hasError()) {
            return makeFinishedFuture(failed(added.error()));
        }
    }
    return executeCommand(config.value());
}

QFuture<ResticXPCService::Result> ResticXPCService::listSnapshots(const QString& repositoryPath,
                                                                  const QString& password) {
    auto config = buildConfig("snapshots", {}, repositoryPath, password, kShortOperationTimeout);
    if (config.hasError()) {
        return makeFinishedFuture(failed(config.error()));
    }
    return executeCommand(config.value());
}

QFuture<ResticXPCService::Result> ResticXPCService::restore(const QString& repositoryPath,
                                                            const QString& password,
                                                            const QString& snapshotId,
                                                            const QString& targetPath,
                                                            const QStringList& paths) {
    if (snapshotId.trimmed().isEmpty()) {
        Logger::instance().error("Restore requested without a snapshot id");
        return makeFinishedFuture(failed(XPCError::InvalidCommand));
    }

    QStringList arguments{snapshotId, "--target", targetPath};
    for (const QString& path : paths) {
        arguments << "--include" << path;
    }

    auto config = buildConfig("restore", arguments, repositoryPath, password, kLongOperationTimeout);
    if (config.hasError()) {
        return makeFinishedFuture(failed(config.error()));
    }

    auto added = addBookmark(config.value(), "target", targetPath, true);
    if (added.hasError()) {
        return makeFinishedFuture(failed(added.error()));
    }
    return executeCommand(config.value());
}

QFuture<ResticXPCService::Result> ResticXPCService::checkRepository(const QString& repositoryPath,
                                                                    const QString& password) {
    auto config = buildConfig("check", {}, repositoryPath, password, kLongOperationTimeout);
    if (config.hasError()) {
        return makeFinishedFuture(failed(config.error()));
    }
    return executeCommand(config.value());
}

QFuture<ResticXPCService::Result> ResticXPCService::executeCommand(const XPCCommandConfig& command) {
    if (!d->connection || !d->queue) {
        return makeFinishedFuture(failed(XPCError::ServiceUnavailable));
    }

    auto prerequisites = d->connection->validateCommandPrerequisites(command);
    if (prerequisites.hasError()) {
        Logger::instance().warn("Command '{}' rejected: {}", command.command.toStdString(),
                                toStdString(prerequisites.error()));
        return makeFinishedFuture(failed(prerequisites.error()));
    }

    if (d->health) {
        const ConnectionHealthStatus health = d->health->currentStatus();
        if (health.state == HealthState::Unhealthy) {
            Logger::instance().warn("Command '{}' rejected, connection unhealthy: {}",
                                    command.command.toStdString(), health.reason.toStdString());
            return makeFinishedFuture(failed(XPCError::ServiceUnavailable));
        }
    }

    auto promise = std::make_shared<QPromise<Result>>();
    promise->start();
    QFuture<Result> future = promise->future();

    const QUuid id = d->queue->enqueue(command);
    d->promises.insert(id, promise);

    auto* watcher = new QFutureWatcher<Result>(this);
    connect(watcher, &QFutureWatcherBase::canceled, this, [this, id]() {
        abandon(id);
    });
    watcher->setFuture(future);
    d->watchers.insert(id, watcher);
    Logger::instance().debug("Queued '{}' as {}", command.command.toStdString(),
                             id.toString(QUuid::WithoutBraces).toStdString());
    return future;
}

Expected<bool, XPCError> ResticXPCService::cancelOperation() {
    if (!d->connection) {
        return makeUnexpected(XPCError::ServiceUnavailable);
    }

    const auto reply = d->connection->sendRequestAndWait("cancelOperation", QByteArray());
    if (reply.hasError()) {
        return makeUnexpected(reply.error());
    }

    bool cancelled = false;
    if (!unpackPayload(reply.value(), cancelled)) {
        return makeUnexpected(XPCError::InvalidMessage);
    }
    Logger::instance().info("Cancel request {}", cancelled ? "stopped the running command" : "found nothing running");
    return cancelled;
}

Expected<void, XPCError> ResticXPCService::validateBookmark(const QByteArray& bookmarkData) {
    if (!d->connection) {
        return makeUnexpected(XPCError::ServiceUnavailable);
    }

    const auto reply = d->connection->sendRequestAndWait("validateBookmark", packPayload(bookmarkData));
    if (reply.hasError()) {
        return makeUnexpected(reply.error());
    }

    bool valid = false;
    quint32 code = 0;
    if (!unpackPayload(reply.value(), valid, code)) {
        return makeUnexpected(XPCError::InvalidMessage);
    }
    if (!valid) {
        return makeUnexpected(fromWireCode(code));
    }
    return Expected<void, XPCError>();
}

XPCQueueStatus ResticXPCService::queueStatus() const {
    return d->queue ? d->queue->queueStatus() : XPCQueueStatus();
}

int ResticXPCService::cleanupQueue() {
    return d->queue ? d->queue->cleanup() : 0;
}

void ResticXPCService::startProcessing() {
    if (!d->processTimer.isActive()) {
        d->processTimer.start();
    }
}

void ResticXPCService::stopProcessing() {
    d->processTimer.stop();
}

bool ResticXPCService::isProcessing() const {
    return d->processTimer.isActive();
}

bool ResticXPCService::hasRequestInFlight() const {
    return !d->inFlight.isNull();
}

void ResticXPCService::processQueue() {
    if (!d->queue || !d->connection || !d->inFlight.isNull()) {
        return;
    }

    auto next = d->queue->nextPendingMessage();
    if (!next) {
        return;
    }

    const QUuid id = next->id;
    d->inFlight = id;

    const int timeoutMs = std::max(d->connection->config().requestTimeoutMs,
                                   next->command.timeoutSeconds * 1000 + kReplyGraceMs);

    Logger::instance().debug("Sending '{}' (attempt {})", next->command.command.toStdString(),
                             next->attempts + 1);

    auto* watcher = new QFutureWatcher<XPCConnectionManager::Reply>(this);
    connect(watcher, &QFutureWatcherBase::finished, this, [this, watcher, id]() {
        const XPCConnectionManager::Reply reply = watcher->result();
        watcher->deleteLater();
        handleReply(id, reply);
    });
    watcher->setFuture(d->connection->sendRequest("execute", packPayload(next->command), timeoutMs));
}

void ResticXPCService::abandon(const QUuid& id) {
    auto promise = d->promises.take(id);
    if (!promise) {
        return;
    }
    if (auto* watcher = d->watchers.take(id)) {
        watcher->disconnect(this);
        watcher->deleteLater();
    }

    const std::string idText = id.toString(QUuid::WithoutBraces).toStdString();
    auto dropped = d->queue->cancelMessage(id);
    if (dropped.hasError()) {
        Logger::instance().warn("Could not drop cancelled message {}: {}", idText, toStdString(dropped.error()));
    }

    if (id == d->inFlight) {
        Logger::instance().info("Caller cancelled {} while it runs, asking the helper to stop it", idText);
        auto* stop = new QFutureWatcher<XPCConnectionManager::Reply>(this);
        connect(stop, &QFutureWatcherBase::finished, this, [stop, idText]() {
            const XPCConnectionManager::Reply reply = stop->result();
            stop->deleteLater();
            if (reply.hasError()) {
                Logger::instance().warn("Cancel request for {} failed: {}", idText, toStdString(reply.error()));
            }
        });
        stop->setFuture(d->connection->sendRequest("cancelOperation", QByteArray()));
    } else {
        Logger::instance().info("Caller cancelled {} before it was sent", idText);
    }

    promise->finish();
    emit commandFinished(id, false);
}

void ResticXPCService::handleReply(const QUuid& id, const XPCConnectionManager::Reply& reply) {
    d->inFlight = QUuid();

    if (!d->promises.contains(id)) {
        Logger::instance().debug("Dropping reply for abandoned message {}",
                                 id.toString(QUuid::WithoutBraces).toStdString());
        return;
    }

    if (reply.hasError() && isTransient(reply.error())) {
        const auto outcome = d->queue->completeMessage(id, reply.error());
        if (outcome.hasError()) {
            resolve(id, failed(outcome.error()));
        } else if (outcome.value() == CompletionOutcome::Failed) {
            resolve(id, failed(reply.error()));
        }
        return;
    }

    // Anything the helper answered, success or not, is final
    const auto completed = d->queue->completeMessage(id);
    if (completed.hasError()) {
        Logger::instance().warn("Could not complete message {}: {}",
                                id.toString(QUuid::WithoutBraces).toStdString(),
                                toStdString(completed.error()));
    }

    if (reply.hasError()) {
        resolve(id, failed(reply.error()));
        return;
    }

    ProcessResult result;
    if (!unpackPayload(reply.value(), result)) {
        resolve(id, failed(XPCError::InvalidMessage));
        return;
    }
    resolve(id, result);
}

void ResticXPCService::resolve(const QUuid& id, const Result& result) {
    auto promise = d->promises.take(id);
    if (!promise) {
        return;
    }
    if (auto* watcher = d->watchers.take(id)) {
        watcher->disconnect(this);
        watcher->deleteLater();
    }

    if (result.hasError()) {
        Logger::instance().warn("Command {} failed: {}", id.toString(QUuid::WithoutBraces).toStdString(),
                                toStdString(result.error()));
    }
    promise->addResult(result);
    promise->finish();
    emit commandFinished(id, result.hasValue() && result.value().succeeded());
}

Expected<XPCCommandConfig, XPCError> ResticXPCService::buildConfig(const QString& command,
                                                                   const QStringList& arguments,
                                                                   const QString& repositoryPath,
                                                                   const QString& password,
                                                                   int timeoutSeconds) const {
    if (password.isEmpty()) {
        Logger::instance().error("Refusing '{}' without a repository password", command.toStdString());
        return makeUnexpected(XPCError::MissingEnvironment);
    }

    XPCCommandConfig config;
    config.command = command;
    config.arguments = arguments;
    config.timeoutSeconds = timeoutSeconds;
    config.auditSessionId = d->connection ? d->connection->auditSessionId() : 0;

    auto added = addBookmark(config, "repository", repositoryPath, true);
    if (added.hasError()) {
        return makeUnexpected(added.error());
    }

    const QString repository = QFileInfo(repositoryPath).absoluteFilePath();
    config.workingDirectory = repository;
    config.environment.insert("RESTIC_REPOSITORY", repository);
    config.environment.insert("RESTIC_PASSWORD", password);
    return config;
}

Expected<void, XPCError> ResticXPCService::addBookmark(XPCCommandConfig& config, const QString& name,
                                                       const QString& path, bool isDirectory) const {
    if (!d->security) {
        return makeUnexpected(XPCError::ServiceUnavailable);
    }

    auto bookmark = d->security->createBookmark(path, isDirectory);
    if (bookmark.hasError()) {
        Logger::instance().error("Could not bookmark {} '{}': {}", name.toStdString(), path.toStdString(),
                                 toStdString(bookmark.error()));
        return makeUnexpected(bookmark.error());
    }
    config.bookmarks.insert(name, bookmark.value());
    return Expected<void, XPCError>();
}

} // namespace Rbum
