#include "XPCConnectionManager.hpp"
#include "XPCFuture.hpp"
#include "core/common/Logger.hpp"
#include "platform/linux/LinuxPeerCredentials.hpp"

#include <QtCore/QHash>
#include <QtCore/QPointer>
#include <QtCore/QPromise>
#include <QtCore/QTimer>
#include <QtNetwork/QLocalSocket>
#include <utility>

namespace Rbum {

namespace {
struct PendingRequest {
    std::shared_ptr<QPromise<XPCConnectionManager::Reply>> promise;
    QString operation;
};

XPCConnectionManager::Reply failedReply(XPCError error) {
    return XPCConnectionManager::Reply(makeUnexpected(error));
}
}

class XPCConnectionManager::XPCConnectionManagerPrivate {
public:
    XPCConnectionConfig config;
    RetryScheduler* scheduler = nullptr;
    std::unique_ptr<TimerRetryScheduler> ownedScheduler;

    QLocalSocket* socket = nullptr;
    XPCFrameReader reader;
    XPCConnectionState state = XPCConnectionState::Disconnected;
    int recoveryAttempt = 0;

    Handler invalidationHandler;
    Handler interruptionHandler;
    std::optional<XPCInterface> exportedInterface;
    std::optional<XPCInterface> remoteInterface;

    qint64 auditSession = 0;
    qint64 confirmedSession = 0;

    QHash<QUuid, PendingRequest> pending;
};

XPCConnectionConfig XPCConnectionConfig::fromConfig(const Config& config) {
    const auto connection = config.getConnectionSettings();
    const auto queue = config.getQueueSettings();

    XPCConnectionConfig result;
    result.serviceName = connection.serviceName;
    result.queueLabel = connection.queueLabel;
    result.interfaceVersion = connection.interfaceVersion;
    result.requestTimeoutMs = connection.requestTimeoutMs;
    result.connectTimeoutMs = connection.connectTimeoutMs;
    result.maxRecoveryAttempts = connection.maxRecoveryAttempts;
    result.recoveryDelayMs = connection.recoveryDelayMs;
    result.maxRetries = queue.maxRetries;
    result.limits = ResourceLimits::fromSettings(config.getResourceSettings());
    result.commandPolicy = CommandPolicy::fromSettings(config.getResticSettings());
    return result;
}

QString toString(XPCConnectionState state) {
    switch (state) {
        case XPCConnectionState::Disconnected: return "disconnected";
        case XPCConnectionState::Connecting: return "connecting";
        case XPCConnectionState::Active: return "active";
        case XPCConnectionState::Interrupted: return "interrupted";
        case XPCConnectionState::Invalidated: return "invalidated";
        case XPCConnectionState::Recovering: return "recovering";
        case XPCConnectionState::Failed: return "failed";
    }
    return "unknown";
}

XPCConnectionManager::XPCConnectionManager(const XPCConnectionConfig& config,
                                           RetryScheduler* scheduler,
                                           QObject* parent)
    : QObject(parent)
    , d(std::make_unique<XPCConnectionManagerPrivate>()) {
    d->config = config;
    d->scheduler = scheduler;
    if (!d->scheduler) {
        d->ownedScheduler = std::make_unique<TimerRetryScheduler>();
        d->scheduler = d->ownedScheduler.get();
    }
    d->auditSession = config.auditSessionId != 0
        ? config.auditSessionId
        : LinuxPeerCredentials::currentAuditSession();
}

XPCConnectionManager::~XPCConnectionManager() {
    failPending(XPCError::ConnectionInvalidated);
    releaseSocket();
}

Expected<void, XPCError> XPCConnectionManager::connectToService() {
    if (d->state == XPCConnectionState::Active && d->socket &&
        d->socket->state() == QLocalSocket::ConnectedState) {
        return Expected<void, XPCError>();
    }

    setState(XPCConnectionState::Connecting);
    auto result = establish();
    if (result.hasError()) {
        Logger::instance().error("Failed to connect to {}: {}",
                                 d->config.serviceName.toStdString(), toStdString(result.error()));
        setState(XPCConnectionState::Disconnected);
        return result;
    }

    d->recoveryAttempt = 0;
    setState(XPCConnectionState::Active);
    Logger::instance().info("Connected to {}", d->config.serviceName.toStdString());
    emit connected();
    return result;
}

Expected<void, XPCError> XPCConnectionManager::establish() {
    releaseSocket();
    d->remoteInterface.reset();
    d->confirmedSession = 0;
    d->reader.reset();

    d->socket = new QLocalSocket(this);
    connect(d->socket, &QLocalSocket::readyRead, this, &XPCConnectionManager::handleReadyRead);
    connect(d->socket, &QLocalSocket::disconnected, this, &XPCConnectionManager::handleDisconnected);

    d->socket->connectToServer(d->config.serviceName);
    if (!d->socket->waitForConnected(d->config.connectTimeoutMs)) {
        Logger::instance().warn("Service {} not reachable: {}",
                                d->config.serviceName.toStdString(),
                                d->socket->errorString().toStdString());
        releaseSocket();
        return makeUnexpected(XPCError::ServiceUnavailable);
    }

    const QByteArray hello = packPayload(d->exportedInterface.value_or(XPCInterface()),
                                         static_cast<qint32>(d->config.interfaceVersion),
                                         d->auditSession);
    const Reply reply = waitForResult(sendEnvelope(XPCMessageType::Handshake, "handshake",
                                                   hello, d->config.connectTimeoutMs));
    if (reply.hasError()) {
        Logger::instance().warn("Handshake with {} failed: {}",
                                d->config.serviceName.toStdString(), toStdString(reply.error()));
        releaseSocket();
        return makeUnexpected(reply.error());
    }

    XPCInterface remote;
    qint64 confirmedSession = 0;
    if (!unpackPayload(reply.value(), remote, confirmedSession)) {
        releaseSocket();
        return makeUnexpected(XPCError::InvalidMessage);
    }

    if (remote.isValid()) {
        if (remote.version != d->config.interfaceVersion) {
            Logger::instance().error("Interface version mismatch: service {} v{}, expected v{}",
                                     remote.name.toStdString(), remote.version,
                                     d->config.interfaceVersion);
            releaseSocket();
            return makeUnexpected(XPCError::InvalidInterface);
        }
        d->remoteInterface = remote;
    } else {
        Logger::instance().warn("Service {} did not describe its interface",
                                d->config.serviceName.toStdString());
    }

    d->confirmedSession = confirmedSession;
    return Expected<void, XPCError>();
}

void XPCConnectionManager::disconnectFromService() {
    failPending(XPCError::ConnectionInvalidated);
    releaseSocket();
    d->remoteInterface.reset();
    d->confirmedSession = 0;
    d->recoveryAttempt = 0;
    setState(XPCConnectionState::Disconnected);
}

void XPCConnectionManager::releaseSocket() {
    if (!d->socket) {
        return;
    }
    QLocalSocket* socket = std::exchange(d->socket, nullptr);
    socket->disconnect(this);
    socket->abort();
    socket->deleteLater();
}

XPCConnectionState XPCConnectionManager::state() const {
    return d->state;
}

int XPCConnectionManager::recoveryAttempt() const {
    return d->recoveryAttempt;
}

bool XPCConnectionManager::isConnected() const {
    return d->state == XPCConnectionState::Active && d->socket &&
           d->socket->state() == QLocalSocket::ConnectedState;
}

void XPCConnectionManager::setState(XPCConnectionState state) {
    if (d->state == state) {
        return;
    }
    const XPCConnectionState previous = d->state;
    d->state = state;
    Logger::instance().info("Connection state: {} -> {}",
                            toString(previous).toStdString(), toString(state).toStdString());
    emit stateChanged(toString(previous), toString(state));
}

void XPCConnectionManager::setInvalidationHandler(Handler handler) {
    d->invalidationHandler = std::move(handler);
}

void XPCConnectionManager::setInterruptionHandler(Handler handler) {
    d->interruptionHandler = std::move(handler);
}

void XPCConnectionManager::setExportedInterface(const XPCInterface& descriptor) {
    d->exportedInterface = descriptor;
}

std::optional<XPCInterface> XPCConnectionManager::exportedInterface() const {
    return d->exportedInterface;
}

std::optional<XPCInterface> XPCConnectionManager::remoteInterface() const {
    return d->remoteInterface;
}

qint64 XPCConnectionManager::auditSessionId() const {
    return d->auditSession;
}

const XPCConnectionConfig& XPCConnectionManager::config() const {
    return d->config;
}

Expected<void, XPCError> XPCConnectionManager::validateConnection() const {
    if (!d->socket || d->state != XPCConnectionState::Active) {
        Logger::instance().error("Connection validation failed: connection not established");
        return makeUnexpected(XPCError::ConnectionNotEstablished);
    }

    if (!d->invalidationHandler) {
        Logger::instance().error("Connection validation failed: invalidation handler not set");
        return makeUnexpected(XPCError::InvalidationHandlerMissing);
    }

    if (!d->exportedInterface) {
        Logger::instance().error("Connection validation failed: exported interface not set");
        return makeUnexpected(XPCError::ExportedInterfaceMissing);
    }

    if (!d->remoteInterface) {
        Logger::instance().error("Connection validation failed: remote interface not set");
        return makeUnexpected(XPCError::RemoteInterfaceMissing);
    }

    if (d->socket->state() != QLocalSocket::ConnectedState) {
        Logger::instance().error("Connection validation failed: remote proxy not available");
        return makeUnexpected(XPCError::RemoteProxyUnavailable);
    }

    if (d->auditSession <= 0 || d->confirmedSession != d->auditSession) {
        Logger::instance().error("Connection validation failed: audit session {} not confirmed (service saw {})",
                                 d->auditSession, d->confirmedSession);
        return makeUnexpected(XPCError::InvalidAuditSession);
    }

    return Expected<void, XPCError>();
}

Expected<void, XPCError> XPCConnectionManager::validateCommandPrerequisites(const XPCCommandConfig& command) {
    auto connection = validateConnection();
    if (connection.hasError()) {
        return connection;
    }

    const QString path = command.environment.value("RESTIC_REPOSITORY", command.workingDirectory);
    auto resources = checkResources(path);
    if (resources.hasError()) {
        Logger::instance().error("Resource check failed: {}", toStdString(resources.error()));
        return makeUnexpected(resources.error());
    }

    auto minimums = validateResourceMinimums(resources.value(), d->config.limits);
    if (minimums.hasError()) {
        return minimums;
    }

    CommandValidator validator(d->config.commandPolicy);
    auto wellFormed = validator.validate(command);
    if (wellFormed.hasError()) {
        return wellFormed;
    }

    auto alive = ping();
    if (alive.hasError()) {
        Logger::instance().error("Health check before command failed: {}", toStdString(alive.error()));
        return alive;
    }

    Logger::instance().debug("Prerequisites satisfied for '{}'", command.command.toStdString());
    return Expected<void, XPCError>();
}

Expected<void, XPCError> XPCConnectionManager::validateConfiguration() const {
    const XPCConnectionConfig& config = d->config;

    if (config.serviceName.isEmpty()) {
        Logger::instance().error("Invalid configuration: empty service name");
        return makeUnexpected(XPCError::InvalidConfiguration);
    }

    if (config.requestTimeoutMs <= 0) {
        Logger::instance().error("Invalid configuration: timeout must be positive (got {}ms)",
                                 config.requestTimeoutMs);
        return makeUnexpected(XPCError::InvalidConfiguration);
    }

    if (config.maxRetries <= 0) {
        Logger::instance().error("Invalid configuration: max retries must be positive (got {})",
                                 config.maxRetries);
        return makeUnexpected(XPCError::InvalidConfiguration);
    }

    if (config.interfaceVersion <= 0) {
        Logger::instance().error("Invalid configuration: interface version must be positive (got {})",
                                 config.interfaceVersion);
        return makeUnexpected(XPCError::InvalidConfiguration);
    }

    if (!config.queueLabel.contains("dev.mpy.rBUM")) {
        Logger::instance().error("Invalid configuration: queue label '{}' outside dev.mpy.rBUM",
                                 config.queueLabel.toStdString());
        return makeUnexpected(XPCError::InvalidConfiguration);
    }

    return Expected<void, XPCError>();
}

QFuture<XPCConnectionManager::Reply> XPCConnectionManager::sendRequest(const QString& operation,
                                                                      const QByteArray& payload,
                                                                      int timeoutMs) {
    if (d->state != XPCConnectionState::Active) {
        return makeFinishedFuture(failedReply(XPCError::ConnectionNotEstablished));
    }
    return sendEnvelope(XPCMessageType::Request, operation, payload, timeoutMs);
}

XPCConnectionManager::Reply XPCConnectionManager::sendRequestAndWait(const QString& operation,
                                                                     const QByteArray& payload,
                                                                     int timeoutMs) {
    return waitForResult(sendRequest(operation, payload, timeoutMs));
}

QFuture<XPCConnectionManager::Reply> XPCConnectionManager::sendEnvelope(XPCMessageType type,
                                                                       const QString& operation,
                                                                       const QByteArray& payload,
                                                                       int timeoutMs) {
    if (!d->socket || d->socket->state() != QLocalSocket::ConnectedState) {
        return makeFinishedFuture(failedReply(XPCError::ConnectionNotEstablished));
    }

    XPCEnvelope envelope;
    envelope.type = type;
    envelope.requestId = QUuid::createUuid();
    envelope.operation = operation;
    envelope.payload = payload;

    auto frame = encodeFrame(envelope);
    if (frame.hasError()) {
        return makeFinishedFuture(failedReply(frame.error()));
    }

    auto promise = std::make_shared<QPromise<Reply>>();
    promise->start();
    QFuture<Reply> future = promise->future();
    d->pending.insert(envelope.requestId, PendingRequest{promise, operation});

    if (d->socket->write(frame.value()) < 0) {
        resolvePending(envelope.requestId, failedReply(XPCError::ConnectionInterrupted));
        return future;
    }

    const int timeout = timeoutMs > 0 ? timeoutMs : d->config.requestTimeoutMs;
    const QUuid requestId = envelope.requestId;
    QTimer::singleShot(timeout, this, [this, requestId, operation]() {
        if (d->pending.contains(requestId)) {
            Logger::instance().warn("Request '{}' timed out", operation.toStdString());
            resolvePending(requestId, failedReply(XPCError::RequestTimeout));
        }
    });

    return future;
}

void XPCConnectionManager::resolvePending(const QUuid& requestId, const Reply& reply) {
    auto it = d->pending.find(requestId);
    if (it == d->pending.end()) {
        Logger::instance().debug("Dropping reply for unknown or expired request {}",
                                 requestId.toString(QUuid::WithoutBraces).toStdString());
        return;
    }

    PendingRequest request = it.value();
    d->pending.erase(it);
    request.promise->addResult(reply);
    request.promise->finish();
}

void XPCConnectionManager::failPending(XPCError error) {
    const QHash<QUuid, PendingRequest> pending = std::exchange(d->pending, {});
    for (const PendingRequest& request : pending) {
        request.promise->addResult(failedReply(error));
        request.promise->finish();
    }
    if (!pending.isEmpty()) {
        Logger::instance().warn("Failed {} pending requests: {}", pending.size(), toStdString(error));
    }
}

void XPCConnectionManager::handleReadyRead() {
    if (!d->socket) {
        return;
    }

    d->reader.append(d->socket->readAll());
    auto frames = d->reader.takeFrames();
    if (frames.hasError()) {
        handleConnectionLoss(XPCConnectionState::Invalidated, frames.error());
        return;
    }

    for (const XPCEnvelope& envelope : frames.value()) {
        if (!dispatch(envelope)) {
            return;
        }
    }
}

bool XPCConnectionManager::dispatch(const XPCEnvelope& envelope) {
    switch (envelope.type) {
        case XPCMessageType::HandshakeReply:
        case XPCMessageType::Pong:
        case XPCMessageType::Reply:
            resolvePending(envelope.requestId, Reply(envelope.payload));
            return true;

        case XPCMessageType::ErrorReply:
            resolvePending(envelope.requestId, failedReply(decodeErrorPayload(envelope.payload)));
            return true;

        case XPCMessageType::Notification:
            if (envelope.operation == "progress") {
                QString line;
                if (unpackPayload(envelope.payload, line)) {
                    emit progressReceived(line);
                }
            }
            return true;

        case XPCMessageType::Shutdown:
            Logger::instance().warn("Service {} is shutting down", d->config.serviceName.toStdString());
            handleConnectionLoss(XPCConnectionState::Invalidated, XPCError::ConnectionInvalidated);
            return false;

        default:
            Logger::instance().warn("Unexpected {} message from service",
                                    toString(envelope.type).toStdString());
            return true;
    }
}

void XPCConnectionManager::handleDisconnected() {
    if (d->state == XPCConnectionState::Active) {
        handleConnectionLoss(XPCConnectionState::Interrupted, XPCError::ConnectionInterrupted);
        return;
    }
    // Dropped mid-handshake; let the waiting connect attempt fail
    failPending(XPCError::ConnectionInterrupted);
}

void XPCConnectionManager::handleConnectionLoss(XPCConnectionState newState, XPCError reason) {
    const bool wasActive = d->state == XPCConnectionState::Active;

    failPending(reason);
    releaseSocket();
    d->remoteInterface.reset();
    d->confirmedSession = 0;
    setState(newState);
    emit connectionLost(errorString(reason));

    const Handler& handler = newState == XPCConnectionState::Invalidated
        ? d->invalidationHandler
        : d->interruptionHandler;
    if (handler) {
        handler();
    }

    if (wasActive && d->config.autoRecover) {
        d->recoveryAttempt = 0;
        scheduleRecovery();
    }
}

void XPCConnectionManager::scheduleRecovery() {
    if (d->recoveryAttempt >= d->config.maxRecoveryAttempts) {
        Logger::instance().error("Connection recovery failed after {} attempts", d->recoveryAttempt);
        setState(XPCConnectionState::Failed);
        return;
    }

    d->recoveryAttempt++;
    setState(XPCConnectionState::Recovering);
    Logger::instance().info("Scheduling connection recovery attempt {}/{} in {}ms",
                            d->recoveryAttempt, d->config.maxRecoveryAttempts,
                            d->config.recoveryDelayMs);

    QPointer<XPCConnectionManager> self(this);
    d->scheduler->schedule(std::chrono::milliseconds(d->config.recoveryDelayMs), [self]() {
        if (self) {
            self->attemptRecovery();
        }
    });
}

void XPCConnectionManager::attemptRecovery() {
    // Disconnected or reconnected by hand while the delay ran
    if (d->state != XPCConnectionState::Recovering) {
        return;
    }

    auto result = establish();
    if (result.hasError()) {
        Logger::instance().warn("Recovery attempt {} failed: {}", d->recoveryAttempt,
                                toStdString(result.error()));
        scheduleRecovery();
        return;
    }

    Logger::instance().info("Connection recovered after {} attempts", d->recoveryAttempt);
    d->recoveryAttempt = 0;
    setState(XPCConnectionState::Active);
    emit connected();
}

Expected<void, XPCError> XPCConnectionManager::ping() {
    if (d->state != XPCConnectionState::Active) {
        return makeUnexpected(XPCError::ConnectionNotEstablished);
    }

    const Reply reply = waitForResult(sendEnvelope(XPCMessageType::Ping, "ping", QByteArray(),
                                                   d->config.requestTimeoutMs));
    if (reply.hasError()) {
        return makeUnexpected(reply.error());
    }
    return Expected<void, XPCError>();
}

Expected<SystemResources, XPCError> XPCConnectionManager::checkResources() {
    return checkResources(QString());
}

Expected<SystemResources, XPCError> XPCConnectionManager::checkResources(const QString& path) {
    const Reply reply = sendRequestAndWait("checkResources", packPayload(path));
    if (reply.hasError()) {
        return makeUnexpected(reply.error());
    }

    SystemResources resources;
    if (!unpackPayload(reply.value(), resources)) {
        return makeUnexpected(XPCError::InvalidMessage);
    }
    return resources;
}

} // namespace Rbum
