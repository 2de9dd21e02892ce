#include "XPCServiceHost.hpp"
#include "XPCMessage.hpp"
#include "core/common/Logger.hpp"
#include "core/restic/ResticCommandService.hpp"
#include "platform/linux/LinuxPeerCredentials.hpp"

#include <QtCore/QFutureWatcher>
#include <QtCore/QHash>
#include <QtCore/QPointer>
#include <QtNetwork/QLocalServer>
#include <QtNetwork/QLocalSocket>

namespace Rbum {

namespace {
struct ClientSession {
    XPCFrameReader reader;
    bool handshaken = false;
    qint64 auditSession = 0;
    XPCInterface clientInterface;
};
}

class XPCServiceHost::XPCServiceHostPrivate {
public:
    ResticCommandService* service = nullptr;
    SystemMonitor* monitor = nullptr;
    XPCServiceHostConfig config;

    std::unique_ptr<QLocalServer> server;
    QHash<QLocalSocket*, std::shared_ptr<ClientSession>> clients;

    // Client whose execute request owns the running command
    QPointer<QLocalSocket> executingClient;

    int handshakenCount() const {
        int count = 0;
        for (const auto& session : clients) {
            if (session->handshaken) {
                ++count;
            }
        }
        return count;
    }
};

XPCServiceHost::XPCServiceHost(ResticCommandService* service,
                               SystemMonitor* monitor,
                               const XPCServiceHostConfig& config,
                               QObject* parent)
    : QObject(parent)
    , d(std::make_unique<XPCServiceHostPrivate>()) {
    d->service = service;
    d->monitor = monitor;
    d->config = config;

    if (d->service) {
        connect(d->service, &ResticCommandService::outputReceived,
                this, &XPCServiceHost::forwardProgress);
    }
}

XPCServiceHost::~XPCServiceHost() {
    stop();
}

QStringList XPCServiceHost::operations() {
    return {"ping", "checkResources", "execute", "cancelOperation", "validateBookmark"};
}

XPCInterface XPCServiceHost::exportedInterface() const {
    XPCInterface descriptor;
    descriptor.name = "dev.mpy.rBUM.ResticServiceProtocol";
    descriptor.version = d->config.interfaceVersion;
    descriptor.operations = operations();
    return descriptor;
}

Expected<void, XPCError> XPCServiceHost::start() {
    if (d->server && d->server->isListening()) {
        return Expected<void, XPCError>();
    }

    d->server = std::make_unique<QLocalServer>();
    d->server->setSocketOptions(QLocalServer::UserAccessOption);
    connect(d->server.get(), &QLocalServer::newConnection, this, &XPCServiceHost::handleNewConnection);

    // A crashed previous helper can leave its socket file behind
    QLocalServer::removeServer(d->config.serviceName);

    if (!d->server->listen(d->config.serviceName)) {
        Logger::instance().error("Failed to listen on {}: {}", d->config.serviceName.toStdString(),
                                 d->server->errorString().toStdString());
        d->server.reset();
        return makeUnexpected(XPCError::ServiceUnavailable);
    }

    Logger::instance().info("Service listening on {}", d->server->fullServerName().toStdString());
    return Expected<void, XPCError>();
}

void XPCServiceHost::stop() {
    const auto clients = d->clients.keys();
    for (QLocalSocket* socket : clients) {
        XPCEnvelope shutdown;
        shutdown.type = XPCMessageType::Shutdown;
        shutdown.operation = "shutdown";
        send(socket, shutdown);
        socket->disconnect(this);
        socket->flush();
        socket->disconnectFromServer();
        socket->deleteLater();
    }
    d->clients.clear();

    if (d->server) {
        d->server->close();
        d->server.reset();
        Logger::instance().info("Service on {} stopped", d->config.serviceName.toStdString());
    }
}

bool XPCServiceHost::isListening() const {
    return d->server && d->server->isListening();
}

int XPCServiceHost::clientCount() const {
    return static_cast<int>(d->clients.size());
}

QString XPCServiceHost::fullServerName() const {
    return d->server ? d->server->fullServerName() : QString();
}

void XPCServiceHost::handleNewConnection() {
    while (d->server && d->server->hasPendingConnections()) {
        QLocalSocket* socket = d->server->nextPendingConnection();
        socket->setParent(this);
        d->clients.insert(socket, std::make_shared<ClientSession>());

        connect(socket, &QLocalSocket::readyRead, this, &XPCServiceHost::handleReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, &XPCServiceHost::handleClientDisconnected);

        Logger::instance().debug("Client connected ({} total)", d->clients.size());
        emit clientConnected();
    }
}

void XPCServiceHost::handleClientDisconnected() {
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket || !d->clients.contains(socket)) {
        return;
    }

    d->clients.remove(socket);
    socket->deleteLater();
    Logger::instance().debug("Client disconnected ({} remaining)", d->clients.size());

    // Nobody is left to receive the result
    if (d->executingClient == socket && d->service && d->service->isOperationRunning()) {
        Logger::instance().warn("Requesting client went away, cancelling running command");
        d->service->cancelOperation();
    }
    emit clientDisconnected();
}

void XPCServiceHost::handleReadyRead() {
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) {
        return;
    }

    auto it = d->clients.find(socket);
    if (it == d->clients.end()) {
        return;
    }
    std::shared_ptr<ClientSession> session = it.value();

    session->reader.append(socket->readAll());
    auto frames = session->reader.takeFrames();
    if (frames.hasError()) {
        Logger::instance().warn("Dropping client: {}", toStdString(frames.error()));
        socket->abort();
        return;
    }

    for (const XPCEnvelope& envelope : frames.value()) {
        if (!d->clients.contains(socket)) {
            return;
        }
        process(socket, envelope);
    }
}

void XPCServiceHost::process(QLocalSocket* socket, const XPCEnvelope& envelope) {
    switch (envelope.type) {
        case XPCMessageType::Handshake:
            handleHandshake(socket, envelope);
            return;

        case XPCMessageType::Ping: {
            auto session = d->clients.value(socket);
            if (!session || !session->handshaken) {
                Logger::instance().warn("Ping before handshake");
                replyError(socket, envelope, XPCError::ConnectionNotEstablished);
                return;
            }
            XPCEnvelope pong;
            pong.type = XPCMessageType::Pong;
            pong.requestId = envelope.requestId;
            pong.operation = envelope.operation;
            send(socket, pong);
            return;
        }

        case XPCMessageType::Request:
            handleRequest(socket, envelope);
            return;

        case XPCMessageType::Shutdown:
            socket->disconnectFromServer();
            return;

        default:
            Logger::instance().warn("Unexpected {} message from client",
                                    toString(envelope.type).toStdString());
            replyError(socket, envelope, XPCError::InvalidMessage);
            return;
    }
}

void XPCServiceHost::handleHandshake(QLocalSocket* socket, const XPCEnvelope& envelope) {
    auto session = d->clients.value(socket);

    XPCInterface clientInterface;
    qint32 version = 0;
    qint64 claimedSession = 0;
    if (!unpackPayload(envelope.payload, clientInterface, version, claimedSession)) {
        replyError(socket, envelope, XPCError::InvalidMessage);
        return;
    }

    if (version != d->config.interfaceVersion) {
        Logger::instance().warn("Client speaks interface v{}, service v{}", version, d->config.interfaceVersion);
        replyError(socket, envelope, XPCError::InvalidInterface);
        return;
    }

    if (d->handshakenCount() >= d->config.maxConnections) {
        Logger::instance().warn("Rejecting client: {} connections already active", d->config.maxConnections);
        replyError(socket, envelope, XPCError::ResourceUnavailable);
        return;
    }

    auto peer = LinuxPeerCredentials::peerCredentials(socket->socketDescriptor());
    if (peer.hasError()) {
        replyError(socket, envelope, peer.error());
        return;
    }

    if (d->config.validatePeerSession) {
        auto validated = LinuxPeerCredentials::validatePeer(socket->socketDescriptor(), claimedSession);
        if (validated.hasError()) {
            replyError(socket, envelope, validated.error());
            return;
        }
    }

    session->handshaken = true;
    session->auditSession = peer.value().sessionId;
    session->clientInterface = clientInterface;

    Logger::instance().info("Handshake complete with {} (pid {}, session {})",
                            clientInterface.name.isEmpty() ? std::string("<anonymous>")
                                                           : clientInterface.name.toStdString(),
                            peer.value().pid, peer.value().sessionId);

    XPCEnvelope response;
    response.type = XPCMessageType::HandshakeReply;
    response.requestId = envelope.requestId;
    response.operation = envelope.operation;
    response.payload = packPayload(exportedInterface(), session->auditSession);
    send(socket, response);
}

void XPCServiceHost::handleRequest(QLocalSocket* socket, const XPCEnvelope& envelope) {
    auto session = d->clients.value(socket);
    if (!session || !session->handshaken) {
        replyError(socket, envelope, XPCError::ConnectionNotEstablished);
        return;
    }

    const QString& operation = envelope.operation;
    if (!operations().contains(operation)) {
        Logger::instance().warn("Unknown operation '{}'", operation.toStdString());
        replyError(socket, envelope, XPCError::InvalidMessage);
        return;
    }

    if (operation == "checkResources") {
        QString path;
        if (!unpackPayload(envelope.payload, path)) {
            replyError(socket, envelope, XPCError::InvalidMessage);
            return;
        }
        if (path.isEmpty()) {
            path = d->config.defaultResourcePath;
        }
        if (!d->monitor) {
            replyError(socket, envelope, XPCError::ResourceUnavailable);
            return;
        }
        const SystemResources resources = d->monitor->sample(path, d->handshakenCount());
        reply(socket, envelope, packPayload(resources));
    } else if (!d->service) {
        replyError(socket, envelope, XPCError::ServiceUnavailable);
        return;
    } else if (operation == "execute") {
        handleExecute(socket, envelope);
        return;
    } else if (operation == "cancelOperation") {
        reply(socket, envelope, packPayload(d->service->cancelOperation()));
    } else if (operation == "validateBookmark") {
        QByteArray bookmark;
        if (!unpackPayload(envelope.payload, bookmark)) {
            replyError(socket, envelope, XPCError::InvalidMessage);
            return;
        }
        auto valid = d->service->validateBookmark(bookmark);
        const quint32 code = valid.hasError() ? toWireCode(valid.error()) : 0;
        reply(socket, envelope, packPayload(valid.hasValue(), code));
    } else {
        replyError(socket, envelope, XPCError::InvalidMessage);
        return;
    }

    emit requestHandled(operation);
}

void XPCServiceHost::handleExecute(QLocalSocket* socket, const XPCEnvelope& envelope) {
    XPCCommandConfig command;
    if (!unpackPayload(envelope.payload, command)) {
        replyError(socket, envelope, XPCError::InvalidMessage);
        return;
    }

    const bool wasRunning = d->service->isOperationRunning();
    QFuture<ResticCommandService::Result> future = d->service->executeCommand(command);
    if (!wasRunning) {
        d->executingClient = socket;
    }

    QPointer<QLocalSocket> client(socket);
    auto* watcher = new QFutureWatcher<ResticCommandService::Result>(this);
    connect(watcher, &QFutureWatcherBase::finished, this, [this, watcher, client, envelope]() {
        const ResticCommandService::Result result = watcher->result();
        watcher->deleteLater();

        if (!client || !d->clients.contains(client.data())) {
            Logger::instance().debug("Result for '{}' has no receiver", envelope.operation.toStdString());
            return;
        }

        if (result.hasError()) {
            replyError(client.data(), envelope, result.error());
        } else {
            reply(client.data(), envelope, packPayload(result.value()));
        }
        emit requestHandled(envelope.operation);
    });
    watcher->setFuture(future);
}

void XPCServiceHost::forwardProgress(const QString& line) {
    QLocalSocket* socket = d->executingClient.data();
    if (!socket || !d->clients.contains(socket)) {
        return;
    }

    XPCEnvelope notification;
    notification.type = XPCMessageType::Notification;
    notification.operation = "progress";
    notification.payload = packPayload(line);
    send(socket, notification);
}

void XPCServiceHost::reply(QLocalSocket* socket, const XPCEnvelope& request, const QByteArray& payload) {
    XPCEnvelope response;
    response.type = XPCMessageType::Reply;
    response.requestId = request.requestId;
    response.operation = request.operation;
    response.payload = payload;
    send(socket, response);
}

void XPCServiceHost::replyError(QLocalSocket* socket, const XPCEnvelope& request, XPCError error) {
    Logger::instance().debug("Replying to '{}' with error: {}", request.operation.toStdString(),
                             toStdString(error));
    XPCEnvelope response;
    response.type = XPCMessageType::ErrorReply;
    response.requestId = request.requestId;
    response.operation = request.operation;
    response.payload = encodeErrorPayload(error);
    send(socket, response);
}

void XPCServiceHost::send(QLocalSocket* socket, const XPCEnvelope& envelope) {
    auto frame = encodeFrame(envelope);
    if (frame.hasError()) {
        if (envelope.type != XPCMessageType::ErrorReply) {
            replyError(socket, envelope, frame.error());
        }
        return;
    }

    if (socket->write(frame.value()) < 0) {
        Logger::instance().warn("Failed to write {} to client: {}", toString(envelope.type).toStdString(),
                                socket->errorString().toStdString());
    }
}

} // namespace Rbum
