#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <memory>

#include "core/common/Expected.hpp"
#include "core/common/SystemMonitor.hpp"
#include "XPCError.hpp"
#include "XPCTypes.hpp"

class QLocalSocket;

namespace Rbum {

class ResticCommandService;
struct XPCEnvelope;

struct XPCServiceHostConfig {
    QString serviceName = "dev.mpy.rBUM.ResticService";
    int interfaceVersion = 1;
    int maxConnections = 10;
    bool validatePeerSession = true;
    QString defaultResourcePath;        // disk probe when a client names no path
};

/**
 * @brief Service end of the XPC channel, run inside rbum-helper
 *
 * Accepts local connections, performs the handshake (interface version,
 * peer uid and audit session) and dispatches requests to the
 * ResticCommandService. Output of the running command is forwarded to
 * the client that started it as progress notifications.
 */
class XPCServiceHost : public QObject {
    Q_OBJECT

public:
    XPCServiceHost(ResticCommandService* service,
                   SystemMonitor* monitor,
                   const XPCServiceHostConfig& config = XPCServiceHostConfig(),
                   QObject* parent = nullptr);
    ~XPCServiceHost() override;

    Expected<void, XPCError> start();
    void stop();
    bool isListening() const;
    int clientCount() const;
    QString fullServerName() const;

    XPCInterface exportedInterface() const;
    static QStringList operations();

signals:
    void clientConnected();
    void clientDisconnected();
    void requestHandled(const QString& operation);

private slots:
    void handleNewConnection();
    void handleReadyRead();
    void handleClientDisconnected();
    void forwardProgress(const QString& line);

private:
    class XPCServiceHostPrivate;
    std::unique_ptr<XPCServiceHostPrivate> d;

    void process(QLocalSocket* socket, const XPCEnvelope& envelope);
    void handleHandshake(QLocalSocket* socket, const XPCEnvelope& envelope);
    void handleRequest(QLocalSocket* socket, const XPCEnvelope& envelope);
    void handleExecute(QLocalSocket* socket, const XPCEnvelope& envelope);
    void reply(QLocalSocket* socket, const XPCEnvelope& request, const QByteArray& payload);
    void replyError(QLocalSocket* socket, const XPCEnvelope& request, XPCError error);
    void send(QLocalSocket* socket, const XPCEnvelope& envelope);
};

} // namespace Rbum
