#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QFuture>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <functional>
#include <memory>
#include <optional>

#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"
#include "core/common/RetryScheduler.hpp"
#include "core/common/SystemMonitor.hpp"
#include "core/security/CommandValidator.hpp"
#include "XPCError.hpp"
#include "XPCHealthMonitor.hpp"
#include "XPCMessage.hpp"
#include "XPCTypes.hpp"

namespace Rbum {

struct XPCConnectionConfig {
    QString serviceName = "dev.mpy.rBUM.ResticService";
    QString queueLabel = "dev.mpy.rBUM.xpc.queue";
    int interfaceVersion = 1;
    qint64 auditSessionId = 0;          // 0 = session of this process
    int requestTimeoutMs = 30000;
    int connectTimeoutMs = 5000;
    int maxRetries = 3;
    int maxRecoveryAttempts = 3;
    int recoveryDelayMs = 2000;
    bool autoRecover = true;
    ResourceLimits limits;
    CommandPolicy commandPolicy;

    static XPCConnectionConfig fromConfig(const Config& config);
};

enum class XPCConnectionState {
    Disconnected,
    Connecting,
    Active,
    Interrupted,
    Invalidated,
    Recovering,
    Failed
};

QString toString(XPCConnectionState state);

/**
 * @brief Client end of the XPC channel to rbum-helper
 *
 * Owns the socket, the handshake and request/reply correlation.
 * Replies are delivered through futures resolved on this object's
 * thread. An unexpected drop fails every pending request with
 * ConnectionInterrupted and, when autoRecover is set, reconnects up to
 * maxRecoveryAttempts times, recoveryDelayMs apart.
 */
class XPCConnectionManager : public QObject, public XPCHealthProbe {
    Q_OBJECT

public:
    using Handler = std::function<void()>;
    using Reply = Expected<QByteArray, XPCError>;

    explicit XPCConnectionManager(const XPCConnectionConfig& config = XPCConnectionConfig(),
                                  RetryScheduler* scheduler = nullptr,
                                  QObject* parent = nullptr);
    ~XPCConnectionManager() override;

    // Connection lifecycle
    Expected<void, XPCError> connectToService();
    void disconnectFromService();
    XPCConnectionState state() const;
    int recoveryAttempt() const;
    bool isConnected() const;

    // Interfaces and handlers
    void setInvalidationHandler(Handler handler);
    void setInterruptionHandler(Handler handler);
    void setExportedInterface(const XPCInterface& descriptor);
    std::optional<XPCInterface> exportedInterface() const;
    std::optional<XPCInterface> remoteInterface() const;
    qint64 auditSessionId() const;

    // Validation
    Expected<void, XPCError> validateConnection() const;
    Expected<void, XPCError> validateCommandPrerequisites(const XPCCommandConfig& command);
    Expected<void, XPCError> validateConfiguration() const;

    // Requests; timeoutMs <= 0 uses requestTimeoutMs
    QFuture<Reply> sendRequest(const QString& operation, const QByteArray& payload, int timeoutMs = 0);
    Reply sendRequestAndWait(const QString& operation, const QByteArray& payload, int timeoutMs = 0);

    // XPCHealthProbe
    Expected<void, XPCError> ping() override;
    Expected<SystemResources, XPCError> checkResources() override;
    Expected<SystemResources, XPCError> checkResources(const QString& path);

    const XPCConnectionConfig& config() const;

signals:
    void stateChanged(const QString& from, const QString& to);
    void connected();
    void connectionLost(const QString& reason);
    void progressReceived(const QString& line);

private slots:
    void handleReadyRead();
    void handleDisconnected();

private:
    class XPCConnectionManagerPrivate;
    std::unique_ptr<XPCConnectionManagerPrivate> d;

    Expected<void, XPCError> establish();
    QFuture<Reply> sendEnvelope(XPCMessageType type, const QString& operation, const QByteArray& payload, int timeoutMs);
    bool dispatch(const XPCEnvelope& envelope);
    void failPending(XPCError error);
    void resolvePending(const QUuid& requestId, const Reply& reply);
    void handleConnectionLoss(XPCConnectionState newState, XPCError reason);
    void scheduleRecovery();
    void attemptRecovery();
    void setState(XPCConnectionState state);
    void releaseSocket();
};

} // namespace Rbum
