#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTimer>
#include <chrono>
#include <optional>

#include "core/common/Expected.hpp"
#include "core/common/SystemMonitor.hpp"
#include "XPCError.hpp"

namespace Rbum {

// What the monitor needs from a connection
class XPCHealthProbe {
public:
    virtual ~XPCHealthProbe() = default;

    virtual Expected<void, XPCError> ping() = 0;
    virtual Expected<SystemResources, XPCError> checkResources() = 0;
};

enum class HealthState {
    Unknown,
    Healthy,
    Degraded,
    Unhealthy
};

struct ConnectionHealthStatus {
    HealthState state = HealthState::Unknown;
    QString reason = QStringLiteral("Initial state");
    int successfulChecks = 0;
    int failedChecks = 0;
    QDateTime lastChecked;
    qint64 responseTimeMs = 0;
    SystemResources resources;

    bool requiresAttention() const;
    QString describe() const;
};

QString toString(HealthState state);

/**
 * @brief Periodic ping plus resource probe over an XPC connection
 *
 * The status is replaced as a whole under a mutex, so currentStatus()
 * never observes a half-updated check. Checks run one at a time: a
 * call made while another waits on the probe returns the last published
 * status. Once stopMonitoring() returns, a timer-driven check still in
 * flight is discarded instead of published.
 */
class XPCHealthMonitor : public QObject {
    Q_OBJECT

public:
    explicit XPCHealthMonitor(XPCHealthProbe* probe,
                              const ResourceLimits& limits = ResourceLimits(),
                              QObject* parent = nullptr);
    ~XPCHealthMonitor() override;

    ConnectionHealthStatus performHealthCheck();

    // Checks once right away, then every interval. Restarts the single
    // timer when already running.
    void startMonitoring(std::chrono::milliseconds interval = std::chrono::milliseconds(30000));
    void stopMonitoring();
    bool isMonitoring() const;

    ConnectionHealthStatus currentStatus() const;
    bool requiresAttention() const;

signals:
    void healthCheckCompleted();
    void stateChanged(const QString& from, const QString& to);
    void attentionRequired(const QString& reason);

private slots:
    void onTimerTick();

private:
    // nullopt when another check is still waiting on the probe
    std::optional<ConnectionHealthStatus> runExclusiveCheck();
    ConnectionHealthStatus runCheck(ConnectionHealthStatus next);
    void publish(const ConnectionHealthStatus& next);

    XPCHealthProbe* probe_;
    ResourceLimits limits_;
    QTimer timer_;
    QTimer kickoff_;

    mutable QMutex mutex_;
    ConnectionHealthStatus status_;

    bool checkInProgress_ = false;
    quint64 generation_ = 0;
};

} // namespace Rbum
