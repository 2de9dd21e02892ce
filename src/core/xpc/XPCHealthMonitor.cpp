#include "XPCHealthMonitor.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QMutexLocker>

namespace Rbum {

bool ConnectionHealthStatus::requiresAttention() const {
    switch (state) {
        case HealthState::Healthy:
        case HealthState::Unknown:
            return false;
        case HealthState::Degraded:
            return failedChecks >= 2;
        case HealthState::Unhealthy:
            return true;
    }
    return false;
}

QString ConnectionHealthStatus::describe() const {
    if (state == HealthState::Healthy) {
        return toString(state);
    }
    return QString("%1(%2)").arg(toString(state), reason);
}

QString toString(HealthState state) {
    switch (state) {
        case HealthState::Unknown: return "unknown";
        case HealthState::Healthy: return "healthy";
        case HealthState::Degraded: return "degraded";
        case HealthState::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

XPCHealthMonitor::XPCHealthMonitor(XPCHealthProbe* probe,
                                   const ResourceLimits& limits,
                                   QObject* parent)
    : QObject(parent)
    , probe_(probe)
    , limits_(limits) {
    status_.lastChecked = QDateTime::currentDateTimeUtc();
    connect(&timer_, &QTimer::timeout, this, &XPCHealthMonitor::onTimerTick);

    kickoff_.setSingleShot(true);
    kickoff_.setInterval(0);
    connect(&kickoff_, &QTimer::timeout, this, &XPCHealthMonitor::onTimerTick);
}

XPCHealthMonitor::~XPCHealthMonitor() {
    stopMonitoring();
}

ConnectionHealthStatus XPCHealthMonitor::performHealthCheck() {
    auto next = runExclusiveCheck();
    if (!next) {
        RBUM_DEBUG("Health check already running, returning the last published status");
        return currentStatus();
    }
    publish(*next);
    return currentStatus();
}

std::optional<ConnectionHealthStatus> XPCHealthMonitor::runExclusiveCheck() {
    // The probe may spin a nested event loop; checks never overlap
    if (checkInProgress_) {
        return std::nullopt;
    }

    checkInProgress_ = true;
    const ConnectionHealthStatus next = runCheck(currentStatus());
    checkInProgress_ = false;
    return next;
}

ConnectionHealthStatus XPCHealthMonitor::runCheck(ConnectionHealthStatus next) {
    QElapsedTimer elapsed;
    elapsed.start();

    auto fail = [&next](const QString& reason) {
        next.state = HealthState::Unhealthy;
        next.reason = reason;
        next.resources = SystemResources();
    };

    if (!probe_) {
        fail(errorString(XPCError::ConnectionNotEstablished));
    } else if (auto ping = probe_->ping(); ping.hasError()) {
        fail(errorString(ping.error()));
    } else if (auto resources = probe_->checkResources(); resources.hasError()) {
        fail(errorString(resources.error()));
    } else {
        next.resources = resources.value();
        const QStringList exceeded = next.resources.exceededLimits(limits_);
        if (exceeded.isEmpty()) {
            next.state = HealthState::Healthy;
            next.reason.clear();
        } else {
            next.state = HealthState::Degraded;
            next.reason = QString("System resources exceeded limits: %1").arg(exceeded.join(", "));
        }
    }

    next.responseTimeMs = elapsed.elapsed();
    next.lastChecked = QDateTime::currentDateTimeUtc();
    return next;
}

void XPCHealthMonitor::publish(const ConnectionHealthStatus& next) {
    ConnectionHealthStatus previous;
    {
        QMutexLocker locker(&mutex_);
        previous = status_;
        // Counters are running totals over every published check
        ConnectionHealthStatus merged = next;
        merged.successfulChecks = status_.successfulChecks +
                                  (next.state == HealthState::Healthy ? 1 : 0);
        merged.failedChecks = status_.failedChecks +
                              (next.state == HealthState::Healthy ? 0 : 1);
        status_ = merged;
    }

    const ConnectionHealthStatus current = currentStatus();
    if (previous.state != current.state || previous.reason != current.reason) {
        RBUM_INFO("Health status changed: {} -> {}",
                  previous.describe().toStdString(), current.describe().toStdString());
        emit stateChanged(toString(previous.state), toString(current.state));
    }

    if (current.requiresAttention()) {
        RBUM_WARN("XPC service requires attention: {}", current.describe().toStdString());
        emit attentionRequired(current.reason);
    }

    emit healthCheckCompleted();
}

void XPCHealthMonitor::startMonitoring(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        RBUM_WARN("Ignoring non-positive health check interval {}ms", interval.count());
        return;
    }

    ++generation_;
    timer_.start(interval);
    kickoff_.start();
    RBUM_INFO("Health monitoring started ({}ms interval)", interval.count());
}

void XPCHealthMonitor::stopMonitoring() {
    kickoff_.stop();
    if (!timer_.isActive()) {
        return;
    }
    ++generation_;
    timer_.stop();
    RBUM_INFO("Health monitoring stopped");
}

bool XPCHealthMonitor::isMonitoring() const {
    return timer_.isActive();
}

void XPCHealthMonitor::onTimerTick() {
    const quint64 generation = generation_;
    auto next = runExclusiveCheck();
    if (!next) {
        return;
    }

    if (generation != generation_ || !timer_.isActive()) {
        RBUM_DEBUG("Discarding health check that finished after monitoring stopped");
        return;
    }
    publish(*next);
}

ConnectionHealthStatus XPCHealthMonitor::currentStatus() const {
    QMutexLocker locker(&mutex_);
    return status_;
}

bool XPCHealthMonitor::requiresAttention() const {
    return currentStatus().requiresAttention();
}

} // namespace Rbum
