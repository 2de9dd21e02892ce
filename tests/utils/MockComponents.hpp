#pragma once

#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QQueue>
#include <QtCore/QString>
#include <chrono>
#include <functional>
#include <vector>

#include "../../src/core/common/Expected.hpp"
#include "../../src/core/common/RetryScheduler.hpp"
#include "../../src/core/common/SystemMonitor.hpp"
#include "../../src/core/security/SecurityService.hpp"
#include "../../src/core/xpc/XPCError.hpp"
#include "../../src/core/xpc/XPCHealthMonitor.hpp"

namespace Rbum {
namespace Test {

/**
 * @brief Retry scheduler whose delays only elapse when the test says so
 */
class ManualRetryScheduler : public RetryScheduler {
public:
    void schedule(std::chrono::milliseconds delay, std::function<void()> task) override;

    int pendingCount() const { return static_cast<int>(tasks_.size()); }
    std::chrono::milliseconds lastDelay() const { return lastDelay_; }

    // Runs the oldest scheduled task, false if none was pending
    bool runNext();
    int runAll();

private:
    std::vector<std::function<void()>> tasks_;
    std::chrono::milliseconds lastDelay_{0};
};

/**
 * @brief System monitor returning a fixed sample
 *
 * Defaults are comfortably inside ResourceLimits().
 */
class FakeSystemMonitor : public SystemMonitor {
public:
    FakeSystemMonitor();

    SystemResources sample(const QString& path, int activeConnections = 0) override;

    void setResources(const SystemResources& resources) { resources_ = resources; }
    SystemResources& resources() { return resources_; }

    int sampleCount() const { return sampleCount_; }
    QString lastPath() const { return lastPath_; }

    static SystemResources healthyResources();

private:
    SystemResources resources_;
    int sampleCount_ = 0;
    QString lastPath_;
};

/**
 * @brief Health probe answering from queued results
 *
 * When a queue runs dry the default result is returned.
 */
class ScriptedHealthProbe : public XPCHealthProbe {
public:
    ScriptedHealthProbe();

    Expected<void, XPCError> ping() override;
    Expected<SystemResources, XPCError> checkResources() override;

    void queuePingFailure(XPCError error) { pingFailures_.enqueue(error); }
    void setPingFailure(XPCError error) { persistentPingFailure_ = error; hasPersistentFailure_ = true; }
    void clearPingFailure() { hasPersistentFailure_ = false; pingFailures_.clear(); }

    void setResources(const SystemResources& resources) { resources_ = resources; }
    void setPingDelayMs(int delayMs) { pingDelayMs_ = delayMs; }
    // ping() waits in a nested event loop, the way a real round trip does
    void setPingEventLoopMs(int waitMs) { pingEventLoopMs_ = waitMs; }

    int pingCount() const { return pingCount_; }
    // Deepest nesting of ping() calls seen so far
    int maxConcurrentPings() const { return maxConcurrentPings_; }
    int resourceCheckCount() const { return resourceCheckCount_; }

private:
    QQueue<XPCError> pingFailures_;
    XPCError persistentPingFailure_ = XPCError::ConnectionInterrupted;
    bool hasPersistentFailure_ = false;
    SystemResources resources_;
    int pingDelayMs_ = 0;
    int pingEventLoopMs_ = 0;
    int pingCount_ = 0;
    int activePings_ = 0;
    int maxConcurrentPings_ = 0;
    int resourceCheckCount_ = 0;
};

/**
 * @brief Production security that counts access starts and stops
 *
 * failStartAt(n) makes the n-th start (1-based) fail with AccessDenied.
 */
class CountingSecurityService : public ProductionSecurityService {
public:
    using ProductionSecurityService::ProductionSecurityService;

    Expected<void, XPCError> startAccessing(SecurityScopedAccess& access) override;
    void stopAccessing(SecurityScopedAccess& access) override;

    void failStartAt(int attempt) { failStartAt_ = attempt; }

    int started() const { return started_; }
    int stopped() const { return stopped_; }
    int held() const { return started_ - stopped_; }

private:
    int attempts_ = 0;
    int failStartAt_ = 0;
    int started_ = 0;
    int stopped_ = 0;
};

} // namespace Test
} // namespace Rbum
