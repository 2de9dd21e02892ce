#pragma once

#include <QtCore/QObject>
#include <chrono>
#include <functional>

namespace Rbum {

/**
 * @brief Runs a task after a delay
 *
 * Retry and recovery paths depend on this interface rather than on
 * QTimer directly so tests can fire the delay deterministically.
 */
class RetryScheduler {
public:
    virtual ~RetryScheduler() = default;

    virtual void schedule(std::chrono::milliseconds delay, std::function<void()> task) = 0;
};

// Delivers the task on this object's thread through QTimer::singleShot
class TimerRetryScheduler : public QObject, public RetryScheduler {
    Q_OBJECT

public:
    explicit TimerRetryScheduler(QObject* parent = nullptr);

    void schedule(std::chrono::milliseconds delay, std::function<void()> task) override;
    int scheduledCount() const { return scheduledCount_; }

private:
    int scheduledCount_ = 0;
};

} // namespace Rbum
