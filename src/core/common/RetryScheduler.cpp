#include "RetryScheduler.hpp"
#include "Logger.hpp"

#include <QtCore/QTimer>

namespace Rbum {

TimerRetryScheduler::TimerRetryScheduler(QObject* parent)
    : QObject(parent) {
}

void TimerRetryScheduler::schedule(std::chrono::milliseconds delay, std::function<void()> task) {
    ++scheduledCount_;
    Logger::instance().debug("Scheduling retry in {}ms", delay.count());
    QTimer::singleShot(delay, this, std::move(task));
}

} // namespace Rbum
