#pragma once

#include <QtCore/QList>
#include <QtCore/QObject>

#include "core/common/Expected.hpp"
#include "core/xpc/XPCError.hpp"

class QSocketNotifier;

namespace Rbum {

/**
 * @brief Turns termination signals into a queued Qt signal
 *
 * The async-signal handler only writes the signal number into a
 * socketpair; a QSocketNotifier on the other end emits
 * terminationRequested() from the event loop. One watcher may be
 * installed per process. The previous handlers come back on uninstall()
 * or destruction.
 */
class LinuxSignalWatcher : public QObject {
    Q_OBJECT

public:
    explicit LinuxSignalWatcher(QObject* parent = nullptr);
    ~LinuxSignalWatcher() override;

    Expected<void, XPCError> install(const QList<int>& signalNumbers);
    void uninstall();
    bool isInstalled() const { return notifier_ != nullptr; }

signals:
    void terminationRequested(int signalNumber);

private slots:
    void onReadable();

private:
    QSocketNotifier* notifier_ = nullptr;
    QList<int> signals_;
};

} // namespace Rbum
