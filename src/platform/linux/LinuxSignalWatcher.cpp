#include "LinuxSignalWatcher.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QSocketNotifier>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

namespace Rbum {

namespace {

int g_signalFds[2] = {-1, -1};
struct sigaction g_previous[NSIG];

void forwardSignal(int signalNumber) {
    const int savedErrno = errno;
    const unsigned char byte = static_cast<unsigned char>(signalNumber);
    // A full buffer already holds a wakeup byte
    [[maybe_unused]] const ssize_t written = ::write(g_signalFds[0], &byte, 1);
    errno = savedErrno;
}

void closeFds() {
    for (int& fd : g_signalFds) {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }
}

} // namespace

LinuxSignalWatcher::LinuxSignalWatcher(QObject* parent)
    : QObject(parent) {
}

LinuxSignalWatcher::~LinuxSignalWatcher() {
    uninstall();
}

Expected<void, XPCError> LinuxSignalWatcher::install(const QList<int>& signalNumbers) {
    if (notifier_ || g_signalFds[0] != -1) {
        Logger::instance().error("A signal watcher is already installed");
        return makeUnexpected(XPCError::InvalidConfiguration);
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, g_signalFds) != 0) {
        Logger::instance().error("socketpair failed: {}", std::strerror(errno));
        g_signalFds[0] = g_signalFds[1] = -1;
        return makeUnexpected(XPCError::ResourceUnavailable);
    }
    ::fcntl(g_signalFds[0], F_SETFL, ::fcntl(g_signalFds[0], F_GETFL) | O_NONBLOCK);

    for (int signalNumber : signalNumbers) {
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = forwardSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;

        if (signalNumber <= 0 || signalNumber >= NSIG ||
            ::sigaction(signalNumber, &action, &g_previous[signalNumber]) != 0) {
            Logger::instance().error("Cannot handle signal {}", signalNumber);
            uninstall();
            closeFds();
            return makeUnexpected(XPCError::InvalidConfiguration);
        }
        signals_.append(signalNumber);
    }

    notifier_ = new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read, this);
    connect(notifier_, &QSocketNotifier::activated, this, &LinuxSignalWatcher::onReadable);
    Logger::instance().debug("Watching {} termination signals", signals_.size());
    return {};
}

void LinuxSignalWatcher::uninstall() {
    for (int signalNumber : signals_) {
        ::sigaction(signalNumber, &g_previous[signalNumber], nullptr);
    }
    signals_.clear();

    if (notifier_) {
        notifier_->setEnabled(false);
        delete notifier_;
        notifier_ = nullptr;
        closeFds();
    }
}

void LinuxSignalWatcher::onReadable() {
    unsigned char byte = 0;
    if (::read(g_signalFds[1], &byte, 1) != 1) {
        return;
    }
    Logger::instance().info("Received signal {}, shutting down", static_cast<int>(byte));
    emit terminationRequested(static_cast<int>(byte));
}

} // namespace Rbum
