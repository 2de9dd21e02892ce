#include "LinuxPeerCredentials.hpp"
#include "core/common/Logger.hpp"

#ifdef Q_OS_UNIX
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#endif

namespace Rbum {
namespace LinuxPeerCredentials {

qint64 currentAuditSession() {
#ifdef Q_OS_UNIX
    return static_cast<qint64>(::getsid(0));
#else
    return 1;
#endif
}

Expected<PeerCredentials, XPCError> peerCredentials(qintptr socketDescriptor) {
#ifdef Q_OS_LINUX
    struct ucred cred;
    socklen_t len = sizeof(cred);

    if (::getsockopt(static_cast<int>(socketDescriptor), SOL_SOCKET, SO_PEERCRED, &cred, &len) == -1) {
        Logger::instance().error("Failed to get peer credentials: errno {}", errno);
        return makeUnexpected(XPCError::InvalidAuditSession);
    }

    PeerCredentials credentials;
    credentials.pid = cred.pid;
    credentials.uid = cred.uid;
    credentials.gid = cred.gid;
    credentials.sessionId = static_cast<qint64>(::getsid(cred.pid));
    return credentials;
#else
    Q_UNUSED(socketDescriptor)
    // No peer credential support; trust the local session
    PeerCredentials credentials;
    credentials.sessionId = currentAuditSession();
    return credentials;
#endif
}

Expected<void, XPCError> validatePeer(qintptr socketDescriptor, qint64 expectedSession) {
    auto credentials = peerCredentials(socketDescriptor);
    if (credentials.hasError()) {
        return makeUnexpected(credentials.error());
    }

    const PeerCredentials& peer = credentials.value();
#ifdef Q_OS_UNIX
    if (peer.uid != static_cast<quint32>(::getuid()) && peer.uid != 0) {
        Logger::instance().warn("Peer credentials rejected: uid={} pid={}", peer.uid, peer.pid);
        return makeUnexpected(XPCError::InvalidAuditSession);
    }
#endif

    if (expectedSession != 0 && peer.sessionId != expectedSession) {
        Logger::instance().warn("Peer audit session mismatch: claimed {} actual {}",
                                expectedSession, peer.sessionId);
        return makeUnexpected(XPCError::InvalidAuditSession);
    }

    Logger::instance().debug("Peer credentials validated: uid={} gid={} pid={} session={}",
                             peer.uid, peer.gid, peer.pid, peer.sessionId);
    return Expected<void, XPCError>();
}

} // namespace LinuxPeerCredentials
} // namespace Rbum
