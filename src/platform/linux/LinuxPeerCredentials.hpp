#pragma once

#include <QtCore/QtGlobal>

#include "core/common/Expected.hpp"
#include "core/xpc/XPCError.hpp"

namespace Rbum {

struct PeerCredentials {
    qint64 pid = 0;
    quint32 uid = 0;
    quint32 gid = 0;
    qint64 sessionId = 0;
};

namespace LinuxPeerCredentials {

// Session id of the calling process, used as the audit session token
qint64 currentAuditSession();

// Credentials of the process on the other end of a connected local socket
Expected<PeerCredentials, XPCError> peerCredentials(qintptr socketDescriptor);

// Same user (or root) and, when expectedSession is non-zero, same session
Expected<void, XPCError> validatePeer(qintptr socketDescriptor, qint64 expectedSession);

} // namespace LinuxPeerCredentials

} // namespace Rbum
