#include "SecurityScopedAccess.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QIODevice>

#ifdef Q_OS_UNIX
#include <sys/stat.h>
#endif

namespace Rbum {

namespace {
constexpr quint32 kBookmarkMagic = 0x52424D4B; // "RBMK"
constexpr quint16 kBookmarkVersion = 1;
constexpr quint32 kAccessMagic = 0x52425341;   // "RBSA"
}

SecurityScopedAccess::FileIdentity SecurityScopedAccess::identityOf(const QString& path) {
    FileIdentity identity;
    QFileInfo info(path);
    identity.exists = info.exists();
    identity.isDirectory = info.isDir();

#ifdef Q_OS_UNIX
    struct stat st;
    if (identity.exists && ::stat(QFile::encodeName(path).constData(), &st) == 0) {
        identity.device = static_cast<quint64>(st.st_dev);
        identity.inode = static_cast<quint64>(st.st_ino);
    }
#endif
    return identity;
}

QByteArray SecurityScopedAccess::makeBookmark(const QString& path, const FileIdentity& identity) {
    QByteArray data;
    QDataStream stream(&data, QIODevice::WriteOnly);
    stream.setVersion(QDataStream::Qt_6_0);
    stream << kBookmarkMagic << kBookmarkVersion
           << path << identity.isDirectory << identity.device << identity.inode;
    return data;
}

Expected<SecurityScopedAccess, XPCError> SecurityScopedAccess::create(const QString& path, bool isDirectory) {
    if (path.isEmpty()) {
        return makeUnexpected(XPCError::InvalidURL);
    }

    const QString absolute = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    const FileIdentity identity = identityOf(absolute);
    if (!identity.exists) {
        RBUM_WARN("Cannot create security-scoped access, file not found: {}", absolute.toStdString());
        return makeUnexpected(XPCError::FileNotFound);
    }

    if (identity.isDirectory != isDirectory) {
        RBUM_WARN("Cannot create security-scoped access, kind mismatch for {}", absolute.toStdString());
        return makeUnexpected(XPCError::InvalidURL);
    }

    SecurityScopedAccess access;
    access.path_ = absolute;
    access.isDirectory_ = isDirectory;
    access.bookmark_ = makeBookmark(absolute, identity);
    return access;
}

Expected<SecurityScopedAccess, XPCError> SecurityScopedAccess::resolve(const QByteArray& bookmarkData) {
    if (bookmarkData.isEmpty()) {
        return makeUnexpected(XPCError::BookmarkInvalid);
    }

    QDataStream stream(bookmarkData);
    stream.setVersion(QDataStream::Qt_6_0);

    quint32 magic = 0;
    quint16 version = 0;
    QString path;
    bool isDirectory = false;
    quint64 device = 0;
    quint64 inode = 0;
    stream >> magic >> version >> path >> isDirectory >> device >> inode;

    if (stream.status() != QDataStream::Ok || magic != kBookmarkMagic ||
        version != kBookmarkVersion || path.isEmpty()) {
        RBUM_WARN("Bookmark data could not be decoded");
        return makeUnexpected(XPCError::BookmarkInvalid);
    }

    const FileIdentity current = identityOf(path);
    if (!current.exists) {
        RBUM_WARN("Bookmark target no longer exists: {}", path.toStdString());
        return makeUnexpected(XPCError::BookmarkResolutionFailed);
    }

    if (current.isDirectory != isDirectory || current.device != device || current.inode != inode) {
        RBUM_WARN("Bookmark is stale for {}", path.toStdString());
        return makeUnexpected(XPCError::BookmarkStale);
    }

    SecurityScopedAccess access;
    access.path_ = path;
    access.isDirectory_ = isDirectory;
    access.bookmark_ = bookmarkData;
    return access;
}

Expected<void, XPCError> SecurityScopedAccess::startAccessing() {
    if (isAccessing_) {
        return Expected<void, XPCError>();
    }

    QFileInfo info(path_);
    if (!info.exists() || info.isDir() != isDirectory_) {
        RBUM_ERROR("Failed to start accessing {}: resource moved", path_.toStdString());
        return makeUnexpected(XPCError::AccessDenied);
    }

    const bool permitted = isDirectory_ ? (info.isReadable() && info.isExecutable())
                                        : info.isReadable();
    if (!permitted) {
        RBUM_ERROR("Failed to start accessing {}: permission denied", path_.toStdString());
        return makeUnexpected(XPCError::AccessDenied);
    }

    isAccessing_ = true;
    return Expected<void, XPCError>();
}

void SecurityScopedAccess::stopAccessing() {
    isAccessing_ = false;
}

QByteArray SecurityScopedAccess::encode() const {
    QByteArray data;
    QDataStream stream(&data, QIODevice::WriteOnly);
    stream.setVersion(QDataStream::Qt_6_0);
    stream << kAccessMagic << path_ << isDirectory_ << bookmark_;
    return data;
}

Expected<SecurityScopedAccess, XPCError> SecurityScopedAccess::decode(const QByteArray& data) {
    QDataStream stream(data);
    stream.setVersion(QDataStream::Qt_6_0);

    quint32 magic = 0;
    SecurityScopedAccess access;
    stream >> magic >> access.path_ >> access.isDirectory_ >> access.bookmark_;

    if (stream.status() != QDataStream::Ok || magic != kAccessMagic || access.path_.isEmpty()) {
        return makeUnexpected(XPCError::InvalidURL);
    }
    return access;
}

bool SecurityScopedAccess::operator==(const SecurityScopedAccess& other) const {
    return path_ == other.path_ &&
           isDirectory_ == other.isDirectory_ &&
           bookmark_ == other.bookmark_;
}

} // namespace Rbum
