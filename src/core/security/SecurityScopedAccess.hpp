#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QDataStream>
#include <QtCore/QString>

#include "core/common/Expected.hpp"
#include "core/xpc/XPCError.hpp"

namespace Rbum {

/**
 * @brief A file-system location plus the access token held on it
 *
 * The bookmark blob pins the identity (device, inode, kind) of the
 * target at creation time. Resolving a bookmark whose target has been
 * replaced reports BookmarkStale rather than silently returning the new
 * file at the same path.
 *
 * Access state belongs to the value; whoever started it calls
 * stopAccessing() on every exit path.
 */
class SecurityScopedAccess {
public:
    SecurityScopedAccess() = default;

    static Expected<SecurityScopedAccess, XPCError> create(const QString& path, bool isDirectory);
    static Expected<SecurityScopedAccess, XPCError> resolve(const QByteArray& bookmarkData);

    const QString& path() const { return path_; }
    bool isDirectory() const { return isDirectory_; }
    bool isAccessing() const { return isAccessing_; }
    const QByteArray& bookmarkData() const { return bookmark_; }

    Expected<void, XPCError> startAccessing();
    void stopAccessing();

    // Cross-process transfer form (path, kind and bookmark; never the access state)
    QByteArray encode() const;
    static Expected<SecurityScopedAccess, XPCError> decode(const QByteArray& data);

    bool operator==(const SecurityScopedAccess& other) const;
    bool operator!=(const SecurityScopedAccess& other) const { return !(*this == other); }

private:
    struct FileIdentity {
        quint64 device = 0;
        quint64 inode = 0;
        bool exists = false;
        bool isDirectory = false;
    };

    static FileIdentity identityOf(const QString& path);
    static QByteArray makeBookmark(const QString& path, const FileIdentity& identity);

    QString path_;
    bool isDirectory_ = false;
    bool isAccessing_ = false;
    QByteArray bookmark_;
};

} // namespace Rbum
