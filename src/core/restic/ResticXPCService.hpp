#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QFuture>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QUuid>
#include <chrono>
#include <memory>

#include "core/common/Expected.hpp"
#include "core/security/SecurityService.hpp"
#include "core/xpc/XPCConnectionManager.hpp"
#include "core/xpc/XPCError.hpp"
#include "core/xpc/XPCHealthMonitor.hpp"
#include "core/xpc/XPCMessageQueue.hpp"
#include "core/xpc/XPCTypes.hpp"

namespace Rbum {

/**
 * @brief Client-side restic API
 *
 * Turns per-verb calls on plain paths into bookmarked command configs,
 * validates them against the connection and queues them. A processor
 * timer sends one queued command at a time to the helper; transient
 * transport failures go back to the queue, anything the helper answers
 * resolves the caller's future. Cancelling that future withdraws the
 * command.
 */
class ResticXPCService : public QObject {
    Q_OBJECT

public:
    using Result = Expected<ProcessResult, XPCError>;

    ResticXPCService(XPCConnectionManager* connection,
                     XPCMessageQueue* queue,
                     XPCHealthMonitor* health,
                     std::shared_ptr<SecurityService> security,
                     std::chrono::milliseconds processInterval = std::chrono::milliseconds(100),
                     QObject* parent = nullptr);
    ~ResticXPCService() override;

    QFuture<Result> initializeRepository(const QString& repositoryPath, const QString& password);
    QFuture<Result> createBackup(const QString& repositoryPath,
                                 const QStringList& sourcePaths,
                                 const QString& password,
                                 const QStringList& excludes = QStringList());
    QFuture<Result> listSnapshots(const QString& repositoryPath, const QString& password);
    QFuture<Result> restore(const QString& repositoryPath,
                            const QString& password,
                            const QString& snapshotId,
                            const QString& targetPath,
                            const QStringList& paths = QStringList());
    QFuture<Result> checkRepository(const QString& repositoryPath, const QString& password);

    // Validates and queues an already assembled command
    QFuture<Result> executeCommand(const XPCCommandConfig& command);

    // Both bypass the queue
    Expected<bool, XPCError> cancelOperation();
    Expected<void, XPCError> validateBookmark(const QByteArray& bookmarkData);

    XPCQueueStatus queueStatus() const;
    int cleanupQueue();

    void startProcessing();
    void stopProcessing();
    bool isProcessing() const;
    bool hasRequestInFlight() const;

signals:
    void progressReceived(const QString& line);
    void commandFinished(const QUuid& id, bool succeeded);

private slots:
    void processQueue();

private:
    class ResticXPCServicePrivate;
    std::unique_ptr<ResticXPCServicePrivate> d;

    Expected<XPCCommandConfig, XPCError> buildConfig(const QString& command,
                                                     const QStringList& arguments,
                                                     const QString& repositoryPath,
                                                     const QString& password,
                                                     int timeoutSeconds) const;
    Expected<void, XPCError> addBookmark(XPCCommandConfig& config, const QString& name,
                                         const QString& path, bool isDirectory) const;
    // The caller cancelled its future: drop the message or stop it on the helper
    void abandon(const QUuid& id);
    void handleReply(const QUuid& id, const XPCConnectionManager::Reply& reply);
    void resolve(const QUuid& id, const Result& result);
};

} // namespace Rbum
