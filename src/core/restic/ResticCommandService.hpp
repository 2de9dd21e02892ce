#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QFuture>
#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <memory>

#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"
#include "core/common/SystemMonitor.hpp"
#include "core/security/CommandValidator.hpp"
#include "core/security/SecurityService.hpp"
#include "core/xpc/XPCError.hpp"
#include "core/xpc/XPCTypes.hpp"
#include "ResticOperationTracker.hpp"
#include "ResticTypes.hpp"

namespace Rbum {

struct ResticServiceConfig {
    QString executablePath = "/usr/local/bin/restic";
    QString cacheDirectory;             // empty = <cache location>/ResticCache
    CommandPolicy policy;
    ResourceLimits limits;
    int terminateGraceMs = 5000;

    static ResticServiceConfig fromConfig(const Config& config);
};

/**
 * @brief Runs restic on behalf of clients inside rbum-helper
 *
 * Every operation resolves and starts its bookmarks, validates the
 * command and local resources, prepares the invocation and runs it as a
 * child process under a timeout. Access is released and the outcome
 * recorded on every path, including cancellation.
 *
 * One operation runs at a time; a second request is rejected with
 * OperationInProgress before any bookmark is touched.
 */
class ResticCommandService : public QObject {
    Q_OBJECT

public:
    using Result = Expected<ProcessResult, XPCError>;

    // monitor may be null, a private SystemMonitor is used then
    ResticCommandService(std::shared_ptr<SecurityService> security,
                         SystemMonitor* monitor,
                         const ResticServiceConfig& config = ResticServiceConfig(),
                         QObject* parent = nullptr);
    ~ResticCommandService() override;

    QFuture<Result> initializeRepository(const QByteArray& repositoryBookmark, const QString& password);
    QFuture<Result> createBackup(const QByteArray& repositoryBookmark,
                                 const QList<QByteArray>& sourceBookmarks,
                                 const QString& password,
                                 const QStringList& excludes = QStringList());
    QFuture<Result> listSnapshots(const QByteArray& repositoryBookmark, const QString& password);
    QFuture<Result> restore(const QByteArray& repositoryBookmark,
                            const QString& password,
                            const QString& snapshotId,
                            const QByteArray& targetBookmark,
                            const QStringList& paths = QStringList());
    QFuture<Result> checkRepository(const QByteArray& repositoryBookmark, const QString& password);

    QFuture<Result> executeCommand(const XPCCommandConfig& config);

    // Terminates the running child, false if nothing was running.
    // Cancelling a future returned above has the same effect on its own operation.
    bool cancelOperation();

    Expected<void, XPCError> validateBookmark(const QByteArray& bookmarkData);
    Expected<PreparedCommand, XPCError> prepareCommand(const XPCCommandConfig& config) const;

    bool isOperationRunning() const;
    QStringList accessedPaths() const;
    const ResticOperationTracker& operations() const;
    const ResticServiceConfig& config() const;

signals:
    void outputReceived(const QString& line);
    void operationStarted(const QString& command);
    void operationFinished(const QString& command, bool succeeded);

private:
    class ResticCommandServicePrivate;
    std::unique_ptr<ResticCommandServicePrivate> d;

    struct ActiveOperation;

    Expected<XPCCommandConfig, XPCError> buildConfig(const QString& command,
                                                     const QStringList& arguments,
                                                     const QByteArray& repositoryBookmark,
                                                     const QString& password,
                                                     int timeoutSeconds) const;
    QFuture<Result> run(const XPCCommandConfig& config, ResticOperationType type);
    void startProcess(const std::shared_ptr<ActiveOperation>& op, const PreparedCommand& prepared);
    void drainOutput(ActiveOperation& op, bool flush);
    void handleFinished(const std::shared_ptr<ActiveOperation>& op, int exitCode, bool crashed);
    void terminateProcess(const std::shared_ptr<ActiveOperation>& op);
    bool cancel(const std::shared_ptr<ActiveOperation>& op);
    void finishOperation(const std::shared_ptr<ActiveOperation>& op, const Result& result,
                         const QString& detail = QString());
};

} // namespace Rbum
