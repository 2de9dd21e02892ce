#include "ResticCommandService.hpp"
#include "core/common/Logger.hpp"
#include "core/xpc/XPCFuture.hpp"
#include "platform/linux/LinuxPeerCredentials.hpp"

#include <QtCore/QDir>
#include <QtCore/QFutureWatcher>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QProcess>
#include <QtCore/QProcessEnvironment>
#include <QtCore/QPromise>
#include <QtCore/QStandardPaths>
#include <QtCore/QTimer>

namespace Rbum {

namespace {
// Bookmark-specific failures keep their kind, anything else is reported as AccessDenied
XPCError accessError(XPCError error) {
    switch (error) {
        case XPCError::BookmarkStale:
        case XPCError::BookmarkInvalid:
        case XPCError::BookmarkResolutionFailed:
            return error;
        default:
            return XPCError::AccessDenied;
    }
}

Expected<QString, XPCError> bookmarkPath(const QByteArray& bookmark) {
    auto access = SecurityScopedAccess::resolve(bookmark);
    if (access.hasError()) {
        return makeUnexpected(accessError(access.error()));
    }
    return access.value().path();
}

ResticCommandService::Result failed(XPCError error) {
    return ResticCommandService::Result(makeUnexpected(error));
}

// Holds started security-scoped access and releases all of it on destruction
class AccessScope {
public:
    explicit AccessScope(SecurityService& service)
        : service_(service) {}

    ~AccessScope() { release(); }

    AccessScope(const AccessScope&) = delete;
    AccessScope& operator=(const AccessScope&) = delete;

    Expected<void, XPCError> acquire(const QString& name, const QByteArray& bookmark) {
        auto access = service_.resolveBookmark(bookmark);
        if (access.hasError()) {
            Logger::instance().error("Failed to resolve bookmark '{}': {}",
                                     name.toStdString(), toStdString(access.error()));
            return makeUnexpected(accessError(access.error()));
        }

        SecurityScopedAccess resolved = access.value();
        auto started = service_.startAccessing(resolved);
        if (started.hasError()) {
            Logger::instance().error("Failed to start accessing '{}' at {}",
                                     name.toStdString(), resolved.path().toStdString());
            return makeUnexpected(XPCError::AccessDenied);
        }

        held_.append(resolved);
        return Expected<void, XPCError>();
    }

    void release() {
        for (auto& access : held_) {
            service_.stopAccessing(access);
        }
        held_.clear();
    }

    QStringList paths() const {
        QStringList result;
        for (const auto& access : held_) {
            result.append(access.path());
        }
        return result;
    }

private:
    SecurityService& service_;
    QList<SecurityScopedAccess> held_;
};
}

struct ResticCommandService::ActiveOperation {
    QUuid trackerId;
    QString command;
    QString auditPath;
    QPromise<Result> promise;
    std::unique_ptr<AccessScope> access;
    QProcess* process = nullptr;
    QTimer* timeout = nullptr;
    QFutureWatcher<Result>* watcher = nullptr;

    QByteArray partialLine;
    QString output;
    QString error;

    bool timedOut = false;
    bool cancelled = false;
    bool completed = false;
};

class ResticCommandService::ResticCommandServicePrivate {
public:
    std::shared_ptr<SecurityService> security;
    SystemMonitor* monitor = nullptr;
    std::unique_ptr<SystemMonitor> ownedMonitor;
    ResticServiceConfig config;
    ResticOperationTracker tracker;

    mutable QMutex mutex;
    std::shared_ptr<ActiveOperation> active;
};

ResticServiceConfig ResticServiceConfig::fromConfig(const Config& config) {
    const auto restic = config.getResticSettings();

    ResticServiceConfig result;
    result.executablePath = restic.executablePath;
    result.cacheDirectory = config.getResticCachePath();
    result.policy = CommandPolicy::fromSettings(restic);
    result.limits = ResourceLimits::fromSettings(config.getResourceSettings());
    result.terminateGraceMs = restic.terminateGraceMs;
    return result;
}

ResticCommandService::ResticCommandService(std::shared_ptr<SecurityService> security,
                                           SystemMonitor* monitor,
                                           const ResticServiceConfig& config,
                                           QObject* parent)
    : QObject(parent)
    , d(std::make_unique<ResticCommandServicePrivate>()) {
    d->security = security ? std::move(security)
                           : std::make_shared<ProductionSecurityService>(nullptr);
    d->monitor = monitor;
    if (!d->monitor) {
        d->ownedMonitor = std::make_unique<SystemMonitor>();
        d->monitor = d->ownedMonitor.get();
    }

    d->config = config;
    if (d->config.cacheDirectory.isEmpty()) {
        d->config.cacheDirectory =
            QStandardPaths::writableLocation(QStandardPaths::CacheLocation) + "/ResticCache";
    }
}

ResticCommandService::~ResticCommandService() {
    cancelOperation();
}

const ResticServiceConfig& ResticCommandService::config() const {
    return d->config;
}

const ResticOperationTracker& ResticCommandService::operations() const {
    return d->tracker;
}

bool ResticCommandService::isOperationRunning() const {
    QMutexLocker locker(&d->mutex);
    return static_cast<bool>(d->active);
}

QStringList ResticCommandService::accessedPaths() const {
    QMutexLocker locker(&d->mutex);
    if (!d->active || !d->active->access) {
        return QStringList();
    }
    return d->active->access->paths();
}

Expected<XPCCommandConfig, XPCError> ResticCommandService::buildConfig(const QString& command,
                                                                       const QStringList& arguments,
                                                                       const QByteArray& repositoryBookmark,
                                                                       const QString& password,
                                                                       int timeoutSeconds) const {
    auto repository = bookmarkPath(repositoryBookmark);
    if (repository.hasError()) {
        return makeUnexpected(repository.error());
    }

    XPCCommandConfig config;
    config.command = command;
    config.arguments = arguments;
    config.environment.insert("RESTIC_PASSWORD", password);
    config.environment.insert("RESTIC_REPOSITORY", repository.value());
    config.workingDirectory = repository.value();
    config.bookmarks.insert("repository", repositoryBookmark);
    config.timeoutSeconds = timeoutSeconds;
    config.auditSessionId = LinuxPeerCredentials::currentAuditSession();
    return config;
}

QFuture<ResticCommandService::Result> ResticCommandService::initializeRepository(const QByteArray& repositoryBookmark,
                                                                                 const QString& password) {
    auto config = buildConfig("init", QStringList(), repositoryBookmark, password, kShortOperationTimeout);
    if (config.hasError()) {
        return makeFinishedFuture(failed(config.error()));
    }
    return run(config.value(), ResticOperationType::Init);
}

QFuture<ResticCommandService::Result> ResticCommandService::createBackup(const QByteArray& repositoryBookmark,
                                                                         const QList<QByteArray>& sourceBookmarks,
                                                                         const QString& password,
                                                                         const QStringList& excludes) {
    if (sourceBookmarks.isEmpty()) {
        Logger::instance().warn("Backup requested without sources");
        return makeFinishedFuture(failed(XPCError::InvalidCommand));
    }

    QStringList arguments;
    for (const QString& pattern : excludes) {
        arguments << "--exclude" << pattern;
    }

    QMap<QString, QByteArray> sources;
    for (int i = 0; i < sourceBookmarks.size(); ++i) {
        auto source = bookmarkPath(sourceBookmarks.at(i));
        if (source.hasError()) {
            return makeFinishedFuture(failed(source.error()));
        }
        arguments << source.value();
        sources.insert(QString("source%1").arg(i), sourceBookmarks.at(i));
    }

    auto config = buildConfig("backup", arguments, repositoryBookmark, password, kLongOperationTimeout);
    if (config.hasError()) {
        return makeFinishedFuture(failed(config.error()));
    }
    config.value().bookmarks.insert(sources);
    return run(config.value(), ResticOperationType::Backup);
}

QFuture<ResticCommandService::Result> ResticCommandService::listSnapshots(const QByteArray& repositoryBookmark,
                                                                          const QString& password) {
    auto config = buildConfig("snapshots", QStringList(), repositoryBookmark, password, kShortOperationTimeout);
    if (config.hasError()) {
        return makeFinishedFuture(failed(config.error()));
    }
    return run(config.value(), ResticOperationType::Snapshots);
}

QFuture<ResticCommandService::Result> ResticCommandService::restore(const QByteArray& repositoryBookmark,
                                                                    const QString& password,
                                                                    const QString& snapshotId,
                                                                    const QByteArray& targetBookmark,
                                                                    const QStringList& paths) {
    if (snapshotId.trimmed().isEmpty()) {
        Logger::instance().warn("Restore requested without a snapshot id");
        return makeFinishedFuture(failed(XPCError::InvalidCommand));
    }

    auto target = bookmarkPath(targetBookmark);
    if (target.hasError()) {
        return makeFinishedFuture(failed(target.error()));
    }

    QStringList arguments;
    arguments << snapshotId << "--target" << target.value();
    for (const QString& path : paths) {
        arguments << "--include" << path;
    }

    auto config = buildConfig("restore", arguments, repositoryBookmark, password, kLongOperationTimeout);
    if (config.hasError()) {
        return makeFinishedFuture(failed(config.error()));
    }
    config.value().bookmarks.insert("target", targetBookmark);
    return run(config.value(), ResticOperationType::Restore);
}

QFuture<ResticCommandService::Result> ResticCommandService::checkRepository(const QByteArray& repositoryBookmark,
                                                                            const QString& password) {
    auto config = buildConfig("check", QStringList(), repositoryBookmark, password, kLongOperationTimeout);
    if (config.hasError()) {
        return makeFinishedFuture(failed(config.error()));
    }
    return run(config.value(), ResticOperationType::Check);
}

QFuture<ResticCommandService::Result> ResticCommandService::executeCommand(const XPCCommandConfig& config) {
    return run(config, operationTypeForCommand(config.command));
}

QFuture<ResticCommandService::Result> ResticCommandService::run(const XPCCommandConfig& config,
                                                                ResticOperationType type) {
    auto op = std::make_shared<ActiveOperation>();
    {
        QMutexLocker locker(&d->mutex);
        if (d->active) {
            Logger::instance().warn("Rejecting '{}': '{}' is still running",
                                    config.command.toStdString(), d->active->command.toStdString());
            return makeFinishedFuture(failed(XPCError::OperationInProgress));
        }
        d->active = op;
    }

    op->command = config.command;
    op->auditPath = config.environment.value("RESTIC_REPOSITORY", config.workingDirectory);
    op->trackerId = d->tracker.begin(type, config.command);
    op->promise.start();
    QFuture<Result> future = op->promise.future();

    Logger::instance().info("Starting restic {} for {}", config.command.toStdString(),
                            op->auditPath.toStdString());
    emit operationStarted(config.command);

    op->access = std::make_unique<AccessScope>(*d->security);
    for (auto it = config.bookmarks.constBegin(); it != config.bookmarks.constEnd(); ++it) {
        auto acquired = op->access->acquire(it.key(), it.value());
        if (acquired.hasError()) {
            finishOperation(op, failed(acquired.error()));
            return future;
        }
    }

    CommandValidator validator(d->config.policy);
    auto wellFormed = validator.validate(config);
    if (wellFormed.hasError()) {
        finishOperation(op, failed(wellFormed.error()));
        return future;
    }

    const SystemResources resources = d->monitor->sample(op->auditPath);
    auto minimums = validateResourceMinimums(resources, d->config.limits);
    if (minimums.hasError()) {
        finishOperation(op, failed(minimums.error()));
        return future;
    }

    auto prepared = prepareCommand(config);
    if (prepared.hasError()) {
        finishOperation(op, failed(prepared.error()));
        return future;
    }

    startProcess(op, prepared.value());
    return future;
}

Expected<PreparedCommand, XPCError> ResticCommandService::prepareCommand(const XPCCommandConfig& config) const {
    const QString cacheDirectory = d->config.cacheDirectory;
    if (!QDir().mkpath(cacheDirectory)) {
        Logger::instance().error("Failed to create restic cache directory {}", cacheDirectory.toStdString());
        return makeUnexpected(XPCError::ResourceUnavailable);
    }

    PreparedCommand prepared;
    prepared.executable = d->config.executablePath;
    prepared.arguments << "--json" << "--quiet" << config.command << config.arguments;
    prepared.environment = config.environment;
    prepared.environment.insert("RESTIC_CACHE_DIR", cacheDirectory);
    prepared.environment.insert("RESTIC_PROGRESS_FPS", "1");

    const QProcessEnvironment system = QProcessEnvironment::systemEnvironment();
    for (const char* inherited : {"PATH", "HOME"}) {
        const QString key = QString::fromLatin1(inherited);
        if (!prepared.environment.contains(key) && system.contains(key)) {
            prepared.environment.insert(key, system.value(key));
        }
    }

    prepared.workingDirectory = config.workingDirectory;
    prepared.timeoutSeconds = config.timeoutSeconds;
    return prepared;
}

void ResticCommandService::startProcess(const std::shared_ptr<ActiveOperation>& op,
                                        const PreparedCommand& prepared) {
    auto* process = new QProcess(this);
    op->process = process;

    process->setProgram(prepared.executable);
    process->setArguments(prepared.arguments);
    process->setWorkingDirectory(prepared.workingDirectory);

    QProcessEnvironment environment;
    for (auto it = prepared.environment.constBegin(); it != prepared.environment.constEnd(); ++it) {
        environment.insert(it.key(), it.value());
    }
    process->setProcessEnvironment(environment);

    std::weak_ptr<ActiveOperation> weak = op;

    connect(process, &QProcess::readyReadStandardOutput, this, [this, weak]() {
        if (auto current = weak.lock()) {
            drainOutput(*current, false);
        }
    });
    connect(process, &QProcess::readyReadStandardError, this, [weak]() {
        if (auto current = weak.lock(); current && current->process) {
            current->error += QString::fromUtf8(current->process->readAllStandardError());
        }
    });
    connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, [this, weak](int exitCode, QProcess::ExitStatus exitStatus) {
        if (auto current = weak.lock()) {
            handleFinished(current, exitCode, exitStatus == QProcess::CrashExit);
        }
    });
    connect(process, &QProcess::errorOccurred, this, [this, weak](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) {
            return;
        }
        if (auto current = weak.lock()) {
            Logger::instance().error("Failed to launch {}: {}", current->process->program().toStdString(),
                                     current->process->errorString().toStdString());
            finishOperation(current, failed(XPCError::LaunchFailed));
        }
    });

    op->timeout = new QTimer(this);
    op->timeout->setSingleShot(true);
    op->timeout->setInterval(prepared.timeoutSeconds * 1000);
    connect(op->timeout, &QTimer::timeout, this, [this, weak]() {
        if (auto current = weak.lock()) {
            Logger::instance().error("restic {} timed out", current->command.toStdString());
            current->timedOut = true;
            terminateProcess(current);
        }
    });

    // Cancelling the caller's future stops this operation, not whatever runs later
    op->watcher = new QFutureWatcher<Result>(this);
    connect(op->watcher, &QFutureWatcherBase::canceled, this, [this, weak]() {
        if (auto current = weak.lock()) {
            Logger::instance().info("Future for restic {} was cancelled", current->command.toStdString());
            cancel(current);
        }
    });
    op->watcher->setFuture(op->promise.future());

    d->tracker.markRunning(op->trackerId);
    Logger::instance().debug("Launching {} {}", prepared.executable.toStdString(),
                             prepared.arguments.join(' ').toStdString());
    op->timeout->start();
    process->start();
}

void ResticCommandService::drainOutput(ActiveOperation& op, bool flush) {
    if (op.process) {
        op.partialLine += op.process->readAllStandardOutput();
    }

    qsizetype newline = op.partialLine.indexOf('\n');
    while (newline >= 0) {
        QByteArray raw = op.partialLine.left(newline);
        op.partialLine.remove(0, newline + 1);
        if (raw.endsWith('\r')) {
            raw.chop(1);
        }

        const QString line = QString::fromUtf8(raw);
        op.output += line + '\n';
        emit outputReceived(line);
        newline = op.partialLine.indexOf('\n');
    }

    if (flush && !op.partialLine.isEmpty()) {
        const QString line = QString::fromUtf8(op.partialLine);
        op.partialLine.clear();
        op.output += line;
        emit outputReceived(line);
    }
}

void ResticCommandService::handleFinished(const std::shared_ptr<ActiveOperation>& op, int exitCode, bool crashed) {
    if (op->completed) {
        return;
    }

    drainOutput(*op, true);
    if (op->process) {
        op->error += QString::fromUtf8(op->process->readAllStandardError());
    }

    if (op->cancelled) {
        finishOperation(op, failed(XPCError::Cancelled));
        return;
    }

    if (op->timedOut) {
        finishOperation(op, failed(XPCError::ExecutionTimeout));
        return;
    }

    if (crashed || exitCode != 0) {
        const QString detail = QString("exit code %1: %2").arg(exitCode).arg(op->error.trimmed());
        Logger::instance().error("restic {} failed with {}", op->command.toStdString(), detail.toStdString());
        finishOperation(op, failed(XPCError::NonZeroExit), detail);
        return;
    }

    ProcessResult result;
    result.output = op->output;
    result.error = op->error;
    result.exitCode = exitCode;
    finishOperation(op, result);
}

void ResticCommandService::terminateProcess(const std::shared_ptr<ActiveOperation>& op) {
    QProcess* process = op->process;
    if (!process || process->state() == QProcess::NotRunning) {
        return;
    }

    process->terminate();
    if (!process->waitForFinished(d->config.terminateGraceMs)) {
        Logger::instance().warn("restic {} ignored SIGTERM, killing", op->command.toStdString());
        process->kill();
        process->waitForFinished(1000);
    }
}

bool ResticCommandService::cancelOperation() {
    std::shared_ptr<ActiveOperation> op;
    {
        QMutexLocker locker(&d->mutex);
        op = d->active;
    }
    return cancel(op);
}

bool ResticCommandService::cancel(const std::shared_ptr<ActiveOperation>& op) {
    if (!op || op->completed || op->cancelled) {
        return false;
    }

    Logger::instance().info("Cancelling restic {}", op->command.toStdString());
    op->cancelled = true;
    terminateProcess(op);

    // No finished() if the child never started or already exited
    if (!op->completed) {
        finishOperation(op, failed(XPCError::Cancelled));
    }
    return true;
}

void ResticCommandService::finishOperation(const std::shared_ptr<ActiveOperation>& op,
                                           const Result& result,
                                           const QString& detail) {
    if (op->completed) {
        return;
    }
    op->completed = true;

    {
        QMutexLocker locker(&d->mutex);
        if (d->active == op) {
            d->active.reset();
        }
    }

    if (op->watcher) {
        op->watcher->disconnect(this);
        op->watcher->deleteLater();
        op->watcher = nullptr;
    }

    if (op->timeout) {
        op->timeout->stop();
        op->timeout->deleteLater();
        op->timeout = nullptr;
    }

    if (op->process) {
        op->process->disconnect(this);
        if (op->process->state() != QProcess::NotRunning) {
            op->process->kill();
            op->process->waitForFinished(1000);
        }
        op->process->deleteLater();
        op->process = nullptr;
    }

    op->access.reset();

    auto recorder = d->security->recorder();
    ResticOperationStatus status = ResticOperationStatus::Completed;
    if (result.hasValue()) {
        recorder->recordOperation(op->auditPath, SecurityOperationType::XPC, SecurityOperationStatus::Success);
        Logger::instance().info("restic {} completed", op->command.toStdString());
    } else {
        const QString message = detail.isEmpty()
            ? errorString(result.error())
            : QString("%1 (%2)").arg(errorString(result.error()), detail);
        recorder->recordOperation(op->auditPath, SecurityOperationType::XPC,
                                  SecurityOperationStatus::Failure, message);
        status = result.error() == XPCError::Cancelled ? ResticOperationStatus::Cancelled
                                                       : ResticOperationStatus::Failed;
    }

    d->tracker.finish(op->trackerId, status,
                      result.hasError() ? std::optional<XPCError>(result.error()) : std::nullopt);
    emit operationFinished(op->command, result.hasValue());

    op->promise.addResult(result);
    op->promise.finish();
}

Expected<void, XPCError> ResticCommandService::validateBookmark(const QByteArray& bookmarkData) {
    auto access = d->security->resolveBookmark(bookmarkData);
    if (access.hasError()) {
        return makeUnexpected(access.error());
    }

    SecurityScopedAccess resolved = access.value();
    auto started = d->security->startAccessing(resolved);
    if (started.hasError()) {
        return started;
    }
    d->security->stopAccessing(resolved);
    return Expected<void, XPCError>();
}

} // namespace Rbum
