#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>

#include "utils/TestUtils.hpp"
#include "utils/MockComponents.hpp"
#include "../src/core/restic/ResticCommandService.hpp"
#include "../src/core/security/SecurityScopedAccess.hpp"
#include "../src/core/security/SecurityService.hpp"

using namespace Rbum;
using namespace Rbum::Test;

namespace {

QStringList readLines(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QStringList();
    }
    QStringList lines = QString::fromUtf8(file.readAll()).split('\n');
    if (!lines.isEmpty() && lines.last().isEmpty()) {
        lines.removeLast();
    }
    return lines;
}

} // namespace

class TestResticCommandService : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // Command preparation
    void testPrepareCommand();
    void testConfigFromSettings();

    // Per-verb invocations
    void testListSnapshots();
    void testInitializeRepository();
    void testCreateBackup();
    void testCreateBackupWithoutSources();
    void testRestore();
    void testRestoreWithoutSnapshot();
    void testCheckRepository();

    // Failure paths
    void testNonZeroExit();
    void testLaunchFailure();
    void testExecutionTimeout();
    void testUnsafeArguments();
    void testMissingPassword();
    void testInsufficientDiskSpace();
    void testStaleRepositoryBookmark();

    // Concurrency and cancellation
    void testCancelOperation();
    void testCancelledFutureStopsProcess();
    void testAccessReleasedWhenLaterBookmarkFails();
    void testCancelWithoutOperation();
    void testOperationInProgress();

    // Output and bookkeeping
    void testOutputLines();
    void testAuditTrail();
    void testValidateBookmark();

private:
    std::unique_ptr<ResticCommandService> makeService(const QString& scriptBody);
    QByteArray bookmarkFor(const QString& path) const;
    XPCCommandConfig commandFor(const QString& command, const QStringList& arguments = QStringList()) const;
    ResticCommandService::Result run(QFuture<ResticCommandService::Result> future, int timeoutMs = 10000);

    QString workDir_;
    QString repository_;
    QString cacheDir_;
    QString argsFile_;
    QString envFile_;
    std::shared_ptr<SecurityOperationRecorder> recorder_;
    std::shared_ptr<CountingSecurityService> security_;
    std::unique_ptr<FakeSystemMonitor> monitor_;
};

void TestResticCommandService::initTestCase() {
    TestUtils::initializeTestEnvironment();
}

void TestResticCommandService::cleanupTestCase() {
    TestUtils::cleanupTestEnvironment();
}

void TestResticCommandService::init() {
    workDir_ = TestUtils::createTempDirectory("restic_service");
    repository_ = workDir_ + "/repo";
    cacheDir_ = workDir_ + "/cache";
    argsFile_ = workDir_ + "/args.txt";
    envFile_ = workDir_ + "/env.txt";
    QVERIFY(QDir().mkpath(repository_));

    recorder_ = std::make_shared<SecurityOperationRecorder>();
    security_ = std::make_shared<CountingSecurityService>(recorder_);
    monitor_ = std::make_unique<FakeSystemMonitor>();
}

void TestResticCommandService::cleanup() {
    monitor_.reset();
    security_.reset();
    recorder_.reset();
    TestUtils::cleanupTempDirectory(workDir_);
}

std::unique_ptr<ResticCommandService> TestResticCommandService::makeService(const QString& scriptBody) {
    ResticServiceConfig config;
    config.executablePath = TestUtils::createFakeResticExecutable(workDir_, scriptBody);
    config.cacheDirectory = cacheDir_;
    config.terminateGraceMs = 2000;
    return std::make_unique<ResticCommandService>(security_, monitor_.get(), config);
}

QByteArray TestResticCommandService::bookmarkFor(const QString& path) const {
    auto bookmark = security_->createBookmark(path, QFileInfo(path).isDir());
    return bookmark.hasValue() ? bookmark.value() : QByteArray();
}

XPCCommandConfig TestResticCommandService::commandFor(const QString& command, const QStringList& arguments) const {
    XPCCommandConfig config;
    config.command = command;
    config.arguments = arguments;
    config.environment = {{"RESTIC_PASSWORD", "secret"}, {"RESTIC_REPOSITORY", repository_}};
    config.workingDirectory = repository_;
    config.timeoutSeconds = 10;
    return config;
}

ResticCommandService::Result TestResticCommandService::run(QFuture<ResticCommandService::Result> future, int timeoutMs) {
    auto result = TestUtils::waitForFuture(future, timeoutMs);
    if (!result) {
        return ResticCommandService::Result(makeUnexpected(XPCError::RequestTimeout));
    }
    return *result;
}

void TestResticCommandService::testPrepareCommand() {
    auto service = makeService("exit 0");

    auto config = commandFor("snapshots", {"--host", "laptop"});
    config.timeoutSeconds = 42;
    auto prepared = service->prepareCommand(config);
    ASSERT_EXPECTED_VALUE(prepared);

    QCOMPARE(prepared.value().executable, service->config().executablePath);
    QCOMPARE(prepared.value().arguments,
             QStringList({"--json", "--quiet", "snapshots", "--host", "laptop"}));
    QCOMPARE(prepared.value().environment.value("RESTIC_CACHE_DIR"), cacheDir_);
    QCOMPARE(prepared.value().environment.value("RESTIC_PROGRESS_FPS"), QString("1"));
    QCOMPARE(prepared.value().environment.value("RESTIC_PASSWORD"), QString("secret"));
    QCOMPARE(prepared.value().workingDirectory, repository_);
    QCOMPARE(prepared.value().timeoutSeconds, 42);
    QVERIFY(QFileInfo(cacheDir_).isDir());

    if (qEnvironmentVariableIsSet("PATH")) {
        QVERIFY(prepared.value().environment.contains("PATH"));
    }
}

void TestResticCommandService::testConfigFromSettings() {
    TEST_SCOPE("restic_settings");
    Config::instance().initializeFromFile(_testScope.getTempDirectory() + "/rbum.ini");

    Config::ResticSettings restic;
    restic.executablePath = "/opt/restic/bin/restic";
    restic.unsafeArguments = {"--no-lock"};
    restic.terminateGraceMs = 750;
    Config::instance().setResticSettings(restic);

    const auto config = ResticServiceConfig::fromConfig(Config::instance());
    QCOMPARE(config.executablePath, QString("/opt/restic/bin/restic"));
    QCOMPARE(config.policy.unsafeArguments, QStringList({"--no-lock"}));
    QCOMPARE(config.terminateGraceMs, 750);
    QCOMPARE(config.cacheDirectory, Config::instance().getResticCachePath());
}

void TestResticCommandService::testListSnapshots() {
    auto service = makeService(QString("printf '%s\\n' \"$@\" > '%1'\n"
                                       "env > '%2'\n"
                                       "echo '[{\"short_id\":\"4f2a9c1e\"}]'").arg(argsFile_, envFile_));
    const QByteArray repository = bookmarkFor(repository_);
    QVERIFY(!repository.isEmpty());

    auto result = run(service->listSnapshots(repository, "secret"));
    ASSERT_EXPECTED_VALUE(result);
    QVERIFY(result.value().output.contains("4f2a9c1e"));
    QCOMPARE(result.value().exitCode, 0);

    QCOMPARE(readLines(argsFile_), QStringList({"--json", "--quiet", "snapshots"}));

    const QString resolved = SecurityScopedAccess::resolve(repository).value().path();
    const QStringList environment = readLines(envFile_);
    QVERIFY(environment.contains("RESTIC_PASSWORD=secret"));
    QVERIFY(environment.contains("RESTIC_REPOSITORY=" + resolved));
    QVERIFY(environment.contains("RESTIC_CACHE_DIR=" + cacheDir_));
    QVERIFY(environment.contains("RESTIC_PROGRESS_FPS=1"));

    QCOMPARE(security_->started(), 1);
    QCOMPARE(security_->stopped(), 1);
    QVERIFY(!service->isOperationRunning());
}

void TestResticCommandService::testInitializeRepository() {
    auto service = makeService(QString("printf '%s\\n' \"$@\" > '%1'\n"
                                       "pwd -P > '%2'").arg(argsFile_, envFile_));

    auto result = run(service->initializeRepository(bookmarkFor(repository_), "secret"));
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(readLines(argsFile_), QStringList({"--json", "--quiet", "init"}));
    QCOMPARE(readLines(envFile_), QStringList({QFileInfo(repository_).canonicalFilePath()}));

    const auto records = service->operations().records();
    QCOMPARE(records.size(), 1);
    QVERIFY(records.first().type == ResticOperationType::Init);
    QVERIFY(records.first().status == ResticOperationStatus::Completed);
}

void TestResticCommandService::testCreateBackup() {
    const QString documents = workDir_ + "/documents";
    const QString photos = workDir_ + "/photos";
    QVERIFY(QDir().mkpath(documents));
    QVERIFY(QDir().mkpath(photos));

    auto service = makeService(QString("printf '%s\\n' \"$@\" > '%1'").arg(argsFile_));
    auto result = run(service->createBackup(bookmarkFor(repository_),
                                            {bookmarkFor(documents), bookmarkFor(photos)},
                                            "secret", {"*.tmp"}));
    ASSERT_EXPECTED_VALUE(result);

    const QStringList arguments = readLines(argsFile_);
    QCOMPARE(arguments.mid(0, 5), QStringList({"--json", "--quiet", "backup", "--exclude", "*.tmp"}));
    QCOMPARE(arguments.size(), 7);
    QVERIFY(arguments.at(5).endsWith("/documents"));
    QVERIFY(arguments.at(6).endsWith("/photos"));

    // Repository plus both sources
    QCOMPARE(security_->started(), 3);
    QCOMPARE(security_->held(), 0);
}

void TestResticCommandService::testCreateBackupWithoutSources() {
    auto service = makeService(QString("touch '%1'").arg(argsFile_));
    auto result = run(service->createBackup(bookmarkFor(repository_), {}, "secret"));
    ASSERT_EXPECTED_ERROR(result, XPCError::InvalidCommand);
    QVERIFY(!QFile::exists(argsFile_));
    QCOMPARE(security_->started(), 0);
}

void TestResticCommandService::testRestore() {
    const QString target = workDir_ + "/restore";
    QVERIFY(QDir().mkpath(target));

    auto service = makeService(QString("printf '%s\\n' \"$@\" > '%1'").arg(argsFile_));
    auto result = run(service->restore(bookmarkFor(repository_), "secret", "4f2a9c1e",
                                       bookmarkFor(target), {"/home/user/docs"}));
    ASSERT_EXPECTED_VALUE(result);

    const QStringList arguments = readLines(argsFile_);
    QCOMPARE(arguments.size(), 8);
    QCOMPARE(arguments.mid(0, 5), QStringList({"--json", "--quiet", "restore", "4f2a9c1e", "--target"}));
    QVERIFY(arguments.at(5).endsWith("/restore"));
    QCOMPARE(arguments.mid(6), QStringList({"--include", "/home/user/docs"}));
    QCOMPARE(security_->started(), 2);
    QCOMPARE(security_->held(), 0);
}

void TestResticCommandService::testRestoreWithoutSnapshot() {
    const QString target = workDir_ + "/restore";
    QVERIFY(QDir().mkpath(target));

    auto service = makeService("exit 0");
    auto result = run(service->restore(bookmarkFor(repository_), "secret", "  ", bookmarkFor(target)));
    ASSERT_EXPECTED_ERROR(result, XPCError::InvalidCommand);
    QCOMPARE(security_->started(), 0);
}

void TestResticCommandService::testCheckRepository() {
    auto service = makeService(QString("printf '%s\\n' \"$@\" > '%1'\n"
                                       "echo 'no errors were found'").arg(argsFile_));
    auto result = run(service->checkRepository(bookmarkFor(repository_), "secret"));
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(readLines(argsFile_), QStringList({"--json", "--quiet", "check"}));
    QVERIFY(result.value().output.contains("no errors were found"));
}

void TestResticCommandService::testNonZeroExit() {
    auto service = makeService("echo 'Fatal: wrong password or no key found' >&2\nexit 1");
    QSignalSpy finished(service.get(), &ResticCommandService::operationFinished);

    auto config = commandFor("snapshots");
    config.bookmarks.insert("repository", bookmarkFor(repository_));

    auto result = run(service->executeCommand(config));
    ASSERT_EXPECTED_ERROR(result, XPCError::NonZeroExit);
    QCOMPARE(finished.count(), 1);
    QCOMPARE(security_->started(), 1);
    QCOMPARE(security_->stopped(), 1);
    QCOMPARE(finished.first().at(1).toBool(), false);

    const auto records = recorder_->records();
    QVERIFY(!records.isEmpty());
    QVERIFY(records.last().type == SecurityOperationType::XPC);
    QVERIFY(records.last().status == SecurityOperationStatus::Failure);
    QVERIFY(records.last().error.has_value());
    QVERIFY(records.last().error->contains("wrong password"));

    const auto operation = service->operations().records().last();
    QVERIFY(operation.status == ResticOperationStatus::Failed);
    QVERIFY(operation.error == XPCError::NonZeroExit);
}

void TestResticCommandService::testLaunchFailure() {
    ResticServiceConfig config;
    config.executablePath = workDir_ + "/missing/restic";
    config.cacheDirectory = cacheDir_;
    ResticCommandService service(security_, monitor_.get(), config);

    auto result = run(service.executeCommand(commandFor("snapshots")));
    ASSERT_EXPECTED_ERROR(result, XPCError::LaunchFailed);
    QVERIFY(!service.isOperationRunning());
}

void TestResticCommandService::testExecutionTimeout() {
    auto service = makeService("exec sleep 30");
    auto config = commandFor("check");
    config.timeoutSeconds = 1;
    config.bookmarks.insert("repository", bookmarkFor(repository_));

    QElapsedTimer elapsed;
    elapsed.start();
    auto result = run(service->executeCommand(config));
    ASSERT_EXPECTED_ERROR(result, XPCError::ExecutionTimeout);
    QVERIFY(elapsed.elapsed() < 10000);
    QVERIFY(!service->isOperationRunning());
    QCOMPARE(security_->started(), 1);
    QCOMPARE(security_->held(), 0);

    const auto operation = service->operations().records().last();
    QVERIFY(operation.status == ResticOperationStatus::Failed);
}

void TestResticCommandService::testUnsafeArguments() {
    auto service = makeService(QString("touch '%1'").arg(argsFile_));
    auto config = commandFor("backup", {"--no-lock", repository_});
    config.bookmarks.insert("repository", bookmarkFor(repository_));

    auto result = run(service->executeCommand(config));
    ASSERT_EXPECTED_ERROR(result, XPCError::UnsafeArguments);
    QVERIFY(!QFile::exists(argsFile_));
    QCOMPARE(security_->started(), 1);
    QCOMPARE(security_->held(), 0);
}

void TestResticCommandService::testMissingPassword() {
    auto service = makeService(QString("touch '%1'").arg(argsFile_));
    auto result = run(service->listSnapshots(bookmarkFor(repository_), QString()));
    ASSERT_EXPECTED_ERROR(result, XPCError::MissingEnvironment);
    QVERIFY(!QFile::exists(argsFile_));
    QCOMPARE(security_->held(), 0);
}

void TestResticCommandService::testInsufficientDiskSpace() {
    auto service = makeService(QString("touch '%1'").arg(argsFile_));
    monitor_->resources().availableDiskSpace = 10 * 1024 * 1024;

    auto result = run(service->listSnapshots(bookmarkFor(repository_), "secret"));
    ASSERT_EXPECTED_ERROR(result, XPCError::InsufficientDiskSpace);
    QVERIFY(!QFile::exists(argsFile_));
    QCOMPARE(monitor_->lastPath(), SecurityScopedAccess::resolve(bookmarkFor(repository_)).value().path());
    QCOMPARE(security_->held(), 0);
}

void TestResticCommandService::testStaleRepositoryBookmark() {
    const QString replaced = workDir_ + "/replaced";
    QVERIFY(QDir().mkpath(replaced));
    const QByteArray bookmark = bookmarkFor(replaced);
    // Keep the old directory around so its inode can't be reused
    QVERIFY(QDir().rename(replaced, replaced + ".old"));
    QVERIFY(QDir().mkpath(replaced));

    auto service = makeService("exit 0");
    auto result = run(service->listSnapshots(bookmark, "secret"));
    ASSERT_EXPECTED_ERROR(result, XPCError::BookmarkStale);
    QCOMPARE(security_->started(), 0);
}

void TestResticCommandService::testCancelOperation() {
    auto service = makeService("echo started\nexec sleep 30");
    QSignalSpy output(service.get(), &ResticCommandService::outputReceived);

    auto config = commandFor("backup", {repository_});
    config.bookmarks.insert("repository", bookmarkFor(repository_));
    auto future = service->executeCommand(config);
    QVERIFY(TestUtils::waitForCondition([&output]() { return output.count() > 0; }));
    QVERIFY(service->isOperationRunning());
    QCOMPARE(security_->held(), 1);

    QVERIFY(service->cancelOperation());
    auto result = run(future, 5000);
    ASSERT_EXPECTED_ERROR(result, XPCError::Cancelled);
    QVERIFY(!service->isOperationRunning());
    QCOMPARE(security_->started(), 1);
    QCOMPARE(security_->stopped(), 1);

    const auto operation = service->operations().records().last();
    QVERIFY(operation.status == ResticOperationStatus::Cancelled);
    QVERIFY(operation.type == ResticOperationType::Backup);
}

void TestResticCommandService::testCancelledFutureStopsProcess() {
    const QString pidFile = workDir_ + "/restic.pid";
    auto service = makeService(QString("echo $$ > '%1'\necho started\nexec sleep 30").arg(pidFile));
    QSignalSpy output(service.get(), &ResticCommandService::outputReceived);
    QSignalSpy finished(service.get(), &ResticCommandService::operationFinished);

    auto config = commandFor("backup", {repository_});
    config.bookmarks.insert("repository", bookmarkFor(repository_));
    auto future = service->executeCommand(config);
    QVERIFY(TestUtils::waitForCondition([&output]() { return output.count() > 0; }));
    QCOMPARE(security_->held(), 1);

    QElapsedTimer elapsed;
    elapsed.start();
    future.cancel();
    QVERIFY(TestUtils::waitForCondition([&service]() { return !service->isOperationRunning(); }, 5000));
    QVERIFY(elapsed.elapsed() < 5000);
    QCOMPARE(finished.count(), 1);
    QCOMPARE(security_->held(), 0);

    // The child is gone, not left to run into its timeout
    const QStringList pid = readLines(pidFile);
    QCOMPARE(pid.size(), 1);
    QVERIFY(!QFileInfo::exists("/proc/" + pid.first()));

    const auto operation = service->operations().records().last();
    QVERIFY(operation.status == ResticOperationStatus::Cancelled);
}

void TestResticCommandService::testAccessReleasedWhenLaterBookmarkFails() {
    const QString documents = workDir_ + "/documents";
    const QString photos = workDir_ + "/photos";
    QVERIFY(QDir().mkpath(documents));
    QVERIFY(QDir().mkpath(photos));
    // repository, source0, source1: the second start is refused
    security_->failStartAt(2);

    auto service = makeService(QString("touch '%1'").arg(argsFile_));
    auto result = run(service->createBackup(bookmarkFor(repository_),
                                            {bookmarkFor(documents), bookmarkFor(photos)}, "secret"));
    ASSERT_EXPECTED_ERROR(result, XPCError::AccessDenied);
    QVERIFY(!QFile::exists(argsFile_));
    QCOMPARE(security_->started(), 1);
    QCOMPARE(security_->stopped(), 1);
    QVERIFY(!service->isOperationRunning());
}

void TestResticCommandService::testCancelWithoutOperation() {
    auto service = makeService("exit 0");
    QVERIFY(!service->cancelOperation());
}

void TestResticCommandService::testOperationInProgress() {
    auto service = makeService("echo started\nexec sleep 30");
    QSignalSpy output(service.get(), &ResticCommandService::outputReceived);

    auto config = commandFor("snapshots");
    config.bookmarks.insert("repository", bookmarkFor(repository_));
    auto first = service->executeCommand(config);
    QVERIFY(TestUtils::waitForCondition([&output]() { return output.count() > 0; }));
    QCOMPARE(security_->held(), 1);

    // Rejected before any bookmark is touched
    auto second = run(service->executeCommand(config), 1000);
    ASSERT_EXPECTED_ERROR(second, XPCError::OperationInProgress);
    QCOMPARE(security_->started(), 1);
    QCOMPARE(service->accessedPaths().size(), 1);

    QVERIFY(service->cancelOperation());
    ASSERT_EXPECTED_ERROR(run(first, 5000), XPCError::Cancelled);
    QCOMPARE(security_->held(), 0);
}

void TestResticCommandService::testOutputLines() {
    auto service = makeService("printf 'first\\nsecond\\r\\nthird'");
    QSignalSpy output(service.get(), &ResticCommandService::outputReceived);

    auto result = run(service->executeCommand(commandFor("snapshots")));
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(output.count(), 3);
    QCOMPARE(output.at(0).at(0).toString(), QString("first"));
    QCOMPARE(output.at(1).at(0).toString(), QString("second"));
    QCOMPARE(output.at(2).at(0).toString(), QString("third"));
    QCOMPARE(result.value().output, QString("first\nsecond\nthird"));
}

void TestResticCommandService::testAuditTrail() {
    auto service = makeService("exit 0");
    auto result = run(service->executeCommand(commandFor("snapshots")));
    ASSERT_EXPECTED_VALUE(result);

    const auto records = recorder_->records();
    QVERIFY(!records.isEmpty());
    QVERIFY(records.last().type == SecurityOperationType::XPC);
    QVERIFY(records.last().status == SecurityOperationStatus::Success);
    QCOMPARE(records.last().path, repository_);
}

void TestResticCommandService::testValidateBookmark() {
    auto service = makeService("exit 0");

    ASSERT_EXPECTED_VALUE(service->validateBookmark(bookmarkFor(repository_)));
    QCOMPARE(security_->held(), 0);
    ASSERT_EXPECTED_ERROR(service->validateBookmark(QByteArray("not a bookmark")), XPCError::BookmarkInvalid);
}

int runTestResticCommandService(int argc, char** argv) {
    TestResticCommandService test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_restic_command_service.moc"
