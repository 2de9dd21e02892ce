#include <QtTest/QtTest>
#include <QtConcurrent/QtConcurrent>
#include <QtCore/QElapsedTimer>

#include "utils/TestUtils.hpp"
#include "../src/core/security/CommandValidator.hpp"
#include "../src/core/security/SecurityOperationRecorder.hpp"
#include "../src/core/security/SecurityService.hpp"
#include "../src/core/common/Expected.hpp"

using namespace Rbum;
using namespace Rbum::Test;

/**
 * @brief Security component tests
 *
 * Covers the audit recorder, both security strategies and the
 * command well-formedness rules.
 */
class TestSecurityComponents : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    // Recorder
    void testRecordSuccessAndFailure();
    void testConcurrentRecording();

    // Security strategies
    void testProductionBookmarkRoundTrip();
    void testAccessStartAndStopRecorded();
    void testProductionRecordsFailures();
    void testDevelopmentBookmarkFailures();
    void testDevelopmentAccessFailures();
    void testDevelopmentPermissionFailures();
    void testDevelopmentArtificialDelay();
    void testSecurityModeFromSettings();
    void testCreateSecurityService();

    // Command validation
    void testValidCommand();
    void testEmptyCommandAndDirectory();
    void testPathTraversalArguments();
    void testDenyListedArguments();
    void testCustomDenyList();
    void testMissingEnvironment();
    void testEmptyEnvironmentEntries();
    void testNonPositiveTimeout();
    void testNullBytes();
    void testValidationOrder();

private:
    static XPCCommandConfig validCommand();
};

void TestSecurityComponents::initTestCase() {
    TestUtils::initializeTestEnvironment();
}

void TestSecurityComponents::cleanupTestCase() {
    TestUtils::cleanupTestEnvironment();
}

XPCCommandConfig TestSecurityComponents::validCommand() {
    XPCCommandConfig config;
    config.command = "snapshots";
    config.arguments = {"--host", "laptop"};
    config.environment = {{"RESTIC_PASSWORD", "secret"}, {"RESTIC_REPOSITORY", "/srv/repo"}};
    config.workingDirectory = "/srv/repo";
    config.timeoutSeconds = 30;
    return config;
}

void TestSecurityComponents::testRecordSuccessAndFailure() {
    SecurityOperationRecorder recorder;
    recorder.recordOperation("/srv/repo", SecurityOperationType::Bookmark, SecurityOperationStatus::Success);
    recorder.recordOperation("/srv/repo", SecurityOperationType::Access, SecurityOperationStatus::Failure,
                             QString("Access denied"));

    const auto records = recorder.records();
    QCOMPARE(records.size(), 2);
    QCOMPARE(recorder.recordCount(), 2);
    QCOMPARE(recorder.failureCount(), 1);

    QCOMPARE(records[0].path, QString("/srv/repo"));
    QVERIFY(records[0].type == SecurityOperationType::Bookmark);
    QVERIFY(!records[0].error.has_value());
    QVERIFY(records[0].timestamp.isValid());

    QVERIFY(records[1].status == SecurityOperationStatus::Failure);
    QCOMPARE(records[1].error.value(), QString("Access denied"));
    QCOMPARE(toString(records[1].type), QString("access"));
}

void TestSecurityComponents::testConcurrentRecording() {
    SecurityOperationRecorder recorder;
    const int threads = 8;
    const int perThread = 50;

    QList<QFuture<void>> futures;
    for (int t = 0; t < threads; ++t) {
        futures << QtConcurrent::run([&recorder, t]() {
            for (int i = 0; i < perThread; ++i) {
                recorder.recordOperation(QString("/path/%1/%2").arg(t).arg(i),
                                         SecurityOperationType::XPC, SecurityOperationStatus::Success);
            }
        });
    }
    for (auto& future : futures) {
        future.waitForFinished();
    }

    QCOMPARE(recorder.recordCount(), threads * perThread);
}

void TestSecurityComponents::testProductionBookmarkRoundTrip() {
    TEST_SCOPE("production_round_trip");
    auto recorder = std::make_shared<SecurityOperationRecorder>();
    ProductionSecurityService service(recorder);
    QCOMPARE(service.name(), QString("production"));

    auto bookmark = service.createBookmark(_testScope.getTempDirectory(), true);
    ASSERT_EXPECTED_VALUE(bookmark);

    auto access = service.resolveBookmark(bookmark.value());
    ASSERT_EXPECTED_VALUE(access);
    ASSERT_EXPECTED_VALUE(service.startAccessing(access.value()));
    QVERIFY(access.value().isAccessing());
    service.stopAccessing(access.value());
    QVERIFY(!access.value().isAccessing());

    // bookmark create, bookmark resolve, access start, access stop
    QCOMPARE(recorder->recordCount(), 4);
    QCOMPARE(recorder->failureCount(), 0);
}

void TestSecurityComponents::testAccessStartAndStopRecorded() {
    TEST_SCOPE("access_audit");
    const QString dir = _testScope.getTempDirectory();
    auto recorder = std::make_shared<SecurityOperationRecorder>();
    ProductionSecurityService service(recorder);

    auto access = SecurityScopedAccess::create(dir, true);
    ASSERT_EXPECTED_VALUE(access);
    ASSERT_EXPECTED_VALUE(service.startAccessing(access.value()));
    service.stopAccessing(access.value());
    // Not accessing any more, nothing to record
    service.stopAccessing(access.value());

    const auto records = recorder->records();
    QCOMPARE(records.size(), 2);
    for (const auto& record : records) {
        QVERIFY(record.type == SecurityOperationType::Access);
        QVERIFY(record.status == SecurityOperationStatus::Success);
        QCOMPARE(record.path, access.value().path());
    }
    QVERIFY(records[0].timestamp <= records[1].timestamp);
}

void TestSecurityComponents::testProductionRecordsFailures() {
    TEST_SCOPE("production_failures");
    ProductionSecurityService service(nullptr);
    QVERIFY(service.recorder() != nullptr);

    const QString missing = _testScope.getTempDirectory() + "/missing";
    ASSERT_EXPECTED_ERROR(service.createBookmark(missing, true), XPCError::FileNotFound);
    ASSERT_EXPECTED_ERROR(service.resolveBookmark(QByteArray("junk")), XPCError::BookmarkInvalid);

    const auto records = service.recorder()->records();
    QCOMPARE(records.size(), 2);
    QVERIFY(records[0].status == SecurityOperationStatus::Failure);
    QCOMPARE(records[0].path, missing);
    QVERIFY(records[0].error.has_value());
}

void TestSecurityComponents::testDevelopmentBookmarkFailures() {
    TEST_SCOPE("development_bookmarks");
    const QString dir = _testScope.getTempDirectory();

    ProductionSecurityService real(nullptr);
    auto bookmark = real.createBookmark(dir, true);
    ASSERT_EXPECTED_VALUE(bookmark);

    DevelopmentOptions options;
    options.simulateBookmarkFailures = true;
    DevelopmentSecurityService service(nullptr, options);
    QCOMPARE(service.name(), QString("development"));

    ASSERT_EXPECTED_ERROR(service.createBookmark(dir, true), XPCError::BookmarkInvalid);
    ASSERT_EXPECTED_ERROR(service.resolveBookmark(bookmark.value()), XPCError::BookmarkStale);
    QCOMPARE(service.recorder()->failureCount(), 2);
}

void TestSecurityComponents::testDevelopmentAccessFailures() {
    TEST_SCOPE("development_access");
    DevelopmentOptions options;
    options.simulateAccessFailures = true;
    DevelopmentSecurityService service(nullptr, options);

    auto bookmark = service.createBookmark(_testScope.getTempDirectory(), true);
    ASSERT_EXPECTED_VALUE(bookmark);
    auto access = service.resolveBookmark(bookmark.value());
    ASSERT_EXPECTED_VALUE(access);

    ASSERT_EXPECTED_ERROR(service.startAccessing(access.value()), XPCError::AccessDenied);
    QVERIFY(!access.value().isAccessing());
}

void TestSecurityComponents::testDevelopmentPermissionFailures() {
    TEST_SCOPE("development_permissions");
    DevelopmentOptions options;
    options.simulatePermissionFailures = true;
    DevelopmentSecurityService service(nullptr, options);

    ASSERT_EXPECTED_ERROR(service.createBookmark(_testScope.getTempDirectory(), true), XPCError::AccessDenied);
}

void TestSecurityComponents::testDevelopmentArtificialDelay() {
    TEST_SCOPE("development_delay");
    DevelopmentOptions options;
    options.artificialDelay = std::chrono::milliseconds(50);
    DevelopmentSecurityService service(nullptr, options);

    QElapsedTimer timer;
    timer.start();
    ASSERT_EXPECTED_VALUE(service.createBookmark(_testScope.getTempDirectory(), true));
    QVERIFY(timer.elapsed() >= 45);
}

void TestSecurityComponents::testSecurityModeFromSettings() {
    Config::SecuritySettings settings;
    QVERIFY(std::holds_alternative<ProductionSecurity>(securityModeFromSettings(settings)));

    settings.mode = "Development";
    settings.simulateAccessFailures = true;
    settings.artificialDelayMs = 25;
    const SecurityMode mode = securityModeFromSettings(settings);
    QVERIFY(std::holds_alternative<DevelopmentSecurity>(mode));

    const auto& options = std::get<DevelopmentSecurity>(mode).options;
    QVERIFY(options.simulateAccessFailures);
    QVERIFY(!options.simulateBookmarkFailures);
    QVERIFY(options.artificialDelay == std::chrono::milliseconds(25));
}

void TestSecurityComponents::testCreateSecurityService() {
    auto recorder = std::make_shared<SecurityOperationRecorder>();

    auto production = createSecurityService(ProductionSecurity{}, recorder);
    QCOMPARE(production->name(), QString("production"));
    QVERIFY(production->recorder() == recorder);

    auto development = createSecurityService(DevelopmentSecurity{DevelopmentOptions()}, recorder);
    QCOMPARE(development->name(), QString("development"));
    QVERIFY(development->recorder() == recorder);
}

void TestSecurityComponents::testValidCommand() {
    CommandValidator validator;
    ASSERT_EXPECTED_VALUE(validator.validate(validCommand()));
}

void TestSecurityComponents::testEmptyCommandAndDirectory() {
    CommandValidator validator;

    auto config = validCommand();
    config.command = "   ";
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::InvalidCommand);

    config = validCommand();
    config.workingDirectory.clear();
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::InvalidCommand);
}

void TestSecurityComponents::testPathTraversalArguments() {
    CommandValidator validator;
    QVERIFY(CommandValidator::isPathTraversalAttempt("../etc/passwd"));
    QVERIFY(CommandValidator::isPathTraversalAttempt("/srv/repo/../../root"));
    QVERIFY(!CommandValidator::isPathTraversalAttempt("/srv/repo/data"));

    auto config = validCommand();
    config.arguments << "../../etc";
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::UnsafeArguments);
}

void TestSecurityComponents::testDenyListedArguments() {
    CommandValidator validator;
    for (const QString& flag : {QString("--no-cache"), QString("--no-lock"), QString("--force")}) {
        auto config = validCommand();
        config.arguments << flag;
        ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::UnsafeArguments);
    }
}

void TestSecurityComponents::testCustomDenyList() {
    CommandPolicy policy;
    policy.unsafeArguments = {"--insecure-tls"};
    CommandValidator validator(policy);

    auto config = validCommand();
    config.arguments << "--force";
    ASSERT_EXPECTED_VALUE(validator.validate(config));

    config.arguments << "--insecure-tls";
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::UnsafeArguments);
}

void TestSecurityComponents::testMissingEnvironment() {
    CommandValidator validator;

    auto config = validCommand();
    config.environment.remove("RESTIC_PASSWORD");
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::MissingEnvironment);

    config = validCommand();
    config.environment["RESTIC_REPOSITORY"] = QString();
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::MissingEnvironment);
}

void TestSecurityComponents::testEmptyEnvironmentEntries() {
    CommandValidator validator;

    auto config = validCommand();
    config.environment.insert("EXTRA", QString());
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::InvalidCommand);

    config = validCommand();
    config.environment.insert(" ", "value");
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::InvalidCommand);
}

void TestSecurityComponents::testNonPositiveTimeout() {
    CommandValidator validator;

    auto config = validCommand();
    config.timeoutSeconds = 0;
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::InvalidConfiguration);
    config.timeoutSeconds = -5;
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::InvalidConfiguration);
}

void TestSecurityComponents::testNullBytes() {
    CommandValidator validator;
    const QString withNull = QString("snap") + QChar(0) + QString("shots");
    QVERIFY(CommandValidator::hasNullBytes(withNull));

    auto config = validCommand();
    config.command = withNull;
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::InvalidCommand);

    config = validCommand();
    config.arguments << withNull;
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::UnsafeArguments);
}

void TestSecurityComponents::testValidationOrder() {
    CommandValidator validator;

    // Arguments are checked before environment, environment before timeout
    auto config = validCommand();
    config.arguments << "--force";
    config.environment.clear();
    config.timeoutSeconds = 0;
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::UnsafeArguments);

    config.arguments = validCommand().arguments;
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::MissingEnvironment);

    config.environment = validCommand().environment;
    ASSERT_EXPECTED_ERROR(validator.validate(config), XPCError::InvalidConfiguration);
}

int runTestSecurityComponents(int argc, char** argv) {
    TestSecurityComponents test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_security_components.moc"
