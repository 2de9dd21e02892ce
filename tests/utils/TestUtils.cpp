#include "TestUtils.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QSaveFile>
#include <QtCore/QUuid>

namespace Rbum {
namespace Test {

QTemporaryDir* TestUtils::tempDir_ = nullptr;

void TestUtils::initializeTestEnvironment() {
    if (tempDir_) {
        return;
    }

    tempDir_ = new QTemporaryDir(QDir::tempPath() + "/rbum-tests-XXXXXX");
    if (!tempDir_->isValid()) {
        qFatal("Failed to create temporary directory for tests: %s",
               qPrintable(tempDir_->errorString()));
    }
    qputenv("RBUM_TEST_MODE", "1");
}

void TestUtils::cleanupTestEnvironment() {
    delete tempDir_;
    tempDir_ = nullptr;
}

QString TestUtils::createTempDirectory(const QString& prefix) {
    initializeTestEnvironment();

    const QString path = QDir(tempDir_->path())
                         .filePath(prefix + "_" + QUuid::createUuid().toString(QUuid::Id128).left(12));
    if (!QDir().mkpath(path)) {
        logMessage(QString("Could not create scratch directory %1").arg(path));
        return QString();
    }
    // Resolve symlinked tmp roots so path comparisons against `pwd -P` hold
    return QDir(path).canonicalPath();
}

void TestUtils::cleanupTempDirectory(const QString& path) {
    if (!path.isEmpty()) {
        QDir(path).removeRecursively();
    }
}

QString TestUtils::createTestTextFile(const QString& directory, const QString& content, const QString& filename) {
    const QString filePath = QDir(directory).filePath(filename);
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return QString();
    }
    file.write(content.toUtf8());
    if (!file.commit()) {
        return QString();
    }
    return filePath;
}

QString TestUtils::createFakeResticExecutable(const QString& directory, const QString& body, const QString& filename) {
    const QString filePath = createTestTextFile(directory, QString("#!/bin/sh\nset -e\n%1\n").arg(body), filename);
    if (filePath.isEmpty()) {
        return QString();
    }

    QFile::setPermissions(filePath, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner |
                                    QFile::ReadGroup | QFile::ExeGroup);
    return filePath;
}

QString TestUtils::uniqueServiceName() {
    return QString("rbum-test-%1").arg(QUuid::createUuid().toString(QUuid::Id128));
}

bool TestUtils::waitForCondition(std::function<bool()> condition, int timeoutMs, int checkIntervalMs) {
    QDeadlineTimer deadline(timeoutMs);
    while (!deadline.hasExpired()) {
        if (condition()) {
            return true;
        }
        QTest::qWait(checkIntervalMs);
    }
    return condition();
}

void TestUtils::logMessage(const QString& message) {
    RBUM_DEBUG("[test] {}", message.toStdString());
}

TestScope::TestScope(const QString& testName)
    : testName_(testName)
    , tempDirectory_(TestUtils::createTempDirectory("test_" + testName)) {
    TestUtils::logMessage(QString("Starting test scope: %1").arg(testName));
}

TestScope::~TestScope() {
    TestUtils::cleanupTempDirectory(tempDirectory_);
    TestUtils::logMessage(QString("Finished test scope: %1").arg(testName_));
}

QString TestScope::getTempDirectory() const {
    return tempDirectory_;
}

} // namespace Test
} // namespace Rbum
