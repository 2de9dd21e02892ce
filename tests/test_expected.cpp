#include <QtTest/QtTest>
#include "../src/core/common/Expected.hpp"
#include "../src/core/xpc/XPCError.hpp"

#include <memory>

using namespace Rbum;

class TestExpected : public QObject {
    Q_OBJECT

private slots:
    void testValueAndError() {
        Expected<int, QString> value(42);
        QVERIFY(value);
        QVERIFY(!value.hasError());
        QCOMPARE(value.value(), 42);

        // QString can't hold an int, so the bare string is the error
        Expected<int, QString> failure(QString("exit status 1"));
        QVERIFY(!failure);
        QCOMPARE(failure.error(), QString("exit status 1"));
    }

    void testSameTypeNeedsMakeUnexpected() {
        Expected<QString, QString> value(QString("snapshot"));
        QVERIFY(value.hasValue());
        QCOMPARE(value.value(), QString("snapshot"));

        Expected<QString, QString> failure = makeUnexpected(QString("denied"));
        QVERIFY(failure.hasError());
        QCOMPARE(failure.error(), QString("denied"));
    }

    void testWrongAccessThrows() {
        Expected<int, XPCError> failure = makeUnexpected(XPCError::AccessDenied);
        QVERIFY_THROWS_EXCEPTION(std::runtime_error, failure.value());

        Expected<int, XPCError> value(7);
        QVERIFY_THROWS_EXCEPTION(std::runtime_error, value.error());

        Expected<void, XPCError> ok;
        QVERIFY_THROWS_EXCEPTION(std::runtime_error, ok.error());
    }

    void testTransform() {
        Expected<int, XPCError> exitCode(3);
        auto text = exitCode.transform([](int code) { return QString::number(code); });
        QVERIFY(text.hasValue());
        QCOMPARE(text.value(), QString("3"));

        Expected<int, XPCError> timedOut = makeUnexpected(XPCError::ExecutionTimeout);
        auto untouched = timedOut.transform([](int code) { return code + 1; });
        QCOMPARE(untouched.error(), XPCError::ExecutionTimeout);
    }

    void testValueOr() {
        Expected<qint64, XPCError> freeBytes(qint64(4096));
        QCOMPARE(freeBytes.valueOr(0), qint64(4096));

        Expected<qint64, XPCError> failed = makeUnexpected(XPCError::ResourceUnavailable);
        QCOMPARE(failed.valueOr(0), qint64(0));
    }

    void testMoveOnlyValue() {
        Expected<std::unique_ptr<int>, XPCError> owned(std::make_unique<int>(5));
        QVERIFY(owned.hasValue());

        std::unique_ptr<int> taken = std::move(owned).value();
        QVERIFY(taken);
        QCOMPARE(*taken, 5);
    }

    void testVoidWithEnumError() {
        Expected<void, XPCError> ok;
        QVERIFY(ok.hasValue());
        ok.value();

        Expected<void, XPCError> failed = makeUnexpected(XPCError::AccessDenied);
        QVERIFY(failed.hasError());
        QCOMPARE(failed.error(), XPCError::AccessDenied);
        QVERIFY_THROWS_EXCEPTION(std::runtime_error, failed.value());

        // Copying a non-const value must not pick the error constructor
        Expected<void, XPCError> copy(ok);
        QVERIFY(copy.hasValue());
        Expected<void, XPCError> failedCopy(failed);
        QCOMPARE(failedCopy.error(), XPCError::AccessDenied);
    }

    void testBoolValueWithEnumError() {
        Expected<bool, XPCError> cancelled(false);
        QVERIFY(cancelled.hasValue());
        QCOMPARE(cancelled.value(), false);

        Expected<bool, XPCError> failed(XPCError::RequestTimeout);
        QVERIFY(failed.hasError());
        QCOMPARE(failed.valueOr(true), true);
    }
};


int runTestExpected(int argc, char** argv) {
    TestExpected test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_expected.moc"
