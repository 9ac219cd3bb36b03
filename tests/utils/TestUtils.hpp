#pragma once

#include <QtTest/QtTest>
#include <QtCore/QDateTime>
#include <QtCore/QEventLoop>
#include <QtCore/QFutureWatcher>
#include <QtCore/QJsonObject>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTemporaryDir>
#include <QtCore/QTimer>
#include <functional>
#include <type_traits>
#include <vector>

#include "../../src/core/common/Expected.hpp"
#include "../../src/core/common/Logger.hpp"
#include "../../src/core/security/SandboxTypes.hpp"

namespace Attest {
namespace Test {

/**
 * @brief Shared helpers for the Attest test suites
 *
 * Temporary project trees, evidence files with controlled timestamps,
 * shell scripts for the executor tests and ready-made rubric records.
 */
class TestUtils : public QObject {
    Q_OBJECT

public:
    explicit TestUtils(QObject* parent = nullptr);
    ~TestUtils() override;

    // Test environment setup
    static void initializeTestEnvironment();
    static void cleanupTestEnvironment();

    // Temporary directory management
    static QString createTempDirectory(const QString& prefix = "attest_test");
    static void cleanupTempDirectory(const QString& path);
    static QString getTempPath();

    // Test file creation; parent directories are created as needed
    static QString createTestTextFile(const QString& directory, const QString& content,
                                      const QString& filename = "test.txt");
    static QString createEvidenceFile(const QString& directory, const QString& filename,
                                      const QDateTime& modified = QDateTime());
    static QString createScript(const QString& directory, const QString& filename, const QString& body);

    // Project layout: tests/, artifacts/, test-results/ under root
    static void createProjectTree(const QString& root);
    static SandboxConfig sandboxConfigFor(const QString& root);

    // Record that satisfies every rubric rule
    static QJsonObject passingRecord();

    // Async testing utilities
    template<typename T>
    static T waitForFuture(QFuture<T> future, int timeoutMs = 5000);

    static bool waitForCondition(std::function<bool()> condition, int timeoutMs = 5000, int checkIntervalMs = 50);

    // Test assertions with better error messages
    template<typename T, typename E>
    static void assertExpectedValue(const Expected<T, E>& result, const QString& context = QString());

    template<typename T, typename E>
    static void assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context = QString());

    static void assertFileExists(const QString& filePath, const QString& context = QString());
    static void assertFileNotExists(const QString& filePath, const QString& context = QString());

    // Logging utilities
    static void logMessage(const QString& message);
    static QStringList getTestLogs();
    static void clearTestLogs();

private:
    static QTemporaryDir* tempDir_;
    static QStringList testLogs_;

    static void logTestMessage(const QString& message);
};

/**
 * @brief RAII helper for test scope management
 */
class TestScope {
public:
    explicit TestScope(const QString& testName);
    ~TestScope();

    QString getTempDirectory() const;
    void addCleanupCallback(std::function<void()> callback);

private:
    QString testName_;
    QString tempDirectory_;
    std::vector<std::function<void()>> cleanupCallbacks_;
};

// Template implementations
template<typename T>
T TestUtils::waitForFuture(QFuture<T> future, int timeoutMs) {
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);

    QFutureWatcher<T> watcher;
    QObject::connect(&watcher, &QFutureWatcher<T>::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    watcher.setFuture(future);
    timer.start(timeoutMs);

    if (!future.isFinished()) {
        loop.exec();
    }

    if (!future.isFinished()) {
        logMessage(QString("waitForFuture timeout after %1ms").arg(timeoutMs));
        static_assert(std::is_default_constructible_v<T>, "T must be default constructible for timeout case");
        return T{};
    }

    return future.result();
}

template<typename T, typename E>
void TestUtils::assertExpectedValue(const Expected<T, E>& result, const QString& context) {
    if (result.hasError()) {
        QString message = QString("Expected value but got error");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

template<typename T, typename E>
void TestUtils::assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context) {
    if (result.hasValue()) {
        QString message = QString("Expected error but got value");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }

    if (result.error() != expectedError) {
        QString message = QString("Expected error %1 but got error %2")
                         .arg(static_cast<int>(expectedError))
                         .arg(static_cast<int>(result.error()));
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

// Convenience macros for testing
#define ASSERT_EXPECTED_VALUE(result) TestUtils::assertExpectedValue(result, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_EXPECTED_ERROR(result, error) TestUtils::assertExpectedError(result, error, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_FILE_EXISTS(path) TestUtils::assertFileExists(path, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_FILE_NOT_EXISTS(path) TestUtils::assertFileNotExists(path, QString("%1:%2").arg(__FILE__).arg(__LINE__))

#define TEST_SCOPE(name) TestScope _testScope(name)

} // namespace Test
} // namespace Attest
