#pragma once

#include <QtTest/QtTest>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTemporaryDir>
#include <QtTest/QSignalSpy>
#include <functional>
#include <vector>

#include "../../src/core/common/Expected.hpp"
#include "../../src/core/common/Logger.hpp"
#include "../../src/core/common/Config.hpp"

namespace Scribe {
namespace Test {

/**
 * @brief Shared helpers for the Scribe test suites
 *
 * Owns one temporary directory for the whole run; suites create their own
 * subdirectories below it.
 */
class TestUtils {
public:
    static void initializeTestEnvironment();
    static void cleanupTestEnvironment();

    static QString createTempDirectory(const QString& prefix = "scribe_test");
    static void cleanupTempDirectory(const QString& path);
    static QString getTempPath();

    static QString createTestTextFile(const QString& directory, const QString& content,
                                      const QString& filename = "test.txt");
    // Writes size bytes of a repeating pattern, creating parent directories
    static bool createBinaryFile(const QString& filePath, qint64 size);
    static QByteArray generatePatternData(qint64 size);

    static bool waitForSignal(QObject* sender, const char* signal, int timeoutMs = 5000);
    static bool waitForCondition(std::function<bool()> condition, int timeoutMs = 5000, int checkIntervalMs = 10);

    // Model settings pointing at a scratch storage root with fast intervals
    static ModelSettings testModelSettings(const QString& storageRoot);

    template<typename T, typename E>
    static void assertExpectedValue(const Expected<T, E>& result, const QString& context = QString());

    template<typename T, typename E>
    static void assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context = QString());

    static void assertFileExists(const QString& filePath, const QString& context = QString());
    static void assertFileNotExists(const QString& filePath, const QString& context = QString());

    static void logMessage(const QString& message);

private:
    static QTemporaryDir* tempDir_;
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

template<typename T, typename E>
void TestUtils::assertExpectedValue(const Expected<T, E>& result, const QString& context) {
    if (result.hasError()) {
        QString message = QString("Expected value but got error");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        message += QString(": error code %1").arg(static_cast<int>(result.error()));
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

#define ASSERT_EXPECTED_VALUE(result) Scribe::Test::TestUtils::assertExpectedValue(result, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_EXPECTED_ERROR(result, error) Scribe::Test::TestUtils::assertExpectedError(result, error, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_FILE_EXISTS(path) Scribe::Test::TestUtils::assertFileExists(path, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_FILE_NOT_EXISTS(path) Scribe::Test::TestUtils::assertFileNotExists(path, QString("%1:%2").arg(__FILE__).arg(__LINE__))

#define TEST_SCOPE(name) Scribe::Test::TestScope _testScope(name)

} // namespace Test
} // namespace Scribe
