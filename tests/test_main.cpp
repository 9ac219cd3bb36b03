#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Forward declarations of test classes that are defined in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestConfig(int argc, char** argv);
extern int runTestPathGuard(int argc, char** argv);
extern int runTestCommandGuard(int argc, char** argv);
extern int runTestEnvironmentSanitizer(int argc, char** argv);
extern int runTestResourceLimiter(int argc, char** argv);
extern int runTestSandboxedExecutor(int argc, char** argv);
extern int runTestRunnerReport(int argc, char** argv);
extern int runTestEvidenceCollector(int argc, char** argv);
extern int runTestValidationRubric(int argc, char** argv);
extern int runTestValidationPipeline(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    Attest::Logger::instance().initialize("attest-tests.log", Attest::Logger::Level::Trace);
    Attest::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"Config", runTestConfig},
        {"PathGuard", runTestPathGuard},
        {"CommandGuard", runTestCommandGuard},
        {"EnvironmentSanitizer", runTestEnvironmentSanitizer},
        {"ResourceLimiter", runTestResourceLimiter},
        {"RunnerReport", runTestRunnerReport},
        {"EvidenceCollector", runTestEvidenceCollector},
        {"ValidationRubric", runTestValidationRubric},
        {"SandboxedExecutor", runTestSandboxedExecutor},
        {"ValidationPipeline", runTestValidationPipeline}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    Attest::Test::TestUtils::cleanupTestEnvironment();

    // Summary
    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}
