#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Forward declarations of test classes that are defined in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestRetryPolicy(int argc, char** argv);
extern int runTestRateLimiter(int argc, char** argv);
extern int runTestBandwidthThrottle(int argc, char** argv);
extern int runTestTaskQueue(int argc, char** argv);
extern int runTestTaskStore(int argc, char** argv);
extern int runTestResumableExecutor(int argc, char** argv);
extern int runTestDownloadScheduler(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    Ferry::Logger::instance().initialize("ferry-tests.log", Ferry::Logger::Level::Trace);
    Ferry::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"RetryPolicy", runTestRetryPolicy},
        {"RateLimiter", runTestRateLimiter},
        {"BandwidthThrottle", runTestBandwidthThrottle},
        {"TaskQueue", runTestTaskQueue},
        {"TaskStore", runTestTaskStore},
        {"ResumableExecutor", runTestResumableExecutor},
        {"DownloadScheduler", runTestDownloadScheduler}
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

    Ferry::Test::TestUtils::cleanupTestEnvironment();

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
