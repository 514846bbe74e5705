#ifndef BRIDGE_TEST_HARNESS_H
#define BRIDGE_TEST_HARNESS_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QEventLoop>
#include <QElapsedTimer>
#include <QTimer>
#include <functional>
#include "../shared/bridgelogger.h"

// Test context for collecting multiple failures
struct TestContext {
    bool passed = true;
    QStringList failures;

    void fail(const QString& message) {
        passed = false;
        failures.append(message);
    }
};

struct TestResult {
    QString testName;
    bool passed;
    QString message;
};

// One list per suite translation unit
static QList<TestResult> testResults;

// Collects failures but continues testing
#define TEST_ASSERT(ctx, condition, message) \
    if (!(condition)) { \
        (ctx).fail(QString("Assertion failed: %1").arg(message)); \
    }

// Stops the test on first failure
#define TEST_REQUIRE(ctx, condition, message) \
    if (!(condition)) { \
        (ctx).fail(QString("Required condition failed: %1").arg(message)); \
        return (ctx).passed; \
    }

#define RUN_TEST(testFunc) \
    { \
        QString testName = #testFunc; \
        TestContext ctx; \
        testFunc(ctx); \
        QString message = ctx.passed ? "Passed" : ctx.failures.join("; "); \
        testResults.append({testName, ctx.passed, message}); \
        if (ctx.passed) { \
            BridgeLogger::instance().info(QString("  ✓ %1").arg(testName)); \
        } else { \
            BridgeLogger::instance().error(QString("  ✗ %1: %2").arg(testName).arg(message)); \
        } \
    }

// Tallies this suite's results; returns the number of failures
static inline int summarizeSuite(const QString& suiteName, int& totalTests, int& passedTests) {
    int passed = 0;
    int failed = 0;
    for (const auto& result : testResults) {
        if (result.passed) {
            passed++;
        } else {
            failed++;
        }
    }

    totalTests = passed + failed;
    passedTests = passed;
    BridgeLogger::instance().info(QString("%1: %2 passed, %3 failed\n")
        .arg(suiteName)
        .arg(passed)
        .arg(failed));
    return failed;
}

// Runs the event loop until condition holds or timeoutMs elapses
static inline bool waitFor(const std::function<bool()>& condition, int timeoutMs = 5000) {
    QElapsedTimer timer;
    timer.start();
    while (!condition()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QEventLoop loop;
        QTimer::singleShot(5, &loop, &QEventLoop::quit);
        loop.exec();
    }
    return true;
}

static inline void waitMs(int ms) {
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

#endif // BRIDGE_TEST_HARNESS_H
