#include <QCoreApplication>
#include <QStandardPaths>
#include <QDir>
#include "test_harness.h"
#include "test_suites.h"
#include "../shared/error_codes.h"

using SuiteRunner = int (*)(int&, int&);

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("MobileBridgeTests");
    QStandardPaths::setTestModeEnabled(true);

    BridgeLoggerConfig config;
    config.appName = "bridge-tests";
    config.baseLogDir = QDir(QStandardPaths::writableLocation(QStandardPaths::TempLocation))
                            .absoluteFilePath("mobile-bridge-test-logs");
    config.logFiles = {
        {"app.log", "default", false},
        {"cdp.log", "cdp", true}
    };
    config.minLevel = LogLevel::Info;
    BridgeLogger::initialize(config);

    const QList<SuiteRunner> suites = {
        runBridgeLoggerTests,
        runCliArgumentTests,
        runHeuristicsTests,
        runCdpConnectionTests,
        runTargetResolverTests,
        runCdpSessionTests,
        runCdpScraperTests,
        runBroadcastHubTests,
        runMessageLogTests,
        runWorkspaceMonitorTests,
        runFileChangeWatcherTests,
        runBridgeServerTests
    };

    int totalTests = 0;
    int passedTests = 0;
    int failedTests = 0;
    for (SuiteRunner runSuite : suites) {
        int suiteTotal = 0;
        int suitePassed = 0;
        failedTests += runSuite(suiteTotal, suitePassed);
        totalTests += suiteTotal;
        passedTests += suitePassed;
    }

    BridgeLogger::instance().info("===============================================");
    BridgeLogger::instance().info(QString("Total: %1 passed, %2 failed (%3 tests)")
        .arg(passedTests)
        .arg(failedTests)
        .arg(totalTests));

    if (failedTests > 0) {
        BridgeLogger::instance().error("Result: FAILED");
        return static_cast<int>(BridgeCommon::ExitCode::TESTS_FAILED);
    }
    BridgeLogger::instance().info("Result: PASSED");
    return static_cast<int>(BridgeCommon::ExitCode::SUCCESS);
}
