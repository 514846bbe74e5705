#include "health_check.h"
#include "bridgelogger.h"
#include "common.h"
#include "cli_args.h"
#include "../cdp/targetresolver.h"
#include <QDir>
#include <QEventLoop>
#include <QHostAddress>
#include <QTemporaryFile>
#include <QTimer>

using namespace BridgeCommon;

namespace BridgeHealthCheck {

void printCheckResult(const CheckResult& result, bool verbose) {
    QString prefix;
    LogLevel level;

    switch (result.status) {
        case CheckStatus::Passed:
            prefix = "  ✓";
            level = LogLevel::Info;
            break;
        case CheckStatus::Warning:
            prefix = "  ⚠";
            level = LogLevel::Warning;
            break;
        case CheckStatus::Failed:
            prefix = "  ✗";
            level = LogLevel::Error;
            break;
    }

    QString output = QString("%1 %2").arg(prefix).arg(result.test);
    if (!result.message.isEmpty() && (verbose || result.status != CheckStatus::Passed)) {
        output += QString(": %1").arg(result.message);
    }

    BridgeLogger::instance().log(level, "bridge", output);
}

HealthCheckSummary calculateSummary(const QList<CheckResult>& results) {
    HealthCheckSummary summary = {0, 0, 0, false, ""};

    for (const auto& result : results) {
        switch (result.status) {
            case CheckStatus::Passed:
                summary.passed++;
                break;
            case CheckStatus::Warning:
                summary.warnings++;
                break;
            case CheckStatus::Failed:
                summary.failed++;
                if (result.critical) {
                    summary.hasBlockingFailures = true;
                }
                break;
        }
    }

    if (summary.hasBlockingFailures) {
        summary.overallStatus = "FAILED (Critical errors)";
    } else if (summary.failed > 0) {
        summary.overallStatus = "FAILED";
    } else if (summary.warnings > 0) {
        summary.overallStatus = "PASSED with warnings";
    } else {
        summary.overallStatus = "PASSED";
    }

    return summary;
}

void printSummary(const HealthCheckSummary& summary) {
    BRIDGE_LOG_INFO("\n[Summary]");
    BRIDGE_LOG_INFO(QString("  Checks: %1 passed, %2 warnings, %3 failed")
        .arg(summary.passed)
        .arg(summary.warnings)
        .arg(summary.failed));

    if (summary.failed > 0) {
        BRIDGE_LOG_ERROR(QString("  Result: %1").arg(summary.overallStatus));
    } else if (summary.warnings > 0) {
        BRIDGE_LOG_WARNING(QString("  Result: %1").arg(summary.overallStatus));
    } else {
        BRIDGE_LOG_INFO(QString("  Result: %1").arg(summary.overallStatus));
    }
}

void printSystemInformation(const HealthCheckConfig& config) {
    BRIDGE_LOG_INFO("\n[System Information]");
    BRIDGE_LOG_INFO(QString("  Version:     %1").arg(Config::APP_VERSION));
    BRIDGE_LOG_INFO(QString("  Qt version:  %1").arg(qVersion()));

    #ifdef QT_DEBUG
    QString buildType = "Debug";
    #else
    QString buildType = "Release";
    #endif
    BRIDGE_LOG_INFO(QString("  Build type:  %1").arg(buildType));
    BRIDGE_LOG_INFO(QString("  Binary:      %1").arg(config.binaryName));

    if (config.verbose) {
        BRIDGE_LOG_INFO(QString("  Endpoint:    %1").arg(config.serverConfig->getCdpBaseUrl()));
        BRIDGE_LOG_INFO(QString("  Product:     %1").arg(config.serverConfig->getProduct()));
        BRIDGE_LOG_INFO(QString("  Log path:    %1").arg(BridgeLogger::instance().currentSessionPath()));
    }
}

QList<CheckResult> checkDebuggingEndpoint(const HealthCheckConfig& config) {
    QList<CheckResult> results;
    const BridgeCLI::ServerConfig& serverConfig = *config.serverConfig;

    TargetResolver resolver(serverConfig.getCdpHost(), serverConfig.getCdpPort(), serverConfig.getProduct());
    QEventLoop loop;
    QTimer guard;
    guard.setSingleShot(true);
    QObject::connect(&guard, &QTimer::timeout, &loop, &QEventLoop::quit);

    QJsonObject version;
    QString versionError = "No response";
    guard.start(TargetResolver::HTTP_TIMEOUT_MS * 2);
    resolver.fetchVersion([&](const QJsonObject& response, const QString& error) {
        version = response;
        versionError = error;
        loop.quit();
    });
    loop.exec();

    if (!versionError.isEmpty()) {
        results.append({
            "Debugging Endpoint",
            "Endpoint reachable",
            CheckStatus::Failed,
            QString("%1 (%2). Start the IDE with --remote-debugging-port=%3")
                .arg(resolver.baseUrl(), versionError).arg(serverConfig.getCdpPort()),
            true
        });
        return results;
    }

    results.append({
        "Debugging Endpoint",
        "Endpoint reachable",
        CheckStatus::Passed,
        QString("%1 (%2)").arg(resolver.baseUrl(), version["Browser"].toString()),
        false
    });

    std::optional<CdpTarget> target;
    QString targetError = "No response";
    guard.start(TargetResolver::HTTP_TIMEOUT_MS * 2);
    resolver.resolveEditorTarget([&](const std::optional<CdpTarget>& resolved, const QString& error) {
        target = resolved;
        targetError = error;
        loop.quit();
    });
    loop.exec();

    if (target) {
        results.append({
            "Debugging Endpoint",
            "Editor window",
            CheckStatus::Passed,
            target->title,
            false
        });
    } else {
        results.append({
            "Debugging Endpoint",
            "Editor window",
            CheckStatus::Warning,
            targetError.isEmpty() ? QString("No page target found") : targetError,
            false
        });
    }

    return results;
}

QList<CheckResult> checkNetworking(const HealthCheckConfig& config) {
    QList<CheckResult> results;
    const quint16 port = config.serverConfig->getPort();
    QHostAddress address(config.serverConfig->getBindAddress());
    if (address.isNull()) {
        address = QHostAddress::Any;
    }

    if (isPortAvailable(port, address)) {
        results.append({
            "Networking",
            "Listen port",
            CheckStatus::Passed,
            QString("Can bind to %1:%2").arg(address.toString()).arg(port),
            false
        });
    } else {
        results.append({
            "Networking",
            "Listen port",
            CheckStatus::Failed,
            QString("Cannot bind to %1:%2").arg(address.toString()).arg(port),
            true
        });
    }

    return results;
}

static CheckResult checkWritableDirectory(const QString& test, const QString& path) {
    QDir directory(path);
    if (!directory.exists() && !directory.mkpath(".")) {
        return {"File System", test, CheckStatus::Failed, QString("Cannot create: %1").arg(path), true};
    }

    QTemporaryFile testFile(directory.absoluteFilePath("bridge_test_XXXXXX"));
    if (!testFile.open()) {
        return {"File System", test, CheckStatus::Failed, QString("Not writable: %1").arg(path), true};
    }
    testFile.close();
    return {"File System", test, CheckStatus::Passed, QString("Writable: %1").arg(path), false};
}

QList<CheckResult> checkFileSystem(const HealthCheckConfig& config) {
    QList<CheckResult> results;
    results.append(checkWritableDirectory("Log directory", BridgeLogger::getBaseLogDir()));
    results.append(checkWritableDirectory("Data directory", config.serverConfig->getDataDir()));

    const QString workspace = config.serverConfig->getWorkspace();
    results.append({
        "File System",
        "Initial workspace",
        QDir(workspace).exists() ? CheckStatus::Passed : CheckStatus::Warning,
        workspace,
        false
    });
    return results;
}

int runHealthCheck(const HealthCheckConfig& config) {
    BRIDGE_LOG_INFO("===============================================");
    BRIDGE_LOG_INFO("Mobile Bridge Health Check");
    BRIDGE_LOG_INFO(QString("Binary: %1").arg(config.binaryName));
    BRIDGE_LOG_INFO("===============================================");

    printSystemInformation(config);

    QList<CheckResult> allResults;

    auto runCategory = [&](const QString& title, const QList<CheckResult>& results) {
        BRIDGE_LOG_INFO(QString("\n[%1]").arg(title));
        for (const auto& result : results) {
            printCheckResult(result, config.verbose);
            allResults.append(result);
        }
    };

    runCategory("Debugging Endpoint", checkDebuggingEndpoint(config));
    runCategory("Networking", checkNetworking(config));
    runCategory("File System", checkFileSystem(config));

    auto summary = calculateSummary(allResults);
    printSummary(summary);

    BRIDGE_LOG_INFO("\n===============================================");
    if (summary.hasBlockingFailures || summary.failed > 0) {
        BRIDGE_LOG_ERROR("CHECK FAILED");
        BRIDGE_LOG_INFO("===============================================");
        return 1;
    } else if (summary.warnings > 0 && config.strictMode) {
        BRIDGE_LOG_WARNING("CHECK FAILED (strict mode - warnings treated as errors)");
        BRIDGE_LOG_INFO("===============================================");
        return 1;
    } else {
        BRIDGE_LOG_INFO("CHECK PASSED");
        BRIDGE_LOG_INFO("===============================================");
        return 0;
    }
}

} // namespace BridgeHealthCheck
