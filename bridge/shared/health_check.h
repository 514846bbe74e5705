#ifndef BRIDGE_HEALTH_CHECK_H
#define BRIDGE_HEALTH_CHECK_H

#include <QString>
#include <QList>

namespace BridgeCLI {
    class ServerConfig;
}

namespace BridgeHealthCheck {

    enum class CheckStatus {
        Passed,
        Warning,
        Failed
    };

    struct CheckResult {
        QString category;
        QString test;
        CheckStatus status;
        QString message;
        bool critical;  // If true, failure means the bridge won't work
    };

    struct HealthCheckConfig {
        QString binaryName;
        bool verbose;
        bool strictMode;       // Fail on warnings for CI
        const BridgeCLI::ServerConfig* serverConfig;
    };

    struct HealthCheckSummary {
        int passed;
        int warnings;
        int failed;
        bool hasBlockingFailures;
        QString overallStatus;
    };

    // Returns exit code (0 = success, 1 = failure). Needs a QCoreApplication.
    int runHealthCheck(const HealthCheckConfig& config);

    void printSystemInformation(const HealthCheckConfig& config);
    QList<CheckResult> checkDebuggingEndpoint(const HealthCheckConfig& config);
    QList<CheckResult> checkNetworking(const HealthCheckConfig& config);
    QList<CheckResult> checkFileSystem(const HealthCheckConfig& config);

    void printCheckResult(const CheckResult& result, bool verbose);
    void printSummary(const HealthCheckSummary& summary);
    HealthCheckSummary calculateSummary(const QList<CheckResult>& results);
}

#endif // BRIDGE_HEALTH_CHECK_H
