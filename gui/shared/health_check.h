#ifndef LOOKOUT_HEALTH_CHECK_H
#define LOOKOUT_HEALTH_CHECK_H

#include <QString>
#include <QList>
#include <QCoreApplication>

namespace LookoutCLI {
    class SessionConfig;
}

namespace LookoutHealthCheck {

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
        bool critical;  // If true, failure means the binary won't work
    };

    struct HealthCheckConfig {
        QString binaryName;     // "lookout" or "lookout-node"
        bool isGui;
        bool verbose;
        bool strictMode;        // Fail on warnings for CI
        bool runTests;          // Run the built-in test suites
        const LookoutCLI::SessionConfig* sessionConfig;
    };

    struct HealthCheckSummary {
        int passed;
        int warnings;
        int failed;
        bool hasBlockingFailures;
        QString overallStatus;
    };

    // Main health check function
    // Returns exit code (0 = success, 1 = failure)
    int runHealthCheck(const HealthCheckConfig& config);

    // Individual check categories (exposed for testing)
    void printSystemInformation(const HealthCheckConfig& config);
    QList<CheckResult> checkProject(const HealthCheckConfig& config);
    QList<CheckResult> checkNetworking(const HealthCheckConfig& config);
    QList<CheckResult> checkFileSystem(const HealthCheckConfig& config);
    QList<CheckResult> checkGuiComponents(const HealthCheckConfig& config);
    CheckResult runSystemTests();

    // Utility functions
    void printCheckResult(const CheckResult& result, bool verbose);
    void printSummary(const HealthCheckSummary& summary);
    HealthCheckSummary calculateSummary(const QList<CheckResult>& results);
}

#endif // LOOKOUT_HEALTH_CHECK_H
