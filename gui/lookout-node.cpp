#include <iostream>
#include <memory>
#include <QCoreApplication>
#include <QDateTime>
#include <QTimer>
#include <QStringList>
#include "shared/lookoutlogger.h"
#include "shared/common.h"
#include "shared/cli_args.h"
#include "shared/cli_help.h"
#include "shared/session_config.h"
#include "shared/health_check.h"
#include "shared/qt_message_handler.h"
#include "shared/server_info.h"
#include "shared/detection_engine.h"
#include "shared/health_prober.h"
#include "shared/timing.h"

using namespace LookoutCommon;

namespace {

void printReport(const DetectionReport& report, const LookoutCLI::CommonArgs& args) {
    if (args.json) {
        std::cout << generateJsonReport(report).toStdString() << "\n" << std::flush;
        return;
    }

    QString text = generateDetectionReport(report, args.verbose);
    if (args.verbose) {
        LookoutLogger::instance().info(text);
    } else {
        std::cout << text.toStdString() << std::flush;
    }
}

} // namespace

int main(int argc, char *argv[]) {
    // Parse command line arguments
    LookoutCLI::CommonArgs args;

    for (int i = 1; i < argc; ++i) {
        const char* nextArg = (i + 1 < argc) ? argv[i + 1] : nullptr;

        if (LookoutCLI::parseSharedArg(argv[i], nextArg, i, args) ||
            LookoutCLI::parseNodeArg(argv[i], nextArg, i, args)) {
            if (args.hasError) {
                std::cerr << "Error: " << args.errorMessage << "\n";
                std::cout << LookoutCLI::generateHelpText(BinaryType::Node, argv[0]);
                return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
            }
            if (args.showHelp) {
                std::cout << LookoutCLI::generateHelpText(BinaryType::Node, argv[0]);
                return 0;
            }
            if (args.showVersion) {
                std::cout << LookoutCLI::generateVersionString(BinaryType::Node) << "\n";
                return 0;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            std::cout << LookoutCLI::generateHelpText(BinaryType::Node, argv[0]);
            return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
        }
    }

    setupConsoleOutput();
    setupSignalHandlers();

    // Validate arguments for conflicts and dependencies
    if (!LookoutCLI::validateArguments(args)) {
        std::cerr << "Error: " << args.errorMessage << "\n";
        return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
    }

    LookoutCLI::SessionConfig sessionConfig(args, BinaryType::Node);

    // Handle dry-run after all arguments are parsed
    if (args.dryRun) {
        if (sessionConfig.hasError()) {
            return reportExitCode(sessionConfig.errorCode(), sessionConfig.errorMessage());
        }
        LookoutCLI::printDryRunConfig(sessionConfig);
        return 0;
    }

    LookoutLoggerConfig logConfig;
    logConfig.appName = "node";
    logConfig.logFiles = {
        {"node.log", "node", false},
        {"detect.log", "detect", false}
    };
    logConfig.emitQtSignals = false;
    logConfig.consoleEnabled = args.verbose;
    logConfig.consoleColors = true;
    logConfig.baseLogDir = LookoutLogger::getBaseLogDir();

    // Handle --check flag for health check
    if (args.check) {
        QCoreApplication app(argc, argv);
        app.setApplicationName(Config::APP_NAME);

        logConfig.consoleEnabled = true;
        LookoutLogger::initialize(logConfig);

        LookoutHealthCheck::HealthCheckConfig checkConfig;
        checkConfig.binaryName = "lookout-node";
        checkConfig.isGui = false;
        checkConfig.verbose = args.verbose;
        checkConfig.strictMode = false;
        checkConfig.runTests = args.verbose;  // Run tests in verbose mode
        checkConfig.sessionConfig = &sessionConfig;

        int result = LookoutHealthCheck::runHealthCheck(checkConfig);
        cleanupSignalHandlers();
        return result;
    }

    if (sessionConfig.hasError()) {
        cleanupSignalHandlers();
        return reportExitCode(sessionConfig.errorCode(), sessionConfig.errorMessage());
    }

    QCoreApplication app(argc, argv);
    app.setApplicationName(Config::APP_NAME);
    setupSignalNotifier();

    LookoutLogger::initialize(logConfig);
    installQtMessageHandler();

    if (!args.json) {
        if (!args.verbose) {
            std::cout << getLookoutBanner().toUtf8().constData() << std::flush;
        } else {
            LookoutLogger::instance().info(getLookoutBanner());
        }
    }

    const DetectionConfig& detection = sessionConfig.detectionConfig();
    auto prober = std::make_unique<HttpHealthProber>(detection.scheme, detection.timeoutMs,
                                                     SystemClock::shared());
    DetectionEngine engine(detection, std::move(prober), SystemClock::shared());
    engine.setProjectRoot(sessionConfig.projectRoot());

    DetectionReport report;
    report.projectRoot = sessionConfig.projectRoot();
    report.projectRootExists = sessionConfig.projectRootExists();
    report.inference = engine.inspectProject();
    report.quick = args.quick;
    if (args.verbose) {
        report.logPath = LookoutLogger::instance().currentSessionPath();
    }

    LookoutLogger::instance().info(QString("Project root: %1").arg(report.projectRoot));

    QStringList lastIdentities;
    QTimer watchTimer;
    watchTimer.setInterval(sessionConfig.watchIntervalSeconds() * 1000);

    QObject::connect(&watchTimer, &QTimer::timeout, &engine, [&]() {
        if (engine.isScanning()) {
            return;
        }
        engine.refresh([&](const DetectionResult& result) {
            QStringList identities = serverIdentities(result);
            if (identities == lastIdentities) {
                LookoutLogger::instance().debug("Watch rescan: no change");
                return;
            }
            LookoutLogger::instance().info(QString("Dev servers changed: [%1] -> [%2]")
                                           .arg(lastIdentities.join(", "))
                                           .arg(identities.join(", ")));
            lastIdentities = identities;
            report.result = result;
            if (!args.json && !args.verbose) {
                std::cout << "\n" << QDateTime::currentDateTime().toString("HH:mm:ss").toStdString()
                          << " Dev servers changed" << std::flush;
            }
            printReport(report, args);
        });
    });

    // Start once the event loop runs so callbacks that settle straight away can still quit it
    QTimer::singleShot(0, &engine, [&]() {
        if (args.quick) {
            engine.quickDetect([&](const std::optional<DevServer>& server) {
                report.quickHit = server;
                printReport(report, args);
                QCoreApplication::exit(0);
            });
            return;
        }

        engine.detectServers([&](const DetectionResult& result) {
            report.result = result;
            lastIdentities = serverIdentities(result);
            printReport(report, args);

            if (!args.watch) {
                QCoreApplication::exit(0);
                return;
            }

            LookoutLogger::instance().info(QString("Watching for changes every %1s")
                                           .arg(sessionConfig.watchIntervalSeconds()));
            watchTimer.start();
        });
    });

    int result = app.exec();

    watchTimer.stop();
    if (isTerminationRequested()) {
        LookoutLogger::instance().info("Termination requested, stopping");
        if (!args.json && !args.verbose) {
            std::cout << "\nLookout Node stopped\n" << std::flush;
        }
    }

    cleanupSignalHandlers();
    LookoutLogger::instance().flush();

    return result;
}
