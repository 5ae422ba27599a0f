#include <iostream>
#include <memory>
#include <QApplication>
#include <QCoreApplication>
#include <QMessageBox>
#include <QWebEngineProfile>
#include "previewwindow.h"
#include "shared/lookoutlogger.h"
#include "shared/common.h"
#include "shared/cli_args.h"
#include "shared/cli_help.h"
#include "shared/session_config.h"
#include "shared/health_check.h"
#include "shared/qt_message_handler.h"

using namespace LookoutCommon;

namespace GuiConfig
{
  constexpr const char *CHROMIUM_FLAGS =
      "--disable-background-timer-throttling "
      "--disable-renderer-backgrounding "
      "--disable-backgrounding-occluded-windows "
      "--autoplay-policy=no-user-gesture-required";
}

int main(int argc, char *argv[])
{
  // Parse command line arguments
  LookoutCLI::CommonArgs args;

  for (int i = 1; i < argc; ++i) {
    const char* nextArg = (i + 1 < argc) ? argv[i + 1] : nullptr;

    // Try parsing as a shared argument first, then the GUI only ones
    if (LookoutCLI::parseSharedArg(argv[i], nextArg, i, args) ||
        LookoutCLI::parseGuiArg(argv[i], args)) {
      if (args.hasError) {
        std::cerr << "Error: " << args.errorMessage << "\n";
        std::cerr << "Use --help to see available options\n";
        return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
      }
      if (args.showHelp) {
        std::cout << LookoutCLI::generateHelpText(BinaryType::Gui, argv[0]);
        return 0;
      }
      if (args.showVersion) {
        std::cout << LookoutCLI::generateVersionString(BinaryType::Gui) << "\n";
        return 0;
      }
      continue;
    }
    else {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      std::cerr << "Use --help to see available options\n";
      return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
    }
  }

  // Validate arguments for conflicts and dependencies
  if (!LookoutCLI::validateArguments(args)) {
    std::cerr << "Error: " << args.errorMessage << "\n";
    return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
  }

  setupConsoleOutput();

  // Settings file and project root are resolved once, up front
  LookoutCLI::SessionConfig config(args, BinaryType::Gui);

  if (args.dryRun) {
    if (config.hasError()) {
      return reportExitCode(config.errorCode(), config.errorMessage());
    }
    LookoutCLI::printDryRunConfig(config);
    return 0;
  }

  LookoutLoggerConfig logConfig;
  logConfig.appName = "gui";
  logConfig.logFiles = {
      {"gui.log", "gui", false},
      {"detect.log", "detect", false}
  };
  logConfig.emitQtSignals = true;
  logConfig.consoleEnabled = args.verbose;
  logConfig.consoleColors = args.verbose;
  logConfig.baseLogDir = LookoutLogger::getBaseLogDir();

  if (args.check)
  {
    // Initialize logger with console output enabled for health check
    logConfig.emitQtSignals = false;
    logConfig.consoleEnabled = true;
    logConfig.consoleColors = true;
    LookoutLogger::initialize(logConfig);
    LookoutLogger::instance().info("Starting Lookout...");

    // Use QCoreApplication for headless check mode - no GUI required
    QCoreApplication tempApp(argc, argv);

    LookoutHealthCheck::HealthCheckConfig checkConfig;
    checkConfig.binaryName = "lookout";
    checkConfig.isGui = true;
    checkConfig.verbose = args.verbose;
    checkConfig.strictMode = false;
    checkConfig.runTests = args.verbose;  // Run tests in verbose mode
    checkConfig.sessionConfig = &config;

    return LookoutHealthCheck::runHealthCheck(checkConfig);
  }

  if (config.hasError()) {
    return reportExitCode(config.errorCode(), config.errorMessage());
  }

  LookoutLogger::initialize(logConfig);
  LookoutLogger::instance().info("Starting Lookout...");
  LookoutLogger::instance().info(QString("Project root: %1").arg(config.projectRoot()));

  if (!config.projectRootExists()) {
    LookoutLogger::instance().warning("Project root does not exist, detection will find nothing");
  }

  if (args.allowRemoteAccess) {
    LookoutLogger::instance().warning("Remote access enabled for the preview, do not use with untrusted projects");
  }

  qputenv("QTWEBENGINE_CHROMIUM_FLAGS", GuiConfig::CHROMIUM_FLAGS);
  QCoreApplication::setAttribute(Qt::AA_ShareOpenGLContexts, true);

  QApplication app(argc, argv);
  installQtMessageHandler();

  if (!QWebEngineProfile::defaultProfile()) {
    QMessageBox::critical(nullptr, "Error", "Qt WebEngine could not be initialized");
    return reportExitCode(ExitCode::WEBENGINE_INIT_FAILED);
  }

  std::unique_ptr<PreviewWindow> window = std::make_unique<PreviewWindow>(config);
  window->show();

  int exitCode = app.exec();

  window.reset();
  LookoutLogger::instance().info("Lookout shutting down");
  LookoutLogger::instance().flush();

  return exitCode;
}
