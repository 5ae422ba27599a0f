#ifndef LOOKOUT_COMMON_H
#define LOOKOUT_COMMON_H

#include <QString>
#include <QCoreApplication>
#include <QTcpServer>
#include <memory>
#include <string>
#include "error_codes.h"

namespace LookoutCommon {
    // Binary type enum used for formatting help text and reports
    enum class BinaryType {
        Gui,      // lookout preview window
        Node      // lookout-node headless scanner
    };

    // Configuration constants
    namespace Config {
        constexpr const char* APP_NAME = "lookout";

        #ifdef LOOKOUT_VERSION
            constexpr const char* APP_VERSION = LOOKOUT_VERSION;
        #else
            constexpr const char* APP_VERSION = "0.0.0";
        #endif

        #ifdef LOOKOUT_COMMIT
            constexpr const char* APP_COMMIT = LOOKOUT_COMMIT;
        #else
            constexpr const char* APP_COMMIT = "unknown";
        #endif

        constexpr const char* PROJECT_PATH_ENV = "LOOKOUT_PROJECT_PATH";
        constexpr const char* SETTINGS_FILE_NAME = ".lookout.json";
    }

    // Allocate and hold a port; the returned server keeps it bound until closed
    std::unique_ptr<QTcpServer> allocatePort(quint16& outPort, const QHostAddress& address = QHostAddress::Any);

    // Project root resolution: command line, then LOOKOUT_PROJECT_PATH, then the working directory
    QString resolveProjectRoot(const std::string& commandLineOverride = "");

    // Random alphanumeric token (CSP nonces)
    std::string generateSecureToken(size_t length = 32);

    // Setup console output on Windows
    bool setupConsoleOutput();

    QString getLookoutBanner();

    // Console signal handling for graceful shutdown of the headless scanner
    void setupSignalHandlers();

    // Must be called after QCoreApplication creation
    void setupSignalNotifier();

    bool isTerminationRequested();

    void cleanupSignalHandlers();
}

#endif // LOOKOUT_COMMON_H
