#ifndef LOOKOUT_ERROR_CODES_H
#define LOOKOUT_ERROR_CODES_H

#include <iostream>
#include <QString>

namespace LookoutCommon {

    // Exit codes for lookout applications
    enum class ExitCode : int {
        SUCCESS = 0,

        // General errors (1-19)
        GENERAL_ERROR = 1,
        INVALID_ARGUMENTS = 2,
        CONFIGURATION_ERROR = 3,

        // File/Directory errors (20-39)
        PROJECT_DIR_NOT_FOUND = 20,
        CONFIG_FILE_NOT_FOUND = 21,
        CONFIG_FILE_INVALID = 22,

        // Network errors (40-59)
        NETWORK_INIT_FAILED = 40,
        NO_CANDIDATE_PORTS = 41,

        // Qt/GUI errors (80-99)
        QT_INIT_FAILED = 80,
        WEBENGINE_INIT_FAILED = 81,
        WINDOW_CREATE_FAILED = 82,

        // Logger errors (100-109)
        LOGGER_INIT_FAILED = 100,
        LOG_DIR_CREATE_FAILED = 101
    };

    // Convert exit code to string description
    inline const char* exitCodeToString(ExitCode code) {
        switch (code) {
            case ExitCode::SUCCESS: return "Success";
            case ExitCode::GENERAL_ERROR: return "General error";
            case ExitCode::INVALID_ARGUMENTS: return "Invalid command line arguments";
            case ExitCode::CONFIGURATION_ERROR: return "Configuration error";

            case ExitCode::PROJECT_DIR_NOT_FOUND: return "Project directory not found";
            case ExitCode::CONFIG_FILE_NOT_FOUND: return "Settings file not found";
            case ExitCode::CONFIG_FILE_INVALID: return "Settings file is not valid";

            case ExitCode::NETWORK_INIT_FAILED: return "Network initialization failed";
            case ExitCode::NO_CANDIDATE_PORTS: return "No candidate ports configured";

            case ExitCode::QT_INIT_FAILED: return "Qt initialization failed";
            case ExitCode::WEBENGINE_INIT_FAILED: return "WebEngine initialization failed";
            case ExitCode::WINDOW_CREATE_FAILED: return "Failed to create window";

            case ExitCode::LOGGER_INIT_FAILED: return "Logger initialization failed";
            case ExitCode::LOG_DIR_CREATE_FAILED: return "Failed to create log directory";

            default: return "Unknown error";
        }
    }

    // Print the description and any detail to stderr, returning the numeric code for main()
    inline int reportExitCode(ExitCode code, const QString& additionalInfo = QString()) {
        if (!additionalInfo.isEmpty()) {
            std::cerr << exitCodeToString(code) << ": " << additionalInfo.toStdString() << std::endl;
        } else {
            std::cerr << exitCodeToString(code) << std::endl;
        }
        return static_cast<int>(code);
    }
}

#endif // LOOKOUT_ERROR_CODES_H
