#ifndef LOOKOUT_CLI_ARGS_H
#define LOOKOUT_CLI_ARGS_H

#include <cstring>
#include <string>
#include <cstdlib>
#include <vector>
#include <QtCore/QtGlobal>

namespace LookoutCLI {

struct CommonArgs {
    // Project location
    std::string projectPath;       // --project (empty = LOOKOUT_PROJECT_PATH or working directory)
    std::string configPath;        // --config (empty = <project>/.lookout.json when present)

    // Detection overrides (empty / zero = not given on the command line)
    std::vector<quint16> ports;
    std::vector<quint16> quickPorts;
    int timeoutMs = 0;
    bool https = false;

    // Preview overrides
    std::string viewport;          // desktop, tablet or mobile
    int refreshDelayMs = -1;       // -1 = not given
    bool noAutoStart = false;
    bool noAutoSync = false;
    bool hideToolbar = false;

    // GUI only
    bool allowRemoteAccess = false; // Allow remote sub-resources inside the preview (debugging only)

    // lookout-node only
    bool quick = false;            // Quick detect instead of a full scan
    bool json = false;             // Machine readable output
    bool watch = false;            // Keep rescanning
    int watchSeconds = 0;          // 0 = default interval

    // Other
    bool verbose = false;
    bool check = false;            // Verify installation
    bool showHelp = false;
    bool showVersion = false;
    bool dryRun = false;           // Show resolved configuration without starting

    // Error handling
    bool hasError = false;
    std::string errorMessage;
};

// Parse a single port number in 1-65535
inline bool parsePortValue(const char* text, quint16& portValue) {
    char* endPtr;
    long port = std::strtol(text, &endPtr, 10);
    if (*endPtr != '\0' || endPtr == text) {
        return false;
    }
    if (port < 1 || port > 65535) {
        return false;
    }
    portValue = static_cast<quint16>(port);
    return true;
}

// Helper function to parse a comma separated port list argument
// Returns true if there was an error, false if successful
inline bool parsePortList(const char* nextArg, int& i, std::vector<quint16>& ports, CommonArgs& args, const char* argName) {
    if (nextArg == nullptr || nextArg[0] == '\0' || nextArg[0] == '-') {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " requires a comma separated list of ports";
        return true;
    }

    std::vector<quint16> parsed;
    std::string list(nextArg);
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        std::string item = list.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        quint16 port = 0;
        if (item.empty() || !parsePortValue(item.c_str(), port)) {
            args.hasError = true;
            args.errorMessage = std::string(argName) + " entries must be ports between 1 and 65535";
            return true;
        }
        parsed.push_back(port);
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    ports = parsed;
    i++; // Consume next arg
    return false;
}

// Helper function to parse a millisecond / second count argument
// Returns true if there was an error, false if successful
inline bool parseCount(const char* nextArg, int& i, int& value, int minValue, CommonArgs& args, const char* argName) {
    if (nextArg == nullptr) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " requires a number";
        return true;
    }

    char* endPtr;
    long number = std::strtol(nextArg, &endPtr, 10);
    if (*endPtr != '\0' || endPtr == nextArg) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " must be a valid number";
        return true;
    }
    if (number < minValue || number > 3600000) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " must be between " + std::to_string(minValue) + " and 3600000";
        return true;
    }

    value = static_cast<int>(number);
    i++; // Consume next arg
    return false;
}

inline bool isKnownViewport(const std::string& viewport) {
    return viewport == "desktop" || viewport == "tablet" || viewport == "mobile";
}

// Parse shared command-line arguments used by both lookout and lookout-node
// Returns true if the argument was recognized (whether successful or not)
// Check args.hasError to see if there was an error processing the argument
inline bool parseSharedArg(const char* arg, const char* nextArg, int& i, CommonArgs& args) {
    // Project location
    if (std::strcmp(arg, "--project") == 0) {
        if (nextArg != nullptr) {
            args.projectPath = nextArg;
            i++;
        } else {
            args.hasError = true;
            args.errorMessage = "--project requires a directory";
        }
        return true;
    } else if (std::strcmp(arg, "--config") == 0) {
        if (nextArg != nullptr) {
            args.configPath = nextArg;
            i++;
        } else {
            args.hasError = true;
            args.errorMessage = "--config requires a file path";
        }
        return true;
    }
    // Detection
    else if (std::strcmp(arg, "--ports") == 0) {
        parsePortList(nextArg, i, args.ports, args, "--ports");
        return true;
    } else if (std::strcmp(arg, "--quick-ports") == 0) {
        parsePortList(nextArg, i, args.quickPorts, args, "--quick-ports");
        return true;
    } else if (std::strcmp(arg, "--timeout") == 0) {
        parseCount(nextArg, i, args.timeoutMs, 1, args, "--timeout");
        return true;
    } else if (std::strcmp(arg, "--https") == 0) {
        args.https = true;
        return true;
    }
    // Preview
    else if (std::strcmp(arg, "--viewport") == 0) {
        if (nextArg != nullptr && isKnownViewport(nextArg)) {
            args.viewport = nextArg;
            i++;
        } else {
            args.hasError = true;
            args.errorMessage = "--viewport must be one of: desktop, tablet, mobile";
        }
        return true;
    } else if (std::strcmp(arg, "--refresh-delay") == 0) {
        parseCount(nextArg, i, args.refreshDelayMs, 0, args, "--refresh-delay");
        return true;
    } else if (std::strcmp(arg, "--no-auto-start") == 0) {
        args.noAutoStart = true;
        return true;
    } else if (std::strcmp(arg, "--no-auto-sync") == 0) {
        args.noAutoSync = true;
        return true;
    } else if (std::strcmp(arg, "--hide-toolbar") == 0) {
        args.hideToolbar = true;
        return true;
    }
    // Other
    else if (std::strcmp(arg, "--verbose") == 0) {
        args.verbose = true;
        return true;
    } else if (std::strcmp(arg, "--check") == 0) {
        args.check = true;
        return true;
    } else if (std::strcmp(arg, "--dry-run") == 0) {
        args.dryRun = true;
        return true;
    } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
        args.showHelp = true;
        return true;
    } else if (std::strcmp(arg, "--version") == 0) {
        args.showVersion = true;
        return true;
    }

    return false;
}

// Parse lookout (GUI) only arguments
inline bool parseGuiArg(const char* arg, CommonArgs& args) {
    if (std::strcmp(arg, "--dev-allow-remote-access") == 0) {
        args.allowRemoteAccess = true;
        return true;
    }

    return false;
}

// Parse lookout-node only arguments
// Returns true if the argument was recognized (whether successful or not)
inline bool parseNodeArg(const char* arg, const char* nextArg, int& i, CommonArgs& args) {
    if (std::strcmp(arg, "--quick") == 0) {
        args.quick = true;
        return true;
    } else if (std::strcmp(arg, "--json") == 0) {
        args.json = true;
        return true;
    } else if (std::strcmp(arg, "--watch") == 0) {
        args.watch = true;
        // The interval is optional
        if (nextArg != nullptr && nextArg[0] != '-') {
            parseCount(nextArg, i, args.watchSeconds, 1, args, "--watch");
        }
        return true;
    }

    return false;
}

// Validate arguments for conflicts
inline bool validateArguments(CommonArgs& args) {
    if (args.watch && args.quick) {
        args.hasError = true;
        args.errorMessage = "--watch cannot be combined with --quick";
        return false;
    }

    if (!args.viewport.empty() && !isKnownViewport(args.viewport)) {
        args.hasError = true;
        args.errorMessage = "--viewport must be one of: desktop, tablet, mobile";
        return false;
    }

    return true;
}

} // namespace LookoutCLI

#endif // LOOKOUT_CLI_ARGS_H
