#include "cli_help.h"
#include "common.h"
#include <sstream>

namespace LookoutCLI {

std::string generateHelpText(LookoutCommon::BinaryType type, const char* programName) {
    std::ostringstream help;

    help << "Usage: " << programName << " [options]\n"
         << "Options:\n"
         << "\n";

    help << "Project:\n"
         << "  --project <dir>          Project root (default: $" << LookoutCommon::Config::PROJECT_PATH_ENV << "\n"
         << "                           or the current directory)\n"
         << "  --config <file>          Settings file (default: <project>/"
         << LookoutCommon::Config::SETTINGS_FILE_NAME << ")\n"
         << "\n"
         << "Detection:\n"
         << "  --ports <p1,p2,...>      Candidate ports for a full scan\n"
         << "  --quick-ports <p1,...>   Priority ports for quick detect (default: 3000,5173,8080,4000)\n"
         << "  --timeout <ms>           Per-probe timeout (default: 2000)\n"
         << "  --https                  Probe with https instead of http\n"
         << "\n"
         << "Preview:\n"
         << "  --viewport <mode>        desktop, tablet or mobile (default: desktop)\n"
         << "  --refresh-delay <ms>     Quiet period before a file change refreshes (default: 300)\n"
         << "  --no-auto-start          Do not look for a server on startup\n"
         << "  --no-auto-sync           Do not refresh on file changes\n"
         << "  --hide-toolbar           Hide the preview toolbar\n";

    if (type == LookoutCommon::BinaryType::Gui) {
        help << "  --dev-allow-remote-access Allow loading remote websites/assets\n"
             << "                           WARNING: For debugging only - reduces security\n";
    }

    if (type == LookoutCommon::BinaryType::Node) {
        help << "\n"
             << "Output:\n"
             << "  --quick                  Check the priority ports only, stop at the first hit\n"
             << "  --json                   Print results as JSON\n"
             << "  --watch [seconds]        Rescan on an interval and report changes (default: 5)\n";
    }

    help << "\n"
         << "Other:\n"
         << "  --verbose                Enable verbose logging\n"
         << "  --check                  Verify installation and exit\n"
         << "  --dry-run                Show the resolved configuration and exit\n"
         << "  --help, -h               Show this help message\n"
         << "  --version                Show version information\n"
         << "\n";

    if (type == LookoutCommon::BinaryType::Gui) {
        help << "Lookout - Live preview of your local dev server\n"
             << "Finds the dev server for your project and keeps a preview in sync with it.\n";
    } else {
        help << "Lookout Node - Headless dev server detection\n"
             << "Scans the candidate ports and reports which dev servers are running.\n";
    }

    return help.str();
}

std::string generateVersionString(LookoutCommon::BinaryType type) {
    std::ostringstream version;

    if (type == LookoutCommon::BinaryType::Gui) {
        version << "lookout";
    } else {
        version << "lookout-node";
    }

    version << " version " << LookoutCommon::Config::APP_VERSION;

    if (std::string(LookoutCommon::Config::APP_COMMIT) != "unknown") {
        version << " (" << LookoutCommon::Config::APP_COMMIT << ")";
    }

    return version.str();
}

} // namespace LookoutCLI
