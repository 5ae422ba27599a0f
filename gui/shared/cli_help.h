#ifndef LOOKOUT_CLI_HELP_H
#define LOOKOUT_CLI_HELP_H

#include <string>
#include "common.h"

namespace LookoutCLI {

/**
 * Generate complete help text for command-line usage
 * @param type Binary type (Gui or Node) to customize help text
 * @param programName Name of the executable (e.g., "lookout" or "lookout-node")
 * @return Formatted help text string ready for console output
 */
std::string generateHelpText(LookoutCommon::BinaryType type, const char* programName);

/**
 * Generate version string with optional commit hash
 * @return Version string in format "lookout[-node] version X.Y.Z (commit)"
 */
std::string generateVersionString(LookoutCommon::BinaryType type);

} // namespace LookoutCLI

#endif // LOOKOUT_CLI_HELP_H
