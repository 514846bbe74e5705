#ifndef BRIDGE_CLI_HELP_H
#define BRIDGE_CLI_HELP_H

#include <string>

namespace BridgeCLI {

/**
 * Generate complete help text for command-line usage
 * @param programName Name of the executable
 * @return Formatted help text string ready for console output
 */
std::string generateHelpText(const char* programName);

/**
 * Generate version string with optional commit hash
 * @return Version string in format "mobile-bridge version X.Y.Z (commit)"
 */
std::string generateVersionString();

} // namespace BridgeCLI

#endif // BRIDGE_CLI_HELP_H
