#include "cli_help.h"
#include "common.h"
#include <sstream>

namespace BridgeCLI {

std::string generateHelpText(const char* programName) {
    std::ostringstream help;

    help << "Usage: " << programName << " [options]\n"
         << "Options:\n"
         << "\n";

    help << "Subscriber Server:\n"
         << "  --port <n>               WebSocket port for mobile clients (default: "
         << BridgeCommon::Config::DEFAULT_PORT << ", env BRIDGE_PORT)\n"
         << "  --bind <addr>            Listen address (default: "
         << BridgeCommon::Config::DEFAULT_BIND << ", env BRIDGE_BIND)\n"
         << "\n";

    help << "Debugging Endpoint:\n"
         << "  --cdp-host <host>        Host of the IDE debugging port (default: "
         << BridgeCommon::Config::DEFAULT_CDP_HOST << ", env BRIDGE_CDP_HOST)\n"
         << "  --cdp-port <n>           IDE debugging port (default: "
         << BridgeCommon::Config::DEFAULT_CDP_PORT << ", env BRIDGE_CDP_PORT)\n"
         << "  --product <name>         Product name in the editor window title (default: "
         << BridgeCommon::Config::DEFAULT_PRODUCT << ", env BRIDGE_PRODUCT)\n"
         << "\n";

    help << "Workspace & Storage:\n"
         << "  --workspace <path>       Initial workspace before detection (default: current dir)\n"
         << "  --data-dir <path>        Directory for messages.json (env BRIDGE_DATA_DIR)\n"
         << "  --no-workspace-polling   Do not track the IDE workspace\n"
         << "\n";

    help << "Other:\n"
         << "  --verbose                Enable verbose logging\n"
         << "  --check                  Verify the debugging endpoint and exit\n"
         << "  --dry-run                Show the resolved configuration and exit\n"
         << "  --help, -h               Show this help message\n"
         << "  --version                Show version information\n"
         << "\n";

    help << "Mobile Bridge - exposes IDE state over a WebSocket for mobile clients\n"
         << "Observes the active model, mode, workspace and pending approvals through the\n"
         << "IDE's remote debugging port without modifying the IDE.\n";

    return help.str();
}

std::string generateVersionString() {
    std::ostringstream version;

    version << BridgeCommon::Config::APP_NAME
            << " version " << BridgeCommon::Config::APP_VERSION;

    if (std::string(BridgeCommon::Config::APP_COMMIT) != "unknown") {
        version << " (" << BridgeCommon::Config::APP_COMMIT << ")";
    }

    return version.str();
}

} // namespace BridgeCLI
