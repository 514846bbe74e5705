#ifndef BRIDGE_CLI_ARGS_H
#define BRIDGE_CLI_ARGS_H

#include <cstring>
#include <string>
#include <cstdlib>
#include <sstream>
#include <iostream>
#include <QtCore/QtGlobal>
#include <QtCore/QString>
#include <QtCore/QDir>
#include "common.h"

namespace BridgeCLI {

struct CommonArgs {
    // Subscriber server
    quint16 port = BridgeCommon::Config::DEFAULT_PORT;
    std::string bind = BridgeCommon::Config::DEFAULT_BIND;

    // Debugging endpoint
    std::string cdpHost = BridgeCommon::Config::DEFAULT_CDP_HOST;
    quint16 cdpPort = BridgeCommon::Config::DEFAULT_CDP_PORT;
    std::string product = BridgeCommon::Config::DEFAULT_PRODUCT;

    // Paths (empty = resolved later)
    std::string workspace;
    std::string dataDir;

    bool noWorkspacePolling = false;
    bool verbose = false;

    // Other
    bool check = false;            // Verify connectivity and exit
    bool showHelp = false;
    bool showVersion = false;
    bool dryRun = false;           // Show configuration without starting

    // Error handling
    bool hasError = false;
    std::string errorMessage;
    BridgeCommon::ExitCode errorCode = BridgeCommon::ExitCode::INVALID_ARGUMENTS;
};

// Helper function to parse a port value
// Returns true if there was an error, false if successful
inline bool parsePortValue(const char* value, quint16& portValue, CommonArgs& args, const char* argName) {
    char* endPtr;
    long port = std::strtol(value, &endPtr, 10);
    if (*endPtr != '\0' || endPtr == value) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " must be a valid number";
        return true;
    }
    if (port < 1 || port > 65535) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " must be between 1 and 65535";
        return true;
    }
    portValue = static_cast<quint16>(port);
    return false;
}

inline bool parsePort(const char* nextArg, int& i, quint16& portValue, CommonArgs& args, const char* argName) {
    if (nextArg == nullptr) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " requires a port number";
        return true;
    }
    if (parsePortValue(nextArg, portValue, args, argName)) {
        return true;
    }
    i++; // Consume next arg
    return false;
}

inline bool parseString(const char* nextArg, int& i, std::string& value, CommonArgs& args, const char* argName) {
    if (nextArg == nullptr || nextArg[0] == '\0') {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " requires a value";
        return true;
    }
    value = nextArg;
    i++;
    return false;
}

// Environment variables supply defaults; flags parsed afterwards override them
inline void applyEnvironmentDefaults(CommonArgs& args) {
    const QString port = qEnvironmentVariable("BRIDGE_PORT");
    if (!port.isEmpty()) {
        parsePortValue(port.toStdString().c_str(), args.port, args, "BRIDGE_PORT");
    }
    const QString cdpPort = qEnvironmentVariable("BRIDGE_CDP_PORT");
    if (!cdpPort.isEmpty() && !args.hasError) {
        parsePortValue(cdpPort.toStdString().c_str(), args.cdpPort, args, "BRIDGE_CDP_PORT");
    }
    if (args.hasError) {
        args.errorCode = BridgeCommon::ExitCode::CONFIGURATION_ERROR;
        return;
    }

    auto stringFromEnv = [](const char* name, std::string& target) {
        const QString value = qEnvironmentVariable(name);
        if (!value.isEmpty()) {
            target = value.toStdString();
        }
    };
    stringFromEnv("BRIDGE_BIND", args.bind);
    stringFromEnv("BRIDGE_CDP_HOST", args.cdpHost);
    stringFromEnv("BRIDGE_PRODUCT", args.product);
    stringFromEnv("BRIDGE_WORKSPACE", args.workspace);
    stringFromEnv("BRIDGE_DATA_DIR", args.dataDir);
}

// Parse one command-line argument
// Returns true if the argument was recognized (whether successful or not)
// Check args.hasError to see if there was an error processing the argument
inline bool parseSharedArg(const char* arg, const char* nextArg, int& i, CommonArgs& args) {
    if (std::strcmp(arg, "--port") == 0) {
        parsePort(nextArg, i, args.port, args, "--port");
        return true;
    } else if (std::strcmp(arg, "--bind") == 0) {
        parseString(nextArg, i, args.bind, args, "--bind");
        return true;
    } else if (std::strcmp(arg, "--cdp-host") == 0) {
        parseString(nextArg, i, args.cdpHost, args, "--cdp-host");
        return true;
    } else if (std::strcmp(arg, "--cdp-port") == 0) {
        parsePort(nextArg, i, args.cdpPort, args, "--cdp-port");
        return true;
    } else if (std::strcmp(arg, "--product") == 0) {
        parseString(nextArg, i, args.product, args, "--product");
        return true;
    } else if (std::strcmp(arg, "--workspace") == 0) {
        parseString(nextArg, i, args.workspace, args, "--workspace");
        return true;
    } else if (std::strcmp(arg, "--data-dir") == 0) {
        parseString(nextArg, i, args.dataDir, args, "--data-dir");
        return true;
    } else if (std::strcmp(arg, "--no-workspace-polling") == 0) {
        args.noWorkspacePolling = true;
        return true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
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

inline bool isLocalHost(const std::string& host) {
    return host == "localhost" || host == "127.0.0.1" || host == "::1";
}

// Validate arguments for conflicts and dependencies
inline bool validateArguments(CommonArgs& args) {
    if (args.hasError) {
        return false;
    }

    if (isLocalHost(args.cdpHost) && args.port == args.cdpPort) {
        args.hasError = true;
        args.errorCode = BridgeCommon::ExitCode::PORT_IN_USE;
        args.errorMessage = "Listen port cannot be the same as the local debugging port";
        return false;
    }

    if (!args.workspace.empty()) {
        QDir workspace(QString::fromStdString(args.workspace));
        if (!workspace.exists()) {
            args.hasError = true;
            args.errorCode = BridgeCommon::ExitCode::WORKSPACE_NOT_FOUND;
            args.errorMessage = "Workspace directory does not exist: " + args.workspace;
            return false;
        }
    }

    if (args.product.empty()) {
        args.hasError = true;
        args.errorCode = BridgeCommon::ExitCode::CONFIGURATION_ERROR;
        args.errorMessage = "Product name cannot be empty";
        return false;
    }

    return true;
}

// Immutable server configuration generated from CommonArgs
class ServerConfig {
public:
    explicit ServerConfig(const CommonArgs& args)
        : m_args(args) {
        m_workspace = args.workspace.empty()
            ? QDir::currentPath()
            : QDir(QString::fromStdString(args.workspace)).absolutePath();
        m_dataDir = args.dataDir.empty()
            ? BridgeCommon::defaultDataDir()
            : QDir(QString::fromStdString(args.dataDir)).absolutePath();
    }

    const CommonArgs& getArgs() const { return m_args; }
    quint16 getPort() const { return m_args.port; }
    QString getBindAddress() const { return QString::fromStdString(m_args.bind); }
    QString getCdpHost() const { return QString::fromStdString(m_args.cdpHost); }
    quint16 getCdpPort() const { return m_args.cdpPort; }
    QString getProduct() const { return QString::fromStdString(m_args.product); }
    QString getWorkspace() const { return m_workspace; }
    QString getDataDir() const { return m_dataDir; }
    bool isWorkspacePollingEnabled() const { return !m_args.noWorkspacePolling; }

    QString getCdpBaseUrl() const {
        return QString("http://%1:%2").arg(getCdpHost()).arg(m_args.cdpPort);
    }

private:
    CommonArgs m_args;
    QString m_workspace;
    QString m_dataDir;
};

inline std::string generateDryRunConfig(const ServerConfig& config) {
    const CommonArgs& args = config.getArgs();
    std::ostringstream oss;
    oss << "\n========================================\n";
    oss << "Mobile Bridge Configuration (--dry-run)\n";
    oss << "========================================\n\n";

    oss << "Subscriber Server:\n";
    oss << "  Bind Address: " << args.bind << "\n";
    oss << "  Port: " << args.port << "\n\n";

    oss << "Debugging Endpoint:\n";
    oss << "  URL: " << config.getCdpBaseUrl().toStdString() << "\n";
    oss << "  Product: " << args.product << "\n\n";

    oss << "Workspace:\n";
    oss << "  Initial Path: " << config.getWorkspace().toStdString();
    if (args.workspace.empty()) {
        oss << " (current directory)";
    }
    oss << "\n";
    oss << "  Polling: " << (config.isWorkspacePollingEnabled() ? "Enabled" : "Disabled") << "\n\n";

    oss << "Storage:\n";
    oss << "  Data Dir: " << config.getDataDir().toStdString() << "\n";
    oss << "  Verbose Logging: " << (args.verbose ? "Yes" : "No") << "\n";

    oss << "\n========================================\n\n";

    return oss.str();
}

inline void printDryRunConfig(const ServerConfig& config) {
    std::cout << generateDryRunConfig(config);
}

} // namespace BridgeCLI

#endif // BRIDGE_CLI_ARGS_H
