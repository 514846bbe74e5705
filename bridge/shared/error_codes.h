#ifndef BRIDGE_ERROR_CODES_H
#define BRIDGE_ERROR_CODES_H

#include <iostream>
#include <QString>

namespace BridgeCommon {

    // Exit codes for mobile-bridge
    enum class ExitCode : int {
        SUCCESS = 0,

        // General errors (1-19)
        GENERAL_ERROR = 1,
        INVALID_ARGUMENTS = 2,
        CONFIGURATION_ERROR = 3,

        // File/Directory errors (20-39)
        WORKSPACE_NOT_FOUND = 20,
        DATA_DIR_CREATE_FAILED = 21,
        PERMISSION_DENIED = 22,

        // Network errors (40-59)
        PORT_ALLOCATION_FAILED = 40,
        PORT_IN_USE = 41,
        NETWORK_INIT_FAILED = 42,
        LISTEN_FAILED = 43,

        // Debugging endpoint errors (60-79)
        CDP_UNREACHABLE = 60,
        CDP_NO_EDITOR_TARGET = 61,

        // Qt errors (80-99)
        QT_INIT_FAILED = 80,

        // Logger errors (100-109)
        LOGGER_INIT_FAILED = 100,
        LOG_DIR_CREATE_FAILED = 101,

        // Self-check (110-119)
        CHECK_FAILED = 110,
        TESTS_FAILED = 111
    };

    // Convert exit code to string description
    inline const char* exitCodeToString(ExitCode code) {
        switch (code) {
            case ExitCode::SUCCESS: return "Success";
            case ExitCode::GENERAL_ERROR: return "General error";
            case ExitCode::INVALID_ARGUMENTS: return "Invalid command line arguments";
            case ExitCode::CONFIGURATION_ERROR: return "Configuration error";

            case ExitCode::WORKSPACE_NOT_FOUND: return "Workspace directory not found";
            case ExitCode::DATA_DIR_CREATE_FAILED: return "Failed to create data directory";
            case ExitCode::PERMISSION_DENIED: return "Permission denied";

            case ExitCode::PORT_ALLOCATION_FAILED: return "Failed to allocate network port";
            case ExitCode::PORT_IN_USE: return "Port already in use";
            case ExitCode::NETWORK_INIT_FAILED: return "Network initialization failed";
            case ExitCode::LISTEN_FAILED: return "Failed to start subscriber server";

            case ExitCode::CDP_UNREACHABLE: return "Debugging endpoint unreachable";
            case ExitCode::CDP_NO_EDITOR_TARGET: return "No editor target found";

            case ExitCode::QT_INIT_FAILED: return "Qt initialization failed";

            case ExitCode::LOGGER_INIT_FAILED: return "Logger initialization failed";
            case ExitCode::LOG_DIR_CREATE_FAILED: return "Failed to create log directory";

            case ExitCode::CHECK_FAILED: return "Installation check failed";
            case ExitCode::TESTS_FAILED: return "Self tests failed";

            default: return "Unknown error";
        }
    }

    // Helper to exit with proper error code and message
    inline void exitWithError(ExitCode code, const QString& additionalInfo = QString()) {
        if (!additionalInfo.isEmpty()) {
            std::cerr << exitCodeToString(code) << ": " << additionalInfo.toStdString() << std::endl;
        } else {
            std::cerr << exitCodeToString(code) << std::endl;
        }
        std::exit(static_cast<int>(code));
    }
}

#endif // BRIDGE_ERROR_CODES_H
