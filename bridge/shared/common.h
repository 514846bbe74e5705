#ifndef BRIDGE_COMMON_H
#define BRIDGE_COMMON_H

#include <QString>
#include <QHostAddress>
#include "error_codes.h"

namespace BridgeCommon {

    namespace Config {
        constexpr const char* APP_NAME = "mobile-bridge";

        #ifdef BRIDGE_VERSION
            constexpr const char* APP_VERSION = BRIDGE_VERSION;
        #else
            constexpr const char* APP_VERSION = "0.0.0";
        #endif

        #ifdef BRIDGE_COMMIT
            constexpr const char* APP_COMMIT = BRIDGE_COMMIT;
        #else
            constexpr const char* APP_COMMIT = "unknown";
        #endif

        constexpr quint16 DEFAULT_PORT = 3001;
        constexpr quint16 DEFAULT_CDP_PORT = 9222;
        constexpr const char* DEFAULT_CDP_HOST = "localhost";
        constexpr const char* DEFAULT_BIND = "0.0.0.0";
        constexpr const char* DEFAULT_PRODUCT = "Antigravity";

        // Delay between QCoreApplication startup and the first poll
        constexpr int STARTUP_DELAY_MS = 250;
    }

    QString getBridgeLogo();

    // Setup console signal handling for graceful shutdown
    void setupSignalHandlers();

    // Must be called after QCoreApplication creation
    void setupSignalNotifier();

    void cleanupSignalHandlers();

    bool isPortAvailable(quint16 port, const QHostAddress& address = QHostAddress::Any);

    // Default location for messages.json when --data-dir is not given
    QString defaultDataDir();
}

#endif // BRIDGE_COMMON_H
