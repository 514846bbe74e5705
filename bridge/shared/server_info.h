#ifndef BRIDGE_SERVER_INFO_H
#define BRIDGE_SERVER_INFO_H

#include <QString>
#include <QtGlobal>

namespace BridgeCommon {

/**
 * Runtime state shown in the startup banner
 */
struct ServerInfo {
    quint16 port = 0;
    QString bindAddress;
    QString cdpUrl;
    bool cdpAvailable = false;
    QString browser;
    QString workspace;
    bool pollingEnabled = true;
    QString dataDir;
    qint64 pid = 0;
    QString logPath;
};

/**
 * Generate complete server info as a formatted string
 * @param info Server information structure with runtime state
 * @param verbose If true, includes log and data locations
 * @return Formatted string ready to be printed with a single logger call
 */
QString generateServerInfoString(const ServerInfo& info, bool verbose = false);

/**
 * List ws:// URLs for every non-loopback IPv4 interface
 */
QString generateSubscriberEndpointsString(quint16 port);

} // namespace BridgeCommon

#endif // BRIDGE_SERVER_INFO_H
