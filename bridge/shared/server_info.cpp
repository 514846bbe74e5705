#include "server_info.h"
#include <QNetworkInterface>
#include <QHostAddress>
#include <QStringList>
#include <QTextStream>

namespace BridgeCommon {

QString generateSubscriberEndpointsString(quint16 port) {
    QStringList lines;
    const QList<QHostAddress> addresses = QNetworkInterface::allAddresses();
    bool first = true;

    for (const QHostAddress &address : addresses) {
        if (address.isLoopback() || address.protocol() != QAbstractSocket::IPv4Protocol) {
            continue;
        }
        lines << QString("%1ws://%2:%3")
            .arg(first ? "  Mobile:    " : "             ")
            .arg(address.toString())
            .arg(port);
        first = false;
    }

    if (first) {
        lines << QString("  Mobile:    ws://127.0.0.1:%1").arg(port);
    }

    return lines.join("\n");
}

QString generateServerInfoString(const ServerInfo& info, bool verbose) {
    QString result;
    QTextStream stream(&result);

    stream << "\n";
    stream << "========================================================\n";
    stream << "Mobile Bridge Started\n";
    stream << "--------------------------------------------------------\n";

    stream << "  Listen:    " << info.bindAddress << ":" << info.port << "\n";
    if (info.bindAddress == "0.0.0.0") {
        stream << generateSubscriberEndpointsString(info.port) << "\n";
    }

    stream << "  CDP:       " << info.cdpUrl;
    if (info.cdpAvailable) {
        stream << " (" << (info.browser.isEmpty() ? QString("available") : info.browser) << ")";
    } else {
        stream << " (unavailable, will keep retrying)";
    }
    stream << "\n";

    stream << "  Workspace: " << info.workspace;
    if (!info.pollingEnabled) {
        stream << " (polling disabled)";
    }
    stream << "\n";

    stream << "  PID:       " << info.pid << "\n";

    if (verbose) {
        stream << "  Data:      " << info.dataDir << "\n";
        stream << "  Logs:      " << info.logPath << "\n";
    }

    stream << "========================================================\n";
    stream << "Press Ctrl+C to stop\n";

    stream.flush();
    return result;
}

} // namespace BridgeCommon
