#include "qt_message_handler.h"
#include "bridgelogger.h"
#include <QString>

namespace BridgeCommon {

static QtMessageHandler previousMessageHandler = nullptr;

static void bridgeMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    if (previousMessageHandler) {
        previousMessageHandler(type, context, msg);
    }

    // The logger itself reports through qCritical before it exists
    if (!BridgeLogger::isInitialized()) {
        return;
    }

    const QString line = QString("[Qt] %1").arg(msg);
    switch (type) {
    case QtDebugMsg:
        BridgeLogger::instance().debug(line);
        break;
    case QtInfoMsg:
        BridgeLogger::instance().info(line);
        break;
    case QtWarningMsg:
        BridgeLogger::instance().warning(line);
        break;
    case QtCriticalMsg:
        BridgeLogger::instance().error(line);
        break;
    case QtFatalMsg:
        BridgeLogger::instance().critical(line);
        BridgeLogger::instance().flush();
        break;
    }
}

void installQtMessageHandler()
{
    previousMessageHandler = qInstallMessageHandler(bridgeMessageHandler);
}

} // namespace BridgeCommon
