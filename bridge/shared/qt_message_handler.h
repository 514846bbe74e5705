#ifndef BRIDGE_QT_MESSAGE_HANDLER_H
#define BRIDGE_QT_MESSAGE_HANDLER_H

#include <QtGlobal>

namespace BridgeCommon {
    /**
     * Route qDebug/qInfo/qWarning/qCritical output through BridgeLogger.
     * Messages land in the default category with a [Qt] prefix. Any
     * previously installed handler keeps receiving them.
     */
    void installQtMessageHandler();
}

#endif // BRIDGE_QT_MESSAGE_HANDLER_H
