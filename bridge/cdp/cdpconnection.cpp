#include "cdpconnection.h"
#include "../shared/bridgelogger.h"
#include <QJsonDocument>

CdpConnection::CdpConnection(QObject* parent)
    : QObject(parent)
    , m_webSocket(new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this))
    , m_connectTimer(new QTimer(this))
    , m_nextCommandId(1)
    , m_connectionState(ConnectionState::NotConnected)
{
    connect(m_webSocket, &QWebSocket::connected, this, &CdpConnection::onConnected);
    connect(m_webSocket, &QWebSocket::disconnected, this, &CdpConnection::onDisconnected);
    connect(m_webSocket, &QWebSocket::textMessageReceived, this, &CdpConnection::onTextMessageReceived);
    connect(m_webSocket, &QWebSocket::errorOccurred, this, &CdpConnection::onErrorOccurred);

    m_connectTimer->setSingleShot(true);
    connect(m_connectTimer, &QTimer::timeout, this, &CdpConnection::onConnectTimeout);
}

CdpConnection::~CdpConnection()
{
    // Owners resolve outstanding calls through close() before deleting us
    m_pendingCommands.clear();
    m_webSocket->disconnect(this);
    m_webSocket->abort();
}

void CdpConnection::open(const QUrl& endpoint, int timeoutMs)
{
    if (m_connectionState != ConnectionState::NotConnected) {
        return;
    }

    m_endpoint = endpoint;
    m_connectionState = ConnectionState::Connecting;
    m_connectTimer->start(timeoutMs);
    m_webSocket->open(endpoint);
}

void CdpConnection::close()
{
    if (m_connectionState == ConnectionState::Closed) {
        return;
    }

    m_connectTimer->stop();
    m_connectionState = ConnectionState::Closed;
    rejectAll("Connection closed");
    if (m_webSocket->state() != QAbstractSocket::UnconnectedState) {
        m_webSocket->close();
    }
}

int CdpConnection::call(const QString& method, const QJsonObject& params, int timeoutMs, ResponseCallback callback)
{
    if (m_connectionState != ConnectionState::Connected) {
        callback(QJsonObject(), QString("Not connected (%1)").arg(method));
        return 0;
    }

    int commandId = m_nextCommandId++;

    PendingCall pending;
    pending.method = method;
    pending.callback = std::move(callback);
    pending.timer = new QTimer(this);
    pending.timer->setSingleShot(true);
    pending.elapsed.start();
    connect(pending.timer, &QTimer::timeout, this, [this, commandId]() {
        completeCall(commandId, QJsonObject(), "Timeout");
    });
    pending.timer->start(timeoutMs);
    m_pendingCommands.insert(commandId, pending);

    QJsonObject command{
        {"id", commandId},
        {"method", method},
        {"params", params}
    };

    m_webSocket->sendTextMessage(QString::fromUtf8(QJsonDocument(command).toJson(QJsonDocument::Compact)));
    return commandId;
}

void CdpConnection::onConnected()
{
    m_connectTimer->stop();
    m_connectionState = ConnectionState::Connected;
    emit opened();
}

void CdpConnection::onDisconnected()
{
    if (m_connectionState == ConnectionState::Connecting) {
        fail(QString("Could not connect to %1").arg(m_endpoint.toString()));
        return;
    }

    bool wasOpen = m_connectionState == ConnectionState::Connected;
    m_connectionState = ConnectionState::Closed;
    rejectAll("Connection lost");
    if (wasOpen) {
        emit closed();
    }
}

void CdpConnection::onErrorOccurred(QAbstractSocket::SocketError)
{
    if (m_connectionState == ConnectionState::Connecting) {
        fail(m_webSocket->errorString());
    }
}

void CdpConnection::onConnectTimeout()
{
    if (m_connectionState == ConnectionState::Connecting) {
        fail(QString("Connect timeout for %1").arg(m_endpoint.toString()));
    }
}

void CdpConnection::fail(const QString& reason)
{
    m_connectTimer->stop();
    m_connectionState = ConnectionState::Closed;
    m_webSocket->abort();
    BRIDGE_CDP_LOG(LogLevel::Debug, "Connection failed",
                   QJsonObject({{"endpoint", m_endpoint.toString()}, {"error", reason}}));
    emit failed(reason);
}

void CdpConnection::onTextMessageReceived(const QString& message)
{
    QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8());
    if (!doc.isObject()) {
        BRIDGE_CDP_LOG(LogLevel::Warning, "Received invalid CDP frame", QJsonObject());
        return;
    }

    processResponse(doc.object());
}

void CdpConnection::processResponse(const QJsonObject& response)
{
    if (response.contains("id")) {
        int id = response["id"].toInt();
        if (!m_pendingCommands.contains(id)) {
            return;
        }

        if (response.contains("error")) {
            QJsonObject error = response["error"].toObject();
            QString errorMessage = error["message"].toString();
            if (errorMessage.isEmpty()) {
                errorMessage = "Unknown protocol error";
            }
            completeCall(id, QJsonObject(), errorMessage);
        } else {
            completeCall(id, response.value("result").toObject(), QString());
        }
        return;
    }

    if (response.contains("method")) {
        emit notification(response["method"].toString(), response["params"].toObject());
    }
}

void CdpConnection::completeCall(int id, const QJsonObject& result, const QString& error)
{
    auto it = m_pendingCommands.find(id);
    if (it == m_pendingCommands.end()) {
        return;
    }

    PendingCall pending = it.value();
    m_pendingCommands.erase(it);

    pending.timer->stop();
    pending.timer->deleteLater();

    QJsonObject meta{
        {"id", id},
        {"method", pending.method},
        {"elapsedMs", static_cast<qint64>(pending.elapsed.elapsed())}
    };
    if (!error.isEmpty()) {
        meta["error"] = error;
    }
    BRIDGE_CDP_LOG(error.isEmpty() ? LogLevel::Debug : LogLevel::Warning, "Call completed", meta);

    pending.callback(result, error);
}

void CdpConnection::rejectAll(const QString& reason)
{
    const QList<int> ids = m_pendingCommands.keys();
    for (int id : ids) {
        completeCall(id, QJsonObject(), reason);
    }
}
