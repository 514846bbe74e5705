#ifndef CDPCONNECTION_H
#define CDPCONNECTION_H

#include <QObject>
#include <QWebSocket>
#include <QJsonObject>
#include <QElapsedTimer>
#include <QMap>
#include <QTimer>
#include <QUrl>
#include <functional>

// One control-channel connection to a single debuggable target.
// Each logical operation opens its own connection; nothing is pooled.
class CdpConnection : public QObject
{
    Q_OBJECT

public:
    enum class ConnectionState {
        NotConnected,
        Connecting,
        Connected,
        Closed
    };

    using ResponseCallback = std::function<void(const QJsonObject& result, const QString& error)>;

    static constexpr int READ_TIMEOUT_MS = 3000;
    static constexpr int MUTATE_TIMEOUT_MS = 5000;
    static constexpr int CONNECT_TIMEOUT_MS = 5000;

    explicit CdpConnection(QObject* parent = nullptr);
    ~CdpConnection();

    void open(const QUrl& endpoint, int timeoutMs = CONNECT_TIMEOUT_MS);
    void close();

    ConnectionState getConnectionState() const { return m_connectionState; }
    bool isConnected() const { return m_connectionState == ConnectionState::Connected; }

    // Returns the request id, or 0 when the call was rejected without being sent.
    // The callback runs exactly once: on response, on timeout or on connection loss.
    int call(const QString& method, const QJsonObject& params, int timeoutMs, ResponseCallback callback);

    int pendingCount() const { return m_pendingCommands.size(); }

signals:
    void opened();
    void failed(const QString& errorMessage);
    void closed();
    void notification(const QString& method, const QJsonObject& params);

private slots:
    void onConnected();
    void onDisconnected();
    void onTextMessageReceived(const QString& message);
    void onErrorOccurred(QAbstractSocket::SocketError error);
    void onConnectTimeout();

private:
    struct PendingCall {
        QString method;
        ResponseCallback callback;
        QTimer* timer = nullptr;
        QElapsedTimer elapsed;
    };

    void processResponse(const QJsonObject& response);
    void completeCall(int id, const QJsonObject& result, const QString& error);
    void rejectAll(const QString& reason);
    void fail(const QString& reason);

    QWebSocket* m_webSocket;
    QTimer* m_connectTimer;
    QUrl m_endpoint;

    int m_nextCommandId;
    QMap<int, PendingCall> m_pendingCommands;

    ConnectionState m_connectionState;
};

#endif // CDPCONNECTION_H
