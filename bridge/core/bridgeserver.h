#ifndef BRIDGESERVER_H
#define BRIDGESERVER_H

#include <QObject>
#include <QHostAddress>
#include <QJsonObject>
#include <QHash>
#include <QList>
#include <QMap>
#include <memory>
#include <unordered_map>
#include "broadcasthub.h"
#include "eventchannel.h"

class QWebSocket;
class QWebSocketServer;
class IdeScraper;
class ChatStreamService;
class QuotaService;
class WorkspaceMonitor;
class FileChangeWatcher;
class MessageLog;

class WebSocketSubscriber : public Subscriber
{
public:
    explicit WebSocketSubscriber(QWebSocket* socket);

    bool isOpen() const override;
    void send(const QString& message) override;

private:
    QWebSocket* m_socket;
};

// Mobile-facing command channel. Subscribers receive broadcasts through the
// hub and send {action, ...} frames; each reply goes only to the sender.
class BridgeServer : public QObject
{
    Q_OBJECT

public:
    struct Services {
        IdeScraper* scraper = nullptr;
        ChatStreamService* chat = nullptr;
        QuotaService* quota = nullptr;
        WorkspaceMonitor* workspace = nullptr;
        FileChangeWatcher* watcher = nullptr;
        MessageLog* messages = nullptr;
        BroadcastHub* hub = nullptr;
        EventChannel* channel = nullptr;
    };

    explicit BridgeServer(const Services& services, QObject* parent = nullptr);
    ~BridgeServer();

    bool listen(const QHostAddress& address, quint16 port, QString* error = nullptr);
    void close();
    quint16 serverPort() const;
    int clientCount() const { return m_clients.size(); }

    // attach() subscribes to broadcasts and sends the history snapshot
    void attach(Subscriber* subscriber);
    void detach(Subscriber* subscriber);
    void handleMessage(Subscriber* from, const QString& text);

    static QStringList actions();

signals:
    void clientCountChanged(int count);

private slots:
    void onNewConnection();

private:
    // Handlers address the requester by connection id; ids are never reused
    using Handler = void (BridgeServer::*)(quint64 client, const QJsonObject& command);

    Subscriber* openClient(quint64 client) const;
    void reply(quint64 client, const QString& action, const QJsonObject& data);
    void replyError(quint64 client, const QString& message);

    void handleInject(quint64 client, const QJsonObject& command);
    void handleFocus(quint64 client, const QJsonObject& command);
    void handleScreenshot(quint64 client, const QJsonObject& command);
    void handleMetrics(quint64 client, const QJsonObject& command);
    void handleStatus(quint64 client, const QJsonObject& command);
    void handleTargets(quint64 client, const QJsonObject& command);
    void handleModels(quint64 client, const QJsonObject& command);
    void handleSetModel(quint64 client, const QJsonObject& command);
    void handleModes(quint64 client, const QJsonObject& command);
    void handleSetMode(quint64 client, const QJsonObject& command);
    void handleApprovals(quint64 client, const QJsonObject& command);
    void handleRespondApproval(quint64 client, const QJsonObject& command);
    void handleWorkspace(quint64 client, const QJsonObject& command);
    void handleWatch(quint64 client, const QJsonObject& command);
    void handleUnwatch(quint64 client, const QJsonObject& command);
    void handleChatSnapshot(quint64 client, const QJsonObject& command);
    void handleChatStart(quint64 client, const QJsonObject& command);
    void handleChatStop(quint64 client, const QJsonObject& command);
    void handleChatStatus(quint64 client, const QJsonObject& command);
    void handleQuota(quint64 client, const QJsonObject& command);
    void handleQuotaStatus(quint64 client, const QJsonObject& command);
    void handleBroadcast(quint64 client, const QJsonObject& command);
    void handleMessages(quint64 client, const QJsonObject& command);
    void handleInbox(quint64 client, const QJsonObject& command);
    void handleInboxRead(quint64 client, const QJsonObject& command);
    void handleClearMessages(quint64 client, const QJsonObject& command);

    // Resolves path against the workspace root; empty if it escapes the root
    QString resolveInsideWorkspace(const QString& path) const;

    static const QMap<QString, Handler>& handlers();

    Services m_services;
    QWebSocketServer* m_server;
    std::unordered_map<QWebSocket*, std::unique_ptr<WebSocketSubscriber>> m_sockets;
    QHash<Subscriber*, quint64> m_clientIds;
    QMap<quint64, Subscriber*> m_clients;
    quint64 m_nextClientId;
};

#endif // BRIDGESERVER_H
