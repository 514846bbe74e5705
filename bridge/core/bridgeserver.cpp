#include "bridgeserver.h"
#include "collaborators.h"
#include "filechangewatcher.h"
#include "messagelog.h"
#include "workspacemonitor.h"
#include "../scraper/idescraper.h"
#include "../shared/bridgelogger.h"
#include <QWebSocket>
#include <QWebSocketServer>
#include <QJsonDocument>
#include <QDateTime>
#include <QFileInfo>
#include <QDir>

WebSocketSubscriber::WebSocketSubscriber(QWebSocket* socket)
    : m_socket(socket)
{
}

bool WebSocketSubscriber::isOpen() const
{
    return m_socket && m_socket->state() == QAbstractSocket::ConnectedState;
}

void WebSocketSubscriber::send(const QString& message)
{
    m_socket->sendTextMessage(message);
}

BridgeServer::BridgeServer(const Services& services, QObject* parent)
    : QObject(parent)
    , m_services(services)
    , m_server(new QWebSocketServer(QStringLiteral("MobileBridge"), QWebSocketServer::NonSecureMode, this))
    , m_nextClientId(1)
{
    connect(m_server, &QWebSocketServer::newConnection, this, &BridgeServer::onNewConnection);
}

BridgeServer::~BridgeServer()
{
    for (auto& [socket, subscriber] : m_sockets) {
        m_services.hub->unsubscribe(subscriber.get());
        socket->disconnect(this);
    }
}

bool BridgeServer::listen(const QHostAddress& address, quint16 port, QString* error)
{
    if (!m_server->listen(address, port)) {
        if (error) {
            *error = m_server->errorString();
        }
        return false;
    }
    BRIDGE_LOG_INFO(QString("Subscriber server listening on %1:%2")
                    .arg(address.toString()).arg(m_server->serverPort()));
    return true;
}

void BridgeServer::close()
{
    m_server->close();

    // disconnected() erases from m_sockets, so close from a copy of the keys
    QList<QWebSocket*> sockets;
    sockets.reserve(static_cast<int>(m_sockets.size()));
    for (const auto& entry : m_sockets) {
        sockets.append(entry.first);
    }
    for (QWebSocket* socket : sockets) {
        socket->close();
    }
}

quint16 BridgeServer::serverPort() const
{
    return m_server->serverPort();
}

void BridgeServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QWebSocket* socket = m_server->nextPendingConnection();
        auto subscriber = std::make_unique<WebSocketSubscriber>(socket);
        Subscriber* raw = subscriber.get();
        m_sockets[socket] = std::move(subscriber);

        connect(socket, &QWebSocket::textMessageReceived, this, [this, raw](const QString& message) {
            handleMessage(raw, message);
        });
        connect(socket, &QWebSocket::disconnected, this, [this, socket, raw]() {
            detach(raw);
            m_sockets.erase(socket);
            socket->deleteLater();
        });

        BRIDGE_LOG_INFO(QString("Client connected from %1").arg(socket->peerAddress().toString()));
        attach(raw);
    }
}

void BridgeServer::attach(Subscriber* subscriber)
{
    if (m_clientIds.contains(subscriber)) {
        return;
    }
    const quint64 client = m_nextClientId++;
    m_clientIds.insert(subscriber, client);
    m_clients.insert(client, subscriber);
    m_services.hub->subscribe(subscriber);

    QJsonArray history = m_services.messages ? m_services.messages->recent(MessageLog::HISTORY_SIZE) : QJsonArray();
    if (subscriber->isOpen()) {
        subscriber->send(BroadcastHub::envelope("history", QJsonObject{{"messages", history}},
                                                QDateTime::currentDateTimeUtc()));
    }

    BRIDGE_LOG_INFO(QString("Client %1 attached. Clients: %2").arg(client).arg(clientCount()));
    emit clientCountChanged(clientCount());
}

void BridgeServer::detach(Subscriber* subscriber)
{
    const quint64 client = m_clientIds.take(subscriber);
    if (client == 0) {
        return;
    }
    m_clients.remove(client);
    m_services.hub->unsubscribe(subscriber);

    BRIDGE_LOG_INFO(QString("Client %1 detached. Clients: %2").arg(client).arg(clientCount()));
    emit clientCountChanged(clientCount());
}

Subscriber* BridgeServer::openClient(quint64 client) const
{
    // The requester may have gone away while the operation was running
    Subscriber* subscriber = m_clients.value(client, nullptr);
    return subscriber && subscriber->isOpen() ? subscriber : nullptr;
}

void BridgeServer::reply(quint64 client, const QString& action, const QJsonObject& data)
{
    if (Subscriber* to = openClient(client)) {
        to->send(BroadcastHub::envelope(action + "_result", data, QDateTime::currentDateTimeUtc()));
    }
}

void BridgeServer::replyError(quint64 client, const QString& message)
{
    if (Subscriber* to = openClient(client)) {
        to->send(BroadcastHub::envelope("error", QJsonObject{{"message", message}}, QDateTime::currentDateTimeUtc()));
    }
}

const QMap<QString, BridgeServer::Handler>& BridgeServer::handlers()
{
    static const QMap<QString, Handler> table = {
        {"inject", &BridgeServer::handleInject},
        {"focus", &BridgeServer::handleFocus},
        {"screenshot", &BridgeServer::handleScreenshot},
        {"metrics", &BridgeServer::handleMetrics},
        {"status", &BridgeServer::handleStatus},
        {"targets", &BridgeServer::handleTargets},
        {"models", &BridgeServer::handleModels},
        {"set_model", &BridgeServer::handleSetModel},
        {"modes", &BridgeServer::handleModes},
        {"set_mode", &BridgeServer::handleSetMode},
        {"approvals", &BridgeServer::handleApprovals},
        {"respond_approval", &BridgeServer::handleRespondApproval},
        {"workspace", &BridgeServer::handleWorkspace},
        {"watch", &BridgeServer::handleWatch},
        {"unwatch", &BridgeServer::handleUnwatch},
        {"chat_snapshot", &BridgeServer::handleChatSnapshot},
        {"chat_start", &BridgeServer::handleChatStart},
        {"chat_stop", &BridgeServer::handleChatStop},
        {"chat_status", &BridgeServer::handleChatStatus},
        {"quota", &BridgeServer::handleQuota},
        {"quota_status", &BridgeServer::handleQuotaStatus},
        {"broadcast", &BridgeServer::handleBroadcast},
        {"messages", &BridgeServer::handleMessages},
        {"inbox", &BridgeServer::handleInbox},
        {"inbox_read", &BridgeServer::handleInboxRead},
        {"clear_messages", &BridgeServer::handleClearMessages}
    };
    return table;
}

QStringList BridgeServer::actions()
{
    return handlers().keys();
}

void BridgeServer::handleMessage(Subscriber* from, const QString& text)
{
    // Unattached senders map to id 0, which never receives replies
    const quint64 client = m_clientIds.value(from, 0);

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        replyError(client, "Invalid JSON");
        return;
    }

    const QJsonObject command = doc.object();
    const QString action = command["action"].toString();
    if (action.isEmpty()) {
        replyError(client, "Missing action");
        return;
    }

    auto it = handlers().constFind(action);
    if (it == handlers().constEnd()) {
        replyError(client, QString("Unknown action: %1").arg(action));
        return;
    }

    BRIDGE_LOG_DEBUG(QString("Command: %1").arg(action));
    (this->*(it.value()))(client, command);
}

void BridgeServer::handleInject(quint64 client, const QJsonObject& command)
{
    const QString text = command["text"].toString();
    const bool submit = command["submit"].toBool(true);

    if (text.trimmed().isEmpty()) {
        replyError(client, "Text required");
        return;
    }

    m_services.scraper->injectText(text, submit, [this, client, text, submit](const ActionResult& result) {
        m_services.messages->append("mobile_command", text);
        m_services.channel->post("mobile_command", QJsonObject{{"text", text}, {"submitted", submit}});
        reply(client, "inject", result.toJson());
    });
}

void BridgeServer::handleFocus(quint64 client, const QJsonObject&)
{
    m_services.scraper->focusInput([this, client](const ActionResult& result) {
        reply(client, "focus", result.toJson());
    });
}

void BridgeServer::handleScreenshot(quint64 client, const QJsonObject& command)
{
    const QString format = command["format"].toString("png");
    const int quality = command["quality"].toInt(80);

    m_services.scraper->captureScreenshot(format, quality, [this, client](const ScreenshotResult& result) {
        reply(client, "screenshot", result.toJson());
    });
}

void BridgeServer::handleMetrics(quint64 client, const QJsonObject&)
{
    m_services.scraper->getPageMetrics([this, client](const PageMetricsResult& result) {
        reply(client, "metrics", result.toJson());
    });
}

void BridgeServer::handleStatus(quint64 client, const QJsonObject&)
{
    m_services.scraper->checkAvailability([this, client](const AvailabilityResult& availability) {
        reply(client, "status", QJsonObject{
            {"ok", true},
            {"clients", clientCount()},
            {"inbox_count", m_services.messages->inboxCount()},
            {"message_count", m_services.messages->count()},
            {"cdp", availability.toJson()}
        });
    });
}

void BridgeServer::handleTargets(quint64 client, const QJsonObject&)
{
    m_services.scraper->listTargets([this, client](const TargetListResult& result) {
        reply(client, "targets", result.toJson());
    });
}

void BridgeServer::handleModels(quint64 client, const QJsonObject&)
{
    m_services.scraper->availableModels([this, client](const OptionsResult& result) {
        reply(client, "models", result.toJson("models"));
    });
}

void BridgeServer::handleSetModel(quint64 client, const QJsonObject& command)
{
    const QString model = command["model"].toString();
    if (model.trimmed().isEmpty()) {
        replyError(client, "Model name required");
        return;
    }

    m_services.scraper->setModel(model, [this, client](const SelectionResult& result) {
        if (result.success) {
            m_services.channel->post("model_changed", QJsonObject{{"model", result.selected}});
        }
        reply(client, "set_model", result.toJson());
    });
}

void BridgeServer::handleModes(quint64 client, const QJsonObject&)
{
    m_services.scraper->availableModes([this, client](const OptionsResult& result) {
        reply(client, "modes", result.toJson("modes"));
    });
}

void BridgeServer::handleSetMode(quint64 client, const QJsonObject& command)
{
    const QString mode = command["mode"].toString();
    if (mode.trimmed().isEmpty()) {
        replyError(client, "Mode name required");
        return;
    }

    m_services.scraper->setMode(mode, [this, client](const SelectionResult& result) {
        if (result.success) {
            m_services.channel->post("mode_changed", QJsonObject{{"mode", result.selected}});
        }
        reply(client, "set_mode", result.toJson());
    });
}

void BridgeServer::handleApprovals(quint64 client, const QJsonObject&)
{
    m_services.scraper->detectApprovals([this, client](const ApprovalResult& result) {
        reply(client, "approvals", result.toJson());
    });
}

void BridgeServer::handleRespondApproval(quint64 client, const QJsonObject& command)
{
    // "action" already names the command, so the decision travels as "response"
    const QString action = command["response"].toString();
    if (action != "approve" && action != "reject") {
        replyError(client, "Response must be 'approve' or 'reject'");
        return;
    }

    m_services.scraper->respondToApproval(action == "approve", [this, client, action](const ActionResult& result) {
        if (result.success) {
            m_services.channel->post("approval_responded", QJsonObject{{"action", action}});
        }
        reply(client, "respond_approval", result.toJson());
    });
}

void BridgeServer::handleWorkspace(quint64 client, const QJsonObject&)
{
    const WorkspaceState& state = m_services.workspace->state();
    QJsonObject data{
        {"path", state.currentPath},
        {"projectName", QFileInfo(state.currentPath).fileName()},
        {"lastKnownGoodPath", state.lastKnownGoodPath},
        {"consecutiveFailures", state.consecutiveFailureCount},
        {"polling", m_services.workspace->isActive()},
        {"watching", m_services.watcher->isWatching()}
    };
    if (m_services.watcher->isWatching()) {
        data["watchedPath"] = m_services.watcher->watchedPath();
    }
    reply(client, "workspace", data);
}

QString BridgeServer::resolveInsideWorkspace(const QString& path) const
{
    const QString root = QDir(m_services.workspace->currentPath()).canonicalPath();
    if (root.isEmpty()) {
        return QString();
    }

    QFileInfo info(QDir::isAbsolutePath(path) ? path : QDir(root).filePath(path));
    const QString resolved = info.canonicalFilePath();
    if (resolved.isEmpty()) {
        return QString();
    }

    const Qt::CaseSensitivity cs = WorkspaceMonitor::platformCaseSensitivity();
    if (resolved.compare(root, cs) == 0) {
        return resolved;
    }
    const QString prefix = root.endsWith('/') ? root : root + '/';
    return resolved.startsWith(prefix, cs) ? resolved : QString();
}

void BridgeServer::handleWatch(quint64 client, const QJsonObject& command)
{
    const QString requested = command["path"].toString();
    if (requested.isEmpty()) {
        replyError(client, "Path required");
        return;
    }

    const QString path = resolveInsideWorkspace(requested);
    if (path.isEmpty()) {
        replyError(client, QString("Path is not inside the workspace: %1").arg(requested));
        return;
    }
    if (!QFileInfo(path).isDir()) {
        replyError(client, QString("Not a directory: %1").arg(requested));
        return;
    }

    const bool watching = m_services.watcher->watch(path);
    QJsonObject data{{"success", watching}, {"path", path}};
    if (!watching) {
        data["error"] = "Failed to watch directory";
    }
    reply(client, "watch", data);
}

void BridgeServer::handleUnwatch(quint64 client, const QJsonObject&)
{
    m_services.watcher->unwatch();
    reply(client, "unwatch", QJsonObject{{"success", true}});
}

void BridgeServer::handleChatSnapshot(quint64 client, const QJsonObject&)
{
    m_services.chat->getChatSnapshot([this, client](const QJsonObject& snapshot, const QString& error) {
        if (!error.isEmpty()) {
            reply(client, "chat_snapshot", QJsonObject{{"error", error}, {"messages", QJsonArray()}});
            return;
        }
        reply(client, "chat_snapshot", snapshot);
    });
}

void BridgeServer::handleChatStart(quint64 client, const QJsonObject& command)
{
    const int interval = command["interval"].toInt(ChatStreamService::DEFAULT_INTERVAL_MS);
    EventChannel* channel = m_services.channel;

    QJsonObject result = m_services.chat->startChatStream([channel](const QJsonObject& chat) {
        channel->post("chat_update", QJsonObject{
            {"messageCount", chat["messageCount"]},
            {"messages", chat["messages"]},
            {"timestamp", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs)}
        });
    }, interval);
    reply(client, "chat_start", result);
}

void BridgeServer::handleChatStop(quint64 client, const QJsonObject&)
{
    m_services.chat->stopChatStream();
    reply(client, "chat_stop", QJsonObject{{"success", true}});
}

void BridgeServer::handleChatStatus(quint64 client, const QJsonObject&)
{
    reply(client, "chat_status", QJsonObject{{"streaming", m_services.chat->isStreaming()}});
}

void BridgeServer::handleQuota(quint64 client, const QJsonObject&)
{
    m_services.quota->getQuota([this, client](const QJsonObject& quota) {
        reply(client, "quota", quota);
    });
}

void BridgeServer::handleQuotaStatus(quint64 client, const QJsonObject&)
{
    m_services.quota->isAvailable([this, client](const QJsonObject& status) {
        reply(client, "quota_status", status);
    });
}

void BridgeServer::handleBroadcast(quint64 client, const QJsonObject& command)
{
    QJsonObject extra;
    if (command.contains("context_summary")) {
        extra["context_summary"] = command["context_summary"];
    }
    if (command.contains("timestamp")) {
        extra["timestamp"] = command["timestamp"];
    }

    const QString type = command["type"].toString();
    const QString content = command["content"].toString();
    QJsonObject message = m_services.messages->append(type, content, extra);
    m_services.channel->post("message", message);

    BRIDGE_LOG_INFO(QString("[%1] %2").arg(message["type"].toString(), content.left(60)));
    reply(client, "broadcast", QJsonObject{{"success", true}, {"clients", clientCount()}});
}

void BridgeServer::handleMessages(quint64 client, const QJsonObject& command)
{
    const int limit = command["limit"].toInt(MessageLog::DEFAULT_LIMIT);
    reply(client, "messages", QJsonObject{
        {"messages", m_services.messages->recent(limit)},
        {"count", m_services.messages->count()}
    });
}

void BridgeServer::handleInbox(quint64 client, const QJsonObject& command)
{
    const QString message = command["message"].toString();
    if (message.isEmpty()) {
        replyError(client, "Message required");
        return;
    }

    const int count = m_services.messages->addToInbox(message);
    m_services.channel->post("inbox_updated", QJsonObject{{"count", count}});
    BRIDGE_LOG_INFO(QString("[INBOX] %1").arg(message.left(50)));
    reply(client, "inbox", QJsonObject{{"success", true}, {"inbox_count", count}});
}

void BridgeServer::handleInboxRead(quint64 client, const QJsonObject&)
{
    QJsonArray messages = m_services.messages->readInbox();
    reply(client, "inbox_read", QJsonObject{{"messages", messages}, {"count", messages.size()}});
}

void BridgeServer::handleClearMessages(quint64 client, const QJsonObject&)
{
    m_services.messages->clear();
    m_services.channel->post("messages_cleared", QJsonObject());
    reply(client, "clear_messages", QJsonObject{{"success", true}});
}
