#include "cdpsession.h"
#include "../shared/bridgelogger.h"
#include <QTimer>
#include <QUrl>

CdpSession::CdpSession(const CdpTarget& target, QObject* parent)
    : QObject(parent)
    , m_target(target)
    , m_connection(new CdpConnection(this))
    , m_settleDelayMs(CONTEXT_SETTLE_MS)
    , m_closed(false)
{
    connect(m_connection, &CdpConnection::notification, this, &CdpSession::onNotification);
}

CdpSession::~CdpSession()
{
}

void CdpSession::start(ReadyCallback onReady, bool collectContexts)
{
    if (m_target.webSocketDebuggerUrl.isEmpty()) {
        onReady(QString("Target %1 has no debugger endpoint").arg(m_target.id));
        return;
    }

    // Exactly one of opened/failed fires; the shared flag keeps onReady single-shot
    auto done = std::make_shared<bool>(false);

    connect(m_connection, &CdpConnection::failed, this, [onReady, done](const QString& error) {
        if (*done) {
            return;
        }
        *done = true;
        onReady(error);
    });

    connect(m_connection, &CdpConnection::opened, this, [this, onReady, done, collectContexts]() {
        if (*done) {
            return;
        }
        if (!collectContexts) {
            *done = true;
            onReady(QString());
            return;
        }

        m_connection->call("Runtime.enable", QJsonObject(), CdpConnection::READ_TIMEOUT_MS,
            [this, onReady, done](const QJsonObject&, const QString& error) {
                if (*done) {
                    return;
                }
                if (!error.isEmpty()) {
                    *done = true;
                    onReady(QString("Runtime.enable failed: %1").arg(error));
                    return;
                }
                QTimer::singleShot(m_settleDelayMs, this, [this, onReady, done]() {
                    if (*done) {
                        return;
                    }
                    *done = true;
                    onReady(m_closed ? QString("Session closed") : QString());
                });
            });
    });

    m_connection->open(QUrl(m_target.webSocketDebuggerUrl));
}

void CdpSession::close()
{
    if (m_closed) {
        return;
    }
    m_closed = true;
    m_connection->close();
    deleteLater();
}

void CdpSession::onNotification(const QString& method, const QJsonObject& params)
{
    if (method == "Runtime.executionContextCreated") {
        int id = params["context"].toObject()["id"].toInt();
        if (id != 0 && !m_contexts.contains(id)) {
            m_contexts.append(id);
        }
    } else if (method == "Runtime.executionContextDestroyed") {
        m_contexts.removeAll(params["executionContextId"].toInt());
    } else if (method == "Runtime.executionContextsCleared") {
        m_contexts.clear();
    }
}

void CdpSession::call(const QString& method, const QJsonObject& params, int timeoutMs, ResponseCallback callback)
{
    m_connection->call(method, params, timeoutMs, std::move(callback));
}

void CdpSession::evaluateInContext(int contextId, const QString& script, int timeoutMs, ValueCallback callback)
{
    QJsonObject params{
        {"expression", script},
        {"returnByValue", true},
        {"awaitPromise", true}
    };
    if (contextId != 0) {
        params["contextId"] = contextId;
    }

    m_connection->call("Runtime.evaluate", params, timeoutMs,
        [callback](const QJsonObject& result, const QString& error) {
            if (!error.isEmpty()) {
                callback(QJsonValue(), error);
                return;
            }
            if (result.contains("exceptionDetails")) {
                QJsonObject details = result["exceptionDetails"].toObject();
                QString description = details["exception"].toObject()["description"].toString();
                if (description.isEmpty()) {
                    description = details["text"].toString();
                }
                callback(QJsonValue(), QString("Script error: %1").arg(description));
                return;
            }

            QJsonValue value = result["result"].toObject().value("value");
            callback(value.isUndefined() ? QJsonValue(QJsonValue::Null) : value, QString());
        });
}

bool CdpSession::defaultPredicate(const QJsonValue& value)
{
    if (value.isNull() || value.isUndefined()) {
        return false;
    }
    if (value.isObject()) {
        QJsonObject object = value.toObject();
        if (object.contains("found")) {
            return object["found"].toBool();
        }
    }
    return true;
}

void CdpSession::evaluateAcrossContexts(const QString& script, int timeoutMs, EvaluationCallback callback)
{
    evaluateAcrossContexts(script, timeoutMs, &CdpSession::defaultPredicate, std::move(callback));
}

void CdpSession::evaluateAcrossContexts(const QString& script, int timeoutMs, Predicate predicate, EvaluationCallback callback)
{
    auto sweep = std::make_shared<Sweep>();
    sweep->script = script;
    sweep->timeoutMs = timeoutMs;
    sweep->predicate = std::move(predicate);
    sweep->callback = std::move(callback);
    sweep->contexts = m_contexts;
    evaluateNext(sweep);
}

void CdpSession::evaluateNext(std::shared_ptr<Sweep> sweep)
{
    if (sweep->index >= sweep->contexts.size()) {
        sweep->callback(std::nullopt);
        return;
    }

    int contextId = sweep->contexts.at(sweep->index++);
    evaluateInContext(contextId, sweep->script, sweep->timeoutMs,
        [this, sweep, contextId](const QJsonValue& value, const QString& error) {
            if (!error.isEmpty()) {
                BRIDGE_CDP_LOG(LogLevel::Debug, "Context evaluation failed",
                               QJsonObject({{"contextId", contextId}, {"error", error}}));
            } else if (sweep->predicate(value)) {
                ContextResult result;
                result.value = value;
                result.contextId = contextId;
                sweep->callback(result);
                return;
            }
            evaluateNext(sweep);
        });
}
