#ifndef CDPSESSION_H
#define CDPSESSION_H

#include <QObject>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <functional>
#include <memory>
#include <optional>
#include "cdpconnection.h"
#include "targetresolver.h"

// A single logical operation against one target: opens a connection,
// learns the target's execution contexts and evaluates scripts in them.
// The owner calls close() when done; the session then deletes itself.
class CdpSession : public QObject
{
    Q_OBJECT

public:
    using ResponseCallback = CdpConnection::ResponseCallback;
    using ReadyCallback = std::function<void(const QString& error)>;
    using ValueCallback = std::function<void(const QJsonValue& value, const QString& error)>;
    using Predicate = std::function<bool(const QJsonValue& value)>;

    struct ContextResult {
        QJsonValue value;
        int contextId = 0;
    };
    using EvaluationCallback = std::function<void(const std::optional<ContextResult>& result)>;

    static constexpr int CONTEXT_SETTLE_MS = 500;

    explicit CdpSession(const CdpTarget& target, QObject* parent = nullptr);
    ~CdpSession();

    // Opens the connection. With collectContexts the session enables the
    // Runtime domain and waits for context notifications to settle first.
    void start(ReadyCallback onReady, bool collectContexts = true);
    void close();

    const CdpTarget& target() const { return m_target; }
    QList<int> contexts() const { return m_contexts; }
    void setSettleDelay(int ms) { m_settleDelayMs = ms; }

    void call(const QString& method, const QJsonObject& params, int timeoutMs, ResponseCallback callback);

    // contextId 0 evaluates in the target's default context
    void evaluateInContext(int contextId, const QString& script, int timeoutMs, ValueCallback callback);

    // First result satisfying predicate, in context discovery order. Failures in
    // one context are logged and skipped; no match at all yields std::nullopt.
    void evaluateAcrossContexts(const QString& script, int timeoutMs, Predicate predicate, EvaluationCallback callback);
    void evaluateAcrossContexts(const QString& script, int timeoutMs, EvaluationCallback callback);

    // Non-null, and when the value is an object carrying "found", found is truthy
    static bool defaultPredicate(const QJsonValue& value);

private slots:
    void onNotification(const QString& method, const QJsonObject& params);

private:
    struct Sweep {
        QString script;
        int timeoutMs = 0;
        Predicate predicate;
        EvaluationCallback callback;
        QList<int> contexts;
        int index = 0;
    };
    void evaluateNext(std::shared_ptr<Sweep> sweep);

    CdpTarget m_target;
    CdpConnection* m_connection;
    QList<int> m_contexts;
    int m_settleDelayMs;
    bool m_closed;
};

#endif // CDPSESSION_H
