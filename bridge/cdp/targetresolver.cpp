#include "targetresolver.h"
#include "../shared/bridgelogger.h"
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QJsonDocument>
#include <QJsonArray>
#include <QUrl>

CdpTarget CdpTarget::fromJson(const QJsonObject& json)
{
    CdpTarget target;
    target.id = json["id"].toString();
    target.title = json["title"].toString();
    target.url = json["url"].toString();
    target.type = json["type"].toString();
    target.webSocketDebuggerUrl = json["webSocketDebuggerUrl"].toString();
    return target;
}

QJsonObject CdpTarget::toJson() const
{
    return QJsonObject{
        {"id", id},
        {"title", title},
        {"url", url},
        {"type", type},
        {"webSocketDebuggerUrl", webSocketDebuggerUrl}
    };
}

TargetResolver::TargetResolver(const QString& host, quint16 port, const QString& productName, QObject* parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_host(host)
    , m_port(port)
    , m_productName(productName)
{
}

QString TargetResolver::baseUrl() const
{
    return QString("http://%1:%2").arg(m_host).arg(m_port);
}

void TargetResolver::get(const QString& path, std::function<void(const QByteArray& body, const QString& error)> handler)
{
    QNetworkRequest request(QUrl(baseUrl() + path));
    request.setTransferTimeout(HTTP_TIMEOUT_MS);

    QNetworkReply* reply = m_networkManager->get(request);
    connect(reply, &QNetworkReply::finished, this, [reply, handler]() {
        reply->deleteLater();

        if (reply->error() != QNetworkReply::NoError) {
            handler(QByteArray(), reply->errorString());
            return;
        }
        handler(reply->readAll(), QString());
    });
}

QList<CdpTarget> TargetResolver::parseTargetList(const QByteArray& body, QString* error)
{
    QList<CdpTarget> targets;
    QJsonDocument doc = QJsonDocument::fromJson(body);
    if (!doc.isArray()) {
        if (error) {
            *error = "Invalid target list format";
        }
        return targets;
    }

    const QJsonArray array = doc.array();
    for (const QJsonValue& value : array) {
        targets.append(CdpTarget::fromJson(value.toObject()));
    }
    return targets;
}

std::optional<CdpTarget> TargetResolver::selectEditorTarget(const QList<CdpTarget>& targets, const QString& productName)
{
    for (const CdpTarget& target : targets) {
        if (target.type == "page"
            && target.title.contains(productName)
            && !target.title.contains(SECONDARY_WINDOW_MARKER)
            && !target.url.contains(INSPECTOR_URL_MARKER)) {
            return target;
        }
    }

    for (const CdpTarget& target : targets) {
        if (target.type == "page") {
            return target;
        }
    }

    return std::nullopt;
}

void TargetResolver::listTargets(TargetListCallback callback)
{
    get("/json/list", [callback](const QByteArray& body, const QString& error) {
        if (!error.isEmpty()) {
            callback(QList<CdpTarget>(), error);
            return;
        }
        QString parseError;
        QList<CdpTarget> targets = parseTargetList(body, &parseError);
        callback(targets, parseError);
    });
}

void TargetResolver::fetchVersion(VersionCallback callback)
{
    get("/json/version", [callback](const QByteArray& body, const QString& error) {
        if (!error.isEmpty()) {
            callback(QJsonObject(), error);
            return;
        }
        QJsonDocument doc = QJsonDocument::fromJson(body);
        if (!doc.isObject()) {
            callback(QJsonObject(), "Invalid version response");
            return;
        }
        callback(doc.object(), QString());
    });
}

void TargetResolver::resolveEditorTarget(TargetCallback callback)
{
    QString product = m_productName;
    listTargets([callback, product](const QList<CdpTarget>& targets, const QString& error) {
        if (!error.isEmpty()) {
            callback(std::nullopt, error);
            return;
        }

        std::optional<CdpTarget> target = selectEditorTarget(targets, product);
        if (target) {
            BRIDGE_CDP_LOG(LogLevel::Debug, "Resolved editor target",
                           QJsonObject({{"id", target->id}, {"title", target->title}}));
        }
        callback(target, QString());
    });
}
