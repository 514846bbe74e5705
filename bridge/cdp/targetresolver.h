#ifndef TARGETRESOLVER_H
#define TARGETRESOLVER_H

#include <QObject>
#include <QString>
#include <QList>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <functional>
#include <optional>

struct CdpTarget {
    QString id;
    QString title;
    QString url;
    QString type;
    QString webSocketDebuggerUrl;

    static CdpTarget fromJson(const QJsonObject& json);
    QJsonObject toJson() const;
};

// Discovers debuggable targets over the endpoint's HTTP interface.
// Nothing is cached: every resolution fetches a fresh list.
class TargetResolver : public QObject
{
    Q_OBJECT

public:
    using TargetListCallback = std::function<void(const QList<CdpTarget>& targets, const QString& error)>;
    using TargetCallback = std::function<void(const std::optional<CdpTarget>& target, const QString& error)>;
    using VersionCallback = std::function<void(const QJsonObject& version, const QString& error)>;

    static constexpr int HTTP_TIMEOUT_MS = 3000;
    static constexpr const char* SECONDARY_WINDOW_MARKER = "Launchpad";
    static constexpr const char* INSPECTOR_URL_MARKER = "devtools";

    TargetResolver(const QString& host, quint16 port, const QString& productName, QObject* parent = nullptr);

    void listTargets(TargetListCallback callback);
    void fetchVersion(VersionCallback callback);

    // No target is reported as an empty optional with an empty error when the
    // endpoint answered but exposes no page; transport failures set the error.
    void resolveEditorTarget(TargetCallback callback);

    static std::optional<CdpTarget> selectEditorTarget(const QList<CdpTarget>& targets, const QString& productName);
    static QList<CdpTarget> parseTargetList(const QByteArray& body, QString* error = nullptr);

    QString productName() const { return m_productName; }
    QString baseUrl() const;

private:
    void get(const QString& path, std::function<void(const QByteArray& body, const QString& error)> handler);

    QNetworkAccessManager* m_networkManager;
    QString m_host;
    quint16 m_port;
    QString m_productName;
};

#endif // TARGETRESOLVER_H
