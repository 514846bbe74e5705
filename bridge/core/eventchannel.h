#ifndef EVENTCHANNEL_H
#define EVENTCHANNEL_H

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <QDateTime>

struct ChangeEvent {
    QString kind;
    QJsonObject payload;
    QDateTime timestamp;

    static ChangeEvent make(const QString& kind, const QJsonObject& payload);
};

// Outbound queue between producers (workspace monitor, file watcher, chat
// forwarder, command handlers) and the broadcast hub. Producers only post;
// delivery happens on a later event-loop turn.
class EventChannel : public QObject
{
    Q_OBJECT

public:
    explicit EventChannel(QObject* parent = nullptr);

    void post(const ChangeEvent& event);
    void post(const QString& kind, const QJsonObject& payload);

signals:
    void eventPosted(const ChangeEvent& event);
};

Q_DECLARE_METATYPE(ChangeEvent)

#endif // EVENTCHANNEL_H
