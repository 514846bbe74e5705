#ifndef BROADCASTHUB_H
#define BROADCASTHUB_H

#include <QObject>
#include <QList>
#include <QJsonObject>
#include <QDateTime>
#include "eventchannel.h"

// Anything that can receive a serialized envelope
class Subscriber
{
public:
    virtual ~Subscriber() = default;
    virtual bool isOpen() const = 0;
    virtual void send(const QString& message) = 0;
};

// Fan-out of {event, data, timestamp} envelopes to every open subscriber.
// Subscribers that are not open at publish time are skipped.
class BroadcastHub : public QObject
{
    Q_OBJECT

public:
    explicit BroadcastHub(QObject* parent = nullptr);

    void subscribe(Subscriber* subscriber);
    void unsubscribe(Subscriber* subscriber);
    int subscriberCount() const { return m_subscribers.size(); }

    // Returns how many subscribers the envelope was sent to
    int publish(const QString& kind, const QJsonObject& payload);
    int publish(const ChangeEvent& event);

    // The hub becomes the consumer of the channel's events
    void drain(EventChannel* channel);

    static QString envelope(const QString& kind, const QJsonObject& payload, const QDateTime& timestamp);

private:
    QList<Subscriber*> m_subscribers;
};

#endif // BROADCASTHUB_H
