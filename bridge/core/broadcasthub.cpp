#include "broadcasthub.h"
#include "../shared/bridgelogger.h"
#include <QJsonDocument>

BroadcastHub::BroadcastHub(QObject* parent)
    : QObject(parent)
{
}

void BroadcastHub::subscribe(Subscriber* subscriber)
{
    if (subscriber && !m_subscribers.contains(subscriber)) {
        m_subscribers.append(subscriber);
    }
}

void BroadcastHub::unsubscribe(Subscriber* subscriber)
{
    m_subscribers.removeAll(subscriber);
}

QString BroadcastHub::envelope(const QString& kind, const QJsonObject& payload, const QDateTime& timestamp)
{
    QJsonObject json{
        {"event", kind},
        {"data", payload},
        {"timestamp", timestamp.toString(Qt::ISODateWithMs)}
    };
    return QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact));
}

int BroadcastHub::publish(const QString& kind, const QJsonObject& payload)
{
    return publish(ChangeEvent::make(kind, payload));
}

int BroadcastHub::publish(const ChangeEvent& event)
{
    const QString message = envelope(event.kind, event.payload, event.timestamp);

    // A send may close a socket and unsubscribe it; iterate over a snapshot
    const QList<Subscriber*> snapshot = m_subscribers;
    int delivered = 0;
    for (Subscriber* subscriber : snapshot) {
        if (!m_subscribers.contains(subscriber) || !subscriber->isOpen()) {
            continue;
        }
        subscriber->send(message);
        ++delivered;
    }

    BRIDGE_LOG_DEBUG(QString("Broadcast '%1' to %2 subscriber(s)").arg(event.kind).arg(delivered));
    return delivered;
}

void BroadcastHub::drain(EventChannel* channel)
{
    connect(channel, &EventChannel::eventPosted, this, [this](const ChangeEvent& event) {
        publish(event);
    });
}
