#include "eventchannel.h"
#include <QMetaObject>

ChangeEvent ChangeEvent::make(const QString& kind, const QJsonObject& payload)
{
    ChangeEvent event;
    event.kind = kind;
    event.payload = payload;
    event.timestamp = QDateTime::currentDateTimeUtc();
    return event;
}

EventChannel::EventChannel(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<ChangeEvent>("ChangeEvent");
}

void EventChannel::post(const ChangeEvent& event)
{
    QMetaObject::invokeMethod(this, [this, event]() {
        emit eventPosted(event);
    }, Qt::QueuedConnection);
}

void EventChannel::post(const QString& kind, const QJsonObject& payload)
{
    post(ChangeEvent::make(kind, payload));
}
