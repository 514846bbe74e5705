#include "collaborators.h"
#include "../shared/bridgelogger.h"
#include <QCryptographicHash>
#include <QJsonDocument>
#include <QPointer>

ScraperChatStream::ScraperChatStream(IdeScraper& scraper, QObject* parent)
    : QObject(parent)
    , m_scraper(scraper)
    , m_timer(new QTimer(this))
    , m_pollInFlight(false)
{
    connect(m_timer, &QTimer::timeout, this, &ScraperChatStream::poll);
}

void ScraperChatStream::getChatSnapshot(SnapshotCallback callback)
{
    m_scraper.chatSnapshot([callback](const ChatSnapshotResult& result) {
        if (!result.success) {
            callback(QJsonObject(), result.error.isEmpty() ? QString("No chat found") : result.error);
            return;
        }
        callback(result.toJson(), QString());
    });
}

QJsonObject ScraperChatStream::startChatStream(UpdateCallback onUpdate, int intervalMs)
{
    m_onUpdate = std::move(onUpdate);
    m_lastHash.clear();
    m_timer->start(intervalMs > 0 ? intervalMs : DEFAULT_INTERVAL_MS);
    BRIDGE_LOG_INFO(QString("Chat stream started (every %1ms)").arg(m_timer->interval()));
    poll();
    return QJsonObject{{"success", true}, {"interval", m_timer->interval()}};
}

void ScraperChatStream::stopChatStream()
{
    if (m_timer->isActive()) {
        m_timer->stop();
        BRIDGE_LOG_INFO("Chat stream stopped");
    }
    m_onUpdate = nullptr;
}

void ScraperChatStream::poll()
{
    if (m_pollInFlight) {
        return;
    }
    m_pollInFlight = true;

    QPointer<ScraperChatStream> self(this);
    getChatSnapshot([self](const QJsonObject& snapshot, const QString& error) {
        if (!self) {
            return;
        }
        self->m_pollInFlight = false;
        if (!error.isEmpty() || !self->m_onUpdate) {
            return;
        }

        QByteArray hash = QCryptographicHash::hash(
            QJsonDocument(snapshot["messages"].toArray()).toJson(QJsonDocument::Compact),
            QCryptographicHash::Sha1);
        if (hash == self->m_lastHash) {
            return;
        }
        self->m_lastHash = hash;
        self->m_onUpdate(snapshot);
    });
}

void UnavailableQuotaService::getQuota(QuotaCallback callback)
{
    callback(QJsonObject{
        {"available", false},
        {"error", "Quota service not configured"},
        {"models", QJsonArray()}
    });
}

void UnavailableQuotaService::isAvailable(QuotaCallback callback)
{
    callback(QJsonObject{
        {"available", false},
        {"error", "Quota service not configured"}
    });
}
