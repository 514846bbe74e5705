#ifndef COLLABORATORS_H
#define COLLABORATORS_H

#include <QObject>
#include <QTimer>
#include <QJsonObject>
#include <QByteArray>
#include <functional>
#include "../scraper/idescraper.h"

// Services the bridge consumes but does not own. Only their interfaces
// matter to the core; the implementations below are the built-in ones.

class ChatStreamService
{
public:
    using SnapshotCallback = std::function<void(const QJsonObject& snapshot, const QString& error)>;
    using UpdateCallback = std::function<void(const QJsonObject& chat)>;

    static constexpr int DEFAULT_INTERVAL_MS = 2000;

    virtual ~ChatStreamService() = default;

    virtual void getChatSnapshot(SnapshotCallback callback) = 0;
    virtual QJsonObject startChatStream(UpdateCallback onUpdate, int intervalMs) = 0;
    virtual void stopChatStream() = 0;
    virtual bool isStreaming() const = 0;
};

class QuotaService
{
public:
    using QuotaCallback = std::function<void(const QJsonObject& result)>;

    virtual ~QuotaService() = default;

    // {available, models[]}
    virtual void getQuota(QuotaCallback callback) = 0;
    // {available}
    virtual void isAvailable(QuotaCallback callback) = 0;
};

// Polls the scraper's chat snapshot and reports only when the transcript changes
class ScraperChatStream : public QObject, public ChatStreamService
{
    Q_OBJECT

public:
    explicit ScraperChatStream(IdeScraper& scraper, QObject* parent = nullptr);

    void getChatSnapshot(SnapshotCallback callback) override;
    QJsonObject startChatStream(UpdateCallback onUpdate, int intervalMs) override;
    void stopChatStream() override;
    bool isStreaming() const override { return m_timer->isActive(); }

private:
    void poll();

    IdeScraper& m_scraper;
    QTimer* m_timer;
    UpdateCallback m_onUpdate;
    QByteArray m_lastHash;
    bool m_pollInFlight;
};

// Used when no quota backend is configured
class UnavailableQuotaService : public QuotaService
{
public:
    void getQuota(QuotaCallback callback) override;
    void isAvailable(QuotaCallback callback) override;
};

#endif // COLLABORATORS_H
