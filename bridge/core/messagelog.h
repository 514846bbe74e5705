#ifndef MESSAGELOG_H
#define MESSAGELOG_H

#include <QObject>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>

// Agent/mobile message history persisted to <dataDir>/messages.json, plus a
// volatile inbox that is emptied when read.
class MessageLog : public QObject
{
    Q_OBJECT

public:
    static constexpr int MAX_MESSAGES = 500;
    static constexpr int HISTORY_SIZE = 50;
    static constexpr int DEFAULT_LIMIT = 100;

    explicit MessageLog(const QString& dataDir, QObject* parent = nullptr);

    // A missing or unreadable file leaves the log empty
    bool load();
    bool save();

    QJsonObject append(const QString& type, const QString& content, const QJsonObject& extra = QJsonObject());
    QJsonArray recent(int limit) const;
    int count() const { return m_messages.size(); }
    void clear();

    int addToInbox(const QString& content);
    QJsonArray readInbox();
    int inboxCount() const { return m_inbox.size(); }

    QString filePath() const { return m_filePath; }

private:
    QString m_filePath;
    QJsonArray m_messages;
    QJsonArray m_inbox;
};

#endif // MESSAGELOG_H
