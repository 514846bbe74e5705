#include "messagelog.h"
#include "../shared/bridgelogger.h"
#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QDateTime>

static QString nowIso()
{
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

MessageLog::MessageLog(const QString& dataDir, QObject* parent)
    : QObject(parent)
    , m_filePath(QDir(dataDir).absoluteFilePath("messages.json"))
{
}

bool MessageLog::load()
{
    QFile file(m_filePath);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        BRIDGE_LOG_WARNING(QString("Failed to open %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        BRIDGE_LOG_WARNING(QString("Ignoring malformed message log %1: %2")
                           .arg(m_filePath, parseError.errorString()));
        m_messages = QJsonArray();
        return false;
    }

    m_messages = doc.array();
    while (m_messages.size() > MAX_MESSAGES) {
        m_messages.removeFirst();
    }
    BRIDGE_LOG_INFO(QString("Loaded %1 message(s) from %2").arg(m_messages.size()).arg(m_filePath));
    return true;
}

bool MessageLog::save()
{
    while (m_messages.size() > MAX_MESSAGES) {
        m_messages.removeFirst();
    }

    QDir().mkpath(QFileInfo(m_filePath).absolutePath());
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        BRIDGE_LOG_WARNING(QString("Failed to write %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }
    file.write(QJsonDocument(m_messages).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        BRIDGE_LOG_WARNING(QString("Failed to commit %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }
    return true;
}

QJsonObject MessageLog::append(const QString& type, const QString& content, const QJsonObject& extra)
{
    QJsonObject message = extra;
    message["type"] = type.isEmpty() ? QString("agent") : type;
    message["content"] = content;
    if (!message.contains("timestamp") || message["timestamp"].toString().isEmpty()) {
        message["timestamp"] = nowIso();
    }

    m_messages.append(message);
    save();
    return message;
}

QJsonArray MessageLog::recent(int limit) const
{
    if (limit <= 0 || limit >= m_messages.size()) {
        return m_messages;
    }
    QJsonArray tail;
    for (int i = m_messages.size() - limit; i < m_messages.size(); ++i) {
        tail.append(m_messages.at(i));
    }
    return tail;
}

void MessageLog::clear()
{
    m_messages = QJsonArray();
    save();
}

int MessageLog::addToInbox(const QString& content)
{
    m_inbox.append(QJsonObject{
        {"content", content},
        {"from", "mobile"},
        {"timestamp", nowIso()}
    });
    return m_inbox.size();
}

QJsonArray MessageLog::readInbox()
{
    QJsonArray messages = m_inbox;
    m_inbox = QJsonArray();
    return messages;
}
