#include "bridgelogger.h"
#include <QDateTime>
#include <QDir>
#include <QStandardPaths>
#include <QJsonDocument>
#include <QDebug>
#include <QCoreApplication>

std::unique_ptr<BridgeLogger> BridgeLogger::s_instance = nullptr;
QMutex BridgeLogger::s_instanceMutex;

BridgeLogger::~BridgeLogger() {
    closeSinks();
}

void BridgeLogger::initialize(const BridgeLoggerConfig& config) {
    QMutexLocker locker(&s_instanceMutex);

    if (s_instance) {
        qWarning() << "BridgeLogger already initialized, ignoring re-initialization";
        return;
    }

    s_instance = std::make_unique<BridgeLogger>();
    s_instance->configure(config);
}

BridgeLogger& BridgeLogger::instance() {
    QMutexLocker locker(&s_instanceMutex);

    if (!s_instance) {
        qFatal("BridgeLogger not initialized! Call BridgeLogger::initialize() first.");
    }

    return *s_instance;
}

bool BridgeLogger::isInitialized() {
    QMutexLocker locker(&s_instanceMutex);
    return s_instance != nullptr;
}

QString BridgeLogger::getDataPath() {
    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return QDir(dataPath).absoluteFilePath("MobileBridge");
}

QString BridgeLogger::getBaseLogDir() {
    return QDir(getDataPath()).absoluteFilePath("logs");
}

void BridgeLogger::configure(const BridgeLoggerConfig& config) {
    m_config = config;
    if (m_config.baseLogDir.isEmpty()) {
        m_config.baseLogDir = getBaseLogDir();
    }
    m_defaultCategory = m_config.logFiles.isEmpty() ? QString("default")
                                                     : m_config.logFiles.first().category;

    m_sessionPath = createSessionFolder();
    openSinks();
    info(QString("Logging '%1' session to %2").arg(m_config.appName, m_sessionPath));
}

QString BridgeLogger::appLogDir() const {
    return QDir(m_config.baseLogDir).absoluteFilePath(m_config.appName);
}

QString BridgeLogger::createSessionFolder() {
    QDir dir(appLogDir());

    // yyyy-MM-dd_HHmmss_p<pid> sorts chronologically by name
    QString sessionName = QString("%1_p%2")
        .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd_HHmmss"))
        .arg(QCoreApplication::applicationPid());

    if (!dir.mkpath(sessionName)) {
        qCritical() << "Failed to create log session directory:" << dir.absoluteFilePath(sessionName);
    }

    pruneSessions();
    return dir.absoluteFilePath(sessionName);
}

void BridgeLogger::pruneSessions() {
    QDir dir(appLogDir());
    QStringList sessions = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);

    while (sessions.size() > m_config.maxSessions) {
        QString oldest = sessions.takeFirst();
        if (!QDir(dir.absoluteFilePath(oldest)).removeRecursively()) {
            qWarning() << "Failed to remove old log session:" << oldest;
        }
    }
}

void BridgeLogger::openSinks() {
    QMutexLocker locker(&m_mutex);

    for (const auto& logFile : m_config.logFiles) {
        QString filePath = QDir(m_sessionPath).absoluteFilePath(logFile.name);

        Sink sink;
        sink.file = std::make_unique<QFile>(filePath);
        if (!sink.file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            qCritical() << "Failed to open log file:" << filePath << sink.file->errorString();
            continue;
        }
        sink.stream = std::make_unique<QTextStream>(sink.file.get());
        sink.jsonFormat = logFile.jsonFormat;

        m_sinks[logFile.category] = std::move(sink);
    }
}

void BridgeLogger::closeSinks() {
    QMutexLocker locker(&m_mutex);

    for (auto& [category, sink] : m_sinks) {
        sink.stream->flush();
        sink.file->close();
    }
    m_sinks.clear();
}

QString BridgeLogger::logFilePath(const QString& category) const {
    QMutexLocker locker(&m_mutex);
    auto it = m_sinks.find(category);
    return it == m_sinks.end() ? QString() : it->second.file->fileName();
}

BridgeLogger::Sink* BridgeLogger::sinkFor(const QString& category) {
    auto it = m_sinks.find(category);
    if (it == m_sinks.end()) {
        it = m_sinks.find(m_defaultCategory);
    }
    return it == m_sinks.end() ? nullptr : &it->second;
}

QString BridgeLogger::formatLine(const QString& timestamp, LogLevel level, const QString& category,
                                 const QString& message) const {
    QString line = QString("%1 [%2] ").arg(timestamp, levelName(level));
    if (category != m_defaultCategory) {
        line += QString("[%1] ").arg(category);
    }
    return line + message;
}

void BridgeLogger::log(LogLevel level, const QString& category, const QString& message) {
    log(level, category, message, QJsonObject());
}

void BridgeLogger::log(LogLevel level, const QString& category, const QString& message,
                       const QJsonObject& metadata) {
    if (level < m_config.minLevel) {
        return;
    }

    QDateTime now = QDateTime::currentDateTime();
    QMutexLocker locker(&m_mutex);

    if (m_config.consoleEnabled) {
        QTextStream err(stderr);
        QString line = formatLine(now.toString("HH:mm:ss.zzz"), level, category, message);
        if (m_config.consoleColors) {
            err << levelColor(level) << line << "\033[0m" << Qt::endl;
        } else {
            err << line << Qt::endl;
        }
    }

    Sink* sink = sinkFor(category);
    if (!sink) {
        return;
    }

    QString timestamp = now.toString("yyyy-MM-dd HH:mm:ss.zzz");
    if (sink->jsonFormat) {
        QJsonObject entry = metadata;
        entry["timestamp"] = timestamp;
        entry["level"] = levelName(level);
        entry["category"] = category;
        entry["message"] = message;
        *sink->stream << QJsonDocument(entry).toJson(QJsonDocument::Compact) << Qt::endl;
    } else {
        *sink->stream << formatLine(timestamp, level, category, message);
        if (!metadata.isEmpty()) {
            *sink->stream << " " << QJsonDocument(metadata).toJson(QJsonDocument::Compact);
        }
        *sink->stream << Qt::endl;
    }

    if (level >= LogLevel::Warning) {
        sink->stream->flush();
    }
}

QString BridgeLogger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARN";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

const char* BridgeLogger::levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "\033[36m";
        case LogLevel::Info:     return "\033[32m";
        case LogLevel::Warning:  return "\033[33m";
        case LogLevel::Error:    return "\033[31m";
        case LogLevel::Critical: return "\033[35m";
    }
    return "\033[0m";
}

void BridgeLogger::flush() {
    QMutexLocker locker(&m_mutex);

    for (auto& [category, sink] : m_sinks) {
        sink.stream->flush();
    }
}

void BridgeLogger::debug(const QString& message) {
    log(LogLevel::Debug, m_defaultCategory, message);
}

void BridgeLogger::info(const QString& message) {
    log(LogLevel::Info, m_defaultCategory, message);
}

void BridgeLogger::warning(const QString& message) {
    log(LogLevel::Warning, m_defaultCategory, message);
}

void BridgeLogger::error(const QString& message) {
    log(LogLevel::Error, m_defaultCategory, message);
}

void BridgeLogger::critical(const QString& message) {
    log(LogLevel::Critical, m_defaultCategory, message);
}
