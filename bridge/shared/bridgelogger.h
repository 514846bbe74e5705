#ifndef BRIDGELOGGER_H
#define BRIDGELOGGER_H

#include <QString>
#include <QJsonObject>
#include <QVector>
#include <QMutex>
#include <QFile>
#include <QTextStream>
#include <memory>
#include <unordered_map>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Critical = 4
};

struct BridgeLoggerConfig {
    QString appName;                    // Session folders live under <baseLogDir>/<appName>
    QString baseLogDir;                 // Default: <app data>/MobileBridge/logs
    int maxSessions = 5;

    struct LogFile {
        QString name;                   // e.g. "bridge.log", "cdp.log"
        QString category;
        bool jsonFormat = false;        // JSONL, metadata merged into each entry
    };
    QVector<LogFile> logFiles;          // First entry is the default category

    bool consoleEnabled = true;
    bool consoleColors = true;
    LogLevel minLevel = LogLevel::Debug;
};

class BridgeLogger {
public:
    static void initialize(const BridgeLoggerConfig& config);
    static BridgeLogger& instance();
    static bool isInitialized();

    static QString getDataPath();
    static QString getBaseLogDir();

    void log(LogLevel level, const QString& category, const QString& message);
    void log(LogLevel level, const QString& category, const QString& message,
             const QJsonObject& metadata);

    // Default category
    void debug(const QString& message);
    void info(const QString& message);
    void warning(const QString& message);
    void error(const QString& message);
    void critical(const QString& message);

    QString currentSessionPath() const { return m_sessionPath; }
    QString logFilePath(const QString& category) const;

    void flush();

    BridgeLogger() = default;
    ~BridgeLogger();

private:
    struct Sink {
        std::unique_ptr<QFile> file;
        std::unique_ptr<QTextStream> stream;
        bool jsonFormat = false;
    };

    void configure(const BridgeLoggerConfig& config);
    QString appLogDir() const;
    QString createSessionFolder();
    void pruneSessions();
    void openSinks();
    void closeSinks();
    Sink* sinkFor(const QString& category);
    QString formatLine(const QString& timestamp, LogLevel level, const QString& category,
                       const QString& message) const;

    static QString levelName(LogLevel level);
    static const char* levelColor(LogLevel level);

    BridgeLoggerConfig m_config;
    QString m_sessionPath;
    QString m_defaultCategory;
    mutable QMutex m_mutex;
    std::unordered_map<QString, Sink> m_sinks;

    static std::unique_ptr<BridgeLogger> s_instance;
    static QMutex s_instanceMutex;
};

#define BRIDGE_LOG_DEBUG(msg) BridgeLogger::instance().debug(msg)
#define BRIDGE_LOG_INFO(msg) BridgeLogger::instance().info(msg)
#define BRIDGE_LOG_WARNING(msg) BridgeLogger::instance().warning(msg)
#define BRIDGE_LOG_ERROR(msg) BridgeLogger::instance().error(msg)
#define BRIDGE_LOG_CRITICAL(msg) BridgeLogger::instance().critical(msg)

// Protocol traffic goes to its own category so bridge.log stays readable
#define BRIDGE_CDP_LOG(level, msg, meta) BridgeLogger::instance().log(level, "cdp", msg, meta)

#endif // BRIDGELOGGER_H
