#ifndef FILECHANGEWATCHER_H
#define FILECHANGEWATCHER_H

#include <QObject>
#include <QTimer>
#include <QString>
#include "eventchannel.h"

class QFileSystemWatcher;

// Watches one directory at a time. Raw change notifications restart a
// debounce timer and a single file_changed event is posted once it expires.
class FileChangeWatcher : public QObject
{
    Q_OBJECT

public:
    static constexpr int DEBOUNCE_MS = 300;

    explicit FileChangeWatcher(EventChannel* channel, QObject* parent = nullptr);
    ~FileChangeWatcher();

    // Replaces any previous watch. Returns false if the directory cannot be watched.
    bool watch(const QString& path);
    void unwatch();

    bool isWatching() const { return m_watcher != nullptr; }
    QString watchedPath() const { return m_path; }

    void setDebounceInterval(int ms) { m_debounceTimer->setInterval(ms); }

    // Entry point for raw OS notifications
    void notifyRawChange(const QString& type, const QString& path);

signals:
    void fileChanged(const QJsonObject& change);

private slots:
    void onDirectoryChanged(const QString& path);
    void onFileChanged(const QString& path);
    void onDebounceElapsed();

private:
    void watchEntries();

    EventChannel* m_channel;
    QFileSystemWatcher* m_watcher;
    QTimer* m_debounceTimer;
    QString m_path;
    QString m_lastType;
    QString m_lastFile;
};

#endif // FILECHANGEWATCHER_H
