#include "filechangewatcher.h"
#include "../shared/bridgelogger.h"
#include <QFileSystemWatcher>
#include <QFileInfo>
#include <QDir>
#include <QDateTime>

FileChangeWatcher::FileChangeWatcher(EventChannel* channel, QObject* parent)
    : QObject(parent)
    , m_channel(channel)
    , m_watcher(nullptr)
    , m_debounceTimer(new QTimer(this))
{
    m_debounceTimer->setSingleShot(true);
    m_debounceTimer->setInterval(DEBOUNCE_MS);
    connect(m_debounceTimer, &QTimer::timeout, this, &FileChangeWatcher::onDebounceElapsed);
}

FileChangeWatcher::~FileChangeWatcher()
{
    unwatch();
}

bool FileChangeWatcher::watch(const QString& path)
{
    unwatch();

    QFileInfo info(path);
    if (!info.exists() || !info.isDir()) {
        BRIDGE_LOG_WARNING(QString("Cannot watch %1: not a directory").arg(path));
        return false;
    }

    m_path = info.absoluteFilePath();
    m_watcher = new QFileSystemWatcher(this);
    connect(m_watcher, &QFileSystemWatcher::directoryChanged,
            this, &FileChangeWatcher::onDirectoryChanged);
    connect(m_watcher, &QFileSystemWatcher::fileChanged,
            this, &FileChangeWatcher::onFileChanged);

    if (!m_watcher->addPath(m_path)) {
        BRIDGE_LOG_WARNING(QString("Failed to add file watcher for: %1").arg(m_path));
        unwatch();
        return false;
    }
    watchEntries();

    BRIDGE_LOG_INFO(QString("Watching %1").arg(m_path));
    return true;
}

void FileChangeWatcher::unwatch()
{
    m_debounceTimer->stop();
    if (m_watcher) {
        m_watcher->deleteLater();
        m_watcher = nullptr;
        BRIDGE_LOG_INFO(QString("Stopped watching %1").arg(m_path));
    }
    m_path.clear();
    m_lastType.clear();
    m_lastFile.clear();
}

void FileChangeWatcher::watchEntries()
{
    // Directory watches miss in-place edits, so the files are watched too
    QDir dir(m_path);
    const QStringList entries = dir.entryList(QDir::Files | QDir::NoDotAndDotDot);
    QStringList paths;
    for (const QString& entry : entries) {
        const QString filePath = dir.absoluteFilePath(entry);
        if (!m_watcher->files().contains(filePath)) {
            paths.append(filePath);
        }
    }
    if (!paths.isEmpty()) {
        m_watcher->addPaths(paths);
    }
}

void FileChangeWatcher::onDirectoryChanged(const QString& path)
{
    if (m_watcher) {
        watchEntries();
    }
    notifyRawChange("rename", path);
}

void FileChangeWatcher::onFileChanged(const QString& path)
{
    notifyRawChange("change", path);
}

void FileChangeWatcher::notifyRawChange(const QString& type, const QString& path)
{
    if (m_path.isEmpty()) {
        return;
    }
    m_lastType = type;
    m_lastFile = path;
    m_debounceTimer->start();
}

void FileChangeWatcher::onDebounceElapsed()
{
    if (m_path.isEmpty()) {
        return;
    }

    QString filename = QDir(m_path).relativeFilePath(m_lastFile);
    if (filename == ".") {
        filename.clear();
    }

    QJsonObject change{
        {"type", m_lastType},
        {"filename", filename},
        {"folder", m_path},
        {"timestamp", QDateTime::currentMSecsSinceEpoch()}
    };

    if (m_channel) {
        m_channel->post("file_changed", change);
    }
    emit fileChanged(change);
}
