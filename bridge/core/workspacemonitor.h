#ifndef WORKSPACEMONITOR_H
#define WORKSPACEMONITOR_H

#include <QObject>
#include <QTimer>
#include <QString>
#include "eventchannel.h"
#include "../scraper/idescraper.h"

struct WorkspaceState {
    QString currentPath;
    QString lastKnownGoodPath;
    int consecutiveFailureCount = 0;
};

// Periodically asks the scraper for the workspace path and publishes
// workspace_changed when it moves. A failed detection never resets the
// current path. The state is only touched from the poll callback.
class WorkspaceMonitor : public QObject
{
    Q_OBJECT

public:
    static constexpr int POLL_INTERVAL_MS = 5000;
    static constexpr int LOGGED_FAILURES = 3;
    static constexpr int FAILURE_LOG_EVERY = 10;

    WorkspaceMonitor(IdeScraper& scraper, EventChannel* channel, const QString& initialPath,
                     QObject* parent = nullptr);

    void start();
    void stop();
    bool isActive() const { return m_timer->isActive(); }
    bool isPolling() const { return m_pollInFlight; }

    // One reconciliation cycle; skipped when the previous one is still running
    void pollOnce();

    const WorkspaceState& state() const { return m_state; }
    QString currentPath() const { return m_state.currentPath; }

    void setInterval(int ms) { m_timer->setInterval(ms); }
    void setCaseSensitive(bool sensitive) { m_caseSensitivity = sensitive ? Qt::CaseSensitive : Qt::CaseInsensitive; }
    static Qt::CaseSensitivity platformCaseSensitivity();

    static bool shouldLogFailure(int failureCount);

signals:
    void workspaceChanged(const QString& path);
    void pollFinished();

private:
    void applyDetection(const WorkspaceResult& result);

    IdeScraper& m_scraper;
    EventChannel* m_channel;
    QTimer* m_timer;
    WorkspaceState m_state;
    Qt::CaseSensitivity m_caseSensitivity;
    bool m_pollInFlight;
};

#endif // WORKSPACEMONITOR_H
