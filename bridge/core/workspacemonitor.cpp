#include "workspacemonitor.h"
#include "../shared/bridgelogger.h"
#include <QPointer>

WorkspaceMonitor::WorkspaceMonitor(IdeScraper& scraper, EventChannel* channel, const QString& initialPath,
                                   QObject* parent)
    : QObject(parent)
    , m_scraper(scraper)
    , m_channel(channel)
    , m_timer(new QTimer(this))
    , m_caseSensitivity(platformCaseSensitivity())
    , m_pollInFlight(false)
{
    m_state.currentPath = initialPath;
    m_state.lastKnownGoodPath = initialPath;

    m_timer->setInterval(POLL_INTERVAL_MS);
    connect(m_timer, &QTimer::timeout, this, &WorkspaceMonitor::pollOnce);
}

Qt::CaseSensitivity WorkspaceMonitor::platformCaseSensitivity()
{
#if defined(Q_OS_WIN) || defined(Q_OS_MACOS)
    return Qt::CaseInsensitive;
#else
    return Qt::CaseSensitive;
#endif
}

bool WorkspaceMonitor::shouldLogFailure(int failureCount)
{
    return failureCount <= LOGGED_FAILURES || failureCount % FAILURE_LOG_EVERY == 0;
}

void WorkspaceMonitor::start()
{
    if (m_timer->isActive()) {
        return;
    }

    BRIDGE_LOG_INFO(QString("Workspace polling started (every %1ms)").arg(m_timer->interval()));
    m_timer->start();
    pollOnce();
}

void WorkspaceMonitor::stop()
{
    if (m_timer->isActive()) {
        m_timer->stop();
        BRIDGE_LOG_INFO("Workspace polling stopped");
    }
}

void WorkspaceMonitor::pollOnce()
{
    if (m_pollInFlight) {
        BRIDGE_LOG_DEBUG("Workspace poll skipped, previous poll still running");
        return;
    }
    m_pollInFlight = true;

    QPointer<WorkspaceMonitor> self(this);
    m_scraper.detectWorkspace([self](const WorkspaceResult& result) {
        if (!self) {
            return;
        }
        self->applyDetection(result);
        self->m_pollInFlight = false;
        emit self->pollFinished();
    });
}

void WorkspaceMonitor::applyDetection(const WorkspaceResult& result)
{
    if (!result.found || result.path.isEmpty()) {
        m_state.consecutiveFailureCount++;
        if (shouldLogFailure(m_state.consecutiveFailureCount)) {
            BRIDGE_LOG_WARNING(QString("Workspace detection failed (%1 in a row), keeping %2%3")
                               .arg(m_state.consecutiveFailureCount)
                               .arg(m_state.currentPath)
                               .arg(result.error.isEmpty() ? QString() : QString(": %1").arg(result.error)));
        }
        return;
    }

    m_state.consecutiveFailureCount = 0;

    const QString detected = QString(result.path).replace("\\\\", "\\");
    if (QString::compare(detected, m_state.currentPath, m_caseSensitivity) == 0) {
        return;
    }

    BRIDGE_LOG_INFO(QString("Workspace changed: %1 -> %2").arg(m_state.currentPath, detected));
    m_state.currentPath = detected;
    m_state.lastKnownGoodPath = detected;

    if (m_channel) {
        m_channel->post("workspace_changed", QJsonObject{
            {"path", detected},
            {"projectName", result.projectName}
        });
    }
    emit workspaceChanged(detected);
}
