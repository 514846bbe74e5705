#ifndef CDPSCRAPER_H
#define CDPSCRAPER_H

#include <QObject>
#include <QList>
#include <QPair>
#include "idescraper.h"
#include "scripts.h"
#include "../cdp/cdpsession.h"
#include "../cdp/targetresolver.h"

// IdeScraper over the debugging endpoint. Every operation resolves a fresh
// editor target and runs in its own CdpSession; nothing is shared between
// concurrent operations.
class CdpScraper : public QObject, public IdeScraper
{
    Q_OBJECT

public:
    static constexpr int SUBMIT_DELAY_MS = 50;
    static constexpr int TYPING_DELAY_MS = 100;
    static constexpr int SCREENSHOT_QUALITY = 80;

    CdpScraper(const QString& host, quint16 port, const QString& productName, QObject* parent = nullptr);

    void setSettleDelay(int ms) { m_settleDelayMs = ms; }
    QString productName() const { return m_resolver->productName(); }

    static const QStringList& knownModels();
    static QJsonArray knownModes();

    void checkAvailability(Callback<AvailabilityResult> callback) override;
    void listTargets(Callback<TargetListResult> callback) override;
    void captureScreenshot(const QString& format, int quality, Callback<ScreenshotResult> callback) override;
    void getPageMetrics(Callback<PageMetricsResult> callback) override;

    void injectText(const QString& text, bool submit, Callback<ActionResult> callback) override;
    void focusInput(Callback<ActionResult> callback) override;

    void readModelMode(Callback<ModelModeResult> callback) override;
    void setModel(const QString& model, Callback<SelectionResult> callback) override;
    void setMode(const QString& mode, Callback<SelectionResult> callback) override;
    void availableModels(Callback<OptionsResult> callback) override;
    void availableModes(Callback<OptionsResult> callback) override;

    void detectWorkspace(Callback<WorkspaceResult> callback) override;

    void detectApprovals(Callback<ApprovalResult> callback) override;
    void respondToApproval(bool approve, Callback<ActionResult> callback) override;

    void chatSnapshot(Callback<ChatSnapshotResult> callback) override;

private:
    // session is null when error is set; otherwise the task owns it and must close() it
    using SessionTask = std::function<void(CdpSession* session, const QString& error)>;
    using KeyEvent = QPair<QString, QJsonObject>;

    void withSession(bool collectContexts, SessionTask task);
    void selectOption(BridgeScripts::SelectorKind kind, const QString& requested, Callback<SelectionResult> callback);
    void dispatchSequence(CdpSession* session, QList<KeyEvent> events, std::function<void(const QString& error)> done);

    static QList<KeyEvent> enterKeyEvents();
    static QList<KeyEvent> typingEvents(const QString& text);

    TargetResolver* m_resolver;
    int m_settleDelayMs;
};

#endif // CDPSCRAPER_H
