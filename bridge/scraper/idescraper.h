#ifndef IDESCRAPER_H
#define IDESCRAPER_H

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QJsonArray>
#include <QList>
#include <functional>
#include "heuristics.h"
#include "../cdp/targetresolver.h"

struct AvailabilityResult {
    bool available = false;
    QString browser;
    QString error;

    QJsonObject toJson() const;
};

struct TargetListResult {
    bool success = false;
    QList<CdpTarget> targets;
    QString error;

    QJsonObject toJson() const;
};

struct ScreenshotResult {
    bool success = false;
    QString format;
    QString data;   // base64, exactly as the endpoint returned it
    QString error;

    QJsonObject toJson() const;
};

struct PageMetricsResult {
    bool success = false;
    QJsonObject metrics;
    QString error;

    QJsonObject toJson() const;
};

// Outcome of a mutating UI action (inject, focus, approval response)
struct ActionResult {
    bool success = false;
    bool found = false;
    QString method;
    QString error;
    QJsonObject details;

    QJsonObject toJson() const;
};

struct ModelModeResult {
    bool success = false;
    BridgeHeuristics::ModelModeState state;
    QString error;
};

struct SelectionResult {
    bool success = false;
    bool found = false;             // the selector trigger was located
    QString requested;
    QString selected;
    QStringList rejectedCandidates; // only filled when nothing matched
    QString error;

    QJsonObject toJson() const;
};

struct OptionsResult {
    bool success = false;
    QJsonArray options;
    QString current;
    QString error;

    QJsonObject toJson(const QString& listKey) const;
};

struct WorkspaceResult {
    bool found = false;
    QString path;
    QString projectName;
    QString source;
    QString error;
};

struct ApprovalResult {
    bool success = false;
    BridgeHeuristics::ApprovalState state;
    QString error;

    QJsonObject toJson() const;
};

struct ChatSnapshotResult {
    bool success = false;
    QJsonArray messages;
    QString error;

    QJsonObject toJson() const;
};

// Capability interface over the IDE's rendered UI. Callers depend on this
// rather than on the protocol so the scraping rules can be swapped.
// Every callback runs exactly once; failures are reported in the result.
class IdeScraper
{
public:
    template <typename T>
    using Callback = std::function<void(const T& result)>;

    virtual ~IdeScraper() = default;

    virtual void checkAvailability(Callback<AvailabilityResult> callback) = 0;
    virtual void listTargets(Callback<TargetListResult> callback) = 0;
    virtual void captureScreenshot(const QString& format, int quality, Callback<ScreenshotResult> callback) = 0;
    virtual void getPageMetrics(Callback<PageMetricsResult> callback) = 0;

    virtual void injectText(const QString& text, bool submit, Callback<ActionResult> callback) = 0;
    virtual void focusInput(Callback<ActionResult> callback) = 0;

    virtual void readModelMode(Callback<ModelModeResult> callback) = 0;
    virtual void setModel(const QString& model, Callback<SelectionResult> callback) = 0;
    virtual void setMode(const QString& mode, Callback<SelectionResult> callback) = 0;
    virtual void availableModels(Callback<OptionsResult> callback) = 0;
    virtual void availableModes(Callback<OptionsResult> callback) = 0;

    virtual void detectWorkspace(Callback<WorkspaceResult> callback) = 0;

    virtual void detectApprovals(Callback<ApprovalResult> callback) = 0;
    virtual void respondToApproval(bool approve, Callback<ActionResult> callback) = 0;

    virtual void chatSnapshot(Callback<ChatSnapshotResult> callback) = 0;
};

#endif // IDESCRAPER_H
