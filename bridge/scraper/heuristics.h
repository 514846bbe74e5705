#ifndef BRIDGE_HEURISTICS_H
#define BRIDGE_HEURISTICS_H

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <optional>

// Text heuristics applied to data scraped from the IDE's rendered UI.
// Everything here is pure so matching rules can change without touching
// the protocol code.
namespace BridgeHeuristics {

    // Candidate matching, strongest tier first
    enum class MatchTier {
        None = 0,
        Relaxed = 1,    // family token plus at least half of the remaining tokens
        AllTokens = 2,  // every token of the request appears in the candidate
        Exact = 3       // normalized text equality
    };

    struct CandidateMatch {
        int index = -1;
        MatchTier tier = MatchTier::None;
        bool isMatch() const { return index >= 0; }
    };

    QString normalizeLabel(const QString& text);
    QStringList tokenize(const QString& text);

    MatchTier matchTier(const QString& requested, const QString& candidate);

    // Highest tier over all candidates wins; ties go to the earliest candidate
    CandidateMatch selectCandidate(const QString& requested, const QStringList& candidates);

    // Exact label first, otherwise the first candidate containing the mode name
    int selectModeCandidate(const QString& requestedMode, const QStringList& candidates);

    struct ModelModeState {
        QString model;
        QString mode;
        bool modelFound = false;
        bool modeFound = false;

        QJsonObject toJson() const;
    };

    bool isModelLabel(const QString& text);
    bool isModeLabel(const QString& text);
    ModelModeState classifyModelMode(const QStringList& texts);

    struct PathSignal {
        QString path;
        bool isWindows = false;
        QString source;  // "tab" or "data-uri"
    };

    // "Demo - Antigravity - index.ts" with product "Antigravity" yields "Demo"
    QString parseProjectAnchor(const QString& windowTitle, const QString& productName);

    std::optional<PathSignal> extractPathFromLabel(const QString& label);
    std::optional<PathSignal> decodeFileUri(const QString& uri);

    // File URIs are preferred over paths embedded in labels
    std::optional<PathSignal> findPathSignal(const QStringList& labels, const QStringList& uris);

    QString inferWorkspaceRoot(const PathSignal& signal, const QString& projectAnchor);

    // Collapses doubled backslashes left over from escaped labels
    QString normalizeDetectedPath(const QString& path);

    struct ApprovalState {
        bool pending = false;
        int count = 0;
        std::optional<QString> approveAffordance;
        std::optional<QString> rejectAffordance;

        QJsonObject toJson() const;
    };

    const QStringList& approveKeywords();
    const QStringList& rejectKeywords();

    ApprovalState detectApproval(const QString& bodyText, const QStringList& labels);

    // Index of the first short label matching the approve or reject keyword set, -1 if none
    int findAffordance(const QStringList& labels, bool approve);

    constexpr int MAX_AFFORDANCE_LABEL_LENGTH = 20;
}

#endif // BRIDGE_HEURISTICS_H
