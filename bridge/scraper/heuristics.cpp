#include "heuristics.h"
#include <QRegularExpression>
#include <QUrl>

namespace BridgeHeuristics {

QString normalizeLabel(const QString& text) {
    return text.simplified().toLower();
}

QStringList tokenize(const QString& text) {
    static const QRegularExpression separators("[^a-z0-9]+");
    return normalizeLabel(text).split(separators, Qt::SkipEmptyParts);
}

MatchTier matchTier(const QString& requested, const QString& candidate) {
    const QString wanted = normalizeLabel(requested);
    const QString text = normalizeLabel(candidate);
    if (wanted.isEmpty() || text.isEmpty()) {
        return MatchTier::None;
    }
    if (text == wanted) {
        return MatchTier::Exact;
    }

    const QStringList tokens = tokenize(requested);
    if (tokens.isEmpty()) {
        return MatchTier::None;
    }

    int matched = 0;
    for (const QString& token : tokens) {
        if (text.contains(token)) {
            matched++;
        }
    }
    if (matched == tokens.size()) {
        return MatchTier::AllTokens;
    }

    if (tokens.size() >= 2 && text.contains(tokens.first())) {
        int remaining = matched - 1;
        if (remaining * 2 >= tokens.size() - 1) {
            return MatchTier::Relaxed;
        }
    }

    return MatchTier::None;
}

CandidateMatch selectCandidate(const QString& requested, const QStringList& candidates) {
    CandidateMatch best;
    for (int i = 0; i < candidates.size(); ++i) {
        MatchTier tier = matchTier(requested, candidates.at(i));
        if (tier > best.tier) {
            best.index = i;
            best.tier = tier;
            if (tier == MatchTier::Exact) {
                break;
            }
        }
    }
    return best;
}

int selectModeCandidate(const QString& requestedMode, const QStringList& candidates) {
    const QString wanted = normalizeLabel(requestedMode);
    if (wanted.isEmpty()) {
        return -1;
    }

    for (int i = 0; i < candidates.size(); ++i) {
        if (normalizeLabel(candidates.at(i)) == wanted) {
            return i;
        }
    }
    for (int i = 0; i < candidates.size(); ++i) {
        if (normalizeLabel(candidates.at(i)).contains(wanted)) {
            return i;
        }
    }
    return -1;
}

QJsonObject ModelModeState::toJson() const {
    return QJsonObject{
        {"model", model},
        {"mode", mode}
    };
}

bool isModelLabel(const QString& text) {
    static const QRegularExpression vendor("^(claude|gemini|gpt)", QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression variant("(opus|sonnet|flash|pro|thinking|high|low|medium)",
                                            QRegularExpression::CaseInsensitiveOption);
    return vendor.match(text).hasMatch() && variant.match(text).hasMatch();
}

bool isModeLabel(const QString& text) {
    static const QRegularExpression mode("^(planning|fast)$", QRegularExpression::CaseInsensitiveOption);
    return mode.match(text).hasMatch();
}

ModelModeState classifyModelMode(const QStringList& texts) {
    ModelModeState state;

    for (const QString& raw : texts) {
        const QString text = raw.trimmed();
        if (text.length() < 4 || text.length() > 50) {
            continue;
        }
        if (!state.modelFound && isModelLabel(text)) {
            state.model = text;
            state.modelFound = true;
        }
        if (!state.modeFound && isModeLabel(text)) {
            state.mode = text;
            state.modeFound = true;
        }
        if (state.modelFound && state.modeFound) {
            break;
        }
    }

    if (!state.modelFound) {
        state.model = "Unknown";
    }
    if (!state.modeFound) {
        state.mode = "Unknown";
    }
    return state;
}

QString parseProjectAnchor(const QString& windowTitle, const QString& productName) {
    if (productName.isEmpty()) {
        return QString();
    }
    const QRegularExpression pattern(
        QString("^([^-]+)\\s*-\\s*%1").arg(QRegularExpression::escape(productName)));
    QRegularExpressionMatch match = pattern.match(windowTitle);
    if (!match.hasMatch()) {
        return QString();
    }
    return match.captured(1).trimmed();
}

static QString cutAtDelimiters(const QString& text, const QStringList& delimiters) {
    int end = text.length();
    for (const QString& delimiter : delimiters) {
        int idx = text.indexOf(delimiter);
        if (idx > 0 && idx < end) {
            end = idx;
        }
    }
    return text.left(end).trimmed();
}

std::optional<PathSignal> extractPathFromLabel(const QString& label) {
    if (label.length() < 5) {
        return std::nullopt;
    }

    // A drive letter must start a token and be followed by a separator
    static const QRegularExpression drive("(?:^|[^A-Za-z0-9])([A-Za-z]:[\\\\/])");
    QRegularExpressionMatch match = drive.match(label);
    if (match.hasMatch()) {
        const QString path = cutAtDelimiters(label.mid(match.capturedStart(1)),
                                             {",", ";", " - "});
        return PathSignal{path, true, "tab"};
    }

    static const QStringList unixRoots = {"/home/", "/Users/", "/var/", "/opt/"};
    for (const QString& root : unixRoots) {
        int idx = label.indexOf(root);
        if (idx >= 0) {
            const QString path = cutAtDelimiters(label.mid(idx),
                                                 {",", ";", " - ", "'", "\""});
            return PathSignal{path, false, "tab"};
        }
    }

    return std::nullopt;
}

std::optional<PathSignal> decodeFileUri(const QString& uri) {
    static const QString scheme = "file:///";
    if (!uri.startsWith(scheme)) {
        return std::nullopt;
    }

    // Keep the slash after the authority so POSIX paths stay absolute
    QString decoded = QUrl::fromPercentEncoding(uri.mid(scheme.length() - 1).toUtf8());
    if (decoded.length() < 2 || decoded.contains(QChar::ReplacementCharacter)) {
        return std::nullopt;
    }

    static const QRegularExpression windowsDrive("^/[A-Za-z]:");
    if (windowsDrive.match(decoded).hasMatch()) {
        decoded = decoded.mid(1).replace('/', '\\');
        return PathSignal{decoded, true, "data-uri"};
    }
    return PathSignal{decoded, false, "data-uri"};
}

std::optional<PathSignal> findPathSignal(const QStringList& labels, const QStringList& uris) {
    for (const QString& uri : uris) {
        if (auto signal = decodeFileUri(uri)) {
            return signal;
        }
    }
    for (const QString& label : labels) {
        if (auto signal = extractPathFromLabel(label)) {
            return signal;
        }
    }
    return std::nullopt;
}

static QString joinPath(const QStringList& parts, bool isWindows) {
    if (isWindows) {
        if (parts.isEmpty()) {
            return QString();
        }
        return parts.first() + QLatin1Char('\\') + parts.mid(1).join(QLatin1Char('\\'));
    }
    return QLatin1Char('/') + parts.join(QLatin1Char('/'));
}

QString inferWorkspaceRoot(const PathSignal& signal, const QString& projectAnchor) {
    static const QRegularExpression windowsSeparators("[\\\\/]+");
    static const QRegularExpression posixSeparators("/+");

    const QStringList parts = signal.path.split(
        signal.isWindows ? windowsSeparators : posixSeparators, Qt::SkipEmptyParts);
    if (parts.isEmpty()) {
        return QString();
    }

    if (!projectAnchor.isEmpty()) {
        for (int i = 0; i < parts.size(); ++i) {
            if (parts.at(i).compare(projectAnchor, Qt::CaseInsensitive) == 0) {
                return joinPath(parts.mid(0, i + 1), signal.isWindows);
            }
        }
    }

    return joinPath(parts.mid(0, parts.size() - 1), signal.isWindows);
}

QString normalizeDetectedPath(const QString& path) {
    QString normalized = path;
    return normalized.replace("\\\\", "\\");
}

QJsonObject ApprovalState::toJson() const {
    auto affordance = [](const std::optional<QString>& text) -> QJsonValue {
        if (!text) {
            return QJsonValue(QJsonValue::Null);
        }
        return QJsonObject{{"text", *text}, {"found", true}};
    };

    return QJsonObject{
        {"pending", pending},
        {"count", count},
        {"approveButton", affordance(approveAffordance)},
        {"rejectButton", affordance(rejectAffordance)}
    };
}

const QStringList& approveKeywords() {
    static const QStringList keywords = {"run", "accept", "approve", "yes", "confirm", "allow"};
    return keywords;
}

const QStringList& rejectKeywords() {
    static const QStringList keywords = {"cancel", "reject", "no", "deny", "skip"};
    return keywords;
}

int findAffordance(const QStringList& labels, bool approve) {
    const QStringList& keywords = approve ? approveKeywords() : rejectKeywords();
    for (int i = 0; i < labels.size(); ++i) {
        const QString text = normalizeLabel(labels.at(i));
        if (text.isEmpty() || text.length() >= MAX_AFFORDANCE_LABEL_LENGTH) {
            continue;
        }
        for (const QString& keyword : keywords) {
            if (text.contains(keyword)) {
                return i;
            }
        }
    }
    return -1;
}

ApprovalState detectApproval(const QString& bodyText, const QStringList& labels) {
    static const QRegularExpression stepRequiresInput("(\\d+)\\s*step.*requires.*input",
                                                      QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression suggestedSendingInput("suggested.*sending.*input.*command",
                                                          QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression sendCommandInput("send.*command.*input",
                                                     QRegularExpression::CaseInsensitiveOption);

    ApprovalState state;

    QRegularExpressionMatch stepMatch = stepRequiresInput.match(bodyText);
    state.pending = stepMatch.hasMatch()
        || suggestedSendingInput.match(bodyText).hasMatch()
        || sendCommandInput.match(bodyText).hasMatch();

    if (!state.pending) {
        return state;
    }

    state.count = 1;
    if (stepMatch.hasMatch()) {
        bool ok = false;
        int count = stepMatch.captured(1).toInt(&ok);
        if (ok) {
            state.count = count;
        }
    }

    int approveIndex = findAffordance(labels, true);
    if (approveIndex >= 0) {
        state.approveAffordance = normalizeLabel(labels.at(approveIndex));
    }
    int rejectIndex = findAffordance(labels, false);
    if (rejectIndex >= 0) {
        state.rejectAffordance = normalizeLabel(labels.at(rejectIndex));
    }

    return state;
}

} // namespace BridgeHeuristics
