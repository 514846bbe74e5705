#include "cdpscraper.h"
#include "../shared/bridgelogger.h"
#include <QTimer>

using namespace BridgeHeuristics;

static QStringList toStringList(const QJsonValue& value)
{
    QStringList list;
    const QJsonArray array = value.toArray();
    for (const QJsonValue& item : array) {
        list.append(item.toString());
    }
    return list;
}

static QString lastPathSegment(const QString& path)
{
    QString trimmed = path;
    while (trimmed.size() > 1 && (trimmed.endsWith('/') || trimmed.endsWith('\\'))) {
        trimmed.chop(1);
    }
    int cut = qMax(trimmed.lastIndexOf('/'), trimmed.lastIndexOf('\\'));
    return trimmed.mid(cut + 1);
}

CdpScraper::CdpScraper(const QString& host, quint16 port, const QString& productName, QObject* parent)
    : QObject(parent)
    , m_resolver(new TargetResolver(host, port, productName, this))
    , m_settleDelayMs(CdpSession::CONTEXT_SETTLE_MS)
{
}

const QStringList& CdpScraper::knownModels()
{
    static const QStringList models = {
        "Gemini 3 Pro (High)",
        "Gemini 3 Pro (Low)",
        "Gemini 3 Flash",
        "Claude Sonnet 4.5",
        "Claude Sonnet 4.5 (Thinking)",
        "Claude Opus 4.5 (Thinking)",
        "GPT-OSS 120B (Medium)"
    };
    return models;
}

QJsonArray CdpScraper::knownModes()
{
    return QJsonArray{
        QJsonObject{{"name", "Planning"},
                    {"description", "Agent can plan before executing. Use for deep research, complex tasks."}},
        QJsonObject{{"name", "Fast"},
                    {"description", "Agent will execute tasks directly. Use for simple tasks."}}
    };
}

void CdpScraper::withSession(bool collectContexts, SessionTask task)
{
    m_resolver->resolveEditorTarget([this, collectContexts, task](const std::optional<CdpTarget>& target,
                                                                  const QString& error) {
        if (!target) {
            task(nullptr, error.isEmpty() ? QString("No editor target found") : error);
            return;
        }

        CdpSession* session = new CdpSession(*target, this);
        session->setSettleDelay(m_settleDelayMs);
        session->start([session, task](const QString& startError) {
            if (!startError.isEmpty()) {
                BRIDGE_LOG_DEBUG(QString("CDP session failed to start: %1").arg(startError));
                session->close();
                task(nullptr, startError);
                return;
            }
            task(session, QString());
        }, collectContexts);
    });
}

void CdpScraper::checkAvailability(Callback<AvailabilityResult> callback)
{
    m_resolver->fetchVersion([callback](const QJsonObject& version, const QString& error) {
        AvailabilityResult result;
        result.available = error.isEmpty();
        result.browser = version["Browser"].toString();
        result.error = error;
        callback(result);
    });
}

void CdpScraper::listTargets(Callback<TargetListResult> callback)
{
    m_resolver->listTargets([callback](const QList<CdpTarget>& targets, const QString& error) {
        TargetListResult result;
        result.success = error.isEmpty();
        result.targets = targets;
        result.error = error;
        callback(result);
    });
}

void CdpScraper::captureScreenshot(const QString& format, int quality, Callback<ScreenshotResult> callback)
{
    const QString imageFormat = format.isEmpty() ? QString("png") : format;

    withSession(false, [imageFormat, quality, callback](CdpSession* session, const QString& error) {
        ScreenshotResult result;
        result.format = imageFormat;
        if (!session) {
            result.error = error;
            callback(result);
            return;
        }

        QJsonObject params{
            {"format", imageFormat},
            {"captureBeyondViewport", false}
        };
        if (imageFormat != "png") {
            params["quality"] = quality > 0 ? quality : SCREENSHOT_QUALITY;
        }

        session->call("Page.captureScreenshot", params, CdpConnection::MUTATE_TIMEOUT_MS,
            [session, result, callback](const QJsonObject& response, const QString& callError) mutable {
                session->close();
                result.success = callError.isEmpty();
                result.data = response["data"].toString();
                result.error = callError;
                callback(result);
            });
    });
}

void CdpScraper::getPageMetrics(Callback<PageMetricsResult> callback)
{
    withSession(false, [callback](CdpSession* session, const QString& error) {
        PageMetricsResult result;
        if (!session) {
            result.error = error;
            callback(result);
            return;
        }

        session->call("Page.getLayoutMetrics", QJsonObject(), CdpConnection::READ_TIMEOUT_MS,
            [session, result, callback](const QJsonObject& response, const QString& callError) mutable {
                session->close();
                result.success = callError.isEmpty();
                result.metrics = response;
                result.error = callError;
                callback(result);
            });
    });
}

QList<CdpScraper::KeyEvent> CdpScraper::enterKeyEvents()
{
    QJsonObject enter{
        {"key", "Enter"},
        {"code", "Enter"},
        {"windowsVirtualKeyCode", 13},
        {"nativeVirtualKeyCode", 13}
    };
    QJsonObject down = enter;
    down["type"] = "keyDown";
    down["text"] = "\r";
    QJsonObject up = enter;
    up["type"] = "keyUp";

    return {
        KeyEvent("Input.dispatchKeyEvent", down),
        KeyEvent("Input.dispatchKeyEvent", up)
    };
}

QList<CdpScraper::KeyEvent> CdpScraper::typingEvents(const QString& text)
{
    QList<KeyEvent> events;
    for (const QChar ch : text) {
        const QString key(ch);
        const QString code = ch.isLetter() ? QString("Key%1").arg(ch.toUpper()) : key;
        events.append(KeyEvent("Input.dispatchKeyEvent",
                               QJsonObject{{"type", "keyDown"}, {"text", key}, {"key", key}, {"code", code}}));
        events.append(KeyEvent("Input.dispatchKeyEvent",
                               QJsonObject{{"type", "keyUp"}, {"key", key}, {"code", code}}));
    }
    return events;
}

void CdpScraper::dispatchSequence(CdpSession* session, QList<KeyEvent> events,
                                  std::function<void(const QString& error)> done)
{
    if (events.isEmpty()) {
        done(QString());
        return;
    }

    KeyEvent next = events.takeFirst();
    session->call(next.first, next.second, CdpConnection::MUTATE_TIMEOUT_MS,
        [this, session, events, done](const QJsonObject&, const QString& error) {
            if (!error.isEmpty()) {
                done(error);
                return;
            }
            dispatchSequence(session, events, done);
        });
}

void CdpScraper::injectText(const QString& text, bool submit, Callback<ActionResult> callback)
{
    if (text.trimmed().isEmpty()) {
        ActionResult result;
        result.error = "Text is required";
        callback(result);
        return;
    }

    withSession(false, [this, text, submit, callback](CdpSession* session, const QString& error) {
        if (!session) {
            ActionResult result;
            result.error = error;
            callback(result);
            return;
        }

        auto finish = [session, callback, text, submit](const QString& method, const QString& failure) {
            session->close();
            ActionResult result;
            result.success = failure.isEmpty();
            result.found = true;
            result.method = method;
            result.error = failure;
            result.details = QJsonObject{{"length", text.length()}, {"submitted", submit && failure.isEmpty()}};
            callback(result);
        };

        session->evaluateInContext(0, BridgeScripts::focusForTyping(), CdpConnection::MUTATE_TIMEOUT_MS,
            [this, session, text, submit, finish](const QJsonValue& focus, const QString& focusError) {
                if (!focusError.isEmpty()) {
                    BRIDGE_LOG_DEBUG(QString("Input focus failed before inject: %1").arg(focusError));
                } else if (!focus.toObject()["found"].toBool()) {
                    BRIDGE_LOG_DEBUG("No input element found, typing into the focused element");
                }

                if (submit) {
                    session->call("Input.insertText", QJsonObject{{"text", text}}, CdpConnection::MUTATE_TIMEOUT_MS,
                        [this, session, finish](const QJsonObject&, const QString& insertError) {
                            if (!insertError.isEmpty()) {
                                finish("insertText", insertError);
                                return;
                            }
                            QTimer::singleShot(SUBMIT_DELAY_MS, session, [this, session, finish]() {
                                dispatchSequence(session, enterKeyEvents(), [finish](const QString& keyError) {
                                    finish("insertText", keyError);
                                });
                            });
                        });
                    return;
                }

                QTimer::singleShot(TYPING_DELAY_MS, session, [this, session, text, finish]() {
                    dispatchSequence(session, typingEvents(text), [finish](const QString& keyError) {
                        finish("dispatchKeyEvent", keyError);
                    });
                });
            });
    });
}

void CdpScraper::focusInput(Callback<ActionResult> callback)
{
    withSession(false, [callback](CdpSession* session, const QString& error) {
        if (!session) {
            ActionResult result;
            result.error = error;
            callback(result);
            return;
        }

        session->evaluateInContext(0, BridgeScripts::focusInput(), CdpConnection::MUTATE_TIMEOUT_MS,
            [session, callback](const QJsonValue& value, const QString& evalError) {
                session->close();
                ActionResult result;
                QJsonObject outcome = value.toObject();
                result.success = evalError.isEmpty() && outcome["success"].toBool();
                result.found = result.success;
                result.method = outcome["method"].toString();
                result.error = evalError;
                callback(result);
            });
    });
}

void CdpScraper::readModelMode(Callback<ModelModeResult> callback)
{
    withSession(true, [callback](CdpSession* session, const QString& error) {
        if (!session) {
            ModelModeResult result;
            result.state = classifyModelMode(QStringList());
            result.error = error;
            callback(result);
            return;
        }

        auto hasLabels = [](const QJsonValue& value) {
            ModelModeState state = classifyModelMode(toStringList(value.toObject()["texts"]));
            return state.modelFound || state.modeFound;
        };

        session->evaluateAcrossContexts(BridgeScripts::modelModeProbe(), CdpConnection::READ_TIMEOUT_MS, hasLabels,
            [session, callback](const std::optional<CdpSession::ContextResult>& match) {
                session->close();
                ModelModeResult result;
                if (match) {
                    result.success = true;
                    result.state = classifyModelMode(toStringList(match->value.toObject()["texts"]));
                } else {
                    result.state = classifyModelMode(QStringList());
                    result.error = "Model and mode labels not found";
                }
                callback(result);
            });
    });
}

void CdpScraper::setModel(const QString& model, Callback<SelectionResult> callback)
{
    selectOption(BridgeScripts::SelectorKind::Model, model, std::move(callback));
}

void CdpScraper::setMode(const QString& mode, Callback<SelectionResult> callback)
{
    selectOption(BridgeScripts::SelectorKind::Mode, mode, std::move(callback));
}

void CdpScraper::selectOption(BridgeScripts::SelectorKind kind, const QString& requested,
                              Callback<SelectionResult> callback)
{
    const bool isModel = kind == BridgeScripts::SelectorKind::Model;
    const QString name = requested.trimmed();

    if (name.isEmpty()) {
        SelectionResult result;
        result.error = isModel ? "Model name is required" : "Mode name is required";
        callback(result);
        return;
    }

    withSession(true, [kind, isModel, name, callback](CdpSession* session, const QString& error) {
        SelectionResult result;
        result.requested = name;
        if (!session) {
            result.error = error;
            callback(result);
            return;
        }

        session->evaluateAcrossContexts(BridgeScripts::openSelector(kind), CdpConnection::MUTATE_TIMEOUT_MS,
            [session, isModel, result, callback](const std::optional<CdpSession::ContextResult>& opened) mutable {
                if (!opened) {
                    session->close();
                    result.error = isModel ? "Model selector not found" : "Mode selector not found";
                    callback(result);
                    return;
                }

                result.found = true;
                const QStringList candidates = toStringList(opened->value.toObject()["candidates"]);
                const int index = isModel
                    ? selectCandidate(result.requested, candidates).index
                    : selectModeCandidate(result.requested, candidates);
                const int contextId = opened->contextId;

                if (index < 0) {
                    BRIDGE_LOG_INFO(QString("No option matched '%1' among %2 candidates")
                                    .arg(result.requested).arg(candidates.size()));
                    result.rejectedCandidates = candidates;
                    result.error = QString("No option matching '%1'").arg(result.requested);
                    session->evaluateInContext(contextId, BridgeScripts::dismissSelector(),
                                               CdpConnection::READ_TIMEOUT_MS,
                        [session, result, callback](const QJsonValue&, const QString& dismissError) {
                            if (!dismissError.isEmpty()) {
                                BRIDGE_LOG_DEBUG(QString("Dismissing selector failed: %1").arg(dismissError));
                            }
                            session->close();
                            callback(result);
                        });
                    return;
                }

                result.selected = candidates.at(index);
                session->evaluateInContext(contextId, BridgeScripts::clickCandidate(index),
                                           CdpConnection::MUTATE_TIMEOUT_MS,
                    [session, result, callback](const QJsonValue& clicked, const QString& clickError) mutable {
                        session->close();
                        result.success = clickError.isEmpty() && clicked.toObject()["clicked"].toBool();
                        if (!result.success) {
                            result.error = clickError.isEmpty()
                                ? QString("Option '%1' could not be clicked").arg(result.selected)
                                : clickError;
                        }
                        callback(result);
                    });
            });
    });
}

void CdpScraper::availableModels(Callback<OptionsResult> callback)
{
    readModelMode([callback](const ModelModeResult& current) {
        OptionsResult result;
        result.success = true;
        result.current = current.state.model;

        QStringList names = knownModels();
        if (current.state.modelFound && !names.contains(current.state.model)) {
            names.prepend(current.state.model);
        }
        for (const QString& name : names) {
            result.options.append(QJsonObject{{"name", name}, {"current", name == current.state.model}});
        }
        callback(result);
    });
}

void CdpScraper::availableModes(Callback<OptionsResult> callback)
{
    readModelMode([callback](const ModelModeResult& current) {
        OptionsResult result;
        result.success = true;
        result.current = current.state.mode;

        const QJsonArray modes = knownModes();
        for (const QJsonValue& value : modes) {
            QJsonObject mode = value.toObject();
            mode["current"] = mode["name"].toString().compare(current.state.mode, Qt::CaseInsensitive) == 0;
            result.options.append(mode);
        }
        callback(result);
    });
}

void CdpScraper::detectWorkspace(Callback<WorkspaceResult> callback)
{
    const QString product = productName();

    withSession(true, [product, callback](CdpSession* session, const QString& error) {
        if (!session) {
            WorkspaceResult result;
            result.error = error;
            callback(result);
            return;
        }

        auto hasPath = [](const QJsonValue& value) {
            QJsonObject probe = value.toObject();
            return findPathSignal(toStringList(probe["labels"]), toStringList(probe["uris"])).has_value();
        };

        const QString title = session->target().title;
        session->evaluateAcrossContexts(BridgeScripts::workspaceProbe(), CdpConnection::READ_TIMEOUT_MS, hasPath,
            [session, title, product, callback](const std::optional<CdpSession::ContextResult>& match) {
                session->close();
                WorkspaceResult result;
                if (!match) {
                    result.error = "No workspace path signal";
                    callback(result);
                    return;
                }

                QJsonObject probe = match->value.toObject();
                std::optional<PathSignal> signal =
                    findPathSignal(toStringList(probe["labels"]), toStringList(probe["uris"]));
                if (!signal) {
                    result.error = "No workspace path signal";
                    callback(result);
                    return;
                }

                const QString anchor = parseProjectAnchor(title, product);
                result.found = true;
                result.path = normalizeDetectedPath(inferWorkspaceRoot(*signal, anchor));
                result.projectName = lastPathSegment(result.path);
                result.source = signal->source;
                callback(result);
            });
    });
}

void CdpScraper::detectApprovals(Callback<ApprovalResult> callback)
{
    withSession(true, [callback](CdpSession* session, const QString& error) {
        if (!session) {
            ApprovalResult result;
            result.error = error;
            callback(result);
            return;
        }

        auto isPending = [](const QJsonValue& value) {
            QJsonObject probe = value.toObject();
            return detectApproval(probe["bodyText"].toString(), toStringList(probe["labels"])).pending;
        };

        session->evaluateAcrossContexts(BridgeScripts::approvalProbe(), CdpConnection::READ_TIMEOUT_MS, isPending,
            [session, callback](const std::optional<CdpSession::ContextResult>& match) {
                session->close();
                ApprovalResult result;
                result.success = true;
                if (match) {
                    QJsonObject probe = match->value.toObject();
                    result.state = detectApproval(probe["bodyText"].toString(), toStringList(probe["labels"]));
                }
                callback(result);
            });
    });
}

void CdpScraper::respondToApproval(bool approve, Callback<ActionResult> callback)
{
    const QString action = approve ? "approve" : "reject";

    withSession(true, [approve, action, callback](CdpSession* session, const QString& error) {
        ActionResult result;
        result.method = action;
        if (!session) {
            result.error = error;
            callback(result);
            return;
        }

        auto hasAffordance = [approve](const QJsonValue& value) {
            return findAffordance(toStringList(value.toObject()["labels"]), approve) >= 0;
        };

        session->evaluateAcrossContexts(BridgeScripts::affordanceProbe(approve), CdpConnection::MUTATE_TIMEOUT_MS,
                                        hasAffordance,
            [session, approve, action, result, callback](const std::optional<CdpSession::ContextResult>& match) mutable {
                if (!match) {
                    session->close();
                    result.error = QString("No %1 button found").arg(action);
                    callback(result);
                    return;
                }

                const QStringList labels = toStringList(match->value.toObject()["labels"]);
                const int index = findAffordance(labels, approve);
                result.found = true;
                result.details["text"] = labels.at(index);

                session->evaluateInContext(match->contextId, BridgeScripts::clickAffordance(index),
                                           CdpConnection::MUTATE_TIMEOUT_MS,
                    [session, action, result, callback](const QJsonValue& clicked, const QString& clickError) mutable {
                        session->close();
                        result.success = clickError.isEmpty() && clicked.toObject()["clicked"].toBool();
                        if (!result.success) {
                            result.error = clickError.isEmpty()
                                ? QString("Found %1 button but could not click it").arg(action)
                                : clickError;
                        }
                        callback(result);
                    });
            });
    });
}

void CdpScraper::chatSnapshot(Callback<ChatSnapshotResult> callback)
{
    withSession(true, [callback](CdpSession* session, const QString& error) {
        if (!session) {
            ChatSnapshotResult result;
            result.error = error;
            callback(result);
            return;
        }

        session->evaluateAcrossContexts(BridgeScripts::chatMessages(), CdpConnection::READ_TIMEOUT_MS,
            [session, callback](const std::optional<CdpSession::ContextResult>& match) {
                session->close();
                ChatSnapshotResult result;
                if (match) {
                    result.success = true;
                    result.messages = match->value.toObject()["messages"].toArray();
                } else {
                    result.error = "No chat messages found";
                }
                callback(result);
            });
    });
}
