#ifndef BRIDGE_SCRIPTS_H
#define BRIDGE_SCRIPTS_H

#include <QString>
#include <QStringList>

// Page-side probes evaluated through Runtime.evaluate. Probes only gather
// and tag elements; the decisions are made by BridgeHeuristics.
namespace BridgeScripts {

    enum class SelectorKind {
        Model,
        Mode
    };

    // {found, texts[]}: short visible texts in DOM order
    QString modelModeProbe();

    // {found, labels[], uris[]}: tab labels/titles and data-uri values
    QString workspaceProbe();

    // {found, trigger, candidates[]}: clicks the selector trigger, waits for
    // the dropdown and tags its options. found means a trigger exists.
    QString openSelector(SelectorKind kind);

    // {found, clicked, text}: clicks a tagged option and clears the tags
    QString clickCandidate(int index);

    // Closes an open dropdown with Escape and clears the tags
    QString dismissSelector();

    // {found, bodyText, labels[]}
    QString approvalProbe();

    // {found, labels[]}: tags short-label affordances for a later click, but only
    // when one of them matches the approve or reject keywords
    QString affordanceProbe(bool approve);

    // {found, clicked, text}
    QString clickAffordance(int index);

    // {found, selector}: focuses the agent input before typing
    QString focusForTyping();

    // {method, success}: textarea, contenteditable, then a keyboard shortcut
    QString focusInput();

    // {messages[], count}
    QString chatMessages();

    QString toJsonArray(const QStringList& values);
}

#endif // BRIDGE_SCRIPTS_H
