#include "scripts.h"
#include "heuristics.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>

namespace BridgeScripts {

static const char* CANDIDATE_ATTRIBUTE = "data-bridge-candidate";
static const char* AFFORDANCE_ATTRIBUTE = "data-bridge-affordance";

QString toJsonArray(const QStringList& values) {
    return QString::fromUtf8(QJsonDocument(QJsonArray::fromStringList(values)).toJson(QJsonDocument::Compact));
}

QString modelModeProbe() {
    return QStringLiteral(R"JS(
(function() {
    var texts = [];
    var elements = document.querySelectorAll('p, span, div, button');
    for (var i = 0; i < elements.length && texts.length < 4000; i++) {
        var text = (elements[i].innerText || elements[i].textContent || '').trim();
        if (text.length >= 4 && text.length <= 50) {
            texts.push(text);
        }
    }
    return { found: texts.length > 0, texts: texts };
})()
)JS");
}

QString workspaceProbe() {
    return QStringLiteral(R"JS(
(function() {
    var labels = [];
    var tabs = document.querySelectorAll('[role="tab"], [class*="tab-label"], .tab');
    for (var i = 0; i < tabs.length; i++) {
        var aria = tabs[i].getAttribute('aria-label') || '';
        var title = tabs[i].getAttribute('title') || '';
        if (aria.length >= 5) labels.push(aria);
        if (title.length >= 5) labels.push(title);
    }
    var uris = [];
    var nodes = document.querySelectorAll('[data-uri]');
    for (var j = 0; j < nodes.length; j++) {
        var uri = nodes[j].getAttribute('data-uri');
        if (uri && uri.indexOf('file:///') === 0) uris.push(uri);
    }
    return { found: labels.length > 0 || uris.length > 0, labels: labels, uris: uris };
})()
)JS");
}

QString openSelector(SelectorKind kind) {
    const bool model = kind == SelectorKind::Model;
    const QStringList keywords = model
        ? QStringList{"gemini", "claude", "gpt", "opus", "sonnet", "flash", "model"}
        : QStringList{"planning", "fast"};

    return QStringLiteral(R"JS(
(async function() {
    var keywords = %1;
    var isModel = %2;
    var attr = '%3';
    var norm = function(el) { return (el.innerText || el.textContent || '').trim(); };
    var hasKeyword = function(text) {
        var lower = text.toLowerCase();
        return keywords.some(function(k) { return lower.indexOf(k) >= 0; });
    };
    var isTrigger = function(text) {
        var lower = text.toLowerCase();
        if (isModel) return lower.length >= 3 && lower.length <= 60 && hasKeyword(lower);
        return lower.length >= 2 && lower.length <= 30 &&
            keywords.some(function(k) { return lower === k || lower.indexOf(k) === 0; });
    };

    var trigger = null;
    var triggerText = '';
    var elements = document.querySelectorAll('button, div[role="button"], p, span');
    for (var i = 0; i < elements.length; i++) {
        var text = norm(elements[i]);
        if (isTrigger(text)) {
            trigger = elements[i].closest('button') || elements[i].closest('[role="button"]') || elements[i];
            triggerText = text;
            break;
        }
    }
    if (!trigger) return { found: false, candidates: [] };

    document.querySelectorAll('[' + attr + ']').forEach(function(el) { el.removeAttribute(attr); });
    trigger.click();
    await new Promise(function(r) { setTimeout(r, 600); });

    var picked = [];
    var pointerItems = document.querySelectorAll('[class*="cursor-pointer"]');
    for (var j = 0; j < pointerItems.length; j++) {
        var itemText = norm(pointerItems[j]);
        var ok = isModel
            ? (itemText.length > 3 && itemText.length < 100 && hasKeyword(itemText))
            : (itemText.length > 1 && itemText.length < 150 && (hasKeyword(itemText) || itemText.length < 30));
        if (ok) picked.push({ el: pointerItems[j], text: itemText });
    }

    if (picked.length === 0 && isModel) {
        var fallbacks = ['[role="listbox"] [role="option"]', '[role="menu"] [role="menuitem"]',
                         '.monaco-list-row', '.action-item'];
        for (var f = 0; f < fallbacks.length && picked.length === 0; f++) {
            var items = document.querySelectorAll(fallbacks[f]);
            for (var k = 0; k < items.length; k++) {
                var t = norm(items[k]);
                if (t.length > 3 && t.length < 80) picked.push({ el: items[k], text: t });
            }
        }
    }

    var candidates = [];
    for (var n = 0; n < picked.length; n++) {
        picked[n].el.setAttribute(attr, String(n));
        candidates.push(picked[n].text);
    }
    return { found: true, trigger: triggerText, candidates: candidates };
})()
)JS").arg(toJsonArray(keywords), model ? "true" : "false", CANDIDATE_ATTRIBUTE);
}

static QString clickTagged(const char* attribute, int index) {
    return QStringLiteral(R"JS(
(async function() {
    var attr = '%1';
    var el = document.querySelector('[' + attr + '="%2"]');
    var clear = function() {
        document.querySelectorAll('[' + attr + ']').forEach(function(e) { e.removeAttribute(attr); });
    };
    if (!el) { clear(); return { found: false, clicked: false }; }
    var text = (el.innerText || el.textContent || '').trim();
    if (!el.isConnected || el.disabled || el.getAttribute('aria-disabled') === 'true') {
        clear();
        return { found: true, clicked: false, text: text };
    }
    el.scrollIntoView({ block: 'center', inline: 'center' });
    await new Promise(function(r) { setTimeout(r, 100); });
    try {
        el.click();
    } catch (e) {
        clear();
        return { found: true, clicked: false, text: text, error: String(e) };
    }
    clear();
    return { found: true, clicked: true, text: text };
})()
)JS").arg(attribute).arg(index);
}

QString clickCandidate(int index) {
    return clickTagged(CANDIDATE_ATTRIBUTE, index);
}

QString dismissSelector() {
    return QStringLiteral(R"JS(
(function() {
    var attr = '%1';
    document.querySelectorAll('[' + attr + ']').forEach(function(e) { e.removeAttribute(attr); });
    document.body.dispatchEvent(new KeyboardEvent('keydown', { key: 'Escape', bubbles: true }));
    return { found: true };
})()
)JS").arg(CANDIDATE_ATTRIBUTE);
}

QString approvalProbe() {
    return QStringLiteral(R"JS(
(function() {
    var labels = [];
    var buttons = document.querySelectorAll('button, [role="button"], [class*="cursor-pointer"]');
    for (var i = 0; i < buttons.length; i++) {
        var text = (buttons[i].innerText || buttons[i].textContent || '').trim();
        if (text.length > 0 && text.length < %1) labels.push(text);
    }
    return { found: true, bodyText: (document.body && document.body.innerText) || '', labels: labels };
})()
)JS").arg(BridgeHeuristics::MAX_AFFORDANCE_LABEL_LENGTH);
}

QString affordanceProbe(bool approve) {
    // Indices follow the full button list so tags line up with the labels returned.
    // Contexts without a keyword match are left untagged.
    const QStringList& keywords = approve ? BridgeHeuristics::approveKeywords()
                                          : BridgeHeuristics::rejectKeywords();
    return QStringLiteral(R"JS(
(function() {
    var attr = '%1';
    var keywords = %2;
    document.querySelectorAll('[' + attr + ']').forEach(function(e) { e.removeAttribute(attr); });
    var labels = [];
    var elements = [];
    var buttons = document.querySelectorAll('button, [role="button"], [class*="cursor-pointer"]');
    for (var i = 0; i < buttons.length; i++) {
        var text = (buttons[i].innerText || buttons[i].textContent || '').trim();
        if (text.length > 0 && text.length < %3) {
            elements.push(buttons[i]);
            labels.push(text);
        }
    }
    var matched = labels.some(function(label) {
        var text = label.replace(/\s+/g, ' ').toLowerCase();
        return keywords.some(function(k) { return text.indexOf(k) !== -1; });
    });
    if (!matched) return { found: false, labels: labels };
    elements.forEach(function(e, i) { e.setAttribute(attr, String(i)); });
    return { found: true, labels: labels };
})()
)JS").arg(AFFORDANCE_ATTRIBUTE, toJsonArray(keywords))
     .arg(BridgeHeuristics::MAX_AFFORDANCE_LABEL_LENGTH);
}

QString clickAffordance(int index) {
    return clickTagged(AFFORDANCE_ATTRIBUTE, index);
}

QString focusForTyping() {
    return QStringLiteral(R"JS(
(function() {
    var selectors = ['textarea.inputarea', 'textarea[aria-label*="input"]', 'div[contenteditable="true"]',
                     '.monaco-inputbox textarea', 'textarea'];
    for (var i = 0; i < selectors.length; i++) {
        var el = document.querySelector(selectors[i]);
        if (el) { el.focus(); return { found: true, selector: selectors[i] }; }
    }
    var area = document.querySelector('.input-area, .chat-input, [class*="input"]');
    if (area) { area.click(); return { found: true, clicked: true }; }
    return { found: false };
})()
)JS");
}

QString focusInput() {
    return QStringLiteral(R"JS(
(function() {
    var textarea = document.querySelector('textarea');
    if (textarea) { textarea.focus(); textarea.click(); return { method: 'textarea', success: true }; }
    var editable = document.querySelector('[contenteditable="true"]');
    if (editable) { editable.focus(); editable.click(); return { method: 'contenteditable', success: true }; }
    document.body.dispatchEvent(new KeyboardEvent('keydown', { key: 'l', code: 'KeyL', ctrlKey: true, bubbles: true }));
    return { method: 'keyboard_shortcut', success: true };
})()
)JS");
}

QString chatMessages() {
    return QStringLiteral(R"JS(
(function() {
    var blacklist = [/^(gemini|claude|gpt|model|opus|sonnet|flash)/i, /^(pro|low|high|medium|thinking)/i,
                     /^(submit|cancel|dismiss|retry)/i, /^(planning|execution|verification)/i,
                     /^(agent|assistant|user)$/i, /^\d+:\d+/, /ask anything/i, /add context/i];
    var rejected = function(text) {
        if (text.length < 30 || text.length > 5000) return true;
        if (text.split(/\s+/).length <= 5 || !/[.!?]/.test(text)) return true;
        return blacklist.some(function(p) { return p.test(text); });
    };
    var selectors = ['.conversation-content', '.agent-response', '.assistant-message', '.user-query',
                     '.auxiliary-bar .content', '.panel-content'];
    var messages = [];
    for (var s = 0; s < selectors.length && messages.length === 0; s++) {
        var els = document.querySelectorAll(selectors[s]);
        for (var i = 0; i < els.length; i++) {
            var text = (els[i].innerText || '').trim();
            if (rejected(text)) continue;
            var cls = String(els[i].className || '').toLowerCase();
            var role = (cls.indexOf('user') >= 0 || cls.indexOf('human') >= 0) ? 'user' : 'agent';
            messages.push({ role: role, content: text.substring(0, 1500) });
        }
    }
    messages = messages.slice(-20);
    return { found: messages.length > 0, messages: messages, count: messages.length };
})()
)JS");
}

} // namespace BridgeScripts
