#include "idescraper.h"

QJsonObject AvailabilityResult::toJson() const
{
    QJsonObject json{{"available", available}};
    if (!browser.isEmpty()) {
        json["browser"] = browser;
    }
    if (!error.isEmpty()) {
        json["error"] = error;
    }
    return json;
}

QJsonObject TargetListResult::toJson() const
{
    QJsonArray list;
    for (const CdpTarget& target : targets) {
        list.append(target.toJson());
    }
    QJsonObject json{{"success", success}, {"targets", list}};
    if (!error.isEmpty()) {
        json["error"] = error;
    }
    return json;
}

QJsonObject ScreenshotResult::toJson() const
{
    QJsonObject json{{"success", success}};
    if (success) {
        json["format"] = format;
        json["data"] = data;
    } else {
        json["error"] = error;
    }
    return json;
}

QJsonObject PageMetricsResult::toJson() const
{
    QJsonObject json{{"success", success}};
    if (success) {
        json["metrics"] = metrics;
    } else {
        json["error"] = error;
    }
    return json;
}

QJsonObject ActionResult::toJson() const
{
    QJsonObject json = details;
    json["success"] = success;
    json["found"] = found;
    if (!method.isEmpty()) {
        json["method"] = method;
    }
    if (!error.isEmpty()) {
        json["error"] = error;
    }
    return json;
}

QJsonObject SelectionResult::toJson() const
{
    QJsonObject json{
        {"success", success},
        {"found", found},
        {"requested", requested}
    };
    if (!selected.isEmpty()) {
        json["selected"] = selected;
    }
    if (!rejectedCandidates.isEmpty()) {
        json["rejectedCandidates"] = QJsonArray::fromStringList(rejectedCandidates);
    }
    if (!error.isEmpty()) {
        json["error"] = error;
    }
    return json;
}

QJsonObject OptionsResult::toJson(const QString& listKey) const
{
    QJsonObject json{
        {"success", success},
        {listKey, options},
        {"current", current}
    };
    if (!error.isEmpty()) {
        json["error"] = error;
    }
    return json;
}

QJsonObject ApprovalResult::toJson() const
{
    QJsonObject json = state.toJson();
    json["success"] = success;
    if (!error.isEmpty()) {
        json["error"] = error;
    }
    return json;
}

QJsonObject ChatSnapshotResult::toJson() const
{
    QJsonObject json{
        {"success", success},
        {"messages", messages},
        {"messageCount", messages.size()}
    };
    if (!error.isEmpty()) {
        json["error"] = error;
    }
    return json;
}
