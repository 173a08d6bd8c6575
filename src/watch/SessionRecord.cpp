/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionRecord.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>

namespace SessionWatch
{

QJsonObject RecentTool::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("toolName")] = toolName;
    obj[QStringLiteral("toolInput")] = toolInput;
    obj[QStringLiteral("startTime")] = startTime;
    obj[QStringLiteral("endTime")] = endTime;
    obj[QStringLiteral("durationMs")] = durationMs;
    if (!succeeded) {
        obj[QStringLiteral("succeeded")] = false;
    }
    return obj;
}

RecentTool RecentTool::fromJson(const QJsonObject &obj)
{
    RecentTool tool;
    tool.toolName = obj.value(QStringLiteral("toolName")).toString();
    tool.toolInput = obj.value(QStringLiteral("toolInput")).toObject();
    tool.startTime = obj.value(QStringLiteral("startTime")).toInteger();
    tool.endTime = obj.value(QStringLiteral("endTime")).toInteger();
    tool.durationMs = obj.value(QStringLiteral("durationMs")).toInteger();
    tool.succeeded = obj.value(QStringLiteral("succeeded")).toBool(true);
    return tool;
}

void SessionRecord::pushRecentTool(const RecentTool &tool, int capacity)
{
    recentTools.prepend(tool);
    while (recentTools.size() > qMax(0, capacity)) {
        recentTools.removeLast();
    }
}

SessionStatus effectiveStatus(const SessionSnapshot &snapshot, bool toolInFlight)
{
    if (toolInFlight) {
        return SessionStatus::Working;
    }
    if (snapshot.hasInProgressTask() && snapshot.status != SessionStatus::Done) {
        return SessionStatus::Working;
    }
    return snapshot.status;
}

SessionStatus effectiveStatus(const SessionRecord &record)
{
    if (!record.state) {
        return record.currentTool ? SessionStatus::Working : SessionStatus::Paused;
    }
    return effectiveStatus(*record.state, record.currentTool.has_value());
}

bool cwdEquals(const QString &a, const QString &b)
{
    auto normalize = [](const QString &path) {
        const QString canonical = QFileInfo(path).canonicalFilePath();
        return canonical.isEmpty() ? QDir::cleanPath(path) : canonical;
    };

#ifdef Q_OS_MACOS
    return normalize(a).compare(normalize(b), Qt::CaseInsensitive) == 0;
#else
    return normalize(a) == normalize(b);
#endif
}

QJsonObject PersistedSession::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("sessionId")] = sessionId;
    obj[QStringLiteral("transcriptPath")] = transcriptPath;
    obj[QStringLiteral("cwd")] = cwd;
    obj[QStringLiteral("pid")] = pid;
    obj[QStringLiteral("ppid")] = ppid;
    obj[QStringLiteral("tty")] = tty;
    obj[QStringLiteral("pidStartTime")] = pidStartTime.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(pidStartTime);

    QJsonArray tools;
    for (const auto &tool : recentTools) {
        tools.append(tool.toJson());
    }
    obj[QStringLiteral("recentTools")] = tools;
    return obj;
}

PersistedSession PersistedSession::fromJson(const QJsonObject &obj)
{
    PersistedSession session;
    session.sessionId = obj.value(QStringLiteral("sessionId")).toString();
    session.transcriptPath = obj.value(QStringLiteral("transcriptPath")).toString();
    session.cwd = obj.value(QStringLiteral("cwd")).toString();
    session.pid = obj.value(QStringLiteral("pid")).toInteger();
    session.ppid = obj.value(QStringLiteral("ppid")).toInteger();
    session.tty = obj.value(QStringLiteral("tty")).toString();
    session.pidStartTime = obj.value(QStringLiteral("pidStartTime")).toString();

    const QJsonArray tools = obj.value(QStringLiteral("recentTools")).toArray();
    for (const QJsonValue &value : tools) {
        session.recentTools.append(RecentTool::fromJson(value.toObject()));
    }
    return session;
}

PersistedSession PersistedSession::fromRecord(const SessionRecord &record)
{
    PersistedSession session;
    session.sessionId = record.sessionId;
    session.transcriptPath = record.transcriptPath;
    session.cwd = record.cwd;
    session.pid = record.pid;
    session.ppid = record.ppid;
    session.tty = record.tty;
    session.pidStartTime = record.pidStartTime;
    session.recentTools = record.recentTools;
    return session;
}

} // namespace SessionWatch
