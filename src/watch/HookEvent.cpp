/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HookEvent.h"

namespace SessionWatch
{

namespace
{
qint64 readPid(const QJsonValue &value)
{
    if (value.isString()) {
        return value.toString().trimmed().toLongLong();
    }
    return static_cast<qint64>(value.toDouble());
}
}

QString HookEvent::kindName(Kind kind)
{
    switch (kind) {
    case Kind::SessionStart:
        return QStringLiteral("SessionStart");
    case Kind::SessionEnd:
        return QStringLiteral("SessionEnd");
    case Kind::ToolStart:
        return QStringLiteral("PreToolUse");
    case Kind::ToolEnd:
        return QStringLiteral("PostToolUse");
    }
    return QString();
}

std::optional<HookEvent::Kind> HookEvent::parseKind(const QString &name)
{
    if (name == QLatin1String("SessionStart")) {
        return Kind::SessionStart;
    }
    if (name == QLatin1String("SessionEnd")) {
        return Kind::SessionEnd;
    }
    if (name == QLatin1String("PreToolUse") || name == QLatin1String("ToolStart")) {
        return Kind::ToolStart;
    }
    if (name == QLatin1String("PostToolUse") || name == QLatin1String("ToolEnd")) {
        return Kind::ToolEnd;
    }
    return std::nullopt;
}

QJsonObject HookEvent::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("event")] = kindName(kind);
    obj[QStringLiteral("sessionId")] = sessionId;
    obj[QStringLiteral("transcriptPath")] = transcriptPath;
    obj[QStringLiteral("cwd")] = cwd;
    obj[QStringLiteral("pid")] = pid;
    obj[QStringLiteral("ppid")] = ppid;
    obj[QStringLiteral("tty")] = tty;

    if (isToolEvent()) {
        obj[QStringLiteral("toolName")] = toolName;
        obj[QStringLiteral("toolInput")] = toolInput;
        obj[QStringLiteral("toolResult")] = toolResult.isUndefined() ? QJsonValue(QJsonValue::Null) : toolResult;
        obj[QStringLiteral("timestamp")] = timestamp;
    }
    return obj;
}

std::optional<HookEvent> HookEvent::fromJson(const QJsonObject &obj, QString *error)
{
    QString name = obj.value(QStringLiteral("event")).toString();
    if (name.isEmpty()) {
        name = obj.value(QStringLiteral("kind")).toString();
    }

    const auto kind = parseKind(name);
    if (!kind) {
        if (error) {
            *error = name.isEmpty() ? QStringLiteral("Hook message missing event") : QStringLiteral("Unknown hook event: ") + name;
        }
        return std::nullopt;
    }

    HookEvent event;
    event.kind = *kind;
    event.sessionId = obj.value(QStringLiteral("sessionId")).toString();
    if (event.sessionId.isEmpty()) {
        if (error) {
            *error = QStringLiteral("Hook message missing sessionId");
        }
        return std::nullopt;
    }

    event.transcriptPath = obj.value(QStringLiteral("transcriptPath")).toString();
    event.cwd = obj.value(QStringLiteral("cwd")).toString();
    event.pid = readPid(obj.value(QStringLiteral("pid")));
    event.ppid = readPid(obj.value(QStringLiteral("ppid")));
    event.tty = obj.value(QStringLiteral("tty")).toString();
    event.toolName = obj.value(QStringLiteral("toolName")).toString();
    event.toolInput = obj.value(QStringLiteral("toolInput")).toObject();
    event.toolResult = obj.value(QStringLiteral("toolResult"));
    event.timestamp = static_cast<qint64>(obj.value(QStringLiteral("timestamp")).toDouble());

    return event;
}

} // namespace SessionWatch
