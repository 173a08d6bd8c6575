/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOOKEVENT_H
#define HOOKEVENT_H

#include "sessionwatchprivate_export.h"

#include <QJsonObject>
#include <QJsonValue>
#include <QMetaType>
#include <QString>

#include <optional>

namespace SessionWatch
{

/**
 * One lifecycle or activity notification sent by the agent's hooks.
 *
 * Wire format is one JSON object per line:
 *   {"event": "SessionStart" | "SessionEnd" | "PreToolUse" | "PostToolUse",
 *    "sessionId", "transcriptPath", "cwd", "pid", "ppid", "tty",
 *    "toolName", "toolInput", "toolResult", "timestamp"}
 */
struct SESSIONWATCHPRIVATE_EXPORT HookEvent {
    enum class Kind {
        SessionStart,
        SessionEnd,
        ToolStart, // "PreToolUse" on the wire
        ToolEnd, // "PostToolUse" on the wire
    };

    Kind kind = Kind::SessionStart;
    QString sessionId;
    QString transcriptPath;
    QString cwd;
    qint64 pid = 0; // Agent process
    qint64 ppid = 0; // Shell the agent runs in
    QString tty;

    QString toolName;
    QJsonObject toolInput;
    QJsonValue toolResult;
    qint64 timestamp = 0; // ms since epoch, 0 when the sender did not stamp it

    bool isToolEvent() const
    {
        return kind == Kind::ToolStart || kind == Kind::ToolEnd;
    }

    QJsonObject toJson() const;

    /**
     * Decode one wire object. Returns std::nullopt for unknown event names
     * and for events without a session id; @p error receives the reason.
     */
    static std::optional<HookEvent> fromJson(const QJsonObject &obj, QString *error = nullptr);

    static QString kindName(Kind kind);
    static std::optional<Kind> parseKind(const QString &name);
};

} // namespace SessionWatch

Q_DECLARE_METATYPE(SessionWatch::HookEvent)

#endif // HOOKEVENT_H
