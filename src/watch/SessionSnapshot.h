/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSNAPSHOT_H
#define SESSIONSNAPSHOT_H

#include "sessionwatchprivate_export.h"

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>

#include <optional>

namespace SessionWatch
{

/**
 * Transcript-derived status of a session
 */
enum class SessionStatus {
    Working, // Agent is producing output or running a tool
    Paused, // Waiting for the user
    Done, // Last turn finished and all tasks are complete
};

SESSIONWATCHPRIVATE_EXPORT QString statusName(SessionStatus status);

/**
 * One entry of the agent's todo list
 */
struct SESSIONWATCHPRIVATE_EXPORT TodoItem {
    QString content;
    QString status; // "pending", "in_progress", "completed"
    QString activeForm;

    bool isInProgress() const
    {
        return status == QLatin1String("in_progress");
    }

    bool isCompleted() const
    {
        return status == QLatin1String("completed");
    }
};

/**
 * Per-session token usage counters
 */
struct SESSIONWATCHPRIVATE_EXPORT TokenUsage {
    quint64 inputTokens = 0;
    quint64 outputTokens = 0;
    quint64 cacheReadTokens = 0;
    quint64 cacheCreationTokens = 0;

    quint64 totalTokens() const
    {
        return inputTokens + outputTokens + cacheReadTokens + cacheCreationTokens;
    }

    QString formatCompact() const;
};

/**
 * SessionSnapshot is the parsed state of one transcript file.
 *
 * Snapshots are immutable values: every re-parse produces a new snapshot
 * that replaces the previous one wholesale.
 */
struct SESSIONWATCHPRIVATE_EXPORT SessionSnapshot {
    QString sessionId;
    QString filePath;
    QString cwd;
    QDateTime created;
    QDateTime lastModified;

    SessionStatus status = SessionStatus::Paused;

    // Subordinate sessions spawned by a parent session
    bool isAgent = false;
    QString parentSessionId;

    QString lastUserPrompt;
    QList<TodoItem> todos;
    TokenUsage tokenUsage;
    quint64 contextTokens = 0; // Prompt size of the latest assistant turn

    bool hasInProgressTask() const;
    int completedTaskCount() const;
};

/**
 * Produces snapshots from transcript files.
 *
 * parse() must be free of side effects; returns std::nullopt when the file
 * cannot be read or holds nothing recognizable yet.
 */
class SESSIONWATCHPRIVATE_EXPORT SnapshotProvider
{
public:
    virtual ~SnapshotProvider() = default;

    virtual std::optional<SessionSnapshot> parse(const QString &filePath) const = 0;
};

} // namespace SessionWatch

Q_DECLARE_METATYPE(SessionWatch::SessionSnapshot)

#endif // SESSIONSNAPSHOT_H
