/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONRECORD_H
#define SESSIONRECORD_H

#include "sessionwatchprivate_export.h"

#include "SessionSnapshot.h"

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>

#include <optional>

class QTimer;

namespace SessionWatch
{

/**
 * Tool call in flight
 */
struct SESSIONWATCHPRIVATE_EXPORT CurrentTool {
    QString toolName;
    QJsonObject toolInput;
    qint64 startTime = 0; // ms since epoch
};

/**
 * Completed tool call
 */
struct SESSIONWATCHPRIVATE_EXPORT RecentTool {
    QString toolName;
    QJsonObject toolInput;
    qint64 startTime = 0;
    qint64 endTime = 0;
    qint64 durationMs = 0; // 0 when no matching start was seen
    bool succeeded = true;

    QJsonObject toJson() const;
    static RecentTool fromJson(const QJsonObject &obj);
};

/**
 * SessionRecord is the registry's view of one running session:
 * its process identity from the hooks plus the latest transcript snapshot.
 */
struct SESSIONWATCHPRIVATE_EXPORT SessionRecord {
    // Identity
    QString sessionId;
    QString transcriptPath;
    QString cwd;
    qint64 pid = 0;
    qint64 ppid = 0;
    QString tty;
    QString pidStartTime; // Fingerprint against pid reuse, empty until fetched

    // Content
    std::optional<SessionSnapshot> state;

    // Activity
    std::optional<CurrentTool> currentTool;
    QTimer *staleToolTimer = nullptr; // Owned by the registry, cleared with the tool
    QList<RecentTool> recentTools; // Most recent first

    QDateTime lastActivityTime;

    /**
     * Prepend @p tool, dropping the oldest entries beyond @p capacity
     */
    void pushRecentTool(const RecentTool &tool, int capacity);
};

/**
 * Effective status shown to the user. Working while a tool is in flight or
 * while a task is in progress and the transcript has not finished; otherwise
 * the transcript status. Never persisted.
 */
SESSIONWATCHPRIVATE_EXPORT SessionStatus effectiveStatus(const SessionSnapshot &snapshot, bool toolInFlight);
SESSIONWATCHPRIVATE_EXPORT SessionStatus effectiveStatus(const SessionRecord &record);

/**
 * Compare two working directories after resolving symlinks; case-insensitive on macOS
 */
SESSIONWATCHPRIVATE_EXPORT bool cwdEquals(const QString &a, const QString &b);

/**
 * What the registry publishes for one active session
 */
struct SESSIONWATCHPRIVATE_EXPORT SessionView {
    SessionSnapshot snapshot;
    SessionStatus effectiveStatus = SessionStatus::Paused;
    std::optional<CurrentTool> currentTool;
    QList<RecentTool> recentTools;
    qint64 pid = 0;
    qint64 ppid = 0;
    bool hasTerminal = false;
};

/**
 * PersistedSession is the on-disk form of an active session, used to
 * re-adopt running sessions after a restart.
 */
class SESSIONWATCHPRIVATE_EXPORT PersistedSession
{
public:
    PersistedSession() = default;

    QString sessionId;
    QString transcriptPath;
    QString cwd;
    qint64 pid = 0;
    qint64 ppid = 0;
    QString tty;
    QString pidStartTime;
    QList<RecentTool> recentTools;

    /**
     * A persisted session must identify its process
     */
    bool isValid() const
    {
        return !sessionId.isEmpty() && !transcriptPath.isEmpty() && pid > 0;
    }

    QJsonObject toJson() const;
    static PersistedSession fromJson(const QJsonObject &obj);
    static PersistedSession fromRecord(const SessionRecord &record);

    bool operator==(const PersistedSession &other) const
    {
        return sessionId == other.sessionId;
    }
};

} // namespace SessionWatch

Q_DECLARE_METATYPE(SessionWatch::SessionView)

#endif // SESSIONRECORD_H
