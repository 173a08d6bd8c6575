/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONREGISTRY_H
#define SESSIONREGISTRY_H

#include "sessionwatchprivate_export.h"

#include "HookEvent.h"
#include "SessionRecord.h"
#include "SessionSnapshot.h"

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QSet>
#include <QString>
#include <QStringList>

class QFileSystemWatcher;
class QTimer;

namespace SessionWatch
{

class ProcessInspector;
class TerminalLinker;

/**
 * Tunables of the registry; WatchSettings produces one from the config file
 */
struct SESSIONWATCHPRIVATE_EXPORT RegistryConfig {
    QString projectsRoot; // Directory holding one subdirectory per project
    QString workspacePath; // Only sessions whose cwd matches are shown; empty shows all
    QString storePath; // Persisted sessions; empty uses defaultStorePath()

    int debounceMs = 150;
    int fileDebounceMs = 100;
    int sweepIntervalMs = 2000;
    int staleToolTimeoutMs = 30000;

    int maxInactiveSessions = 100;
    int inactiveDisplayLimit = 20;
    int recentToolCapacity = 15;
};

/**
 * SessionRegistry reconciles hook events with transcript snapshots.
 *
 * Active sessions are created by SessionStart, updated by tool events and
 * transcript re-parses, and archived on SessionEnd, process death or manual
 * termination. Active records are indexed by pid, parent pid and transcript
 * path; each index has exactly one entry per active record, so a second
 * session claiming the same pid or parent pid evicts the first. An unknown
 * parent pid (0) is not indexed and never evicts.
 *
 * Snapshots of transcripts without an active record are kept as archived
 * sessions. Agent transcripts are shown while their parent is active; an
 * agent whose parent is not active yet waits in the orphan set.
 *
 * Active sessions are persisted and re-adopted on start() when their
 * process is still the same process (pid plus start time).
 *
 * Every change schedules one debounced update; activeSessionsChanged()
 * and inactiveSessionsChanged() fire once per quiet period.
 */
class SESSIONWATCHPRIVATE_EXPORT SessionRegistry : public QObject
{
    Q_OBJECT

public:
    static constexpr int StoreVersion = 1;

    SessionRegistry(const RegistryConfig &config, SnapshotProvider *provider, ProcessInspector *inspector, TerminalLinker *linker, QObject *parent = nullptr);
    ~SessionRegistry() override;

    /**
     * Restore persisted sessions, scan the projects tree, start watching
     * and start the periodic sweep
     */
    void start();

    /**
     * Cancel every timer and write the store synchronously
     */
    void stop();

    bool isRunning() const
    {
        return m_running;
    }

    const RegistryConfig &config() const
    {
        return m_config;
    }

    QString storePath() const;
    static QString defaultStorePath(const QString &workspacePath = QString());

    // Queries
    QList<SessionView> activeSessions() const;
    QList<SessionSnapshot> inactiveSessions() const;

    const SessionRecord *record(const QString &sessionId) const;
    QStringList activeSessionIds() const;
    bool isActive(const QString &sessionId) const;
    bool isArchived(const QString &sessionId) const;
    std::optional<SessionSnapshot> archivedSnapshot(const QString &sessionId) const;
    int archivedCount() const;

    QString sessionIdForPid(qint64 pid) const;
    QString sessionIdForPpid(qint64 ppid) const;
    QString sessionIdForPath(const QString &transcriptPath) const;
    const QHash<qint64, QString> &pidIndex() const
    {
        return m_pidIndex;
    }
    const QHash<qint64, QString> &ppidIndex() const
    {
        return m_ppidIndex;
    }
    const QHash<QString, QString> &pathIndex() const
    {
        return m_pathIndex;
    }

    bool isOrphanedAgent(const QString &filePath) const;
    bool isVisibleAgent(const QString &filePath) const;

    /**
     * Parent of an agent snapshot: the active record's snapshot, else the archived one
     */
    std::optional<SessionSnapshot> parentSession(const SessionSnapshot &snapshot) const;

    SessionStatus effectiveStatusOf(const QString &sessionId) const;

    /**
     * Sessions that ended recently; late tool events for them are dropped.
     * Bounded by maxInactiveSessions, oldest forgotten first.
     */
    bool hasEnded(const QString &sessionId) const
    {
        return m_endedSessions.contains(sessionId);
    }
    int endedSessionCount() const
    {
        return m_endedOrder.size();
    }

    /**
     * Restoring persisted sessions is sequential; true until the last one is decided
     */
    bool isRestoring() const
    {
        return m_restoring;
    }

public Q_SLOTS:
    void handleEvent(const SessionWatch::HookEvent &event);
    void handleSessionStart(const SessionWatch::HookEvent &event);
    void handleSessionEnd(const SessionWatch::HookEvent &event);
    void handleToolStart(const SessionWatch::HookEvent &event);
    void handleToolEnd(const SessionWatch::HookEvent &event);

    /**
     * Debounced per file; the transcript is re-parsed once it settles
     */
    void handleFileChanged(const QString &filePath);
    void handleFileDeleted(const QString &filePath);

    /**
     * Re-parse @p filePath if its mtime advanced since the last parse
     */
    void parseAndUpdateSession(const QString &filePath);

    void scanProjects();
    void validateActiveSessions();
    void sweep();

    /**
     * Liveness pass plus an update
     */
    void refresh();

    /**
     * Archive an active session. False if it is not active.
     */
    bool terminateSession(const QString &sessionId);

    void revealTerminal(const QString &sessionId);

    void restorePersistedSessions();

Q_SIGNALS:
    void activeSessionsChanged(const QList<SessionWatch::SessionView> &sessions);
    void inactiveSessionsChanged(const QList<SessionWatch::SessionSnapshot> &sessions);

    void sessionRegistered(const QString &sessionId);
    void sessionArchived(const QString &sessionId);
    void sessionRestored(const QString &sessionId);
    void restoreFinished(int restoredCount);

private Q_SLOTS:
    void onDirectoryChanged(const QString &path);
    void onWatchedFileChanged(const QString &path);

private:
    void registerSession(const HookEvent &event);
    bool ensureActive(const HookEvent &event);
    void insertRecord(const SessionRecord &record);
    SessionRecord takeRecord(const QString &sessionId);
    void archiveSession(const QString &sessionId, const char *reason, bool announce = true);
    QStringList evictConflicts(const QString &sessionId, qint64 pid, qint64 ppid, const QString &transcriptPath);
    void markEnded(const QString &sessionId);
    void unmarkEnded(const QString &sessionId);
    void cancelStaleTimer(SessionRecord &record);
    void armStaleTimer(const QString &sessionId);
    void onStaleToolExpired(const QString &sessionId, QTimer *timer);
    void correctParentPid(const QString &sessionId, qint64 pid, qint64 newPpid);
    void fetchFingerprint(const QString &sessionId, qint64 pid);
    void lazyLink(const QString &sessionId);
    void dropAgentsOf(const QString &parentSessionId);

    void parseFile(const QString &filePath, bool force);
    void applyAgentSnapshot(const QString &filePath, const SessionSnapshot &snapshot);
    void recheckOrphanedAgents();
    void trimInactiveSessions();

    void scheduleNotify();
    void notifyNow();

    bool matchesWorkspace(const QString &cwd) const;
    void watchPath(const QString &path);
    void scanProjectDir(const QString &dirPath, bool debounce);
    void unwatchPath(const QString &path);

    QList<PersistedSession> loadStore();
    void persist();
    void restoreNext();
    void adoptRestored(const PersistedSession &stored);

    RegistryConfig m_config;
    SnapshotProvider *m_provider = nullptr;
    QPointer<ProcessInspector> m_inspector;
    QPointer<TerminalLinker> m_linker;

    bool m_running = false;
    bool m_stopped = false;

    QHash<QString, SessionRecord> m_activeSessions;
    QHash<qint64, QString> m_pidIndex;
    QHash<qint64, QString> m_ppidIndex;
    QHash<QString, QString> m_pathIndex; // transcriptPath -> sessionId

    QHash<QString, SessionSnapshot> m_archivedSessions; // sessionId -> snapshot
    QHash<QString, SessionSnapshot> m_agentSessions; // filePath -> snapshot, parent active
    QHash<QString, QString> m_orphanedAgents; // filePath -> parentSessionId

    QHash<QString, qint64> m_fileLastModified; // filePath -> mtime (ms)
    QHash<QString, QTimer *> m_fileTimers;
    QHash<QString, QStringList> m_dirEntries; // project dir -> transcript paths
    QSet<QString> m_watchedPaths;
    QSet<QString> m_endedSessions; // Late tool events must not revive these
    QStringList m_endedOrder; // Same ids, oldest first

    QTimer *m_notifyTimer = nullptr;
    QTimer *m_sweepTimer = nullptr;
    QFileSystemWatcher *m_watcher = nullptr;

    QList<PersistedSession> m_restoreQueue;
    bool m_restoring = false;
    int m_restoredCount = 0;
};

} // namespace SessionWatch

#endif // SESSIONREGISTRY_H
