/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionRegistry.h"

#include "ProcessInspector.h"
#include "TerminalHandle.h"
#include "TerminalLinker.h"
#include "TranscriptParser.h"

#include <QCryptographicHash>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>
#include <QTimer>

#include <algorithm>

namespace SessionWatch
{

namespace
{
qint64 nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

bool toolFailed(const QJsonValue &result)
{
    const QJsonObject obj = result.toObject();
    if (obj.value(QStringLiteral("is_error")).toBool()) {
        return true;
    }
    return obj.contains(QStringLiteral("success")) && !obj.value(QStringLiteral("success")).toBool();
}
}

SessionRegistry::SessionRegistry(const RegistryConfig &config, SnapshotProvider *provider, ProcessInspector *inspector, TerminalLinker *linker, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_provider(provider)
    , m_inspector(inspector)
    , m_linker(linker)
    , m_notifyTimer(new QTimer(this))
    , m_sweepTimer(new QTimer(this))
{
    m_notifyTimer->setSingleShot(true);
    m_notifyTimer->setInterval(m_config.debounceMs);
    connect(m_notifyTimer, &QTimer::timeout, this, &SessionRegistry::notifyNow);

    m_sweepTimer->setInterval(m_config.sweepIntervalMs);
    connect(m_sweepTimer, &QTimer::timeout, this, &SessionRegistry::sweep);

    if (m_linker) {
        connect(m_linker, &TerminalLinker::terminalLinked, this, &SessionRegistry::scheduleNotify);
        QPointer<SessionRegistry> guard(this);
        m_linker->setSessionPredicate([guard](const QString &sessionId) {
            return guard && !guard->m_stopped && guard->isActive(sessionId);
        });
    }
}

SessionRegistry::~SessionRegistry()
{
    stop();
}

void SessionRegistry::start()
{
    if (m_running) {
        return;
    }
    m_running = true;
    m_stopped = false;

    restorePersistedSessions();

    m_watcher = new QFileSystemWatcher(this);
    connect(m_watcher, &QFileSystemWatcher::directoryChanged, this, &SessionRegistry::onDirectoryChanged);
    connect(m_watcher, &QFileSystemWatcher::fileChanged, this, &SessionRegistry::onWatchedFileChanged);

    scanProjects();
    m_sweepTimer->start();

    qDebug() << "SessionRegistry: Started, projects root" << m_config.projectsRoot << "workspace" << m_config.workspacePath;
}

void SessionRegistry::stop()
{
    if (m_stopped) {
        return;
    }

    if (m_running) {
        // Still-pending restores are written back so they survive the restart
        persist();
    }
    m_running = false;
    m_stopped = true;

    m_notifyTimer->stop();
    m_sweepTimer->stop();

    qDeleteAll(m_fileTimers);
    m_fileTimers.clear();

    for (auto it = m_activeSessions.begin(); it != m_activeSessions.end(); ++it) {
        cancelStaleTimer(it.value());
    }

    delete m_watcher;
    m_watcher = nullptr;
    m_watchedPaths.clear();

    m_restoreQueue.clear();
    m_restoring = false;
}

// ============================================================================
// Hook events
// ============================================================================

void SessionRegistry::handleEvent(const HookEvent &event)
{
    switch (event.kind) {
    case HookEvent::Kind::SessionStart:
        handleSessionStart(event);
        break;
    case HookEvent::Kind::SessionEnd:
        handleSessionEnd(event);
        break;
    case HookEvent::Kind::ToolStart:
        handleToolStart(event);
        break;
    case HookEvent::Kind::ToolEnd:
        handleToolEnd(event);
        break;
    }
}

void SessionRegistry::handleSessionStart(const HookEvent &event)
{
    if (event.pid <= 0 || event.transcriptPath.isEmpty()) {
        qWarning() << "SessionRegistry: Ignoring SessionStart without process identity for" << event.sessionId;
        return;
    }
    unmarkEnded(event.sessionId);
    registerSession(event);
}

void SessionRegistry::registerSession(const HookEvent &event)
{
    const QString id = event.sessionId;
    qDebug() << "SessionRegistry: SessionStart" << id << "pid" << event.pid << "ppid" << event.ppid;

    SessionRecord record;
    if (m_activeSessions.contains(id)) {
        // Duplicate delivery or a re-registration from a new process
        SessionRecord previous = takeRecord(id);
        record.state = previous.state;
        record.recentTools = previous.recentTools;
        if (previous.pid == event.pid) {
            record.pidStartTime = previous.pidStartTime;
        }
    }

    const QStringList evicted = evictConflicts(id, event.pid, event.ppid, event.transcriptPath);

    record.sessionId = id;
    record.transcriptPath = event.transcriptPath;
    record.cwd = event.cwd;
    record.pid = event.pid;
    record.ppid = event.ppid;
    record.tty = event.tty;
    record.lastActivityTime = QDateTime::currentDateTime();

    insertRecord(record);
    m_archivedSessions.remove(id);
    persist();

    // Announced only once the active map is consistent again
    for (const QString &victim : evicted) {
        Q_EMIT sessionArchived(victim);
    }

    if (record.pidStartTime.isEmpty()) {
        fetchFingerprint(id, record.pid);
    }
    if (m_linker && !m_linker->hasLinkedTerminal(id)) {
        m_linker->linkPending(id, record.ppid);
    }

    parseFile(record.transcriptPath, true);
    recheckOrphanedAgents();

    Q_EMIT sessionRegistered(id);
    scheduleNotify();
}

bool SessionRegistry::ensureActive(const HookEvent &event)
{
    if (m_activeSessions.contains(event.sessionId)) {
        return true;
    }
    // Sessions started before this registry only announce themselves through tool events
    if (event.pid <= 0 || event.transcriptPath.isEmpty() || m_endedSessions.contains(event.sessionId)) {
        qDebug() << "SessionRegistry: Ignoring" << HookEvent::kindName(event.kind) << "for unknown session" << event.sessionId;
        return false;
    }
    qDebug() << "SessionRegistry: Registering session" << event.sessionId << "from a tool event";
    registerSession(event);
    return m_activeSessions.contains(event.sessionId);
}

void SessionRegistry::handleSessionEnd(const HookEvent &event)
{
    markEnded(event.sessionId);
    if (!m_activeSessions.contains(event.sessionId)) {
        qDebug() << "SessionRegistry: SessionEnd for unknown session" << event.sessionId;
        return;
    }
    archiveSession(event.sessionId, "ended");
}

void SessionRegistry::handleToolStart(const HookEvent &event)
{
    if (!ensureActive(event)) {
        return;
    }

    auto it = m_activeSessions.find(event.sessionId);
    cancelStaleTimer(it.value());
    it->currentTool = CurrentTool{event.toolName, event.toolInput, event.timestamp > 0 ? event.timestamp : nowMs()};
    it->lastActivityTime = QDateTime::currentDateTime();
    armStaleTimer(event.sessionId);

    lazyLink(event.sessionId);
    scheduleNotify();
}

void SessionRegistry::handleToolEnd(const HookEvent &event)
{
    if (!ensureActive(event)) {
        return;
    }

    auto it = m_activeSessions.find(event.sessionId);
    cancelStaleTimer(it.value());

    RecentTool tool;
    tool.toolName = event.toolName;
    tool.toolInput = event.toolInput;
    tool.endTime = event.timestamp > 0 ? event.timestamp : nowMs();
    tool.succeeded = !toolFailed(event.toolResult);

    if (it->currentTool && it->currentTool->toolName == event.toolName) {
        tool.startTime = it->currentTool->startTime;
        tool.durationMs = qMax<qint64>(0, tool.endTime - tool.startTime);
        if (tool.toolInput.isEmpty()) {
            tool.toolInput = it->currentTool->toolInput;
        }
    } else {
        tool.startTime = tool.endTime;
        tool.durationMs = 0;
    }

    it->pushRecentTool(tool, m_config.recentToolCapacity);
    it->currentTool.reset();
    it->lastActivityTime = QDateTime::currentDateTime();

    persist();
    scheduleNotify();
}

// ============================================================================
// Records and indices
// ============================================================================

void SessionRegistry::insertRecord(const SessionRecord &record)
{
    m_activeSessions.insert(record.sessionId, record);
    m_pidIndex.insert(record.pid, record.sessionId);
    // An unknown parent (0) is not an identity
    if (record.ppid > 0) {
        m_ppidIndex.insert(record.ppid, record.sessionId);
    }
    m_pathIndex.insert(record.transcriptPath, record.sessionId);
}

SessionRecord SessionRegistry::takeRecord(const QString &sessionId)
{
    SessionRecord record = m_activeSessions.take(sessionId);
    cancelStaleTimer(record);

    if (m_pidIndex.value(record.pid) == sessionId) {
        m_pidIndex.remove(record.pid);
    }
    if (m_ppidIndex.value(record.ppid) == sessionId) {
        m_ppidIndex.remove(record.ppid);
    }
    if (m_pathIndex.value(record.transcriptPath) == sessionId) {
        m_pathIndex.remove(record.transcriptPath);
    }
    return record;
}

QStringList SessionRegistry::evictConflicts(const QString &sessionId, qint64 pid, qint64 ppid, const QString &transcriptPath)
{
    QStringList victims;
    const QString owners[] = {
        pid > 0 ? m_pidIndex.value(pid) : QString(),
        ppid > 0 ? m_ppidIndex.value(ppid) : QString(),
        m_pathIndex.value(transcriptPath),
    };
    for (const QString &owner : owners) {
        if (!owner.isEmpty() && owner != sessionId && !victims.contains(owner)) {
            victims.append(owner);
        }
    }
    for (const QString &victim : std::as_const(victims)) {
        qDebug() << "SessionRegistry: Evicting stale session" << victim << "for" << sessionId;
        archiveSession(victim, "evicted", false);
    }
    return victims;
}

void SessionRegistry::archiveSession(const QString &sessionId, const char *reason, bool announce)
{
    if (!m_activeSessions.contains(sessionId)) {
        return;
    }

    SessionRecord record = takeRecord(sessionId);
    if (m_linker) {
        m_linker->unlinkSession(sessionId);
    }
    dropAgentsOf(sessionId);

    std::optional<SessionSnapshot> snapshot = record.state;
    if (!snapshot && m_provider) {
        snapshot = m_provider->parse(record.transcriptPath);
    }
    if (snapshot) {
        m_archivedSessions.insert(sessionId, *snapshot);
    }

    qDebug() << "SessionRegistry: Archived session" << sessionId << "(" << reason << ")";
    persist();

    if (announce) {
        Q_EMIT sessionArchived(sessionId);
    }
    scheduleNotify();
}

void SessionRegistry::markEnded(const QString &sessionId)
{
    if (m_endedSessions.contains(sessionId)) {
        return;
    }
    m_endedSessions.insert(sessionId);
    m_endedOrder.append(sessionId);
    while (m_endedOrder.size() > qMax(1, m_config.maxInactiveSessions)) {
        m_endedSessions.remove(m_endedOrder.takeFirst());
    }
}

void SessionRegistry::unmarkEnded(const QString &sessionId)
{
    if (m_endedSessions.remove(sessionId)) {
        m_endedOrder.removeOne(sessionId);
    }
}

void SessionRegistry::dropAgentsOf(const QString &parentSessionId)
{
    for (auto it = m_agentSessions.begin(); it != m_agentSessions.end();) {
        if (it->parentSessionId == parentSessionId) {
            // Back to waiting in case the parent comes back
            m_orphanedAgents.insert(it.key(), parentSessionId);
            it = m_agentSessions.erase(it);
        } else {
            ++it;
        }
    }
}

void SessionRegistry::cancelStaleTimer(SessionRecord &record)
{
    if (!record.staleToolTimer) {
        return;
    }
    record.staleToolTimer->stop();
    record.staleToolTimer->deleteLater();
    record.staleToolTimer = nullptr;
}

void SessionRegistry::armStaleTimer(const QString &sessionId)
{
    auto it = m_activeSessions.find(sessionId);
    if (it == m_activeSessions.end()) {
        return;
    }

    auto *timer = new QTimer(this);
    timer->setSingleShot(true);
    timer->setInterval(m_config.staleToolTimeoutMs);
    connect(timer, &QTimer::timeout, this, [this, sessionId, timer]() {
        onStaleToolExpired(sessionId, timer);
    });
    it->staleToolTimer = timer;
    timer->start();
}

void SessionRegistry::onStaleToolExpired(const QString &sessionId, QTimer *timer)
{
    auto it = m_activeSessions.find(sessionId);
    if (it == m_activeSessions.end() || it->staleToolTimer != timer) {
        return;
    }

    qDebug() << "SessionRegistry: Clearing stale tool" << (it->currentTool ? it->currentTool->toolName : QString()) << "for" << sessionId;
    it->currentTool.reset();
    cancelStaleTimer(it.value());
    scheduleNotify();
}

void SessionRegistry::fetchFingerprint(const QString &sessionId, qint64 pid)
{
    if (!m_inspector) {
        return;
    }

    QPointer<SessionRegistry> guard(this);
    m_inspector->queryStartTime(pid, [guard, sessionId, pid](const QString &fingerprint) {
        if (!guard || guard->m_stopped || fingerprint.isEmpty()) {
            return;
        }
        auto it = guard->m_activeSessions.find(sessionId);
        if (it == guard->m_activeSessions.end() || it->pid != pid || it->pidStartTime == fingerprint) {
            return;
        }
        it->pidStartTime = fingerprint;
        guard->persist();
    });
}

void SessionRegistry::lazyLink(const QString &sessionId)
{
    const SessionRecord *r = record(sessionId);
    if (!m_linker || !r || m_linker->hasLinkedTerminal(sessionId)) {
        return;
    }

    QPointer<SessionRegistry> guard(this);
    const qint64 pid = r->pid;
    m_linker->tryLazyLink(sessionId, r->ppid, pid, r->cwd, [guard, sessionId, pid](qint64 newPpid) {
        if (guard && !guard->m_stopped) {
            guard->correctParentPid(sessionId, pid, newPpid);
        }
    });
}

void SessionRegistry::correctParentPid(const QString &sessionId, qint64 pid, qint64 newPpid)
{
    auto it = m_activeSessions.find(sessionId);
    if (newPpid <= 0 || it == m_activeSessions.end() || it->pid != pid || it->ppid == newPpid) {
        return;
    }

    const QString owner = m_ppidIndex.value(newPpid);
    if (!owner.isEmpty() && owner != sessionId) {
        qDebug() << "SessionRegistry: Not moving" << sessionId << "to ppid" << newPpid << "owned by" << owner;
        return;
    }

    if (m_ppidIndex.value(it->ppid) == sessionId) {
        m_ppidIndex.remove(it->ppid);
    }
    qDebug() << "SessionRegistry: Corrected ppid of" << sessionId << it->ppid << "->" << newPpid;
    it->ppid = newPpid;
    m_ppidIndex.insert(newPpid, sessionId);
    persist();
}

// ============================================================================
// Transcripts
// ============================================================================

void SessionRegistry::handleFileChanged(const QString &filePath)
{
    if (m_stopped) {
        return;
    }

    QTimer *timer = m_fileTimers.value(filePath);
    if (!timer) {
        timer = new QTimer(this);
        timer->setSingleShot(true);
        timer->setInterval(m_config.fileDebounceMs);
        connect(timer, &QTimer::timeout, this, [this, filePath]() {
            if (QTimer *done = m_fileTimers.take(filePath)) {
                done->deleteLater();
            }
            parseFile(filePath, false);
        });
        m_fileTimers.insert(filePath, timer);
    }
    timer->start();
}

void SessionRegistry::handleFileDeleted(const QString &filePath)
{
    if (QTimer *timer = m_fileTimers.take(filePath)) {
        timer->stop();
        timer->deleteLater();
    }
    unwatchPath(filePath);

    const QString sessionId = m_pathIndex.value(filePath);
    if (!sessionId.isEmpty()) {
        takeRecord(sessionId);
        if (m_linker) {
            m_linker->unlinkSession(sessionId);
        }
        dropAgentsOf(sessionId);
        m_archivedSessions.remove(sessionId);
        persist();
        qDebug() << "SessionRegistry: Transcript deleted for active session" << sessionId;
    }

    for (auto it = m_archivedSessions.begin(); it != m_archivedSessions.end();) {
        if (it->filePath == filePath) {
            it = m_archivedSessions.erase(it);
        } else {
            ++it;
        }
    }
    m_agentSessions.remove(filePath);
    m_orphanedAgents.remove(filePath);
    m_fileLastModified.remove(filePath);

    scheduleNotify();
}

void SessionRegistry::parseAndUpdateSession(const QString &filePath)
{
    parseFile(filePath, false);
}

void SessionRegistry::parseFile(const QString &filePath, bool force)
{
    const QFileInfo info(filePath);
    if (!info.exists()) {
        return;
    }

    const qint64 mtime = info.lastModified().toMSecsSinceEpoch();
    if (!force) {
        auto cached = m_fileLastModified.constFind(filePath);
        if (cached != m_fileLastModified.constEnd() && mtime <= cached.value()) {
            return;
        }
    }
    m_fileLastModified.insert(filePath, mtime);

    if (!m_provider) {
        return;
    }
    const std::optional<SessionSnapshot> snapshot = m_provider->parse(filePath);
    if (!snapshot) {
        qDebug() << "SessionRegistry: No state yet for" << filePath;
        return;
    }

    if (snapshot->isAgent) {
        applyAgentSnapshot(filePath, *snapshot);
        scheduleNotify();
        return;
    }

    // The path index wins when the transcript's own id differs from the hook's
    QString sessionId = m_pathIndex.value(filePath);
    if (sessionId.isEmpty() && m_activeSessions.contains(snapshot->sessionId)) {
        sessionId = snapshot->sessionId;
    }

    if (!sessionId.isEmpty()) {
        auto it = m_activeSessions.find(sessionId);
        it->state = *snapshot;
        it->lastActivityTime = QDateTime::currentDateTime();
    } else {
        m_archivedSessions.insert(snapshot->sessionId, *snapshot);
    }

    scheduleNotify();
}

void SessionRegistry::applyAgentSnapshot(const QString &filePath, const SessionSnapshot &snapshot)
{
    const QString parentId = snapshot.parentSessionId;
    if (parentId.isEmpty()) {
        m_agentSessions.remove(filePath);
        m_orphanedAgents.remove(filePath);
        return;
    }

    if (m_activeSessions.contains(parentId)) {
        m_orphanedAgents.remove(filePath);
        m_agentSessions.insert(filePath, snapshot);
    } else {
        m_agentSessions.remove(filePath);
        m_orphanedAgents.insert(filePath, parentId);
    }
}

void SessionRegistry::recheckOrphanedAgents()
{
    QStringList resolved;
    for (auto it = m_orphanedAgents.cbegin(); it != m_orphanedAgents.cend(); ++it) {
        if (m_activeSessions.contains(it.value())) {
            resolved.append(it.key());
        }
    }

    for (const QString &filePath : std::as_const(resolved)) {
        qDebug() << "SessionRegistry: Parent of agent" << filePath << "is active";
        m_orphanedAgents.remove(filePath);
        parseFile(filePath, true);
    }
}

void SessionRegistry::trimInactiveSessions()
{
    const int excess = m_archivedSessions.size() - m_config.maxInactiveSessions;
    if (excess <= 0) {
        return;
    }

    QList<QPair<QDateTime, QString>> byAge;
    byAge.reserve(m_archivedSessions.size());
    for (auto it = m_archivedSessions.cbegin(); it != m_archivedSessions.cend(); ++it) {
        byAge.append(qMakePair(it->lastModified, it.key()));
    }
    std::sort(byAge.begin(), byAge.end());

    for (int i = 0; i < excess; ++i) {
        m_archivedSessions.remove(byAge.at(i).second);
        unmarkEnded(byAge.at(i).second);
    }
    qDebug() << "SessionRegistry: Trimmed" << excess << "old sessions";
}

// ============================================================================
// Watching and sweeping
// ============================================================================

void SessionRegistry::watchPath(const QString &path)
{
    if (!m_watcher || m_watchedPaths.contains(path)) {
        return;
    }
    if (m_watcher->addPath(path)) {
        m_watchedPaths.insert(path);
    }
}

void SessionRegistry::unwatchPath(const QString &path)
{
    if (m_watcher && m_watchedPaths.remove(path)) {
        m_watcher->removePath(path);
    }
}

void SessionRegistry::scanProjects()
{
    const QString root = m_config.projectsRoot;
    if (root.isEmpty() || !QFileInfo(root).isDir()) {
        return;
    }
    watchPath(root);

    const QStringList projects = QDir(root).entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString &project : projects) {
        const QString dirPath = root + QLatin1Char('/') + project;
        watchPath(dirPath);
        scanProjectDir(dirPath, false);
    }
}

void SessionRegistry::scanProjectDir(const QString &dirPath, bool debounce)
{
    QStringList files = QDir(dirPath).entryList({QStringLiteral("*.jsonl")}, QDir::Files, QDir::Name);
    files.erase(std::remove_if(files.begin(),
                               files.end(),
                               [](const QString &name) {
                                   return !TranscriptParser::isTranscriptFileName(name);
                               }),
                files.end());
    // Primary sessions first so their agents find an active parent
    std::stable_partition(files.begin(), files.end(), [](const QString &name) {
        return !TranscriptParser::isAgentFileName(name);
    });

    QStringList paths;
    paths.reserve(files.size());
    for (const QString &name : std::as_const(files)) {
        paths.append(dirPath + QLatin1Char('/') + name);
    }

    const QStringList previous = m_dirEntries.value(dirPath);
    for (const QString &path : previous) {
        if (!paths.contains(path)) {
            handleFileDeleted(path);
        }
    }
    m_dirEntries.insert(dirPath, paths);

    for (const QString &path : std::as_const(paths)) {
        watchPath(path);
        if (debounce) {
            if (!m_fileLastModified.contains(path)) {
                handleFileChanged(path);
            }
        } else {
            parseFile(path, false);
        }
    }
}

void SessionRegistry::onDirectoryChanged(const QString &path)
{
    if (path == m_config.projectsRoot) {
        const QStringList projects = QDir(path).entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
        for (const QString &project : projects) {
            const QString dirPath = path + QLatin1Char('/') + project;
            if (!m_watchedPaths.contains(dirPath)) {
                watchPath(dirPath);
                scanProjectDir(dirPath, true);
            }
        }
        return;
    }

    if (!QFileInfo(path).isDir()) {
        // Whole project removed
        const QStringList previous = m_dirEntries.take(path);
        for (const QString &file : previous) {
            handleFileDeleted(file);
        }
        unwatchPath(path);
        return;
    }
    scanProjectDir(path, true);
}

void SessionRegistry::onWatchedFileChanged(const QString &path)
{
    if (!QFileInfo::exists(path)) {
        handleFileDeleted(path);
        return;
    }
    // Replaced files drop out of the watcher
    if (m_watcher && !m_watcher->files().contains(path)) {
        m_watchedPaths.remove(path);
        watchPath(path);
    }
    handleFileChanged(path);
}

void SessionRegistry::validateActiveSessions()
{
    if (!m_inspector) {
        return;
    }

    const QStringList ids = m_activeSessions.keys();
    for (const QString &sessionId : ids) {
        auto it = m_activeSessions.constFind(sessionId);
        if (it == m_activeSessions.constEnd()) {
            continue;
        }
        const qint64 pid = it->pid;
        const QString fingerprint = it->pidStartTime;

        QPointer<SessionRegistry> guard(this);
        m_inspector->checkProcessValid(pid, fingerprint, [guard, sessionId, pid](bool valid) {
            if (!guard || guard->m_stopped || valid) {
                return;
            }
            const SessionRecord *current = guard->record(sessionId);
            if (!current || current->pid != pid) {
                return;
            }
            guard->markEnded(sessionId);
            guard->archiveSession(sessionId, "process exited");
        });
    }
}

void SessionRegistry::sweep()
{
    scanProjects();
    validateActiveSessions();
}

void SessionRegistry::refresh()
{
    validateActiveSessions();
    scheduleNotify();
}

bool SessionRegistry::terminateSession(const QString &sessionId)
{
    if (!m_activeSessions.contains(sessionId)) {
        return false;
    }
    markEnded(sessionId);
    archiveSession(sessionId, "terminated");
    return true;
}

void SessionRegistry::revealTerminal(const QString &sessionId)
{
    if (!m_linker) {
        return;
    }
    if (TerminalHandle *terminal = m_linker->linkedTerminal(sessionId)) {
        terminal->show();
        return;
    }

    const SessionRecord *r = record(sessionId);
    if (!r) {
        return;
    }

    QPointer<SessionRegistry> guard(this);
    const qint64 pid = r->pid;
    m_linker->tryLazyLink(
        sessionId,
        r->ppid,
        pid,
        r->cwd,
        [guard, sessionId, pid](qint64 newPpid) {
            if (guard && !guard->m_stopped) {
                guard->correctParentPid(sessionId, pid, newPpid);
            }
        },
        [sessionId](TerminalHandle *terminal) {
            if (terminal) {
                terminal->show();
            } else {
                qDebug() << "SessionRegistry: No terminal found for" << sessionId;
            }
        });
}

// ============================================================================
// Notification
// ============================================================================

void SessionRegistry::scheduleNotify()
{
    if (m_stopped) {
        return;
    }
    m_notifyTimer->start();
}

void SessionRegistry::notifyNow()
{
    Q_EMIT activeSessionsChanged(activeSessions());

    trimInactiveSessions();
    Q_EMIT inactiveSessionsChanged(inactiveSessions());

    recheckOrphanedAgents();
}

bool SessionRegistry::matchesWorkspace(const QString &cwd) const
{
    return m_config.workspacePath.isEmpty() || cwdEquals(cwd, m_config.workspacePath);
}

QList<SessionView> SessionRegistry::activeSessions() const
{
    QList<SessionView> sessions;

    for (const SessionRecord &r : m_activeSessions) {
        if (!r.state) {
            continue;
        }
        const QString cwd = r.state->cwd.isEmpty() ? r.cwd : r.state->cwd;
        if (!matchesWorkspace(cwd)) {
            continue;
        }

        SessionView view;
        view.snapshot = *r.state;
        view.effectiveStatus = effectiveStatus(r);
        view.currentTool = r.currentTool;
        view.recentTools = r.recentTools;
        view.pid = r.pid;
        view.ppid = r.ppid;
        view.hasTerminal = m_linker && m_linker->hasLinkedTerminal(r.sessionId);
        sessions.append(view);
    }

    for (const SessionSnapshot &agent : m_agentSessions) {
        if (!m_activeSessions.contains(agent.parentSessionId) || !matchesWorkspace(agent.cwd)) {
            continue;
        }
        SessionView view;
        view.snapshot = agent;
        view.effectiveStatus = effectiveStatus(agent, false);
        sessions.append(view);
    }

    std::stable_sort(sessions.begin(), sessions.end(), [](const SessionView &a, const SessionView &b) {
        return a.snapshot.created > b.snapshot.created;
    });
    return sessions;
}

QList<SessionSnapshot> SessionRegistry::inactiveSessions() const
{
    QList<SessionSnapshot> sessions;

    for (auto it = m_archivedSessions.cbegin(); it != m_archivedSessions.cend(); ++it) {
        const SessionSnapshot &snapshot = it.value();
        if (m_activeSessions.contains(it.key()) || snapshot.isAgent || snapshot.lastUserPrompt.isEmpty()) {
            continue;
        }
        if (!matchesWorkspace(snapshot.cwd)) {
            continue;
        }
        sessions.append(snapshot);
    }

    std::stable_sort(sessions.begin(), sessions.end(), [](const SessionSnapshot &a, const SessionSnapshot &b) {
        return a.lastModified > b.lastModified;
    });
    return sessions.mid(0, m_config.inactiveDisplayLimit);
}

// ============================================================================
// Queries
// ============================================================================

const SessionRecord *SessionRegistry::record(const QString &sessionId) const
{
    auto it = m_activeSessions.constFind(sessionId);
    return it == m_activeSessions.constEnd() ? nullptr : &it.value();
}

QStringList SessionRegistry::activeSessionIds() const
{
    return m_activeSessions.keys();
}

bool SessionRegistry::isActive(const QString &sessionId) const
{
    return m_activeSessions.contains(sessionId);
}

bool SessionRegistry::isArchived(const QString &sessionId) const
{
    return m_archivedSessions.contains(sessionId);
}

std::optional<SessionSnapshot> SessionRegistry::archivedSnapshot(const QString &sessionId) const
{
    auto it = m_archivedSessions.constFind(sessionId);
    if (it == m_archivedSessions.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

int SessionRegistry::archivedCount() const
{
    return m_archivedSessions.size();
}

QString SessionRegistry::sessionIdForPid(qint64 pid) const
{
    return m_pidIndex.value(pid);
}

QString SessionRegistry::sessionIdForPpid(qint64 ppid) const
{
    return m_ppidIndex.value(ppid);
}

QString SessionRegistry::sessionIdForPath(const QString &transcriptPath) const
{
    return m_pathIndex.value(transcriptPath);
}

bool SessionRegistry::isOrphanedAgent(const QString &filePath) const
{
    return m_orphanedAgents.contains(filePath);
}

bool SessionRegistry::isVisibleAgent(const QString &filePath) const
{
    return m_agentSessions.contains(filePath);
}

std::optional<SessionSnapshot> SessionRegistry::parentSession(const SessionSnapshot &snapshot) const
{
    if (snapshot.parentSessionId.isEmpty()) {
        return std::nullopt;
    }
    if (const SessionRecord *parent = record(snapshot.parentSessionId)) {
        if (parent->state) {
            return parent->state;
        }
    }
    return archivedSnapshot(snapshot.parentSessionId);
}

SessionStatus SessionRegistry::effectiveStatusOf(const QString &sessionId) const
{
    if (const SessionRecord *r = record(sessionId)) {
        return effectiveStatus(*r);
    }
    if (const auto archived = archivedSnapshot(sessionId)) {
        return archived->status;
    }
    return SessionStatus::Paused;
}

// ============================================================================
// Persistence
// ============================================================================

QString SessionRegistry::defaultStorePath(const QString &workspacePath)
{
    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation) + QStringLiteral("/sessionwatch");
    if (workspacePath.isEmpty()) {
        return dataDir + QStringLiteral("/registry.json");
    }
    const QByteArray hash = QCryptographicHash::hash(QDir::cleanPath(workspacePath).toUtf8(), QCryptographicHash::Sha1).toHex().left(12);
    return dataDir + QStringLiteral("/registry-") + QString::fromLatin1(hash) + QStringLiteral(".json");
}

QString SessionRegistry::storePath() const
{
    return m_config.storePath.isEmpty() ? defaultStorePath(m_config.workspacePath) : m_config.storePath;
}

QList<PersistedSession> SessionRegistry::loadStore()
{
    const QString filePath = storePath();
    QFile file(filePath);

    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        return {};
    }

    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "SessionRegistry: Discarding unreadable store" << filePath << error.errorString();
        QFile::remove(filePath);
        return {};
    }

    const QJsonObject root = doc.object();
    const int version = root.value(QStringLiteral("version")).toInt();
    if (version != StoreVersion) {
        qWarning() << "SessionRegistry: Discarding store with version" << version << "expected" << StoreVersion;
        QFile::remove(filePath);
        return {};
    }

    QList<PersistedSession> sessions;
    const QJsonArray entries = root.value(QStringLiteral("sessions")).toArray();
    for (const QJsonValue &value : entries) {
        if (!value.isObject()) {
            continue;
        }
        PersistedSession session = PersistedSession::fromJson(value.toObject());
        if (session.isValid() && !sessions.contains(session)) {
            sessions.append(session);
        }
    }
    return sessions;
}

void SessionRegistry::persist()
{
    const QString filePath = storePath();
    QDir().mkpath(QFileInfo(filePath).absolutePath());

    QJsonArray sessions;
    for (const SessionRecord &r : std::as_const(m_activeSessions)) {
        sessions.append(PersistedSession::fromRecord(r).toJson());
    }
    for (const PersistedSession &pending : std::as_const(m_restoreQueue)) {
        if (!m_activeSessions.contains(pending.sessionId)) {
            sessions.append(pending.toJson());
        }
    }

    QJsonObject root;
    root[QStringLiteral("version")] = StoreVersion;
    root[QStringLiteral("sessions")] = sessions;

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "SessionRegistry: Failed to open store" << filePath << file.errorString();
        return;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "SessionRegistry: Failed to write store" << filePath << file.errorString();
    }
}

void SessionRegistry::restorePersistedSessions()
{
    if (m_restoring) {
        return;
    }

    m_restoreQueue = loadStore();
    m_restoredCount = 0;
    m_restoring = true;
    qDebug() << "SessionRegistry: Restoring" << m_restoreQueue.size() << "persisted sessions";
    restoreNext();
}

void SessionRegistry::restoreNext()
{
    if (m_stopped) {
        return;
    }
    if (m_restoreQueue.isEmpty()) {
        m_restoring = false;
        persist();
        Q_EMIT restoreFinished(m_restoredCount);
        return;
    }

    const PersistedSession stored = m_restoreQueue.first();
    QPointer<SessionRegistry> guard(this);

    // The entry leaves the queue only once decided, so persist() keeps it meanwhile
    auto next = [guard, stored]() {
        if (!guard || guard->m_stopped) {
            return;
        }
        if (!guard->m_restoreQueue.isEmpty() && guard->m_restoreQueue.first() == stored) {
            guard->m_restoreQueue.removeFirst();
        }
        guard->restoreNext();
    };

    if (!m_inspector || m_activeSessions.contains(stored.sessionId)) {
        next();
        return;
    }

    m_inspector->checkProcessValid(stored.pid, stored.pidStartTime, [guard, stored, next](bool valid) {
        if (!guard || guard->m_stopped) {
            return;
        }
        if (!valid) {
            qDebug() << "SessionRegistry: Not restoring" << stored.sessionId << "- process" << stored.pid << "is gone or was reused";
            next();
            return;
        }
        if (!guard->matchesWorkspace(stored.cwd)) {
            qDebug() << "SessionRegistry: Not restoring" << stored.sessionId << "- outside workspace";
            next();
            return;
        }
        if (!guard->m_linker) {
            guard->adoptRestored(stored);
            next();
            return;
        }
        guard->m_linker->canLink(stored.pid, stored.ppid, [guard, stored, next](bool linkable) {
            if (!guard || guard->m_stopped) {
                return;
            }
            if (linkable) {
                guard->adoptRestored(stored);
            } else {
                qDebug() << "SessionRegistry: Not restoring" << stored.sessionId << "- no terminal hosts it";
            }
            next();
        });
    });
}

void SessionRegistry::adoptRestored(const PersistedSession &stored)
{
    // A SessionStart that arrived meanwhile is authoritative
    if (m_activeSessions.contains(stored.sessionId) || m_pidIndex.contains(stored.pid) || (stored.ppid > 0 && m_ppidIndex.contains(stored.ppid))
        || m_pathIndex.contains(stored.transcriptPath)) {
        return;
    }

    SessionRecord r;
    r.sessionId = stored.sessionId;
    r.transcriptPath = stored.transcriptPath;
    r.cwd = stored.cwd;
    r.pid = stored.pid;
    r.ppid = stored.ppid;
    r.tty = stored.tty;
    r.pidStartTime = stored.pidStartTime;
    r.recentTools = stored.recentTools.mid(0, m_config.recentToolCapacity);
    r.lastActivityTime = QDateTime::currentDateTime();

    insertRecord(r);
    m_archivedSessions.remove(r.sessionId);
    unmarkEnded(r.sessionId);

    if (r.pidStartTime.isEmpty()) {
        fetchFingerprint(r.sessionId, r.pid);
    }
    parseFile(r.transcriptPath, true);
    lazyLink(r.sessionId);
    recheckOrphanedAgents();

    ++m_restoredCount;
    qDebug() << "SessionRegistry: Restored session" << r.sessionId;
    Q_EMIT sessionRestored(r.sessionId);
    scheduleNotify();
}

} // namespace SessionWatch

#include "moc_SessionRegistry.cpp"
