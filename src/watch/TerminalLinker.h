/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALLINKER_H
#define TERMINALLINKER_H

#include "sessionwatchprivate_export.h"

#include <QHash>
#include <QList>
#include <QObject>
#include <QPair>
#include <QPointer>
#include <QString>

#include <functional>

namespace SessionWatch
{

class ProcessInspector;
class TerminalHandle;
class TerminalHost;

/**
 * TerminalLinker maps sessions to the terminals hosting them.
 *
 * A terminal is identified by its shell pid. A session is linked either
 * when it starts in a terminal that was registered as pending, or lazily
 * by searching the session process's ancestry for a known terminal.
 */
class SESSIONWATCHPRIVATE_EXPORT TerminalLinker : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultMaxPendingTerminals = 50;
    static constexpr int MaxAncestorDepth = 10;

    using PidCorrection = std::function<void(qint64)>;
    using TerminalCallback = std::function<void(TerminalHandle *)>;
    using SessionPredicate = std::function<bool(const QString &)>;

    TerminalLinker(TerminalHost *host, ProcessInspector *inspector, QObject *parent = nullptr);
    ~TerminalLinker() override;

    void setMaxPendingTerminals(int max);
    int maxPendingTerminals() const
    {
        return m_maxPending;
    }

    void setTerminalMarker(const QString &marker);

    /**
     * Consulted when a lookup completes; sessions it rejects are not linked.
     * Without a predicate every session is accepted.
     */
    void setSessionPredicate(SessionPredicate predicate);

    /**
     * Remember a terminal opened before its session is known.
     * The oldest pending terminal is dropped when the list is full.
     */
    void registerPendingTerminal(TerminalHandle *terminal);
    int pendingCount() const;

    /**
     * Promote the pending terminal whose shell pid equals @p parentPid.
     * The terminal stays pending if the session is rejected by then.
     */
    void linkPending(const QString &sessionId, qint64 parentPid, std::function<void(bool)> done = nullptr);

    /**
     * Locate the terminal hosting a session:
     *   1. a terminal whose shell pid equals @p parentPid
     *   2. the nearest terminal among the ancestors of @p pid; @p onPidCorrected
     *      receives that terminal's pid so the caller can fix its record
     *   3. a terminal whose name contains the marker and the basename of
     *      @p cwd, tried only when the ancestry could not be resolved
     */
    void findTerminal(qint64 parentPid, qint64 pid, const QString &cwd, PidCorrection onPidCorrected, TerminalCallback callback);

    /**
     * findTerminal() for a session that missed the pending link; links the result
     */
    void tryLazyLink(const QString &sessionId, qint64 parentPid, qint64 pid, const QString &cwd, PidCorrection onPidCorrected, TerminalCallback done = nullptr);

    /**
     * True when steps 1-2 of findTerminal() would succeed
     */
    void canLink(qint64 pid, qint64 parentPid, std::function<void(bool)> callback);

    /**
     * Ancestors of @p pid, nearest first. Stops at init, on a cycle or after
     * MaxAncestorDepth hops. Empty when the process cannot be inspected.
     */
    void processAncestors(qint64 pid, std::function<void(const QList<qint64> &)> callback);

    TerminalHandle *linkedTerminal(const QString &sessionId) const;
    bool hasLinkedTerminal(const QString &sessionId) const;
    QString sessionForTerminal(TerminalHandle *terminal) const;

    void unlinkSession(const QString &sessionId);
    void clear();

public Q_SLOTS:
    void handleTerminalClosed(SessionWatch::TerminalHandle *terminal);

Q_SIGNALS:
    void terminalLinked(const QString &sessionId);

private:
    using ResolvedTerminals = QList<QPair<QPointer<TerminalHandle>, qint64>>;

    void resolveProcessIds(const QList<TerminalHandle *> &terminals, std::function<void(const ResolvedTerminals &)> callback);
    void walkAncestors(qint64 origin, qint64 current, QList<qint64> chain, std::function<void(const QList<qint64> &)> callback);
    TerminalHandle *matchByName(const QString &cwd) const;
    void link(const QString &sessionId, TerminalHandle *terminal);
    void pruneDeadPending();
    bool acceptsSession(const QString &sessionId) const;

    QPointer<TerminalHost> m_host;
    QPointer<ProcessInspector> m_inspector;
    int m_maxPending = DefaultMaxPendingTerminals;
    QString m_marker = QStringLiteral("claude");
    SessionPredicate m_sessionPredicate;

    QList<QPointer<TerminalHandle>> m_pending; // oldest first
    QHash<QString, QPointer<TerminalHandle>> m_linked; // sessionId -> terminal
    QHash<TerminalHandle *, QString> m_terminalSessions; // terminal -> sessionId
};

} // namespace SessionWatch

#endif // TERMINALLINKER_H
