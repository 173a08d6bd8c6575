/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalLinker.h"

#include "ProcessInspector.h"
#include "TerminalHandle.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

#include <algorithm>
#include <memory>
#include <utility>

namespace SessionWatch
{

TerminalLinker::TerminalLinker(TerminalHost *host, ProcessInspector *inspector, QObject *parent)
    : QObject(parent)
    , m_host(host)
    , m_inspector(inspector)
{
    if (m_host) {
        connect(m_host, &TerminalHost::terminalClosed, this, &TerminalLinker::handleTerminalClosed);
    }
}

TerminalLinker::~TerminalLinker() = default;

void TerminalLinker::setMaxPendingTerminals(int max)
{
    m_maxPending = qMax(1, max);
    while (m_pending.size() > m_maxPending) {
        m_pending.removeFirst();
    }
}

void TerminalLinker::setTerminalMarker(const QString &marker)
{
    m_marker = marker;
}

void TerminalLinker::setSessionPredicate(SessionPredicate predicate)
{
    m_sessionPredicate = std::move(predicate);
}

bool TerminalLinker::acceptsSession(const QString &sessionId) const
{
    return !m_sessionPredicate || m_sessionPredicate(sessionId);
}

void TerminalLinker::pruneDeadPending()
{
    m_pending.erase(std::remove_if(m_pending.begin(),
                                   m_pending.end(),
                                   [](const QPointer<TerminalHandle> &terminal) {
                                       return terminal.isNull();
                                   }),
                    m_pending.end());
}

void TerminalLinker::registerPendingTerminal(TerminalHandle *terminal)
{
    if (!terminal) {
        return;
    }
    pruneDeadPending();
    for (const auto &pending : std::as_const(m_pending)) {
        if (pending == terminal) {
            return;
        }
    }

    if (m_pending.size() >= m_maxPending) {
        m_pending.removeFirst();
    }
    m_pending.append(terminal);
    qDebug() << "TerminalLinker: Registered pending terminal" << terminal->name();
}

int TerminalLinker::pendingCount() const
{
    return static_cast<int>(std::count_if(m_pending.cbegin(), m_pending.cend(), [](const QPointer<TerminalHandle> &terminal) {
        return !terminal.isNull();
    }));
}

void TerminalLinker::linkPending(const QString &sessionId, qint64 parentPid, std::function<void(bool)> done)
{
    pruneDeadPending();

    QList<TerminalHandle *> candidates;
    for (const auto &pending : std::as_const(m_pending)) {
        candidates.append(pending.data());
    }

    QPointer<TerminalLinker> guard(this);
    resolveProcessIds(candidates, [guard, sessionId, parentPid, done](const ResolvedTerminals &resolved) {
        if (!guard) {
            return;
        }
        if (!guard->acceptsSession(sessionId)) {
            qDebug() << "TerminalLinker: Session" << sessionId << "went away before its terminal was found";
            if (done) {
                done(false);
            }
            return;
        }
        for (const auto &entry : resolved) {
            if (entry.first && entry.second == parentPid) {
                guard->m_pending.removeAll(entry.first);
                guard->link(sessionId, entry.first);
                if (done) {
                    done(true);
                }
                return;
            }
        }
        if (done) {
            done(false);
        }
    });
}

void TerminalLinker::findTerminal(qint64 parentPid, qint64 pid, const QString &cwd, PidCorrection onPidCorrected, TerminalCallback callback)
{
    if (!m_host) {
        callback(nullptr);
        return;
    }

    QPointer<TerminalLinker> guard(this);
    resolveProcessIds(m_host->terminals(), [guard, parentPid, pid, cwd, onPidCorrected, callback](const ResolvedTerminals &resolved) {
        if (!guard) {
            return;
        }

        for (const auto &entry : resolved) {
            if (entry.first && entry.second == parentPid) {
                callback(entry.first);
                return;
            }
        }

        auto byName = [guard, cwd, callback]() {
            TerminalHandle *terminal = guard->matchByName(cwd);
            if (terminal) {
                qDebug() << "TerminalLinker: Matched terminal by name" << terminal->name();
            }
            callback(terminal);
        };

        if (pid <= 0) {
            byName();
            return;
        }

        guard->processAncestors(pid, [guard, resolved, onPidCorrected, callback, byName](const QList<qint64> &ancestors) {
            if (!guard) {
                return;
            }
            if (ancestors.isEmpty()) {
                byName();
                return;
            }
            for (qint64 ancestor : ancestors) {
                for (const auto &entry : resolved) {
                    if (entry.first && entry.second == ancestor) {
                        if (onPidCorrected) {
                            onPidCorrected(ancestor);
                        }
                        callback(entry.first);
                        return;
                    }
                }
            }
            qDebug() << "TerminalLinker: No terminal among ancestors" << ancestors;
            callback(nullptr);
        });
    });
}

void TerminalLinker::tryLazyLink(const QString &sessionId, qint64 parentPid, qint64 pid, const QString &cwd, PidCorrection onPidCorrected, TerminalCallback done)
{
    QPointer<TerminalLinker> guard(this);
    findTerminal(parentPid, pid, cwd, onPidCorrected, [guard, sessionId, done](TerminalHandle *terminal) {
        if (!guard) {
            return;
        }
        if (!guard->acceptsSession(sessionId)) {
            qDebug() << "TerminalLinker: Session" << sessionId << "went away before its terminal was found";
            if (done) {
                done(nullptr);
            }
            return;
        }
        if (terminal) {
            guard->m_pending.removeAll(terminal);
            guard->link(sessionId, terminal);
        } else {
            qDebug() << "TerminalLinker: Lazy link failed for session" << sessionId;
        }
        if (done) {
            done(terminal);
        }
    });
}

void TerminalLinker::canLink(qint64 pid, qint64 parentPid, std::function<void(bool)> callback)
{
    if (!m_host) {
        callback(false);
        return;
    }

    QPointer<TerminalLinker> guard(this);
    resolveProcessIds(m_host->terminals(), [guard, pid, parentPid, callback](const ResolvedTerminals &resolved) {
        if (!guard) {
            return;
        }
        for (const auto &entry : resolved) {
            if (entry.first && entry.second == parentPid) {
                callback(true);
                return;
            }
        }
        if (pid <= 0) {
            callback(false);
            return;
        }
        guard->processAncestors(pid, [resolved, callback](const QList<qint64> &ancestors) {
            for (const auto &entry : resolved) {
                if (entry.first && ancestors.contains(entry.second)) {
                    callback(true);
                    return;
                }
            }
            callback(false);
        });
    });
}

void TerminalLinker::processAncestors(qint64 pid, std::function<void(const QList<qint64> &)> callback)
{
    if (pid <= 1 || !m_inspector) {
        callback({});
        return;
    }
    walkAncestors(pid, pid, {}, callback);
}

void TerminalLinker::walkAncestors(qint64 origin, qint64 current, QList<qint64> chain, std::function<void(const QList<qint64> &)> callback)
{
    if (chain.size() >= MaxAncestorDepth || !m_inspector) {
        callback(chain);
        return;
    }

    QPointer<TerminalLinker> guard(this);
    m_inspector->queryParentPid(current, [guard, origin, chain, callback](qint64 parent) mutable {
        if (!guard) {
            return;
        }
        if (parent <= 1 || parent == origin || chain.contains(parent)) {
            callback(chain);
            return;
        }
        chain.append(parent);
        guard->walkAncestors(origin, parent, chain, callback);
    });
}

void TerminalLinker::resolveProcessIds(const QList<TerminalHandle *> &terminals, std::function<void(const ResolvedTerminals &)> callback)
{
    QList<QPointer<TerminalHandle>> live;
    for (TerminalHandle *terminal : terminals) {
        if (terminal) {
            live.append(terminal);
        }
    }

    if (live.isEmpty()) {
        callback({});
        return;
    }

    // Replies may arrive in any order; keep the terminal order stable
    auto results = std::make_shared<QList<qint64>>(live.size(), 0);
    auto remaining = std::make_shared<int>(live.size());

    for (int i = 0; i < live.size(); ++i) {
        QPointer<TerminalHandle> terminal = live.at(i);
        terminal->requestProcessId([live, results, remaining, i, callback](qint64 pid) {
            (*results)[i] = pid;
            if (--(*remaining) > 0) {
                return;
            }
            ResolvedTerminals resolved;
            for (int j = 0; j < live.size(); ++j) {
                // Terminals closed mid-lookup are skipped
                if (live.at(j) && results->at(j) > 0) {
                    resolved.append(qMakePair(live.at(j), results->at(j)));
                }
            }
            callback(resolved);
        });
    }
}

TerminalHandle *TerminalLinker::matchByName(const QString &cwd) const
{
    if (!m_host || cwd.isEmpty() || m_marker.isEmpty()) {
        return nullptr;
    }

    const QString project = QFileInfo(QDir::cleanPath(cwd)).fileName().toLower();
    if (project.isEmpty()) {
        return nullptr;
    }

    const QList<TerminalHandle *> terminals = m_host->terminals();
    for (TerminalHandle *terminal : terminals) {
        if (!terminal) {
            continue;
        }
        const QString name = terminal->name().toLower();
        if (name.contains(m_marker.toLower()) && name.contains(project)) {
            return terminal;
        }
    }
    return nullptr;
}

void TerminalLinker::link(const QString &sessionId, TerminalHandle *terminal)
{
    // A terminal hosts one session at a time
    const QString previous = m_terminalSessions.value(terminal);
    if (!previous.isEmpty() && previous != sessionId) {
        m_linked.remove(previous);
    }
    TerminalHandle *old = m_linked.value(sessionId).data();
    if (old && old != terminal) {
        m_terminalSessions.remove(old);
    }

    m_linked.insert(sessionId, terminal);
    m_terminalSessions.insert(terminal, sessionId);
    qDebug() << "TerminalLinker: Linked session" << sessionId << "to" << terminal->name();
    Q_EMIT terminalLinked(sessionId);
}

TerminalHandle *TerminalLinker::linkedTerminal(const QString &sessionId) const
{
    return m_linked.value(sessionId).data();
}

bool TerminalLinker::hasLinkedTerminal(const QString &sessionId) const
{
    return linkedTerminal(sessionId) != nullptr;
}

QString TerminalLinker::sessionForTerminal(TerminalHandle *terminal) const
{
    return m_terminalSessions.value(terminal);
}

void TerminalLinker::unlinkSession(const QString &sessionId)
{
    m_linked.remove(sessionId);
    // The handle may already be destroyed; its raw pointer key is still removable
    for (auto it = m_terminalSessions.begin(); it != m_terminalSessions.end();) {
        if (it.value() == sessionId) {
            it = m_terminalSessions.erase(it);
        } else {
            ++it;
        }
    }
}

void TerminalLinker::handleTerminalClosed(TerminalHandle *terminal)
{
    const QString sessionId = m_terminalSessions.take(terminal);
    if (!sessionId.isEmpty()) {
        m_linked.remove(sessionId);
        qDebug() << "TerminalLinker: Removed linked terminal for session" << sessionId;
    }
    m_pending.removeAll(terminal);
    pruneDeadPending();
}

void TerminalLinker::clear()
{
    m_pending.clear();
    m_linked.clear();
    m_terminalSessions.clear();
}

} // namespace SessionWatch

#include "moc_TerminalLinker.cpp"
