/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKECOLLABORATORS_H
#define FAKECOLLABORATORS_H

#include "../watch/ProcessInspector.h"
#include "../watch/SessionSnapshot.h"
#include "../watch/TerminalHandle.h"

#include <QHash>
#include <QList>
#include <QPointer>
#include <QTimer>

namespace SessionWatch
{

/**
 * In-memory terminal; answers process id requests synchronously, or from
 * the event loop when deferred
 */
class FakeTerminal : public TerminalHandle
{
public:
    FakeTerminal(const QString &name, qint64 shellPid, QObject *parent = nullptr)
        : TerminalHandle(parent)
        , m_name(name)
        , m_shellPid(shellPid)
    {
    }

    QString name() const override
    {
        return m_name;
    }

    void requestProcessId(std::function<void(qint64)> callback) override
    {
        ++processIdRequests;
        if (deferred) {
            const qint64 pid = m_shellPid;
            QTimer::singleShot(0, this, [callback, pid]() {
                callback(pid);
            });
            return;
        }
        callback(m_shellPid);
    }

    void show() override
    {
        ++showCount;
    }

    void setShellPid(qint64 pid)
    {
        m_shellPid = pid;
    }

    int processIdRequests = 0;
    int showCount = 0;
    bool deferred = false;

private:
    QString m_name;
    qint64 m_shellPid;
};

class FakeTerminalHost : public TerminalHost
{
public:
    using TerminalHost::TerminalHost;

    QList<TerminalHandle *> terminals() const override
    {
        QList<TerminalHandle *> result;
        for (const auto &terminal : m_terminals) {
            if (terminal) {
                result.append(terminal.data());
            }
        }
        return result;
    }

    FakeTerminal *open(const QString &name, qint64 shellPid)
    {
        auto *terminal = new FakeTerminal(name, shellPid, this);
        m_terminals.append(terminal);
        Q_EMIT terminalOpened(terminal);
        return terminal;
    }

    void close(FakeTerminal *terminal)
    {
        m_terminals.removeAll(terminal);
        Q_EMIT terminal->closed();
        Q_EMIT terminalClosed(terminal);
        delete terminal;
    }

private:
    QList<QPointer<FakeTerminal>> m_terminals;
};

/**
 * Process table held in memory: pid -> parent pid and pid -> start time.
 * Answers synchronously; unknown pids report 0 / empty.
 */
class FakeProcessInspector : public ProcessInspector
{
public:
    using ProcessInspector::ProcessInspector;

    void queryParentPid(qint64 pid, std::function<void(qint64)> callback) override
    {
        ++parentQueries;
        callback(parents.value(pid, 0));
    }

    void queryStartTime(qint64 pid, std::function<void(const QString &)> callback) override
    {
        callback(startTimes.value(pid));
    }

    void addProcess(qint64 pid, qint64 ppid, const QString &startTime = QStringLiteral("T0"))
    {
        parents.insert(pid, ppid);
        startTimes.insert(pid, startTime);
    }

    void killProcess(qint64 pid)
    {
        parents.remove(pid);
        startTimes.remove(pid);
    }

    QHash<qint64, qint64> parents;
    QHash<qint64, QString> startTimes;
    int parentQueries = 0;
};

/**
 * Snapshot provider returning canned snapshots by path
 */
class FakeSnapshotProvider : public SnapshotProvider
{
public:
    std::optional<SessionSnapshot> parse(const QString &filePath) const override
    {
        ++parseCount;
        const auto it = snapshots.constFind(filePath);
        if (it == snapshots.constEnd()) {
            return std::nullopt;
        }
        SessionSnapshot snapshot = it.value();
        snapshot.filePath = filePath;
        return snapshot;
    }

    void set(const QString &filePath, const SessionSnapshot &snapshot)
    {
        snapshots.insert(filePath, snapshot);
    }

    QHash<QString, SessionSnapshot> snapshots;
    mutable int parseCount = 0;
};

}

#endif // FAKECOLLABORATORS_H
