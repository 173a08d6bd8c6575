/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxTerminalHost.h"

#include <QDebug>
#include <QSet>
#include <QTimer>

namespace SessionWatch
{

TmuxPaneTerminal::TmuxPaneTerminal(TmuxManager *manager, const TmuxManager::PaneInfo &pane, QObject *parent)
    : TerminalHandle(parent)
    , m_manager(manager)
    , m_pane(pane)
{
}

TmuxPaneTerminal::~TmuxPaneTerminal() = default;

QString TmuxPaneTerminal::name() const
{
    return m_pane.title();
}

void TmuxPaneTerminal::requestProcessId(std::function<void(qint64)> callback)
{
    if (!m_manager) {
        callback(m_pane.panePid);
        return;
    }
    const qint64 listed = m_pane.panePid;
    m_manager->getPanePidAsync(m_pane.paneId, [callback, listed](qint64 pid) {
        callback(pid > 0 ? pid : listed);
    });
}

void TmuxPaneTerminal::show()
{
    if (m_manager) {
        m_manager->selectPaneAsync(m_pane.paneId);
    }
}

void TmuxPaneTerminal::updatePane(const TmuxManager::PaneInfo &pane)
{
    m_pane = pane;
}

TmuxTerminalHost::TmuxTerminalHost(TmuxManager *manager, QObject *parent)
    : TerminalHost(parent)
    , m_manager(manager)
{
}

TmuxTerminalHost::~TmuxTerminalHost()
{
    stop();
}

QList<TerminalHandle *> TmuxTerminalHost::terminals() const
{
    QList<TerminalHandle *> result;
    result.reserve(m_panes.size());
    for (TmuxPaneTerminal *pane : m_panes) {
        result.append(pane);
    }
    return result;
}

void TmuxTerminalHost::start(int refreshIntervalMs)
{
    if (!m_refreshTimer) {
        m_refreshTimer = new QTimer(this);
        connect(m_refreshTimer, &QTimer::timeout, this, &TmuxTerminalHost::refresh);
    }
    m_refreshTimer->start(refreshIntervalMs);
    refresh();
}

void TmuxTerminalHost::stop()
{
    if (m_refreshTimer) {
        m_refreshTimer->stop();
    }
}

void TmuxTerminalHost::refresh()
{
    if (!m_manager || m_refreshInFlight) {
        return;
    }
    m_refreshInFlight = true;

    QPointer<TmuxTerminalHost> guard(this);
    m_manager->listPanesAsync([guard](bool ok, const QList<TmuxManager::PaneInfo> &panes) {
        if (!guard) {
            return;
        }
        guard->m_refreshInFlight = false;
        // No tmux server running means no panes
        guard->applyPaneList(ok ? panes : QList<TmuxManager::PaneInfo>());
    });
}

void TmuxTerminalHost::applyPaneList(const QList<TmuxManager::PaneInfo> &panes)
{
    QSet<QString> seen;

    for (const auto &pane : panes) {
        seen.insert(pane.paneId);
        if (TmuxPaneTerminal *existing = m_panes.value(pane.paneId)) {
            existing->updatePane(pane);
            continue;
        }
        auto *terminal = new TmuxPaneTerminal(m_manager, pane, this);
        m_panes.insert(pane.paneId, terminal);
        qDebug() << "TmuxTerminalHost: Pane opened" << pane.paneId << pane.title();
        Q_EMIT terminalOpened(terminal);
    }

    const QList<QString> known = m_panes.keys();
    for (const QString &paneId : known) {
        if (seen.contains(paneId)) {
            continue;
        }
        TmuxPaneTerminal *terminal = m_panes.take(paneId);
        qDebug() << "TmuxTerminalHost: Pane closed" << paneId;
        Q_EMIT terminal->closed();
        Q_EMIT terminalClosed(terminal);
        terminal->deleteLater();
    }
}

} // namespace SessionWatch

#include "moc_TmuxTerminalHost.cpp"
