/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXTERMINALHOST_H
#define TMUXTERMINALHOST_H

#include "TerminalHandle.h"
#include "TmuxManager.h"

#include <QHash>
#include <QPointer>

class QTimer;

namespace SessionWatch
{

/**
 * A tmux pane as a terminal handle
 */
class SESSIONWATCHPRIVATE_EXPORT TmuxPaneTerminal : public TerminalHandle
{
    Q_OBJECT

public:
    TmuxPaneTerminal(TmuxManager *manager, const TmuxManager::PaneInfo &pane, QObject *parent = nullptr);
    ~TmuxPaneTerminal() override;

    QString name() const override;
    void requestProcessId(std::function<void(qint64)> callback) override;
    void show() override;

    QString paneId() const
    {
        return m_pane.paneId;
    }

    void updatePane(const TmuxManager::PaneInfo &pane);

private:
    QPointer<TmuxManager> m_manager;
    TmuxManager::PaneInfo m_pane;
};

/**
 * Terminal host that tracks every tmux pane on the default server.
 *
 * Panes are polled; new ones are announced with terminalOpened() and
 * vanished ones close their handle.
 */
class SESSIONWATCHPRIVATE_EXPORT TmuxTerminalHost : public TerminalHost
{
    Q_OBJECT

public:
    explicit TmuxTerminalHost(TmuxManager *manager, QObject *parent = nullptr);
    ~TmuxTerminalHost() override;

    QList<TerminalHandle *> terminals() const override;

    void start(int refreshIntervalMs);
    void stop();

    /**
     * Reconcile the handles with a fresh pane listing
     */
    void applyPaneList(const QList<TmuxManager::PaneInfo> &panes);

public Q_SLOTS:
    void refresh();

private:
    QPointer<TmuxManager> m_manager;
    QTimer *m_refreshTimer = nullptr;
    QHash<QString, TmuxPaneTerminal *> m_panes; // paneId -> handle
    bool m_refreshInFlight = false;
};

} // namespace SessionWatch

#endif // TMUXTERMINALHOST_H
