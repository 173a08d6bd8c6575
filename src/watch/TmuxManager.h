/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXMANAGER_H
#define TMUXMANAGER_H

#include "sessionwatchprivate_export.h"

#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

namespace SessionWatch
{

/**
 * TmuxManager runs tmux commands on behalf of the tmux terminal host.
 *
 * Every tmux pane is a terminal; the pane's shell is its process.
 */
class SESSIONWATCHPRIVATE_EXPORT TmuxManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Information about a tmux pane
     */
    struct PaneInfo {
        QString paneId; // e.g. "%3"
        qint64 panePid = 0; // Shell running in the pane
        QString sessionName;
        QString windowName;
        QString currentPath;

        QString title() const
        {
            return sessionName + QLatin1Char(':') + windowName;
        }
    };

    explicit TmuxManager(QObject *parent = nullptr);
    ~TmuxManager() override;

    /**
     * Check if tmux is available on the system
     */
    static bool isAvailable();

    /**
     * Format string passed to list-panes; fields are tab separated
     */
    static QString paneListFormat();

    /**
     * Parse list-panes output produced with paneListFormat()
     */
    static QList<PaneInfo> parsePaneList(const QString &output);

    void listPanesAsync(std::function<void(bool, const QList<PaneInfo> &)> callback);

    void getPanePidAsync(const QString &paneId, std::function<void(qint64)> callback);

    /**
     * Bring a pane to the front of the attached client
     */
    void selectPaneAsync(const QString &paneId);

Q_SIGNALS:
    /**
     * Emitted when an error occurs during tmux operations
     */
    void errorOccurred(const QString &message);

private:
    void executeCommandAsync(const QStringList &args, std::function<void(bool, const QString &)> callback);
};

} // namespace SessionWatch

#endif // TMUXMANAGER_H
