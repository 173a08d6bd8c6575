/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxManager.h"

#include <QDebug>
#include <QProcess>
#include <QStandardPaths>

namespace SessionWatch
{

TmuxManager::TmuxManager(QObject *parent)
    : QObject(parent)
{
}

TmuxManager::~TmuxManager() = default;

bool TmuxManager::isAvailable()
{
    const QString tmuxPath = QStandardPaths::findExecutable(QStringLiteral("tmux"));
    return !tmuxPath.isEmpty();
}

QString TmuxManager::paneListFormat()
{
    return QStringLiteral("#{pane_id}\t#{pane_pid}\t#{session_name}\t#{window_name}\t#{pane_current_path}");
}

QList<TmuxManager::PaneInfo> TmuxManager::parsePaneList(const QString &output)
{
    QList<PaneInfo> panes;

    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QStringList parts = line.split(QLatin1Char('\t'));
        if (parts.size() < 4 || !parts[0].startsWith(QLatin1Char('%'))) {
            continue;
        }
        PaneInfo info;
        info.paneId = parts[0];
        info.panePid = parts[1].toLongLong();
        info.sessionName = parts[2];
        info.windowName = parts[3];
        if (parts.size() > 4) {
            info.currentPath = parts[4];
        }
        panes.append(info);
    }

    return panes;
}

void TmuxManager::listPanesAsync(std::function<void(bool, const QList<PaneInfo> &)> callback)
{
    executeCommandAsync({QStringLiteral("list-panes"), QStringLiteral("-a"), QStringLiteral("-F"), paneListFormat()},
                        [callback](bool ok, const QString &output) {
                            if (callback) {
                                callback(ok, ok ? parsePaneList(output) : QList<PaneInfo>());
                            }
                        });
}

void TmuxManager::getPanePidAsync(const QString &paneId, std::function<void(qint64)> callback)
{
    executeCommandAsync({QStringLiteral("display-message"), QStringLiteral("-p"), QStringLiteral("-t"), paneId, QStringLiteral("#{pane_pid}")},
                        [callback](bool ok, const QString &output) {
                            if (!ok || !callback) {
                                if (callback) {
                                    callback(0);
                                }
                                return;
                            }
                            bool converted = false;
                            qint64 pid = output.trimmed().toLongLong(&converted);
                            callback(converted ? pid : 0);
                        });
}

void TmuxManager::selectPaneAsync(const QString &paneId)
{
    // switch-client fails without an attached client; the pane is still selected
    executeCommandAsync({QStringLiteral("switch-client"), QStringLiteral("-t"), paneId}, nullptr);
    executeCommandAsync({QStringLiteral("select-window"), QStringLiteral("-t"), paneId}, nullptr);
    executeCommandAsync({QStringLiteral("select-pane"), QStringLiteral("-t"), paneId}, nullptr);
}

void TmuxManager::executeCommandAsync(const QStringList &args, std::function<void(bool, const QString &)> callback)
{
    auto *process = new QProcess(this);
    connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [this, process, callback](int exitCode, QProcess::ExitStatus) {
        bool ok = (exitCode == 0);
        QString output = QString::fromUtf8(process->readAllStandardOutput());
        if (!ok) {
            QString errorOutput = QString::fromUtf8(process->readAllStandardError());
            if (!errorOutput.isEmpty()) {
                Q_EMIT errorOccurred(errorOutput);
            }
        }
        if (callback) {
            callback(ok, output);
        }
        process->deleteLater();
    });
    connect(process, &QProcess::errorOccurred, this, [this, process, callback](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) {
            return;
        }
        Q_EMIT errorOccurred(process->errorString());
        if (callback) {
            callback(false, QString());
        }
        process->deleteLater();
    });
    process->start(QStringLiteral("tmux"), args);
}

} // namespace SessionWatch

#include "moc_TmuxManager.cpp"
