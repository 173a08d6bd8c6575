/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WATCHSETTINGS_H
#define WATCHSETTINGS_H

#include "sessionwatchprivate_export.h"

#include "HookEventServer.h"
#include "SessionRegistry.h"

#include <QObject>
#include <QString>

#include <KSharedConfig>

namespace SessionWatch
{

/**
 * WatchSettings manages the daemon's settings in sessionwatchrc.
 *
 * Groups:
 * - General: projects root, workspace filter, terminal name marker
 * - Timing: debounce intervals, sweep interval, stale tool timeout
 * - Limits: archived/inactive bounds, pending terminals, recent tools
 * - Events: server mode and endpoint file
 */
class SESSIONWATCHPRIVATE_EXPORT WatchSettings : public QObject
{
    Q_OBJECT

public:
    explicit WatchSettings(const QString &configName = QStringLiteral("sessionwatchrc"), QObject *parent = nullptr);
    ~WatchSettings() override;

    /**
     * Directory holding one transcript directory per project (~/.claude/projects)
     */
    QString projectsRoot() const;
    void setProjectsRoot(const QString &path);

    /**
     * Only sessions in this directory are shown; empty shows every session
     */
    QString workspaceFilter() const;
    void setWorkspaceFilter(const QString &path);

    /**
     * Substring identifying agent terminals by name
     */
    QString terminalMarker() const;
    void setTerminalMarker(const QString &marker);

    int debounceMs() const;
    int fileDebounceMs() const;
    int sweepIntervalMs() const;
    int staleToolTimeoutMs() const;

    int maxInactiveSessions() const;
    int inactiveDisplayLimit() const;
    int maxPendingTerminals() const;
    int recentToolCapacity() const;

    HookEventServer::Mode serverMode() const;
    void setServerMode(HookEventServer::Mode mode);

    QString endpointFile() const;
    void setEndpointFile(const QString &path);

    /**
     * Registry tunables from the current values
     */
    RegistryConfig registryConfig() const;

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    int readPositive(const QString &group, const char *key, int defaultValue) const;

    KSharedConfig::Ptr m_config;
};

} // namespace SessionWatch

#endif // WATCHSETTINGS_H
