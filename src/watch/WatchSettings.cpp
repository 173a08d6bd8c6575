/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WatchSettings.h"

#include <KConfigGroup>
#include <QDir>

namespace SessionWatch
{

WatchSettings::WatchSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    // Load config from ~/.config/sessionwatchrc
    m_config = KSharedConfig::openConfig(configName);
}

WatchSettings::~WatchSettings()
{
    save();
}

int WatchSettings::readPositive(const QString &group, const char *key, int defaultValue) const
{
    KConfigGroup configGroup(m_config, group);
    const int value = configGroup.readEntry(key, defaultValue);
    return value > 0 ? value : defaultValue;
}

QString WatchSettings::projectsRoot() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    QString defaultRoot = QDir::homePath() + QStringLiteral("/.claude/projects");
    return group.readEntry("ProjectsRoot", defaultRoot);
}

void WatchSettings::setProjectsRoot(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("ProjectsRoot", path);
    Q_EMIT settingsChanged();
}

QString WatchSettings::workspaceFilter() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return group.readEntry("WorkspaceFilter", QString());
}

void WatchSettings::setWorkspaceFilter(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("WorkspaceFilter", path);
    Q_EMIT settingsChanged();
}

QString WatchSettings::terminalMarker() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return group.readEntry("TerminalMarker", QStringLiteral("claude"));
}

void WatchSettings::setTerminalMarker(const QString &marker)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("TerminalMarker", marker);
    Q_EMIT settingsChanged();
}

int WatchSettings::debounceMs() const
{
    return readPositive(QStringLiteral("Timing"), "DebounceMs", 150);
}

int WatchSettings::fileDebounceMs() const
{
    return readPositive(QStringLiteral("Timing"), "FileDebounceMs", 100);
}

int WatchSettings::sweepIntervalMs() const
{
    return readPositive(QStringLiteral("Timing"), "SweepIntervalMs", 2000);
}

int WatchSettings::staleToolTimeoutMs() const
{
    return readPositive(QStringLiteral("Timing"), "StaleToolTimeoutMs", 30000);
}

int WatchSettings::maxInactiveSessions() const
{
    return readPositive(QStringLiteral("Limits"), "MaxInactiveSessions", 100);
}

int WatchSettings::inactiveDisplayLimit() const
{
    return readPositive(QStringLiteral("Limits"), "InactiveDisplayLimit", 20);
}

int WatchSettings::maxPendingTerminals() const
{
    return readPositive(QStringLiteral("Limits"), "MaxPendingTerminals", 50);
}

int WatchSettings::recentToolCapacity() const
{
    return readPositive(QStringLiteral("Limits"), "RecentToolCapacity", 15);
}

HookEventServer::Mode WatchSettings::serverMode() const
{
    KConfigGroup group(m_config, QStringLiteral("Events"));
    const QString mode = group.readEntry("ServerMode", QStringLiteral("tcp"));
    return mode.compare(QLatin1String("local"), Qt::CaseInsensitive) == 0 ? HookEventServer::LocalSocket : HookEventServer::TCP;
}

void WatchSettings::setServerMode(HookEventServer::Mode mode)
{
    KConfigGroup group(m_config, QStringLiteral("Events"));
    group.writeEntry("ServerMode", mode == HookEventServer::LocalSocket ? QStringLiteral("local") : QStringLiteral("tcp"));
    Q_EMIT settingsChanged();
}

QString WatchSettings::endpointFile() const
{
    KConfigGroup group(m_config, QStringLiteral("Events"));
    return group.readEntry("EndpointFile", EndpointFile::defaultPath());
}

void WatchSettings::setEndpointFile(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Events"));
    group.writeEntry("EndpointFile", path);
    Q_EMIT settingsChanged();
}

RegistryConfig WatchSettings::registryConfig() const
{
    RegistryConfig config;
    config.projectsRoot = projectsRoot();
    config.workspacePath = workspaceFilter();
    config.debounceMs = debounceMs();
    config.fileDebounceMs = fileDebounceMs();
    config.sweepIntervalMs = sweepIntervalMs();
    config.staleToolTimeoutMs = staleToolTimeoutMs();
    config.maxInactiveSessions = maxInactiveSessions();
    config.inactiveDisplayLimit = inactiveDisplayLimit();
    config.recentToolCapacity = recentToolCapacity();
    return config;
}

void WatchSettings::save()
{
    m_config->sync();
}

} // namespace SessionWatch

#include "moc_WatchSettings.cpp"
