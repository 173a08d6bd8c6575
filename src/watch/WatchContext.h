/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WATCHCONTEXT_H
#define WATCHCONTEXT_H

#include "sessionwatchprivate_export.h"

#include "HookEventServer.h"
#include "SessionRegistry.h"

#include <QObject>
#include <QPointer>

#include <memory>

namespace SessionWatch
{

class ProcessTable;
class TerminalLinker;
class TmuxManager;
class TmuxTerminalHost;
class TranscriptParser;
class WatchSettings;

/**
 * WatchContext owns and wires the daemon's components:
 * event server -> registry, tmux panes -> terminal linker.
 */
class SESSIONWATCHPRIVATE_EXPORT WatchContext : public QObject
{
    Q_OBJECT

public:
    WatchContext(WatchSettings *settings, const RegistryConfig &config, HookEventServer::Mode mode, QObject *parent = nullptr);
    ~WatchContext() override;

    /**
     * Start the event server, the terminal host and the registry.
     * Returns false if the event server could not listen; the registry
     * still runs from transcripts alone in that case.
     */
    bool start();
    void stop();

    bool isRunning() const
    {
        return m_running;
    }

    SessionRegistry *registry() const
    {
        return m_registry;
    }

    HookEventServer *server() const
    {
        return m_server;
    }

    TerminalLinker *linker() const
    {
        return m_linker;
    }

private:
    QPointer<WatchSettings> m_settings;
    RegistryConfig m_config;

    ProcessTable *m_processTable = nullptr;
    TmuxManager *m_tmux = nullptr;
    TmuxTerminalHost *m_terminalHost = nullptr;
    TerminalLinker *m_linker = nullptr;
    std::unique_ptr<TranscriptParser> m_parser;
    HookEventServer *m_server = nullptr;
    SessionRegistry *m_registry = nullptr;

    bool m_running = false;
};

} // namespace SessionWatch

#endif // WATCHCONTEXT_H
