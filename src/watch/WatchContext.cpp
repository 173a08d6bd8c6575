/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WatchContext.h"

#include "ProcessTable.h"
#include "TerminalLinker.h"
#include "TmuxManager.h"
#include "TmuxTerminalHost.h"
#include "TranscriptParser.h"
#include "WatchSettings.h"

#include <QDebug>

namespace SessionWatch
{

WatchContext::WatchContext(WatchSettings *settings, const RegistryConfig &config, HookEventServer::Mode mode, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_config(config)
    , m_parser(std::make_unique<TranscriptParser>())
{
    m_processTable = new ProcessTable(this);
    m_tmux = new TmuxManager(this);
    m_terminalHost = new TmuxTerminalHost(m_tmux, this);

    m_linker = new TerminalLinker(m_terminalHost, m_processTable, this);
    if (m_settings) {
        m_linker->setMaxPendingTerminals(m_settings->maxPendingTerminals());
        m_linker->setTerminalMarker(m_settings->terminalMarker());
    }

    const QString endpointFile = m_settings ? m_settings->endpointFile() : EndpointFile::defaultPath();
    m_server = new HookEventServer(endpointFile, this);
    m_server->setMode(mode);

    m_registry = new SessionRegistry(m_config, m_parser.get(), m_processTable, m_linker, this);

    connect(m_server, &HookEventServer::eventReceived, m_registry, &SessionRegistry::handleEvent);
    connect(m_server, &HookEventServer::errorOccurred, this, [](const QString &message) {
        qWarning() << "WatchContext: Event server error:" << message;
    });
    connect(m_terminalHost, &TerminalHost::terminalOpened, m_linker, &TerminalLinker::registerPendingTerminal);
    connect(m_tmux, &TmuxManager::errorOccurred, this, [](const QString &message) {
        qDebug() << "WatchContext: tmux:" << message;
    });
}

WatchContext::~WatchContext()
{
    stop();
    // The registry holds a raw pointer to the parser
    delete m_registry;
    m_registry = nullptr;
}

bool WatchContext::start()
{
    if (m_running) {
        return true;
    }

    const bool listening = m_server->start();
    if (!listening) {
        qWarning() << "WatchContext: No event server; sessions are tracked from transcripts only";
    }

    if (TmuxManager::isAvailable()) {
        m_terminalHost->start(m_config.sweepIntervalMs);
    } else {
        qDebug() << "WatchContext: tmux not found, terminal linking disabled";
    }

    m_registry->start();
    m_running = true;
    return listening;
}

void WatchContext::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    // Registry first so the store is written while every index is intact
    m_registry->stop();
    m_server->stop();
    m_terminalHost->stop();
    m_linker->clear();
}

} // namespace SessionWatch

#include "moc_WatchContext.cpp"
