/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOOKEVENTSERVER_H
#define HOOKEVENTSERVER_H

#include "sessionwatchprivate_export.h"

#include "EndpointFile.h"
#include "HookEvent.h"

#include <QObject>
#include <QSet>
#include <QString>

class QIODevice;
class QLocalServer;
class QTcpServer;

namespace SessionWatch
{

/**
 * HookEventServer receives hook events from sessionwatch-hook.
 *
 * Supports two modes:
 * - TCP: QTcpServer on 127.0.0.1 with a dynamic port (default)
 * - LocalSocket: QLocalServer in the sessionwatch data directory
 *
 * Each connection carries newline-delimited JSON objects. Lines that do
 * not decode are logged and dropped; the connection stays open. The
 * listening address is appended to the endpoint file on start and
 * removed from it on stop.
 */
class SESSIONWATCHPRIVATE_EXPORT HookEventServer : public QObject
{
    Q_OBJECT

public:
    enum Mode {
        TCP,
        LocalSocket,
    };

    explicit HookEventServer(const QString &endpointFilePath = EndpointFile::defaultPath(), QObject *parent = nullptr);
    ~HookEventServer() override;

    /**
     * Set the server mode (must be called before start())
     */
    void setMode(Mode mode)
    {
        m_mode = mode;
    }

    Mode mode() const
    {
        return m_mode;
    }

    QString socketPath() const
    {
        return m_socketPath;
    }

    /**
     * Override the local socket path (must be called before start())
     */
    void setSocketPath(const QString &path)
    {
        m_socketPath = path;
    }

    /**
     * TCP port, 0 if not started
     */
    quint16 tcpPort() const
    {
        return m_tcpPort;
    }

    QString endpointFilePath() const
    {
        return m_endpointFile.path();
    }

    bool start();
    void stop();
    bool isRunning() const;

    /**
     * Address published in the endpoint file: "127.0.0.1:PORT" or the socket path
     */
    QString connectionString() const;

    /**
     * Base directory for sessionwatch runtime data
     */
    static QString dataDir();

Q_SIGNALS:
    void eventReceived(const SessionWatch::HookEvent &event);
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString &message);

private Q_SLOTS:
    void onNewConnection();
    void onTcpNewConnection();

private:
    void attachClient(QIODevice *client);
    void detachClient(QIODevice *client);
    void readLines(QIODevice *client);
    void handleMessage(const QByteArray &data);
    bool startLocalSocket();
    bool startTcp();

    Mode m_mode = TCP;
    EndpointFile m_endpointFile;
    QString m_socketPath;
    QLocalServer *m_server = nullptr;
    QTcpServer *m_tcpServer = nullptr;
    quint16 m_tcpPort = 0;
    QSet<QIODevice *> m_clients;
    bool m_running = false;
};

/**
 * Client side used by the hook tool to deliver one event
 */
class SESSIONWATCHPRIVATE_EXPORT HookEventClient : public QObject
{
    Q_OBJECT

public:
    explicit HookEventClient(QObject *parent = nullptr);
    ~HookEventClient() override;

    /**
     * Send @p event as one line to @p address; blocking, bounded by @p timeoutMs
     */
    bool sendEvent(const QString &address, const HookEvent &event, int timeoutMs = 1000);

    /**
     * Send to every address in the endpoint file; returns how many accepted it
     */
    int broadcast(const EndpointFile &endpoints, const HookEvent &event, int timeoutMs = 1000);
};

} // namespace SessionWatch

#endif // HOOKEVENTSERVER_H
