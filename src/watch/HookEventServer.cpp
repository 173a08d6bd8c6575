/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HookEventServer.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QLocalServer>
#include <QLocalSocket>
#include <QStandardPaths>
#include <QTcpServer>
#include <QTcpSocket>

namespace SessionWatch
{

// ============================================================================
// HookEventServer
// ============================================================================

HookEventServer::HookEventServer(const QString &endpointFilePath, QObject *parent)
    : QObject(parent)
    , m_endpointFile(endpointFilePath)
{
    m_socketPath = dataDir() + QStringLiteral("/sockets/hooks-%1.sock").arg(QCoreApplication::applicationPid());
}

HookEventServer::~HookEventServer()
{
    stop();
}

QString HookEventServer::dataDir()
{
    QString dataHome = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return dataHome + QStringLiteral("/sessionwatch");
}

bool HookEventServer::start()
{
    if (m_running) {
        return true;
    }

    const bool started = (m_mode == TCP) ? startTcp() : startLocalSocket();
    if (!started) {
        return false;
    }

    m_running = true;
    if (!m_endpointFile.add(connectionString())) {
        // Still listening; hooks just cannot discover us
        qWarning() << "HookEventServer: Failed to publish endpoint to" << m_endpointFile.path();
        Q_EMIT errorOccurred(QStringLiteral("Failed to publish endpoint to ") + m_endpointFile.path());
    }
    qDebug() << "HookEventServer: Listening on" << connectionString();
    return true;
}

bool HookEventServer::startTcp()
{
    m_tcpServer = new QTcpServer(this);
    connect(m_tcpServer, &QTcpServer::newConnection, this, &HookEventServer::onTcpNewConnection);

    if (!m_tcpServer->listen(QHostAddress::LocalHost, 0)) {
        qWarning() << "HookEventServer: Failed to start TCP server:" << m_tcpServer->errorString();
        Q_EMIT errorOccurred(QStringLiteral("Failed to start TCP server: ") + m_tcpServer->errorString());
        delete m_tcpServer;
        m_tcpServer = nullptr;
        return false;
    }

    m_tcpPort = m_tcpServer->serverPort();
    return true;
}

bool HookEventServer::startLocalSocket()
{
    const QString dir = QFileInfo(m_socketPath).absolutePath();
    if (!QDir().mkpath(dir)) {
        qWarning() << "HookEventServer: Failed to create" << dir;
    }

    // Remove old socket file if exists
    if (QFile::exists(m_socketPath)) {
        QFile::remove(m_socketPath);
    }

    m_server = new QLocalServer(this);
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    connect(m_server, &QLocalServer::newConnection, this, &HookEventServer::onNewConnection);

    if (!m_server->listen(m_socketPath)) {
        qWarning() << "HookEventServer: Failed to start hook server:" << m_server->errorString();
        Q_EMIT errorOccurred(QStringLiteral("Failed to start hook server: ") + m_server->errorString());
        delete m_server;
        m_server = nullptr;
        return false;
    }
    return true;
}

void HookEventServer::stop()
{
    if (!m_running && !m_server && !m_tcpServer) {
        return;
    }

    if (m_running) {
        m_endpointFile.remove(connectionString());
    }
    m_running = false;

    if (m_server) {
        m_server->close();
        delete m_server;
        m_server = nullptr;
        if (QFile::exists(m_socketPath)) {
            QFile::remove(m_socketPath);
        }
    }
    if (m_tcpServer) {
        m_tcpServer->close();
        delete m_tcpServer;
        m_tcpServer = nullptr;
    }
    m_tcpPort = 0;

    // Close all client connections without reading what is left in them
    const QSet<QIODevice *> clients = m_clients;
    m_clients.clear();
    for (QIODevice *client : clients) {
        client->disconnect(this);
        if (auto *local = qobject_cast<QLocalSocket *>(client)) {
            local->abort();
        } else if (auto *tcp = qobject_cast<QTcpSocket *>(client)) {
            tcp->abort();
        }
        client->deleteLater();
    }
}

bool HookEventServer::isRunning() const
{
    return m_running;
}

QString HookEventServer::connectionString() const
{
    if (m_mode == TCP) {
        return m_tcpPort ? EndpointFile::tcpAddress(m_tcpPort) : QString();
    }
    return m_socketPath;
}

void HookEventServer::onNewConnection()
{
    while (m_server && m_server->hasPendingConnections()) {
        QLocalSocket *client = m_server->nextPendingConnection();
        if (!client) {
            continue;
        }
        connect(client, &QLocalSocket::disconnected, this, [this, client]() {
            detachClient(client);
        });
        attachClient(client);
    }
}

void HookEventServer::onTcpNewConnection()
{
    while (m_tcpServer && m_tcpServer->hasPendingConnections()) {
        QTcpSocket *client = m_tcpServer->nextPendingConnection();
        if (!client) {
            continue;
        }
        connect(client, &QTcpSocket::disconnected, this, [this, client]() {
            detachClient(client);
        });
        attachClient(client);
    }
}

void HookEventServer::attachClient(QIODevice *client)
{
    m_clients.insert(client);
    connect(client, &QIODevice::readyRead, this, [this, client]() {
        readLines(client);
    });
    qDebug() << "HookEventServer: Client connected, total clients:" << m_clients.size();
    Q_EMIT clientConnected();

    // Data may have arrived before the connection was picked up
    readLines(client);
}

void HookEventServer::detachClient(QIODevice *client)
{
    if (!m_clients.remove(client)) {
        return;
    }

    readLines(client);
    // A final line without a trailing newline is still a message
    const QByteArray rest = client->readAll();
    if (!rest.trimmed().isEmpty()) {
        handleMessage(rest);
    }

    client->disconnect(this);
    client->deleteLater();
    Q_EMIT clientDisconnected();
}

void HookEventServer::readLines(QIODevice *client)
{
    while (m_running && client->canReadLine()) {
        handleMessage(client->readLine());
    }
}

void HookEventServer::handleMessage(const QByteArray &data)
{
    if (!m_running) {
        return;
    }

    const QByteArray line = data.trimmed();
    if (line.isEmpty()) {
        return;
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(line, &error);

    if (error.error != QJsonParseError::NoError) {
        qWarning() << "HookEventServer: Failed to parse hook message:" << error.errorString() << line.left(200);
        Q_EMIT errorOccurred(QStringLiteral("Failed to parse hook message: ") + error.errorString());
        return;
    }

    if (!doc.isObject()) {
        qWarning() << "HookEventServer: Hook message is not a JSON object";
        Q_EMIT errorOccurred(QStringLiteral("Hook message is not a JSON object"));
        return;
    }

    QString reason;
    const auto event = HookEvent::fromJson(doc.object(), &reason);
    if (!event) {
        qWarning() << "HookEventServer:" << reason;
        Q_EMIT errorOccurred(reason);
        return;
    }

    qDebug() << "HookEventServer: Received" << HookEvent::kindName(event->kind) << "for session" << event->sessionId << event->toolName;
    Q_EMIT eventReceived(*event);
}

// ============================================================================
// HookEventClient
// ============================================================================

HookEventClient::HookEventClient(QObject *parent)
    : QObject(parent)
{
}

HookEventClient::~HookEventClient() = default;

bool HookEventClient::sendEvent(const QString &address, const HookEvent &event, int timeoutMs)
{
    const QByteArray data = QJsonDocument(event.toJson()).toJson(QJsonDocument::Compact) + "\n";

    if (EndpointFile::isLocalAddress(address)) {
        QLocalSocket socket;
        socket.connectToServer(address);
        if (!socket.waitForConnected(timeoutMs)) {
            return false;
        }
        socket.write(data);
        const bool written = socket.waitForBytesWritten(timeoutMs);
        socket.disconnectFromServer();
        return written;
    }

    QString host;
    quint16 port = 0;
    if (!EndpointFile::parseTcpAddress(address, &host, &port)) {
        return false;
    }

    QTcpSocket socket;
    socket.connectToHost(host, port);
    if (!socket.waitForConnected(timeoutMs)) {
        return false;
    }
    socket.write(data);
    const bool written = socket.waitForBytesWritten(timeoutMs);
    socket.disconnectFromHost();
    if (socket.state() != QAbstractSocket::UnconnectedState) {
        socket.waitForDisconnected(timeoutMs);
    }
    return written;
}

int HookEventClient::broadcast(const EndpointFile &endpoints, const HookEvent &event, int timeoutMs)
{
    int delivered = 0;
    const QStringList addresses = endpoints.addresses();
    for (const QString &address : addresses) {
        if (sendEvent(address, event, timeoutMs)) {
            ++delivered;
        }
    }
    return delivered;
}

} // namespace SessionWatch

#include "moc_HookEventServer.cpp"
