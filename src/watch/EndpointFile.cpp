/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "EndpointFile.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLocalSocket>
#include <QSaveFile>
#include <QTcpSocket>

namespace SessionWatch
{

namespace
{
constexpr int ProbeTimeoutMs = 100;
}

EndpointFile::EndpointFile(const QString &path)
    : m_path(path)
{
}

QString EndpointFile::defaultPath()
{
    return QDir::homePath() + QStringLiteral("/.claude/.claude-watch-port");
}

QString EndpointFile::tcpAddress(quint16 port)
{
    return QStringLiteral("127.0.0.1:%1").arg(port);
}

bool EndpointFile::isLocalAddress(const QString &address)
{
    return address.startsWith(QLatin1Char('/'));
}

QString EndpointFile::normalize(const QString &address)
{
    const QString trimmed = address.trimmed();
    if (trimmed.isEmpty() || isLocalAddress(trimmed)) {
        return trimmed;
    }

    bool isNumber = false;
    const uint port = trimmed.toUInt(&isNumber);
    if (isNumber) {
        return port > 0 && port <= 65535 ? tcpAddress(static_cast<quint16>(port)) : QString();
    }

    QString host;
    quint16 tcpPort = 0;
    return parseTcpAddress(trimmed, &host, &tcpPort) ? trimmed : QString();
}

bool EndpointFile::parseTcpAddress(const QString &address, QString *host, quint16 *port)
{
    if (isLocalAddress(address)) {
        return false;
    }
    const int colon = address.lastIndexOf(QLatin1Char(':'));
    if (colon <= 0) {
        return false;
    }
    bool ok = false;
    const uint value = address.mid(colon + 1).toUInt(&ok);
    if (!ok || value == 0 || value > 65535) {
        return false;
    }
    if (host) {
        *host = address.left(colon);
    }
    if (port) {
        *port = static_cast<quint16>(value);
    }
    return true;
}

QStringList EndpointFile::addresses() const
{
    QFile file(m_path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return {};
    }

    QStringList result;
    while (!file.atEnd()) {
        const QString address = normalize(QString::fromUtf8(file.readLine()));
        if (!address.isEmpty() && !result.contains(address)) {
            result.append(address);
        }
    }
    return result;
}

bool EndpointFile::add(const QString &address, const AliveProbe &probe)
{
    const QString ours = normalize(address);
    if (ours.isEmpty()) {
        return false;
    }

    QStringList kept;
    const QStringList existing = addresses();
    for (const QString &entry : existing) {
        if (entry == ours || !probe || probe(entry)) {
            kept.append(entry);
        } else {
            qDebug() << "EndpointFile: Pruning dead endpoint" << entry;
        }
    }
    if (!kept.contains(ours)) {
        kept.append(ours);
    }
    return write(kept);
}

bool EndpointFile::remove(const QString &address)
{
    const QString ours = normalize(address);
    QStringList remaining = addresses();
    remaining.removeAll(ours);

    if (remaining.isEmpty()) {
        if (QFile::exists(m_path) && !QFile::remove(m_path)) {
            qWarning() << "EndpointFile: Failed to remove" << m_path;
            return false;
        }
        return true;
    }
    return write(remaining);
}

bool EndpointFile::write(const QStringList &addresses) const
{
    QDir().mkpath(QFileInfo(m_path).absolutePath());

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "EndpointFile: Failed to open" << m_path << file.errorString();
        return false;
    }
    file.write(addresses.join(QLatin1Char('\n')).toUtf8());
    file.write("\n");
    if (!file.commit()) {
        qWarning() << "EndpointFile: Failed to write" << m_path << file.errorString();
        return false;
    }
    return true;
}

bool EndpointFile::isAlive(const QString &address)
{
    if (isLocalAddress(address)) {
        QLocalSocket socket;
        socket.connectToServer(address);
        const bool alive = socket.waitForConnected(ProbeTimeoutMs);
        socket.abort();
        return alive;
    }

    QString host;
    quint16 port = 0;
    if (!parseTcpAddress(address, &host, &port)) {
        return false;
    }
    QTcpSocket socket;
    socket.connectToHost(host, port);
    const bool alive = socket.waitForConnected(ProbeTimeoutMs);
    socket.abort();
    return alive;
}

} // namespace SessionWatch
