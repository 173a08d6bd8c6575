/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ENDPOINTFILE_H
#define ENDPOINTFILE_H

#include "sessionwatchprivate_export.h"

#include <QString>
#include <QStringList>

#include <functional>

namespace SessionWatch
{

/**
 * The endpoint discovery file shared by every running registry.
 *
 * One listening address per line: "127.0.0.1:PORT" for TCP servers (a bare
 * port number is read the same way) or an absolute path for local sockets.
 * Instances append their own entry on start and remove only that entry on
 * stop, so several registries can run side by side.
 */
class SESSIONWATCHPRIVATE_EXPORT EndpointFile
{
public:
    using AliveProbe = std::function<bool(const QString &)>;

    explicit EndpointFile(const QString &path = defaultPath());

    /**
     * ~/.claude/.claude-watch-port
     */
    static QString defaultPath();

    QString path() const
    {
        return m_path;
    }

    /**
     * All addresses in the file, normalized, in file order
     */
    QStringList addresses() const;

    /**
     * Drop entries the probe reports dead, then append @p address if absent
     */
    bool add(const QString &address, const AliveProbe &probe = &EndpointFile::isAlive);

    /**
     * Remove @p address; the file is deleted when nothing is left
     */
    bool remove(const QString &address);

    static QString tcpAddress(quint16 port);
    static QString normalize(const QString &address);
    static bool isLocalAddress(const QString &address);

    /**
     * Parse a TCP address into host and port; false for local addresses
     */
    static bool parseTcpAddress(const QString &address, QString *host, quint16 *port);

    /**
     * Connect probe with a short timeout
     */
    static bool isAlive(const QString &address);

private:
    bool write(const QStringList &addresses) const;

    QString m_path;
};

} // namespace SessionWatch

#endif // ENDPOINTFILE_H
