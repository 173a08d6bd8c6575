/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALHANDLE_H
#define TERMINALHANDLE_H

#include "sessionwatchprivate_export.h"

#include <QList>
#include <QObject>
#include <QString>

#include <functional>

namespace SessionWatch
{

/**
 * A terminal that may host a session.
 *
 * The process id reported is the terminal's shell, i.e. the parent of the
 * agent process running inside it.
 */
class SESSIONWATCHPRIVATE_EXPORT TerminalHandle : public QObject
{
    Q_OBJECT

public:
    explicit TerminalHandle(QObject *parent = nullptr);
    ~TerminalHandle() override;

    virtual QString name() const = 0;

    /**
     * Resolve the shell pid; the callback receives 0 when unavailable
     */
    virtual void requestProcessId(std::function<void(qint64)> callback) = 0;

    /**
     * Bring the terminal to the front
     */
    virtual void show() = 0;

Q_SIGNALS:
    void closed();
};

/**
 * Source of terminal handles
 */
class SESSIONWATCHPRIVATE_EXPORT TerminalHost : public QObject
{
    Q_OBJECT

public:
    explicit TerminalHost(QObject *parent = nullptr);
    ~TerminalHost() override;

    virtual QList<TerminalHandle *> terminals() const = 0;

Q_SIGNALS:
    void terminalOpened(SessionWatch::TerminalHandle *terminal);
    void terminalClosed(SessionWatch::TerminalHandle *terminal);
};

} // namespace SessionWatch

#endif // TERMINALHANDLE_H
