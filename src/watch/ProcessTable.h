/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROCESSTABLE_H
#define PROCESSTABLE_H

#include "ProcessInspector.h"

#include <QStringList>

namespace SessionWatch
{

/**
 * ProcessInspector backed by ps(1).
 *
 * ps is used instead of /proc so the same code runs on Linux and macOS.
 */
class SESSIONWATCHPRIVATE_EXPORT ProcessTable : public ProcessInspector
{
    Q_OBJECT

public:
    explicit ProcessTable(QObject *parent = nullptr);
    ~ProcessTable() override;

    void queryParentPid(qint64 pid, std::function<void(qint64)> callback) override;
    void queryStartTime(qint64 pid, std::function<void(const QString &)> callback) override;

    /**
     * Blocking variants for short-lived tools that have no event loop
     */
    static qint64 parentPidOf(qint64 pid);
    static QString startTimeOf(qint64 pid);
    static QString ttyOf(qint64 pid);

    /**
     * Parse a single numeric ps column; 0 when the output is not a number
     */
    static qint64 parsePid(const QString &output);

    /**
     * Normalize a ps tty column: "?" and "??" mean no terminal
     */
    static QString parseTty(const QString &output);

private:
    static QStringList fieldArgs(const QString &field, qint64 pid);
    static QString runPs(const QStringList &args, bool *ok = nullptr);

    void executeCommandAsync(const QStringList &args, std::function<void(bool, const QString &)> callback);
};

} // namespace SessionWatch

#endif // PROCESSTABLE_H
