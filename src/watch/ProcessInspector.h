/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROCESSINSPECTOR_H
#define PROCESSINSPECTOR_H

#include "sessionwatchprivate_export.h"

#include <QObject>
#include <QString>

#include <functional>

namespace SessionWatch
{

/**
 * ProcessInspector answers questions about the OS process table.
 *
 * All queries are asynchronous and never fail loudly: a process that
 * cannot be inspected reports 0 / an empty string, which callers treat
 * as "unknown".
 */
class SESSIONWATCHPRIVATE_EXPORT ProcessInspector : public QObject
{
    Q_OBJECT

public:
    explicit ProcessInspector(QObject *parent = nullptr);
    ~ProcessInspector() override;

    /**
     * Parent pid of @p pid, or 0 when the process is gone or the query failed
     */
    virtual void queryParentPid(qint64 pid, std::function<void(qint64)> callback) = 0;

    /**
     * Opaque start-time fingerprint of @p pid. Two processes that reuse the
     * same pid have different fingerprints. Empty when the process is gone.
     */
    virtual void queryStartTime(qint64 pid, std::function<void(const QString &)> callback) = 0;

    /**
     * A process is valid when it exists and, if @p fingerprint is non-empty,
     * its current start time equals the fingerprint. Without a fingerprint
     * only existence is checked.
     */
    void checkProcessValid(qint64 pid, const QString &fingerprint, std::function<void(bool)> callback);
};

} // namespace SessionWatch

#endif // PROCESSINSPECTOR_H
