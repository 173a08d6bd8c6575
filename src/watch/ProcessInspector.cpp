/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ProcessInspector.h"

#include <QDebug>

namespace SessionWatch
{

ProcessInspector::ProcessInspector(QObject *parent)
    : QObject(parent)
{
}

ProcessInspector::~ProcessInspector() = default;

void ProcessInspector::checkProcessValid(qint64 pid, const QString &fingerprint, std::function<void(bool)> callback)
{
    if (pid <= 0) {
        callback(false);
        return;
    }

    queryStartTime(pid, [pid, fingerprint, callback](const QString &startTime) {
        if (startTime.isEmpty()) {
            callback(false);
            return;
        }
        if (!fingerprint.isEmpty() && startTime != fingerprint) {
            qDebug() << "ProcessInspector: pid" << pid << "was reused (" << fingerprint << "->" << startTime << ")";
            callback(false);
            return;
        }
        callback(true);
    });
}

} // namespace SessionWatch

#include "moc_ProcessInspector.cpp"
