/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ProcessTable.h"

#include <QDebug>
#include <QProcess>

namespace SessionWatch
{

namespace
{
const QString PsProgram = QStringLiteral("ps");
constexpr int PsTimeoutMs = 5000;
}

ProcessTable::ProcessTable(QObject *parent)
    : ProcessInspector(parent)
{
}

ProcessTable::~ProcessTable() = default;

QStringList ProcessTable::fieldArgs(const QString &field, qint64 pid)
{
    return {QStringLiteral("-o"), field + QLatin1Char('='), QStringLiteral("-p"), QString::number(pid)};
}

qint64 ProcessTable::parsePid(const QString &output)
{
    bool converted = false;
    const qint64 pid = output.trimmed().toLongLong(&converted);
    return converted && pid > 0 ? pid : 0;
}

QString ProcessTable::parseTty(const QString &output)
{
    const QString tty = output.trimmed();
    if (tty.isEmpty() || tty == QLatin1String("?") || tty == QLatin1String("??")) {
        return QString();
    }
    return tty;
}

void ProcessTable::queryParentPid(qint64 pid, std::function<void(qint64)> callback)
{
    if (pid <= 0) {
        callback(0);
        return;
    }
    executeCommandAsync(fieldArgs(QStringLiteral("ppid"), pid), [callback](bool ok, const QString &output) {
        callback(ok ? parsePid(output) : 0);
    });
}

void ProcessTable::queryStartTime(qint64 pid, std::function<void(const QString &)> callback)
{
    if (pid <= 0) {
        callback(QString());
        return;
    }
    executeCommandAsync(fieldArgs(QStringLiteral("lstart"), pid), [callback](bool ok, const QString &output) {
        callback(ok ? output.simplified() : QString());
    });
}

qint64 ProcessTable::parentPidOf(qint64 pid)
{
    bool ok = false;
    const QString output = runPs(fieldArgs(QStringLiteral("ppid"), pid), &ok);
    return ok ? parsePid(output) : 0;
}

QString ProcessTable::startTimeOf(qint64 pid)
{
    bool ok = false;
    const QString output = runPs(fieldArgs(QStringLiteral("lstart"), pid), &ok);
    return ok ? output.simplified() : QString();
}

QString ProcessTable::ttyOf(qint64 pid)
{
    bool ok = false;
    const QString output = runPs(fieldArgs(QStringLiteral("tty"), pid), &ok);
    return ok ? parseTty(output) : QString();
}

QString ProcessTable::runPs(const QStringList &args, bool *ok)
{
    QProcess process;
    process.start(PsProgram, args);

    if (!process.waitForFinished(PsTimeoutMs)) {
        if (ok) {
            *ok = false;
        }
        return QString();
    }

    // ps exits 1 when the pid does not exist
    if (ok) {
        *ok = (process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0);
    }

    return QString::fromUtf8(process.readAllStandardOutput());
}

void ProcessTable::executeCommandAsync(const QStringList &args, std::function<void(bool, const QString &)> callback)
{
    auto *process = new QProcess(this);
    connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [process, callback](int exitCode, QProcess::ExitStatus status) {
        const bool ok = (status == QProcess::NormalExit && exitCode == 0);
        const QString output = QString::fromUtf8(process->readAllStandardOutput());
        process->deleteLater();
        callback(ok, output);
    });
    connect(process, &QProcess::errorOccurred, this, [process, callback](QProcess::ProcessError error) {
        // A crash also emits finished(); only start failures end up here alone
        if (error != QProcess::FailedToStart) {
            return;
        }
        qWarning() << "ProcessTable: Failed to run ps:" << process->errorString();
        process->deleteLater();
        callback(false, QString());
    });
    process->start(PsProgram, args);
}

} // namespace SessionWatch

#include "moc_ProcessTable.cpp"
