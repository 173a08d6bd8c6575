/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    sessionwatch - session registry daemon

    Receives hook events from sessionwatch-hook, watches the transcript
    tree and prints the active and recent sessions whenever they settle.

    Usage:
        sessionwatch [--workspace <dir>] [--projects-root <dir>] [--local] [--debug]
*/

#include "watch/SessionRegistry.h"
#include "watch/WatchContext.h"
#include "watch/WatchSettings.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QLoggingCategory>
#include <QTextStream>
#include <QTimer>

#include <csignal>

using namespace SessionWatch;

namespace
{

volatile std::sig_atomic_t g_quitRequested = 0;

void requestQuit(int)
{
    g_quitRequested = 1;
}

QString describe(const SessionView &view)
{
    const SessionSnapshot &s = view.snapshot;
    QString line = QStringLiteral("  [%1] %2 pid=%3 ppid=%4 %5")
                       .arg(statusName(view.effectiveStatus), s.sessionId)
                       .arg(view.pid)
                       .arg(view.ppid)
                       .arg(s.cwd);
    if (view.currentTool) {
        line += QStringLiteral(" tool=") + view.currentTool->toolName;
    }
    if (view.hasTerminal) {
        line += QStringLiteral(" (terminal)");
    }
    if (s.tokenUsage.totalTokens() > 0) {
        line += QLatin1Char(' ') + s.tokenUsage.formatCompact();
    }
    return line;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("sessionwatch"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Tracks running coding agent sessions"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption workspaceOption(QStringList() << QStringLiteral("w") << QStringLiteral("workspace"),
                                       QStringLiteral("Only show sessions started in this directory"),
                                       QStringLiteral("dir"));
    parser.addOption(workspaceOption);

    QCommandLineOption projectsOption(QStringList() << QStringLiteral("p") << QStringLiteral("projects-root"),
                                      QStringLiteral("Transcript directory (default: ~/.claude/projects)"),
                                      QStringLiteral("dir"));
    parser.addOption(projectsOption);

    QCommandLineOption localOption(QStringList() << QStringLiteral("l") << QStringLiteral("local"),
                                   QStringLiteral("Receive hook events on a local socket instead of TCP"));
    parser.addOption(localOption);

    QCommandLineOption debugOption(QStringList() << QStringLiteral("d") << QStringLiteral("debug"), QStringLiteral("Print debug output"));
    parser.addOption(debugOption);

    parser.process(app);

    if (parser.isSet(debugOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=true"));
    } else {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    WatchSettings settings;
    RegistryConfig config = settings.registryConfig();
    if (parser.isSet(workspaceOption)) {
        config.workspacePath = QDir(parser.value(workspaceOption)).absolutePath();
    }
    if (parser.isSet(projectsOption)) {
        config.projectsRoot = QDir(parser.value(projectsOption)).absolutePath();
    }
    const HookEventServer::Mode mode = parser.isSet(localOption) ? HookEventServer::LocalSocket : settings.serverMode();

    WatchContext context(&settings, config, mode);

    QTextStream out(stdout);
    QObject::connect(context.registry(), &SessionRegistry::activeSessionsChanged, &app, [&out](const QList<SessionView> &sessions) {
        out << "Active sessions: " << sessions.size() << "\n";
        for (const SessionView &view : sessions) {
            out << describe(view) << "\n";
        }
        out.flush();
    });
    QObject::connect(context.registry(), &SessionRegistry::inactiveSessionsChanged, &app, [&out](const QList<SessionSnapshot> &sessions) {
        out << "Recent sessions: " << sessions.size() << "\n";
        for (const SessionSnapshot &s : sessions) {
            out << "  [" << statusName(s.status) << "] " << s.sessionId << " " << s.cwd << " " << s.lastModified.toString(Qt::ISODate) << "\n";
        }
        out.flush();
    });
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &context, &WatchContext::stop);

    std::signal(SIGINT, requestQuit);
    std::signal(SIGTERM, requestQuit);
    QTimer quitPoll;
    QObject::connect(&quitPoll, &QTimer::timeout, &app, []() {
        if (g_quitRequested) {
            QCoreApplication::quit();
        }
    });
    quitPoll.start(200);

    if (!context.start()) {
        qWarning() << "sessionwatch: Hook events unavailable";
    }
    qInfo() << "sessionwatch: Watching" << config.projectsRoot;

    return app.exec();
}
