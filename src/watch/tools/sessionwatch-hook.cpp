/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    sessionwatch-hook - agent hook client

    The agent runs this binary from its SessionStart, SessionEnd,
    PreToolUse and PostToolUse hooks. It reads the hook payload from
    stdin (JSON), adds the identity of the agent process and sends one
    event line to every registry listed in the endpoint file.

    Usage:
        sessionwatch-hook [--event <type>] [--endpoint-file <path>] [--timeout <ms>]

    The event name defaults to the payload's hook_event_name.
*/

#include "EndpointFile.h"
#include "HookEvent.h"
#include "HookEventServer.h"
#include "ProcessTable.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <unistd.h>

using namespace SessionWatch;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("sessionwatch-hook"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Hook client for sessionwatch"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption eventOption(QStringList() << QStringLiteral("e") << QStringLiteral("event"),
                                   QStringLiteral("Event type (SessionStart, SessionEnd, PreToolUse, PostToolUse)"),
                                   QStringLiteral("type"));
    parser.addOption(eventOption);

    QCommandLineOption endpointOption(QStringList() << QStringLiteral("f") << QStringLiteral("endpoint-file"),
                                      QStringLiteral("Endpoint file (default: ~/.claude/.claude-watch-port)"),
                                      QStringLiteral("path"),
                                      EndpointFile::defaultPath());
    parser.addOption(endpointOption);

    QCommandLineOption timeoutOption(QStringList() << QStringLiteral("t") << QStringLiteral("timeout"),
                                     QStringLiteral("Connection timeout in milliseconds (default: 1000)"),
                                     QStringLiteral("ms"),
                                     QStringLiteral("1000"));
    parser.addOption(timeoutOption);

    parser.process(app);

    int timeout = parser.value(timeoutOption).toInt();
    if (timeout <= 0) {
        timeout = 1000;
    }

    // Read hook payload from stdin
    QFile stdinFile;
    if (!stdinFile.open(stdin, QIODevice::ReadOnly)) {
        return 0;
    }
    const QByteArray stdinData = stdinFile.readAll();
    stdinFile.close();

    QJsonObject payload;
    if (!stdinData.isEmpty()) {
        QJsonParseError error;
        const QJsonDocument doc = QJsonDocument::fromJson(stdinData, &error);
        if (error.error == QJsonParseError::NoError && doc.isObject()) {
            payload = doc.object();
        }
    }

    const QString eventName = parser.isSet(eventOption) ? parser.value(eventOption) : payload.value(QStringLiteral("hook_event_name")).toString();
    const std::optional<HookEvent::Kind> kind = HookEvent::parseKind(eventName);
    if (!kind) {
        // Other hooks (Stop, Notification, ...) are not tracked
        return 0;
    }

    HookEvent event;
    event.kind = *kind;
    event.sessionId = payload.value(QStringLiteral("session_id")).toString();
    event.transcriptPath = payload.value(QStringLiteral("transcript_path")).toString();
    event.cwd = payload.value(QStringLiteral("cwd")).toString();
    if (event.sessionId.isEmpty()) {
        QTextStream err(stderr);
        err << "sessionwatch-hook: payload has no session_id\n";
        return 0;
    }

    // The agent runs this hook, so our parent is the agent process
    event.pid = static_cast<qint64>(getppid());
    event.ppid = ProcessTable::parentPidOf(event.pid);
    event.tty = ProcessTable::ttyOf(event.pid);
    event.timestamp = QDateTime::currentMSecsSinceEpoch();

    if (event.isToolEvent()) {
        event.toolName = payload.value(QStringLiteral("tool_name")).toString();
        event.toolInput = payload.value(QStringLiteral("tool_input")).toObject();
        if (event.kind == HookEvent::Kind::ToolEnd) {
            event.toolResult = payload.value(QStringLiteral("tool_response"));
        }
    }

    const EndpointFile endpoints(parser.value(endpointOption));
    HookEventClient client;
    client.broadcast(endpoints, event, timeout);

    // Always exit 0: a failing hook would interrupt the agent's session
    return 0;
}
