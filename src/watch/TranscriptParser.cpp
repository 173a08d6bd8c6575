/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TranscriptParser.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>

namespace SessionWatch
{

namespace
{
const QString JsonlSuffix = QStringLiteral(".jsonl");
const QString AgentPrefix = QStringLiteral("agent-");

QDateTime parseTimestamp(const QJsonValue &value)
{
    if (value.isDouble()) {
        return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(value.toDouble()));
    }
    return QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
}
}

bool TranscriptParser::isAgentFileName(const QString &fileName)
{
    return fileName.startsWith(AgentPrefix) && fileName.endsWith(JsonlSuffix) && fileName.size() > AgentPrefix.size() + JsonlSuffix.size();
}

bool TranscriptParser::isTranscriptFileName(const QString &fileName)
{
    if (!fileName.endsWith(JsonlSuffix)) {
        return false;
    }
    if (isAgentFileName(fileName)) {
        return true;
    }
    const QString base = fileName.left(fileName.size() - JsonlSuffix.size());
    return !QUuid::fromString(base).isNull();
}

QString TranscriptParser::userPromptText(const QJsonObject &message)
{
    const QJsonValue content = message.value(QStringLiteral("content"));
    QString text;

    if (content.isString()) {
        text = content.toString();
    } else if (content.isArray()) {
        // Tool results come back as user entries too; only plain text counts
        const QJsonArray blocks = content.toArray();
        for (const QJsonValue &block : blocks) {
            const QJsonObject obj = block.toObject();
            if (obj.value(QStringLiteral("type")).toString() == QLatin1String("text")) {
                text = obj.value(QStringLiteral("text")).toString();
                break;
            }
        }
    }

    text = text.trimmed();
    // Slash commands and injected reminders are wrapped in tags
    if (text.startsWith(QLatin1Char('<'))) {
        return QString();
    }
    return text;
}

std::optional<SessionSnapshot> TranscriptParser::parse(const QString &filePath) const
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qDebug() << "TranscriptParser: Cannot open" << filePath << file.errorString();
        return std::nullopt;
    }

    const QFileInfo info(filePath);
    const QString fileName = info.fileName();

    SessionSnapshot snapshot;
    snapshot.filePath = filePath;
    snapshot.lastModified = info.lastModified();
    snapshot.isAgent = isAgentFileName(fileName);

    QString recordedSessionId;
    QString lastEntryType;
    QString lastStopReason;
    bool lastAssistantUsedTool = false;
    int entries = 0;

    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }

        QJsonParseError error;
        const QJsonDocument doc = QJsonDocument::fromJson(line, &error);
        if (error.error != QJsonParseError::NoError || !doc.isObject()) {
            // The writer may be mid-line; skip and keep going
            continue;
        }
        ++entries;

        const QJsonObject obj = doc.object();
        const QString type = obj.value(QStringLiteral("type")).toString();

        if (recordedSessionId.isEmpty()) {
            recordedSessionId = obj.value(QStringLiteral("sessionId")).toString();
        }
        const QString cwd = obj.value(QStringLiteral("cwd")).toString();
        if (!cwd.isEmpty()) {
            snapshot.cwd = cwd;
        }
        if (!snapshot.created.isValid()) {
            const QDateTime ts = parseTimestamp(obj.value(QStringLiteral("timestamp")));
            if (ts.isValid()) {
                snapshot.created = ts;
            }
        }
        if (obj.value(QStringLiteral("isSidechain")).toBool()) {
            snapshot.isAgent = true;
        }

        if (type != QLatin1String("user") && type != QLatin1String("assistant")) {
            continue;
        }

        const QJsonObject message = obj.value(QStringLiteral("message")).toObject();
        lastEntryType = type;

        if (type == QLatin1String("user")) {
            const QString prompt = userPromptText(message);
            if (!prompt.isEmpty()) {
                snapshot.lastUserPrompt = prompt;
            }
            continue;
        }

        lastStopReason = message.value(QStringLiteral("stop_reason")).toString();
        lastAssistantUsedTool = false;

        const QJsonArray blocks = message.value(QStringLiteral("content")).toArray();
        for (const QJsonValue &blockValue : blocks) {
            const QJsonObject block = blockValue.toObject();
            if (block.value(QStringLiteral("type")).toString() != QLatin1String("tool_use")) {
                continue;
            }
            lastAssistantUsedTool = true;

            if (block.value(QStringLiteral("name")).toString() == QLatin1String("TodoWrite")) {
                QList<TodoItem> todos;
                const QJsonArray items = block.value(QStringLiteral("input")).toObject().value(QStringLiteral("todos")).toArray();
                for (const QJsonValue &item : items) {
                    const QJsonObject todo = item.toObject();
                    todos.append(TodoItem{todo.value(QStringLiteral("content")).toString(),
                                          todo.value(QStringLiteral("status")).toString(),
                                          todo.value(QStringLiteral("activeForm")).toString()});
                }
                snapshot.todos = todos;
            }
        }

        const QJsonObject usage = message.value(QStringLiteral("usage")).toObject();
        if (!usage.isEmpty()) {
            const quint64 input = usage.value(QStringLiteral("input_tokens")).toInteger();
            const quint64 cacheRead = usage.value(QStringLiteral("cache_read_input_tokens")).toInteger();
            const quint64 cacheCreation = usage.value(QStringLiteral("cache_creation_input_tokens")).toInteger();

            snapshot.tokenUsage.inputTokens += input;
            snapshot.tokenUsage.outputTokens += usage.value(QStringLiteral("output_tokens")).toInteger();
            snapshot.tokenUsage.cacheReadTokens += cacheRead;
            snapshot.tokenUsage.cacheCreationTokens += cacheCreation;
            snapshot.contextTokens = input + cacheRead + cacheCreation;
        }
    }

    if (entries == 0) {
        return std::nullopt;
    }

    const QString baseName = fileName.endsWith(JsonlSuffix) ? fileName.left(fileName.size() - JsonlSuffix.size()) : info.completeBaseName();
    if (snapshot.isAgent) {
        // Agent transcripts record their parent's id
        snapshot.sessionId = baseName;
        snapshot.parentSessionId = recordedSessionId;
    } else {
        snapshot.sessionId = recordedSessionId.isEmpty() ? baseName : recordedSessionId;
    }

    if (!snapshot.created.isValid()) {
        snapshot.created = info.birthTime().isValid() ? info.birthTime() : snapshot.lastModified;
    }

    if (lastEntryType == QLatin1String("user") || (lastEntryType == QLatin1String("assistant") && lastAssistantUsedTool)) {
        snapshot.status = SessionStatus::Working;
    } else if (lastEntryType == QLatin1String("assistant") && lastStopReason == QLatin1String("end_turn")
               && snapshot.completedTaskCount() == snapshot.todos.size()) {
        snapshot.status = SessionStatus::Done;
    } else {
        snapshot.status = SessionStatus::Paused;
    }

    return snapshot;
}

} // namespace SessionWatch
