/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTPARSER_H
#define TRANSCRIPTPARSER_H

#include "SessionSnapshot.h"

class QJsonObject;

namespace SessionWatch
{

/**
 * TranscriptParser reads the agent's JSONL transcript files.
 *
 * Every line is one JSON object with a "type" ("user", "assistant",
 * "summary", ...), a "timestamp", the "sessionId" and "cwd" of the session,
 * and for conversational entries a "message" carrying "content" and, for
 * assistant turns, "usage" and "stop_reason".
 *
 * Agent transcripts are named agent-<id>.jsonl and carry the id of the
 * session that spawned them in their "sessionId" field.
 */
class SESSIONWATCHPRIVATE_EXPORT TranscriptParser : public SnapshotProvider
{
public:
    TranscriptParser() = default;

    std::optional<SessionSnapshot> parse(const QString &filePath) const override;

    /**
     * True for transcript file names the registry tracks: <uuid>.jsonl for
     * primary sessions and agent-<id>.jsonl for agents.
     */
    static bool isTranscriptFileName(const QString &fileName);
    static bool isAgentFileName(const QString &fileName);

private:
    static QString userPromptText(const QJsonObject &message);
};

} // namespace SessionWatch

#endif // TRANSCRIPTPARSER_H
