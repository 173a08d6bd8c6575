/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "HookEventTest.h"

// Qt
#include <QJsonDocument>
#include <QJsonObject>
#include <QTest>

// SessionWatch
#include "../watch/HookEvent.h"

using namespace SessionWatch;

namespace
{
QJsonObject parseObject(const QByteArray &json)
{
    return QJsonDocument::fromJson(json).object();
}
}

void HookEventTest::testParseKind()
{
    QCOMPARE(HookEvent::parseKind(QStringLiteral("SessionStart")).value_or(HookEvent::Kind::ToolEnd), HookEvent::Kind::SessionStart);
    QCOMPARE(HookEvent::parseKind(QStringLiteral("SessionEnd")).value_or(HookEvent::Kind::SessionStart), HookEvent::Kind::SessionEnd);
    QCOMPARE(HookEvent::parseKind(QStringLiteral("PreToolUse")).value_or(HookEvent::Kind::SessionStart), HookEvent::Kind::ToolStart);
    QCOMPARE(HookEvent::parseKind(QStringLiteral("ToolStart")).value_or(HookEvent::Kind::SessionStart), HookEvent::Kind::ToolStart);
    QCOMPARE(HookEvent::parseKind(QStringLiteral("PostToolUse")).value_or(HookEvent::Kind::SessionStart), HookEvent::Kind::ToolEnd);
    QCOMPARE(HookEvent::parseKind(QStringLiteral("ToolEnd")).value_or(HookEvent::Kind::SessionStart), HookEvent::Kind::ToolEnd);

    QVERIFY(!HookEvent::parseKind(QStringLiteral("Stop")).has_value());
    QVERIFY(!HookEvent::parseKind(QStringLiteral("sessionstart")).has_value());
    QVERIFY(!HookEvent::parseKind(QString()).has_value());
}

void HookEventTest::testKindName()
{
    QCOMPARE(HookEvent::kindName(HookEvent::Kind::SessionStart), QStringLiteral("SessionStart"));
    QCOMPARE(HookEvent::kindName(HookEvent::Kind::SessionEnd), QStringLiteral("SessionEnd"));
    QCOMPARE(HookEvent::kindName(HookEvent::Kind::ToolStart), QStringLiteral("PreToolUse"));
    QCOMPARE(HookEvent::kindName(HookEvent::Kind::ToolEnd), QStringLiteral("PostToolUse"));
}

void HookEventTest::testFromJsonSessionStart()
{
    const QJsonObject obj = parseObject(R"({"event":"SessionStart","sessionId":"s1","transcriptPath":"/p/s1.jsonl",)"
                                        R"("cwd":"/home/dev","pid":4242,"ppid":4000,"tty":"pts/3"})");

    QString error;
    const auto event = HookEvent::fromJson(obj, &error);
    QVERIFY(event.has_value());
    QVERIFY(error.isEmpty());
    QCOMPARE(event->kind, HookEvent::Kind::SessionStart);
    QCOMPARE(event->sessionId, QStringLiteral("s1"));
    QCOMPARE(event->transcriptPath, QStringLiteral("/p/s1.jsonl"));
    QCOMPARE(event->cwd, QStringLiteral("/home/dev"));
    QCOMPARE(event->pid, qint64(4242));
    QCOMPARE(event->ppid, qint64(4000));
    QCOMPARE(event->tty, QStringLiteral("pts/3"));
    QVERIFY(!event->isToolEvent());
}

void HookEventTest::testFromJsonToolEnd()
{
    const QJsonObject obj = parseObject(R"({"event":"PostToolUse","sessionId":"s1","toolName":"Bash",)"
                                        R"("toolInput":{"command":"ls"},"toolResult":{"is_error":true},"timestamp":1700000000123})");

    const auto event = HookEvent::fromJson(obj);
    QVERIFY(event.has_value());
    QCOMPARE(event->kind, HookEvent::Kind::ToolEnd);
    QVERIFY(event->isToolEvent());
    QCOMPARE(event->toolName, QStringLiteral("Bash"));
    QCOMPARE(event->toolInput.value(QStringLiteral("command")).toString(), QStringLiteral("ls"));
    QVERIFY(event->toolResult.toObject().value(QStringLiteral("is_error")).toBool());
    QCOMPARE(event->timestamp, qint64(1700000000123));
}

void HookEventTest::testFromJsonKindAlias()
{
    const auto event = HookEvent::fromJson(parseObject(R"({"kind":"ToolStart","sessionId":"s2","toolName":"Read"})"));
    QVERIFY(event.has_value());
    QCOMPARE(event->kind, HookEvent::Kind::ToolStart);
    QCOMPARE(event->toolName, QStringLiteral("Read"));
}

void HookEventTest::testFromJsonPidAsString()
{
    const auto event = HookEvent::fromJson(parseObject(R"({"event":"SessionStart","sessionId":"s3","pid":" 123 ","ppid":"45"})"));
    QVERIFY(event.has_value());
    QCOMPARE(event->pid, qint64(123));
    QCOMPARE(event->ppid, qint64(45));
}

void HookEventTest::testFromJsonRejectsUnknownEvent()
{
    QString error;
    QVERIFY(!HookEvent::fromJson(parseObject(R"({"event":"Notification","sessionId":"s1"})"), &error).has_value());
    QVERIFY(error.contains(QStringLiteral("Notification")));

    error.clear();
    QVERIFY(!HookEvent::fromJson(parseObject(R"({"sessionId":"s1"})"), &error).has_value());
    QVERIFY(!error.isEmpty());
}

void HookEventTest::testFromJsonRejectsMissingSessionId()
{
    QString error;
    QVERIFY(!HookEvent::fromJson(parseObject(R"({"event":"SessionEnd","pid":1})"), &error).has_value());
    QVERIFY(error.contains(QStringLiteral("sessionId")));
}

void HookEventTest::testToJsonOmitsToolFieldsForLifecycle()
{
    HookEvent event;
    event.kind = HookEvent::Kind::SessionEnd;
    event.sessionId = QStringLiteral("s1");
    event.pid = 10;

    const QJsonObject obj = event.toJson();
    QCOMPARE(obj.value(QStringLiteral("event")).toString(), QStringLiteral("SessionEnd"));
    QCOMPARE(obj.value(QStringLiteral("pid")).toInteger(), qint64(10));
    QVERIFY(!obj.contains(QStringLiteral("toolName")));
    QVERIFY(!obj.contains(QStringLiteral("toolResult")));
}

void HookEventTest::testToJsonRoundTripTool()
{
    HookEvent event;
    event.kind = HookEvent::Kind::ToolStart;
    event.sessionId = QStringLiteral("s9");
    event.transcriptPath = QStringLiteral("/p/s9.jsonl");
    event.pid = 77;
    event.ppid = 70;
    event.toolName = QStringLiteral("Edit");
    event.toolInput[QStringLiteral("file_path")] = QStringLiteral("/src/a.cpp");
    event.timestamp = 1700000000000;

    const QJsonObject obj = event.toJson();
    QCOMPARE(obj.value(QStringLiteral("event")).toString(), QStringLiteral("PreToolUse"));
    QVERIFY(obj.value(QStringLiteral("toolResult")).isNull());

    const auto decoded = HookEvent::fromJson(obj);
    QVERIFY(decoded.has_value());
    QCOMPARE(decoded->kind, HookEvent::Kind::ToolStart);
    QCOMPARE(decoded->sessionId, event.sessionId);
    QCOMPARE(decoded->pid, event.pid);
    QCOMPARE(decoded->ppid, event.ppid);
    QCOMPARE(decoded->toolInput, event.toolInput);
    QCOMPARE(decoded->timestamp, event.timestamp);
}

QTEST_GUILESS_MAIN(HookEventTest)

#include "moc_HookEventTest.cpp"
