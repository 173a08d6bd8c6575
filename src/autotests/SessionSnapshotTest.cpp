/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "SessionSnapshotTest.h"

// Qt
#include <QTest>

// SessionWatch
#include "../watch/SessionSnapshot.h"

using namespace SessionWatch;

namespace
{
TodoItem todo(const QString &content, const QString &status)
{
    TodoItem item;
    item.content = content;
    item.status = status;
    return item;
}
}

void SessionSnapshotTest::testDefaultZero()
{
    TokenUsage usage;

    QCOMPARE(usage.inputTokens, quint64(0));
    QCOMPARE(usage.outputTokens, quint64(0));
    QCOMPARE(usage.cacheReadTokens, quint64(0));
    QCOMPARE(usage.cacheCreationTokens, quint64(0));
    QCOMPARE(usage.totalTokens(), quint64(0));
}

void SessionSnapshotTest::testTotalTokens()
{
    TokenUsage usage;
    usage.inputTokens = 1000;
    usage.outputTokens = 500;
    usage.cacheReadTokens = 200;
    usage.cacheCreationTokens = 100;

    QCOMPARE(usage.totalTokens(), quint64(1800));
}

void SessionSnapshotTest::testFormatCompactSmall()
{
    TokenUsage usage;
    usage.inputTokens = 500;
    usage.outputTokens = 200;

    const QString formatted = usage.formatCompact();
    QVERIFY(formatted.contains(QStringLiteral("500")));
    QVERIFY(formatted.contains(QStringLiteral("200")));
}

void SessionSnapshotTest::testFormatCompactThousands()
{
    TokenUsage usage;
    usage.inputTokens = 40000;
    usage.cacheReadTokens = 5000;
    usage.outputTokens = 12000;

    // Cache reads count towards the input side
    const QString formatted = usage.formatCompact();
    QVERIFY(formatted.contains(QStringLiteral("45.0K")));
    QVERIFY(formatted.contains(QStringLiteral("12.0K")));
}

void SessionSnapshotTest::testFormatCompactMillions()
{
    TokenUsage usage;
    usage.inputTokens = 2500000;
    usage.outputTokens = 1000000;

    const QString formatted = usage.formatCompact();
    QVERIFY(formatted.contains(QStringLiteral("2.5M")));
    QVERIFY(formatted.contains(QStringLiteral("1.0M")));
}

void SessionSnapshotTest::testHasInProgressTask()
{
    SessionSnapshot snapshot;
    QVERIFY(!snapshot.hasInProgressTask());

    snapshot.todos = {todo(QStringLiteral("a"), QStringLiteral("completed")), todo(QStringLiteral("b"), QStringLiteral("pending"))};
    QVERIFY(!snapshot.hasInProgressTask());

    snapshot.todos.append(todo(QStringLiteral("c"), QStringLiteral("in_progress")));
    QVERIFY(snapshot.hasInProgressTask());
}

void SessionSnapshotTest::testCompletedTaskCount()
{
    SessionSnapshot snapshot;
    QCOMPARE(snapshot.completedTaskCount(), 0);

    snapshot.todos = {todo(QStringLiteral("a"), QStringLiteral("completed")),
                      todo(QStringLiteral("b"), QStringLiteral("in_progress")),
                      todo(QStringLiteral("c"), QStringLiteral("completed"))};
    QCOMPARE(snapshot.completedTaskCount(), 2);
}

void SessionSnapshotTest::testStatusName()
{
    QCOMPARE(statusName(SessionStatus::Working), QStringLiteral("Working"));
    QCOMPARE(statusName(SessionStatus::Paused), QStringLiteral("Paused"));
    QCOMPARE(statusName(SessionStatus::Done), QStringLiteral("Done"));
}

QTEST_GUILESS_MAIN(SessionSnapshotTest)

#include "moc_SessionSnapshotTest.cpp"
