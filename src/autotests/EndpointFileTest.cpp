/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "EndpointFileTest.h"

// Qt
#include <QDir>
#include <QFile>
#include <QStandardPaths>
#include <QTcpServer>
#include <QTest>

// SessionWatch
#include "../watch/EndpointFile.h"

using namespace SessionWatch;

void EndpointFileTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QVERIFY(m_dir.isValid());
}

void EndpointFileTest::cleanup()
{
    QFile::remove(filePath());
}

QString EndpointFileTest::filePath() const
{
    return m_dir.filePath(QStringLiteral("endpoints"));
}

void EndpointFileTest::testDefaultPath()
{
    const QString path = EndpointFile::defaultPath();
    QVERIFY(path.startsWith(QDir::homePath()));
    QVERIFY(path.endsWith(QStringLiteral("/.claude/.claude-watch-port")));
}

void EndpointFileTest::testNormalize()
{
    QCOMPARE(EndpointFile::normalize(QStringLiteral("4711")), QStringLiteral("127.0.0.1:4711"));
    QCOMPARE(EndpointFile::normalize(QStringLiteral("  127.0.0.1:4711\n")), QStringLiteral("127.0.0.1:4711"));
    QCOMPARE(EndpointFile::normalize(QStringLiteral("/run/user/1000/hooks.sock")), QStringLiteral("/run/user/1000/hooks.sock"));

    QVERIFY(EndpointFile::normalize(QStringLiteral("0")).isEmpty());
    QVERIFY(EndpointFile::normalize(QStringLiteral("70000")).isEmpty());
    QVERIFY(EndpointFile::normalize(QStringLiteral("garbage")).isEmpty());
    QVERIFY(EndpointFile::normalize(QString()).isEmpty());
}

void EndpointFileTest::testParseTcpAddress()
{
    QString host;
    quint16 port = 0;
    QVERIFY(EndpointFile::parseTcpAddress(QStringLiteral("127.0.0.1:5555"), &host, &port));
    QCOMPARE(host, QStringLiteral("127.0.0.1"));
    QCOMPARE(port, quint16(5555));

    QVERIFY(!EndpointFile::parseTcpAddress(QStringLiteral("/tmp/x.sock"), &host, &port));
    QVERIFY(!EndpointFile::parseTcpAddress(QStringLiteral("127.0.0.1"), &host, &port));
    QVERIFY(!EndpointFile::parseTcpAddress(QStringLiteral(":80"), &host, &port));
    QVERIFY(!EndpointFile::parseTcpAddress(QStringLiteral("127.0.0.1:0"), &host, &port));
}

void EndpointFileTest::testAddressesMissingFile()
{
    EndpointFile file(filePath());
    QVERIFY(file.addresses().isEmpty());
}

void EndpointFileTest::testAddCreatesFile()
{
    EndpointFile file(m_dir.filePath(QStringLiteral("nested/dir/endpoints")));
    QVERIFY(file.add(QStringLiteral("127.0.0.1:4000")));
    QCOMPARE(file.addresses(), QStringList{QStringLiteral("127.0.0.1:4000")});
    QVERIFY(file.remove(QStringLiteral("127.0.0.1:4000")));
}

void EndpointFileTest::testAddKeepsLiveEntriesAndPrunesDead()
{
    EndpointFile file(filePath());
    const auto allAlive = [](const QString &) {
        return true;
    };
    QVERIFY(file.add(QStringLiteral("127.0.0.1:4001"), allAlive));
    QVERIFY(file.add(QStringLiteral("127.0.0.1:4002"), allAlive));

    const auto only4002Alive = [](const QString &address) {
        return address == QStringLiteral("127.0.0.1:4002");
    };
    QVERIFY(file.add(QStringLiteral("/tmp/ours.sock"), only4002Alive));

    QCOMPARE(file.addresses(), (QStringList{QStringLiteral("127.0.0.1:4002"), QStringLiteral("/tmp/ours.sock")}));
}

void EndpointFileTest::testAddIsIdempotent()
{
    EndpointFile file(filePath());
    const auto allAlive = [](const QString &) {
        return true;
    };
    QVERIFY(file.add(QStringLiteral("127.0.0.1:4003"), allAlive));
    QVERIFY(file.add(QStringLiteral("4003"), allAlive));

    QCOMPARE(file.addresses().size(), 1);
}

void EndpointFileTest::testAddRejectsInvalidAddress()
{
    EndpointFile file(filePath());
    QVERIFY(!file.add(QStringLiteral("not an address")));
    QVERIFY(!QFile::exists(filePath()));
}

void EndpointFileTest::testRemoveKeepsOthers()
{
    EndpointFile file(filePath());
    const auto allAlive = [](const QString &) {
        return true;
    };
    QVERIFY(file.add(QStringLiteral("127.0.0.1:4004"), allAlive));
    QVERIFY(file.add(QStringLiteral("127.0.0.1:4005"), allAlive));

    QVERIFY(file.remove(QStringLiteral("127.0.0.1:4004")));
    QCOMPARE(file.addresses(), QStringList{QStringLiteral("127.0.0.1:4005")});
}

void EndpointFileTest::testRemoveLastDeletesFile()
{
    EndpointFile file(filePath());
    QVERIFY(file.add(QStringLiteral("127.0.0.1:4006")));
    QVERIFY(QFile::exists(filePath()));

    QVERIFY(file.remove(QStringLiteral("127.0.0.1:4006")));
    QVERIFY(!QFile::exists(filePath()));

    // Removing from a missing file is not an error
    QVERIFY(file.remove(QStringLiteral("127.0.0.1:4006")));
}

void EndpointFileTest::testReadsBarePortsAndDedupes()
{
    QFile raw(filePath());
    QVERIFY(raw.open(QIODevice::WriteOnly));
    raw.write("4100\n127.0.0.1:4100\n\njunk\n/tmp/a.sock\n");
    raw.close();

    EndpointFile file(filePath());
    QCOMPARE(file.addresses(), (QStringList{QStringLiteral("127.0.0.1:4100"), QStringLiteral("/tmp/a.sock")}));
}

void EndpointFileTest::testIsAliveListening()
{
    QTcpServer server;
    QVERIFY(server.listen(QHostAddress::LocalHost, 0));

    QVERIFY(EndpointFile::isAlive(EndpointFile::tcpAddress(server.serverPort())));
    server.close();
}

void EndpointFileTest::testIsAliveDead()
{
    // Find a free port by listening and closing again
    quint16 port = 0;
    {
        QTcpServer server;
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));
        port = server.serverPort();
        server.close();
    }
    QVERIFY(!EndpointFile::isAlive(EndpointFile::tcpAddress(port)));
    QVERIFY(!EndpointFile::isAlive(m_dir.filePath(QStringLiteral("nobody.sock"))));
}

QTEST_GUILESS_MAIN(EndpointFileTest)

#include "moc_EndpointFileTest.cpp"
