/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "HookEventServerTest.h"

// Qt
#include <QCoreApplication>
#include <QFile>
#include <QLocalSocket>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTcpSocket>
#include <QTest>

// SessionWatch
#include "../watch/EndpointFile.h"
#include "../watch/HookEventServer.h"

using namespace SessionWatch;

namespace
{
HookEvent sampleEvent(HookEvent::Kind kind, const QString &sessionId)
{
    HookEvent event;
    event.kind = kind;
    event.sessionId = sessionId;
    event.transcriptPath = QStringLiteral("/projects/demo/") + sessionId + QStringLiteral(".jsonl");
    event.cwd = QStringLiteral("/home/dev/demo");
    event.pid = 4242;
    event.ppid = 4000;
    event.tty = QStringLiteral("pts/1");
    return event;
}

QByteArray sessionStartLine(const QByteArray &sessionId)
{
    return R"({"event":"SessionStart","sessionId":")" + sessionId + R"(","transcriptPath":"/p/x.jsonl","pid":10,"ppid":9})";
}

// Connect a raw TCP client, let the server accept it and return it
QTcpSocket *connectRaw(HookEventServer &server)
{
    auto *socket = new QTcpSocket;
    socket->connectToHost(QStringLiteral("127.0.0.1"), server.tcpPort());
    if (!socket->waitForConnected(1000)) {
        delete socket;
        return nullptr;
    }
    return socket;
}

void closeRaw(QTcpSocket *socket)
{
    socket->disconnectFromHost();
    if (socket->state() != QAbstractSocket::UnconnectedState) {
        socket->waitForDisconnected(500);
    }
    delete socket;
}
}

void HookEventServerTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    qRegisterMetaType<SessionWatch::HookEvent>();
    QVERIFY(m_dir.isValid());
}

void HookEventServerTest::cleanup()
{
    // Drain deferred deletions from socket cleanup
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
    QCoreApplication::processEvents();
    QFile::remove(endpointFilePath());
}

QString HookEventServerTest::endpointFilePath() const
{
    return m_dir.filePath(QStringLiteral("endpoints"));
}

void HookEventServerTest::testDataDir()
{
    const QString dir = HookEventServer::dataDir();
    QVERIFY(!dir.isEmpty());
    QVERIFY(dir.endsWith(QStringLiteral("/sessionwatch")));
}

void HookEventServerTest::testTcpStartStop()
{
    HookEventServer server(endpointFilePath());
    QCOMPARE(server.mode(), HookEventServer::TCP);
    QVERIFY(!server.isRunning());
    QCOMPARE(server.tcpPort(), quint16(0));
    QVERIFY(server.connectionString().isEmpty());

    QVERIFY(server.start());
    QVERIFY(server.isRunning());
    QVERIFY(server.tcpPort() > 0);
    QCOMPARE(server.connectionString(), EndpointFile::tcpAddress(server.tcpPort()));

    // Published for the hook client
    EndpointFile endpoints(endpointFilePath());
    QVERIFY(endpoints.addresses().contains(server.connectionString()));

    server.stop();
    QVERIFY(!server.isRunning());
    QCOMPARE(server.tcpPort(), quint16(0));
    QVERIFY(!QFile::exists(endpointFilePath()));
}

void HookEventServerTest::testLocalSocketStartStop()
{
    HookEventServer server(endpointFilePath());
    server.setMode(HookEventServer::LocalSocket);
    server.setSocketPath(m_dir.filePath(QStringLiteral("sockets/hooks-test.sock")));

    QVERIFY(server.start());
    QVERIFY(server.isRunning());
    QVERIFY(QFile::exists(server.socketPath()));
    QCOMPARE(server.connectionString(), server.socketPath());
    QCOMPARE(EndpointFile(endpointFilePath()).addresses(), QStringList{server.socketPath()});

    server.stop();
    QVERIFY(!server.isRunning());
    QVERIFY(!QFile::exists(server.socketPath()));
}

void HookEventServerTest::testStartTwice()
{
    HookEventServer server(endpointFilePath());
    QVERIFY(server.start());
    const quint16 port = server.tcpPort();

    QVERIFY(server.start());
    QCOMPARE(server.tcpPort(), port);
    QCOMPARE(EndpointFile(endpointFilePath()).addresses().size(), 1);

    server.stop();
}

void HookEventServerTest::testStopKeepsOtherEndpoints()
{
    HookEventServer first(endpointFilePath());
    HookEventServer second(endpointFilePath());
    QVERIFY(first.start());
    QVERIFY(second.start());

    EndpointFile endpoints(endpointFilePath());
    QCOMPARE(endpoints.addresses().size(), 2);

    first.stop();
    QCOMPARE(endpoints.addresses(), QStringList{second.connectionString()});

    second.stop();
    QVERIFY(!QFile::exists(endpointFilePath()));
}

void HookEventServerTest::testReceiveEventTcp()
{
    HookEventServer server(endpointFilePath());
    QVERIFY(server.start());
    QSignalSpy spy(&server, &HookEventServer::eventReceived);

    HookEvent event = sampleEvent(HookEvent::Kind::ToolStart, QStringLiteral("tcp-session"));
    event.toolName = QStringLiteral("Bash");
    event.toolInput[QStringLiteral("command")] = QStringLiteral("make");

    HookEventClient client;
    QVERIFY(client.sendEvent(server.connectionString(), event));
    QVERIFY(QTest::qWaitFor(
        [&]() {
            return spy.count() > 0;
        },
        2000));

    QCOMPARE(spy.count(), 1);
    const HookEvent received = spy.at(0).at(0).value<HookEvent>();
    QCOMPARE(received.kind, HookEvent::Kind::ToolStart);
    QCOMPARE(received.sessionId, QStringLiteral("tcp-session"));
    QCOMPARE(received.pid, qint64(4242));
    QCOMPARE(received.ppid, qint64(4000));
    QCOMPARE(received.toolName, QStringLiteral("Bash"));
    QCOMPARE(received.toolInput.value(QStringLiteral("command")).toString(), QStringLiteral("make"));

    server.stop();
}

void HookEventServerTest::testReceiveEventLocalSocket()
{
    HookEventServer server(endpointFilePath());
    server.setMode(HookEventServer::LocalSocket);
    server.setSocketPath(m_dir.filePath(QStringLiteral("sockets/hooks-receive.sock")));
    QVERIFY(server.start());
    QSignalSpy spy(&server, &HookEventServer::eventReceived);

    HookEventClient client;
    QVERIFY(client.sendEvent(server.connectionString(), sampleEvent(HookEvent::Kind::SessionEnd, QStringLiteral("local-session"))));
    QVERIFY(QTest::qWaitFor(
        [&]() {
            return spy.count() > 0;
        },
        2000));

    const HookEvent received = spy.at(0).at(0).value<HookEvent>();
    QCOMPARE(received.kind, HookEvent::Kind::SessionEnd);
    QCOMPARE(received.sessionId, QStringLiteral("local-session"));

    server.stop();
}

void HookEventServerTest::testMultipleLinesOneConnection()
{
    HookEventServer server(endpointFilePath());
    QVERIFY(server.start());
    QSignalSpy spy(&server, &HookEventServer::eventReceived);

    QTcpSocket *socket = connectRaw(server);
    QVERIFY(socket);
    socket->write(sessionStartLine("a") + "\n" + sessionStartLine("b") + "\n\n" + sessionStartLine("c") + "\n");
    QVERIFY(socket->waitForBytesWritten(1000));

    QVERIFY(QTest::qWaitFor(
        [&]() {
            return spy.count() >= 3;
        },
        2000));
    QCOMPARE(spy.count(), 3);
    QCOMPARE(spy.at(0).at(0).value<HookEvent>().sessionId, QStringLiteral("a"));
    QCOMPARE(spy.at(1).at(0).value<HookEvent>().sessionId, QStringLiteral("b"));
    QCOMPARE(spy.at(2).at(0).value<HookEvent>().sessionId, QStringLiteral("c"));

    closeRaw(socket);
    server.stop();
}

void HookEventServerTest::testSplitLineAcrossWrites()
{
    HookEventServer server(endpointFilePath());
    QVERIFY(server.start());
    QSignalSpy spy(&server, &HookEventServer::eventReceived);

    QTcpSocket *socket = connectRaw(server);
    QVERIFY(socket);
    const QByteArray line = sessionStartLine("split");
    socket->write(line.left(20));
    QVERIFY(socket->waitForBytesWritten(1000));
    QTest::qWait(50);
    QCOMPARE(spy.count(), 0);

    socket->write(line.mid(20) + "\n");
    QVERIFY(socket->waitForBytesWritten(1000));
    QVERIFY(QTest::qWaitFor(
        [&]() {
            return spy.count() > 0;
        },
        2000));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<HookEvent>().sessionId, QStringLiteral("split"));

    closeRaw(socket);
    server.stop();
}

void HookEventServerTest::testFinalLineWithoutNewline()
{
    HookEventServer server(endpointFilePath());
    QVERIFY(server.start());
    QSignalSpy spy(&server, &HookEventServer::eventReceived);

    QTcpSocket *socket = connectRaw(server);
    QVERIFY(socket);
    socket->write(sessionStartLine("unterminated"));
    QVERIFY(socket->waitForBytesWritten(1000));
    closeRaw(socket);

    QVERIFY(QTest::qWaitFor(
        [&]() {
            return spy.count() > 0;
        },
        2000));
    QCOMPARE(spy.at(0).at(0).value<HookEvent>().sessionId, QStringLiteral("unterminated"));

    server.stop();
}

void HookEventServerTest::testMalformedLineDropped()
{
    HookEventServer server(endpointFilePath());
    QVERIFY(server.start());
    QSignalSpy eventSpy(&server, &HookEventServer::eventReceived);
    QSignalSpy errorSpy(&server, &HookEventServer::errorOccurred);

    QTcpSocket *socket = connectRaw(server);
    QVERIFY(socket);
    socket->write("{this is not json\n[1,2,3]\n" + sessionStartLine("after-garbage") + "\n");
    QVERIFY(socket->waitForBytesWritten(1000));

    QVERIFY(QTest::qWaitFor(
        [&]() {
            return eventSpy.count() > 0;
        },
        2000));
    // The connection survives bad input
    QCOMPARE(eventSpy.count(), 1);
    QCOMPARE(errorSpy.count(), 2);
    QCOMPARE(eventSpy.at(0).at(0).value<HookEvent>().sessionId, QStringLiteral("after-garbage"));

    closeRaw(socket);
    server.stop();
}

void HookEventServerTest::testUnknownEventReported()
{
    HookEventServer server(endpointFilePath());
    QVERIFY(server.start());
    QSignalSpy eventSpy(&server, &HookEventServer::eventReceived);
    QSignalSpy errorSpy(&server, &HookEventServer::errorOccurred);

    QTcpSocket *socket = connectRaw(server);
    QVERIFY(socket);
    socket->write(R"({"event":"Notification","sessionId":"s1"})"
                  "\n");
    QVERIFY(socket->waitForBytesWritten(1000));

    QVERIFY(QTest::qWaitFor(
        [&]() {
            return errorSpy.count() > 0;
        },
        2000));
    QCOMPARE(eventSpy.count(), 0);

    closeRaw(socket);
    server.stop();
}

void HookEventServerTest::testClientSignals()
{
    HookEventServer server(endpointFilePath());
    QVERIFY(server.start());
    QSignalSpy connectedSpy(&server, &HookEventServer::clientConnected);
    QSignalSpy disconnectedSpy(&server, &HookEventServer::clientDisconnected);

    QTcpSocket *socket = connectRaw(server);
    QVERIFY(socket);
    QVERIFY(QTest::qWaitFor(
        [&]() {
            return connectedSpy.count() > 0;
        },
        1000));

    closeRaw(socket);
    QVERIFY(QTest::qWaitFor(
        [&]() {
            return disconnectedSpy.count() > 0;
        },
        1000));

    server.stop();
}

void HookEventServerTest::testSendEventNoListener()
{
    HookEventClient client;
    const HookEvent event = sampleEvent(HookEvent::Kind::SessionStart, QStringLiteral("nobody"));

    QVERIFY(!client.sendEvent(m_dir.filePath(QStringLiteral("missing.sock")), event, 200));
    QVERIFY(!client.sendEvent(QStringLiteral("not-an-address"), event, 200));
}

void HookEventServerTest::testBroadcast()
{
    HookEventServer first(endpointFilePath());
    HookEventServer second(endpointFilePath());
    QVERIFY(first.start());
    QVERIFY(second.start());
    QSignalSpy firstSpy(&first, &HookEventServer::eventReceived);
    QSignalSpy secondSpy(&second, &HookEventServer::eventReceived);

    HookEventClient client;
    const int delivered = client.broadcast(EndpointFile(endpointFilePath()), sampleEvent(HookEvent::Kind::SessionStart, QStringLiteral("fanout")));
    QCOMPARE(delivered, 2);

    QVERIFY(QTest::qWaitFor(
        [&]() {
            return firstSpy.count() > 0 && secondSpy.count() > 0;
        },
        2000));

    first.stop();
    second.stop();
}

QTEST_GUILESS_MAIN(HookEventServerTest)

#include "moc_HookEventServerTest.cpp"
