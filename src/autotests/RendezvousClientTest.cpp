/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "RendezvousClientTest.h"

// Qt
#include <QElapsedTimer>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSignalSpy>
#include <QTest>

// ClaudeIsland
#include "../hook/RendezvousClient.h"
#include "FakeIslandServer.h"

using namespace ClaudeIsland;

namespace
{
SessionStatusRecord stopRecord()
{
    SessionStatusRecord record;
    record.sessionId = QStringLiteral("s-stop");
    record.event = QStringLiteral("Stop");
    record.pid = 100;
    record.status = SessionStatusRecord::Status::WaitingForInput;
    return record;
}

SessionStatusRecord approvalRecord()
{
    SessionStatusRecord record;
    record.sessionId = QStringLiteral("s-perm");
    record.event = QStringLiteral("PermissionRequest");
    record.pid = 100;
    record.status = SessionStatusRecord::Status::WaitingForApproval;
    record.hasToolFields = true;
    record.tool = QStringLiteral("Bash");
    record.toolInput = QJsonObject{{QStringLiteral("command"), QStringLiteral("rm -rf build")}};
    return record;
}

TransportConfig unixConfig(const FakeIslandServer &server, int timeoutMs = 2000)
{
    TransportConfig config;
    config.socketPath = server.socketPath();
    config.timeoutMs = timeoutMs;
    return config;
}

QJsonObject receivedObject(const FakeIslandServer &server)
{
    return QJsonDocument::fromJson(server.received().value(0)).object();
}
}

void RendezvousClientTest::testFireAndForgetSendsOnce()
{
    FakeIslandServer server;
    QVERIFY(server.startListening());

    RendezvousClient client(unixConfig(server));
    DecisionReply reply = client.send(stopRecord());

    QVERIFY(!reply.isValid());
    QCOMPARE(client.lastError(), HookTransport::NoError);

    QVERIFY(server.waitDone());
    QCOMPARE(server.connectionCount(), 1);
    QCOMPARE(server.received().at(0), stopRecord().toWire());
}

void RendezvousClientTest::testFireAndForgetIgnoresReply()
{
    FakeIslandServer server;
    server.setReply(QByteArrayLiteral("{\"decision\":\"allow\"}"));
    QVERIFY(server.startListening());

    RendezvousClient client(unixConfig(server));
    DecisionReply reply = client.send(stopRecord());

    // Non-approval records never read
    QVERIFY(!reply.isValid());

    QVERIFY(server.waitDone());
    QCOMPARE(receivedObject(server).value(QStringLiteral("status")).toString(), QStringLiteral("waiting_for_input"));
}

void RendezvousClientTest::testFireAndForgetTcp()
{
    FakeIslandServer server(FakeIslandServer::TCP);
    QVERIFY(server.startListening());

    TransportConfig config;
    config.tcpTarget = server.tcpTarget();
    config.timeoutMs = 2000;

    RendezvousClient client(config);
    QVERIFY(!client.send(stopRecord()).isValid());

    QVERIFY(server.waitDone());
    QCOMPARE(receivedObject(server).value(QStringLiteral("session_id")).toString(), QStringLiteral("s-stop"));
}

void RendezvousClientTest::testApprovalAllow()
{
    FakeIslandServer server;
    server.setReply(QByteArrayLiteral("{\"decision\":\"allow\"}"));
    QVERIFY(server.startListening());

    RendezvousClient client(unixConfig(server));
    DecisionReply reply = client.send(approvalRecord());

    QVERIFY(reply.isValid());
    QCOMPARE(reply.decision(), DecisionReply::Decision::Allow);

    QVERIFY(server.waitDone());
    QJsonObject sent = receivedObject(server);
    QCOMPARE(sent.value(QStringLiteral("status")).toString(), QStringLiteral("waiting_for_approval"));
    QCOMPARE(sent.value(QStringLiteral("tool")).toString(), QStringLiteral("Bash"));
}

void RendezvousClientTest::testApprovalDenyTcp()
{
    FakeIslandServer server(FakeIslandServer::TCP);
    server.setReply(QByteArrayLiteral("{\"decision\":\"deny\",\"reason\":\"not now\"}"));
    QVERIFY(server.startListening());

    TransportConfig config;
    config.tcpTarget = server.tcpTarget();
    config.timeoutMs = 2000;

    RendezvousClient client(config);
    DecisionReply reply = client.send(approvalRecord());

    QVERIFY(reply.isValid());
    QCOMPARE(reply.decision(), DecisionReply::Decision::Deny);
    QCOMPARE(reply.reason(), QStringLiteral("not now"));
    QVERIFY(server.waitDone());
}

void RendezvousClientTest::testApprovalTimeout()
{
    FakeIslandServer server;
    QVERIFY(server.startListening());

    QElapsedTimer clock;
    clock.start();

    RendezvousClient client(unixConfig(server, 300));
    DecisionReply reply = client.send(approvalRecord());

    QVERIFY(!reply.isValid());
    QCOMPARE(client.lastError(), HookTransport::TransportError);
    QVERIFY(clock.elapsed() >= 250);
    QVERIFY(clock.elapsed() < 3000);

    QVERIFY(server.waitDone());
    QCOMPARE(server.connectionCount(), 1);
}

void RendezvousClientTest::testApprovalMalformedReply()
{
    FakeIslandServer server;
    server.setReply(QByteArrayLiteral("definitely not json"));
    QVERIFY(server.startListening());

    RendezvousClient client(unixConfig(server));
    QSignalSpy errorSpy(&client, &RendezvousClient::errorOccurred);

    DecisionReply reply = client.send(approvalRecord());

    QVERIFY(!reply.isValid());
    QCOMPARE(client.lastError(), HookTransport::NoError);
    QCOMPARE(errorSpy.count(), 1);
    QVERIFY(server.waitDone());
}

void RendezvousClientTest::testApprovalPeerClosesWithoutReply()
{
    FakeIslandServer server;
    server.setHangUpAfterMessage(true);
    QVERIFY(server.startListening());

    QElapsedTimer clock;
    clock.start();

    // Long timeout: the hang-up, not the timer, has to end the wait
    RendezvousClient client(unixConfig(server, 10000));
    DecisionReply reply = client.send(approvalRecord());

    QVERIFY(!reply.isValid());
    QVERIFY(clock.elapsed() < 5000);

    QVERIFY(server.waitDone());
    QCOMPARE(receivedObject(server).value(QStringLiteral("status")).toString(), QStringLiteral("waiting_for_approval"));
}

void RendezvousClientTest::testUnreachableSocket()
{
    TransportConfig config;
    config.socketPath = QStringLiteral("/tmp/nonexistent-claude-island-rendezvous.sock");
    config.timeoutMs = 500;

    RendezvousClient client(config);

    QVERIFY(!client.send(stopRecord()).isValid());
    QCOMPARE(client.lastError(), HookTransport::TransportError);

    QVERIFY(!client.send(approvalRecord()).isValid());
    QCOMPARE(client.lastError(), HookTransport::TransportError);
}

void RendezvousClientTest::testMalformedTarget()
{
    TransportConfig config;
    config.tcpTarget = QStringLiteral("localhost:port");

    RendezvousClient client(config);

    QVERIFY(!client.send(approvalRecord()).isValid());
    QCOMPARE(client.lastError(), HookTransport::ConfigurationError);
}

void RendezvousClientTest::testErrorSignal()
{
    TransportConfig config;
    config.socketPath = QStringLiteral("/tmp/nonexistent-claude-island-signal.sock");
    config.timeoutMs = 500;

    RendezvousClient client(config);
    QSignalSpy errorSpy(&client, &RendezvousClient::errorOccurred);

    client.send(stopRecord());
    QCOMPARE(errorSpy.count(), 1);
}

QTEST_GUILESS_MAIN(RendezvousClientTest)

#include "moc_RendezvousClientTest.cpp"
