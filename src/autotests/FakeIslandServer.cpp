/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "FakeIslandServer.h"

// Qt
#include <QAtomicInt>
#include <QCoreApplication>
#include <QDir>
#include <QHostAddress>
#include <QJsonDocument>
#include <QLocalServer>
#include <QLocalSocket>
#include <QMutexLocker>
#include <QTcpServer>
#include <QTcpSocket>

using namespace ClaudeIsland;

namespace
{
QAtomicInt s_serverCounter;

bool isCompleteObject(const QByteArray &data)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    return error.error == QJsonParseError::NoError && doc.isObject();
}
}

FakeIslandServer::FakeIslandServer(Mode mode, QObject *parent)
    : QThread(parent)
    , m_mode(mode)
{
}

FakeIslandServer::~FakeIslandServer()
{
    wait(m_acceptTimeoutMs + 5000);
}

bool FakeIslandServer::startListening()
{
    if (m_mode == UnixSocket) {
        m_socketPath = QStringLiteral("%1/claude-island-test-%2-%3.sock")
                           .arg(QDir::tempPath())
                           .arg(QCoreApplication::applicationPid())
                           .arg(s_serverCounter.fetchAndAddRelaxed(1));
    }

    start();
    m_ready.acquire();
    return m_listening;
}

bool FakeIslandServer::waitDone(int ms)
{
    return wait(ms);
}

QString FakeIslandServer::tcpTarget() const
{
    return QStringLiteral("127.0.0.1:%1").arg(m_tcpPort);
}

QList<QByteArray> FakeIslandServer::received() const
{
    QMutexLocker locker(&m_mutex);
    return m_received;
}

int FakeIslandServer::connectionCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_received.size();
}

void FakeIslandServer::run()
{
    if (m_mode == UnixSocket) {
        QLocalServer::removeServer(m_socketPath);
        QLocalServer server;
        m_listening = server.listen(m_socketPath);
        m_ready.release();
        if (!m_listening) {
            return;
        }

        if (server.waitForNewConnection(m_acceptTimeoutMs)) {
            QLocalSocket *client = server.nextPendingConnection();
            serve(client);
            delete client;
        }
        server.close();
    } else {
        QTcpServer server;
        m_listening = server.listen(QHostAddress::LocalHost, 0);
        m_tcpPort = server.serverPort();
        m_ready.release();
        if (!m_listening) {
            return;
        }

        if (server.waitForNewConnection(m_acceptTimeoutMs)) {
            QTcpSocket *client = server.nextPendingConnection();
            serve(client);
            delete client;
        }
        server.close();
    }
}

template<typename Socket>
void FakeIslandServer::serve(Socket *socket)
{
    QByteArray data;
    const bool stopAtMessage = m_hangUp || !m_reply.isEmpty();

    while (true) {
        if (socket->bytesAvailable() == 0 && !socket->waitForReadyRead(m_acceptTimeoutMs)) {
            break;
        }
        data += socket->readAll();
        if (stopAtMessage && isCompleteObject(data)) {
            break;
        }
    }
    data += socket->readAll();

    if (!m_hangUp && !m_reply.isEmpty() && isCompleteObject(data)) {
        socket->write(m_reply);
        while (socket->bytesToWrite() > 0 && socket->waitForBytesWritten(1000)) {
        }
    }
    socket->close();

    QMutexLocker locker(&m_mutex);
    m_received.append(data);
}

#include "moc_FakeIslandServer.cpp"
