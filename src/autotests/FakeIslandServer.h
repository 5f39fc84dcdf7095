/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKEISLANDSERVER_H
#define FAKEISLANDSERVER_H

#include <QByteArray>
#include <QList>
#include <QMutex>
#include <QSemaphore>
#include <QString>
#include <QThread>

namespace ClaudeIsland
{

/**
 * Stand-in for the ClaudeIsland app in tests.
 *
 * Accepts a single connection on its own thread using the blocking socket
 * API, so the blocking hook client can run on the test thread. It reads
 * until the client hangs up, or, when a reply or a hang-up is configured,
 * until a complete JSON object has arrived, then answers (or not) and closes.
 */
class FakeIslandServer : public QThread
{
    Q_OBJECT

public:
    enum Mode {
        UnixSocket,
        TCP
    };

    explicit FakeIslandServer(Mode mode = UnixSocket, QObject *parent = nullptr);
    ~FakeIslandServer() override;

    /**
     * Bytes to answer with once a full message arrived. Empty never answers.
     */
    void setReply(const QByteArray &reply)
    {
        m_reply = reply;
    }

    /**
     * Close as soon as a full message arrived, without answering
     */
    void setHangUpAfterMessage(bool hangUp)
    {
        m_hangUp = hangUp;
    }

    /**
     * How long to wait for the client to connect
     */
    void setAcceptTimeout(int ms)
    {
        m_acceptTimeoutMs = ms;
    }

    /**
     * Start the thread and block until the server listens
     */
    bool startListening();

    /**
     * Wait for the connection to be served
     */
    bool waitDone(int ms = 5000);

    QString socketPath() const
    {
        return m_socketPath;
    }

    quint16 tcpPort() const
    {
        return m_tcpPort;
    }

    /**
     * "127.0.0.1:<port>" for TCP mode
     */
    QString tcpTarget() const;

    /**
     * Everything the client sent, one entry per connection
     */
    QList<QByteArray> received() const;

    int connectionCount() const;

protected:
    void run() override;

private:
    template<typename Socket>
    void serve(Socket *socket);

    Mode m_mode;
    QByteArray m_reply;
    bool m_hangUp = false;
    int m_acceptTimeoutMs = 3000;
    QString m_socketPath;
    quint16 m_tcpPort = 0;
    bool m_listening = false;
    QSemaphore m_ready;

    mutable QMutex m_mutex;
    QList<QByteArray> m_received;
};

}

#endif // FAKEISLANDSERVER_H
