/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOOKTRANSPORT_H
#define HOOKTRANSPORT_H

#include <QByteArray>
#include <QObject>
#include <QString>

class QIODevice;
class QLocalSocket;
class QTcpSocket;

namespace ClaudeIsland
{

/**
 * Where and how long to talk to ClaudeIsland
 */
struct TransportConfig {
    QString tcpTarget;      // "host:port" or "port"; empty selects the Unix socket
    QString socketPath;     // Unix socket endpoint
    int timeoutMs;          // Connect, write and read timeout

    TransportConfig();

    /**
     * Defaults with CLAUDE_ISLAND_TCP applied
     */
    static TransportConfig fromEnvironment();
};

/**
 * HookTransport owns one connection to ClaudeIsland.
 *
 * Two modes:
 * - UnixSocket: QLocalSocket at /tmp/claude-island.sock (local sessions)
 * - TCP: QTcpSocket to host:port, normally an SSH reverse tunnel back to the
 *   machine running the app (remote sessions)
 *
 * There is no framing. A fire-and-forget message ends when close() is called;
 * a reply is whatever a single bounded receive() returns.
 *
 * The connection is closed when the object is destroyed.
 */
class HookTransport : public QObject
{
    Q_OBJECT

public:
    enum Mode {
        UnixSocket, ///< Local Unix socket
        TCP ///< TCP connection, tunneled via SSH -R for remote sessions
    };

    enum Error {
        NoError,
        ConfigurationError, ///< Malformed tcp target
        TransportError ///< Connect, write or read failed
    };

    /**
     * Resolved endpoint
     */
    struct Target {
        Mode mode = UnixSocket;
        QString socketPath;
        QString host;
        quint16 port = 0;
    };

    static constexpr int DefaultTimeoutMs = 300 * 1000;
    static constexpr qint64 MaxReplySize = 4096;

    explicit HookTransport(QObject *parent = nullptr);
    ~HookTransport() override;

    /**
     * Well-known Unix socket path of the app
     */
    static QString defaultSocketPath();

    /**
     * Resolve a config into an endpoint.
     *
     * The tcp target is split on the last ':'. Without a ':' the whole value
     * is the port and the host is "localhost".
     *
     * @param ok Set to false for a malformed tcp target
     * @param errorString Receives the reason when @p ok is false
     */
    static Target parseTarget(const TransportConfig &config, bool *ok = nullptr, QString *errorString = nullptr);

    /**
     * Connect to the endpoint described by @p config
     *
     * @return true if connected within config.timeoutMs
     */
    bool connectToIsland(const TransportConfig &config);

    /**
     * Write the whole payload and wait for it to leave the socket
     */
    bool send(const QByteArray &data);

    /**
     * Wait once for data and read at most MaxReplySize bytes.
     *
     * @return empty on timeout or disconnect
     */
    QByteArray receive();

    /**
     * Disconnect. Safe to call more than once.
     */
    void close();

    bool isConnected() const;

    Mode mode() const
    {
        return m_target.mode;
    }

    Target target() const
    {
        return m_target;
    }

    Error error() const
    {
        return m_error;
    }

    QString errorString() const
    {
        return m_errorString;
    }

Q_SIGNALS:
    /**
     * Emitted when an error occurs
     */
    void errorOccurred(const QString &message);

private:
    void setError(Error error, const QString &message);
    bool connectLocal();
    bool connectTcp();

    Target m_target;
    int m_timeoutMs = DefaultTimeoutMs;
    Error m_error = NoError;
    QString m_errorString;

    // Unix socket mode
    QLocalSocket *m_localSocket = nullptr;

    // TCP mode
    QTcpSocket *m_tcpSocket = nullptr;

    QIODevice *m_device = nullptr;
};

} // namespace ClaudeIsland

#endif // HOOKTRANSPORT_H
