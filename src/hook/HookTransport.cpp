/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HookTransport.h"

#include <QDebug>
#include <QLocalSocket>
#include <QTcpSocket>

namespace ClaudeIsland
{

// ============================================================================
// TransportConfig
// ============================================================================

TransportConfig::TransportConfig()
    : socketPath(HookTransport::defaultSocketPath())
    , timeoutMs(HookTransport::DefaultTimeoutMs)
{
}

TransportConfig TransportConfig::fromEnvironment()
{
    TransportConfig config;
    config.tcpTarget = qEnvironmentVariable("CLAUDE_ISLAND_TCP");
    return config;
}

// ============================================================================
// HookTransport
// ============================================================================

HookTransport::HookTransport(QObject *parent)
    : QObject(parent)
{
}

HookTransport::~HookTransport()
{
    close();
}

QString HookTransport::defaultSocketPath()
{
    return QStringLiteral("/tmp/claude-island.sock");
}

HookTransport::Target HookTransport::parseTarget(const TransportConfig &config, bool *ok, QString *errorString)
{
    Target target;
    if (ok) *ok = true;

    if (config.tcpTarget.isEmpty()) {
        target.mode = UnixSocket;
        target.socketPath = config.socketPath;
        return target;
    }

    target.mode = TCP;

    QString portString;
    const int colon = config.tcpTarget.lastIndexOf(QLatin1Char(':'));
    if (colon < 0) {
        target.host = QStringLiteral("localhost");
        portString = config.tcpTarget;
    } else {
        target.host = config.tcpTarget.left(colon);
        portString = config.tcpTarget.mid(colon + 1);
    }

    bool portOk = false;
    const uint port = portString.trimmed().toUInt(&portOk);
    if (!portOk || port == 0 || port > 65535) {
        if (ok) *ok = false;
        if (errorString) *errorString = QStringLiteral("Invalid port in tcp target: %1").arg(config.tcpTarget);
        return target;
    }

    if (target.host.isEmpty()) {
        if (ok) *ok = false;
        if (errorString) *errorString = QStringLiteral("Missing host in tcp target: %1").arg(config.tcpTarget);
        return target;
    }

    target.port = static_cast<quint16>(port);
    return target;
}

bool HookTransport::connectToIsland(const TransportConfig &config)
{
    close();
    m_error = NoError;
    m_errorString.clear();
    m_timeoutMs = config.timeoutMs;

    bool ok = false;
    QString parseError;
    m_target = parseTarget(config, &ok, &parseError);
    if (!ok) {
        setError(ConfigurationError, parseError);
        return false;
    }

    return m_target.mode == TCP ? connectTcp() : connectLocal();
}

bool HookTransport::connectLocal()
{
    m_localSocket = new QLocalSocket(this);
    m_device = m_localSocket;

    m_localSocket->connectToServer(m_target.socketPath);
    if (!m_localSocket->waitForConnected(m_timeoutMs)) {
        setError(TransportError,
                 QStringLiteral("Failed to connect to %1: %2").arg(m_target.socketPath, m_localSocket->errorString()));
        close();
        return false;
    }

    qDebug() << "HookTransport: Connected to" << m_target.socketPath;
    return true;
}

bool HookTransport::connectTcp()
{
    m_tcpSocket = new QTcpSocket(this);
    m_device = m_tcpSocket;

    m_tcpSocket->connectToHost(m_target.host, m_target.port);
    if (!m_tcpSocket->waitForConnected(m_timeoutMs)) {
        setError(TransportError,
                 QStringLiteral("Failed to connect to %1:%2: %3").arg(m_target.host).arg(m_target.port).arg(m_tcpSocket->errorString()));
        close();
        return false;
    }

    qDebug() << "HookTransport: Connected to" << m_target.host << m_target.port;
    return true;
}

bool HookTransport::send(const QByteArray &data)
{
    if (!isConnected()) {
        setError(TransportError, QStringLiteral("Not connected"));
        return false;
    }

    if (m_device->write(data) != data.size()) {
        setError(TransportError, QStringLiteral("Write failed: ") + m_device->errorString());
        return false;
    }

    while (m_device->bytesToWrite() > 0) {
        if (!m_device->waitForBytesWritten(m_timeoutMs)) {
            setError(TransportError, QStringLiteral("Write timed out: ") + m_device->errorString());
            return false;
        }
    }

    return true;
}

QByteArray HookTransport::receive()
{
    if (!m_device) {
        setError(TransportError, QStringLiteral("Not connected"));
        return QByteArray();
    }

    if (m_device->bytesAvailable() == 0 && !m_device->waitForReadyRead(m_timeoutMs)) {
        setError(TransportError, QStringLiteral("No reply: ") + m_device->errorString());
        return QByteArray();
    }

    return m_device->read(MaxReplySize);
}

void HookTransport::close()
{
    if (m_localSocket) {
        if (m_localSocket->state() != QLocalSocket::UnconnectedState) {
            m_localSocket->disconnectFromServer();
            if (m_localSocket->state() != QLocalSocket::UnconnectedState) {
                m_localSocket->waitForDisconnected(1000);
            }
        }
        delete m_localSocket;
        m_localSocket = nullptr;
    }

    if (m_tcpSocket) {
        if (m_tcpSocket->state() != QAbstractSocket::UnconnectedState) {
            m_tcpSocket->disconnectFromHost();
            if (m_tcpSocket->state() != QAbstractSocket::UnconnectedState) {
                m_tcpSocket->waitForDisconnected(1000);
            }
        }
        delete m_tcpSocket;
        m_tcpSocket = nullptr;
    }

    m_device = nullptr;
}

bool HookTransport::isConnected() const
{
    if (m_localSocket) {
        return m_localSocket->state() == QLocalSocket::ConnectedState;
    }
    if (m_tcpSocket) {
        return m_tcpSocket->state() == QAbstractSocket::ConnectedState;
    }
    return false;
}

void HookTransport::setError(Error error, const QString &message)
{
    m_error = error;
    m_errorString = message;
    qWarning() << "HookTransport:" << message;
    Q_EMIT errorOccurred(message);
}

} // namespace ClaudeIsland

#include "moc_HookTransport.cpp"
