/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "RendezvousClient.h"

#include <QDebug>

namespace ClaudeIsland
{

RendezvousClient::RendezvousClient(const TransportConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
{
}

RendezvousClient::~RendezvousClient() = default;

DecisionReply RendezvousClient::send(const SessionStatusRecord &record)
{
    m_lastError = HookTransport::NoError;

    HookTransport transport;
    connect(&transport, &HookTransport::errorOccurred, this, &RendezvousClient::errorOccurred);

    if (!transport.connectToIsland(m_config) || !transport.send(record.toWire())) {
        m_lastError = transport.error();
        return DecisionReply();
    }

    if (!record.expectsReply()) {
        // The app reads until we hang up
        transport.close();
        return DecisionReply();
    }

    qDebug() << "RendezvousClient: Waiting for decision on" << record.tool;

    const QByteArray response = transport.receive();
    transport.close();

    if (response.isEmpty()) {
        m_lastError = transport.error();
        return DecisionReply();
    }

    bool ok = false;
    DecisionReply reply = DecisionReply::fromBytes(response, &ok);
    if (!ok) {
        qWarning() << "RendezvousClient: Ignoring malformed reply:" << response.left(200);
        Q_EMIT errorOccurred(QStringLiteral("Malformed decision reply"));
        return DecisionReply();
    }

    return reply;
}

} // namespace ClaudeIsland

#include "moc_RendezvousClient.cpp"
