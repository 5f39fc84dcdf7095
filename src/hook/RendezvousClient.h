/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RENDEZVOUSCLIENT_H
#define RENDEZVOUSCLIENT_H

#include "DecisionTranslator.h"
#include "HookTransport.h"
#include "SessionStatusRecord.h"

#include <QObject>

namespace ClaudeIsland
{

/**
 * RendezvousClient delivers one SessionStatusRecord to ClaudeIsland.
 *
 * Every send() opens its own connection and closes it before returning.
 * For waiting_for_approval records it then blocks (bounded by the transport
 * timeout) for the app's decision; every other record is fire-and-forget.
 *
 * Failures never propagate: an unreachable app, a timeout or a garbled reply
 * all come back as an invalid DecisionReply.
 */
class RendezvousClient : public QObject
{
    Q_OBJECT

public:
    explicit RendezvousClient(const TransportConfig &config, QObject *parent = nullptr);
    ~RendezvousClient() override;

    TransportConfig config() const
    {
        return m_config;
    }

    /**
     * Send a record, waiting for a decision if the record expects one
     *
     * @return the decision, or an invalid reply if none was received
     */
    DecisionReply send(const SessionStatusRecord &record);

    /**
     * Error of the last send(), NoError when it went through
     */
    HookTransport::Error lastError() const
    {
        return m_lastError;
    }

Q_SIGNALS:
    /**
     * Emitted when delivery or the reply fails
     */
    void errorOccurred(const QString &message);

private:
    TransportConfig m_config;
    HookTransport::Error m_lastError = HookTransport::NoError;
};

} // namespace ClaudeIsland

#endif // RENDEZVOUSCLIENT_H
