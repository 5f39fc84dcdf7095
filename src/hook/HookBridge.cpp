/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HookBridge.h"

#include "DecisionTranslator.h"
#include "EventClassifier.h"
#include "RendezvousClient.h"

#include <QDebug>
#include <QIODevice>
#include <QJsonDocument>
#include <QJsonObject>

namespace ClaudeIsland
{

namespace
{
HookBridge::Error bridgeError(HookTransport::Error error)
{
    switch (error) {
    case HookTransport::ConfigurationError:
        return HookBridge::ConfigurationError;
    case HookTransport::TransportError:
        return HookBridge::TransportError;
    case HookTransport::NoError:
    default:
        return HookBridge::NoError;
    }
}
}

HookBridge::HookBridge(const TerminalResolver *terminals, const PaneResolver *panes, QObject *parent)
    : QObject(parent)
    , m_terminals(terminals)
    , m_panes(panes)
{
}

HookBridge::~HookBridge() = default;

int HookBridge::run(QIODevice *input, QIODevice *output)
{
    m_lastError = NoError;

    const QByteArray inputData = input ? input->readAll() : QByteArray();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(inputData, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "HookBridge: Failed to parse hook input:"
                   << (parseError.error != QJsonParseError::NoError ? parseError.errorString() : QStringLiteral("not a JSON object"));
        m_lastError = InputParseError;
        return 1;
    }

    const QJsonObject event = doc.object();

    // Permission prompts are covered by PermissionRequest, skip before probing anything
    if (EventClassifier::isSuppressed(event)) {
        qDebug() << "HookBridge: Skipping permission_prompt notification";
        return 0;
    }

    const AmbientContext context = AmbientContext::discover(*m_terminals, *m_panes, m_supervisorPid, m_remoteHost);

    SessionStatusRecord record;
    if (!EventClassifier::classify(event, context, &record)) {
        return 0;
    }

    qDebug() << "HookBridge:" << record.event << "->" << SessionStatusRecord::statusName(record.status);

    RendezvousClient client(m_config);
    const DecisionReply reply = client.send(record);
    m_lastError = bridgeError(client.lastError());

    if (!record.expectsReply()) {
        return 0;
    }

    if (!reply.isValid() && m_lastError == NoError) {
        m_lastError = ReplyParseError;
    }

    const DecisionTranslator::ControlSignal result = DecisionTranslator::translate(reply);
    if (!result.hasOutput()) {
        // No answer or "ask": let Claude Code show its normal UI
        qDebug() << "HookBridge: Deferring permission decision to Claude Code";
        return 0;
    }

    if (output) {
        output->write(QJsonDocument(result.toHookOutput()).toJson(QJsonDocument::Compact) + "\n");
    }
    return 0;
}

} // namespace ClaudeIsland

#include "moc_HookBridge.cpp"
