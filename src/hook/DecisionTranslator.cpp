/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "DecisionTranslator.h"

#include <QDebug>
#include <QJsonDocument>

namespace ClaudeIsland
{

// ============================================================================
// DecisionReply
// ============================================================================

DecisionReply::Decision DecisionReply::parseDecision(const QString &name)
{
    if (name == QLatin1String("allow")) {
        return Decision::Allow;
    }
    if (name == QLatin1String("deny")) {
        return Decision::Deny;
    }
    return Decision::Ask;
}

DecisionReply DecisionReply::fromJson(const QJsonObject &obj)
{
    DecisionReply reply;
    reply.m_valid = true;
    reply.m_decision = parseDecision(obj.value(QStringLiteral("decision")).toString(QStringLiteral("ask")));
    reply.m_reason = obj.value(QStringLiteral("reason")).toString();
    return reply;
}

DecisionReply DecisionReply::fromBytes(const QByteArray &data, bool *ok)
{
    if (data.trimmed().isEmpty()) {
        if (ok) *ok = false;
        return DecisionReply();
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);

    if (error.error != QJsonParseError::NoError) {
        qWarning() << "DecisionReply: Failed to parse reply:" << error.errorString();
        if (ok) *ok = false;
        return DecisionReply();
    }

    if (!doc.isObject()) {
        qWarning() << "DecisionReply: Reply is not a JSON object";
        if (ok) *ok = false;
        return DecisionReply();
    }

    if (ok) *ok = true;
    return fromJson(doc.object());
}

// ============================================================================
// DecisionTranslator
// ============================================================================

QJsonObject DecisionTranslator::ControlSignal::toHookOutput() const
{
    if (kind == DeferToDefault) {
        return QJsonObject();
    }

    QJsonObject decision;
    if (kind == Allow) {
        decision[QStringLiteral("behavior")] = QStringLiteral("allow");
    } else {
        decision[QStringLiteral("behavior")] = QStringLiteral("deny");
        decision[QStringLiteral("message")] = message;
    }

    QJsonObject hookOutput;
    hookOutput[QStringLiteral("hookEventName")] = QStringLiteral("PermissionRequest");
    hookOutput[QStringLiteral("decision")] = decision;

    QJsonObject output;
    output[QStringLiteral("hookSpecificOutput")] = hookOutput;
    return output;
}

QString DecisionTranslator::defaultDenyReason()
{
    return QStringLiteral("Denied by user via ClaudeIsland");
}

DecisionTranslator::ControlSignal DecisionTranslator::translate(const DecisionReply &reply)
{
    ControlSignal result;
    if (!reply.isValid()) {
        return result;
    }

    switch (reply.decision()) {
    case DecisionReply::Decision::Allow:
        result.kind = ControlSignal::Allow;
        break;
    case DecisionReply::Decision::Deny:
        result.kind = ControlSignal::Deny;
        result.message = reply.reason().isEmpty() ? defaultDenyReason() : reply.reason();
        break;
    case DecisionReply::Decision::Ask:
        result.kind = ControlSignal::DeferToDefault;
        break;
    }

    return result;
}

} // namespace ClaudeIsland
