/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef DECISIONTRANSLATOR_H
#define DECISIONTRANSLATOR_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace ClaudeIsland
{

/**
 * DecisionReply is what ClaudeIsland answers to a waiting_for_approval record:
 *   {"decision": "allow" | "deny" | "ask", "reason": "..."}
 *
 * A default-constructed reply is invalid and stands for "no reply".
 */
class DecisionReply
{
public:
    enum class Decision {
        Ask,
        Allow,
        Deny
    };

    DecisionReply() = default;

    /**
     * Whether a reply was actually received and parsed
     */
    bool isValid() const
    {
        return m_valid;
    }

    Decision decision() const
    {
        return m_decision;
    }

    QString reason() const
    {
        return m_reason;
    }

    /**
     * Parse decision name, anything unrecognized reads as Ask
     */
    static Decision parseDecision(const QString &name);

    /**
     * Deserialize from JSON
     */
    static DecisionReply fromJson(const QJsonObject &obj);

    /**
     * Parse raw reply bytes.
     *
     * @param ok Set to false if the bytes are not a JSON object
     * @return an invalid reply when parsing fails
     */
    static DecisionReply fromBytes(const QByteArray &data, bool *ok = nullptr);

private:
    bool m_valid = false;
    Decision m_decision = Decision::Ask;
    QString m_reason;
};

/**
 * DecisionTranslator turns a DecisionReply into what Claude Code expects from
 * a PermissionRequest hook.
 *
 * Anything other than an explicit allow or deny defers to Claude Code, which
 * then shows its normal permission prompt.
 */
class DecisionTranslator
{
public:
    /**
     * Control flow signal handed back to Claude Code
     */
    struct ControlSignal {
        enum Kind {
            DeferToDefault, ///< No output, Claude shows its own prompt
            Allow, ///< Approve the tool call
            Deny ///< Refuse the tool call with message
        };

        Kind kind = DeferToDefault;
        QString message; // Deny only

        /**
         * Whether anything has to be written to stdout
         */
        bool hasOutput() const
        {
            return kind != DeferToDefault;
        }

        /**
         * hookSpecificOutput document for Allow / Deny, empty for DeferToDefault
         */
        QJsonObject toHookOutput() const;
    };

    /**
     * Message used when a deny comes without a reason
     */
    static QString defaultDenyReason();

    static ControlSignal translate(const DecisionReply &reply);
};

} // namespace ClaudeIsland

#endif // DECISIONTRANSLATOR_H
