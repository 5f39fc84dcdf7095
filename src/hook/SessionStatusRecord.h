/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSTATUSRECORD_H
#define SESSIONSTATUSRECORD_H

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace ClaudeIsland
{

/**
 * SessionStatusRecord is the payload sent to ClaudeIsland for one hook event.
 *
 * It carries the session identification, the ambient process context and
 * exactly one normalized status. Which of the optional fields end up on the
 * wire depends on the status:
 * - tool fields for running_tool, processing (after PostToolUse) and
 *   waiting_for_approval
 * - notification fields for notification and waiting_for_input (idle prompt)
 */
class SessionStatusRecord
{
public:
    /**
     * Normalized session status
     */
    enum class Status {
        Processing,
        RunningTool,
        WaitingForApproval,
        WaitingForInput,
        Ended,
        Compacting,
        Notification,
        Unknown
    };

    SessionStatusRecord() = default;
    ~SessionStatusRecord() = default;

    // Session identification
    QString sessionId = QStringLiteral("unknown");
    QString cwd;
    QString event;              // Raw hook_event_name

    // Ambient context
    qint64 pid = 0;             // Supervising (parent) process
    QString tty;                // Empty when undiscoverable
    QString remoteHost;         // Empty unless CLAUDE_ISLAND_REMOTE_HOST is set
    QString tmuxTarget;         // Empty unless remote and a pane was found

    Status status = Status::Unknown;

    // Tool fields
    bool hasToolFields = false;
    QString tool;               // Null string is sent as JSON null
    QJsonValue toolInput = QJsonObject();
    QString toolUseId;          // Omitted when empty

    // Notification fields
    bool hasNotificationFields = false;
    QString notificationType;   // Null string is sent as JSON null
    QString message;            // Null string is sent as JSON null

    /**
     * Wire name of a status (e.g. "waiting_for_approval")
     */
    static QString statusName(Status status);

    /**
     * Whether the sender has to wait for a decision after sending this record
     */
    bool expectsReply() const
    {
        return status == Status::WaitingForApproval;
    }

    /**
     * Serialize to JSON, omitting fields that do not apply to the status
     */
    QJsonObject toJson() const;

    /**
     * Compact UTF-8 JSON as written to the socket
     */
    QByteArray toWire() const;
};

} // namespace ClaudeIsland

#endif // SESSIONSTATUSRECORD_H
