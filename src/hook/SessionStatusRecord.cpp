/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionStatusRecord.h"

#include <QJsonDocument>

namespace ClaudeIsland
{

namespace
{
QJsonValue stringOrNull(const QString &value)
{
    if (value.isNull()) {
        return QJsonValue(QJsonValue::Null);
    }
    return value;
}
}

QString SessionStatusRecord::statusName(Status status)
{
    switch (status) {
    case Status::Processing:
        return QStringLiteral("processing");
    case Status::RunningTool:
        return QStringLiteral("running_tool");
    case Status::WaitingForApproval:
        return QStringLiteral("waiting_for_approval");
    case Status::WaitingForInput:
        return QStringLiteral("waiting_for_input");
    case Status::Ended:
        return QStringLiteral("ended");
    case Status::Compacting:
        return QStringLiteral("compacting");
    case Status::Notification:
        return QStringLiteral("notification");
    case Status::Unknown:
    default:
        return QStringLiteral("unknown");
    }
}

QJsonObject SessionStatusRecord::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("session_id")] = sessionId;
    obj[QStringLiteral("cwd")] = cwd;
    obj[QStringLiteral("event")] = event;
    obj[QStringLiteral("pid")] = pid;
    if (!tty.isEmpty()) {
        obj[QStringLiteral("tty")] = tty;
    }
    if (!remoteHost.isEmpty()) {
        obj[QStringLiteral("remote_host")] = remoteHost;
    }
    if (!tmuxTarget.isEmpty()) {
        obj[QStringLiteral("tmux_target")] = tmuxTarget;
    }
    obj[QStringLiteral("status")] = statusName(status);

    if (hasToolFields) {
        obj[QStringLiteral("tool")] = stringOrNull(tool);
        obj[QStringLiteral("tool_input")] = toolInput;
        if (!toolUseId.isEmpty()) {
            obj[QStringLiteral("tool_use_id")] = toolUseId;
        }
    }

    if (hasNotificationFields) {
        obj[QStringLiteral("notification_type")] = stringOrNull(notificationType);
        obj[QStringLiteral("message")] = stringOrNull(message);
    }

    return obj;
}

QByteArray SessionStatusRecord::toWire() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

} // namespace ClaudeIsland
