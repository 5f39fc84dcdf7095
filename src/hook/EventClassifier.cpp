/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "EventClassifier.h"

#include "TerminalResolver.h"
#include "TmuxPaneResolver.h"

namespace ClaudeIsland
{

namespace
{
// Missing keys stay null so the record can send JSON null
QString optionalString(const QJsonObject &obj, const QString &key)
{
    const QJsonValue value = obj.value(key);
    if (!value.isString()) {
        return QString();
    }
    return value.toString();
}

void copyToolFields(const QJsonObject &input, SessionStatusRecord *record, bool withToolUseId)
{
    record->hasToolFields = true;
    record->tool = optionalString(input, QStringLiteral("tool_name"));

    const QJsonValue toolInput = input.value(QStringLiteral("tool_input"));
    record->toolInput = toolInput.isUndefined() ? QJsonValue(QJsonObject()) : toolInput;

    if (withToolUseId) {
        record->toolUseId = input.value(QStringLiteral("tool_use_id")).toString();
    }
}

void copyNotificationFields(const QJsonObject &input, SessionStatusRecord *record)
{
    record->hasNotificationFields = true;
    record->notificationType = optionalString(input, QStringLiteral("notification_type"));
    record->message = optionalString(input, QStringLiteral("message"));
}
}

AmbientContext AmbientContext::discover(const TerminalResolver &terminals,
                                        const PaneResolver &panes,
                                        qint64 pid,
                                        const QString &remoteHost)
{
    AmbientContext context;
    context.pid = pid;
    context.tty = TerminalResolver::resolveTty(terminals, pid);
    context.remoteHost = remoteHost;
    if (!remoteHost.isEmpty()) {
        context.tmuxTarget = PaneResolver::resolveTarget(panes);
    }
    return context;
}

EventClassifier::Event EventClassifier::parseEvent(const QString &name)
{
    if (name == QLatin1String("UserPromptSubmit")) {
        return Event::UserPromptSubmit;
    } else if (name == QLatin1String("PreToolUse")) {
        return Event::PreToolUse;
    } else if (name == QLatin1String("PostToolUse")) {
        return Event::PostToolUse;
    } else if (name == QLatin1String("PermissionRequest")) {
        return Event::PermissionRequest;
    } else if (name == QLatin1String("Notification")) {
        return Event::Notification;
    } else if (name == QLatin1String("Stop")) {
        return Event::Stop;
    } else if (name == QLatin1String("SubagentStop")) {
        return Event::SubagentStop;
    } else if (name == QLatin1String("SessionStart")) {
        return Event::SessionStart;
    } else if (name == QLatin1String("SessionEnd")) {
        return Event::SessionEnd;
    } else if (name == QLatin1String("PreCompact")) {
        return Event::PreCompact;
    }
    return Event::Unknown;
}

QString EventClassifier::eventName(Event event)
{
    switch (event) {
    case Event::UserPromptSubmit:
        return QStringLiteral("UserPromptSubmit");
    case Event::PreToolUse:
        return QStringLiteral("PreToolUse");
    case Event::PostToolUse:
        return QStringLiteral("PostToolUse");
    case Event::PermissionRequest:
        return QStringLiteral("PermissionRequest");
    case Event::Notification:
        return QStringLiteral("Notification");
    case Event::Stop:
        return QStringLiteral("Stop");
    case Event::SubagentStop:
        return QStringLiteral("SubagentStop");
    case Event::SessionStart:
        return QStringLiteral("SessionStart");
    case Event::SessionEnd:
        return QStringLiteral("SessionEnd");
    case Event::PreCompact:
        return QStringLiteral("PreCompact");
    case Event::Unknown:
    default:
        return QString();
    }
}

bool EventClassifier::isSuppressed(const QJsonObject &input)
{
    return parseEvent(input.value(QStringLiteral("hook_event_name")).toString()) == Event::Notification
        && input.value(QStringLiteral("notification_type")).toString() == QLatin1String("permission_prompt");
}

bool EventClassifier::classify(const QJsonObject &input, const AmbientContext &context, SessionStatusRecord *record)
{
    if (!record || isSuppressed(input)) {
        return false;
    }

    SessionStatusRecord result;
    result.sessionId = input.value(QStringLiteral("session_id")).toString(QStringLiteral("unknown"));
    result.cwd = input.value(QStringLiteral("cwd")).toString();
    result.event = input.value(QStringLiteral("hook_event_name")).toString();
    result.pid = context.pid;
    result.tty = context.tty;
    result.remoteHost = context.remoteHost;
    if (!context.remoteHost.isEmpty()) {
        result.tmuxTarget = context.tmuxTarget;
    }

    using Status = SessionStatusRecord::Status;

    switch (parseEvent(result.event)) {
    case Event::UserPromptSubmit:
        result.status = Status::Processing;
        break;
    case Event::PreToolUse:
        result.status = Status::RunningTool;
        copyToolFields(input, &result, true);
        break;
    case Event::PostToolUse:
        // tool_use_id lets the app cancel the matching pending permission
        result.status = Status::Processing;
        copyToolFields(input, &result, true);
        break;
    case Event::PermissionRequest:
        // The app matches tool_use_id from its PreToolUse cache
        result.status = Status::WaitingForApproval;
        copyToolFields(input, &result, false);
        break;
    case Event::Notification:
        if (input.value(QStringLiteral("notification_type")).toString() == QLatin1String("idle_prompt")) {
            result.status = Status::WaitingForInput;
        } else {
            result.status = Status::Notification;
        }
        copyNotificationFields(input, &result);
        break;
    case Event::Stop:
    case Event::SubagentStop:
    case Event::SessionStart:
        result.status = Status::WaitingForInput;
        break;
    case Event::SessionEnd:
        result.status = Status::Ended;
        break;
    case Event::PreCompact:
        result.status = Status::Compacting;
        break;
    case Event::Unknown:
        result.status = Status::Unknown;
        break;
    }

    *record = result;
    return true;
}

} // namespace ClaudeIsland
