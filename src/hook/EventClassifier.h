/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef EVENTCLASSIFIER_H
#define EVENTCLASSIFIER_H

#include "SessionStatusRecord.h"

#include <QJsonObject>
#include <QString>

namespace ClaudeIsland
{

class PaneResolver;
class TerminalResolver;

/**
 * Process context that is not part of the hook payload
 */
struct AmbientContext {
    qint64 pid = 0;         // Claude process (parent of the hook)
    QString tty;            // Empty when undiscoverable
    QString remoteHost;     // CLAUDE_ISLAND_REMOTE_HOST
    QString tmuxTarget;     // Only looked up when remoteHost is set

    /**
     * Gather the context through the given resolvers.
     *
     * Pane discovery only runs when @p remoteHost is non-empty.
     * Never fails; missing pieces are left empty.
     */
    static AmbientContext discover(const TerminalResolver &terminals,
                                   const PaneResolver &panes,
                                   qint64 pid,
                                   const QString &remoteHost);
};

/**
 * EventClassifier maps a Claude hook event onto a SessionStatusRecord.
 *
 * Hook events:
 * - UserPromptSubmit: user sent a message, Claude is processing
 * - PreToolUse / PostToolUse: tool started / finished
 * - PermissionRequest: Claude needs an approval decision
 * - Notification: idle prompts and other notices (permission prompts are
 *   skipped, PermissionRequest carries better information)
 * - Stop / SubagentStop / SessionStart: back to waiting for input
 * - SessionEnd: session is gone
 * - PreCompact: context is being compacted
 */
class EventClassifier
{
public:
    enum class Event {
        UserPromptSubmit,
        PreToolUse,
        PostToolUse,
        PermissionRequest,
        Notification,
        Stop,
        SubagentStop,
        SessionStart,
        SessionEnd,
        PreCompact,
        Unknown
    };

    /**
     * Parse a hook_event_name. Unrecognized names map to Event::Unknown.
     */
    static Event parseEvent(const QString &name);

    /**
     * Hook name of an event (empty for Event::Unknown)
     */
    static QString eventName(Event event);

    /**
     * Whether the event is dropped without being sent.
     */
    static bool isSuppressed(const QJsonObject &input);

    /**
     * Build the status record for a hook payload.
     *
     * @param input Hook JSON read from stdin
     * @param context Ambient process context
     * @param record Receives the record
     * @return false if the event is suppressed and nothing should be sent
     */
    static bool classify(const QJsonObject &input, const AmbientContext &context, SessionStatusRecord *record);
};

} // namespace ClaudeIsland

#endif // EVENTCLASSIFIER_H
