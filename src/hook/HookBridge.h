/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOOKBRIDGE_H
#define HOOKBRIDGE_H

#include "HookTransport.h"

#include <QObject>
#include <QString>

class QIODevice;

namespace ClaudeIsland
{

class PaneResolver;
class TerminalResolver;

/**
 * HookBridge handles one Claude hook invocation end to end:
 *
 *   stdin JSON -> EventClassifier -> RendezvousClient
 *              -> DecisionTranslator (PermissionRequest only) -> stdout
 *
 * Only unparseable input is fatal. Everything after that degrades to
 * "nothing happened": fire-and-forget events are dropped and permission
 * requests fall back to Claude Code's own prompt.
 */
class HookBridge : public QObject
{
    Q_OBJECT

public:
    enum Error {
        NoError,
        InputParseError, ///< stdin is not a JSON object
        ConfigurationError, ///< Malformed tcp target
        TransportError, ///< Connect, write or read failed
        ReplyParseError ///< Decision reply could not be parsed
    };

    /**
     * @param terminals Tty discovery, not owned
     * @param panes tmux pane discovery, not owned
     */
    HookBridge(const TerminalResolver *terminals, const PaneResolver *panes, QObject *parent = nullptr);
    ~HookBridge() override;

    void setTransportConfig(const TransportConfig &config)
    {
        m_config = config;
    }

    TransportConfig transportConfig() const
    {
        return m_config;
    }

    /**
     * SSH host of a remote session; enables tmux pane discovery
     */
    void setRemoteHost(const QString &host)
    {
        m_remoteHost = host;
    }

    /**
     * Pid of the Claude process (the hook's parent)
     */
    void setSupervisorPid(qint64 pid)
    {
        m_supervisorPid = pid;
    }

    /**
     * Process one event.
     *
     * @param input Hook JSON
     * @param output Receives the permission directive, if any
     * @return process exit code
     */
    int run(QIODevice *input, QIODevice *output);

    /**
     * Error of the last run(), NoError if it went through
     */
    Error lastError() const
    {
        return m_lastError;
    }

private:
    const TerminalResolver *m_terminals;
    const PaneResolver *m_panes;
    TransportConfig m_config;
    QString m_remoteHost;
    qint64 m_supervisorPid = 0;
    Error m_lastError = NoError;
};

} // namespace ClaudeIsland

#endif // HOOKBRIDGE_H
