/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    claude-island-hook - Claude hook handler binary

    This small binary is called by Claude hooks to report session state to
    ClaudeIsland. It reads event data from stdin (JSON) and sends it to the
    ClaudeIsland socket.

    For PermissionRequest events it waits for the user's decision in
    ClaudeIsland and prints the matching hook output.

    Usage:
        claude-island-hook [--socket <path>] [--tcp <host:port>] [--verbose]

    Environment:
        CLAUDE_ISLAND_TCP          TCP host:port (or port) instead of the Unix socket
        CLAUDE_ISLAND_REMOTE_HOST  SSH host of a remote session, enables tmux lookup
        CLAUDE_ISLAND_DEBUG        Enable debug logging
*/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QLoggingCategory>
#include <QTextStream>

#include <unistd.h>

#include "../HookBridge.h"
#include "../HookTransport.h"
#include "../TerminalResolver.h"
#include "../TmuxPaneResolver.h"

using namespace ClaudeIsland;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("claude-island-hook"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Claude hook handler for ClaudeIsland"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption socketOption(
        QStringList() << QStringLiteral("s") << QStringLiteral("socket"),
        QStringLiteral("Path to ClaudeIsland socket (default: %1)").arg(HookTransport::defaultSocketPath()),
        QStringLiteral("path"),
        HookTransport::defaultSocketPath()
    );
    parser.addOption(socketOption);

    QCommandLineOption tcpOption(
        QStringList() << QStringLiteral("t") << QStringLiteral("tcp"),
        QStringLiteral("TCP target host:port or port (overrides CLAUDE_ISLAND_TCP)"),
        QStringLiteral("target")
    );
    parser.addOption(tcpOption);

    QCommandLineOption verboseOption(
        QStringList() << QStringLiteral("v") << QStringLiteral("verbose"),
        QStringLiteral("Log progress to stderr")
    );
    parser.addOption(verboseOption);

    if (!parser.parse(app.arguments())) {
        QTextStream err(stderr);
        err << "Error: " << parser.errorText() << "\n";
        return 1;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        parser.showHelp(0);
    }
    if (parser.isSet(QStringLiteral("version"))) {
        parser.showVersion();
    }

    // stderr of a hook ends up in Claude's transcript, keep it quiet by default
    if (!parser.isSet(verboseOption) && qEnvironmentVariableIsEmpty("CLAUDE_ISLAND_DEBUG")) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    TransportConfig config = TransportConfig::fromEnvironment();
    config.socketPath = parser.value(socketOption);
    if (parser.isSet(tcpOption)) {
        config.tcpTarget = parser.value(tcpOption);
    }

    ProcessTerminalResolver terminals;
    TmuxPaneResolver panes;

    HookBridge bridge(&terminals, &panes);
    bridge.setTransportConfig(config);
    bridge.setRemoteHost(qEnvironmentVariable("CLAUDE_ISLAND_REMOTE_HOST"));
    bridge.setSupervisorPid(static_cast<qint64>(::getppid()));

    QFile stdinFile;
    if (!stdinFile.open(stdin, QIODevice::ReadOnly)) {
        QTextStream err(stderr);
        err << "Error: cannot read stdin\n";
        return 1;
    }

    QFile stdoutFile;
    if (!stdoutFile.open(stdout, QIODevice::WriteOnly)) {
        QTextStream err(stderr);
        err << "Error: cannot write stdout\n";
        return 1;
    }

    const int exitCode = bridge.run(&stdinFile, &stdoutFile);
    stdoutFile.flush();
    return exitCode;
}
