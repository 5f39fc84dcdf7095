/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALRESOLVER_H
#define TERMINALRESOLVER_H

#include <QString>

namespace ClaudeIsland
{

/**
 * TerminalResolver answers "which tty is this Claude session on?".
 *
 * Each probe returns an empty string when it has no usable answer.
 * resolveTty() chains the probes in order:
 *   1. controlling terminal of the supervising process
 *   2. the hook's own stdin
 *   3. the hook's own stdout
 */
class TerminalResolver
{
public:
    virtual ~TerminalResolver() = default;

    /**
     * Controlling terminal of @p pid as reported by the process table
     * (e.g. "pts/3", "ttys001", "??")
     */
    virtual QString controllingTerminal(qint64 pid) const = 0;

    /**
     * Device path of standard input if it is a terminal
     */
    virtual QString stdinTerminal() const = 0;

    /**
     * Device path of standard output if it is a terminal
     */
    virtual QString stdoutTerminal() const = 0;

    /**
     * Walk the fallback chain. Returns an empty string if nothing matched.
     */
    static QString resolveTty(const TerminalResolver &resolver, qint64 pid);

    /**
     * Turn ps output into a device path ("pts/3" -> "/dev/pts/3").
     * Returns an empty string for "", "??" and "-".
     */
    static QString normalizeTtyName(const QString &psOutput);
};

/**
 * TerminalResolver backed by `ps` and ttyname(3)
 */
class ProcessTerminalResolver : public TerminalResolver
{
public:
    explicit ProcessTerminalResolver(int timeoutMs = 2000);

    QString controllingTerminal(qint64 pid) const override;
    QString stdinTerminal() const override;
    QString stdoutTerminal() const override;

private:
    int m_timeoutMs;
};

} // namespace ClaudeIsland

#endif // TERMINALRESOLVER_H
