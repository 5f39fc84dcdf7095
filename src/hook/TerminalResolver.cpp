/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalResolver.h"

#include <QDebug>
#include <QProcess>

#include <unistd.h>

namespace ClaudeIsland
{

namespace
{
QString ttyPathOf(int fd)
{
    const char *name = ::ttyname(fd);
    if (!name) {
        return QString();
    }
    return QString::fromLocal8Bit(name);
}
}

QString TerminalResolver::resolveTty(const TerminalResolver &resolver, qint64 pid)
{
    QString tty = normalizeTtyName(resolver.controllingTerminal(pid));
    if (!tty.isEmpty()) {
        return tty;
    }

    tty = resolver.stdinTerminal();
    if (!tty.isEmpty()) {
        return tty;
    }

    return resolver.stdoutTerminal();
}

QString TerminalResolver::normalizeTtyName(const QString &psOutput)
{
    QString tty = psOutput.trimmed();
    if (tty.isEmpty() || tty == QLatin1String("??") || tty == QLatin1String("-")) {
        return QString();
    }

    // ps prints "ttys001" / "pts/3", the app wants the device path
    if (!tty.startsWith(QLatin1String("/dev/"))) {
        tty.prepend(QStringLiteral("/dev/"));
    }
    return tty;
}

ProcessTerminalResolver::ProcessTerminalResolver(int timeoutMs)
    : m_timeoutMs(timeoutMs)
{
}

QString ProcessTerminalResolver::controllingTerminal(qint64 pid) const
{
    QProcess process;
    process.start(QStringLiteral("ps"), {QStringLiteral("-p"), QString::number(pid), QStringLiteral("-o"), QStringLiteral("tty=")});

    if (!process.waitForFinished(m_timeoutMs)) {
        qDebug() << "ProcessTerminalResolver: ps did not finish:" << process.errorString();
        process.kill();
        process.waitForFinished(100);
        return QString();
    }

    return QString::fromUtf8(process.readAllStandardOutput()).trimmed();
}

QString ProcessTerminalResolver::stdinTerminal() const
{
    return ttyPathOf(STDIN_FILENO);
}

QString ProcessTerminalResolver::stdoutTerminal() const
{
    return ttyPathOf(STDOUT_FILENO);
}

} // namespace ClaudeIsland
