/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    Based on Bobcat's SessionManager by İsmail Yılmaz
*/

#include "TmuxPaneResolver.h"

#include <QDebug>
#include <QProcess>

namespace ClaudeIsland
{

QString PaneResolver::resolveTarget(const PaneResolver &resolver)
{
    const QString pane = resolver.paneId();
    if (pane.isEmpty()) {
        return QString();
    }

    const QString descriptor = resolver.paneDescriptor(pane);
    if (!descriptor.isEmpty()) {
        return descriptor;
    }

    return pane;
}

TmuxPaneResolver::TmuxPaneResolver(QObject *parent)
    : QObject(parent)
{
}

TmuxPaneResolver::~TmuxPaneResolver() = default;

QString TmuxPaneResolver::descriptorFormat()
{
    return QStringLiteral("#{session_name}:#{window_index}.#{pane_index}");
}

QStringList TmuxPaneResolver::buildDescriptorArgs(const QString &paneId)
{
    // tmux display-message -p -t <pane> <format>
    QStringList args;
    args << QStringLiteral("display-message") << QStringLiteral("-p");
    if (!paneId.isEmpty()) {
        args << QStringLiteral("-t") << paneId;
    }
    args << descriptorFormat();
    return args;
}

QString TmuxPaneResolver::paneId() const
{
    // Set by tmux for every process in a pane (e.g. "%42")
    return qEnvironmentVariable("TMUX_PANE");
}

QString TmuxPaneResolver::paneDescriptor(const QString &paneId) const
{
    bool ok = false;
    const QString output = executeCommand(buildDescriptorArgs(paneId), &ok).trimmed();
    if (!ok) {
        return QString();
    }
    return output;
}

QString TmuxPaneResolver::executeCommand(const QStringList &args, bool *ok) const
{
    QProcess process;
    process.start(QStringLiteral("tmux"), args);

    if (!process.waitForFinished(m_timeoutMs)) {
        if (ok) *ok = false;
        if (process.state() != QProcess::NotRunning) {
            process.kill();
            process.waitForFinished(100);
        }
        qDebug() << "TmuxPaneResolver: tmux did not finish:" << process.errorString();
        return QString();
    }

    if (ok) {
        *ok = (process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0);
    }

    if (process.exitCode() != 0) {
        QString errorOutput = QString::fromUtf8(process.readAllStandardError());
        if (!errorOutput.isEmpty()) {
            Q_EMIT const_cast<TmuxPaneResolver *>(this)->errorOccurred(errorOutput);
        }
    }

    return QString::fromUtf8(process.readAllStandardOutput());
}

} // namespace ClaudeIsland

#include "moc_TmuxPaneResolver.cpp"
