/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    Based on Bobcat's SessionManager by İsmail Yılmaz
*/

#ifndef TMUXPANERESOLVER_H
#define TMUXPANERESOLVER_H

#include <QObject>
#include <QString>
#include <QStringList>

namespace ClaudeIsland
{

/**
 * PaneResolver finds the tmux pane a remote Claude session runs in, so the
 * app can send keys back to it over SSH.
 */
class PaneResolver
{
public:
    virtual ~PaneResolver() = default;

    /**
     * Raw pane id of the current pane (e.g. "%42"), empty outside tmux
     */
    virtual QString paneId() const = 0;

    /**
     * Full "session:window.pane" descriptor for @p paneId, empty on failure
     */
    virtual QString paneDescriptor(const QString &paneId) const = 0;

    /**
     * Descriptor if tmux can resolve it, otherwise the raw pane id,
     * otherwise empty.
     */
    static QString resolveTarget(const PaneResolver &resolver);
};

/**
 * PaneResolver that reads TMUX_PANE and asks tmux for the descriptor.
 */
class TmuxPaneResolver : public QObject, public PaneResolver
{
    Q_OBJECT

public:
    explicit TmuxPaneResolver(QObject *parent = nullptr);
    ~TmuxPaneResolver() override;

    /**
     * Format passed to `tmux display-message -p`
     */
    static QString descriptorFormat();

    /**
     * Arguments for resolving @p paneId
     */
    static QStringList buildDescriptorArgs(const QString &paneId);

    /**
     * Timeout for each tmux invocation in milliseconds (default: 2000)
     */
    void setTimeout(int timeoutMs)
    {
        m_timeoutMs = timeoutMs;
    }

    int timeout() const
    {
        return m_timeoutMs;
    }

    QString paneId() const override;
    QString paneDescriptor(const QString &paneId) const override;

Q_SIGNALS:
    /**
     * Emitted when a tmux invocation fails
     */
    void errorOccurred(const QString &message);

private:
    /**
     * Execute a tmux command and return the output
     */
    QString executeCommand(const QStringList &args, bool *ok = nullptr) const;

    int m_timeoutMs = 2000;
};

} // namespace ClaudeIsland

#endif // TMUXPANERESOLVER_H
