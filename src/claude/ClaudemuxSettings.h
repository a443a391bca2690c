/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CLAUDEMUX_SETTINGS_H
#define CLAUDEMUX_SETTINGS_H

#include <QObject>
#include <QString>
#include <QStringList>

#include <KSharedConfig>

namespace Claudemux
{

/**
 * ClaudemuxSettings manages application-wide settings.
 *
 * Settings are read from ~/.config/claudemuxrc and include:
 * - Session store location
 * - Assistant command and the process names used to recognize it
 * - tmux session naming
 * - Monitor refresh interval
 * - Notification, focus and usage-refresh collaborators
 */
class ClaudemuxSettings : public QObject
{
    Q_OBJECT

public:
    static ClaudemuxSettings *instance();

    explicit ClaudemuxSettings(const QString &configName = QStringLiteral("claudemuxrc"), QObject *parent = nullptr);
    ~ClaudemuxSettings() override;

    /**
     * Directory holding one <id>.json file per session
     */
    QString storeDirectory() const;
    void setStoreDirectory(const QString &path);

    /**
     * Command started inside new tmux sessions (e.g., "claude")
     */
    QString assistantCommand() const;
    void setAssistantCommand(const QString &command);

    /**
     * Process names that identify the assistant when walking the process tree
     */
    QStringList assistantProcessNames() const;
    void setAssistantProcessNames(const QStringList &names);

    /**
     * Prefix for tmux session names (default "claudemux-")
     */
    QString tmuxSessionPrefix() const;
    void setTmuxSessionPrefix(const QString &prefix);

    /**
     * Age in days after which exited sessions are pruned on monitor exit.
     * 0 prunes every exited session.
     */
    int pruneMaxAgeDays() const;
    void setPruneMaxAgeDays(int days);

    /**
     * Fallback refresh interval of the interactive monitor
     */
    int refreshIntervalSeconds() const;
    void setRefreshIntervalSeconds(int seconds);

    /**
     * Where log output goes while the monitor owns the terminal
     */
    QString monitorLogFile() const;
    void setMonitorLogFile(const QString &path);

    // ========== Notifications ==========

    bool notificationsEnabled() const;
    void setNotificationsEnabled(bool enabled);

    QString notificationCommand() const;
    void setNotificationCommand(const QString &command);

    int notificationCooldownSeconds() const;
    void setNotificationCooldownSeconds(int seconds);

    /**
     * Target statuses that trigger a notification (status strings)
     */
    QStringList notificationTransitions() const;
    void setNotificationTransitions(const QStringList &statuses);

    // ========== External collaborators ==========

    /**
     * Command used to raise a terminal window, %1 is the window title
     */
    QString focusCommand() const;
    void setFocusCommand(const QString &command);

    /**
     * Command that refreshes the usage-accounting cache
     */
    QString usageRefreshCommand() const;
    void setUsageRefreshCommand(const QString &command);

    /**
     * Log file for hook invocations
     */
    QString hookLogFile() const;
    void setHookLogFile(const QString &path);

    /**
     * Base data directory (~/.local/share/claudemux)
     */
    static QString dataDirectory();

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    static ClaudemuxSettings *s_instance;
    KSharedConfig::Ptr m_config;
};

} // namespace Claudemux

#endif // CLAUDEMUX_SETTINGS_H
