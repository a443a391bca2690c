/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef NOTIFICATIONDISPATCHER_H
#define NOTIFICATIONDISPATCHER_H

#include "SessionRecord.h"

#include <QString>
#include <QStringList>

namespace Claudemux
{

class ClaudemuxSettings;

/**
 * NotificationDispatcher raises desktop notifications for status
 * transitions.
 *
 * Notifications are rate limited per session: the modification time of
 * <stateDirectory>/<id> records when the last one was sent, which works
 * across the many short-lived hook processes.
 */
class NotificationDispatcher
{
public:
    struct Config {
        bool enabled = false;
        QString command = QStringLiteral("notify-send");
        int cooldownSeconds = 30;
        QStringList transitions; // Target status strings that notify
        QString stateDirectory;
    };

    explicit NotificationDispatcher(const Config &config);

    static Config configFromSettings(const ClaudemuxSettings *settings);

    const Config &config() const
    {
        return m_config;
    }

    /**
     * True if a change from @p from to @p to should notify
     */
    bool matchesTransition(SessionStatus from, SessionStatus to) const;

    /**
     * True if a notification for @p sessionId was sent within the cooldown
     */
    bool isCoolingDown(const QString &sessionId) const;

    /**
     * Notify about a transition if enabled, matching and not cooling down.
     * Returns true if a notification was dispatched.
     */
    bool onStateTransition(const QString &sessionId,
                           SessionStatus from,
                           SessionStatus to,
                           const QString &workingDirectory,
                           const QString &conversationTitle);

    /**
     * Notification summary and body for a transition
     */
    static QString summaryText(SessionStatus to);
    static QString bodyText(const QString &sessionId, const QString &workingDirectory, const QString &conversationTitle);

private:
    void touchStateFile(const QString &sessionId) const;

    Config m_config;
};

} // namespace Claudemux

#endif // NOTIFICATIONDISPATCHER_H
