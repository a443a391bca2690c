/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "NotificationDispatcher.h"

#include "ClaudemuxDebug.h"
#include "ClaudemuxSettings.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>

namespace Claudemux
{

NotificationDispatcher::NotificationDispatcher(const Config &config)
    : m_config(config)
{
}

NotificationDispatcher::Config NotificationDispatcher::configFromSettings(const ClaudemuxSettings *settings)
{
    Config config;
    config.stateDirectory = ClaudemuxSettings::dataDirectory() + QStringLiteral("/notify-state");
    if (!settings) {
        return config;
    }
    config.enabled = settings->notificationsEnabled();
    config.command = settings->notificationCommand();
    config.cooldownSeconds = settings->notificationCooldownSeconds();
    config.transitions = settings->notificationTransitions();
    return config;
}

bool NotificationDispatcher::matchesTransition(SessionStatus from, SessionStatus to) const
{
    if (from == to) {
        return false;
    }
    return m_config.transitions.contains(statusToString(to));
}

bool NotificationDispatcher::isCoolingDown(const QString &sessionId) const
{
    if (m_config.cooldownSeconds <= 0) {
        return false;
    }
    const QFileInfo info(m_config.stateDirectory + QLatin1Char('/') + sessionId);
    if (!info.exists()) {
        return false;
    }
    return info.lastModified().secsTo(QDateTime::currentDateTime()) < m_config.cooldownSeconds;
}

void NotificationDispatcher::touchStateFile(const QString &sessionId) const
{
    if (!QDir().mkpath(m_config.stateDirectory)) {
        qCWarning(ClaudemuxHooks) << "NotificationDispatcher: Cannot create" << m_config.stateDirectory;
        return;
    }
    QFile file(m_config.stateDirectory + QLatin1Char('/') + sessionId);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate) || file.write(QDateTime::currentDateTimeUtc().toString(Qt::ISODate).toUtf8()) < 0) {
        qCWarning(ClaudemuxHooks) << "NotificationDispatcher: Cannot record cooldown for" << sessionId << ":" << file.errorString();
    }
}

QString NotificationDispatcher::summaryText(SessionStatus to)
{
    switch (to) {
    case SessionStatus::Idle:
        return QStringLiteral("Claude: Idle");
    case SessionStatus::AwaitingPermission:
        return QStringLiteral("Claude: Needs permission");
    case SessionStatus::AwaitingInput:
        return QStringLiteral("Claude: Needs input");
    default:
        return QStringLiteral("Claude: %1").arg(statusDisplayName(to));
    }
}

QString NotificationDispatcher::bodyText(const QString &sessionId, const QString &workingDirectory, const QString &conversationTitle)
{
    QString projectName = QFileInfo(workingDirectory).fileName();
    if (projectName.isEmpty()) {
        projectName = QStringLiteral("unknown");
    }

    if (conversationTitle.isEmpty()) {
        return QStringLiteral("%1 | %2").arg(sessionId, projectName);
    }
    return QStringLiteral("%1 | %2 - %3").arg(sessionId, projectName, conversationTitle);
}

bool NotificationDispatcher::onStateTransition(const QString &sessionId,
                                               SessionStatus from,
                                               SessionStatus to,
                                               const QString &workingDirectory,
                                               const QString &conversationTitle)
{
    if (!m_config.enabled || !matchesTransition(from, to)) {
        return false;
    }

    if (isCoolingDown(sessionId)) {
        qCDebug(ClaudemuxHooks) << "NotificationDispatcher: Cooldown active for" << sessionId;
        return false;
    }

    QStringList args = QProcess::splitCommand(m_config.command);
    if (args.isEmpty()) {
        return false;
    }
    const QString program = args.takeFirst();
    args << summaryText(to) << bodyText(sessionId, workingDirectory, conversationTitle);

    // Detached so a slow notification daemon never delays the hook
    if (!QProcess::startDetached(program, args)) {
        qCWarning(ClaudemuxHooks) << "NotificationDispatcher: Failed to start" << program;
        return false;
    }

    touchStateFile(sessionId);
    qCInfo(ClaudemuxHooks) << "NotificationDispatcher: Notified" << sessionId << statusToString(from) << "->" << statusToString(to);
    return true;
}

} // namespace Claudemux
