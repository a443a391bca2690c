/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ClaudemuxSettings.h"

#include <KConfigGroup>
#include <QStandardPaths>

namespace Claudemux
{

ClaudemuxSettings *ClaudemuxSettings::s_instance = nullptr;

ClaudemuxSettings *ClaudemuxSettings::instance()
{
    return s_instance;
}

ClaudemuxSettings::ClaudemuxSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    if (!s_instance) {
        s_instance = this;
    }

    m_config = KSharedConfig::openConfig(configName, KConfig::SimpleConfig);
}

ClaudemuxSettings::~ClaudemuxSettings()
{
    save();
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

QString ClaudemuxSettings::dataDirectory()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation) + QStringLiteral("/claudemux");
}

QString ClaudemuxSettings::storeDirectory() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return group.readEntry("StoreDirectory", dataDirectory() + QStringLiteral("/sessions"));
}

void ClaudemuxSettings::setStoreDirectory(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("StoreDirectory", path);
    Q_EMIT settingsChanged();
}

QString ClaudemuxSettings::assistantCommand() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return group.readEntry("AssistantCommand", QStringLiteral("claude"));
}

void ClaudemuxSettings::setAssistantCommand(const QString &command)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("AssistantCommand", command);
    Q_EMIT settingsChanged();
}

QStringList ClaudemuxSettings::assistantProcessNames() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    // Claude Code runs as a node process, but the binary may also be named claude
    return group.readEntry("AssistantProcessNames", QStringList{QStringLiteral("claude"), QStringLiteral("node")});
}

void ClaudemuxSettings::setAssistantProcessNames(const QStringList &names)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("AssistantProcessNames", names);
    Q_EMIT settingsChanged();
}

QString ClaudemuxSettings::tmuxSessionPrefix() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return group.readEntry("TmuxSessionPrefix", QStringLiteral("claudemux-"));
}

void ClaudemuxSettings::setTmuxSessionPrefix(const QString &prefix)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("TmuxSessionPrefix", prefix);
    Q_EMIT settingsChanged();
}

int ClaudemuxSettings::pruneMaxAgeDays() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return group.readEntry("PruneMaxAgeDays", 7);
}

void ClaudemuxSettings::setPruneMaxAgeDays(int days)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("PruneMaxAgeDays", days);
    Q_EMIT settingsChanged();
}

int ClaudemuxSettings::refreshIntervalSeconds() const
{
    KConfigGroup group(m_config, QStringLiteral("Monitor"));
    return group.readEntry("RefreshIntervalSeconds", 5);
}

void ClaudemuxSettings::setRefreshIntervalSeconds(int seconds)
{
    KConfigGroup group(m_config, QStringLiteral("Monitor"));
    group.writeEntry("RefreshIntervalSeconds", seconds);
    Q_EMIT settingsChanged();
}

QString ClaudemuxSettings::monitorLogFile() const
{
    KConfigGroup group(m_config, QStringLiteral("Monitor"));
    return group.readEntry("LogFile", dataDirectory() + QStringLiteral("/monitor.log"));
}

void ClaudemuxSettings::setMonitorLogFile(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Monitor"));
    group.writeEntry("LogFile", path);
    Q_EMIT settingsChanged();
}

bool ClaudemuxSettings::notificationsEnabled() const
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    return group.readEntry("Enabled", false);
}

void ClaudemuxSettings::setNotificationsEnabled(bool enabled)
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    group.writeEntry("Enabled", enabled);
    Q_EMIT settingsChanged();
}

QString ClaudemuxSettings::notificationCommand() const
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    return group.readEntry("Command", QStringLiteral("notify-send"));
}

void ClaudemuxSettings::setNotificationCommand(const QString &command)
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    group.writeEntry("Command", command);
    Q_EMIT settingsChanged();
}

int ClaudemuxSettings::notificationCooldownSeconds() const
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    return group.readEntry("CooldownSeconds", 30);
}

void ClaudemuxSettings::setNotificationCooldownSeconds(int seconds)
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    group.writeEntry("CooldownSeconds", seconds);
    Q_EMIT settingsChanged();
}

QStringList ClaudemuxSettings::notificationTransitions() const
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    return group.readEntry("Transitions",
                           QStringList{QStringLiteral("idle"), QStringLiteral("awaiting_permission"), QStringLiteral("awaiting_input")});
}

void ClaudemuxSettings::setNotificationTransitions(const QStringList &statuses)
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    group.writeEntry("Transitions", statuses);
    Q_EMIT settingsChanged();
}

QString ClaudemuxSettings::focusCommand() const
{
    KConfigGroup group(m_config, QStringLiteral("Focus"));
    return group.readEntry("Command", QString());
}

void ClaudemuxSettings::setFocusCommand(const QString &command)
{
    KConfigGroup group(m_config, QStringLiteral("Focus"));
    group.writeEntry("Command", command);
    Q_EMIT settingsChanged();
}

QString ClaudemuxSettings::usageRefreshCommand() const
{
    KConfigGroup group(m_config, QStringLiteral("Usage"));
    return group.readEntry("RefreshCommand", QString());
}

void ClaudemuxSettings::setUsageRefreshCommand(const QString &command)
{
    KConfigGroup group(m_config, QStringLiteral("Usage"));
    group.writeEntry("RefreshCommand", command);
    Q_EMIT settingsChanged();
}

QString ClaudemuxSettings::hookLogFile() const
{
    KConfigGroup group(m_config, QStringLiteral("Hooks"));
    return group.readEntry("LogFile", dataDirectory() + QStringLiteral("/hooks.log"));
}

void ClaudemuxSettings::setHookLogFile(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Hooks"));
    group.writeEntry("LogFile", path);
    Q_EMIT settingsChanged();
}

void ClaudemuxSettings::save()
{
    m_config->sync();
}

} // namespace Claudemux

#include "moc_ClaudemuxSettings.cpp"
