/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CLAUDEMUXDEBUG_H
#define CLAUDEMUXDEBUG_H

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(ClaudemuxStore)
Q_DECLARE_LOGGING_CATEGORY(ClaudemuxHooks)
Q_DECLARE_LOGGING_CATEGORY(ClaudemuxTmux)
Q_DECLARE_LOGGING_CATEGORY(ClaudemuxInbox)
Q_DECLARE_LOGGING_CATEGORY(ClaudemuxMonitor)
Q_DECLARE_LOGGING_CATEGORY(ClaudemuxLifecycle)

namespace Claudemux
{

/**
 * Sends all Qt log output to a file while it is alive.
 *
 * Used where stderr is not a place to write: inside hook callbacks, whose
 * output nobody sees, and while the monitor owns the terminal. The previous
 * message handler is restored on destruction. Instances do not nest.
 */
class LogFileRedirect
{
public:
    explicit LogFileRedirect(const QString &path, bool echoToStderr = false);
    ~LogFileRedirect();

    QString path() const;

private:
    Q_DISABLE_COPY(LogFileRedirect)

    QtMessageHandler m_previous = nullptr;
};

} // namespace Claudemux

#endif // CLAUDEMUXDEBUG_H
