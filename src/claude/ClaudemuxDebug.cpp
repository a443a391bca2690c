/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ClaudemuxDebug.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <cstdio>

Q_LOGGING_CATEGORY(ClaudemuxStore, "claudemux.store", QtInfoMsg)
Q_LOGGING_CATEGORY(ClaudemuxHooks, "claudemux.hooks", QtDebugMsg)
Q_LOGGING_CATEGORY(ClaudemuxTmux, "claudemux.tmux", QtInfoMsg)
Q_LOGGING_CATEGORY(ClaudemuxInbox, "claudemux.inbox", QtInfoMsg)
Q_LOGGING_CATEGORY(ClaudemuxMonitor, "claudemux.monitor", QtWarningMsg)
Q_LOGGING_CATEGORY(ClaudemuxLifecycle, "claudemux.lifecycle", QtInfoMsg)

namespace Claudemux
{

namespace
{
QString s_logPath;
bool s_echoToStderr = false;

void fileMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    const QString line = QStringLiteral("%1 [%2] %3\n")
                             .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs))
                             .arg(QCoreApplication::applicationPid())
                             .arg(qFormatLogMessage(type, context, message));

    // A log that cannot be opened has nowhere left to report to
    if (!s_logPath.isEmpty()) {
        QFile log(s_logPath);
        if (log.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            log.write(line.toUtf8());
        }
    }

    if (s_echoToStderr) {
        std::fputs(line.toLocal8Bit().constData(), stderr);
    }
}
}

LogFileRedirect::LogFileRedirect(const QString &path, bool echoToStderr)
{
    s_logPath = path;
    if (!s_logPath.isEmpty() && !QDir().mkpath(QFileInfo(s_logPath).absolutePath())) {
        s_logPath.clear();
    }
    s_echoToStderr = echoToStderr;
    m_previous = qInstallMessageHandler(fileMessageHandler);
}

LogFileRedirect::~LogFileRedirect()
{
    qInstallMessageHandler(m_previous);
    s_logPath.clear();
    s_echoToStderr = false;
}

QString LogFileRedirect::path() const
{
    return s_logPath;
}

} // namespace Claudemux
