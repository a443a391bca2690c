/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ProcessTable.h"

#include <QFile>
#include <QFileInfo>
#include <QProcess>

#include <cerrno>
#include <csignal>
#include <sys/types.h>

namespace Claudemux
{

bool ProcessTable::isAlive(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    // EPERM means the process exists but belongs to someone else
    return errno == EPERM;
}

QString ProcessTable::runPs(const QString &field, qint64 pid)
{
    QProcess process;
    process.start(QStringLiteral("ps"), {QStringLiteral("-o"), field + QLatin1Char('='), QStringLiteral("-p"), QString::number(pid)});
    if (!process.waitForFinished(2000) || process.exitCode() != 0) {
        return QString();
    }
    return QString::fromUtf8(process.readAllStandardOutput()).trimmed();
}

qint64 ProcessTable::parentPid(qint64 pid)
{
    if (pid <= 0) {
        return 0;
    }

#ifdef Q_OS_LINUX
    QFile statFile(QStringLiteral("/proc/%1/stat").arg(pid));
    if (statFile.open(QIODevice::ReadOnly | QIODevice::Text)) {
        const QString statLine = QString::fromUtf8(statFile.readAll()).trimmed();
        statFile.close();

        // Skip past the comm field "(name)" which may contain spaces
        const int closeParenIdx = statLine.lastIndexOf(QLatin1Char(')'));
        if (closeParenIdx > 0) {
            const QStringList fields = statLine.mid(closeParenIdx + 2).split(QLatin1Char(' '), Qt::SkipEmptyParts);
            // fields[0]=state, fields[1]=ppid
            if (fields.size() > 1) {
                bool ok = false;
                const qint64 ppid = fields[1].toLongLong(&ok);
                if (ok) {
                    return ppid;
                }
            }
        }
    }
#endif

    bool ok = false;
    const qint64 ppid = runPs(QStringLiteral("ppid"), pid).toLongLong(&ok);
    return ok ? ppid : 0;
}

QString ProcessTable::processName(qint64 pid)
{
    if (pid <= 0) {
        return QString();
    }

#ifdef Q_OS_LINUX
    QFile commFile(QStringLiteral("/proc/%1/comm").arg(pid));
    if (commFile.open(QIODevice::ReadOnly | QIODevice::Text)) {
        const QString name = QString::fromUtf8(commFile.readAll()).trimmed();
        if (!name.isEmpty()) {
            return name;
        }
    }
#endif

    // ps may report a full path for comm
    return QFileInfo(runPs(QStringLiteral("comm"), pid)).fileName();
}

qint64 ProcessTable::findAncestor(qint64 startPid, const QStringList &names)
{
    qint64 pid = startPid;
    // Depth limit guards against cycles from pid reuse during the walk
    for (int depth = 0; pid > 1 && depth < 64; ++depth) {
        const QString name = processName(pid);
        if (!name.isEmpty() && names.contains(name)) {
            return pid;
        }
        pid = parentPid(pid);
    }
    return 0;
}

} // namespace Claudemux
