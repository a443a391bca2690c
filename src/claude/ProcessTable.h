/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROCESSTABLE_H
#define PROCESSTABLE_H

#include <QString>
#include <QStringList>

namespace Claudemux
{

/**
 * ProcessTable queries the OS process table.
 *
 * On Linux everything is read from /proc. Elsewhere ps(1) is used.
 */
class ProcessTable
{
public:
    /**
     * True if a process with @p pid exists (signal 0 probe)
     */
    static bool isAlive(qint64 pid);

    /**
     * Parent PID of @p pid, or 0 if it cannot be determined
     */
    static qint64 parentPid(qint64 pid);

    /**
     * Short process name (comm) of @p pid, or an empty string
     */
    static QString processName(qint64 pid);

    /**
     * Walk the ancestor chain starting at @p startPid (inclusive) and
     * return the first process whose name matches one of @p names.
     * Returns 0 if none is found before reaching init.
     */
    static qint64 findAncestor(qint64 startPid, const QStringList &names);

private:
    static QString runPs(const QString &field, qint64 pid);
};

} // namespace Claudemux

#endif // PROCESSTABLE_H
