/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONCOMMANDS_H
#define SESSIONCOMMANDS_H

#include "LifecycleController.h"
#include "MonitorModel.h"
#include "SessionView.h"

#include <QStringList>
#include <QTextStream>

namespace Claudemux
{

class ClaudemuxSettings;
class TmuxManager;

/**
 * SessionCommands implements the `claudemux` subcommands.
 *
 * Every run*() method takes the subcommand's own argument list (program
 * name first) and returns the process exit code.
 */
class SessionCommands
{
public:
    SessionCommands(ClaudemuxSettings *settings, LifecycleController *lifecycle, TmuxManager *tmux);

    /**
     * Dispatch on the first argument; no subcommand runs `watch`
     */
    int execute(const QStringList &arguments);

    int runNew(const QStringList &arguments);
    int runList(const QStringList &arguments);
    int runAttach(const QStringList &arguments);
    int runFocus(const QStringList &arguments);
    int runKill(const QStringList &arguments);
    int runPrune(const QStringList &arguments);
    int runMessage(const QStringList &arguments);
    int runWatch(const QStringList &arguments);

    /**
     * Watch loop: show the monitor, act on the result, show it again
     */
    int watch(const WatchState &initialState);

    /**
     * Remove exited sessions older than PruneMaxAgeDays; run when watch quits
     */
    OperationResult pruneOnQuit(SessionRecordList *pruned = nullptr);

    /**
     * Plain-text session table as printed by `ls`
     */
    static QString formatTable(const SessionRecordList &records, const QDateTime &now = QDateTime::currentDateTimeUtc());

private:
    int reportFailure(const OperationResult &result);
    int report(const OperationResult &result);
    void printUsage();
    bool confirmKill(const SessionRecordList &targets);

    ClaudemuxSettings *m_settings;
    LifecycleController *m_lifecycle;
    TmuxManager *m_tmux;
    QTextStream m_out;
    QTextStream m_err;
};

} // namespace Claudemux

#endif // SESSIONCOMMANDS_H
