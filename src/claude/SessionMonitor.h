/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONMONITOR_H
#define SESSIONMONITOR_H

#include "MonitorModel.h"
#include "TmuxManager.h"

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QTimer>

#include <memory>

class QEventLoop;
class QFileSystemWatcher;
class QSocketNotifier;

namespace Claudemux
{

class LifecycleController;
class SignalForwarder;
class TerminalScreen;

/**
 * One input to the monitor loop.
 *
 * The refresh timer, the store directory watcher, the keyboard and the
 * asynchronous tmux query each produce events; SessionMonitor::dispatch()
 * is the only place that consumes them.
 */
struct MonitorEvent {
    enum class Kind {
        Tick,            // Periodic or requested full refresh
        RecordChanged,   // <id>.json was written
        RecordRemoved,   // <id>.json disappeared
        Key,
        RefreshFinished, // tmux list-sessions answered
        Resize,
        Terminate,       // SIGINT/SIGTERM while the monitor is shown
    };

    Kind kind = Kind::Tick;
    QString sessionId;
    MonitorModel::Key key;
    QList<TmuxManager::SessionInfo> tmuxSessions;

    static MonitorEvent of(Kind kind)
    {
        MonitorEvent event;
        event.kind = kind;
        return event;
    }
};

/**
 * SessionMonitor runs one cycle of the interactive session list.
 *
 * run() shows the list until the user picks something that requires
 * leaving the terminal (attach, focus, new session) or quits. The caller
 * carries the returned state into the next cycle.
 */
class SessionMonitor : public QObject
{
    Q_OBJECT

public:
    struct Result {
        MonitorModel::Action action;
        WatchState state;
    };

    SessionMonitor(LifecycleController *lifecycle, TmuxManager *tmux, int refreshIntervalSeconds, QObject *parent = nullptr);
    ~SessionMonitor() override;

    /**
     * Log output goes to this file while the terminal screen is up.
     * Without one it is dropped for that time.
     */
    void setLogFile(const QString &path)
    {
        m_logFile = path;
    }

    /**
     * Load the first view from the store. run() calls this; it needs no terminal.
     */
    void begin(const WatchState &state);

    /**
     * Block in a local event loop until the user leaves the monitor
     */
    Result run(const WatchState &state);

    void dispatch(const MonitorEvent &event);

    const MonitorModel *model() const
    {
        return m_model.get();
    }

private:
    void requestRefresh();
    void scanStore();
    void reloadRecord(const QString &sessionId);
    void applyRefresh(const QList<TmuxManager::SessionInfo> &sessions);
    void perform(const MonitorModel::Action &action);
    void finish(const MonitorModel::Action &action);
    void render();

    LifecycleController *m_lifecycle;
    TmuxManager *m_tmux;
    int m_refreshIntervalSeconds;
    QString m_logFile;

    std::unique_ptr<MonitorModel> m_model;
    std::unique_ptr<TerminalScreen> m_screen;
    QTimer m_refreshTimer;
    QFileSystemWatcher *m_watcher = nullptr;
    QSocketNotifier *m_stdinNotifier = nullptr;
    SignalForwarder *m_signals = nullptr;
    QPointer<QEventLoop> m_loop;

    QHash<QString, QDateTime> m_fileTimes;
    QList<TmuxManager::SessionInfo> m_tmuxSnapshot;
    bool m_refreshInFlight = false;
    bool m_refreshQueued = false;
    bool m_finished = false;
    MonitorModel::Action m_result;
};

} // namespace Claudemux

#endif // SESSIONMONITOR_H
