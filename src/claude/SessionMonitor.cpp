/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionMonitor.h"

#include "ClaudemuxDebug.h"
#include "LifecycleController.h"
#include "LivenessReconciler.h"
#include "SignalForwarder.h"
#include "TerminalScreen.h"

#include <KLocalizedString>

#include <QDir>
#include <QEventLoop>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QSocketNotifier>

#include <csignal>
#include <unistd.h>

namespace Claudemux
{

SessionMonitor::SessionMonitor(LifecycleController *lifecycle, TmuxManager *tmux, int refreshIntervalSeconds, QObject *parent)
    : QObject(parent)
    , m_lifecycle(lifecycle)
    , m_tmux(tmux)
    , m_refreshIntervalSeconds(qMax(refreshIntervalSeconds, 1))
{
    m_refreshTimer.setInterval(m_refreshIntervalSeconds * 1000);
    connect(&m_refreshTimer, &QTimer::timeout, this, [this]() {
        dispatch(MonitorEvent::of(MonitorEvent::Kind::Tick));
    });
}

SessionMonitor::~SessionMonitor() = default;

void SessionMonitor::begin(const WatchState &state)
{
    m_model = std::make_unique<MonitorModel>(state);
    m_finished = false;
    m_result = MonitorModel::Action();
    m_fileTimes.clear();

    const QString storeDirectory = m_lifecycle->store().directory();
    if (!QDir().mkpath(storeDirectory)) {
        qCWarning(ClaudemuxMonitor) << "SessionMonitor: Cannot create store directory" << storeDirectory;
    }

    // First paint comes from the store alone; tmux state follows asynchronously
    m_model->setRecords(m_lifecycle->reconcileRecords(m_tmuxSnapshot, false));
    for (const SessionRecord &record : m_model->records()) {
        m_fileTimes.insert(record.id, QFileInfo(m_lifecycle->store().recordPath(record.id)).lastModified());
    }
}

SessionMonitor::Result SessionMonitor::run(const WatchState &state)
{
    begin(state);
    const QString storeDirectory = m_lifecycle->store().directory();

    // Anything logged to stderr would land on the curses screen
    std::unique_ptr<LogFileRedirect> logRedirect = std::make_unique<LogFileRedirect>(m_logFile);

    m_screen = std::make_unique<TerminalScreen>();
    if (!m_screen->isActive()) {
        m_screen.reset();
        logRedirect.reset();
        Result result;
        result.action.kind = MonitorModel::Action::Quit;
        result.state = m_model->state();
        result.state.message = i18n("claudemux watch needs an interactive terminal");
        return result;
    }

    m_watcher = new QFileSystemWatcher(this);
    m_watcher->addPath(storeDirectory);
    connect(m_watcher, &QFileSystemWatcher::directoryChanged, this, [this]() {
        scanStore();
    });

    m_stdinNotifier = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(m_stdinNotifier, &QSocketNotifier::activated, this, [this]() {
        if (!m_screen) {
            return;
        }
        const QList<MonitorModel::Key> keys = m_screen->readKeys();
        for (const MonitorModel::Key &key : keys) {
            if (m_finished) {
                break;
            }
            MonitorEvent event = MonitorEvent::of(MonitorEvent::Kind::Key);
            event.key = key;
            dispatch(event);
        }
    });

    m_signals = new SignalForwarder({SIGWINCH, SIGINT, SIGTERM, SIGHUP}, this);
    connect(m_signals, &SignalForwarder::signalReceived, this, [this](int signalNumber) {
        dispatch(MonitorEvent::of(signalNumber == SIGWINCH ? MonitorEvent::Kind::Resize : MonitorEvent::Kind::Terminate));
    });

    m_model->setViewportHeight(MonitorModel::viewportHeightFor(m_screen->height()));
    render();

    m_refreshTimer.start();
    requestRefresh();

    if (!m_finished) {
        QEventLoop loop;
        m_loop = &loop;
        loop.exec();
        m_loop = nullptr;
    }

    m_refreshTimer.stop();
    delete m_signals;
    m_signals = nullptr;
    delete m_stdinNotifier;
    m_stdinNotifier = nullptr;
    delete m_watcher;
    m_watcher = nullptr;
    m_screen.reset();
    logRedirect.reset();

    Result result;
    result.action = m_result;
    result.state = m_model->state();
    return result;
}

void SessionMonitor::dispatch(const MonitorEvent &event)
{
    if (m_finished || !m_model) {
        return;
    }

    switch (event.kind) {
    case MonitorEvent::Kind::Tick:
        requestRefresh();
        return;
    case MonitorEvent::Kind::RefreshFinished:
        applyRefresh(event.tmuxSessions);
        break;
    case MonitorEvent::Kind::RecordChanged:
        reloadRecord(event.sessionId);
        break;
    case MonitorEvent::Kind::RecordRemoved:
        m_model->removeRecord(event.sessionId);
        break;
    case MonitorEvent::Kind::Resize:
        if (m_screen) {
            m_screen->handleResize();
            m_model->setViewportHeight(MonitorModel::viewportHeightFor(m_screen->height()));
        }
        break;
    case MonitorEvent::Kind::Terminate: {
        MonitorModel::Action quit;
        quit.kind = MonitorModel::Action::Quit;
        finish(quit);
        return;
    }
    case MonitorEvent::Kind::Key: {
        const MonitorModel::Action action = m_model->handleKey(event.key);
        if (action.endsMonitor()) {
            finish(action);
            return;
        }
        perform(action);
        break;
    }
    }

    render();
}

void SessionMonitor::requestRefresh()
{
    if (!m_tmux) {
        applyRefresh({});
        render();
        return;
    }

    if (m_refreshInFlight) {
        m_refreshQueued = true;
        return;
    }

    m_refreshInFlight = true;
    QPointer<SessionMonitor> guard(this);
    m_tmux->listSessionsAsync([guard](bool ok, const QList<TmuxManager::SessionInfo> &sessions) {
        if (!guard) {
            return;
        }
        guard->m_refreshInFlight = false;
        if (!ok) {
            // No server running is the common case here
            qCDebug(ClaudemuxMonitor) << "SessionMonitor: tmux list-sessions failed, treating as no sessions";
        }

        MonitorEvent event = MonitorEvent::of(MonitorEvent::Kind::RefreshFinished);
        event.tmuxSessions = sessions;
        guard->dispatch(event);

        if (guard && guard->m_refreshQueued && !guard->m_finished) {
            guard->m_refreshQueued = false;
            guard->requestRefresh();
        }
    });
}

void SessionMonitor::applyRefresh(const QList<TmuxManager::SessionInfo> &sessions)
{
    m_tmuxSnapshot = sessions;
    m_model->setRecords(m_lifecycle->reconcileRecords(m_tmuxSnapshot, true));

    m_fileTimes.clear();
    for (const SessionRecord &record : m_model->records()) {
        m_fileTimes.insert(record.id, QFileInfo(m_lifecycle->store().recordPath(record.id)).lastModified());
    }
}

void SessionMonitor::scanStore()
{
    const QDir directory(m_lifecycle->store().directory());
    const QFileInfoList entries = directory.entryInfoList({QStringLiteral("*.json")}, QDir::Files, QDir::Name);

    QHash<QString, QDateTime> current;
    for (const QFileInfo &info : entries) {
        current.insert(info.completeBaseName(), info.lastModified());
    }

    for (auto it = current.constBegin(); it != current.constEnd(); ++it) {
        const auto known = m_fileTimes.constFind(it.key());
        if (known == m_fileTimes.constEnd() || known.value() != it.value()) {
            MonitorEvent event = MonitorEvent::of(MonitorEvent::Kind::RecordChanged);
            event.sessionId = it.key();
            dispatch(event);
        }
    }

    const QStringList knownIds = m_fileTimes.keys();
    for (const QString &id : knownIds) {
        if (!current.contains(id)) {
            MonitorEvent event = MonitorEvent::of(MonitorEvent::Kind::RecordRemoved);
            event.sessionId = id;
            dispatch(event);
        }
    }

    m_fileTimes = current;

    // QFileSystemWatcher drops a directory that was removed and recreated
    if (m_watcher && !m_watcher->directories().contains(directory.absolutePath()) && directory.exists()) {
        m_watcher->addPath(directory.absolutePath());
    }
}

void SessionMonitor::reloadRecord(const QString &sessionId)
{
    SessionStore::LoadError error = SessionStore::LoadError::None;
    std::optional<SessionRecord> record = m_lifecycle->store().load(sessionId, &error);
    if (!record) {
        if (error == SessionStore::LoadError::NotFound) {
            m_model->removeRecord(sessionId);
        }
        return;
    }

    const LivenessReconciler reconciler = LivenessReconciler::fromSnapshot(m_tmuxSnapshot);
    reconciler.reconcile(*record);
    m_model->updateRecord(*record);

    // A session created after the last snapshot is not known to it yet
    if (!record->tmuxSession.isEmpty() && !record->tmuxAlive && record->status != SessionStatus::Exited) {
        requestRefresh();
    }
}

void SessionMonitor::perform(const MonitorModel::Action &action)
{
    switch (action.kind) {
    case MonitorModel::Action::Refresh:
        requestRefresh();
        break;
    case MonitorModel::Action::Kill: {
        const OperationResult result = m_lifecycle->kill(action.sessionId);
        if (result.ok) {
            m_model->removeRecord(action.sessionId);
            m_fileTimes.remove(action.sessionId);
        } else {
            m_model->setMessage(result.message);
        }
        requestRefresh();
        break;
    }
    case MonitorModel::Action::Detach: {
        const OperationResult result = m_lifecycle->detachClients(action.sessionId);
        m_model->setMessage(result.message);
        requestRefresh();
        break;
    }
    default:
        break;
    }
}

void SessionMonitor::finish(const MonitorModel::Action &action)
{
    m_finished = true;
    m_result = action;
    if (m_loop) {
        m_loop->quit();
    }
}

void SessionMonitor::render()
{
    if (m_screen && !m_finished) {
        m_screen->render(*m_model);
    }
}

} // namespace Claudemux

#include "moc_SessionMonitor.cpp"
