/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LifecycleController.h"

#include "ClaudemuxDebug.h"
#include "ClaudemuxSettings.h"
#include "LivenessReconciler.h"
#include "SignalForwarder.h"
#include "TmuxManager.h"

#include <KLocalizedString>

#include <QDateTime>
#include <QDir>
#include <QEventLoop>
#include <QFileInfo>
#include <QProcess>
#include <QProcessEnvironment>
#include <QRegularExpression>

#include <chrono>
#include <csignal>
#include <cstdio>

namespace Claudemux
{

LifecycleController::LifecycleController(const SessionStore &store, TmuxManager *tmux, const Config &config, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_inbox(store.directory())
    , m_tmux(tmux)
    , m_config(config)
{
}

LifecycleController::~LifecycleController() = default;

LifecycleController::Config LifecycleController::configFromSettings(const ClaudemuxSettings *settings)
{
    Config config;
    if (!settings) {
        return config;
    }
    config.assistantCommand = settings->assistantCommand();
    config.tmuxSessionPrefix = settings->tmuxSessionPrefix();
    config.focusCommand = settings->focusCommand();
    return config;
}

QString LifecycleController::generateSessionId()
{
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    return QStringLiteral("%1").arg(static_cast<quint64>(nanos) & 0xffffffffULL, 8, 16, QLatin1Char('0'));
}

QString LifecycleController::deriveSessionId(const QString &label, const QString &resumeConversationId)
{
    if (!label.isEmpty()) {
        return label;
    }
    if (!resumeConversationId.isEmpty()) {
        return resumeConversationId.left(8);
    }
    return generateSessionId();
}

bool LifecycleController::parseDuration(const QString &text, qint64 *seconds)
{
    static const QRegularExpression pattern(QStringLiteral("^\\s*(\\d+)\\s*([smhdwSMHDW]?)\\s*$"));
    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return false;
    }

    bool ok = false;
    const qint64 value = match.captured(1).toLongLong(&ok);
    if (!ok) {
        return false;
    }

    const QString suffix = match.captured(2).toLower();
    qint64 unit = 1;
    switch (suffix.isEmpty() ? 's' : suffix.at(0).toLatin1()) {
    case 'm':
        unit = 60;
        break;
    case 'h':
        unit = 3600;
        break;
    case 'd':
        unit = 86400;
        break;
    case 'w':
        unit = 7 * 86400;
        break;
    default:
        break;
    }

    if (seconds) {
        *seconds = value * unit;
    }
    return true;
}

QString LifecycleController::formatAge(qint64 seconds)
{
    if (seconds < 60) {
        return QStringLiteral("%1s").arg(qMax<qint64>(seconds, 0));
    }
    if (seconds < 3600) {
        return QStringLiteral("%1m").arg(seconds / 60);
    }
    if (seconds < 86400) {
        return QStringLiteral("%1h").arg(seconds / 3600);
    }
    return QStringLiteral("%1d").arg(seconds / 86400);
}

OperationResult LifecycleController::resolve(const QString &idOrPrefix, SessionRecord *record) const
{
    if (idOrPrefix.isEmpty()) {
        return OperationResult::failure(i18n("Session ID required"));
    }

    const SessionStore::Resolution resolution = m_store.resolve(idOrPrefix);
    switch (resolution.kind) {
    case SessionStore::Resolution::Found:
        if (record) {
            *record = resolution.record;
        }
        return OperationResult::success();
    case SessionStore::Resolution::Ambiguous:
        return OperationResult::failure(i18n("Ambiguous session ID %1, matches: %2", idOrPrefix, resolution.candidates.join(QStringLiteral(", "))),
                                        resolution.candidates);
    case SessionStore::Resolution::NotFound:
        break;
    }
    return OperationResult::failure(i18n("No session found with ID %1", idOrPrefix));
}

SessionRecordList LifecycleController::reconciledRecords(bool persistExited) const
{
    return reconcileRecords(m_tmux ? m_tmux->listSessions() : QList<TmuxManager::SessionInfo>(), persistExited);
}

SessionRecordList LifecycleController::reconcileRecords(const QList<TmuxManager::SessionInfo> &tmuxSessions, bool persistExited) const
{
    SessionRecordList records = m_store.list();
    const LivenessReconciler reconciler = LivenessReconciler::fromSnapshot(tmuxSessions);

    for (SessionRecord &record : records) {
        if (reconciler.reconcile(record) && persistExited) {
            SessionRecord persisted = record;
            QString error;
            if (m_store.save(persisted, &error)) {
                record.updated = persisted.updated;
            } else {
                qCWarning(ClaudemuxLifecycle) << "LifecycleController: Failed to persist exit of" << record.id << ":" << error;
            }
        }
    }
    return records;
}

bool LifecycleController::markExited(SessionRecord &record)
{
    record.status = SessionStatus::Exited;
    record.statusDetail.clear();
    record.attachedClients = 0;
    return m_store.save(record);
}

OperationResult LifecycleController::create(const CreateOptions &options, SessionRecord *created)
{
    if (!TmuxManager::isAvailable()) {
        return OperationResult::failure(i18n("tmux is not installed or not in PATH"));
    }

    QString workingDir = options.workingDirectory.isEmpty() ? QDir::currentPath() : options.workingDirectory;
    workingDir = QDir::cleanPath(QDir(workingDir).absolutePath());
    if (!QFileInfo(workingDir).isDir()) {
        return OperationResult::failure(i18n("Directory %1 does not exist", workingDir));
    }

    const QString sessionId = deriveSessionId(options.label, options.resumeConversationId);
    if (!SessionStore::isValidId(sessionId)) {
        return OperationResult::failure(i18n("Invalid session ID %1: use letters, digits, '-', '_' and '.'", sessionId));
    }

    if (auto existing = m_store.load(sessionId)) {
        LivenessReconciler reconciler(m_tmux);
        reconciler.reconcile(*existing);
        if (existing->status != SessionStatus::Exited) {
            return OperationResult::failure(i18n("Session %1 already exists", sessionId));
        }
    }

    const QString tmuxSession = TmuxManager::buildSessionName(m_config.tmuxSessionPrefix, sessionId);
    if (m_tmux->sessionExists(tmuxSession)) {
        return OperationResult::failure(i18n("tmux session %1 already exists", tmuxSession));
    }

    QStringList command = QProcess::splitCommand(m_config.assistantCommand);
    if (command.isEmpty()) {
        return OperationResult::failure(i18n("No assistant command configured"));
    }
    if (!options.resumeConversationId.isEmpty()) {
        command << QStringLiteral("--resume") << options.resumeConversationId;
    }

    QString error;
    if (!m_tmux->newSession(tmuxSession, workingDir, command, {{sessionIdVariable(), sessionId}}, &error)) {
        return OperationResult::failure(i18n("Failed to create tmux session: %1", error));
    }

    SessionRecord record;
    record.id = sessionId;
    record.tmuxSession = tmuxSession;
    record.pid = m_tmux->panePid(tmuxSession);
    record.workingDirectory = workingDir;
    record.conversationId = options.resumeConversationId;
    record.status = SessionStatus::Running;

    if (!m_store.save(record, &error)) {
        // Without a record nobody could find the session again
        if (!m_tmux->killSession(tmuxSession)) {
            qCWarning(ClaudemuxLifecycle) << "LifecycleController: Could not clean up tmux session" << tmuxSession;
        }
        return OperationResult::failure(i18n("Failed to save session state: %1", error));
    }

    qCInfo(ClaudemuxLifecycle) << "LifecycleController: Created session" << sessionId << "tmux" << tmuxSession << "pid" << record.pid;
    if (created) {
        *created = record;
    }
    Q_EMIT sessionCreated(sessionId);
    return OperationResult::success(i18n("Created session %1", sessionId));
}

bool LifecycleController::removeSession(const SessionRecord &record, QString *errorString)
{
    if (m_tmux->sessionExists(record.tmuxSession) && !m_tmux->killSession(record.tmuxSession)) {
        if (errorString) {
            *errorString = i18n("Failed to kill tmux session %1", record.tmuxSession);
        }
        return false;
    }

    QString error;
    if (!m_store.remove(record.id, &error)) {
        if (errorString) {
            *errorString = i18n("Failed to delete session state: %1", error);
        }
        return false;
    }

    if (!m_inbox.removeSession(record.id)) {
        qCWarning(ClaudemuxLifecycle) << "LifecycleController: Could not remove inbox of" << record.id;
    }

    qCInfo(ClaudemuxLifecycle) << "LifecycleController: Removed session" << record.id;
    Q_EMIT sessionRemoved(record.id);
    return true;
}

OperationResult LifecycleController::kill(const QString &idOrPrefix)
{
    SessionRecord record;
    OperationResult result = resolve(idOrPrefix, &record);
    if (!result.ok) {
        return result;
    }

    QString error;
    if (!removeSession(record, &error)) {
        return OperationResult::failure(error);
    }
    return OperationResult::success(i18n("Killed session %1", record.id));
}

OperationResult LifecycleController::killMany(KillScope scope, const ConfirmFunction &confirm, QStringList *killed)
{
    SessionRecordList targets;
    const SessionRecordList records = reconciledRecords(false);
    for (const SessionRecord &record : records) {
        if (scope == KillScope::All || record.status == SessionStatus::Idle) {
            targets.append(record);
        }
    }

    if (targets.isEmpty()) {
        return OperationResult::success(scope == KillScope::All ? i18n("No sessions to kill") : i18n("No idle sessions to kill"));
    }

    if (confirm && !confirm(targets)) {
        return OperationResult::failure(i18n("Aborted"));
    }

    QStringList failures;
    int count = 0;
    for (const SessionRecord &record : std::as_const(targets)) {
        QString error;
        if (removeSession(record, &error)) {
            ++count;
            if (killed) {
                killed->append(record.id);
            }
        } else {
            failures.append(QStringLiteral("%1: %2").arg(record.id, error));
        }
    }

    if (!failures.isEmpty()) {
        return OperationResult::failure(i18np("Killed 1 session, failed: %2", "Killed %1 sessions, failed: %2", count, failures.join(QStringLiteral("; "))));
    }
    return OperationResult::success(i18np("Killed 1 session", "Killed %1 sessions", count));
}

SessionRecordList LifecycleController::pruneCandidates(qint64 maxAgeSeconds) const
{
    SessionRecordList candidates;
    const QDateTime cutoff = QDateTime::currentDateTimeUtc().addSecs(-maxAgeSeconds);

    const SessionRecordList records = reconciledRecords(false);
    for (const SessionRecord &record : records) {
        if (record.status != SessionStatus::Exited) {
            continue;
        }
        if (maxAgeSeconds <= 0 || record.updated < cutoff) {
            candidates.append(record);
        }
    }
    return candidates;
}

OperationResult LifecycleController::prune(qint64 maxAgeSeconds, bool dryRun, SessionRecordList *affected)
{
    const SessionRecordList candidates = pruneCandidates(maxAgeSeconds);
    if (affected) {
        *affected = candidates;
    }

    if (candidates.isEmpty()) {
        return OperationResult::success(i18n("No exited sessions to prune"));
    }
    if (dryRun) {
        return OperationResult::success(i18np("Would delete 1 exited session", "Would delete %1 exited sessions", candidates.size()));
    }

    int deleted = 0;
    QStringList failures;
    for (const SessionRecord &record : candidates) {
        QString error;
        if (m_store.remove(record.id, &error)) {
            if (!m_inbox.removeSession(record.id)) {
                qCWarning(ClaudemuxLifecycle) << "LifecycleController: Failed to remove inbox of" << record.id;
            }
            Q_EMIT sessionRemoved(record.id);
            ++deleted;
        } else {
            failures.append(QStringLiteral("%1: %2").arg(record.id, error));
        }
    }

    qCInfo(ClaudemuxLifecycle) << "LifecycleController: Pruned" << deleted << "exited sessions";
    if (!failures.isEmpty()) {
        return OperationResult::failure(i18np("Pruned 1 exited session, failed: %2", "Pruned %1 exited sessions, failed: %2", deleted, failures.join(QStringLiteral("; "))));
    }
    return OperationResult::success(i18np("Pruned 1 exited session", "Pruned %1 exited sessions", deleted));
}

OperationResult LifecycleController::attach(const QString &idOrPrefix, bool force, AttachOutcome *outcome)
{
    if (outcome) {
        *outcome = AttachOutcome::Failed;
    }

    SessionRecord record;
    OperationResult result = resolve(idOrPrefix, &record);
    if (!result.ok) {
        return result;
    }

    if (record.tmuxSession.isEmpty()) {
        return OperationResult::failure(i18n("Session %1 is not running inside tmux and cannot be attached", record.id));
    }

    if (!m_tmux->sessionExists(record.tmuxSession)) {
        if (!markExited(record)) {
            qCWarning(ClaudemuxLifecycle) << "LifecycleController: Failed to persist exit of" << record.id;
        }
        return OperationResult::failure(i18n("Session %1 has exited", record.id));
    }

    if (!force && m_tmux->attachedCount(record.tmuxSession) > 0) {
        QString error;
        if (!m_inbox.post(record.id, Inbox::focusType(), QJsonValue(), &error)) {
            return OperationResult::failure(i18n("Session %1 is attached elsewhere and the focus request failed: %2", record.id, error));
        }
        if (outcome) {
            *outcome = AttachOutcome::AlreadyAttached;
        }
        return OperationResult::success(i18n("Session %1 is already attached in another terminal", record.id));
    }

    // OSC 0: lets the focus utility find this terminal window by title
    std::fprintf(stdout, "\033]0;claudemux:%s\007", qPrintable(record.id));
    std::fflush(stdout);

    InboxWatcher watcher(m_inbox, record.id, [this](const InboxMessage &message) {
        handleInboxMessage(message);
    });
    QString watcherError;
    if (!watcher.start(&watcherError)) {
        qCWarning(ClaudemuxLifecycle) << "LifecycleController: Inbox watcher not started:" << watcherError;
    }

    QProcess process;
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(sessionIdVariable(), record.id);
    process.setProcessEnvironment(env);
    process.setProcessChannelMode(QProcess::ForwardedChannels);
    process.setInputChannelMode(QProcess::ForwardedInputChannel);

    SignalForwarder forwarder(SignalForwarder::attachSignals());
    connect(&forwarder, &SignalForwarder::signalReceived, &process, [&process](int signalNumber) {
        const qint64 pid = process.processId();
        if (pid > 0) {
            ::kill(static_cast<pid_t>(pid), signalNumber);
        }
    });

    QEventLoop loop;
    connect(&process, &QProcess::finished, &loop, &QEventLoop::quit);
    connect(&process, &QProcess::errorOccurred, &loop, [&loop](QProcess::ProcessError error) {
        if (error == QProcess::FailedToStart) {
            loop.quit();
        }
    });

    qCInfo(ClaudemuxLifecycle) << "LifecycleController: Attaching to" << record.id << (force ? "(force)" : "");
    process.start(QStringLiteral("tmux"), TmuxManager::attachArguments(record.tmuxSession, force));
    if (!process.waitForStarted(5000)) {
        return OperationResult::failure(i18n("Failed to start tmux: %1", process.errorString()));
    }
    if (process.state() != QProcess::NotRunning) {
        loop.exec();
    }

    watcher.stop();

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        return OperationResult::failure(i18n("tmux attach exited with code %1", process.exitCode()));
    }

    if (outcome) {
        *outcome = AttachOutcome::Attached;
    }
    return OperationResult::success();
}

OperationResult LifecycleController::detachClients(const QString &idOrPrefix)
{
    SessionRecord record;
    OperationResult result = resolve(idOrPrefix, &record);
    if (!result.ok) {
        return result;
    }

    if (!m_tmux->sessionExists(record.tmuxSession)) {
        return OperationResult::failure(i18n("Session %1 has no live tmux session", record.id));
    }

    const int detached = m_tmux->detachClients(record.tmuxSession);
    if (detached < 0) {
        return OperationResult::failure(i18n("Failed to list clients of %1", record.tmuxSession));
    }
    return OperationResult::success(i18np("Detached 1 client from %2", "Detached %1 clients from %2", detached, record.id));
}

OperationResult LifecycleController::focus(const QString &idOrPrefix)
{
    SessionRecord record;
    OperationResult result = resolve(idOrPrefix, &record);
    if (!result.ok) {
        return result;
    }

    if (!m_tmux->sessionExists(record.tmuxSession)) {
        if (!markExited(record)) {
            qCWarning(ClaudemuxLifecycle) << "LifecycleController: Failed to persist exit of" << record.id;
        }
        return OperationResult::failure(i18n("Session %1 has exited", record.id));
    }

    if (m_tmux->attachedCount(record.tmuxSession) <= 0) {
        return OperationResult::failure(i18n("Session %1 is not attached in any terminal", record.id));
    }

    QString error;
    if (!m_inbox.post(record.id, Inbox::focusType(), QJsonValue(), &error)) {
        return OperationResult::failure(i18n("Failed to send focus request: %1", error));
    }
    return OperationResult::success(i18n("Focusing session %1", record.id));
}

OperationResult LifecycleController::postMessage(const QString &idOrPrefix, const QString &type)
{
    SessionRecord record;
    OperationResult result = resolve(idOrPrefix, &record);
    if (!result.ok) {
        return result;
    }

    QString error;
    if (!m_inbox.post(record.id, type, QJsonValue(), &error)) {
        return OperationResult::failure(i18n("Failed to post message: %1", error));
    }
    return OperationResult::success(i18n("Posted %1 message to session %2", type, record.id));
}

void LifecycleController::handleInboxMessage(const InboxMessage &message)
{
    if (message.type != Inbox::focusType()) {
        qCDebug(ClaudemuxLifecycle) << "LifecycleController: Unknown inbox message type:" << message.type;
        return;
    }

    if (m_config.focusCommand.isEmpty()) {
        qCDebug(ClaudemuxLifecycle) << "LifecycleController: No focus command configured";
        return;
    }

    const QString title = QStringLiteral("claudemux:%1").arg(message.sessionId);
    QStringList args = QProcess::splitCommand(m_config.focusCommand);
    for (QString &arg : args) {
        arg.replace(QStringLiteral("%1"), title);
    }
    if (args.isEmpty()) {
        return;
    }
    const QString program = args.takeFirst();
    if (!QProcess::startDetached(program, args)) {
        qCWarning(ClaudemuxLifecycle) << "LifecycleController: Failed to start focus command" << program;
    }
}

} // namespace Claudemux

#include "moc_LifecycleController.cpp"
