/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "StatusEngine.h"

#include "ClaudemuxDebug.h"
#include "ConversationIndex.h"
#include "NotificationDispatcher.h"

#include <QDir>
#include <QFile>
#include <QProcess>

namespace Claudemux
{

StatusEngine::StatusEngine(const SessionStore &store, QObject *parent)
    : QObject(parent)
    , m_store(store)
{
}

StatusEngine::~StatusEngine() = default;

void StatusEngine::setConversationIndex(const ConversationIndex *index)
{
    m_conversationIndex = index;
}

void StatusEngine::setNotificationDispatcher(NotificationDispatcher *dispatcher)
{
    m_notificationDispatcher = dispatcher;
}

void StatusEngine::setUsageRefreshCommand(const QString &command)
{
    m_usageRefreshCommand = command;
}

StatusEngine::Transition StatusEngine::transitionFor(const HookEvent &event)
{
    Transition t;

    switch (event.kind()) {
    case HookEvent::Kind::UserPromptSubmit:
        t.applies = true;
        t.status = SessionStatus::Working;
        break;

    case HookEvent::Kind::PreToolUse:
    case HookEvent::Kind::PostToolUse:
    case HookEvent::Kind::PostToolUseFailure:
        t.applies = true;
        t.status = SessionStatus::Working;
        t.detail = event.toolName;
        break;

    case HookEvent::Kind::SubagentStart:
    case HookEvent::Kind::SubagentStop:
        // Can fire after Stop and would overwrite Idle
        break;

    case HookEvent::Kind::Stop:
    case HookEvent::Kind::SessionStart:
        t.applies = true;
        t.status = SessionStatus::Idle;
        break;

    case HookEvent::Kind::PermissionRequest:
        t.applies = true;
        t.status = SessionStatus::AwaitingPermission;
        t.detail = event.toolName.isEmpty() ? QStringLiteral("permission") : event.toolName;
        break;

    case HookEvent::Kind::Notification:
        if (event.notificationType == QLatin1String("permission_prompt")) {
            t.applies = true;
            t.status = SessionStatus::AwaitingPermission;
            t.detail = event.message;
        } else if (event.notificationType == QLatin1String("elicitation_dialog")) {
            t.applies = true;
            t.status = SessionStatus::AwaitingInput;
            t.detail = event.message;
        }
        break;

    case HookEvent::Kind::Unknown:
        break;
    }

    return t;
}

std::optional<SessionRecord> StatusEngine::findByConversation(const QString &conversationId) const
{
    if (conversationId.isEmpty()) {
        return std::nullopt;
    }
    const SessionRecordList records = m_store.list();
    for (const SessionRecord &record : records) {
        if (record.conversationId == conversationId) {
            return record;
        }
    }
    return std::nullopt;
}

std::optional<SessionRecord> StatusEngine::autoRegister(const HookEvent &event, const IngestContext &context)
{
    const qint64 assistantPid = context.findAssistantPid ? context.findAssistantPid() : 0;
    if (assistantPid <= 0) {
        qCDebug(ClaudemuxHooks) << "StatusEngine: No assistant process found, not registering conversation" << event.conversationId;
        return std::nullopt;
    }

    QString baseId = event.conversationId.left(8);
    if (!SessionStore::isValidId(baseId)) {
        return std::nullopt;
    }

    SessionRecord record;
    record.id = baseId;
    record.tmuxSession = context.currentTmuxSession ? context.currentTmuxSession() : QString();
    record.pid = assistantPid;
    record.workingDirectory = event.workingDirectory.isEmpty() ? QDir::currentPath() : event.workingDirectory;
    record.conversationId = event.conversationId;
    record.status = SessionStatus::Working;
    record.autoRegistered = true;

    if (auto existing = m_store.load(baseId)) {
        if (existing->conversationId == event.conversationId) {
            return existing;
        }
        record.id.clear();
        for (int i = 1; i < 100; ++i) {
            const QString candidate = QStringLiteral("%1-%2").arg(baseId).arg(i);
            if (!QFile::exists(m_store.recordPath(candidate))) {
                record.id = candidate;
                break;
            }
        }
        if (record.id.isEmpty()) {
            qCWarning(ClaudemuxHooks) << "StatusEngine: No free session id for conversation" << event.conversationId;
            return std::nullopt;
        }
    }

    QString error;
    if (!m_store.save(record, &error)) {
        qCWarning(ClaudemuxHooks) << "StatusEngine: Failed to register session" << record.id << ":" << error;
        return std::nullopt;
    }

    qCInfo(ClaudemuxHooks) << "StatusEngine: Auto-registered session" << record.id << "for conversation" << event.conversationId << "pid" << assistantPid
                           << "tmux" << record.tmuxSession;
    return record;
}

std::optional<SessionRecord> StatusEngine::resolveSession(const HookEvent &event, const IngestContext &context)
{
    if (!context.sessionId.isEmpty()) {
        if (auto record = m_store.load(context.sessionId)) {
            return record;
        }
        qCDebug(ClaudemuxHooks) << "StatusEngine: Session" << context.sessionId << "from environment not found";
    }

    if (event.conversationId.isEmpty()) {
        return std::nullopt;
    }

    if (auto record = findByConversation(event.conversationId)) {
        return record;
    }

    return autoRegister(event, context);
}

void StatusEngine::refreshUsageCache() const
{
    QStringList args = QProcess::splitCommand(m_usageRefreshCommand);
    if (args.isEmpty()) {
        return;
    }
    const QString program = args.takeFirst();

    // Runs synchronously: hooks are separate processes, so this only keeps
    // the hook alive a little longer
    QProcess process;
    process.start(program, args);
    if (!process.waitForFinished(10000)) {
        qCWarning(ClaudemuxHooks) << "StatusEngine: Usage refresh did not finish:" << program;
        process.kill();
        process.waitForFinished(1000);
    }
}

StatusEngine::Outcome StatusEngine::ingest(const HookEvent &event, const IngestContext &context, QString *errorString)
{
    qCInfo(ClaudemuxHooks) << "hook received event:" << event.eventName << "conv_id:" << event.conversationId << "notification_type:" << event.notificationType
                           << "tool_name:" << event.toolName << "cwd:" << event.workingDirectory;

    if (event.isEmpty()) {
        return Outcome::Ignored;
    }

    const Transition transition = transitionFor(event);
    if (!transition.applies) {
        return Outcome::Ignored;
    }

    auto resolved = resolveSession(event, context);
    if (!resolved) {
        return Outcome::Unresolved;
    }
    SessionRecord record = *resolved;
    qCInfo(ClaudemuxHooks) << "session found:" << record.id << "status:" << statusToString(record.status);

    const SessionStatus previous = record.status;
    record.status = transition.status;
    record.statusDetail = transition.detail;

    // Conversation changes on resume
    if (!event.conversationId.isEmpty() && record.conversationId != event.conversationId) {
        qCInfo(ClaudemuxHooks) << "updating conversation id of" << record.id << "from" << record.conversationId << "to" << event.conversationId;
        record.conversationId = event.conversationId;
    }

    const bool pidStale = record.pid <= 0 || (context.processAlive && !context.processAlive(record.pid));
    if (pidStale && context.findAssistantPid) {
        const qint64 pid = context.findAssistantPid();
        if (pid > 0) {
            record.pid = pid;
        }
    }

    QString error;
    if (!m_store.save(record, &error)) {
        if (errorString) {
            *errorString = error;
        }
        return Outcome::StoreError;
    }

    if (transition.status == SessionStatus::Idle || statusNeedsAttention(transition.status)) {
        refreshUsageCache();
    }

    if (m_notificationDispatcher) {
        const QString title = m_conversationIndex ? m_conversationIndex->titleAndPrompt(record.conversationId, record.workingDirectory) : QString();
        m_notificationDispatcher->onStateTransition(record.id, previous, record.status, record.workingDirectory, title);
    }

    Q_EMIT transitioned(record.id, previous, record.status);
    return Outcome::Updated;
}

} // namespace Claudemux

#include "moc_StatusEngine.cpp"
