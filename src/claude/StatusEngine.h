/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STATUSENGINE_H
#define STATUSENGINE_H

#include "HookEvent.h"
#include "SessionRecord.h"
#include "SessionStore.h"

#include <QObject>
#include <QString>

#include <functional>
#include <optional>

namespace Claudemux
{

class ConversationIndex;
class NotificationDispatcher;

/**
 * Everything the engine needs to know about the process that delivered
 * an event. The hook executable fills this from its environment; tests
 * supply their own.
 */
struct IngestContext {
    /** Session id handed down by `claudemux new`/`attach`, if any */
    QString sessionId;

    /** PID of the assistant process hosting the hook, or 0 */
    std::function<qint64()> findAssistantPid;

    /** Name of the tmux session hosting the hook, or empty */
    std::function<QString()> currentTmuxSession;

    std::function<bool(qint64)> processAlive;
};

/**
 * StatusEngine applies hook events to session records.
 *
 * Each event kind maps to a fixed (status, detail) pair. Subagent events
 * are deliberately ignored: they can arrive after the parent's Stop and
 * would otherwise overwrite Idle.
 */
class StatusEngine : public QObject
{
    Q_OBJECT

public:
    enum class Outcome {
        Ignored,    // Empty, unknown or deliberately ignored event
        Unresolved, // No session could be found or registered
        Updated,
        StoreError,
    };

    struct Transition {
        bool applies = false;
        SessionStatus status = SessionStatus::Running;
        QString detail;
    };

    explicit StatusEngine(const SessionStore &store, QObject *parent = nullptr);
    ~StatusEngine() override;

    /**
     * The transition an event causes, independent of any session
     */
    static Transition transitionFor(const HookEvent &event);

    /**
     * Optional collaborators, not owned
     */
    void setConversationIndex(const ConversationIndex *index);
    void setNotificationDispatcher(NotificationDispatcher *dispatcher);

    /**
     * Command run when a session starts waiting for the user, to refresh
     * the usage cache shown in status bars. Empty disables it.
     */
    void setUsageRefreshCommand(const QString &command);

    /**
     * Find the session an event belongs to: the explicit session id first,
     * then a record bound to the event's conversation, then
     * auto-registration of a new record.
     */
    std::optional<SessionRecord> resolveSession(const HookEvent &event, const IngestContext &context);

    /**
     * Apply @p event. Never fails the caller for unresolved sessions.
     */
    Outcome ingest(const HookEvent &event, const IngestContext &context, QString *errorString = nullptr);

Q_SIGNALS:
    /**
     * Emitted after a record was updated and persisted
     */
    void transitioned(const QString &sessionId, Claudemux::SessionStatus previous, Claudemux::SessionStatus current);

private:
    std::optional<SessionRecord> findByConversation(const QString &conversationId) const;
    std::optional<SessionRecord> autoRegister(const HookEvent &event, const IngestContext &context);
    void refreshUsageCache() const;

    SessionStore m_store;
    const ConversationIndex *m_conversationIndex = nullptr;
    NotificationDispatcher *m_notificationDispatcher = nullptr;
    QString m_usageRefreshCommand;
};

} // namespace Claudemux

#endif // STATUSENGINE_H
