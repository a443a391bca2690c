/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LIFECYCLECONTROLLER_H
#define LIFECYCLECONTROLLER_H

#include "Inbox.h"
#include "SessionRecord.h"
#include "SessionStore.h"
#include "TmuxManager.h"

#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

namespace Claudemux
{

class ClaudemuxSettings;

/**
 * Outcome of a user-facing operation
 */
struct OperationResult {
    bool ok = false;
    QString message;        // User-facing, already localized
    QStringList candidates; // Matching ids when an id prefix was ambiguous

    static OperationResult success(const QString &message = QString())
    {
        return OperationResult{true, message, {}};
    }

    static OperationResult failure(const QString &message, const QStringList &candidates = {})
    {
        return OperationResult{false, message, candidates};
    }
};

/**
 * LifecycleController creates, attaches, kills and prunes sessions.
 */
class LifecycleController : public QObject
{
    Q_OBJECT

public:
    struct Config {
        QString assistantCommand = QStringLiteral("claude");
        QString tmuxSessionPrefix = QStringLiteral("claudemux-");
        QString focusCommand;
    };

    struct CreateOptions {
        QString workingDirectory;
        QString resumeConversationId;
        QString label;
    };

    enum class KillScope {
        All,
        IdleOnly,
    };

    enum class AttachOutcome {
        Attached,
        AlreadyAttached, // Not attached; a focus request was sent instead
        Failed,
    };

    /**
     * Called with the sessions about to be killed; returning false aborts
     */
    using ConfirmFunction = std::function<bool(const SessionRecordList &)>;

    LifecycleController(const SessionStore &store, TmuxManager *tmux, const Config &config, QObject *parent = nullptr);
    ~LifecycleController() override;

    static Config configFromSettings(const ClaudemuxSettings *settings);

    /**
     * Environment variable carrying the session id into hosted processes
     */
    static QString sessionIdVariable()
    {
        return QStringLiteral("CLAUDEMUX_SESSION_ID");
    }

    /**
     * Random session id: the last 8 hex digits of the current time in ns
     */
    static QString generateSessionId();

    /**
     * Label if given, else the first 8 characters of the resumed
     * conversation id, else a random id
     */
    static QString deriveSessionId(const QString &label, const QString &resumeConversationId);

    /**
     * Parse durations like "7d", "2w", "12h", "30m", "45s" or a plain
     * number of seconds
     */
    static bool parseDuration(const QString &text, qint64 *seconds);

    /**
     * Human-friendly age such as "5m" or "3d"
     */
    static QString formatAge(qint64 seconds);

    const SessionStore &store() const
    {
        return m_store;
    }

    const Inbox &inbox() const
    {
        return m_inbox;
    }

    /**
     * Start the assistant in a new detached tmux session and persist
     * an initial Running record
     */
    OperationResult create(const CreateOptions &options, SessionRecord *created = nullptr);

    /**
     * Resolve an exact id or unique id prefix
     */
    OperationResult resolve(const QString &idOrPrefix, SessionRecord *record) const;

    /**
     * All records, reconciled against tmux and the process table.
     * With @p persistExited, records found to have exited are saved.
     */
    SessionRecordList reconciledRecords(bool persistExited = true) const;

    /**
     * Same as reconciledRecords() but answering tmux queries from a
     * list-sessions result the caller already has
     */
    SessionRecordList reconcileRecords(const QList<TmuxManager::SessionInfo> &tmuxSessions, bool persistExited = true) const;

    /**
     * Kill one session by id or id prefix
     */
    OperationResult kill(const QString &idOrPrefix);

    /**
     * Kill every session, or only the idle ones. @p confirm may veto.
     */
    OperationResult killMany(KillScope scope, const ConfirmFunction &confirm = nullptr, QStringList *killed = nullptr);

    /**
     * Exited sessions last updated more than @p maxAgeSeconds ago;
     * 0 selects every exited session
     */
    SessionRecordList pruneCandidates(qint64 maxAgeSeconds) const;

    /**
     * Delete the records pruneCandidates() selects, unless @p dryRun
     */
    OperationResult prune(qint64 maxAgeSeconds, bool dryRun = false, SessionRecordList *affected = nullptr);

    /**
     * Attach the calling terminal to a session. Blocks until tmux detaches
     * or exits while running the inbox watcher and forwarding signals.
     */
    OperationResult attach(const QString &idOrPrefix, bool force, AttachOutcome *outcome = nullptr);

    /**
     * Detach every client of a session's tmux session
     */
    OperationResult detachClients(const QString &idOrPrefix);

    /**
     * Ask the terminal attached to a session to raise its window
     */
    OperationResult focus(const QString &idOrPrefix);

    /**
     * Post a message to a session's inbox
     */
    OperationResult postMessage(const QString &idOrPrefix, const QString &type);

    /**
     * Handle a message delivered to the session this process is attached to
     */
    void handleInboxMessage(const InboxMessage &message);

Q_SIGNALS:
    void sessionCreated(const QString &sessionId);
    void sessionRemoved(const QString &sessionId);

private:
    bool removeSession(const SessionRecord &record, QString *errorString);
    bool markExited(SessionRecord &record);

    SessionStore m_store;
    Inbox m_inbox;
    TmuxManager *m_tmux;
    Config m_config;
};

} // namespace Claudemux

#endif // LIFECYCLECONTROLLER_H
