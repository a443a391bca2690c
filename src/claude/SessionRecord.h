/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONRECORD_H
#define SESSIONRECORD_H

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>

namespace Claudemux
{

/**
 * Status of a tracked session.
 *
 * Running is the initial status of a freshly created session, before the
 * assistant has reported anything through its hooks.
 */
enum class SessionStatus {
    Running,
    Working,
    Idle,
    AwaitingPermission,
    AwaitingInput,
    Exited,
};

/**
 * On-disk string of a status (e.g. "awaiting_permission")
 */
QString statusToString(SessionStatus status);

/**
 * Parse an on-disk status string. Legacy "waiting_*" spellings are accepted.
 * Returns false for unknown strings and leaves @p status untouched.
 */
bool statusFromString(const QString &text, SessionStatus *status);

/**
 * Short human-readable label used by the monitor and `ls`
 */
QString statusDisplayName(SessionStatus status);

/**
 * Sort priority for the status column: sessions needing attention first,
 * then idle, then working, then exited.
 */
int statusPriority(SessionStatus status);

/**
 * True for AwaitingPermission and AwaitingInput
 */
bool statusNeedsAttention(SessionStatus status);

/**
 * SessionRecord is the persisted state of one tracked session.
 *
 * One record lives in <store>/<id>.json. The attached client count is
 * recomputed by reconciliation and never written to disk.
 */
class SessionRecord
{
public:
    SessionRecord() = default;

    QString id;                 // Unique key and file name
    QString tmuxSession;        // Backing tmux session name (empty if none)
    qint64 pid = 0;             // PID of the assistant process (0 if unknown)
    QString workingDirectory;
    QString conversationId;     // Bound Claude conversation (set by hooks)
    SessionStatus status = SessionStatus::Running;
    QString statusDetail;       // Tool name, notification message, ...
    QDateTime created;
    QDateTime updated;
    bool autoRegistered = false; // Created from an unmatched hook event

    // Ephemeral, filled in by LivenessReconciler
    int attachedClients = 0;
    bool tmuxAlive = false;

    bool isValid() const
    {
        return !id.isEmpty();
    }

    QJsonObject toJson() const;

    /**
     * Deserialize from JSON. Returns an invalid record if the id is missing.
     */
    static SessionRecord fromJson(const QJsonObject &obj);

    /**
     * Compares persisted fields only
     */
    bool operator==(const SessionRecord &other) const;
    bool operator!=(const SessionRecord &other) const
    {
        return !(*this == other);
    }
};

using SessionRecordList = QList<SessionRecord>;

} // namespace Claudemux

Q_DECLARE_METATYPE(Claudemux::SessionStatus)
Q_DECLARE_METATYPE(Claudemux::SessionRecord)

#endif // SESSIONRECORD_H
