/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LIVENESSRECONCILER_H
#define LIVENESSRECONCILER_H

#include "SessionRecord.h"
#include "TmuxManager.h"

#include <QHash>

#include <functional>

namespace Claudemux
{

/**
 * LivenessReconciler recomputes whether a session is still alive and how
 * many clients are attached to it.
 *
 * A live backing tmux session is authoritative: the persisted status is
 * kept and only the attached count is refreshed. Without one, the
 * assistant PID is probed directly so sessions started outside tmux (or
 * orphaned by a tmux crash) still report correctly. Results are computed
 * in memory; persisting an Exited transition is up to the caller.
 */
class LivenessReconciler
{
public:
    /**
     * Returns the attached client count of a tmux session, or -1 if it
     * does not exist
     */
    using SessionQuery = std::function<int(const QString &)>;
    using ProcessProbe = std::function<bool(qint64)>;

    /**
     * Reconciler querying tmux one session at a time
     */
    explicit LivenessReconciler(TmuxManager *tmux);

    LivenessReconciler(SessionQuery sessionQuery, ProcessProbe processProbe);

    /**
     * Reconciler answering from a list-sessions snapshot, so a whole list
     * costs a single tmux call
     */
    static LivenessReconciler fromSnapshot(const QList<TmuxManager::SessionInfo> &sessions);

    /**
     * Update @p record in place. Returns true if it just became Exited.
     */
    bool reconcile(SessionRecord &record) const;

    /**
     * Reconcile every record of @p records. Ids of records that just
     * became Exited are appended to @p newlyExited.
     */
    void reconcileAll(SessionRecordList &records, QStringList *newlyExited = nullptr) const;

    /**
     * True if the record has a backing tmux session that currently exists
     */
    bool hasLiveBackingSession(const SessionRecord &record) const;

private:
    SessionQuery m_sessionQuery;
    ProcessProbe m_processProbe;
};

} // namespace Claudemux

#endif // LIVENESSRECONCILER_H
