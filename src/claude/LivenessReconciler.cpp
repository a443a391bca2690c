/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LivenessReconciler.h"

#include "ClaudemuxDebug.h"
#include "ProcessTable.h"

#include <utility>

namespace Claudemux
{

LivenessReconciler::LivenessReconciler(TmuxManager *tmux)
    : m_sessionQuery([tmux](const QString &name) {
        return tmux ? tmux->attachedCount(name) : -1;
    })
    , m_processProbe(&ProcessTable::isAlive)
{
}

LivenessReconciler::LivenessReconciler(SessionQuery sessionQuery, ProcessProbe processProbe)
    : m_sessionQuery(std::move(sessionQuery))
    , m_processProbe(std::move(processProbe))
{
}

LivenessReconciler LivenessReconciler::fromSnapshot(const QList<TmuxManager::SessionInfo> &sessions)
{
    QHash<QString, int> attached;
    for (const auto &info : sessions) {
        attached.insert(info.name, info.attached);
    }
    return LivenessReconciler(
        [attached](const QString &name) {
            return attached.value(name, -1);
        },
        &ProcessTable::isAlive);
}

bool LivenessReconciler::hasLiveBackingSession(const SessionRecord &record) const
{
    return !record.tmuxSession.isEmpty() && m_sessionQuery && m_sessionQuery(record.tmuxSession) >= 0;
}

bool LivenessReconciler::reconcile(SessionRecord &record) const
{
    if (!record.tmuxSession.isEmpty() && m_sessionQuery) {
        const int attached = m_sessionQuery(record.tmuxSession);
        if (attached >= 0) {
            record.attachedClients = attached;
            record.tmuxAlive = true;
            return false;
        }
    }

    record.attachedClients = 0;
    record.tmuxAlive = false;

    // Status stays hook-driven while the assistant process is alive
    if (record.pid > 0 && m_processProbe && m_processProbe(record.pid)) {
        return false;
    }

    if (record.status == SessionStatus::Exited) {
        return false;
    }

    qCDebug(ClaudemuxStore) << "LivenessReconciler: Session" << record.id << "has exited (tmux:" << record.tmuxSession << "pid:" << record.pid << ")";
    record.status = SessionStatus::Exited;
    record.statusDetail.clear();
    return true;
}

void LivenessReconciler::reconcileAll(SessionRecordList &records, QStringList *newlyExited) const
{
    for (SessionRecord &record : records) {
        if (reconcile(record) && newlyExited) {
            newlyExited->append(record.id);
        }
    }
}

} // namespace Claudemux
