/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONVIEW_H
#define SESSIONVIEW_H

#include "SessionRecord.h"

#include <QList>
#include <QString>
#include <QStringList>

namespace Claudemux
{

enum class SortColumn {
    None,
    Id,
    Directory,
    Status,
    Age,
    Updated,
};

enum class SortOrder {
    Ascending,
    Descending,
};

/**
 * Column and direction a session list is sorted by
 */
struct SortSpec {
    SortColumn column = SortColumn::None;
    SortOrder order = SortOrder::Ascending;

    /**
     * Cycle @p target through ascending, descending and unsorted.
     * Selecting a different column starts it ascending.
     */
    void toggle(SortColumn target);

    /**
     * Accepts id, directory/dir, status, age/created, updated/time
     */
    static bool parseColumn(const QString &name, SortColumn *column);

    /**
     * Time columns default to most recent first
     */
    static SortOrder defaultOrder(SortColumn column);

    bool operator==(const SortSpec &other) const
    {
        return column == other.column && order == other.order;
    }
};

/**
 * Show/hide status filter applied before sorting and search.
 *
 * An empty show list shows every status. Exited sessions are hidden unless
 * includeExited is set.
 */
struct StatusFilter {
    QList<SessionStatus> show;
    QList<SessionStatus> hide;
    bool includeExited = false;

    bool accepts(const SessionRecord &record) const;

    bool isActive() const
    {
        return !show.isEmpty() || !hide.isEmpty();
    }

    /**
     * Comma separated display names of the shown statuses
     */
    QString describe() const;

    /**
     * Parse user-facing status names. "all" clears the list, "permission"
     * and "input" are aliases, "attention" expands to both awaiting
     * statuses. Entries may themselves be comma separated.
     */
    static bool parseStatuses(const QStringList &names, QList<SessionStatus> *statuses, QString *errorString = nullptr);
};

/**
 * Case-insensitive substring match on id, directory, status, detail and
 * conversation id. An empty query matches everything.
 */
bool matchesSearch(const SessionRecord &record, const QString &query);

/**
 * Stable sort; an unsorted view keeps the store order
 */
void sortRecords(SessionRecordList &records, const SortSpec &sort);

/**
 * Filter, sort and search in one pass
 */
SessionRecordList applyView(const SessionRecordList &records, const StatusFilter &filter, const SortSpec &sort, const QString &search = QString());

/**
 * "5s ago", "3m ago", "2h ago", "4d ago"
 */
QString formatRelativeTime(const QDateTime &time, const QDateTime &now = QDateTime::currentDateTimeUtc());

} // namespace Claudemux

#endif // SESSIONVIEW_H
