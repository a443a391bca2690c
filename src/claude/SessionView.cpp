/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionView.h"

#include <KLocalizedString>

#include <algorithm>

namespace Claudemux
{

void SortSpec::toggle(SortColumn target)
{
    if (target == SortColumn::None) {
        column = SortColumn::None;
        order = SortOrder::Ascending;
        return;
    }

    if (column != target) {
        column = target;
        order = SortOrder::Ascending;
    } else if (order == SortOrder::Ascending) {
        order = SortOrder::Descending;
    } else {
        column = SortColumn::None;
        order = SortOrder::Ascending;
    }
}

bool SortSpec::parseColumn(const QString &name, SortColumn *column)
{
    const QString key = name.trimmed().toLower();
    SortColumn parsed;
    if (key.isEmpty() || key == QLatin1String("none")) {
        parsed = SortColumn::None;
    } else if (key == QLatin1String("id")) {
        parsed = SortColumn::Id;
    } else if (key == QLatin1String("directory") || key == QLatin1String("dir")) {
        parsed = SortColumn::Directory;
    } else if (key == QLatin1String("status")) {
        parsed = SortColumn::Status;
    } else if (key == QLatin1String("age") || key == QLatin1String("created")) {
        parsed = SortColumn::Age;
    } else if (key == QLatin1String("updated") || key == QLatin1String("time")) {
        parsed = SortColumn::Updated;
    } else {
        return false;
    }

    if (column) {
        *column = parsed;
    }
    return true;
}

SortOrder SortSpec::defaultOrder(SortColumn column)
{
    return (column == SortColumn::Age || column == SortColumn::Updated) ? SortOrder::Descending : SortOrder::Ascending;
}

bool StatusFilter::accepts(const SessionRecord &record) const
{
    if (record.status == SessionStatus::Exited && !includeExited && !show.contains(SessionStatus::Exited)) {
        return false;
    }
    if (!show.isEmpty() && !show.contains(record.status)) {
        return false;
    }
    return !hide.contains(record.status);
}

QString StatusFilter::describe() const
{
    QStringList names;
    for (SessionStatus status : show) {
        names.append(statusDisplayName(status));
    }
    return names.join(QStringLiteral(", "));
}

bool StatusFilter::parseStatuses(const QStringList &names, QList<SessionStatus> *statuses, QString *errorString)
{
    QList<SessionStatus> result;

    QStringList entries;
    for (const QString &name : names) {
        entries.append(name.split(QLatin1Char(','), Qt::SkipEmptyParts));
    }

    for (const QString &entry : std::as_const(entries)) {
        const QString key = entry.trimmed().toLower();
        if (key == QLatin1String("all")) {
            result.clear();
            break;
        }

        QList<SessionStatus> matched;
        SessionStatus status;
        if (key == QLatin1String("permission")) {
            matched.append(SessionStatus::AwaitingPermission);
        } else if (key == QLatin1String("input")) {
            matched.append(SessionStatus::AwaitingInput);
        } else if (key == QLatin1String("attention")) {
            matched.append(SessionStatus::AwaitingPermission);
            matched.append(SessionStatus::AwaitingInput);
        } else if (statusFromString(key, &status)) {
            matched.append(status);
        } else {
            if (errorString) {
                *errorString = i18n("Unknown status '%1' (expected idle, working, running, awaiting_permission, awaiting_input, attention, exited or all)", entry);
            }
            return false;
        }

        for (SessionStatus s : std::as_const(matched)) {
            if (!result.contains(s)) {
                result.append(s);
            }
        }
    }

    if (statuses) {
        *statuses = result;
    }
    return true;
}

bool matchesSearch(const SessionRecord &record, const QString &query)
{
    if (query.isEmpty()) {
        return true;
    }

    const QStringList haystack = {
        record.id,
        record.workingDirectory,
        statusToString(record.status),
        statusDisplayName(record.status),
        record.statusDetail,
        record.conversationId,
    };
    for (const QString &field : haystack) {
        if (field.contains(query, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

void sortRecords(SessionRecordList &records, const SortSpec &sort)
{
    if (sort.column == SortColumn::None || records.size() < 2) {
        return;
    }

    auto less = [&sort](const SessionRecord &a, const SessionRecord &b) {
        switch (sort.column) {
        case SortColumn::Id:
            return a.id < b.id;
        case SortColumn::Directory:
            return a.workingDirectory < b.workingDirectory;
        case SortColumn::Status:
            return statusPriority(a.status) < statusPriority(b.status);
        case SortColumn::Age:
            return a.created < b.created;
        case SortColumn::Updated:
            return a.updated < b.updated;
        case SortColumn::None:
            break;
        }
        return false;
    };

    if (sort.order == SortOrder::Descending) {
        std::stable_sort(records.begin(), records.end(), [&less](const SessionRecord &a, const SessionRecord &b) {
            return less(b, a);
        });
    } else {
        std::stable_sort(records.begin(), records.end(), less);
    }
}

SessionRecordList applyView(const SessionRecordList &records, const StatusFilter &filter, const SortSpec &sort, const QString &search)
{
    SessionRecordList result;
    for (const SessionRecord &record : records) {
        if (filter.accepts(record) && matchesSearch(record, search)) {
            result.append(record);
        }
    }
    sortRecords(result, sort);
    return result;
}

QString formatRelativeTime(const QDateTime &time, const QDateTime &now)
{
    if (!time.isValid()) {
        return QStringLiteral("-");
    }

    const qint64 seconds = qMax<qint64>(time.secsTo(now), 0);
    if (seconds < 60) {
        return QStringLiteral("%1s ago").arg(seconds);
    }
    if (seconds < 3600) {
        return QStringLiteral("%1m ago").arg(seconds / 60);
    }
    if (seconds < 86400) {
        return QStringLiteral("%1h ago").arg(seconds / 3600);
    }
    return QStringLiteral("%1d ago").arg(seconds / 86400);
}

} // namespace Claudemux
