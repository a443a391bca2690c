/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "SessionViewTest.h"

// Qt
#include <QStandardPaths>
#include <QTest>

// Claudemux
#include "../claude/SessionView.h"

using namespace Claudemux;

namespace
{
SessionRecord makeRecord(const QString &id, SessionStatus status, const QString &cwd, const QDateTime &created)
{
    SessionRecord record;
    record.id = id;
    record.status = status;
    record.workingDirectory = cwd;
    record.created = created;
    record.updated = created;
    return record;
}

QStringList ids(const SessionRecordList &records)
{
    QStringList result;
    for (const SessionRecord &record : records) {
        result.append(record.id);
    }
    return result;
}
}

void SessionViewTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void SessionViewTest::testParseColumn()
{
    SortColumn column = SortColumn::None;
    QVERIFY(SortSpec::parseColumn(QStringLiteral("dir"), &column));
    QVERIFY(column == SortColumn::Directory);
    QVERIFY(SortSpec::parseColumn(QStringLiteral(" Created "), &column));
    QVERIFY(column == SortColumn::Age);
    QVERIFY(SortSpec::parseColumn(QStringLiteral("time"), &column));
    QVERIFY(column == SortColumn::Updated);
    QVERIFY(SortSpec::parseColumn(QStringLiteral("none"), &column));
    QVERIFY(column == SortColumn::None);

    column = SortColumn::Id;
    QVERIFY(!SortSpec::parseColumn(QStringLiteral("size"), &column));
    QVERIFY(column == SortColumn::Id);
}

void SessionViewTest::testDefaultOrder()
{
    QVERIFY(SortSpec::defaultOrder(SortColumn::Age) == SortOrder::Descending);
    QVERIFY(SortSpec::defaultOrder(SortColumn::Updated) == SortOrder::Descending);
    QVERIFY(SortSpec::defaultOrder(SortColumn::Id) == SortOrder::Ascending);
    QVERIFY(SortSpec::defaultOrder(SortColumn::Status) == SortOrder::Ascending);
}

void SessionViewTest::testToggle()
{
    SortSpec sort;
    sort.toggle(SortColumn::Status);
    QVERIFY(sort.column == SortColumn::Status && sort.order == SortOrder::Ascending);
    sort.toggle(SortColumn::Status);
    QVERIFY(sort.column == SortColumn::Status && sort.order == SortOrder::Descending);
    sort.toggle(SortColumn::Status);
    QVERIFY(sort.column == SortColumn::None);

    sort.toggle(SortColumn::Id);
    sort.toggle(SortColumn::Id);
    sort.toggle(SortColumn::Directory);
    QVERIFY(sort.column == SortColumn::Directory && sort.order == SortOrder::Ascending);
}

void SessionViewTest::testParseStatuses()
{
    QList<SessionStatus> statuses;
    QVERIFY(StatusFilter::parseStatuses({QStringLiteral("idle,permission"), QStringLiteral("input")}, &statuses));
    QVERIFY(statuses == (QList<SessionStatus>{SessionStatus::Idle, SessionStatus::AwaitingPermission, SessionStatus::AwaitingInput}));

    QVERIFY(StatusFilter::parseStatuses({QStringLiteral("attention"), QStringLiteral("awaiting_input")}, &statuses));
    QVERIFY(statuses == (QList<SessionStatus>{SessionStatus::AwaitingPermission, SessionStatus::AwaitingInput}));

    QVERIFY(StatusFilter::parseStatuses({QStringLiteral("Exited")}, &statuses));
    QVERIFY(statuses == QList<SessionStatus>{SessionStatus::Exited});
}

void SessionViewTest::testParseStatusesAll()
{
    QList<SessionStatus> statuses = {SessionStatus::Idle};
    QVERIFY(StatusFilter::parseStatuses({QStringLiteral("working,all")}, &statuses));
    QVERIFY(statuses.isEmpty());
}

void SessionViewTest::testParseStatusesUnknown()
{
    QList<SessionStatus> statuses = {SessionStatus::Idle};
    QString error;
    QVERIFY(!StatusFilter::parseStatuses({QStringLiteral("idle,busy")}, &statuses, &error));
    QVERIFY(error.contains(QStringLiteral("busy")));
    QVERIFY(statuses == QList<SessionStatus>{SessionStatus::Idle});
}

void SessionViewTest::testFilterHidesExitedByDefault()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    const SessionRecord exited = makeRecord(QStringLiteral("old"), SessionStatus::Exited, QStringLiteral("/tmp"), now);
    const SessionRecord idle = makeRecord(QStringLiteral("new"), SessionStatus::Idle, QStringLiteral("/tmp"), now);

    StatusFilter filter;
    QVERIFY(!filter.isActive());
    QVERIFY(!filter.accepts(exited));
    QVERIFY(filter.accepts(idle));

    filter.includeExited = true;
    QVERIFY(filter.accepts(exited));

    StatusFilter onlyExited;
    onlyExited.show = {SessionStatus::Exited};
    QVERIFY(onlyExited.accepts(exited));
    QVERIFY(!onlyExited.accepts(idle));
}

void SessionViewTest::testFilterShowAndHide()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    const SessionRecord working = makeRecord(QStringLiteral("w"), SessionStatus::Working, QStringLiteral("/tmp"), now);
    const SessionRecord waiting = makeRecord(QStringLiteral("p"), SessionStatus::AwaitingPermission, QStringLiteral("/tmp"), now);

    StatusFilter filter;
    filter.show = {SessionStatus::AwaitingPermission, SessionStatus::AwaitingInput};
    QVERIFY(filter.isActive());
    QVERIFY(filter.accepts(waiting));
    QVERIFY(!filter.accepts(working));
    QCOMPARE(filter.describe(), QStringLiteral("Permission, Input"));

    StatusFilter hiding;
    hiding.hide = {SessionStatus::Working};
    QVERIFY(!hiding.accepts(working));
    QVERIFY(hiding.accepts(waiting));
}

void SessionViewTest::testSearch()
{
    SessionRecord record = makeRecord(QStringLiteral("abc123"), SessionStatus::AwaitingPermission, QStringLiteral("/home/user/WebApp"), QDateTime());
    record.statusDetail = QStringLiteral("Bash");
    record.conversationId = QStringLiteral("f00dcafe-0000");

    QVERIFY(matchesSearch(record, QString()));
    QVERIFY(matchesSearch(record, QStringLiteral("ABC")));
    QVERIFY(matchesSearch(record, QStringLiteral("webapp")));
    QVERIFY(matchesSearch(record, QStringLiteral("awaiting_perm")));
    QVERIFY(matchesSearch(record, QStringLiteral("permission")));
    QVERIFY(matchesSearch(record, QStringLiteral("bash")));
    QVERIFY(matchesSearch(record, QStringLiteral("cafe")));
    QVERIFY(!matchesSearch(record, QStringLiteral("docs")));
}

void SessionViewTest::testApplyViewSortsStable()
{
    const QDateTime base = QDateTime(QDate(2025, 3, 1), QTime(12, 0), Qt::UTC);
    const SessionRecordList records = {
        makeRecord(QStringLiteral("a"), SessionStatus::Working, QStringLiteral("/z"), base),
        makeRecord(QStringLiteral("b"), SessionStatus::Idle, QStringLiteral("/y"), base.addSecs(60)),
        makeRecord(QStringLiteral("c"), SessionStatus::AwaitingInput, QStringLiteral("/x"), base.addSecs(120)),
        makeRecord(QStringLiteral("d"), SessionStatus::Working, QStringLiteral("/w"), base.addSecs(180)),
        makeRecord(QStringLiteral("e"), SessionStatus::Exited, QStringLiteral("/v"), base.addSecs(240)),
    };

    SortSpec none;
    QCOMPARE(ids(applyView(records, StatusFilter(), none)), (QStringList{QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c"), QStringLiteral("d")}));

    SortSpec byStatus;
    byStatus.column = SortColumn::Status;
    QCOMPARE(ids(applyView(records, StatusFilter(), byStatus)), (QStringList{QStringLiteral("c"), QStringLiteral("b"), QStringLiteral("a"), QStringLiteral("d")}));

    SortSpec newestFirst;
    newestFirst.column = SortColumn::Age;
    newestFirst.order = SortOrder::Descending;
    StatusFilter withExited;
    withExited.includeExited = true;
    QCOMPARE(ids(applyView(records, withExited, newestFirst)),
             (QStringList{QStringLiteral("e"), QStringLiteral("d"), QStringLiteral("c"), QStringLiteral("b"), QStringLiteral("a")}));

    SortSpec byDirectory;
    byDirectory.column = SortColumn::Directory;
    QCOMPARE(ids(applyView(records, StatusFilter(), byDirectory, QStringLiteral("working"))), (QStringList{QStringLiteral("d"), QStringLiteral("a")}));
}

void SessionViewTest::testFormatRelativeTime()
{
    const QDateTime now = QDateTime(QDate(2025, 3, 1), QTime(12, 0), Qt::UTC);
    QCOMPARE(formatRelativeTime(QDateTime(), now), QStringLiteral("-"));
    QCOMPARE(formatRelativeTime(now.addSecs(-5), now), QStringLiteral("5s ago"));
    QCOMPARE(formatRelativeTime(now.addSecs(-59), now), QStringLiteral("59s ago"));
    QCOMPARE(formatRelativeTime(now.addSecs(-60), now), QStringLiteral("1m ago"));
    QCOMPARE(formatRelativeTime(now.addSecs(-3 * 3600 - 10), now), QStringLiteral("3h ago"));
    QCOMPARE(formatRelativeTime(now.addDays(-2), now), QStringLiteral("2d ago"));
    QCOMPARE(formatRelativeTime(now.addSecs(30), now), QStringLiteral("0s ago"));
}

QTEST_GUILESS_MAIN(SessionViewTest)

#include "moc_SessionViewTest.cpp"
