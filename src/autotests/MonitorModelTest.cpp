/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "MonitorModelTest.h"

// Qt
#include <QStandardPaths>
#include <QTest>

// Claudemux
#include "../claude/MonitorModel.h"

using namespace Claudemux;

using Key = MonitorModel::Key;
using Action = MonitorModel::Action;

namespace
{
SessionRecord makeRecord(const QString &id, SessionStatus status, const QString &cwd = QStringLiteral("/tmp"), int attached = 0, bool tmuxAlive = true)
{
    SessionRecord record;
    record.id = id;
    record.tmuxSession = QStringLiteral("claudemux-") + id;
    record.status = status;
    record.workingDirectory = cwd;
    record.attachedClients = attached;
    record.tmuxAlive = tmuxAlive;
    record.created = QDateTime::currentDateTimeUtc();
    record.updated = record.created;
    return record;
}

Action press(MonitorModel &model, char c)
{
    return model.handleKey(Key::fromCharacter(static_cast<uint>(c)));
}

Action press(MonitorModel &model, Key::Code code, int number = 0)
{
    return model.handleKey(Key::of(code, number));
}

void type(MonitorModel &model, const QString &text)
{
    for (const QChar c : text) {
        model.handleKey(Key::fromCharacter(c.unicode()));
    }
}

QStringList visibleIds(const MonitorModel &model)
{
    QStringList ids;
    for (const SessionRecord &record : model.visibleRecords()) {
        ids.append(record.id);
    }
    return ids;
}

SessionRecordList threeSessions()
{
    return {makeRecord(QStringLiteral("aaa"), SessionStatus::Working, QStringLiteral("/home/u/web")),
            makeRecord(QStringLiteral("bbb"), SessionStatus::Idle, QStringLiteral("/home/u/api")),
            makeRecord(QStringLiteral("ccc"), SessionStatus::AwaitingPermission, QStringLiteral("/home/u/docs"))};
}
}

void MonitorModelTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void MonitorModelTest::testCursorMovesAndClamps()
{
    MonitorModel model;
    model.setRecords(threeSessions());
    QCOMPARE(model.cursor(), 0);

    press(model, 'j');
    press(model, Key::Down);
    QCOMPARE(model.cursor(), 2);
    press(model, Key::Down);
    QCOMPARE(model.cursor(), 2);

    press(model, 'k');
    QCOMPARE(model.cursor(), 1);
    press(model, Key::Home);
    QCOMPARE(model.cursor(), 0);
    press(model, Key::Up);
    QCOMPARE(model.cursor(), 0);
    press(model, Key::End);
    QCOMPARE(model.cursor(), 2);
}

void MonitorModelTest::testCursorFollowsSessionAcrossRefresh()
{
    MonitorModel model;
    model.setRecords(threeSessions());
    press(model, 'j');
    QCOMPARE(model.selectedRecord()->id, QStringLiteral("bbb"));

    // A new session listed first must not move the selection
    SessionRecordList records = threeSessions();
    records.prepend(makeRecord(QStringLiteral("000"), SessionStatus::Working));
    model.setRecords(records);
    QCOMPARE(model.selectedRecord()->id, QStringLiteral("bbb"));
    QCOMPARE(model.cursor(), 2);
}

void MonitorModelTest::testCursorClampedAfterRemoval()
{
    MonitorModel model;
    model.setRecords(threeSessions());
    press(model, Key::End);
    QCOMPARE(model.cursor(), 2);

    model.removeRecord(QStringLiteral("ccc"));
    QCOMPARE(model.cursor(), 1);
    QCOMPARE(model.selectedRecord()->id, QStringLiteral("bbb"));

    model.setRecords({});
    QCOMPARE(model.cursor(), 0);
    QVERIFY(model.selectedRecord() == nullptr);
}

void MonitorModelTest::testViewportKeepsCursorVisible()
{
    SessionRecordList records;
    for (int i = 0; i < 20; ++i) {
        records.append(makeRecord(QStringLiteral("s%1").arg(i, 2, 10, QLatin1Char('0')), SessionStatus::Idle));
    }

    MonitorModel model;
    model.setViewportHeight(5);
    model.setRecords(records);

    for (int i = 0; i < 7; ++i) {
        press(model, Key::Down);
    }
    QCOMPARE(model.cursor(), 7);
    QCOMPARE(model.scrollOffset(), 3);

    press(model, Key::End);
    QCOMPARE(model.scrollOffset(), 15);

    press(model, Key::PageUp);
    QCOMPARE(model.cursor(), 14);
    QCOMPARE(model.scrollOffset(), 14);

    press(model, Key::Home);
    QCOMPARE(model.scrollOffset(), 0);
}

void MonitorModelTest::testViewportHeightFor()
{
    QCOMPARE(MonitorModel::viewportHeightFor(40), 30);
    QCOMPARE(MonitorModel::viewportHeightFor(12), 5);
    QCOMPARE(MonitorModel::viewportHeightFor(0), 5);
}

void MonitorModelTest::testSortColumnCycles()
{
    MonitorModel model;
    model.setRecords({makeRecord(QStringLiteral("bbb"), SessionStatus::Idle), makeRecord(QStringLiteral("ccc"), SessionStatus::Idle),
                      makeRecord(QStringLiteral("aaa"), SessionStatus::Idle)});

    press(model, '1');
    QCOMPARE(model.sort().column, SortColumn::Id);
    QCOMPARE(model.sort().order, SortOrder::Ascending);
    QCOMPARE(visibleIds(model), QStringList({QStringLiteral("aaa"), QStringLiteral("bbb"), QStringLiteral("ccc")}));

    press(model, '1');
    QCOMPARE(model.sort().order, SortOrder::Descending);
    QCOMPARE(visibleIds(model), QStringList({QStringLiteral("ccc"), QStringLiteral("bbb"), QStringLiteral("aaa")}));

    press(model, '1');
    QCOMPARE(model.sort().column, SortColumn::None);
    QCOMPARE(visibleIds(model), QStringList({QStringLiteral("bbb"), QStringLiteral("ccc"), QStringLiteral("aaa")}));

    // Switching column starts ascending again
    press(model, '1');
    press(model, '2');
    QCOMPARE(model.sort().column, SortColumn::Directory);
    QCOMPARE(model.sort().order, SortOrder::Ascending);
}

void MonitorModelTest::testStatusSortPutsAttentionFirst()
{
    MonitorModel model;
    model.setRecords({makeRecord(QStringLiteral("w"), SessionStatus::Working), makeRecord(QStringLiteral("i"), SessionStatus::Idle),
                      makeRecord(QStringLiteral("p"), SessionStatus::AwaitingPermission), makeRecord(QStringLiteral("n"), SessionStatus::AwaitingInput)});

    press(model, '3');
    const QStringList ids = visibleIds(model);
    QCOMPARE(ids.mid(2), QStringList({QStringLiteral("i"), QStringLiteral("w")}));
    QVERIFY(ids.mid(0, 2).contains(QStringLiteral("p")));
    QVERIFY(ids.mid(0, 2).contains(QStringLiteral("n")));
}

void MonitorModelTest::testFunctionKeysSort()
{
    MonitorModel model;
    model.setRecords(threeSessions());
    press(model, Key::Function, 5);
    QCOMPARE(model.sort().column, SortColumn::Updated);
    press(model, Key::Function, 4);
    QCOMPARE(model.sort().column, SortColumn::Age);
    press(model, Key::Function, 9);
    QCOMPARE(model.sort().column, SortColumn::Age);
}

void MonitorModelTest::testSearchFiltersRows()
{
    MonitorModel model;
    SessionRecordList records = threeSessions();
    records[1].conversationId = QStringLiteral("5f3e-conv");
    records[2].statusDetail = QStringLiteral("Bash");
    model.setRecords(records);

    press(model, '/');
    QCOMPARE(model.mode(), MonitorModel::Mode::Search);

    type(model, QStringLiteral("WEB"));
    QCOMPARE(visibleIds(model), QStringList({QStringLiteral("aaa")}));
    QCOMPARE(model.filteredCount(), 3);

    model.handleKey(Key::of(Key::ClearLine));
    type(model, QStringLiteral("5f3e"));
    QCOMPARE(visibleIds(model), QStringList({QStringLiteral("bbb")}));

    model.handleKey(Key::of(Key::ClearLine));
    type(model, QStringLiteral("bash"));
    QCOMPARE(visibleIds(model), QStringList({QStringLiteral("ccc")}));

    model.handleKey(Key::of(Key::ClearLine));
    type(model, QStringLiteral("idle"));
    QCOMPARE(visibleIds(model), QStringList({QStringLiteral("bbb")}));

    // Typing 'q' in search mode is text, not quit
    const Action action = press(model, 'q');
    QCOMPARE(action.kind, Action::None);
    QCOMPARE(model.search(), QStringLiteral("idleq"));
    QVERIFY(model.visibleRecords().isEmpty());

    press(model, Key::Backspace);
    QCOMPARE(model.search(), QStringLiteral("idle"));

    press(model, Key::Enter);
    QCOMPARE(model.mode(), MonitorModel::Mode::Browse);
    QCOMPARE(model.search(), QStringLiteral("idle"));
}

void MonitorModelTest::testSearchEscapeClearsThenLeaves()
{
    MonitorModel model;
    model.setRecords(threeSessions());

    press(model, '/');
    type(model, QStringLiteral("api"));
    QCOMPARE(model.visibleRecords().size(), 1);

    press(model, Key::Escape);
    QCOMPARE(model.mode(), MonitorModel::Mode::Search);
    QVERIFY(model.search().isEmpty());
    QCOMPARE(model.visibleRecords().size(), 3);

    press(model, Key::Escape);
    QCOMPARE(model.mode(), MonitorModel::Mode::Browse);
}

void MonitorModelTest::testSearchArrowLeavesAndMoves()
{
    MonitorModel model;
    model.setRecords(threeSessions());

    press(model, '/');
    press(model, Key::Down);
    QCOMPARE(model.mode(), MonitorModel::Mode::Browse);
    QCOMPARE(model.cursor(), 1);
}

void MonitorModelTest::testSearchClearLine()
{
    MonitorModel model;
    model.setRecords(threeSessions());
    press(model, '/');
    type(model, QStringLiteral("zzz"));
    QVERIFY(model.visibleRecords().isEmpty());
    press(model, Key::ClearLine);
    QVERIFY(model.search().isEmpty());
    QCOMPARE(model.visibleRecords().size(), 3);
}

void MonitorModelTest::testFilterAllClearsOthers()
{
    MonitorModel model;
    model.setRecords(threeSessions());

    press(model, 'f');
    QCOMPARE(model.mode(), MonitorModel::Mode::FilterMenu);
    QVERIFY(model.isFilterOptionChecked(0));

    press(model, 'j');
    press(model, ' ');
    press(model, 'j');
    press(model, ' ');
    QVERIFY(!model.isFilterOptionChecked(0));
    QVERIFY(model.isFilterOptionChecked(1));
    QVERIFY(model.isFilterOptionChecked(2));

    press(model, Key::Home);
    press(model, 'k');
    press(model, 'k');
    QCOMPARE(model.filterCursor(), 0);
    press(model, 'x');
    QVERIFY(model.isFilterOptionChecked(0));
    QVERIFY(!model.isFilterOptionChecked(1));
    QVERIFY(!model.isFilterOptionChecked(2));
}

void MonitorModelTest::testFilterSpecificClearsAll()
{
    MonitorModel model;
    model.setRecords(threeSessions());

    press(model, 'f');
    press(model, 'j');
    press(model, ' ');
    press(model, Key::Enter);

    QCOMPARE(model.mode(), MonitorModel::Mode::Browse);
    QVERIFY(model.filter().show == QList<SessionStatus>({SessionStatus::Idle}));
    QCOMPARE(visibleIds(model), QStringList({QStringLiteral("bbb")}));

    // Reopening the menu reflects the active filter
    press(model, 'f');
    QVERIFY(!model.isFilterOptionChecked(0));
    QVERIFY(model.isFilterOptionChecked(1));
}

void MonitorModelTest::testFilterNothingCheckedFallsBackToAll()
{
    MonitorModel model;
    model.setRecords(threeSessions());

    press(model, 'f');
    press(model, 'j');
    press(model, ' ');
    press(model, ' ');
    QVERIFY(model.isFilterOptionChecked(0));
    press(model, 'f');
    QVERIFY(model.filter().show.isEmpty());
    QCOMPARE(model.visibleRecords().size(), 3);
}

void MonitorModelTest::testFilterExitedIncludesExited()
{
    MonitorModel model;
    SessionRecordList records = threeSessions();
    records.append(makeRecord(QStringLiteral("ddd"), SessionStatus::Exited, QStringLiteral("/old"), 0, false));
    model.setRecords(records);
    QCOMPARE(model.visibleRecords().size(), 3);

    press(model, 'f');
    for (int i = 0; i < 5; ++i) {
        press(model, Key::Down);
    }
    QCOMPARE(model.filterCursor(), 5);
    press(model, ' ');
    press(model, Key::Enter);

    QVERIFY(model.filter().includeExited);
    QCOMPARE(visibleIds(model), QStringList({QStringLiteral("ddd")}));
}

void MonitorModelTest::testFilterMenuEscapeDiscards()
{
    MonitorModel model;
    model.setRecords(threeSessions());

    press(model, 'f');
    press(model, 'j');
    press(model, ' ');
    press(model, Key::Escape);
    QCOMPARE(model.mode(), MonitorModel::Mode::Browse);
    QVERIFY(model.filter().show.isEmpty());
    QCOMPARE(model.visibleRecords().size(), 3);
}

void MonitorModelTest::testEnterAttachesDetachedSession()
{
    MonitorModel model;
    model.setRecords(threeSessions());
    press(model, 'j');

    const Action action = press(model, Key::Enter);
    QCOMPARE(action.kind, Action::Attach);
    QCOMPARE(action.sessionId, QStringLiteral("bbb"));
    QVERIFY(!action.force);
    QVERIFY(action.endsMonitor());
}

void MonitorModelTest::testEnterFocusesAttachedSession()
{
    MonitorModel model;
    model.setRecords({makeRecord(QStringLiteral("att"), SessionStatus::Working, QStringLiteral("/w"), 1)});

    const Action action = press(model, Key::Enter);
    QCOMPARE(action.kind, Action::FocusOnly);
    QCOMPARE(action.sessionId, QStringLiteral("att"));
}

void MonitorModelTest::testEnterWithoutTmuxShowsInfo()
{
    MonitorModel model;
    model.setRecords({makeRecord(QStringLiteral("bare"), SessionStatus::Working, QStringLiteral("/w"), 0, false)});

    Action action = press(model, Key::Enter);
    QCOMPARE(action.kind, Action::None);
    QCOMPARE(model.mode(), MonitorModel::Mode::Confirm);
    QCOMPARE(model.confirmKind(), MonitorModel::ConfirmKind::NoTmux);

    // Any key closes it, including 'y'
    action = press(model, 'y');
    QCOMPARE(action.kind, Action::None);
    QCOMPARE(model.mode(), MonitorModel::Mode::Browse);
}

void MonitorModelTest::testForceAttachNeedsConfirmation()
{
    MonitorModel model;
    model.setRecords({makeRecord(QStringLiteral("att"), SessionStatus::Idle, QStringLiteral("/w"), 2)});

    Action action = press(model, 'a');
    QCOMPARE(action.kind, Action::None);
    QCOMPARE(model.confirmKind(), MonitorModel::ConfirmKind::AttachForce);
    QCOMPARE(model.confirmSessionId(), QStringLiteral("att"));

    action = press(model, 'y');
    QCOMPARE(action.kind, Action::Attach);
    QVERIFY(action.force);
    QCOMPARE(action.sessionId, QStringLiteral("att"));
}

void MonitorModelTest::testKillConfirmation()
{
    MonitorModel model;
    model.setRecords(threeSessions());

    press(model, 'x');
    QCOMPARE(model.confirmKind(), MonitorModel::ConfirmKind::Kill);

    // Unrelated keys keep the dialog open
    QCOMPARE(press(model, 'z').kind, Action::None);
    QCOMPARE(model.mode(), MonitorModel::Mode::Confirm);

    QCOMPARE(press(model, 'n').kind, Action::None);
    QCOMPARE(model.mode(), MonitorModel::Mode::Browse);

    press(model, Key::Delete);
    const Action action = press(model, 'y');
    QCOMPARE(action.kind, Action::Kill);
    QCOMPARE(action.sessionId, QStringLiteral("aaa"));
    QVERIFY(!action.endsMonitor());
    QCOMPARE(model.mode(), MonitorModel::Mode::Browse);
}

void MonitorModelTest::testDetachOnlyWhenAttached()
{
    MonitorModel model;
    model.setRecords({makeRecord(QStringLiteral("det"), SessionStatus::Idle), makeRecord(QStringLiteral("att"), SessionStatus::Idle, QStringLiteral("/w"), 1)});

    press(model, 'd');
    QCOMPARE(model.mode(), MonitorModel::Mode::Browse);

    press(model, 'j');
    press(model, 'd');
    QCOMPARE(model.confirmKind(), MonitorModel::ConfirmKind::Detach);
    const Action action = press(model, 'Y');
    QCOMPARE(action.kind, Action::Detach);
    QCOMPARE(action.sessionId, QStringLiteral("att"));
}

void MonitorModelTest::testQuitKeys()
{
    MonitorModel model;
    model.setRecords(threeSessions());
    QCOMPARE(press(model, 'q').kind, Action::Quit);
    QCOMPARE(press(model, Key::Interrupt).kind, Action::Quit);
    QCOMPARE(press(model, Key::Escape).kind, Action::Quit);
}

void MonitorModelTest::testEscapeInBrowseClearsSearchFirst()
{
    MonitorModel model;
    model.setRecords(threeSessions());
    press(model, '/');
    type(model, QStringLiteral("api"));
    press(model, Key::Enter);

    QCOMPARE(press(model, Key::Escape).kind, Action::None);
    QVERIFY(model.search().isEmpty());
    QCOMPARE(press(model, Key::Escape).kind, Action::Quit);
}

void MonitorModelTest::testHelpClosesOnAnyKey()
{
    MonitorModel model;
    model.setRecords(threeSessions());

    press(model, '?');
    QCOMPARE(model.mode(), MonitorModel::Mode::Help);
    QCOMPARE(press(model, 'q').kind, Action::None);
    QCOMPARE(model.mode(), MonitorModel::Mode::Browse);

    press(model, 'h');
    QCOMPARE(model.mode(), MonitorModel::Mode::Help);
}

void MonitorModelTest::testSimpleActions()
{
    MonitorModel model;
    model.setRecords({});
    QCOMPARE(press(model, 'r').kind, Action::Refresh);
    QCOMPARE(press(model, 'n').kind, Action::CreateNew);
    QVERIFY(Action{Action::CreateNew, QString(), false}.endsMonitor());

    // Nothing selected: Enter and kill do nothing
    QCOMPARE(press(model, Key::Enter).kind, Action::None);
    press(model, 'x');
    QCOMPARE(model.mode(), MonitorModel::Mode::Browse);
}

void MonitorModelTest::testUpdateRecordRespectsFilter()
{
    MonitorModel model;
    model.setRecords(threeSessions());

    SessionRecord changed = makeRecord(QStringLiteral("aaa"), SessionStatus::Exited, QStringLiteral("/home/u/web"), 0, false);
    model.updateRecord(changed);
    QCOMPARE(visibleIds(model), QStringList({QStringLiteral("bbb"), QStringLiteral("ccc")}));
    QVERIFY(model.hasRecord(QStringLiteral("aaa")));

    model.updateRecord(makeRecord(QStringLiteral("eee"), SessionStatus::Running));
    QCOMPARE(model.visibleRecords().size(), 3);

    model.removeRecord(QStringLiteral("eee"));
    QVERIFY(!model.hasRecord(QStringLiteral("eee")));
}

void MonitorModelTest::testStateCarriesAcrossCycles()
{
    MonitorModel first;
    first.setRecords(threeSessions());
    press(first, '3');
    press(first, '/');
    type(first, QStringLiteral("home"));
    press(first, Key::Enter);
    press(first, 'j');
    const QString selected = first.selectedRecord()->id;

    WatchState state = first.state();
    QCOMPARE(state.selectedId, selected);

    MonitorModel second(state);
    second.setRecords(threeSessions());
    QVERIFY(second.sort() == first.sort());
    QCOMPARE(second.search(), QStringLiteral("home"));
    QCOMPARE(second.selectedRecord()->id, selected);
}

QTEST_GUILESS_MAIN(MonitorModelTest)

#include "moc_MonitorModelTest.cpp"
