/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef MONITORMODELTEST_H
#define MONITORMODELTEST_H

#include <QObject>

namespace Claudemux
{

class MonitorModelTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Navigation
    void testCursorMovesAndClamps();
    void testCursorFollowsSessionAcrossRefresh();
    void testCursorClampedAfterRemoval();
    void testViewportKeepsCursorVisible();
    void testViewportHeightFor();

    // Sorting
    void testSortColumnCycles();
    void testStatusSortPutsAttentionFirst();
    void testFunctionKeysSort();

    // Search
    void testSearchFiltersRows();
    void testSearchEscapeClearsThenLeaves();
    void testSearchArrowLeavesAndMoves();
    void testSearchClearLine();

    // Filter menu
    void testFilterAllClearsOthers();
    void testFilterSpecificClearsAll();
    void testFilterNothingCheckedFallsBackToAll();
    void testFilterExitedIncludesExited();
    void testFilterMenuEscapeDiscards();

    // Actions and dialogs
    void testEnterAttachesDetachedSession();
    void testEnterFocusesAttachedSession();
    void testEnterWithoutTmuxShowsInfo();
    void testForceAttachNeedsConfirmation();
    void testKillConfirmation();
    void testDetachOnlyWhenAttached();
    void testQuitKeys();
    void testEscapeInBrowseClearsSearchFirst();
    void testHelpClosesOnAnyKey();
    void testSimpleActions();

    // Incremental updates and state
    void testUpdateRecordRespectsFilter();
    void testStateCarriesAcrossCycles();
};

}

#endif // MONITORMODELTEST_H
