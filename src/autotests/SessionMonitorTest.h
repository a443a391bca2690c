/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONMONITORTEST_H
#define SESSIONMONITORTEST_H

#include <QObject>

namespace Claudemux
{

class SessionMonitorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testBeginLoadsStoreWithoutPersisting();
    void testRecordChangedReloadsOneRow();
    void testRecordRemovedDropsRow();
    void testRecordChangedForMissingFileDropsRow();
    void testRefreshPersistsExited();
    void testTerminateEndsDispatch();
};

}

#endif // SESSIONMONITORTEST_H
