/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONCOMMANDSTEST_H
#define SESSIONCOMMANDSTEST_H

#include <QObject>

namespace Claudemux
{

class SessionCommandsTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testFormatTable();
    void testFormatTableShortensDirectory();
    void testUnknownCommand();
    void testHelpAndVersion();
    void testArgumentErrors();
    void testKillSelectors();
    void testPruneDryRunKeepsRecords();
    void testPruneRemovesExited();
    void testPruneOnQuit();
    void testMessage();
    void testListEmptyStore();
};

}

#endif // SESSIONCOMMANDSTEST_H
