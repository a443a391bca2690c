/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROCESSTABLETEST_H
#define PROCESSTABLETEST_H

#include <QObject>

namespace Claudemux
{

class ProcessTableTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testOwnProcessAlive();
    void testInvalidPids();
    void testFinishedProcessNotAlive();
    void testParentPid();
    void testFindAncestor();
};

}

#endif // PROCESSTABLETEST_H
