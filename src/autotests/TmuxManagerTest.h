/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXMANAGERTEST_H
#define TMUXMANAGERTEST_H

#include <QObject>

namespace Claudemux
{

class TmuxManagerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Static utility tests
    void testBuildSessionName();
    void testBuildSessionNameSanitizesChars();
    void testAttachArguments();
    void testAttachArgumentsForce();
    void testParseSessionList();
    void testParseSessionListNameWithColon();
    void testParseSessionListSkipsGarbage();

    // Availability tests
    void testIsAvailable();
    void testVersion();

    // Execution tests (require tmux)
    void testSessionExistsNonexistent();
    void testAttachedCountNonexistent();
    void testPanePidNonexistent();
    void testKillNonexistentSession();
    void testDetachClientsNonexistent();
    void testListSessionsAsync();
    void testSessionLifecycle();
};

}

#endif // TMUXMANAGERTEST_H
