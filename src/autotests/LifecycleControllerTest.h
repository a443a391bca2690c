/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LIFECYCLECONTROLLERTEST_H
#define LIFECYCLECONTROLLERTEST_H

#include <QObject>

namespace Claudemux
{

class LifecycleControllerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Helpers
    void testParseDuration();
    void testFormatAge();
    void testDeriveSessionId();

    // Store-only operations
    void testResolveAmbiguous();
    void testReconcilePersistsExit();
    void testPruneByAge();
    void testPruneAll();
    void testPruneDryRun();
    void testKillWithoutTmux();
    void testKillIdleOnly();
    void testKillManyAborted();
    void testPostMessage();
    void testAttachWithoutTmuxSession();

    // Real tmux
    void testSessionLifecycle();
    void testCreateRejectsDuplicate();
    void testCreateMissingDirectory();
};

}

#endif // LIFECYCLECONTROLLERTEST_H
