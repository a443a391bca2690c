/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ProcessTableTest.h"

// Qt
#include <QCoreApplication>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <QTest>

// Claudemux
#include "../claude/ProcessTable.h"

#include <unistd.h>

using namespace Claudemux;

void ProcessTableTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void ProcessTableTest::testOwnProcessAlive()
{
    QVERIFY(ProcessTable::isAlive(QCoreApplication::applicationPid()));
    QVERIFY(!ProcessTable::processName(QCoreApplication::applicationPid()).isEmpty());
}

void ProcessTableTest::testInvalidPids()
{
    QVERIFY(!ProcessTable::isAlive(0));
    QVERIFY(!ProcessTable::isAlive(-5));
    QCOMPARE(ProcessTable::parentPid(0), qint64(0));
    QVERIFY(ProcessTable::processName(0).isEmpty());
    QCOMPARE(ProcessTable::findAncestor(0, {QStringLiteral("init")}), qint64(0));
}

void ProcessTableTest::testFinishedProcessNotAlive()
{
    QProcess process;
    process.start(QStringLiteral("true"), QStringList());
    if (!process.waitForStarted(5000)) {
        QSKIP("cannot start 'true'");
    }
    const qint64 pid = process.processId();
    QVERIFY(process.waitForFinished(5000));

    // Reaped by QProcess, so the pid is free unless reused
    QTRY_VERIFY_WITH_TIMEOUT(!ProcessTable::isAlive(pid) || ProcessTable::processName(pid) != QLatin1String("true"), 5000);
}

void ProcessTableTest::testParentPid()
{
    QCOMPARE(ProcessTable::parentPid(QCoreApplication::applicationPid()), static_cast<qint64>(getppid()));
}

void ProcessTableTest::testFindAncestor()
{
    const qint64 self = QCoreApplication::applicationPid();
    const QString ownName = ProcessTable::processName(self);
    QVERIFY(!ownName.isEmpty());

    QCOMPARE(ProcessTable::findAncestor(self, {ownName}), self);
    QCOMPARE(ProcessTable::findAncestor(self, {QStringLiteral("no-such-process-name")}), qint64(0));

    const QString parentName = ProcessTable::processName(getppid());
    if (!parentName.isEmpty() && parentName != ownName) {
        QCOMPARE(ProcessTable::findAncestor(self, {parentName}), static_cast<qint64>(getppid()));
    }
}

QTEST_GUILESS_MAIN(ProcessTableTest)

#include "moc_ProcessTableTest.cpp"
