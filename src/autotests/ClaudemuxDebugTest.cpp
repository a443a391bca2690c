/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ClaudemuxDebugTest.h"

// Qt
#include <QFile>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

// Claudemux
#include "../claude/ClaudemuxDebug.h"

using namespace Claudemux;

namespace
{
QStringList s_captured;

void captureHandler(QtMsgType, const QMessageLogContext &, const QString &message)
{
    s_captured.append(message);
}

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}
}

void ClaudemuxDebugTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void ClaudemuxDebugTest::testRedirectWritesToFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString logPath = dir.path() + QStringLiteral("/logs/monitor.log");

    {
        const LogFileRedirect redirect(logPath);
        QCOMPARE(redirect.path(), logPath);
        qCWarning(ClaudemuxTmux) << "tmux went away";
        qCInfo(ClaudemuxLifecycle) << "Removed session demo";
    }

    const QByteArray contents = readFile(logPath);
    QVERIFY(contents.contains("tmux went away"));
    QVERIFY(contents.contains("Removed session demo"));
}

void ClaudemuxDebugTest::testRedirectRestoresPreviousHandler()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString logPath = dir.path() + QStringLiteral("/monitor.log");

    s_captured.clear();
    const QtMessageHandler original = qInstallMessageHandler(captureHandler);

    {
        const LogFileRedirect redirect(logPath);
        qCWarning(ClaudemuxStore) << "while the screen is up";
    }
    qCWarning(ClaudemuxStore) << "after the screen is gone";

    qInstallMessageHandler(original);

    QCOMPARE(s_captured.size(), 1);
    QVERIFY(s_captured.first().contains(QLatin1String("after the screen is gone")));

    const QByteArray contents = readFile(logPath);
    QVERIFY(contents.contains("while the screen is up"));
    QVERIFY(!contents.contains("after the screen is gone"));
}

void ClaudemuxDebugTest::testRedirectWithoutFileDropsOutput()
{
    s_captured.clear();
    const QtMessageHandler original = qInstallMessageHandler(captureHandler);

    {
        const LogFileRedirect redirect(QString());
        QVERIFY(redirect.path().isEmpty());
        qCWarning(ClaudemuxMonitor) << "nobody hears this";
    }

    qInstallMessageHandler(original);
    QVERIFY(s_captured.isEmpty());
}

QTEST_GUILESS_MAIN(ClaudemuxDebugTest)

#include "moc_ClaudemuxDebugTest.cpp"
