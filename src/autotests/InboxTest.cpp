/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "InboxTest.h"

// Qt
#include <QDir>
#include <QFile>
#include <QJsonObject>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

// Claudemux
#include "../claude/Inbox.h"

using namespace Claudemux;

void InboxTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void InboxTest::testPostAndTake()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const Inbox inbox(dir.path());

    QJsonObject payload;
    payload[QStringLiteral("reason")] = QStringLiteral("attention");

    QString error;
    QVERIFY2(inbox.post(QStringLiteral("abc"), Inbox::focusType(), payload, &error), qPrintable(error));
    QCOMPARE(inbox.pendingCount(QStringLiteral("abc")), 1);
    QCOMPARE(inbox.pendingCount(QStringLiteral("other")), 0);

    const QList<InboxMessage> messages = inbox.takeAll(QStringLiteral("abc"));
    QCOMPARE(messages.size(), 1);
    QCOMPARE(messages.first().sessionId, QStringLiteral("abc"));
    QCOMPARE(messages.first().type, QStringLiteral("focus"));
    QCOMPARE(messages.first().payload.toObject().value(QStringLiteral("reason")).toString(), QStringLiteral("attention"));
    QVERIFY(messages.first().created.isValid());

    // Taking deletes
    QCOMPARE(inbox.pendingCount(QStringLiteral("abc")), 0);
    QVERIFY(inbox.takeAll(QStringLiteral("abc")).isEmpty());
}

void InboxTest::testOrdering()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const Inbox inbox(dir.path());

    QStringList posted;
    for (int i = 0; i < 20; ++i) {
        const QString type = QStringLiteral("m%1").arg(i);
        QVERIFY(inbox.post(QStringLiteral("abc"), type));
        posted.append(type);
    }

    QStringList received;
    const QList<InboxMessage> messages = inbox.takeAll(QStringLiteral("abc"));
    for (const InboxMessage &message : messages) {
        received.append(message.type);
    }
    QCOMPARE(received, posted);
}

void InboxTest::testInvalidEntriesDropped()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const Inbox inbox(dir.path());

    QVERIFY(inbox.post(QStringLiteral("abc"), QStringLiteral("first")));

    QFile broken(inbox.inboxDirectory(QStringLiteral("abc")) + QStringLiteral("/00000000000000000001-1-000000.msg"));
    QVERIFY(broken.open(QIODevice::WriteOnly));
    QVERIFY(broken.write("{not json") > 0);
    broken.close();

    const QList<InboxMessage> messages = inbox.takeAll(QStringLiteral("abc"));
    QCOMPARE(messages.size(), 1);
    QCOMPARE(messages.first().type, QStringLiteral("first"));
    QCOMPARE(inbox.pendingCount(QStringLiteral("abc")), 0);
}

void InboxTest::testRemoveSession()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const Inbox inbox(dir.path());

    QVERIFY(inbox.post(QStringLiteral("abc"), QStringLiteral("focus")));
    QVERIFY(inbox.removeSession(QStringLiteral("abc")));
    QVERIFY(!QDir(dir.filePath(QStringLiteral("abc"))).exists());

    // Nothing to remove is not an error
    QVERIFY(inbox.removeSession(QStringLiteral("never-existed")));
}

void InboxTest::testWatcherDeliversPending()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const Inbox inbox(dir.path());

    // Posted while nobody is attached
    QVERIFY(inbox.post(QStringLiteral("abc"), QStringLiteral("focus")));

    QStringList delivered;
    InboxWatcher watcher(inbox, QStringLiteral("abc"), [&delivered](const InboxMessage &message) {
        delivered.append(message.type);
    });
    QVERIFY(watcher.start());
    QVERIFY(watcher.isRunning());
    QCOMPARE(delivered, QStringList{QStringLiteral("focus")});
}

void InboxTest::testWatcherDeliversLivePosts()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const Inbox inbox(dir.path());

    QStringList delivered;
    InboxWatcher watcher(inbox, QStringLiteral("abc"), [&delivered](const InboxMessage &message) {
        delivered.append(message.type);
    });
    QVERIFY(watcher.start());
    QVERIFY(delivered.isEmpty());

    QVERIFY(inbox.post(QStringLiteral("abc"), QStringLiteral("one")));
    QVERIFY(inbox.post(QStringLiteral("abc"), QStringLiteral("two")));

    // Directory notification or the poll timer, whichever comes first
    QTRY_COMPARE_WITH_TIMEOUT(delivered.size(), 2, 5000);
    QCOMPARE(delivered, (QStringList{QStringLiteral("one"), QStringLiteral("two")}));
}

void InboxTest::testStoppedWatcherDeliversNothing()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const Inbox inbox(dir.path());

    int deliveries = 0;
    InboxWatcher watcher(inbox, QStringLiteral("abc"), [&deliveries](const InboxMessage &) {
        ++deliveries;
    });
    QVERIFY(watcher.start());
    watcher.stop();
    QVERIFY(!watcher.isRunning());

    QVERIFY(inbox.post(QStringLiteral("abc"), QStringLiteral("focus")));
    watcher.processPending();
    QTest::qWait(1500);

    QCOMPARE(deliveries, 0);
    QCOMPARE(inbox.pendingCount(QStringLiteral("abc")), 1);
}

QTEST_GUILESS_MAIN(InboxTest)

#include "moc_InboxTest.cpp"
