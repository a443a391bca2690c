/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ConversationIndexTest.h"

// Qt
#include <QDir>
#include <QFile>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

// Claudemux
#include "../claude/ConversationIndex.h"

using namespace Claudemux;

namespace
{
const QString kProject = QStringLiteral("/home/user/my.project");

bool writeProjectFile(const ConversationIndex &index, const QString &name, const QByteArray &data)
{
    const QString dir = index.projectPath(kProject);
    if (!QDir().mkpath(dir)) {
        return false;
    }
    QFile file(dir + QLatin1Char('/') + name);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(data) == data.size();
}

const QByteArray kIndex = R"({
    "version": 1,
    "entries": [
        {"sessionId": "11111111-aaaa", "firstPrompt": "fix the build", "summary": "Build repair"},
        {"sessionId": "22222222-bbbb", "firstPrompt": "write docs", "summary": "Docs", "customTitle": "My docs"},
        {"sessionId": "22222222-cccc", "firstPrompt": "other"}
    ]
})";
}

void ConversationIndexTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void ConversationIndexTest::testProjectDirectoryName()
{
    QCOMPARE(ConversationIndex::projectDirectoryName(QStringLiteral("/home/user/my.project")), QStringLiteral("-home-user-my-project"));
    QCOMPARE(ConversationIndex::projectDirectoryName(QStringLiteral("/home/user/app/")), QStringLiteral("-home-user-app"));
}

void ConversationIndexTest::testCleanTitle()
{
    QCOMPARE(ConversationIndex::cleanTitle(QStringLiteral("<command-name>/review</command-name>  the   diff")), QStringLiteral("/review the diff"));
    QCOMPARE(ConversationIndex::cleanTitle(QStringLiteral("line one\nline two")), QStringLiteral("line one ↵ line two"));
    QVERIFY(ConversationIndex::cleanTitle(QString()).isEmpty());
}

void ConversationIndexTest::testFormatTitleAndPrompt()
{
    QCOMPARE(ConversationIndex::formatTitleAndPrompt(QStringLiteral("Title"), QStringLiteral("prompt")), QStringLiteral("[Title]: prompt"));
    QCOMPARE(ConversationIndex::formatTitleAndPrompt(QString(), QStringLiteral("prompt")), QStringLiteral("prompt"));
    QCOMPARE(ConversationIndex::formatTitleAndPrompt(QStringLiteral("Title"), QString()), QStringLiteral("Title"));
}

void ConversationIndexTest::testFindInIndex()
{
    QTemporaryDir root;
    QVERIFY(root.isValid());
    const ConversationIndex index(root.path());
    QVERIFY(writeProjectFile(index, QStringLiteral("sessions-index.json"), kIndex));

    ConversationEntry entry;
    QVERIFY(index.find(QStringLiteral("22222222-bbbb"), kProject, &entry));
    QCOMPARE(entry.customTitle, QStringLiteral("My docs"));
    QCOMPARE(entry.displayTitle(), QStringLiteral("My docs"));

    QVERIFY(index.find(QStringLiteral("11111111-aaaa"), kProject, &entry));
    QCOMPARE(entry.displayTitle(), QStringLiteral("Build repair"));

    QVERIFY(!index.find(QStringLiteral("33333333"), kProject, &entry));
}

void ConversationIndexTest::testFindByPrefix()
{
    QTemporaryDir root;
    QVERIFY(root.isValid());
    const ConversationIndex index(root.path());
    QVERIFY(writeProjectFile(index, QStringLiteral("sessions-index.json"), kIndex));

    ConversationEntry entry;
    QVERIFY(index.find(QStringLiteral("1111"), kProject, &entry));
    QCOMPARE(entry.conversationId, QStringLiteral("11111111-aaaa"));

    // Two entries share the prefix
    QVERIFY(!index.find(QStringLiteral("2222"), kProject, &entry));
}

void ConversationIndexTest::testTitleFromIndex()
{
    QTemporaryDir root;
    QVERIFY(root.isValid());
    const ConversationIndex index(root.path());
    QVERIFY(writeProjectFile(index, QStringLiteral("sessions-index.json"), kIndex));

    QCOMPARE(index.titleAndPrompt(QStringLiteral("22222222-bbbb"), kProject), QStringLiteral("[My docs]: write docs"));
    QCOMPARE(index.titleAndPrompt(QStringLiteral("22222222-cccc"), kProject), QStringLiteral("other"));
}

void ConversationIndexTest::testTitleFromTranscript()
{
    QTemporaryDir root;
    QVERIFY(root.isValid());
    const ConversationIndex index(root.path());

    const QByteArray transcript =
        "{\"type\": \"system\", \"message\": {\"role\": \"system\", \"content\": \"ignored\"}}\n"
        "not json\n"
        "{\"type\": \"user\", \"message\": {\"role\": \"user\", \"content\": [{\"type\": \"image\"}, {\"type\": \"text\", \"text\": \"refactor <b>parser</b>\"}]}}\n";
    QVERIFY(writeProjectFile(index, QStringLiteral("44444444-dddd.jsonl"), transcript));

    QCOMPARE(index.titleAndPrompt(QStringLiteral("44444444-dddd"), kProject), QStringLiteral("refactor parser"));
}

void ConversationIndexTest::testMissingProject()
{
    QTemporaryDir root;
    QVERIFY(root.isValid());
    const ConversationIndex index(root.path());

    QVERIFY(index.titleAndPrompt(QStringLiteral("11111111-aaaa"), kProject).isEmpty());
    QVERIFY(index.titleAndPrompt(QString(), kProject).isEmpty());
    QVERIFY(!index.find(QStringLiteral("11111111-aaaa"), QString(), nullptr));
}

QTEST_GUILESS_MAIN(ConversationIndexTest)

#include "moc_ConversationIndexTest.cpp"
