/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ConversationIndex.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QRegularExpression>

namespace Claudemux
{

QString ConversationEntry::displayTitle() const
{
    if (!customTitle.isEmpty()) {
        return customTitle;
    }
    if (!summary.isEmpty()) {
        return summary;
    }
    return firstPrompt;
}

ConversationIndex::ConversationIndex(const QString &projectsRoot)
    : m_projectsRoot(projectsRoot.isEmpty() ? QDir::homePath() + QStringLiteral("/.claude/projects") : projectsRoot)
{
}

QString ConversationIndex::projectDirectoryName(const QString &workingDirectory)
{
    QString hashedName = QDir::cleanPath(QDir(workingDirectory).absolutePath());
    hashedName.replace(QLatin1Char('/'), QLatin1Char('-'));
    hashedName.replace(QLatin1Char('.'), QLatin1Char('-'));
    hashedName.remove(QLatin1Char(':'));
    return hashedName;
}

QString ConversationIndex::projectPath(const QString &workingDirectory) const
{
    return m_projectsRoot + QLatin1Char('/') + projectDirectoryName(workingDirectory);
}

bool ConversationIndex::find(const QString &conversationId, const QString &workingDirectory, ConversationEntry *entry) const
{
    if (conversationId.isEmpty() || workingDirectory.isEmpty()) {
        return false;
    }

    QFile file(projectPath(workingDirectory) + QStringLiteral("/sessions-index.json"));
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    const QJsonArray entries = doc.object().value(QStringLiteral("entries")).toArray();

    auto toEntry = [](const QJsonObject &obj) {
        ConversationEntry result;
        result.conversationId = obj.value(QStringLiteral("sessionId")).toString();
        result.firstPrompt = obj.value(QStringLiteral("firstPrompt")).toString();
        result.summary = obj.value(QStringLiteral("summary")).toString();
        result.customTitle = obj.value(QStringLiteral("customTitle")).toString();
        return result;
    };

    QList<QJsonObject> prefixMatches;
    for (const QJsonValue &value : entries) {
        const QJsonObject obj = value.toObject();
        const QString id = obj.value(QStringLiteral("sessionId")).toString();
        if (id == conversationId) {
            if (entry) {
                *entry = toEntry(obj);
            }
            return true;
        }
        if (id.startsWith(conversationId)) {
            prefixMatches.append(obj);
        }
    }

    if (prefixMatches.size() != 1) {
        return false;
    }
    if (entry) {
        *entry = toEntry(prefixMatches.first());
    }
    return true;
}

QString ConversationIndex::titleAndPrompt(const QString &conversationId, const QString &workingDirectory) const
{
    if (conversationId.isEmpty() || workingDirectory.isEmpty()) {
        return QString();
    }

    ConversationEntry entry;
    if (find(conversationId, workingDirectory, &entry)) {
        const QString title = !entry.customTitle.isEmpty() ? entry.customTitle : entry.summary;
        return formatTitleAndPrompt(title, entry.firstPrompt);
    }

    return cleanTitle(firstPromptFromTranscript(conversationId, workingDirectory));
}

QString ConversationIndex::cleanTitle(const QString &text)
{
    if (text.isEmpty()) {
        return QString();
    }

    // Remove XML-like tags (e.g., <command-name>...</command-name>)
    QString result;
    result.reserve(text.size());
    bool inTag = false;
    for (const QChar c : text) {
        if (c == QLatin1Char('<')) {
            inTag = true;
        } else if (c == QLatin1Char('>')) {
            inTag = false;
        } else if (!inTag) {
            result.append(c);
        }
    }

    result.replace(QStringLiteral("\r\n"), QStringLiteral(" ↵ "));
    result.replace(QLatin1Char('\n'), QStringLiteral(" ↵ "));
    result.replace(QLatin1Char('\r'), QStringLiteral(" ↵ "));

    static const QRegularExpression spaces(QStringLiteral(" {2,}"));
    result.replace(spaces, QStringLiteral(" "));
    return result.trimmed();
}

QString ConversationIndex::formatTitleAndPrompt(const QString &title, const QString &prompt)
{
    const QString cleanedTitle = cleanTitle(title);
    const QString cleanedPrompt = cleanTitle(prompt);

    if (!cleanedTitle.isEmpty() && !cleanedPrompt.isEmpty()) {
        return QStringLiteral("[%1]: %2").arg(cleanedTitle, cleanedPrompt);
    }
    return cleanedTitle.isEmpty() ? cleanedPrompt : cleanedTitle;
}

QString ConversationIndex::firstPromptFromTranscript(const QString &conversationId, const QString &workingDirectory) const
{
    QFile file(projectPath(workingDirectory) + QLatin1Char('/') + conversationId + QStringLiteral(".jsonl"));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString();
    }

    while (!file.atEnd()) {
        const QJsonObject obj = QJsonDocument::fromJson(file.readLine()).object();
        if (obj.isEmpty()) {
            continue;
        }

        const QString summary = obj.value(QStringLiteral("summary")).toString();
        if (!summary.isEmpty()) {
            return summary;
        }

        const QJsonObject message = obj.value(QStringLiteral("message")).toObject();
        if (obj.value(QStringLiteral("type")).toString() != QLatin1String("user") || message.value(QStringLiteral("role")).toString() != QLatin1String("user")) {
            continue;
        }

        const QJsonValue content = message.value(QStringLiteral("content"));
        if (content.isString()) {
            return content.toString();
        }
        const QJsonArray blocks = content.toArray();
        for (const QJsonValue &block : blocks) {
            const QJsonObject blockObj = block.toObject();
            if (blockObj.value(QStringLiteral("type")).toString() == QLatin1String("text")) {
                return blockObj.value(QStringLiteral("text")).toString();
            }
        }
        return QString();
    }
    return QString();
}

} // namespace Claudemux
