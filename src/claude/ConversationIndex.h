/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CONVERSATIONINDEX_H
#define CONVERSATIONINDEX_H

#include <QString>

namespace Claudemux
{

/**
 * A Claude CLI conversation entry from sessions-index.json
 */
struct ConversationEntry {
    QString conversationId;
    QString firstPrompt;
    QString summary;
    QString customTitle;

    /**
     * customTitle, then summary, then first prompt
     */
    QString displayTitle() const;
};

/**
 * ConversationIndex looks up human-readable conversation titles in the
 * Claude CLI project directories (~/.claude/projects).
 */
class ConversationIndex
{
public:
    /**
     * @param projectsRoot Directory holding one folder per project;
     *                     defaults to ~/.claude/projects
     */
    explicit ConversationIndex(const QString &projectsRoot = QString());

    /**
     * Claude's directory name for a project path: '/' and '.' become '-'
     */
    static QString projectDirectoryName(const QString &workingDirectory);

    /**
     * Full path of the project directory for @p workingDirectory
     */
    QString projectPath(const QString &workingDirectory) const;

    /**
     * Find an entry by exact conversation id, falling back to a unique
     * prefix. Returns false if nothing matches.
     */
    bool find(const QString &conversationId, const QString &workingDirectory, ConversationEntry *entry) const;

    /**
     * Title for notifications: "[title]: prompt", or whichever of the two
     * exists. Falls back to the first user prompt of the transcript for
     * conversations the index does not know yet.
     */
    QString titleAndPrompt(const QString &conversationId, const QString &workingDirectory) const;

    /**
     * Strip XML-like tags, show newlines as " ↵ " and collapse whitespace
     */
    static QString cleanTitle(const QString &text);

    static QString formatTitleAndPrompt(const QString &title, const QString &prompt);

private:
    QString firstPromptFromTranscript(const QString &conversationId, const QString &workingDirectory) const;

    QString m_projectsRoot;
};

} // namespace Claudemux

#endif // CONVERSATIONINDEX_H
