/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOOKEVENT_H
#define HOOKEVENT_H

#include <QByteArray>
#include <QString>

namespace Claudemux
{

/**
 * HookEvent is one lifecycle event reported by a Claude Code hook.
 *
 * Claude Code pipes a single JSON object to the hook command's stdin.
 * Its "session_id" field is the conversation id; claudemux keeps its own
 * session ids.
 */
struct HookEvent {
    enum class Kind {
        Unknown,
        SessionStart,
        UserPromptSubmit,
        PreToolUse,
        PostToolUse,
        PostToolUseFailure,
        SubagentStart,
        SubagentStop,
        Stop,
        PermissionRequest,
        Notification,
    };

    QString conversationId;
    QString transcriptPath;
    QString workingDirectory;
    QString permissionMode;
    QString eventName;
    QString notificationType;
    QString message;
    QString prompt;
    bool stopHookActive = false;
    QString toolName;
    QString agentType;
    QString agentId;

    Kind kind() const;

    /**
     * Empty input is a valid event that nothing reacts to
     */
    bool isEmpty() const
    {
        return eventName.isEmpty();
    }

    /**
     * Parse hook input. Empty or blank input yields an empty event.
     * Returns false if the input is not a JSON object.
     */
    static bool parse(const QByteArray &data, HookEvent *event, QString *errorString = nullptr);

    static Kind kindFromName(const QString &eventName);
};

} // namespace Claudemux

#endif // HOOKEVENT_H
