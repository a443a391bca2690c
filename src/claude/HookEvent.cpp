/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HookEvent.h"

#include <QHash>
#include <QJsonDocument>
#include <QJsonObject>

namespace Claudemux
{

HookEvent::Kind HookEvent::kindFromName(const QString &eventName)
{
    static const QHash<QString, Kind> kinds{
        {QStringLiteral("SessionStart"), Kind::SessionStart},
        {QStringLiteral("UserPromptSubmit"), Kind::UserPromptSubmit},
        {QStringLiteral("PreToolUse"), Kind::PreToolUse},
        {QStringLiteral("PostToolUse"), Kind::PostToolUse},
        {QStringLiteral("PostToolUseFailure"), Kind::PostToolUseFailure},
        {QStringLiteral("SubagentStart"), Kind::SubagentStart},
        {QStringLiteral("SubagentStop"), Kind::SubagentStop},
        {QStringLiteral("Stop"), Kind::Stop},
        {QStringLiteral("PermissionRequest"), Kind::PermissionRequest},
        {QStringLiteral("Notification"), Kind::Notification},
    };
    return kinds.value(eventName, Kind::Unknown);
}

HookEvent::Kind HookEvent::kind() const
{
    return kindFromName(eventName);
}

bool HookEvent::parse(const QByteArray &data, HookEvent *event, QString *errorString)
{
    HookEvent parsed;
    if (data.trimmed().isEmpty()) {
        if (event) {
            *event = parsed;
        }
        return true;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError) {
        if (errorString) {
            *errorString = QStringLiteral("failed to parse hook input: %1 at offset %2").arg(error.errorString()).arg(error.offset);
        }
        return false;
    }
    if (!doc.isObject()) {
        if (errorString) {
            *errorString = QStringLiteral("hook input is not a JSON object");
        }
        return false;
    }

    const QJsonObject obj = doc.object();
    parsed.conversationId = obj.value(QStringLiteral("session_id")).toString();
    parsed.transcriptPath = obj.value(QStringLiteral("transcript_path")).toString();
    parsed.workingDirectory = obj.value(QStringLiteral("cwd")).toString();
    parsed.permissionMode = obj.value(QStringLiteral("permission_mode")).toString();
    parsed.eventName = obj.value(QStringLiteral("hook_event_name")).toString();
    parsed.notificationType = obj.value(QStringLiteral("notification_type")).toString();
    parsed.message = obj.value(QStringLiteral("message")).toString();
    parsed.prompt = obj.value(QStringLiteral("prompt")).toString();
    parsed.stopHookActive = obj.value(QStringLiteral("stop_hook_active")).toBool();
    parsed.toolName = obj.value(QStringLiteral("tool_name")).toString();
    parsed.agentType = obj.value(QStringLiteral("agent_type")).toString();
    parsed.agentId = obj.value(QStringLiteral("agent_id")).toString();

    if (event) {
        *event = parsed;
    }
    return true;
}

} // namespace Claudemux
