/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionRecord.h"

namespace Claudemux
{

QString statusToString(SessionStatus status)
{
    switch (status) {
    case SessionStatus::Running:
        return QStringLiteral("running");
    case SessionStatus::Working:
        return QStringLiteral("working");
    case SessionStatus::Idle:
        return QStringLiteral("idle");
    case SessionStatus::AwaitingPermission:
        return QStringLiteral("awaiting_permission");
    case SessionStatus::AwaitingInput:
        return QStringLiteral("awaiting_input");
    case SessionStatus::Exited:
        return QStringLiteral("exited");
    }
    return QStringLiteral("running");
}

bool statusFromString(const QString &text, SessionStatus *status)
{
    SessionStatus parsed;
    if (text == QLatin1String("running")) {
        parsed = SessionStatus::Running;
    } else if (text == QLatin1String("working")) {
        parsed = SessionStatus::Working;
    } else if (text == QLatin1String("idle")) {
        parsed = SessionStatus::Idle;
    } else if (text == QLatin1String("awaiting_permission") || text == QLatin1String("waiting_permission")) {
        parsed = SessionStatus::AwaitingPermission;
    } else if (text == QLatin1String("awaiting_input") || text == QLatin1String("waiting_input")) {
        parsed = SessionStatus::AwaitingInput;
    } else if (text == QLatin1String("exited")) {
        parsed = SessionStatus::Exited;
    } else {
        return false;
    }

    if (status) {
        *status = parsed;
    }
    return true;
}

QString statusDisplayName(SessionStatus status)
{
    switch (status) {
    case SessionStatus::Running:
        return QStringLiteral("Running");
    case SessionStatus::Working:
        return QStringLiteral("Working");
    case SessionStatus::Idle:
        return QStringLiteral("Idle");
    case SessionStatus::AwaitingPermission:
        return QStringLiteral("Permission");
    case SessionStatus::AwaitingInput:
        return QStringLiteral("Input");
    case SessionStatus::Exited:
        return QStringLiteral("Exited");
    }
    return QString();
}

int statusPriority(SessionStatus status)
{
    switch (status) {
    case SessionStatus::AwaitingPermission:
    case SessionStatus::AwaitingInput:
        return 0;
    case SessionStatus::Idle:
        return 1;
    case SessionStatus::Working:
    case SessionStatus::Running:
        return 2;
    case SessionStatus::Exited:
        return 3;
    }
    return 0;
}

bool statusNeedsAttention(SessionStatus status)
{
    return status == SessionStatus::AwaitingPermission || status == SessionStatus::AwaitingInput;
}

QJsonObject SessionRecord::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    if (!tmuxSession.isEmpty()) {
        obj[QStringLiteral("tmuxSession")] = tmuxSession;
    }
    obj[QStringLiteral("pid")] = pid;
    obj[QStringLiteral("cwd")] = workingDirectory;
    if (!conversationId.isEmpty()) {
        obj[QStringLiteral("conversationId")] = conversationId;
    }
    obj[QStringLiteral("status")] = statusToString(status);
    if (!statusDetail.isEmpty()) {
        obj[QStringLiteral("statusDetail")] = statusDetail;
    }
    obj[QStringLiteral("created")] = created.toUTC().toString(Qt::ISODateWithMs);
    obj[QStringLiteral("updated")] = updated.toUTC().toString(Qt::ISODateWithMs);
    if (autoRegistered) {
        obj[QStringLiteral("autoRegistered")] = true;
    }
    return obj;
}

SessionRecord SessionRecord::fromJson(const QJsonObject &obj)
{
    SessionRecord record;
    record.id = obj.value(QStringLiteral("id")).toString();
    record.tmuxSession = obj.value(QStringLiteral("tmuxSession")).toString();
    record.pid = obj.value(QStringLiteral("pid")).toInteger();
    record.workingDirectory = obj.value(QStringLiteral("cwd")).toString();
    record.conversationId = obj.value(QStringLiteral("conversationId")).toString();
    // Unknown status strings keep the default (Running) so the reconciler decides
    statusFromString(obj.value(QStringLiteral("status")).toString(), &record.status);
    record.statusDetail = obj.value(QStringLiteral("statusDetail")).toString();
    record.created = QDateTime::fromString(obj.value(QStringLiteral("created")).toString(), Qt::ISODateWithMs);
    record.updated = QDateTime::fromString(obj.value(QStringLiteral("updated")).toString(), Qt::ISODateWithMs);
    record.autoRegistered = obj.value(QStringLiteral("autoRegistered")).toBool();
    return record;
}

bool SessionRecord::operator==(const SessionRecord &other) const
{
    return id == other.id && tmuxSession == other.tmuxSession && pid == other.pid && workingDirectory == other.workingDirectory
        && conversationId == other.conversationId && status == other.status && statusDetail == other.statusDetail && created == other.created
        && updated == other.updated && autoRegistered == other.autoRegistered;
}

} // namespace Claudemux
