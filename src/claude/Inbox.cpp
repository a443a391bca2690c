/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Inbox.h"

#include "ClaudemuxDebug.h"

#include <QAtomicInt>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileSystemWatcher>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QTimer>

#include <chrono>

namespace Claudemux
{

namespace
{
// Orders messages posted by the same process within one clock tick
QAtomicInt s_sequence;

// Fallback for file systems without change notifications
constexpr int PollIntervalMs = 1000;
}

Inbox::Inbox(const QString &rootDirectory)
    : m_rootDirectory(rootDirectory)
{
}

QString Inbox::inboxDirectory(const QString &sessionId) const
{
    return m_rootDirectory + QLatin1Char('/') + sessionId + QStringLiteral("/inbox");
}

bool Inbox::post(const QString &sessionId, const QString &type, const QJsonValue &payload, QString *errorString) const
{
    const QString dir = inboxDirectory(sessionId);
    if (!QDir().mkpath(dir)) {
        if (errorString) {
            *errorString = QStringLiteral("cannot create inbox directory %1").arg(dir);
        }
        return false;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    QJsonObject obj;
    obj[QStringLiteral("type")] = type;
    if (!payload.isUndefined() && !payload.isNull()) {
        obj[QStringLiteral("payload")] = payload;
    }
    obj[QStringLiteral("created")] = now.toString(Qt::ISODateWithMs);

    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    const QString fileName = QStringLiteral("%1-%2-%3.msg")
                                 .arg(static_cast<qint64>(nanos), 20, 10, QLatin1Char('0'))
                                 .arg(QCoreApplication::applicationPid())
                                 .arg(s_sequence.fetchAndAddRelaxed(1), 6, 10, QLatin1Char('0'));

    // The temporary file does not end in .msg, so readers never see it half written
    QSaveFile file(dir + QLatin1Char('/') + fileName);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorString) {
            *errorString = file.errorString();
        }
        return false;
    }
    file.write(QJsonDocument(obj).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        if (errorString) {
            *errorString = file.errorString();
        }
        return false;
    }

    qCDebug(ClaudemuxInbox) << "Inbox: Posted" << type << "to" << sessionId;
    return true;
}

QList<InboxMessage> Inbox::takeAll(const QString &sessionId) const
{
    QList<InboxMessage> messages;

    QDir dir(inboxDirectory(sessionId));
    if (!dir.exists()) {
        return messages;
    }

    const QStringList files = dir.entryList({QStringLiteral("*.msg")}, QDir::Files, QDir::Name);
    for (const QString &name : files) {
        QFile file(dir.filePath(name));
        if (!file.open(QIODevice::ReadOnly)) {
            continue;
        }
        const QByteArray data = file.readAll();
        file.close();

        // Delete before delivering so a message is never handled twice
        if (!file.remove()) {
            qCWarning(ClaudemuxInbox) << "Inbox: Cannot remove" << file.fileName() << ":" << file.errorString();
            continue;
        }

        QJsonParseError error;
        const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
        if (error.error != QJsonParseError::NoError || !doc.isObject()) {
            qCWarning(ClaudemuxInbox) << "Inbox: Dropped invalid message" << name;
            continue;
        }

        const QJsonObject obj = doc.object();
        InboxMessage message;
        message.sessionId = sessionId;
        message.type = obj.value(QStringLiteral("type")).toString();
        message.payload = obj.value(QStringLiteral("payload"));
        message.created = QDateTime::fromString(obj.value(QStringLiteral("created")).toString(), Qt::ISODateWithMs);
        messages.append(message);
    }

    return messages;
}

int Inbox::pendingCount(const QString &sessionId) const
{
    return QDir(inboxDirectory(sessionId)).entryList({QStringLiteral("*.msg")}, QDir::Files).size();
}

bool Inbox::removeSession(const QString &sessionId) const
{
    QDir dir(m_rootDirectory + QLatin1Char('/') + sessionId);
    if (!dir.exists()) {
        return true;
    }
    return dir.removeRecursively();
}

InboxWatcher::InboxWatcher(const Inbox &inbox, const QString &sessionId, Handler handler, QObject *parent)
    : QObject(parent)
    , m_inbox(inbox)
    , m_sessionId(sessionId)
    , m_handler(std::move(handler))
{
}

InboxWatcher::~InboxWatcher()
{
    stop();
}

bool InboxWatcher::start(QString *errorString)
{
    if (m_running) {
        return true;
    }

    const QString dir = m_inbox.inboxDirectory(m_sessionId);
    if (!QDir().mkpath(dir)) {
        if (errorString) {
            *errorString = QStringLiteral("cannot create inbox directory %1").arg(dir);
        }
        return false;
    }

    m_watcher = new QFileSystemWatcher(this);
    if (!m_watcher->addPath(dir)) {
        qCDebug(ClaudemuxInbox) << "InboxWatcher: Cannot watch" << dir << "- polling only";
    }
    connect(m_watcher, &QFileSystemWatcher::directoryChanged, this, &InboxWatcher::processPending);

    m_pollTimer = new QTimer(this);
    m_pollTimer->setInterval(PollIntervalMs);
    connect(m_pollTimer, &QTimer::timeout, this, &InboxWatcher::processPending);
    m_pollTimer->start();

    m_running = true;
    qCDebug(ClaudemuxInbox) << "InboxWatcher: Watching" << dir;

    processPending();
    return true;
}

void InboxWatcher::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    delete m_pollTimer;
    m_pollTimer = nullptr;
    delete m_watcher;
    m_watcher = nullptr;

    qCDebug(ClaudemuxInbox) << "InboxWatcher: Stopped watching" << m_sessionId;
}

void InboxWatcher::processPending()
{
    if (!m_running) {
        return;
    }

    const QList<InboxMessage> messages = m_inbox.takeAll(m_sessionId);
    for (const InboxMessage &message : messages) {
        qCDebug(ClaudemuxInbox) << "InboxWatcher: Delivering" << message.type << "for" << m_sessionId;
        if (m_handler) {
            m_handler(message);
        }
    }
}

} // namespace Claudemux

#include "moc_Inbox.cpp"
