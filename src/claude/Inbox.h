/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INBOX_H
#define INBOX_H

#include <QDateTime>
#include <QJsonValue>
#include <QList>
#include <QObject>
#include <QString>

#include <functional>

class QFileSystemWatcher;
class QTimer;

namespace Claudemux
{

/**
 * A message posted to a session's inbox
 */
struct InboxMessage {
    QString sessionId;
    QString type;
    QJsonValue payload;
    QDateTime created;
};

/**
 * Inbox is a per-session message queue backed by files.
 *
 * Any process may post. Each message is one file under
 * <root>/<session-id>/inbox/ whose name starts with a zero-padded
 * nanosecond timestamp, so sorting by name gives post order.
 */
class Inbox
{
public:
    /** Ask the attached terminal to raise its window */
    static QString focusType()
    {
        return QStringLiteral("focus");
    }

    /**
     * @param rootDirectory Directory holding one folder per session,
     *                      normally the session store directory
     */
    explicit Inbox(const QString &rootDirectory);

    QString inboxDirectory(const QString &sessionId) const;

    /**
     * Append a message. Never waits for a consumer.
     */
    bool post(const QString &sessionId, const QString &type, const QJsonValue &payload = QJsonValue(), QString *errorString = nullptr) const;

    /**
     * Read and delete every pending message, oldest first.
     * Unparsable entries are deleted and skipped.
     */
    QList<InboxMessage> takeAll(const QString &sessionId) const;

    /**
     * Number of pending message files
     */
    int pendingCount(const QString &sessionId) const;

    /**
     * Delete the session's folder including undelivered messages
     */
    bool removeSession(const QString &sessionId) const;

private:
    QString m_rootDirectory;
};

/**
 * InboxWatcher delivers inbox messages to a handler while it is running.
 *
 * Messages already waiting when start() is called are delivered first.
 * The watcher stops when stop() is called or when it is destroyed, so
 * scoping it to an attach guarantees it never outlives the attach.
 */
class InboxWatcher : public QObject
{
    Q_OBJECT

public:
    using Handler = std::function<void(const InboxMessage &)>;

    InboxWatcher(const Inbox &inbox, const QString &sessionId, Handler handler, QObject *parent = nullptr);
    ~InboxWatcher() override;

    bool start(QString *errorString = nullptr);
    void stop();

    bool isRunning() const
    {
        return m_running;
    }

    /**
     * Deliver whatever is pending right now
     */
    void processPending();

private:
    Inbox m_inbox;
    QString m_sessionId;
    Handler m_handler;
    QFileSystemWatcher *m_watcher = nullptr;
    QTimer *m_pollTimer = nullptr;
    bool m_running = false;
};

} // namespace Claudemux

#endif // INBOX_H
