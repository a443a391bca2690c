/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    Based on Bobcat's SessionManager by İsmail Yılmaz
*/

#ifndef TMUXMANAGER_H
#define TMUXMANAGER_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <functional>

namespace Claudemux
{

/**
 * TmuxManager wraps the tmux binary.
 *
 * Each managed session runs inside a detached tmux session so it survives
 * the terminal that started it and can be reattached later.
 */
class TmuxManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Information about a tmux session
     */
    struct SessionInfo {
        QString name;       // Session name (e.g., "claudemux-a1b2c3d4")
        int attached = 0;   // Number of attached clients
        int windows = 0;    // Number of windows in session
        qint64 created = 0; // Creation time, seconds since epoch
    };

    explicit TmuxManager(QObject *parent = nullptr);
    ~TmuxManager() override;

    /**
     * Check if tmux is available on the system
     */
    static bool isAvailable();

    /**
     * Get tmux version string
     */
    static QString version();

    /**
     * Build a tmux session name from a prefix and a session id.
     * Characters tmux treats specially ('.' and ':') are replaced.
     */
    static QString buildSessionName(const QString &prefix, const QString &sessionId);

    /**
     * Arguments for `tmux attach-session`. With @p detachOthers every
     * other client is detached first.
     */
    static QStringList attachArguments(const QString &sessionName, bool detachOthers);

    /**
     * Create a detached session running @p command in @p workingDir.
     * @p environment is set in the new session's environment.
     */
    bool newSession(const QString &sessionName,
                    const QString &workingDir,
                    const QStringList &command,
                    const QHash<QString, QString> &environment = {},
                    QString *errorString = nullptr);

    /**
     * List all tmux sessions. Returns an empty list if no server runs.
     */
    QList<SessionInfo> listSessions() const;

    /**
     * Asynchronous listSessions(). @p callback receives ok=false if
     * tmux could not be queried.
     */
    void listSessionsAsync(std::function<void(bool, const QList<SessionInfo> &)> callback);

    /**
     * Check if a session with the given name exists
     */
    bool sessionExists(const QString &sessionName) const;

    /**
     * Number of clients attached to the session, or -1 if the session
     * cannot be queried
     */
    int attachedCount(const QString &sessionName) const;

    /**
     * PID of the process in the first pane of the session, or 0
     */
    qint64 panePid(const QString &sessionName) const;

    /**
     * Name of the tmux session the calling process runs in. Empty when
     * not running inside tmux.
     */
    QString currentSessionName() const;

    /**
     * Kill a specific session
     */
    bool killSession(const QString &sessionName);

    /**
     * Detach every client attached to the session.
     * Returns the number of clients detached, or -1 on failure.
     */
    int detachClients(const QString &sessionName);

    /**
     * Parse `list-sessions -F` output produced with sessionListFormat()
     */
    static QList<SessionInfo> parseSessionList(const QString &output);

    static QString sessionListFormat();

Q_SIGNALS:
    /**
     * Emitted when an error occurs during tmux operations
     */
    void errorOccurred(const QString &message);

private:
    /**
     * Execute a tmux command and return the output
     */
    QString executeCommand(const QStringList &args, bool *ok = nullptr) const;

    /**
     * Execute a tmux command without blocking; @p callback runs on completion
     */
    void executeCommandAsync(const QStringList &args, std::function<void(bool, const QString &)> callback);
};

} // namespace Claudemux

#endif // TMUXMANAGER_H
