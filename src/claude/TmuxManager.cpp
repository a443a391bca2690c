/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    Based on Bobcat's SessionManager by İsmail Yılmaz
*/

#include "TmuxManager.h"

#include "ClaudemuxDebug.h"

#include <QStandardPaths>

namespace Claudemux
{

namespace
{
// "=" forces an exact match instead of tmux's prefix matching
QString exactTarget(const QString &sessionName)
{
    return QLatin1Char('=') + sessionName;
}
}

TmuxManager::TmuxManager(QObject *parent)
    : QObject(parent)
{
}

TmuxManager::~TmuxManager() = default;

bool TmuxManager::isAvailable()
{
    const QString tmuxPath = QStandardPaths::findExecutable(QStringLiteral("tmux"));
    return !tmuxPath.isEmpty();
}

QString TmuxManager::version()
{
    QProcess process;
    process.start(QStringLiteral("tmux"), {QStringLiteral("-V")});
    if (!process.waitForFinished(5000)) {
        return QString();
    }
    return QString::fromUtf8(process.readAllStandardOutput()).trimmed();
}

QString TmuxManager::buildSessionName(const QString &prefix, const QString &sessionId)
{
    QString result = prefix + sessionId;

    // Sanitize session name: tmux doesn't allow certain characters
    result.replace(QLatin1Char('.'), QLatin1Char('-'));
    result.replace(QLatin1Char(':'), QLatin1Char('-'));

    return result;
}

QStringList TmuxManager::attachArguments(const QString &sessionName, bool detachOthers)
{
    // tmux attach-session [-d] -t <session-name>
    QStringList args{QStringLiteral("attach-session")};
    if (detachOthers) {
        args << QStringLiteral("-d");
    }
    args << QStringLiteral("-t") << exactTarget(sessionName);
    return args;
}

QString TmuxManager::sessionListFormat()
{
    return QStringLiteral("#{session_name}:#{session_windows}:#{session_created}:#{session_attached}");
}

bool TmuxManager::newSession(const QString &sessionName,
                             const QString &workingDir,
                             const QStringList &command,
                             const QHash<QString, QString> &environment,
                             QString *errorString)
{
    // tmux new-session -d -s <session-name> [-c <dir>] [-e K=V]... -- <command>
    QStringList args{QStringLiteral("new-session"), QStringLiteral("-d"), QStringLiteral("-s"), sessionName};

    if (!workingDir.isEmpty()) {
        args << QStringLiteral("-c") << workingDir;
    }

    for (auto it = environment.constBegin(); it != environment.constEnd(); ++it) {
        args << QStringLiteral("-e") << it.key() + QLatin1Char('=') + it.value();
    }

    if (!command.isEmpty()) {
        args << QStringLiteral("--");
        args << command;
    }

    QProcess process;
    process.start(QStringLiteral("tmux"), args);
    if (!process.waitForFinished(10000)) {
        if (errorString) {
            *errorString = process.error() == QProcess::FailedToStart ? QStringLiteral("tmux could not be started") : QStringLiteral("tmux timed out");
        }
        return false;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString errorOutput = QString::fromUtf8(process.readAllStandardError()).trimmed();
        qCWarning(ClaudemuxTmux) << "TmuxManager: new-session failed for" << sessionName << ":" << errorOutput;
        if (errorString) {
            *errorString = errorOutput.isEmpty() ? QStringLiteral("tmux new-session failed") : errorOutput;
        }
        Q_EMIT errorOccurred(errorOutput);
        return false;
    }

    qCInfo(ClaudemuxTmux) << "TmuxManager: Created session" << sessionName << "in" << workingDir;
    return true;
}

QList<TmuxManager::SessionInfo> TmuxManager::listSessions() const
{
    bool ok = false;
    QString output = executeCommand({QStringLiteral("list-sessions"), QStringLiteral("-F"), sessionListFormat()}, &ok);

    if (!ok) {
        return {};
    }

    return parseSessionList(output);
}

void TmuxManager::listSessionsAsync(std::function<void(bool, const QList<SessionInfo> &)> callback)
{
    executeCommandAsync({QStringLiteral("list-sessions"), QStringLiteral("-F"), sessionListFormat()}, [callback](bool ok, const QString &output) {
        if (callback) {
            callback(ok, ok ? parseSessionList(output) : QList<SessionInfo>());
        }
    });
}

bool TmuxManager::sessionExists(const QString &sessionName) const
{
    if (sessionName.isEmpty()) {
        return false;
    }
    bool ok = false;
    executeCommand({QStringLiteral("has-session"), QStringLiteral("-t"), exactTarget(sessionName)}, &ok);
    return ok;
}

int TmuxManager::attachedCount(const QString &sessionName) const
{
    bool ok = false;
    const QString output = executeCommand(
        {QStringLiteral("display-message"), QStringLiteral("-p"), QStringLiteral("-t"), exactTarget(sessionName) + QLatin1Char(':'), QStringLiteral("#{session_attached}")},
        &ok);
    if (!ok) {
        return -1;
    }
    bool converted = false;
    const int count = output.trimmed().toInt(&converted);
    return converted ? count : -1;
}

qint64 TmuxManager::panePid(const QString &sessionName) const
{
    bool ok = false;
    const QString output =
        executeCommand({QStringLiteral("list-panes"), QStringLiteral("-t"), exactTarget(sessionName) + QLatin1Char(':'), QStringLiteral("-F"), QStringLiteral("#{pane_pid}")},
                       &ok);

    if (!ok) {
        return 0;
    }
    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    if (lines.isEmpty()) {
        return 0;
    }
    bool converted = false;
    const qint64 pid = lines.first().trimmed().toLongLong(&converted);
    return converted ? pid : 0;
}

QString TmuxManager::currentSessionName() const
{
    if (qEnvironmentVariableIsEmpty("TMUX")) {
        return QString();
    }
    bool ok = false;
    const QString output = executeCommand({QStringLiteral("display-message"), QStringLiteral("-p"), QStringLiteral("#{session_name}")}, &ok);
    return ok ? output.trimmed() : QString();
}

bool TmuxManager::killSession(const QString &sessionName)
{
    bool ok = false;
    executeCommand({QStringLiteral("kill-session"), QStringLiteral("-t"), exactTarget(sessionName)}, &ok);
    if (ok) {
        qCInfo(ClaudemuxTmux) << "TmuxManager: Killed session" << sessionName;
    }
    return ok;
}

int TmuxManager::detachClients(const QString &sessionName)
{
    bool ok = false;
    const QString output = executeCommand(
        {QStringLiteral("list-clients"), QStringLiteral("-t"), exactTarget(sessionName), QStringLiteral("-F"), QStringLiteral("#{client_tty}")},
        &ok);
    if (!ok) {
        return -1;
    }

    int detached = 0;
    const QStringList ttys = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &tty : ttys) {
        bool detachOk = false;
        executeCommand({QStringLiteral("detach-client"), QStringLiteral("-t"), tty.trimmed()}, &detachOk);
        if (detachOk) {
            ++detached;
        }
    }
    return detached;
}

QString TmuxManager::executeCommand(const QStringList &args, bool *ok) const
{
    QProcess process;
    process.start(QStringLiteral("tmux"), args);

    if (!process.waitForFinished(10000)) {
        if (ok) *ok = false;
        return QString();
    }

    if (ok) {
        *ok = (process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0);
    }

    if (process.exitCode() != 0) {
        QString errorOutput = QString::fromUtf8(process.readAllStandardError());
        if (!errorOutput.isEmpty()) {
            qCDebug(ClaudemuxTmux) << "TmuxManager:" << args.value(0) << "failed:" << errorOutput.trimmed();
            Q_EMIT const_cast<TmuxManager*>(this)->errorOccurred(errorOutput);
        }
    }

    return QString::fromUtf8(process.readAllStandardOutput());
}

void TmuxManager::executeCommandAsync(const QStringList &args, std::function<void(bool, const QString &)> callback)
{
    auto *process = new QProcess(this);
    connect(process, &QProcess::finished, this, [this, process, callback](int exitCode, QProcess::ExitStatus exitStatus) {
        bool ok = (exitStatus == QProcess::NormalExit && exitCode == 0);
        QString output = QString::fromUtf8(process->readAllStandardOutput());
        if (!ok) {
            QString errorOutput = QString::fromUtf8(process->readAllStandardError());
            if (!errorOutput.isEmpty()) {
                Q_EMIT errorOccurred(errorOutput);
            }
        }
        if (callback) {
            callback(ok, output);
        }
        process->deleteLater();
    });
    connect(process, &QProcess::errorOccurred, this, [process, callback](QProcess::ProcessError error) {
        // finished() is not emitted when tmux cannot be started at all
        if (error == QProcess::FailedToStart) {
            if (callback) {
                callback(false, QString());
            }
            process->deleteLater();
        }
    });
    process->start(QStringLiteral("tmux"), args);
}

QList<TmuxManager::SessionInfo> TmuxManager::parseSessionList(const QString &output)
{
    QList<SessionInfo> sessions;

    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        // Session names may contain ':' themselves, so parse from the right
        QStringList parts = line.split(QLatin1Char(':'));
        if (parts.size() >= 4) {
            SessionInfo info;
            info.attached = parts.takeLast().toInt();
            info.created = parts.takeLast().toLongLong();
            info.windows = parts.takeLast().toInt();
            info.name = parts.join(QLatin1Char(':'));
            sessions.append(info);
        }
    }

    return sessions;
}

} // namespace Claudemux

#include "moc_TmuxManager.cpp"
