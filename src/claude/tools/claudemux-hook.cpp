/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    claudemux-hook - Claude hook callback

    Registered as the command of every Claude hook. It reads the hook event
    from stdin (JSON), finds the session it belongs to and updates that
    session's status in the store.

    Usage:
        claudemux-hook < event.json

    Exits 0 for handled or ignored events and 1 for malformed input.
    Diagnostics go to the hook log file and stderr.
*/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QProcessEnvironment>

#include <KLocalizedString>

#include "../ClaudemuxDebug.h"
#include "../ClaudemuxSettings.h"
#include "../ConversationIndex.h"
#include "../HookEvent.h"
#include "../LifecycleController.h"
#include "../NotificationDispatcher.h"
#include "../ProcessTable.h"
#include "../SessionStore.h"
#include "../StatusEngine.h"
#include "../TmuxManager.h"

#include <cstdio>
#include <unistd.h>

using namespace Claudemux;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("claudemux-hook"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    KLocalizedString::setApplicationDomain("claudemux");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Claude hook callback for claudemux"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.process(app);

    ClaudemuxSettings settings;

    // Hook output is invisible to the user, so everything is kept in a log file
    qSetMessagePattern(QStringLiteral("%{if-category}%{category} %{endif}%{type}: %{message}"));
    const LogFileRedirect logRedirect(settings.hookLogFile(), true);

    // Read event data from stdin
    QFile stdinFile;
    if (!stdinFile.open(stdin, QIODevice::ReadOnly)) {
        qCWarning(ClaudemuxHooks) << "claudemux-hook: Cannot read stdin";
        return 0;
    }
    const QByteArray stdinData = stdinFile.readAll();
    stdinFile.close();

    HookEvent event;
    QString parseError;
    if (!HookEvent::parse(stdinData, &event, &parseError)) {
        qCWarning(ClaudemuxHooks) << "claudemux-hook: Malformed hook input:" << parseError;
        return 1;
    }

    const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    const QStringList assistantNames = settings.assistantProcessNames();

    TmuxManager tmux;

    IngestContext context;
    context.sessionId = env.value(LifecycleController::sessionIdVariable());
    context.findAssistantPid = [assistantNames]() {
        return ProcessTable::findAncestor(static_cast<qint64>(getppid()), assistantNames);
    };
    context.currentTmuxSession = [&tmux]() {
        return tmux.currentSessionName();
    };
    context.processAlive = &ProcessTable::isAlive;

    ConversationIndex conversations;
    NotificationDispatcher notifications(NotificationDispatcher::configFromSettings(&settings));

    StatusEngine engine(SessionStore::fromSettings());
    engine.setConversationIndex(&conversations);
    engine.setNotificationDispatcher(&notifications);
    engine.setUsageRefreshCommand(settings.usageRefreshCommand());

    QString error;
    const StatusEngine::Outcome outcome = engine.ingest(event, context, &error);
    if (outcome == StatusEngine::Outcome::StoreError) {
        // A failing hook would interrupt the Claude session, so only log it
        qCWarning(ClaudemuxHooks) << "claudemux-hook: Failed to store session state:" << error;
    }

    return 0;
}
