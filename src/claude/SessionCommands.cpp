/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionCommands.h"

#include "ClaudemuxDebug.h"
#include "ClaudemuxSettings.h"
#include "SessionMonitor.h"
#include "TmuxManager.h"

#include <KLocalizedString>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>

#include <cstdio>

namespace Claudemux
{

namespace
{
constexpr int DirectoryColumnWidth = 40;

QStringList subcommandArguments(const QStringList &arguments)
{
    // "claudemux ls --all" -> {"claudemux ls", "--all"}
    QStringList result;
    result << arguments.value(0) + QLatin1Char(' ') + arguments.value(1);
    result << arguments.mid(2);
    return result;
}

QString listIndicator(const SessionRecord &record)
{
    if (!record.tmuxAlive) {
        return QStringLiteral(" ◉");
    }
    if (record.attachedClients > 0) {
        return QStringLiteral("⚡");
    }
    return QStringLiteral("  ");
}

QString shortenPath(const QString &path, int maxLength)
{
    if (path.size() <= maxLength) {
        return path;
    }
    return QStringLiteral("…") + path.right(maxLength - 1);
}
}

SessionCommands::SessionCommands(ClaudemuxSettings *settings, LifecycleController *lifecycle, TmuxManager *tmux)
    : m_settings(settings)
    , m_lifecycle(lifecycle)
    , m_tmux(tmux)
    , m_out(stdout)
    , m_err(stderr)
{
}

int SessionCommands::execute(const QStringList &arguments)
{
    const QString command = arguments.value(1);

    if (command.isEmpty()) {
        return runWatch(subcommandArguments({arguments.value(0), QStringLiteral("watch")}));
    }
    if (command == QLatin1String("-h") || command == QLatin1String("--help") || command == QLatin1String("help")) {
        printUsage();
        return 0;
    }
    if (command == QLatin1String("-v") || command == QLatin1String("--version")) {
        m_out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << Qt::endl;
        return 0;
    }

    const QStringList subArguments = subcommandArguments(arguments);
    if (command == QLatin1String("new")) {
        return runNew(subArguments);
    }
    if (command == QLatin1String("ls") || command == QLatin1String("list") || command == QLatin1String("status")) {
        return runList(subArguments);
    }
    if (command == QLatin1String("attach")) {
        return runAttach(subArguments);
    }
    if (command == QLatin1String("focus")) {
        return runFocus(subArguments);
    }
    if (command == QLatin1String("kill")) {
        return runKill(subArguments);
    }
    if (command == QLatin1String("prune")) {
        return runPrune(subArguments);
    }
    if (command == QLatin1String("msg")) {
        return runMessage(subArguments);
    }
    if (command == QLatin1String("watch")) {
        return runWatch(subArguments);
    }

    m_err << i18n("Unknown command: %1", command) << Qt::endl;
    printUsage();
    return 1;
}

void SessionCommands::printUsage()
{
    m_out << i18n("Usage: claudemux [command] [options]") << "\n\n";
    m_out << i18n("Commands:") << "\n";
    m_out << "  new [dir]      " << i18n("Start Claude in a new tmux session") << "\n";
    m_out << "  ls             " << i18n("List sessions") << "\n";
    m_out << "  attach <id>    " << i18n("Attach to a session") << "\n";
    m_out << "  focus <id>     " << i18n("Raise the terminal a session is attached in") << "\n";
    m_out << "  kill <id>      " << i18n("Kill a session (or --all, --idle)") << "\n";
    m_out << "  prune          " << i18n("Remove exited sessions") << "\n";
    m_out << "  msg <id>       " << i18n("Post a message to a session's inbox") << "\n";
    m_out << "  watch          " << i18n("Interactive session monitor (default)") << "\n\n";
    m_out << i18n("Run 'claudemux <command> --help' for the options of a command.") << Qt::endl;
}

int SessionCommands::reportFailure(const OperationResult &result)
{
    m_err << i18n("Error: %1", result.message) << Qt::endl;
    for (const QString &candidate : result.candidates) {
        m_err << "  " << candidate << Qt::endl;
    }
    return 1;
}

int SessionCommands::report(const OperationResult &result)
{
    if (!result.ok) {
        return reportFailure(result);
    }
    if (!result.message.isEmpty()) {
        m_out << result.message << Qt::endl;
    }
    return 0;
}

int SessionCommands::runNew(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Start Claude in a new detached tmux session"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("dir"), i18n("Working directory (default: current directory)"), QStringLiteral("[dir]"));
    const QCommandLineOption resumeOption({QStringLiteral("r"), QStringLiteral("resume")}, i18n("Resume a conversation by ID"), QStringLiteral("id"));
    const QCommandLineOption labelOption({QStringLiteral("l"), QStringLiteral("label")}, i18n("Use this label as the session ID"), QStringLiteral("label"));
    const QCommandLineOption attachOption({QStringLiteral("a"), QStringLiteral("attach")}, i18n("Attach right after creating"));
    parser.addOption(resumeOption);
    parser.addOption(labelOption);
    parser.addOption(attachOption);

    if (!parser.parse(arguments)) {
        m_err << parser.errorText() << Qt::endl;
        return 1;
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        return 0;
    }
    if (parser.positionalArguments().size() > 1) {
        m_err << i18n("Too many arguments") << Qt::endl;
        return 1;
    }

    LifecycleController::CreateOptions options;
    options.workingDirectory = parser.positionalArguments().value(0);
    options.resumeConversationId = parser.value(resumeOption);
    options.label = parser.value(labelOption);

    SessionRecord created;
    const OperationResult result = m_lifecycle->create(options, &created);
    if (!result.ok) {
        return reportFailure(result);
    }

    if (!parser.isSet(attachOption)) {
        m_out << result.message << "\n\n";
        m_out << i18n("Attach with: claudemux attach %1", created.id) << Qt::endl;
        return 0;
    }
    return report(m_lifecycle->attach(created.id, false));
}

QString SessionCommands::formatTable(const SessionRecordList &records, const QDateTime &now)
{
    const QStringList headers = {i18n("ID"), i18n("DIRECTORY"), i18n("STATUS"), i18n("AGE"), i18n("UPDATED")};

    QList<QStringList> rows;
    for (const SessionRecord &record : records) {
        QString status = statusToString(record.status);
        if (!record.statusDetail.isEmpty()) {
            status += QStringLiteral(": ") + record.statusDetail;
        }
        rows.append({record.id, shortenPath(record.workingDirectory, DirectoryColumnWidth), status, formatRelativeTime(record.created, now),
                     formatRelativeTime(record.updated, now)});
    }

    QList<int> widths;
    for (int column = 0; column < headers.size(); ++column) {
        int width = headers.at(column).size();
        for (const QStringList &row : std::as_const(rows)) {
            width = qMax(width, static_cast<int>(row.at(column).size()));
        }
        widths.append(width);
    }

    auto formatRow = [&widths](const QString &indicator, const QStringList &cells) {
        QString line = indicator + QLatin1Char(' ');
        for (int column = 0; column < cells.size(); ++column) {
            const bool last = column == cells.size() - 1;
            line += last ? cells.at(column) : cells.at(column).leftJustified(widths.at(column) + 2);
        }
        return line;
    };

    QString text = formatRow(QStringLiteral("  "), headers) + QLatin1Char('\n');
    for (int i = 0; i < rows.size(); ++i) {
        text += formatRow(listIndicator(records.at(i)), rows.at(i)) + QLatin1Char('\n');
    }
    return text;
}

int SessionCommands::runList(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("List Claude sessions"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption allOption({QStringLiteral("a"), QStringLiteral("all")}, i18n("Include exited sessions"));
    const QCommandLineOption jsonOption(QStringLiteral("json"), i18n("Output as JSON"));
    const QCommandLineOption watchOption({QStringLiteral("w"), QStringLiteral("watch")}, i18n("Interactive watch mode with auto-refresh"));
    const QCommandLineOption sortOption({QStringLiteral("s"), QStringLiteral("sort")},
                                        i18n("Sort by column: id, directory, status, age, updated"),
                                        QStringLiteral("column"));
    const QCommandLineOption ascOption(QStringLiteral("asc"), i18n("Sort ascending (default for id, directory, status)"));
    const QCommandLineOption descOption(QStringLiteral("desc"), i18n("Sort descending (default for age, updated)"));
    const QCommandLineOption showOption(QStringLiteral("show"),
                                        i18n("Only show these statuses (idle, working, awaiting_permission, awaiting_input, attention, exited, all)"),
                                        QStringLiteral("status"));
    const QCommandLineOption hideOption(QStringLiteral("hide"), i18n("Hide these statuses"), QStringLiteral("status"));
    parser.addOptions({allOption, jsonOption, watchOption, sortOption, ascOption, descOption, showOption, hideOption});

    if (!parser.parse(arguments)) {
        m_err << parser.errorText() << Qt::endl;
        return 1;
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        return 0;
    }

    SortSpec sort;
    if (parser.isSet(sortOption) && !SortSpec::parseColumn(parser.value(sortOption), &sort.column)) {
        m_err << i18n("Unknown sort column: %1", parser.value(sortOption)) << Qt::endl;
        return 1;
    }
    if (parser.isSet(ascOption)) {
        sort.order = SortOrder::Ascending;
    } else if (parser.isSet(descOption)) {
        sort.order = SortOrder::Descending;
    } else {
        sort.order = SortSpec::defaultOrder(sort.column);
    }

    StatusFilter filter;
    filter.includeExited = parser.isSet(allOption);
    QString error;
    if (!StatusFilter::parseStatuses(parser.values(showOption), &filter.show, &error)
        || !StatusFilter::parseStatuses(parser.values(hideOption), &filter.hide, &error)) {
        m_err << error << Qt::endl;
        return 1;
    }

    if (parser.isSet(watchOption)) {
        WatchState state;
        state.sort = sort;
        state.filter = filter;
        return watch(state);
    }

    const SessionRecordList all = m_lifecycle->reconciledRecords(true);
    if (all.isEmpty()) {
        m_out << i18n("No sessions found") << "\n\n";
        m_out << i18n("Start a new session with: claudemux new") << Qt::endl;
        return 0;
    }

    const SessionRecordList records = applyView(all, filter, sort);
    if (parser.isSet(jsonOption)) {
        QJsonArray array;
        for (const SessionRecord &record : records) {
            QJsonObject obj = record.toJson();
            obj[QStringLiteral("attached")] = record.attachedClients;
            obj[QStringLiteral("tmuxAlive")] = record.tmuxAlive;
            array.append(obj);
        }
        m_out << QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Indented));
        m_out.flush();
        return 0;
    }

    if (records.isEmpty()) {
        m_out << i18n("No active sessions found") << "\n\n";
        m_out << i18n("Start a new session with: claudemux new") << Qt::endl;
        return 0;
    }

    m_out << formatTable(records) << '\n';
    m_out << i18n("Attach with: claudemux attach <id>") << Qt::endl;
    return 0;
}

int SessionCommands::runAttach(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Attach to a session"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("id"), i18n("Session ID or unique prefix"));
    const QCommandLineOption forceOption({QStringLiteral("f"), QStringLiteral("force")}, i18n("Detach other clients and attach anyway"));
    parser.addOption(forceOption);

    if (!parser.parse(arguments)) {
        m_err << parser.errorText() << Qt::endl;
        return 1;
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        return 0;
    }
    if (parser.positionalArguments().size() != 1) {
        m_err << i18n("Expected exactly one session ID") << Qt::endl;
        return 1;
    }

    return report(m_lifecycle->attach(parser.positionalArguments().constFirst(), parser.isSet(forceOption)));
}

int SessionCommands::runFocus(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Raise the terminal window a session is attached in"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("id"), i18n("Session ID or unique prefix"));

    if (!parser.parse(arguments)) {
        m_err << parser.errorText() << Qt::endl;
        return 1;
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        return 0;
    }
    if (parser.positionalArguments().size() != 1) {
        m_err << i18n("Expected exactly one session ID") << Qt::endl;
        return 1;
    }

    return report(m_lifecycle->focus(parser.positionalArguments().constFirst()));
}

bool SessionCommands::confirmKill(const SessionRecordList &targets)
{
    m_out << i18np("About to kill 1 session:", "About to kill %1 sessions:", targets.size()) << '\n';
    for (const SessionRecord &record : targets) {
        m_out << "  " << record.id << "  " << record.workingDirectory << "  " << statusToString(record.status) << '\n';
    }
    m_out << i18n("Continue? [y/N] ");
    m_out.flush();

    QTextStream in(stdin);
    const QString answer = in.readLine().trimmed().toLower();
    return answer == QLatin1String("y") || answer == QLatin1String("yes");
}

int SessionCommands::runKill(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Kill sessions and delete their state"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("id"), i18n("Session ID or unique prefix"), QStringLiteral("[id]"));
    const QCommandLineOption allOption({QStringLiteral("a"), QStringLiteral("all")}, i18n("Kill every session"));
    const QCommandLineOption idleOption(QStringLiteral("idle"), i18n("Kill every idle session"));
    const QCommandLineOption yesOption({QStringLiteral("y"), QStringLiteral("yes")}, i18n("Do not ask for confirmation"));
    parser.addOptions({allOption, idleOption, yesOption});

    if (!parser.parse(arguments)) {
        m_err << parser.errorText() << Qt::endl;
        return 1;
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        return 0;
    }

    const QStringList ids = parser.positionalArguments();
    const int selectors = (ids.isEmpty() ? 0 : 1) + (parser.isSet(allOption) ? 1 : 0) + (parser.isSet(idleOption) ? 1 : 0);
    if (selectors != 1 || ids.size() > 1) {
        m_err << i18n("Specify exactly one of: a session ID, --all, --idle") << Qt::endl;
        return 1;
    }

    if (!ids.isEmpty()) {
        return report(m_lifecycle->kill(ids.constFirst()));
    }

    LifecycleController::ConfirmFunction confirm;
    if (!parser.isSet(yesOption)) {
        confirm = [this](const SessionRecordList &targets) {
            return confirmKill(targets);
        };
    }

    QStringList killed;
    const OperationResult result =
        m_lifecycle->killMany(parser.isSet(allOption) ? LifecycleController::KillScope::All : LifecycleController::KillScope::IdleOnly, confirm, &killed);
    for (const QString &id : std::as_const(killed)) {
        m_out << "  " << id << '\n';
    }
    return report(result);
}

int SessionCommands::runPrune(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Remove the state of exited sessions"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption maxAgeOption(QStringLiteral("max-age"), i18n("Only remove sessions exited longer ago than this (e.g. 24h, 7d, 1w)"), QStringLiteral("age"));
    const QCommandLineOption allOption({QStringLiteral("a"), QStringLiteral("all")}, i18n("Remove every exited session regardless of age"));
    const QCommandLineOption dryRunOption(QStringLiteral("dry-run"), i18n("Show what would be removed without removing it"));
    parser.addOptions({maxAgeOption, allOption, dryRunOption});

    if (!parser.parse(arguments)) {
        m_err << parser.errorText() << Qt::endl;
        return 1;
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        return 0;
    }

    qint64 maxAge = 0;
    if (!parser.isSet(allOption) && parser.isSet(maxAgeOption) && !LifecycleController::parseDuration(parser.value(maxAgeOption), &maxAge)) {
        m_err << i18n("Invalid max-age: %1", parser.value(maxAgeOption)) << Qt::endl;
        return 1;
    }

    SessionRecordList affected;
    const bool dryRun = parser.isSet(dryRunOption);
    const OperationResult result = m_lifecycle->prune(maxAge, dryRun, &affected);
    if (!result.ok) {
        return reportFailure(result);
    }

    m_out << result.message << (affected.isEmpty() ? "" : ":") << '\n';
    const QDateTime now = QDateTime::currentDateTimeUtc();
    for (const SessionRecord &record : std::as_const(affected)) {
        m_out << "  " << record.id << "  " << i18n("(exited %1)", formatRelativeTime(record.updated, now)) << '\n';
    }
    m_out.flush();
    return 0;
}

int SessionCommands::runMessage(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Post a message to a session's inbox"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("id"), i18n("Session ID or unique prefix"));
    const QCommandLineOption typeOption({QStringLiteral("t"), QStringLiteral("type")}, i18n("Message type (default: focus)"), QStringLiteral("type"), Inbox::focusType());
    parser.addOption(typeOption);

    if (!parser.parse(arguments)) {
        m_err << parser.errorText() << Qt::endl;
        return 1;
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        return 0;
    }
    if (parser.positionalArguments().size() != 1) {
        m_err << i18n("Expected exactly one session ID") << Qt::endl;
        return 1;
    }

    return report(m_lifecycle->postMessage(parser.positionalArguments().constFirst(), parser.value(typeOption)));
}

int SessionCommands::runWatch(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Interactive session monitor"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption allOption({QStringLiteral("a"), QStringLiteral("all")}, i18n("Include exited sessions"));
    parser.addOption(allOption);

    if (!parser.parse(arguments)) {
        m_err << parser.errorText() << Qt::endl;
        return 1;
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        return 0;
    }

    WatchState state;
    state.filter.includeExited = parser.isSet(allOption);
    return watch(state);
}

OperationResult SessionCommands::pruneOnQuit(SessionRecordList *pruned)
{
    // Best effort: exited sessions past the configured age are dropped on the way out
    const qint64 maxAge = qint64(qMax(m_settings->pruneMaxAgeDays(), 0)) * 86400;
    return m_lifecycle->prune(maxAge, false, pruned);
}

int SessionCommands::watch(const WatchState &initialState)
{
    WatchState state = initialState;

    for (;;) {
        SessionMonitor monitor(m_lifecycle, m_tmux, m_settings->refreshIntervalSeconds());
        monitor.setLogFile(m_settings->monitorLogFile());
        const SessionMonitor::Result result = monitor.run(state);
        state = result.state;

        const MonitorModel::Action &action = result.action;
        OperationResult outcome = OperationResult::success();

        switch (action.kind) {
        case MonitorModel::Action::CreateNew: {
            LifecycleController::CreateOptions options;
            options.workingDirectory = QDir::currentPath();
            SessionRecord created;
            outcome = m_lifecycle->create(options, &created);
            if (outcome.ok) {
                state.selectedId = created.id;
                outcome = m_lifecycle->attach(created.id, false);
            }
            break;
        }
        case MonitorModel::Action::FocusOnly:
            outcome = m_lifecycle->focus(action.sessionId);
            break;
        case MonitorModel::Action::Attach:
            outcome = m_lifecycle->attach(action.sessionId, action.force);
            break;
        default: {
            if (!state.message.isEmpty()) {
                m_err << state.message << Qt::endl;
                return 1;
            }

            const OperationResult pruned = pruneOnQuit();
            if (!pruned.ok) {
                qCWarning(ClaudemuxMonitor) << "SessionCommands: Silent prune failed:" << pruned.message;
            }
            return 0;
        }
        }

        state.message = outcome.message;
    }
}

} // namespace Claudemux
