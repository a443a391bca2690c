/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalScreen.h"

#include "ClaudemuxDebug.h"

#include <KLocalizedString>

#include <QDateTime>

#include <clocale>
#include <cstdio>

#include <sys/ioctl.h>
#include <unistd.h>

#include <curses.h>

namespace Claudemux
{

namespace
{
enum ColorPair {
    PairIdle = 1,
    PairWorking,
    PairAttention,
    PairExited,
    PairHeader,
    PairDialog,
};

constexpr int IndicatorWidth = 3;
constexpr int IdWidth = 12;
constexpr int StatusWidth = 30;
constexpr int AgeWidth = 9;
constexpr int UpdatedWidth = 9;

int statusPair(SessionStatus status)
{
    switch (status) {
    case SessionStatus::Idle:
        return PairIdle;
    case SessionStatus::Working:
    case SessionStatus::Running:
        return PairWorking;
    case SessionStatus::AwaitingPermission:
    case SessionStatus::AwaitingInput:
        return PairAttention;
    case SessionStatus::Exited:
        return PairExited;
    }
    return PairAttention;
}

QString sortIndicator(const SortSpec &sort, SortColumn column)
{
    if (sort.column != column) {
        return QString();
    }
    return sort.order == SortOrder::Ascending ? QStringLiteral(" ↑") : QStringLiteral(" ↓");
}

QString shortenPath(const QString &path, int maxLength)
{
    if (maxLength <= 1 || path.size() <= maxLength) {
        return path;
    }
    return QStringLiteral("…") + path.right(maxLength - 1);
}

QString attachIndicator(const SessionRecord &record)
{
    if (!record.tmuxAlive) {
        return QStringLiteral(" ◉");
    }
    if (record.attachedClients > 0) {
        return QStringLiteral("⚡");
    }
    return QStringLiteral(" ▷");
}
}

TerminalScreen::TerminalScreen()
{
    std::setlocale(LC_ALL, "");

    m_screen = newterm(nullptr, stdout, stdin);
    if (!m_screen) {
        qCWarning(ClaudemuxMonitor) << "TerminalScreen: Failed to initialize the terminal";
        return;
    }
    set_term(m_screen);

    raw();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);

    if (has_colors()) {
        m_colors = true;
        start_color();
        use_default_colors();
        init_pair(PairIdle, COLOR_YELLOW, -1);
        init_pair(PairWorking, COLOR_GREEN, -1);
        init_pair(PairAttention, COLOR_RED, -1);
        init_pair(PairExited, COLOR_BLACK, -1);
        init_pair(PairHeader, COLOR_CYAN, -1);
        init_pair(PairDialog, COLOR_WHITE, COLOR_BLUE);
    }
}

TerminalScreen::~TerminalScreen()
{
    if (m_screen) {
        endwin();
        delscreen(m_screen);
        m_screen = nullptr;
    }
}

int TerminalScreen::height() const
{
    return m_screen ? LINES : 0;
}

int TerminalScreen::width() const
{
    return m_screen ? COLS : 0;
}

void TerminalScreen::handleResize()
{
    if (!m_screen) {
        return;
    }

    struct winsize size;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_row > 0 && size.ws_col > 0) {
        resize_term(size.ws_row, size.ws_col);
    }
    clear();
}

MonitorModel::Key TerminalScreen::translateKey(int result, unsigned int code)
{
    using Key = MonitorModel::Key;

    if (result == KEY_CODE_YES) {
        switch (code) {
        case KEY_UP:
            return Key::of(Key::Up);
        case KEY_DOWN:
            return Key::of(Key::Down);
        case KEY_PPAGE:
            return Key::of(Key::PageUp);
        case KEY_NPAGE:
            return Key::of(Key::PageDown);
        case KEY_HOME:
            return Key::of(Key::Home);
        case KEY_END:
            return Key::of(Key::End);
        case KEY_ENTER:
            return Key::of(Key::Enter);
        case KEY_BACKSPACE:
            return Key::of(Key::Backspace);
        case KEY_DC:
            return Key::of(Key::Delete);
        case KEY_RESIZE:
            return Key::of(Key::Resize);
        default:
            if (code >= static_cast<unsigned int>(KEY_F(1)) && code <= static_cast<unsigned int>(KEY_F(12))) {
                return Key::of(Key::Function, static_cast<int>(code) - KEY_F0);
            }
            return Key();
        }
    }

    if (result != OK) {
        return Key();
    }

    switch (code) {
    case 3:
        return Key::of(Key::Interrupt);
    case 8:
    case 127:
        return Key::of(Key::Backspace);
    case '\n':
    case '\r':
        return Key::of(Key::Enter);
    case 21:
        return Key::of(Key::ClearLine);
    case 27:
        return Key::of(Key::Escape);
    default:
        break;
    }

    if (code < 32) {
        return Key();
    }
    return Key::fromCharacter(code);
}

QList<MonitorModel::Key> TerminalScreen::readKeys()
{
    QList<MonitorModel::Key> keys;
    if (!m_screen) {
        return keys;
    }

    for (;;) {
        wint_t code = 0;
        const int result = get_wch(&code);
        if (result == ERR) {
            break;
        }
        const MonitorModel::Key key = translateKey(result, static_cast<unsigned int>(code));
        if (key.code != MonitorModel::Key::None) {
            keys.append(key);
        }
    }
    return keys;
}

void TerminalScreen::put(int row, int column, const QString &text, int maxWidth, int attributes)
{
    if (row < 0 || row >= LINES || column >= COLS) {
        return;
    }

    const int available = COLS - column;
    const int limit = maxWidth < 0 ? available : qMin(maxWidth, available);
    QString clipped = text;
    if (clipped.size() > limit) {
        clipped = clipped.left(qMax(limit - 1, 0)) + QStringLiteral("…");
    }

    if (attributes) {
        attron(attributes);
    }
    mvaddstr(row, column, clipped.toUtf8().constData());
    if (attributes) {
        attroff(attributes);
    }
}

void TerminalScreen::render(const MonitorModel &model)
{
    if (!m_screen) {
        return;
    }

    erase();

    if (model.mode() == MonitorModel::Mode::Help) {
        drawHelp();
        refresh();
        return;
    }

    drawHeader(model);
    drawTable(model);
    drawFooter(model);

    if (model.mode() == MonitorModel::Mode::Confirm) {
        drawConfirm(model);
    } else if (model.mode() == MonitorModel::Mode::FilterMenu) {
        drawFilterMenu(model);
    }

    refresh();
}

void TerminalScreen::drawHeader(const MonitorModel &model)
{
    const int headerAttributes = A_BOLD | (m_colors ? COLOR_PAIR(PairHeader) : 0);
    put(0, 0, i18n("Claude sessions"), -1, headerAttributes);

    const int total = model.filteredCount();
    const int shown = model.visibleRecords().size();
    const QString count = shown != total ? i18n("[showing %1 of %2]", shown, total) : i18np("[%1 session]", "[%1 sessions]", total);
    put(0, 17, count);

    QStringList details;
    if (model.filter().isActive()) {
        details.append(i18n("filter: %1", model.filter().describe()));
    }
    if (!model.search().isEmpty()) {
        details.append(i18n("search: \"%1\"", model.search()));
    }
    put(1, 0, details.join(QStringLiteral("  ")), -1, A_DIM);
}

void TerminalScreen::drawTable(const MonitorModel &model)
{
    const int headerRow = 3;
    const int firstRow = headerRow + 1;
    const int directoryWidth = qMax(COLS - IndicatorWidth - IdWidth - StatusWidth - AgeWidth - UpdatedWidth - 5, 12);

    const SortSpec &sort = model.sort();
    int column = IndicatorWidth;
    put(headerRow, column, i18n("ID") + sortIndicator(sort, SortColumn::Id), IdWidth, A_BOLD);
    column += IdWidth + 1;
    put(headerRow, column, i18n("DIRECTORY") + sortIndicator(sort, SortColumn::Directory), directoryWidth, A_BOLD);
    column += directoryWidth + 1;
    put(headerRow, column, i18n("STATUS") + sortIndicator(sort, SortColumn::Status), StatusWidth, A_BOLD);
    column += StatusWidth + 1;
    put(headerRow, column, i18n("AGE") + sortIndicator(sort, SortColumn::Age), AgeWidth, A_BOLD);
    column += AgeWidth + 1;
    put(headerRow, column, i18n("UPDATED") + sortIndicator(sort, SortColumn::Updated), UpdatedWidth, A_BOLD);

    const SessionRecordList &records = model.visibleRecords();
    if (records.isEmpty()) {
        QString empty;
        if (!model.search().isEmpty()) {
            empty = i18n("No matches for \"%1\"", model.search());
        } else if (model.filter().isActive()) {
            empty = i18n("No active sessions (filter: %1)", model.filter().describe());
        } else {
            empty = i18n("No active sessions");
        }
        put(firstRow + 1, IndicatorWidth, empty, -1, A_DIM);
        return;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    const int end = qMin(model.scrollOffset() + model.viewportHeight(), records.size());
    for (int i = model.scrollOffset(); i < end; ++i) {
        const SessionRecord &record = records.at(i);
        const int row = firstRow + (i - model.scrollOffset());
        const bool selected = (i == model.cursor());
        if (selected) {
            attron(A_REVERSE);
            mvhline(row, 0, ' ', COLS);
        }

        QString status = statusToString(record.status);
        if (!record.statusDetail.isEmpty()) {
            status += QStringLiteral(": ") + record.statusDetail;
        }
        int statusAttributes = m_colors ? COLOR_PAIR(statusPair(record.status)) : 0;
        if (record.status == SessionStatus::Exited) {
            statusAttributes |= A_BOLD;
        }

        column = 0;
        put(row, column, attachIndicator(record), IndicatorWidth);
        column += IndicatorWidth;
        put(row, column, record.id, IdWidth);
        column += IdWidth + 1;
        put(row, column, shortenPath(record.workingDirectory, directoryWidth), directoryWidth);
        column += directoryWidth + 1;
        put(row, column, status, StatusWidth, statusAttributes);
        column += StatusWidth + 1;
        put(row, column, formatRelativeTime(record.created, now), AgeWidth);
        column += AgeWidth + 1;
        put(row, column, formatRelativeTime(record.updated, now), UpdatedWidth);

        if (selected) {
            attroff(A_REVERSE);
        }
    }

    if (records.size() > model.viewportHeight()) {
        put(firstRow + model.viewportHeight(), IndicatorWidth, i18n("%1-%2 of %3", model.scrollOffset() + 1, end, records.size()), -1, A_DIM);
    }
}

void TerminalScreen::drawFooter(const MonitorModel &model)
{
    const int bottom = LINES - 1;

    if (model.mode() == MonitorModel::Mode::Search) {
        curs_set(1);
        put(bottom - 1, 0, QStringLiteral("/") + model.search());
        move(bottom - 1, qMin(model.search().size() + 1, COLS - 1));
    } else {
        curs_set(0);
        if (!model.search().isEmpty()) {
            put(bottom - 1, 0, QStringLiteral("/") + model.search(), -1, A_DIM);
        }
    }

    if (!model.message().isEmpty()) {
        put(bottom, 0, model.message(), -1, A_BOLD | (m_colors ? COLOR_PAIR(PairAttention) : 0));
    } else {
        put(bottom, 0, i18n("h help • n new • / search • ↑/↓ navigate • enter attach • q quit"), -1, A_DIM);
    }
}

void TerminalScreen::drawConfirm(const MonitorModel &model)
{
    const QString id = model.confirmSessionId();
    QStringList lines;
    switch (model.confirmKind()) {
    case MonitorModel::ConfirmKind::Kill:
        lines << i18n("Kill session %1? [y/n]", id);
        break;
    case MonitorModel::ConfirmKind::Detach:
        lines << i18n("Detach all clients from session %1? [y/n]", id);
        break;
    case MonitorModel::ConfirmKind::AttachForce:
        lines << i18n("Session %1 already attached. Detach other clients? [y/n]", id);
        break;
    case MonitorModel::ConfirmKind::NoTmux:
        lines << i18n("Session %1 has no live tmux session.", id);
        lines << i18n("It was started outside claudemux or its tmux session is gone.");
        lines << i18n("Use 'x' to remove it from the list.");
        lines << QString();
        lines << i18n("[press any key]");
        break;
    case MonitorModel::ConfirmKind::None:
        return;
    }
    drawBox(lines);
}

void TerminalScreen::drawFilterMenu(const MonitorModel &model)
{
    QStringList lines;
    lines << i18n("Filter by status");
    lines << QString();
    const QList<MonitorModel::FilterOption> &options = MonitorModel::filterOptions();
    for (int i = 0; i < options.size(); ++i) {
        const QString marker = (i == model.filterCursor()) ? QStringLiteral("> ") : QStringLiteral("  ");
        const QString check = model.isFilterOptionChecked(i) ? QStringLiteral("[x] ") : QStringLiteral("[ ] ");
        lines << marker + check + options.at(i).label;
    }
    lines << QString();
    lines << i18n("space toggle • enter apply • esc cancel");
    drawBox(lines);
}

void TerminalScreen::drawBox(const QStringList &lines)
{
    int boxWidth = 0;
    for (const QString &line : lines) {
        boxWidth = qMax(boxWidth, static_cast<int>(line.size()));
    }
    boxWidth = qMin(boxWidth + 4, COLS);
    const int boxHeight = qMin(static_cast<int>(lines.size()) + 2, LINES);
    const int top = qMax((LINES - boxHeight) / 2, 0);
    const int left = qMax((COLS - boxWidth) / 2, 0);

    const int attributes = m_colors ? COLOR_PAIR(PairDialog) : A_REVERSE;
    attron(attributes);
    for (int row = 0; row < boxHeight; ++row) {
        mvhline(top + row, left, ' ', boxWidth);
    }
    attroff(attributes);

    for (int i = 0; i < lines.size() && i + 1 < boxHeight; ++i) {
        put(top + 1 + i, left + 2, lines.at(i), boxWidth - 4, attributes);
    }
}

void TerminalScreen::drawHelp()
{
    const QList<QPair<QString, QStringList>> groups = {
        {i18n("Navigation"), {i18n("↑/k, ↓/j    Move selection"), i18n("PgUp/PgDn   Scroll a page"), i18n("g/G         First / last session")}},
        {i18n("Search"),
         {i18n("/           Start search"),
          i18n("Esc         Clear search, then leave"),
          i18n("Enter       Leave search, keep filter"),
          i18n("Ctrl+U      Clear search text")}},
        {i18n("Actions"),
         {i18n("Enter       Attach (focus if attached elsewhere)"),
          i18n("a           Attach, detaching other clients"),
          i18n("n           New session in current directory"),
          i18n("x/Del       Kill session"),
          i18n("d           Detach all clients"),
          i18n("r           Refresh"),
          i18n("q/Esc       Quit")}},
        {i18n("Filtering"), {i18n("f           Filter by status")}},
        {i18n("Sorting"), {i18n("1-5, F1-F5   Sort by ID, directory, status, age, updated")}},
        {i18n("Session Indicators"), {i18n("⚡          Attached"), i18n("▷           Detached"), i18n("◉           No live tmux session")}},
    };

    int row = 0;
    put(row++, 0, i18n("claudemux watch - keys"), -1, A_BOLD);
    ++row;
    for (const auto &group : groups) {
        put(row++, 0, group.first, -1, A_BOLD | (m_colors ? COLOR_PAIR(PairHeader) : 0));
        for (const QString &line : group.second) {
            put(row++, 2, line);
        }
        ++row;
    }
    put(LINES - 1, 0, i18n("[press any key]"), -1, A_DIM);
}

} // namespace Claudemux
