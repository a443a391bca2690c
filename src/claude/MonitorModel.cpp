/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "MonitorModel.h"

#include <KLocalizedString>

namespace Claudemux
{

namespace
{
constexpr int ReservedLines = 10;
constexpr int MinimumViewport = 5;
}

MonitorModel::MonitorModel(const WatchState &state)
    : m_sort(state.sort)
    , m_filter(state.filter)
    , m_search(state.search)
    , m_selectedId(state.selectedId)
    , m_message(state.message)
    , m_cursor(qMax(state.cursor, 0))
{
}

WatchState MonitorModel::state() const
{
    WatchState state;
    state.sort = m_sort;
    state.filter = m_filter;
    state.search = m_search;
    state.cursor = m_cursor;
    if (const SessionRecord *record = selectedRecord()) {
        state.selectedId = record->id;
    }
    return state;
}

int MonitorModel::viewportHeightFor(int terminalHeight)
{
    return qMax(terminalHeight - ReservedLines, MinimumViewport);
}

const QList<MonitorModel::FilterOption> &MonitorModel::filterOptions()
{
    static const QList<FilterOption> options = {
        {true, SessionStatus::Running, i18n("All (no filter)")},
        {false, SessionStatus::Idle, i18n("Idle")},
        {false, SessionStatus::Working, i18n("Working")},
        {false, SessionStatus::AwaitingPermission, i18n("Awaiting permission")},
        {false, SessionStatus::AwaitingInput, i18n("Awaiting input")},
        {false, SessionStatus::Exited, i18n("Exited")},
    };
    return options;
}

void MonitorModel::setRecords(const SessionRecordList &records)
{
    m_records = records;
    rebuild();
}

void MonitorModel::updateRecord(const SessionRecord &record)
{
    for (SessionRecord &existing : m_records) {
        if (existing.id == record.id) {
            existing = record;
            rebuild();
            return;
        }
    }
    m_records.append(record);
    rebuild();
}

void MonitorModel::removeRecord(const QString &id)
{
    for (int i = 0; i < m_records.size(); ++i) {
        if (m_records.at(i).id == id) {
            m_records.removeAt(i);
            rebuild();
            return;
        }
    }
}

bool MonitorModel::hasRecord(const QString &id) const
{
    for (const SessionRecord &record : m_records) {
        if (record.id == id) {
            return true;
        }
    }
    return false;
}

const SessionRecord *MonitorModel::selectedRecord() const
{
    if (m_cursor < 0 || m_cursor >= m_visible.size()) {
        return nullptr;
    }
    return &m_visible.at(m_cursor);
}

void MonitorModel::setViewportHeight(int rows)
{
    m_viewportHeight = qMax(rows, 1);
    ensureCursorVisible();
}

bool MonitorModel::isFilterOptionChecked(int index) const
{
    return index >= 0 && index < m_filterChecked.size() && m_filterChecked.at(index);
}

void MonitorModel::rebuild()
{
    // Keep the selection on the same session when rows move
    if (const SessionRecord *record = selectedRecord()) {
        m_selectedId = record->id;
    }

    SessionRecordList filtered;
    for (const SessionRecord &record : std::as_const(m_records)) {
        if (m_filter.accepts(record)) {
            filtered.append(record);
        }
    }
    m_filteredCount = filtered.size();

    m_visible.clear();
    for (const SessionRecord &record : std::as_const(filtered)) {
        if (matchesSearch(record, m_search)) {
            m_visible.append(record);
        }
    }
    sortRecords(m_visible, m_sort);

    int index = -1;
    if (!m_selectedId.isEmpty()) {
        for (int i = 0; i < m_visible.size(); ++i) {
            if (m_visible.at(i).id == m_selectedId) {
                index = i;
                break;
            }
        }
    }
    setCursor(index >= 0 ? index : m_cursor);
}

void MonitorModel::setCursor(int index)
{
    if (m_visible.isEmpty()) {
        m_cursor = 0;
    } else {
        m_cursor = qBound(0, index, m_visible.size() - 1);
        m_selectedId = m_visible.at(m_cursor).id;
    }
    ensureCursorVisible();
}

void MonitorModel::moveCursor(int delta)
{
    setCursor(m_cursor + delta);
}

void MonitorModel::ensureCursorVisible()
{
    if (m_cursor < m_scrollOffset) {
        m_scrollOffset = m_cursor;
    } else if (m_cursor >= m_scrollOffset + m_viewportHeight) {
        m_scrollOffset = m_cursor - m_viewportHeight + 1;
    }
    m_scrollOffset = qBound(0, m_scrollOffset, qMax(0, m_visible.size() - m_viewportHeight));
}

void MonitorModel::openConfirm(ConfirmKind kind, const QString &sessionId)
{
    m_mode = Mode::Confirm;
    m_confirm = kind;
    m_confirmId = sessionId;
}

MonitorModel::Action MonitorModel::handleKey(const Key &key)
{
    if (key.code == Key::None || key.code == Key::Resize) {
        return Action();
    }

    switch (m_mode) {
    case Mode::Help:
        m_mode = Mode::Browse;
        return Action();
    case Mode::Confirm:
        return handleConfirmKey(key);
    case Mode::Search:
        return handleSearchKey(key);
    case Mode::FilterMenu:
        return handleFilterKey(key);
    case Mode::Browse:
        break;
    }
    return handleBrowseKey(key);
}

MonitorModel::Action MonitorModel::handleBrowseKey(const Key &key)
{
    m_message.clear();

    Action action;
    const SessionRecord *selected = selectedRecord();

    if (key.is('q') || key.code == Key::Interrupt) {
        action.kind = Action::Quit;
        return action;
    }

    if (key.code == Key::Escape) {
        if (!m_search.isEmpty()) {
            m_search.clear();
            rebuild();
        } else {
            action.kind = Action::Quit;
        }
        return action;
    }

    if (key.code == Key::Up || key.is('k')) {
        moveCursor(-1);
    } else if (key.code == Key::Down || key.is('j')) {
        moveCursor(1);
    } else if (key.code == Key::PageUp) {
        moveCursor(-m_viewportHeight);
    } else if (key.code == Key::PageDown) {
        moveCursor(m_viewportHeight);
    } else if (key.code == Key::Home || key.is('g')) {
        setCursor(0);
    } else if (key.code == Key::End || key.is('G')) {
        setCursor(m_visible.size() - 1);
    } else if (key.is('/')) {
        m_mode = Mode::Search;
    } else if (key.code == Key::Enter) {
        if (!selected) {
            return action;
        }
        if (!selected->tmuxAlive) {
            openConfirm(ConfirmKind::NoTmux, selected->id);
        } else if (selected->attachedClients > 0) {
            action.kind = Action::FocusOnly;
            action.sessionId = selected->id;
        } else {
            action.kind = Action::Attach;
            action.sessionId = selected->id;
        }
    } else if (key.is('a')) {
        // Attach even if another terminal holds the session
        if (!selected) {
            return action;
        }
        if (!selected->tmuxAlive) {
            openConfirm(ConfirmKind::NoTmux, selected->id);
        } else if (selected->attachedClients > 0) {
            openConfirm(ConfirmKind::AttachForce, selected->id);
        } else {
            action.kind = Action::Attach;
            action.sessionId = selected->id;
        }
    } else if (key.code == Key::Delete || key.code == Key::Backspace || key.is('x')) {
        if (selected) {
            openConfirm(ConfirmKind::Kill, selected->id);
        }
    } else if (key.is('d')) {
        if (selected && selected->tmuxAlive && selected->attachedClients > 0) {
            openConfirm(ConfirmKind::Detach, selected->id);
        }
    } else if (key.is('f')) {
        openFilterMenu();
    } else if (key.is('h') || key.is('?')) {
        m_mode = Mode::Help;
    } else if (key.is('r')) {
        action.kind = Action::Refresh;
    } else if (key.is('n')) {
        action.kind = Action::CreateNew;
    } else {
        static const SortColumn columns[] = {SortColumn::Id, SortColumn::Directory, SortColumn::Status, SortColumn::Age, SortColumn::Updated};
        int column = 0;
        if (key.code == Key::Character && key.character >= '1' && key.character <= '5') {
            column = static_cast<int>(key.character - '0');
        } else if (key.code == Key::Function && key.number >= 1 && key.number <= 5) {
            column = key.number;
        }
        if (column > 0) {
            m_sort.toggle(columns[column - 1]);
            rebuild();
        }
    }

    return action;
}

MonitorModel::Action MonitorModel::handleSearchKey(const Key &key)
{
    Action action;

    switch (key.code) {
    case Key::Interrupt:
        action.kind = Action::Quit;
        return action;
    case Key::Escape:
        if (!m_search.isEmpty()) {
            m_search.clear();
            rebuild();
        } else {
            m_mode = Mode::Browse;
        }
        return action;
    case Key::Enter:
        m_mode = Mode::Browse;
        return action;
    case Key::Up:
        m_mode = Mode::Browse;
        moveCursor(-1);
        return action;
    case Key::Down:
        m_mode = Mode::Browse;
        moveCursor(1);
        return action;
    case Key::Backspace:
    case Key::Delete:
        if (!m_search.isEmpty()) {
            m_search.chop(1);
            rebuild();
        }
        return action;
    case Key::ClearLine:
        m_search.clear();
        rebuild();
        return action;
    case Key::Character:
        if (key.character >= 32 && key.character != 127) {
            const char32_t character = key.character;
            m_search.append(QString::fromUcs4(&character, 1));
            rebuild();
        }
        return action;
    default:
        return action;
    }
}

void MonitorModel::openFilterMenu()
{
    const QList<FilterOption> &options = filterOptions();
    m_filterChecked = QList<bool>(options.size(), false);
    if (m_filter.show.isEmpty()) {
        m_filterChecked[0] = true;
    } else {
        for (int i = 1; i < options.size(); ++i) {
            m_filterChecked[i] = m_filter.show.contains(options.at(i).status);
        }
    }
    m_filterCursor = 0;
    m_mode = Mode::FilterMenu;
}

void MonitorModel::toggleFilterOption(int index)
{
    if (index < 0 || index >= m_filterChecked.size()) {
        return;
    }

    if (index == 0) {
        m_filterChecked.fill(false);
        m_filterChecked[0] = true;
        return;
    }

    m_filterChecked[index] = !m_filterChecked.at(index);
    if (m_filterChecked.at(index)) {
        m_filterChecked[0] = false;
    } else if (!m_filterChecked.contains(true)) {
        m_filterChecked[0] = true;
    }
}

void MonitorModel::applyFilterMenu()
{
    const QList<FilterOption> &options = filterOptions();
    m_filter.show.clear();
    if (!m_filterChecked.value(0)) {
        for (int i = 1; i < options.size(); ++i) {
            if (m_filterChecked.at(i)) {
                m_filter.show.append(options.at(i).status);
            }
        }
    }
    m_filter.includeExited = m_filter.show.contains(SessionStatus::Exited);
    m_mode = Mode::Browse;
    rebuild();
}

MonitorModel::Action MonitorModel::handleFilterKey(const Key &key)
{
    const int count = filterOptions().size();

    if (key.code == Key::Interrupt) {
        Action action;
        action.kind = Action::Quit;
        return action;
    }

    if (key.code == Key::Escape || key.is('q')) {
        m_mode = Mode::Browse;
    } else if (key.code == Key::Up || key.is('k')) {
        m_filterCursor = qMax(m_filterCursor - 1, 0);
    } else if (key.code == Key::Down || key.is('j')) {
        m_filterCursor = qMin(m_filterCursor + 1, count - 1);
    } else if (key.is(' ') || key.is('x')) {
        toggleFilterOption(m_filterCursor);
    } else if (key.code == Key::Enter || key.is('f')) {
        applyFilterMenu();
    }
    return Action();
}

MonitorModel::Action MonitorModel::handleConfirmKey(const Key &key)
{
    Action action;

    if (m_confirm == ConfirmKind::NoTmux) {
        m_mode = Mode::Browse;
        m_confirm = ConfirmKind::None;
        return action;
    }

    if (key.is('y') || key.is('Y')) {
        action.sessionId = m_confirmId;
        switch (m_confirm) {
        case ConfirmKind::Kill:
            action.kind = Action::Kill;
            break;
        case ConfirmKind::Detach:
            action.kind = Action::Detach;
            break;
        case ConfirmKind::AttachForce:
            action.kind = Action::Attach;
            action.force = true;
            break;
        case ConfirmKind::NoTmux:
        case ConfirmKind::None:
            break;
        }
    } else if (!(key.is('n') || key.is('N') || key.is('q') || key.is(' ') || key.code == Key::Escape || key.code == Key::Enter
                 || key.code == Key::Interrupt)) {
        return action;
    }

    m_mode = Mode::Browse;
    m_confirm = ConfirmKind::None;
    m_confirmId.clear();
    return action;
}

} // namespace Claudemux
