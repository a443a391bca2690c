/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef MONITORMODEL_H
#define MONITORMODEL_H

#include "SessionRecord.h"
#include "SessionView.h"

#include <QList>
#include <QString>

namespace Claudemux
{

/**
 * Monitor state carried across attach cycles
 */
struct WatchState {
    SortSpec sort;
    StatusFilter filter;
    QString search;
    QString selectedId;
    int cursor = 0;
    QString message; // Shown once, e.g. the error of the last attach
};

/**
 * MonitorModel is the terminal-independent state of the session monitor.
 *
 * It owns the record list, the visible (filtered, sorted, searched) view,
 * the cursor and viewport, and the modal sub-state. Keys go in through
 * handleKey(), actions the caller has to carry out come back out.
 * Nothing here touches tmux, the store or the terminal.
 */
class MonitorModel
{
public:
    enum class Mode {
        Browse,
        Search,
        FilterMenu,
        Confirm,
        Help,
    };

    enum class ConfirmKind {
        None,
        Kill,
        Detach,
        AttachForce,
        NoTmux, // Informational, any key closes it
    };

    struct Key {
        enum Code {
            None,
            Character,
            Up,
            Down,
            PageUp,
            PageDown,
            Home,
            End,
            Enter,
            Escape,
            Backspace,
            Delete,
            Interrupt, // Ctrl+C
            ClearLine, // Ctrl+U
            Function,  // F1..F12, see number
            Resize,
        };

        Code code = None;
        uint character = 0;
        int number = 0;

        static Key of(Code code, int number = 0)
        {
            Key key;
            key.code = code;
            key.number = number;
            return key;
        }

        static Key fromCharacter(uint character)
        {
            Key key;
            key.code = Character;
            key.character = character;
            return key;
        }

        bool is(char c) const
        {
            return code == Character && character == static_cast<uint>(c);
        }
    };

    struct Action {
        enum Kind {
            None,
            Quit,
            Attach,
            FocusOnly,
            CreateNew,
            Kill,
            Detach,
            Refresh,
        };

        Kind kind = None;
        QString sessionId;
        bool force = false;

        /**
         * True for actions that leave the monitor
         */
        bool endsMonitor() const
        {
            return kind == Quit || kind == Attach || kind == FocusOnly || kind == CreateNew;
        }
    };

    struct FilterOption {
        bool all;
        SessionStatus status;
        QString label;
    };

    explicit MonitorModel(const WatchState &state = WatchState());

    /**
     * Snapshot for the next monitor cycle
     */
    WatchState state() const;

    /**
     * Rows shown for a terminal of @p terminalHeight lines
     */
    static int viewportHeightFor(int terminalHeight);

    static const QList<FilterOption> &filterOptions();

    /**
     * Replace every record (full refresh)
     */
    void setRecords(const SessionRecordList &records);

    /**
     * Insert or replace a single record
     */
    void updateRecord(const SessionRecord &record);

    void removeRecord(const QString &id);

    bool hasRecord(const QString &id) const;

    Action handleKey(const Key &key);

    Mode mode() const
    {
        return m_mode;
    }

    ConfirmKind confirmKind() const
    {
        return m_confirm;
    }

    QString confirmSessionId() const
    {
        return m_confirmId;
    }

    const SessionRecordList &records() const
    {
        return m_records;
    }

    const SessionRecordList &visibleRecords() const
    {
        return m_visible;
    }

    /**
     * Number of records passing the status filter, before search
     */
    int filteredCount() const
    {
        return m_filteredCount;
    }

    int cursor() const
    {
        return m_cursor;
    }

    const SessionRecord *selectedRecord() const;

    void setViewportHeight(int rows);

    int viewportHeight() const
    {
        return m_viewportHeight;
    }

    int scrollOffset() const
    {
        return m_scrollOffset;
    }

    const SortSpec &sort() const
    {
        return m_sort;
    }

    const StatusFilter &filter() const
    {
        return m_filter;
    }

    QString search() const
    {
        return m_search;
    }

    int filterCursor() const
    {
        return m_filterCursor;
    }

    bool isFilterOptionChecked(int index) const;

    QString message() const
    {
        return m_message;
    }

    void setMessage(const QString &message)
    {
        m_message = message;
    }

private:
    Action handleBrowseKey(const Key &key);
    Action handleSearchKey(const Key &key);
    Action handleFilterKey(const Key &key);
    Action handleConfirmKey(const Key &key);

    void rebuild();
    void moveCursor(int delta);
    void setCursor(int index);
    void ensureCursorVisible();
    void openConfirm(ConfirmKind kind, const QString &sessionId);
    void openFilterMenu();
    void toggleFilterOption(int index);
    void applyFilterMenu();

    SessionRecordList m_records;
    SessionRecordList m_visible;
    int m_filteredCount = 0;

    SortSpec m_sort;
    StatusFilter m_filter;
    QString m_search;
    QString m_selectedId;
    QString m_message;

    Mode m_mode = Mode::Browse;
    ConfirmKind m_confirm = ConfirmKind::None;
    QString m_confirmId;

    QList<bool> m_filterChecked;
    int m_filterCursor = 0;

    int m_cursor = 0;
    int m_scrollOffset = 0;
    int m_viewportHeight = 10;
};

} // namespace Claudemux

#endif // MONITORMODEL_H
