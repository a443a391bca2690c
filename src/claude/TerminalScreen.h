/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALSCREEN_H
#define TERMINALSCREEN_H

#include "MonitorModel.h"

#include <QList>
#include <QString>

typedef struct screen SCREEN;

namespace Claudemux
{

/**
 * TerminalScreen draws a MonitorModel with ncurses and decodes keys.
 *
 * The terminal is in curses mode for the lifetime of the object and is
 * restored on destruction, so it must be destroyed before handing the
 * terminal to tmux.
 */
class TerminalScreen
{
public:
    TerminalScreen();
    ~TerminalScreen();

    TerminalScreen(const TerminalScreen &) = delete;
    TerminalScreen &operator=(const TerminalScreen &) = delete;

    /**
     * False if the terminal could not be initialized (e.g. stdout is not a tty)
     */
    bool isActive() const
    {
        return m_screen != nullptr;
    }

    int height() const;
    int width() const;

    /**
     * Drain every key currently buffered on stdin without blocking
     */
    QList<MonitorModel::Key> readKeys();

    /**
     * Pick up a new terminal size after SIGWINCH
     */
    void handleResize();

    void render(const MonitorModel &model);

    /**
     * Map a get_wch() result to a monitor key
     */
    static MonitorModel::Key translateKey(int result, unsigned int code);

private:
    void drawHeader(const MonitorModel &model);
    void drawTable(const MonitorModel &model);
    void drawFooter(const MonitorModel &model);
    void drawConfirm(const MonitorModel &model);
    void drawFilterMenu(const MonitorModel &model);
    void drawHelp();
    void drawBox(const QStringList &lines);
    void put(int row, int column, const QString &text, int maxWidth = -1, int attributes = 0);

    SCREEN *m_screen = nullptr;
    bool m_colors = false;
};

} // namespace Claudemux

#endif // TERMINALSCREEN_H
