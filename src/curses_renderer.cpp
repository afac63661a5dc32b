#include "curses_renderer.hpp"
#define NCURSES_NOMACROS // real functions for move(), erase() etc., so std::move still works
#include <curses.h>
#include <cstdio>
#include <sstream>
#include <utility>
#include "errors.hpp"

std::vector<std::string> format_board(const Snapshot& snapshot) {
    std::vector<std::string> lines;
    lines.reserve(snapshot.size());
    for (const auto& row : snapshot) {
        std::string line;
        line.reserve(row.size());
        for (bool cell : row)
            line += cell ? LIVE_SLOT : OPEN_SLOT;
        lines.push_back(line);
    }
    return lines;
}

int count_live(const Snapshot& snapshot) {
    int count = 0;
    for (const auto& row : snapshot)
        for (bool cell : row)
            if (cell) count++;
    return count;
}

std::string format_status(long generation, int live_cells, RunState state) {
    std::ostringstream oss;
    oss << "gen " << generation << "  live " << live_cells << "  ";
    switch (state) {
        case RunState::Running: oss << "[running]"; break;
        case RunState::Paused:  oss << "[paused] "; break;
        case RunState::Stopped: oss << "[stopped]"; break;
    }
    oss << "  p: pause/resume  q: quit";
    return oss.str();
}

void check_board_fits(int terminal_rows, int terminal_cols, int board_rows, int board_cols) {
    if (board_rows < terminal_rows && board_cols <= terminal_cols)
        return;
    std::ostringstream oss;
    oss << "terminal is " << terminal_rows << "x" << terminal_cols << ", need at least "
        << static_cast<long long>(board_rows) + 1 << "x" << board_cols;
    throw RenderFailure(oss.str());
}

InputSignal signal_for_key(int key) {
    switch (key) {
        case 'p':
        case 'P':
        case ' ':
            return InputSignal::ToggleRun;
        case 'q':
        case 'Q':
        case 27: // Escape
            return InputSignal::Quit;
        default:
            return InputSignal::None;
    }
}

/* TerminalSession */

TerminalSession::TerminalSession(int board_rows, int board_cols) : scr(nullptr) {
    scr = newterm(nullptr, stdout, stdin);
    if (scr == nullptr)
        throw RenderFailure("cannot initialise the terminal (is TERM set?)");
    set_term(scr);
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0); // not every terminal can hide its cursor

    int height, width;
    getmaxyx(stdscr, height, width);
    try {
        check_board_fits(height, width, board_rows, board_cols);
    } catch (const RenderFailure&) {
        endwin();
        delscreen(scr);
        throw;
    }
}

TerminalSession::~TerminalSession() {
    endwin();
    delscreen(scr);
}

void TerminalSession::show(const std::vector<std::string>& lines, const std::string& status) {
    if (erase() == ERR)
        throw RenderFailure("terminal refused to clear the screen");
    int width = getmaxx(stdscr);
    int row = 0;
    for (const auto& line : lines)
        mvaddnstr(row++, 0, line.c_str(), width);
    // the status line stays off the last column so curses never scrolls.
    mvaddnstr(row, 0, status.c_str(), width - 1);
    if (refresh() == ERR)
        throw RenderFailure("terminal refused to refresh the screen");
}

void TerminalSession::place_cursor(int row, int col) {
    curs_set(1);
    move(row, col);
    refresh();
}

void TerminalSession::hide_cursor() {
    curs_set(0);
}

int TerminalSession::read_key(std::chrono::milliseconds wait) {
    timeout(wait.count() < 0 ? -1 : static_cast<int>(wait.count()));
    int key = getch();
    return key == ERR ? -1 : key;
}

/* CursesRenderer */

CursesRenderer::CursesRenderer(std::unique_ptr<TerminalSession> session)
    : session(std::move(session))
{
    if (!this->session)
        throw RenderFailure("CursesRenderer: no terminal session");
    this->session->hide_cursor();
}

void CursesRenderer::draw(long generation, const Snapshot& snapshot, RunState state) {
    session->show(format_board(snapshot), format_status(generation, count_live(snapshot), state));
}

InputSignal CursesRenderer::poll(std::chrono::milliseconds wait) {
    // keys without a meaning must not shorten the tick, so keep waiting until the deadline.
    auto deadline = std::chrono::steady_clock::now() + wait;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return InputSignal::None;
        int key = session->read_key(remaining);
        if (key == -1)
            return InputSignal::None;
        InputSignal signal = signal_for_key(key);
        if (signal != InputSignal::None)
            return signal;
    }
}
