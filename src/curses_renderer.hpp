#pragma once
/*
Terminal front end built on ncurses.

TerminalSession is the process-wide curses screen as a scoped resource: the constructor takes
over the terminal and the destructor gives it back, on every exit path. CursesRenderer owns a
session and implements the Renderer contract on top of it.
*/

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "renderer.hpp"

constexpr char LIVE_SLOT = 'O';
constexpr char OPEN_SLOT = '_';

// One text line per board row.
std::vector<std::string> format_board(const Snapshot& snapshot);
std::string format_status(long generation, int live_cells, RunState state);
int count_live(const Snapshot& snapshot);

// Throws RenderFailure unless a board_rows x board_cols board plus its status line fits on a
// terminal_rows x terminal_cols screen.
void check_board_fits(int terminal_rows, int terminal_cols, int board_rows, int board_cols);

// ncurses SCREEN, declared here so the header does not pull in <curses.h>.
struct screen;

class TerminalSession {
    private:
        struct screen* scr;

    public:
        // Throws RenderFailure if there is no usable terminal or it cannot hold a
        // board_rows x board_cols board and the status line below it.
        TerminalSession(int board_rows, int board_cols);
        ~TerminalSession();

        TerminalSession(const TerminalSession&) = delete;
        TerminalSession& operator=(const TerminalSession&) = delete;

        // Replace the screen contents with `lines` followed by `status` on the next line.
        void show(const std::vector<std::string>& lines, const std::string& status);

        // Put the visible cursor at (row, col), or hide it.
        void place_cursor(int row, int col);
        void hide_cursor();

        // Next key, or -1 after `wait` passes without one. A negative wait blocks.
        int read_key(std::chrono::milliseconds wait);
};

class CursesRenderer : public Renderer {
    private:
        std::unique_ptr<TerminalSession> session;

    public:
        explicit CursesRenderer(std::unique_ptr<TerminalSession> session);

        void draw(long generation, const Snapshot& snapshot, RunState state) override;
        InputSignal poll(std::chrono::milliseconds wait) override;
};

// p or space pauses and resumes, q or Escape quits.
InputSignal signal_for_key(int key);
