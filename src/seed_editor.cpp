#include "seed_editor.hpp"
#define NCURSES_NOMACROS // real functions for move(), erase() etc., so std::move still works
#include <curses.h>
#include <sstream>
#include <vector>
#include "curses_renderer.hpp"
#include "errors.hpp"

SeedEditor::SeedEditor(int rows, int cols)
    : rows(rows), cols(cols), cursor(0, 0), on_cells(), status(EditorStatus::Editing)
{
    if (rows <= 0 || cols <= 0) {
        std::ostringstream oss;
        oss << "grid dimensions must be positive, got " << rows << "x" << cols;
        throw ConfigurationError(oss.str());
    }
}

EditorStatus SeedEditor::press(EditorKey key, Direction direction) {
    if (status != EditorStatus::Editing) return status;
    switch (key) {
        case EditorKey::Move:
            if (auto next = step_in_bounds(cursor, direction, rows, cols))
                cursor = *next;
            break;
        case EditorKey::Toggle:
            if (!on_cells.erase(cursor))
                on_cells.insert(cursor);
            break;
        case EditorKey::Accept:
            status = EditorStatus::Accepted;
            break;
        case EditorKey::Abandon:
            status = EditorStatus::Abandoned;
            break;
        case EditorKey::Ignored:
            break;
    }
    return status;
}

namespace {

// Arrow keys and vi-style h/j/k/l move, space toggles, Enter accepts, q abandons.
EditorKey editor_key(int key, Direction& direction) {
    switch (key) {
        case 'k': case KEY_UP:    direction = Direction::N; return EditorKey::Move;
        case 'j': case KEY_DOWN:  direction = Direction::S; return EditorKey::Move;
        case 'h': case KEY_LEFT:  direction = Direction::W; return EditorKey::Move;
        case 'l': case KEY_RIGHT: direction = Direction::E; return EditorKey::Move;
        case ' ': return EditorKey::Toggle;
        case '\n': case '\r': case KEY_ENTER: return EditorKey::Accept;
        case 'q': case 'Q': return EditorKey::Abandon;
        default: return EditorKey::Ignored;
    }
}

Snapshot editor_board(const SeedEditor& editor) {
    Snapshot board(editor.get_rows(), std::vector<bool>(editor.get_cols(), false));
    for (const auto& [row, col] : editor.get_cells())
        board[row][col] = true;
    return board;
}

}

EditorStatus run_seed_editor(TerminalSession& session, SeedEditor& editor) {
    const std::string help = "arrows/hjkl: move  space: toggle  enter: start  q: quit";
    while (editor.get_status() == EditorStatus::Editing) {
        session.show(format_board(editor_board(editor)), help);
        auto [row, col] = editor.get_cursor();
        session.place_cursor(row, col);

        int key = session.read_key(std::chrono::milliseconds(-1));
        if (key == -1) continue;
        Direction direction = Direction::N;
        EditorKey action = editor_key(key, direction);
        editor.press(action, direction);
    }
    session.hide_cursor();
    return editor.get_status();
}
