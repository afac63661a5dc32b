#pragma once
/*
SeedEditor: lets the user place the initial live cells by hand before the simulation starts.

A cursor starts at (0, 0) on an empty board. Movement keys step the cursor one cell and are
ignored at the border, space toggles the cell under the cursor, Enter accepts the board and
q abandons it. The class knows nothing about the terminal; run_seed_editor() feeds it keys
from a TerminalSession.
*/

#include <set>
#include "geometry.hpp"

class TerminalSession;

enum class EditorKey {
    Move,
    Toggle,
    Accept,
    Abandon,
    Ignored
};

enum class EditorStatus {
    Editing,
    Accepted,
    Abandoned
};

class SeedEditor {
    private:
        int rows;
        int cols;
        Position cursor;
        std::set<Position> on_cells;
        EditorStatus status;

    public:
        SeedEditor(int rows, int cols);

        // Direction is only read for EditorKey::Move.
        EditorStatus press(EditorKey key, Direction direction = Direction::N);

        int get_rows() const { return rows; }
        int get_cols() const { return cols; }
        Position get_cursor() const { return cursor; }
        EditorStatus get_status() const { return status; }
        const std::set<Position>& get_cells() const { return on_cells; }
        bool is_alive(Position p) const { return on_cells.count(p) > 0; }
};

// Run the editor interactively. Returns Accepted or Abandoned; the seed is left in `editor`.
EditorStatus run_seed_editor(TerminalSession& session, SeedEditor& editor);
