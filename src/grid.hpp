#pragma once
/*
Grid: a fixed rows x cols board evolving under B3/S23 with hard borders.

Cells outside [0, rows) x [0, cols) do not exist and always read as dead, so edge and corner
cells only ever see their in-bounds neighbors. advance() computes the whole next generation
into a second buffer from the current one and then swaps the two, so no cell ever observes
a neighbor's already-updated state.
*/

#include <set>
#include <vector>
#include "geometry.hpp"
#include "seed.hpp"

// Row-major copy of the cell states, snapshot[row][col].
using Snapshot = std::vector<std::vector<bool>>;

class Grid {
    private:
        int num_rows;
        int num_cols;
        long gen;
        bool changed; // did the last advance() flip any cell?
        std::vector<std::vector<bool>> current;
        std::vector<std::vector<bool>> next;

        void place_seed(const std::set<Position>& seed);

    public:
        // Throws ConfigurationError on non-positive dimensions or an out-of-range seed position.
        Grid(int rows, int cols, const std::set<Position>& seed);
        Grid(int rows, int cols, const RandomFill& fill);

        int rows() const { return num_rows; }
        int cols() const { return num_cols; }
        long generation() const { return gen; }

        bool is_alive(int row, int col) const;
        int count_live_neighbors(int row, int col) const;
        int live_count() const;

        void advance();

        // True once an advance() left every cell unchanged.
        bool is_stable() const { return gen > 0 && !changed; }

        Snapshot snapshot() const { return current; }
};
