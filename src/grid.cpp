#include "grid.hpp"
#include <sstream>
#include <utility>
#include "errors.hpp"

namespace {

void check_dimensions(int rows, int cols) {
    if (rows <= 0 || cols <= 0) {
        std::ostringstream oss;
        oss << "grid dimensions must be positive, got " << rows << "x" << cols;
        throw ConfigurationError(oss.str());
    }
}

}

Grid::Grid(int rows, int cols, const std::set<Position>& seed)
    : num_rows(rows), num_cols(cols), gen(0), changed(false)
{
    check_dimensions(rows, cols);
    place_seed(seed);
}

Grid::Grid(int rows, int cols, const RandomFill& fill)
    : num_rows(rows), num_cols(cols), gen(0), changed(false)
{
    check_dimensions(rows, cols);
    place_seed(random_seed(rows, cols, fill));
}

void Grid::place_seed(const std::set<Position>& seed) {
    current.assign(num_rows, std::vector<bool>(num_cols, false));
    next = current;
    for (const auto& p : seed) {
        if (!in_bounds(p, num_rows, num_cols)) {
            std::ostringstream oss;
            oss << "seed position (" << p.first << ", " << p.second << ") lies outside the "
                << num_rows << "x" << num_cols << " grid";
            throw ConfigurationError(oss.str());
        }
        current[p.first][p.second] = true;
    }
}

bool Grid::is_alive(int row, int col) const {
    if (!in_bounds({row, col}, num_rows, num_cols))
        return false;
    return current[row][col];
}

int Grid::count_live_neighbors(int row, int col) const {
    int live_neighbors = 0;
    for (Direction d : ALL_DIRECTIONS) {
        auto [r, c] = Position(row, col) + offset(d);
        if (is_alive(r, c))
            live_neighbors++;
    }
    return live_neighbors;
}

int Grid::live_count() const {
    int count = 0;
    for (const auto& row : current)
        for (bool cell : row)
            if (cell) count++;
    return count;
}

void Grid::advance() {
    bool any_changed = false;
    for (int row = 0; row < num_rows; row++) {
        for (int col = 0; col < num_cols; col++) {
            int live_neighbors = count_live_neighbors(row, col);
            bool currently_alive = current[row][col];
            bool alive = (currently_alive && live_neighbors == 2) || live_neighbors == 3;
            next[row][col] = alive;
            if (alive != currently_alive)
                any_changed = true;
        }
    }
    std::swap(current, next);
    changed = any_changed;
    gen++;
}
