#pragma once
#include <array>
#include <optional>
#include <utility>

/* POSITION: (row, col) coordinates on the board, or sometimes an offset between two of them */
using Position = std::pair<int, int>;

inline Position operator +(Position p1, Position p2) {
    return {p1.first + p2.first, p1.second + p2.second};
}

inline Position operator -(Position p1, Position p2) {
    return {p1.first - p2.first, p1.second - p2.second};
}


/*
DIRECTION: the eight compass directions of the Moore neighborhood.

  NW (-1,-1) | N (-1, 0) | NE (-1, 1)
  -----------------------------------
  W  ( 0,-1) |     c     | E  ( 0, 1)
  -----------------------------------
  SW ( 1,-1) | S ( 1, 0) | SE ( 1, 1)
*/
enum class Direction { NW, N, NE, W, E, SW, S, SE };

constexpr std::array<Direction, 8> ALL_DIRECTIONS = {
    Direction::NW, Direction::N, Direction::NE, Direction::W,
    Direction::E, Direction::SW, Direction::S, Direction::SE
};

inline Position offset(Direction d) {
    switch (d) {
        case Direction::NW: return {-1, -1};
        case Direction::N:  return {-1, 0};
        case Direction::NE: return {-1, 1};
        case Direction::W:  return {0, -1};
        case Direction::E:  return {0, 1};
        case Direction::SW: return {1, -1};
        case Direction::S:  return {1, 0};
        case Direction::SE: return {1, 1};
    }
    return {0, 0};
}

/* BOUNDS: the board is always [0, rows) x [0, cols). */

inline bool in_bounds(Position p, int rows, int cols) {
    auto [row, col] = p;
    return row >= 0 && row < rows && col >= 0 && col < cols;
}

// The neighbor of p in direction d, or nothing if it would leave the board.
inline std::optional<Position> step_in_bounds(Position p, Direction d, int rows, int cols) {
    Position next = p + offset(d);
    if (!in_bounds(next, rows, cols))
        return std::nullopt;
    return next;
}
