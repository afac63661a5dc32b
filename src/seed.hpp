#pragma once
/*
Seeds: the initial live cells of a board.

- random_seed: every cell alive independently with probability `density`.
- parse_rle: a run-length pattern description (b = dead, o = alive, $ = next row, ! = end),
  placed on the board with place_pattern.
*/

#include <set>
#include <string>
#include "geometry.hpp"

// Longest run, and widest or tallest pattern, parse_rle accepts.
constexpr int MAX_PATTERN_EXTENT = 1 << 16;

struct RandomFill {
    double density = 0.5;
    unsigned int seed = 0;
};

struct PatternSeed {
    std::set<Position> on_cells; // relative to the pattern's top-left corner
    int height = 0;
    int width = 0;
};

std::set<Position> random_seed(int rows, int cols, const RandomFill& fill);

// Throws ConfigurationError on unknown characters or a pattern beyond MAX_PATTERN_EXTENT.
// Trailing blank rows do not count towards the height.
PatternSeed parse_rle(const std::string& rle);

// Translate a pattern onto a rows x cols board, either centered or at the top-left corner.
std::set<Position> place_pattern(const PatternSeed& pattern, int rows, int cols, bool centered = true);

std::string read_pattern_file(const std::string& path);
