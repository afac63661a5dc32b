#include "seed.hpp"
#include <cctype>
#include <fstream>
#include <random>
#include <sstream>
#include "errors.hpp"

std::set<Position> random_seed(int rows, int cols, const RandomFill& fill) {
    if (fill.density < 0.0 || fill.density > 1.0)
        throw ConfigurationError("density must be within [0, 1], got " + std::to_string(fill.density));
    std::mt19937 rng(fill.seed);
    std::bernoulli_distribution alive(fill.density);
    std::set<Position> on_cells;
    for (int row = 0; row < rows; row++) {
        for (int col = 0; col < cols; col++) {
            if (alive(rng))
                on_cells.insert({row, col});
        }
    }
    return on_cells;
}

namespace {

void check_extent(long long extent, size_t offset) {
    if (extent > MAX_PATTERN_EXTENT)
        throw ConfigurationError("pattern run at offset " + std::to_string(offset) +
                                 " reaches past " + std::to_string(MAX_PATTERN_EXTENT) + " cells");
}

}

PatternSeed parse_rle(const std::string& rle) {
    PatternSeed pattern;
    int row = 0;
    int col = 0;
    int max_col = 0;
    int rows_used = 0; // rows up to and including the last one holding a run
    long long count = 0;
    size_t i = 0;
    while (i < rle.size()) {
        char c = rle[i];
        if (count == 0 && (c == 'x' || c == '#')) { // skip header and comments.
            while (i < rle.size() && rle[i] != '\n') i++;
            i++;
            continue;
        }
        if (c >= '0' && c <= '9') {
            count = count * 10 + (c - '0');
            check_extent(count, i);
            i++;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            i++;
            continue;
        }
        if (count == 0) count = 1;
        if (c == 'b' || c == 'o') {
            check_extent(col + count, i);
            if (c == 'o') {
                for (long long j = 0; j < count; j++)
                    pattern.on_cells.insert(Position(row, col + static_cast<int>(j)));
            }
            col += static_cast<int>(count);
            rows_used = row + 1;
        } else if (c == '$') {
            check_extent(row + count, i);
            row += static_cast<int>(count);
            col = 0;
        } else if (c == '!') {
            break;
        } else {
            throw ConfigurationError(std::string("unexpected character '") + c +
                                     "' in pattern at offset " + std::to_string(i));
        }
        if (col > max_col) max_col = col;
        count = 0;
        i++;
    }
    pattern.height = rows_used;
    pattern.width = max_col;
    return pattern;
}

std::set<Position> place_pattern(const PatternSeed& pattern, int rows, int cols, bool centered) {
    if (pattern.height > rows || pattern.width > cols) {
        std::ostringstream oss;
        oss << "pattern of size " << pattern.height << "x" << pattern.width
            << " does not fit on a " << rows << "x" << cols << " board";
        throw ConfigurationError(oss.str());
    }
    Position origin = {0, 0};
    if (centered)
        origin = {(rows - pattern.height) / 2, (cols - pattern.width) / 2};
    std::set<Position> placed;
    for (const auto& p : pattern.on_cells)
        placed.insert(p + origin);
    return placed;
}

std::string read_pattern_file(const std::string& path) {
    std::ifstream in(path);
    if (!in)
        throw ConfigurationError("cannot open pattern file " + path);
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}
