#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <utility>
#include "curses_renderer.hpp"
#include "driver.hpp"
#include "errors.hpp"
#include "grid.hpp"
#include "options.hpp"
#include "report.hpp"
#include "seed.hpp"
#include "seed_editor.hpp"

namespace {

constexpr int EXIT_RENDER_FAILURE = 1;
constexpr int EXIT_CONFIGURATION_ERROR = 2;
constexpr int EXIT_INTERNAL_ERROR = 3;

// Live cells of a pattern seed, read and placed before the terminal is taken over.
std::optional<std::set<Position>> load_pattern(const Options& options) {
    if (options.source != SeedSource::Pattern)
        return std::nullopt;
    PatternSeed pattern = parse_rle(read_pattern_file(options.pattern_path));
    return place_pattern(pattern, options.rows, options.cols);
}

// Board for the random and pattern sources. Only called once the terminal session has
// accepted the board size. The editor builds its own board.
std::optional<Grid> build_grid(const Options& options, const std::optional<std::set<Position>>& pattern) {
    switch (options.source) {
        case SeedSource::Random:
            return Grid(options.rows, options.cols, options.fill);
        case SeedSource::Pattern:
            return Grid(options.rows, options.cols, *pattern);
        case SeedSource::Editor:
            break;
    }
    return std::nullopt;
}

}

int main(int argc, char* argv[]) {
    Options options;
    try {
        options = parse_options(argc, argv);
    } catch (const ConfigurationError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << usage(argv[0]);
        return EXIT_CONFIGURATION_ERROR;
    }
    if (options.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }
    if (!options.fill_seed_given)
        options.fill.seed = std::random_device{}();
    options.print();

    try {
        std::optional<std::set<Position>> pattern = load_pattern(options);
        auto session = std::make_unique<TerminalSession>(options.rows, options.cols);
        std::optional<Grid> grid = build_grid(options, pattern);
        if (!grid) {
            SeedEditor editor(options.rows, options.cols);
            if (run_seed_editor(*session, editor) == EditorStatus::Abandoned) {
                session.reset();
                std::cout << "Seed editor abandoned, nothing to simulate." << std::endl;
                return 0;
            }
            grid.emplace(options.rows, options.cols, editor.get_cells());
        }

        Driver driver(std::move(*grid), std::make_unique<CursesRenderer>(std::move(session)), options.driver);
        RunSummary summary = driver.run();
        std::cout << format_summary(summary) << std::endl;
    } catch (const ConfigurationError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return EXIT_CONFIGURATION_ERROR;
    } catch (const RenderFailure& e) {
        std::cerr << "render failure: " << e.what() << std::endl;
        return EXIT_RENDER_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << std::endl;
        return EXIT_INTERNAL_ERROR;
    }
    return 0;
}
