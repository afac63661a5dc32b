#include "options.hpp"
#include <getopt.h>
#include <climits>
#include <iostream>
#include <sstream>
#include "errors.hpp"

namespace {

// Whole number in [min_value, max_value], named after its flag in any error.
long parse_number(const char* flag, const char* text, long min_value, long max_value) {
    std::string value(text);
    size_t used = 0;
    long number = 0;
    try {
        number = std::stol(value, &used);
    } catch (const std::exception&) {
        throw ConfigurationError(std::string("--") + flag + ": expected a number, got '" + value + "'");
    }
    if (used != value.size())
        throw ConfigurationError(std::string("--") + flag + ": expected a number, got '" + value + "'");
    if (number < min_value)
        throw ConfigurationError(std::string("--") + flag + " must be at least " + std::to_string(min_value));
    if (number > max_value)
        throw ConfigurationError(std::string("--") + flag + " must be at most " + std::to_string(max_value));
    return number;
}

double parse_density(const char* text) {
    std::string value(text);
    size_t used = 0;
    double density = 0.0;
    try {
        density = std::stod(value, &used);
    } catch (const std::exception&) {
        throw ConfigurationError("--density: expected a number, got '" + value + "'");
    }
    if (used != value.size())
        throw ConfigurationError("--density: expected a number, got '" + value + "'");
    if (density < 0.0 || density > 1.0)
        throw ConfigurationError("--density must be within [0, 1]");
    return density;
}

}

Options parse_options(int argc, char* argv[]) {
    Options options;
    bool edit = false;
    static struct option long_opts[] = {
        { "rows", required_argument, 0, 'r' },
        { "cols", required_argument, 0, 'c' },
        { "density", required_argument, 0, 'd' },
        { "pattern", required_argument, 0, 'p' },
        { "edit", no_argument, 0, 'e' },
        { "interval", required_argument, 0, 'i' },
        { "seed", required_argument, 0, 's' },
        { "generations", required_argument, 0, 'g' },
        { "stop-when-stable", no_argument, 0, 'S' },
        { "help", no_argument, 0, 'h' },
        { 0, 0, 0, 0 }
    };

    optind = 0; // full rescan, so parse_options can run more than once per process
    opterr = 0;
    while (true) {
        int index = 0;
        int c = getopt_long(argc, argv, "r:c:d:p:ei:s:g:Sh", long_opts, &index);
        if (c == -1)
            break;
        switch (c) {
            case 'r':
                options.rows = static_cast<int>(parse_number("rows", optarg, 1, INT_MAX));
                break;
            case 'c':
                options.cols = static_cast<int>(parse_number("cols", optarg, 1, INT_MAX));
                break;
            case 'd':
                options.fill.density = parse_density(optarg);
                break;
            case 'p':
                options.pattern_path = optarg;
                break;
            case 'e':
                edit = true;
                break;
            case 'i':
                options.driver.interval = std::chrono::milliseconds(parse_number("interval", optarg, 1, INT_MAX));
                break;
            case 's':
                options.fill.seed = static_cast<unsigned int>(parse_number("seed", optarg, 0, UINT_MAX));
                options.fill_seed_given = true;
                break;
            case 'g':
                options.driver.max_generations = parse_number("generations", optarg, 0, LONG_MAX);
                break;
            case 'S':
                options.driver.stop_when_stable = true;
                break;
            case 'h':
                options.show_help = true;
                break;
            default: {
                std::string offender = (optind > 0 && optind <= argc) ? argv[optind - 1] : "?";
                throw ConfigurationError("unknown option or missing value: " + offender);
            }
        }
    }
    if (optind < argc)
        throw ConfigurationError(std::string("unexpected argument: ") + argv[optind]);

    if (edit && !options.pattern_path.empty())
        throw ConfigurationError("--pattern and --edit cannot be combined");
    if (edit)
        options.source = SeedSource::Editor;
    else if (!options.pattern_path.empty())
        options.source = SeedSource::Pattern;
    return options;
}

Options parse_options(const std::vector<std::string>& args) {
    std::vector<std::string> storage = args;
    std::vector<char*> argv;
    for (auto& arg : storage)
        argv.push_back(&arg[0]);
    argv.push_back(nullptr);
    return parse_options(static_cast<int>(storage.size()), argv.data());
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  -r, --rows N             board height (default 8)\n"
        << "  -c, --cols N             board width (default 8)\n"
        << "  -d, --density X          share of live cells in a random seed (default 0.5)\n"
        << "  -p, --pattern FILE       seed from a run-length pattern, centered on the board\n"
        << "  -e, --edit               place the seed by hand before starting\n"
        << "  -i, --interval MS        delay between generations (default 200)\n"
        << "  -s, --seed N             random seed for a reproducible board\n"
        << "  -g, --generations N      stop after N generations (default 0 = never)\n"
        << "  -S, --stop-when-stable   stop once a generation changes nothing\n"
        << "  -h, --help               show this message\n"
        << "While running: p or space pauses and resumes, q quits.\n";
    return oss.str();
}

void Options::print() const {
    std::cout << "Options" << std::endl;
    std::cout << "  board      : " << rows << "x" << cols << std::endl;
    switch (source) {
        case SeedSource::Random:
            std::cout << "  seed       : random, density " << fill.density << ", rng seed " << fill.seed << std::endl;
            break;
        case SeedSource::Pattern:
            std::cout << "  seed       : pattern " << pattern_path << std::endl;
            break;
        case SeedSource::Editor:
            std::cout << "  seed       : interactive editor" << std::endl;
            break;
    }
    std::cout << "  interval   : " << driver.interval.count() << " ms" << std::endl;
    std::cout << "  max gens   : " << (driver.max_generations > 0 ? std::to_string(driver.max_generations) : "unlimited") << std::endl;
    std::cout << "  stop stable: " << (driver.stop_when_stable ? "true" : "false") << std::endl;
    std::cout << std::endl;
}
