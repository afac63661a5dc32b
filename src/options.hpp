#pragma once
#include <string>
#include <vector>
#include "driver.hpp"
#include "seed.hpp"

enum class SeedSource {
    Random,
    Pattern,
    Editor
};

struct Options {
    int rows = 8;
    int cols = 8;
    SeedSource source = SeedSource::Random;
    RandomFill fill;
    bool fill_seed_given = false; // otherwise fill.seed comes from std::random_device
    std::string pattern_path;
    DriverConfig driver;
    bool show_help = false;

    void print() const;
};

// Parse argv with getopt_long. Throws ConfigurationError naming the offending flag.
Options parse_options(int argc, char* argv[]);

// Convenience overload for tests.
Options parse_options(const std::vector<std::string>& args);

std::string usage(const std::string& program);
