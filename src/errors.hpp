#pragma once
#include <stdexcept>
#include <string>

// Bad dimensions, seeds, patterns or flags. Raised before any simulation starts.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// The terminal could not be set up, is too small, or stopped accepting output.
class RenderFailure : public std::runtime_error {
public:
    explicit RenderFailure(const std::string& what) : std::runtime_error(what) {}
};
