#pragma once
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include "driver.hpp"

// Format a duration as a human-readable string: "850 ms", "12.40 s", "3m 05s", "1h 02m 09s".
inline std::string format_duration(std::chrono::milliseconds duration) {
    long long ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }
    double seconds = ms / 1000.0;
    std::ostringstream oss;
    if (seconds < 60) {
        oss << std::fixed << std::setprecision(2) << seconds << " s";
        return oss.str();
    }
    long long total_seconds = ms / 1000;
    long long hours = total_seconds / 3600;
    long long minutes = (total_seconds % 3600) / 60;
    long long secs = total_seconds % 60;
    if (hours > 0) {
        oss << hours << "h " << std::setw(2) << std::setfill('0') << minutes << "m ";
    } else {
        oss << minutes << "m ";
    }
    oss << std::setw(2) << std::setfill('0') << secs << "s";
    return oss.str();
}

// One line printed after the terminal has been handed back.
inline std::string format_summary(const RunSummary& summary) {
    std::ostringstream oss;
    oss << "Game over after " << summary.generation << " generations ("
        << summary.live_cells << " live cells, " << to_string(summary.reason) << ", "
        << format_duration(summary.elapsed) << ")";
    return oss.str();
}
