#pragma once

#include "live_session.hpp"
#include "saved_session.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

// Render-ready strings for one table row.
struct LiveRow {
    std::string pid;
    std::string directory;
    std::string terminal;
    std::string uptime;
    std::string status;
    bool running = false;
};

struct SavedRow {
    std::string ordinal;
    std::string id;
    std::string directory;
    std::string last_activity;
    std::string summary;
};

// "2d 3h", "4h 12m", "7m"
std::string format_uptime(std::chrono::seconds uptime);

// Keeps the tail of long paths: "...rest/of/path". Empty path gives "N/A".
std::string shorten_path(const std::string& path, size_t max_length);

// Local time, "HH:MM:SS".
std::string format_clock(std::chrono::system_clock::time_point tp);

// Local time, "YYYY-MM-DD HH:MM".
std::string format_last_activity(std::chrono::system_clock::time_point tp);

// Rows are ordered by pid.
std::vector<LiveRow> make_live_rows(const std::vector<LiveSession>& sessions, size_t path_width);
std::vector<SavedRow> make_saved_rows(const std::vector<SavedSession>& sessions, size_t path_width);
