#pragma once

#include <chrono>
#include <string>
#include <vector>

struct SavedSession {
    std::string id;          // record file stem, as assigned by the agent
    std::string directory;   // cwd recorded in the session
    std::string project;     // project subdirectory name in the store
    std::chrono::system_clock::time_point last_activity;
    std::string summary;     // first user message, truncated; may be empty
    int message_count = 0;

    // 1-based display position. Only meaningful for the listing it came from.
    int ordinal = 0;
};

// Most recent first, ties by id ascending. Assigns ordinals.
void sort_for_display(std::vector<SavedSession>& sessions);
