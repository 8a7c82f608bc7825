#pragma once

#include <chrono>
#include <string>

enum class SessionStatus { Running, Idle };

struct LiveSession {
    int pid = 0;
    std::string working_dir;   // resolved cwd, absolute
    std::string display_dir;   // working_dir with home replaced by "~"
    std::string terminal;      // e.g. "pts/3", empty if none
    std::chrono::system_clock::time_point start_time;
    std::chrono::seconds uptime{0};
    SessionStatus status = SessionStatus::Idle;
};

inline const char* status_label(SessionStatus status) {
    switch (status) {
        case SessionStatus::Running: return "Running";
        case SessionStatus::Idle: return "Idle";
    }
    return "Idle";
}
