#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// Names a process can be matched by.
struct ProcessIdentity {
    std::string comm;   // kernel command name (may be truncated to 15 chars)
    std::string argv0;  // first command-line argument, as launched
};

struct ProcessFacts {
    int pid = 0;
    std::string working_dir;
    std::string terminal;        // "pts/N", "ttyN", ... or empty
    char state = '?';            // kernel scheduler state letter
    uint64_t start_ticks = 0;    // clock ticks after boot
    uint64_t cpu_ticks = 0;      // utime + stime
    double start_epoch_s = 0.0;  // wall clock start, seconds since epoch
    double uptime_s = 0.0;       // boot-clock seconds since start, >= 0
};

class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    // Fails only if the table itself cannot be listed.
    virtual std::expected<std::vector<int>, std::string> list_pids() = 0;

    // nullopt when the process is gone or unreadable.
    virtual std::optional<ProcessIdentity> identify(int pid) = 0;
    virtual std::optional<ProcessFacts> inspect(int pid) = 0;
};
