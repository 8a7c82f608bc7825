#pragma once

#include "live_session.hpp"
#include "process_scanner.hpp"
#include "saved_session.hpp"
#include "session_store.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

// Everything one refresh cycle hands to the view.
struct Snapshot {
    std::vector<LiveSession> live;
    std::optional<std::vector<SavedSession>> saved;
    std::chrono::system_clock::time_point taken_at;
};

class SessionMonitor {
public:
    // store may be null; saved_limit 0 keeps every saved session.
    SessionMonitor(ProcessScanner& scanner, const SessionStore* store, size_t saved_limit);

    // Reads the store on a worker thread while the process table is scanned,
    // joining both before returning. Either source failing fails the cycle.
    std::expected<Snapshot, std::string> snapshot(std::stop_token stop);

private:
    ProcessScanner& scanner_;
    const SessionStore* store_;
    size_t saved_limit_;
};
