#include "session_monitor.hpp"

#include <format>
#include <thread>

SessionMonitor::SessionMonitor(ProcessScanner& scanner, const SessionStore* store, size_t saved_limit)
    : scanner_(scanner), store_(store), saved_limit_(saved_limit) {}

std::expected<Snapshot, std::string> SessionMonitor::snapshot(std::stop_token stop) {
    std::expected<std::vector<SavedSession>, std::string> saved;

    std::jthread reader;
    if (store_) {
        reader = std::jthread([this, &saved, stop] { saved = store_->list_checked(stop); });
    }

    auto live = scanner_.scan(stop);

    if (reader.joinable()) reader.join();

    if (!live) return std::unexpected(std::format("process scan failed: {}", live.error()));

    Snapshot snap;
    snap.live = std::move(*live);
    snap.taken_at = std::chrono::system_clock::now();

    if (store_) {
        if (!saved) return std::unexpected(std::format("session store unavailable: {}", saved.error()));
        if (saved_limit_ > 0 && saved->size() > saved_limit_) saved->resize(saved_limit_);
        snap.saved = std::move(*saved);
    }

    return snap;
}
