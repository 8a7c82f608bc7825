#include "process_scanner.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace {

std::string basename_of(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return path;
    return path.substr(slash + 1);
}

} // namespace

ProcessScanner::ProcessScanner(ProcessTable& table, ActivityClassifier& classifier,
                               std::string agent, std::string home_dir)
    : table_(table), classifier_(classifier),
      agent_(std::move(agent)), home_dir_(std::move(home_dir)) {}

std::expected<std::vector<LiveSession>, std::string> ProcessScanner::scan(std::stop_token stop) {
    auto pids = table_.list_pids();
    if (!pids) return std::unexpected(pids.error());

    classifier_.begin_cycle();

    std::vector<LiveSession> sessions;
    for (int pid : *pids) {
        if (stop.stop_requested()) break;

        auto id = table_.identify(pid);
        if (!id || !matches(*id)) continue;

        auto facts = table_.inspect(pid);
        if (!facts) continue;

        LiveSession s;
        s.pid = pid;
        s.working_dir = facts->working_dir;
        s.display_dir = abbreviate_home(facts->working_dir, home_dir_);
        s.terminal = facts->terminal;
        s.uptime = std::chrono::seconds(static_cast<long long>(std::floor(std::max(0.0, facts->uptime_s))));
        s.start_time = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::duration<double>(facts->start_epoch_s)));
        s.status = classifier_.classify(*facts);
        sessions.push_back(std::move(s));
    }

    return sessions;
}

bool ProcessScanner::matches(const ProcessIdentity& id) const {
    if (agent_.empty()) return false;
    if (!id.argv0.empty() && basename_of(id.argv0) == agent_) return true;
    return id.comm == agent_;
}

std::string ProcessScanner::abbreviate_home(const std::string& path, const std::string& home) {
    if (home.empty() || home == "/") return path;
    if (path == home) return "~";
    if (path.size() > home.size() && path.starts_with(home) && path[home.size()] == '/') {
        return "~" + path.substr(home.size());
    }
    return path;
}
