#include "rows.hpp"

#include <algorithm>
#include <ctime>
#include <format>

namespace {

std::string format_local(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (!localtime_r(&t, &tm)) return "?";
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

} // namespace

std::string format_uptime(std::chrono::seconds uptime) {
    auto elapsed = std::max<long long>(0, uptime.count());
    long long days = elapsed / 86400;
    long long hours = (elapsed % 86400) / 3600;
    long long minutes = (elapsed % 3600) / 60;

    if (days > 0) return std::format("{}d {}h", days, hours);
    if (hours > 0) return std::format("{}h {}m", hours, minutes);
    return std::format("{}m", minutes);
}

std::string shorten_path(const std::string& path, size_t max_length) {
    if (path.empty()) return "N/A";
    if (max_length <= 3 || path.size() <= max_length) return path;
    return "..." + path.substr(path.size() - (max_length - 3));
}

std::string format_clock(std::chrono::system_clock::time_point tp) {
    return format_local(tp, "%H:%M:%S");
}

std::string format_last_activity(std::chrono::system_clock::time_point tp) {
    return format_local(tp, "%Y-%m-%d %H:%M");
}

std::vector<LiveRow> make_live_rows(const std::vector<LiveSession>& sessions, size_t path_width) {
    std::vector<const LiveSession*> ordered;
    for (const auto& s : sessions) ordered.push_back(&s);
    std::ranges::stable_sort(ordered, {}, &LiveSession::pid);

    std::vector<LiveRow> rows;
    rows.reserve(ordered.size());
    for (const auto* s : ordered) {
        rows.push_back(LiveRow{
            .pid = std::to_string(s->pid),
            .directory = shorten_path(s->display_dir, path_width),
            .terminal = s->terminal.empty() ? "N/A" : s->terminal,
            .uptime = format_uptime(s->uptime),
            .status = status_label(s->status),
            .running = s->status == SessionStatus::Running,
        });
    }
    return rows;
}

std::vector<SavedRow> make_saved_rows(const std::vector<SavedSession>& sessions, size_t path_width) {
    std::vector<SavedRow> rows;
    rows.reserve(sessions.size());
    for (const auto& s : sessions) {
        rows.push_back(SavedRow{
            .ordinal = std::to_string(s.ordinal),
            .id = s.id,
            .directory = shorten_path(s.directory, path_width),
            .last_activity = format_last_activity(s.last_activity),
            .summary = s.summary,
        });
    }
    return rows;
}
