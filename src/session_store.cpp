#include "session_store.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool parse_int(const std::string& s, size_t pos, size_t len, int& out) {
    if (pos + len > s.size()) return false;
    auto* first = s.data() + pos;
    auto [ptr, ec] = std::from_chars(first, first + len, out);
    return ec == std::errc{} && ptr == first + len;
}

// Text of a user-authored message, empty for anything else (assistant turns,
// meta entries, tool results, slash-command wrappers).
std::string user_text(const json& event) {
    if (event.value("type", "") != "user") return {};
    if (event.value("isMeta", false)) return {};

    auto msg = event.find("message");
    if (msg == event.end() || !msg->is_object()) return {};
    if (msg->contains("role") && msg->value("role", "") != "user") return {};

    auto content = msg->find("content");
    if (content == msg->end()) return {};

    std::string text;
    if (content->is_string()) {
        text = content->get<std::string>();
    } else if (content->is_array()) {
        for (const auto& part : *content) {
            if (!part.is_object()) continue;
            auto type = part.value("type", "");
            if (type == "tool_result") return {};
            if (type == "text" && text.empty()) text = part.value("text", "");
        }
    }

    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    if (text[first] == '<') return {};
    return text;
}

} // namespace

SessionStore::SessionStore(std::string root, size_t summary_length)
    : root_(std::move(root)), summary_length_(summary_length) {}

std::optional<SavedSession> SessionStore::load_record(const fs::path& file,
                                                     std::map<std::string, CachedRecord>& seen,
                                                     std::stop_token stop) const {
    std::error_code ec;
    auto mtime = fs::last_write_time(file, ec);
    if (ec) return std::nullopt;
    auto size = fs::file_size(file, ec);
    if (ec) return std::nullopt;

    auto key = file.string();
    {
        std::lock_guard lock(cache_mu_);
        auto it = cache_.find(key);
        if (it != cache_.end() && it->second.mtime == mtime && it->second.size == size) {
            seen[key] = it->second;
            return it->second.record;
        }
    }

    auto record = parse_record(file, summary_length_, stop);
    // An interrupted parse says nothing about the file.
    if (stop.stop_requested()) return std::nullopt;

    seen[key] = CachedRecord{.mtime = mtime, .size = size, .record = record};
    return record;
}

std::expected<std::vector<SavedSession>, std::string>
SessionStore::list_checked(std::stop_token stop) const {
    std::vector<SavedSession> sessions;
    std::map<std::string, CachedRecord> seen;

    std::error_code ec;
    if (root_.empty() || !fs::exists(root_, ec)) return sessions;

    fs::directory_iterator projects(root_, ec);
    if (ec) return std::unexpected(std::format("cannot read {}: {}", root_, ec.message()));

    for (; projects != fs::directory_iterator(); projects.increment(ec)) {
        if (ec || stop.stop_requested()) break;

        std::error_code entry_ec;
        if (!projects->is_directory(entry_ec)) continue;

        fs::directory_iterator records(projects->path(), entry_ec);
        if (entry_ec) continue;

        for (; records != fs::directory_iterator(); records.increment(entry_ec)) {
            if (entry_ec || stop.stop_requested()) break;

            const auto& path = records->path();
            if (path.extension() != ".jsonl") continue;
            if (!records->is_regular_file(entry_ec)) continue;

            if (auto s = load_record(path, seen, stop)) {
                sessions.push_back(std::move(*s));
            }
        }
    }

    if (!stop.stop_requested()) {
        std::lock_guard lock(cache_mu_);
        cache_ = std::move(seen);
    }

    sort_for_display(sessions);
    return sessions;
}

std::vector<SavedSession> SessionStore::list_sessions(std::stop_token stop) const {
    auto sessions = list_checked(stop);
    if (!sessions) {
        std::println(stderr, "store: {}", sessions.error());
        return {};
    }
    return std::move(*sessions);
}

std::optional<SavedSession> SessionStore::parse_record(const fs::path& file, size_t summary_length,
                                                       std::stop_token stop) {
    std::ifstream f(file);
    if (!f.is_open()) return std::nullopt;

    SavedSession s;
    s.id = file.stem().string();
    s.project = file.parent_path().filename().string();
    if (s.id.empty()) return std::nullopt;

    bool any_event = false;
    bool have_timestamp = false;
    bool have_summary = false;

    std::string line;
    while (std::getline(f, line)) {
        if (stop.stop_requested()) return std::nullopt;
        if (line.empty()) continue;

        // A trailing line may be mid-write; unparseable lines are ignored.
        auto event = json::parse(line, nullptr, false);
        if (event.is_discarded() || !event.is_object()) continue;

        try {
            if (event.value("isSidechain", false)) continue;
            any_event = true;

            auto type = event.value("type", "");
            if (type == "user" || type == "assistant") ++s.message_count;

            if (s.directory.empty()) {
                auto cwd = event.find("cwd");
                if (cwd != event.end() && cwd->is_string()) s.directory = cwd->get<std::string>();
            }

            auto ts = event.find("timestamp");
            if (ts != event.end() && ts->is_string()) {
                if (auto tp = parse_timestamp(ts->get<std::string>())) {
                    if (!have_timestamp || *tp > s.last_activity) s.last_activity = *tp;
                    have_timestamp = true;
                }
            }

            if (!have_summary) {
                auto text = user_text(event);
                if (!text.empty()) {
                    s.summary = make_summary(text, summary_length);
                    have_summary = true;
                }
            }
        } catch (const json::exception&) {
            // Field of an unexpected type; the rest of the line is unusable.
            continue;
        }
    }

    if (!any_event) return std::nullopt;

    if (s.directory.empty()) s.directory = decode_project_dir(s.project);

    if (!have_timestamp) {
        std::error_code ec;
        auto mtime = fs::last_write_time(file, ec);
        if (ec) return std::nullopt;
        s.last_activity = std::chrono::file_clock::to_sys(mtime);
    }

    return s;
}

std::optional<std::chrono::system_clock::time_point>
SessionStore::parse_timestamp(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SS
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    std::tm tm{};
    if (!parse_int(text, 0, 4, tm.tm_year) || !parse_int(text, 5, 2, tm.tm_mon) ||
        !parse_int(text, 8, 2, tm.tm_mday) || !parse_int(text, 11, 2, tm.tm_hour) ||
        !parse_int(text, 14, 2, tm.tm_min) || !parse_int(text, 17, 2, tm.tm_sec)) {
        return std::nullopt;
    }
    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    size_t pos = 19;
    std::chrono::milliseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        int millis = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int d = digits; d < 3; ++d) millis *= 10;
        fraction = std::chrono::milliseconds(millis);
    }

    std::chrono::seconds offset{0};
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            int oh = 0, om = 0;
            if (!parse_int(text, pos + 1, 2, oh)) return std::nullopt;
            size_t mpos = pos + 3;
            if (mpos < text.size() && text[mpos] == ':') ++mpos;
            if (!parse_int(text, mpos, 2, om)) return std::nullopt;
            offset = std::chrono::hours(oh) + std::chrono::minutes(om);
            if (sign == '-') offset = -offset;
            pos = mpos + 2;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    time_t epoch = timegm(&tm);
    return std::chrono::system_clock::from_time_t(epoch) + fraction - offset;
}

std::string SessionStore::make_summary(const std::string& text, size_t max_chars) {
    std::string collapsed;
    collapsed.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !collapsed.empty();
            continue;
        }
        if (pending_space) collapsed.push_back(' ');
        pending_space = false;
        collapsed.push_back(c);
    }

    auto is_lead = [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; };
    size_t code_points = std::ranges::count_if(collapsed, is_lead);
    if (max_chars == 0) return {};
    if (code_points <= max_chars) return collapsed;

    size_t keep = max_chars > 3 ? max_chars - 3 : max_chars;
    size_t seen = 0;
    size_t cut = collapsed.size();
    for (size_t i = 0; i < collapsed.size(); ++i) {
        if (!is_lead(collapsed[i])) continue;
        if (seen == keep) {
            cut = i;
            break;
        }
        ++seen;
    }

    auto out = collapsed.substr(0, cut);
    while (!out.empty() && out.back() == ' ') out.pop_back();
    if (max_chars > 3) out += "...";
    return out;
}

std::string SessionStore::decode_project_dir(const std::string& name) {
    std::string dir = name;
    std::ranges::replace(dir, '-', '/');
    return dir;
}
