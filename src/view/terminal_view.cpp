#include "view/terminal_view.hpp"

#include <algorithm>
#include <chrono>
#include <print>
#include <unistd.h>

namespace {

constexpr const char* kReset = "\x1b[0m";
constexpr const char* kBold = "\x1b[1m";
constexpr const char* kDim = "\x1b[2m";
constexpr const char* kRed = "\x1b[31m";
constexpr const char* kGreen = "\x1b[32m";
constexpr const char* kYellow = "\x1b[33m";
constexpr const char* kCyan = "\x1b[36m";

size_t column_width(size_t header, size_t min, auto&& values) {
    size_t w = std::max(header, min);
    for (const auto& v : values) w = std::max(w, v.size());
    return w;
}

} // namespace

TerminalView::TerminalView(std::string agent, size_t path_width, std::FILE* out)
    : agent_(std::move(agent)), path_width_(path_width), out_(out),
      color_(::isatty(::fileno(out)) == 1) {}

void TerminalView::render(const Snapshot& snapshot) {
    clear();

    auto live = make_live_rows(snapshot.live, path_width_);
    std::println(out_, "{}{}Session Monitor{} {}({} active){}", paint(kBold), paint(kCyan),
                 paint(kReset), paint(kDim), live.size(), paint(kReset));
    std::println(out_, "");

    if (live.empty()) {
        std::println(out_, "  {}No active {} sessions{}", paint(kDim), agent_, paint(kReset));
    } else {
        print_live(live);
    }

    if (snapshot.saved) {
        std::println(out_, "");
        std::println(out_, "{}Recent saved sessions{}", paint(kBold), paint(kReset));
        if (snapshot.saved->empty()) {
            std::println(out_, "  {}No saved sessions{}", paint(kDim), paint(kReset));
        } else {
            print_saved(out_, make_saved_rows(*snapshot.saved, path_width_), color_);
        }
    }

    std::println(out_, "");
    std::println(out_, "{}Updated: {} | Press Ctrl+C to exit{}", paint(kDim),
                 format_clock(snapshot.taken_at), paint(kReset));
    std::fflush(out_);
}

void TerminalView::render_error(const std::string& message, uint32_t consecutive_failures) {
    clear();
    std::println(out_, "{}{}Session Monitor{}", paint(kBold), paint(kCyan), paint(kReset));
    std::println(out_, "");
    std::println(out_, "  {}Error:{} {} (attempt {})", paint(kRed), paint(kReset), message,
                 consecutive_failures);
    std::println(out_, "");
    std::println(out_, "{}Updated: {} | Press Ctrl+C to exit{}", paint(kDim),
                 format_clock(std::chrono::system_clock::now()), paint(kReset));
    std::fflush(out_);
}

void TerminalView::print_saved(std::FILE* out, const std::vector<SavedRow>& rows, bool color) {
    auto c = [color](const char* code) { return color ? code : ""; };

    size_t ord_w = 3;
    for (const auto& r : rows) ord_w = std::max(ord_w, r.ordinal.size());

    for (const auto& r : rows) {
        std::println(out, "{}{:>{}}{}  {}{}{}  {}", c(kCyan), r.ordinal, ord_w, c(kReset),
                     c(kBold), r.id, c(kReset), r.last_activity);
        std::println(out, "{:>{}}  {}", "", ord_w, r.directory);
        if (!r.summary.empty()) {
            std::println(out, "{:>{}}  {}{}{}", "", ord_w, c(kDim), r.summary, c(kReset));
        }
    }
}

void TerminalView::clear() {
    if (color_) std::print(out_, "\x1b[2J\x1b[H");
}

void TerminalView::print_live(const std::vector<LiveRow>& rows) {
    std::vector<std::string> dirs;
    for (const auto& r : rows) dirs.push_back(r.directory);
    size_t dir_w = column_width(9, 30, dirs);

    std::println(out_, "{}{:>8}  {:<{}}  {:^12}  {:>10}  {:^10}{}", paint(kBold), "PID", "Directory",
                 dir_w, "Terminal", "Uptime", "Status", paint(kReset));

    for (const auto& r : rows) {
        const char* status_color = r.running ? kGreen : kYellow;
        std::println(out_, "{}{:>8}{}  {:<{}}  {:^12}  {:>10}  {}{:^10}{}", paint(kCyan), r.pid,
                     paint(kReset), r.directory, dir_w, r.terminal, r.uptime,
                     paint(status_color), r.status, paint(kReset));
    }
}
