#include "activity_classifier.hpp"
#include "config.hpp"
#include "platform/linux/procfs_process_table.hpp"
#include "platform/linux/signal_watcher.hpp"
#include "platform/resume.hpp"
#include "process_scanner.hpp"
#include "refresh_loop.hpp"
#include "rows.hpp"
#include "session_monitor.hpp"
#include "session_resolver.hpp"
#include "session_store.hpp"
#include "view/terminal_view.hpp"

#include <charconv>
#include <memory>
#include <print>
#include <string>
#include <unistd.h>

namespace {

bool g_verbose = false;

void log(const std::string& msg) {
    if (g_verbose) {
        std::println(stderr, "[claude-sessions] {}", msg);
    }
}

void usage(const char* prog) {
    std::println("Usage: {} [command] [options]", prog);
    std::println("Commands:");
    std::println("  monitor [--saved] [-i SECONDS]   Refreshing view of running sessions (default)");
    std::println("  list [--limit N]                 List saved sessions, most recent first");
    std::println("  attach <N|ID-FRAGMENT>           Resume a saved session by ordinal or id");
    std::println("Options:");
    std::println("  -c, --config PATH   Config file path");
    std::println("      --root PATH     Session store root");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -h, --help          Show this help");
}

bool parse_uint(const std::string& s, uint32_t& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

int run_monitor(const Config& config) {
    ProcfsProcessTable table;
    if (auto pids = table.list_pids(); !pids) {
        std::println(stderr, "Cannot read the process table: {}", pids.error());
        return 1;
    }

    CpuActivityClassifier classifier(config.monitor.busy_cpu_ticks);
    ProcessScanner scanner(table, classifier, config.agent, config.home_dir);

    std::unique_ptr<SessionStore> store;
    if (config.monitor.show_saved) {
        store = std::make_unique<SessionStore>(config.store_root, config.display.summary_length);
    }
    SessionMonitor monitor(scanner, store.get(), config.monitor.saved_limit);

    TerminalView view(config.agent, config.display.path_width);
    StopTokenWaiter waiter;
    RefreshLoop loop(
        [&monitor](std::stop_token stop) { return monitor.snapshot(stop); },
        view, waiter,
        RefreshLoop::Options{
            .period = config.monitor.refresh_period(),
            .max_consecutive_failures = config.monitor.max_consecutive_failures,
        });

    SignalWatcher signals([&loop](int signo) {
        log("Received signal " + std::to_string(signo) + ", shutting down");
        loop.request_stop();
    });
    if (!signals.init()) {
        std::println(stderr, "Failed to set up signal handling");
        return 1;
    }

    log("Monitoring '" + config.agent + "' every " +
        std::to_string(config.monitor.refresh_seconds) + "s");

    auto result = loop.run();
    signals.shutdown();

    if (!result) {
        std::println(stderr, "Monitoring failed: {}", result.error());
        return 1;
    }
    std::println("\nMonitoring stopped.");
    return 0;
}

int run_list(const Config& config, uint32_t limit) {
    SessionStore store(config.store_root, config.display.summary_length);
    auto sessions = store.list_checked();
    if (!sessions) {
        std::println(stderr, "Cannot read session store: {}", sessions.error());
        return 1;
    }

    log("Session store: " + store.root());
    if (sessions->empty()) {
        std::println("No saved sessions in {}", store.root());
        return 0;
    }

    if (limit > 0 && sessions->size() > limit) sessions->resize(limit);
    TerminalView::print_saved(stdout, make_saved_rows(*sessions, config.display.path_width),
                              ::isatty(STDOUT_FILENO) == 1);
    return 0;
}

int run_attach(const Config& config, const std::string& token) {
    // Always re-list: ordinals only hold for the listing they were read from.
    SessionStore store(config.store_root, config.display.summary_length);
    auto sessions = store.list_checked();
    if (!sessions) {
        std::println(stderr, "Cannot read session store: {}", sessions.error());
        return 1;
    }

    auto session = resolve(token, *sessions);
    if (!session) {
        std::println(stderr, "{}", session.error().message());
        if (session.error().kind == ResolutionError::Kind::Ambiguous) {
            std::println(stderr, "Use a longer fragment or the list ordinal.");
        }
        return 1;
    }

    std::println("Resuming {} in {}", session->id, session->directory);
    std::fflush(stdout);

    auto res = platform::exec_resume(config.agent, session->id, session->directory);
    if (!res) {
        std::println(stderr, "Error: {}", res.error());
    }
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string command = "monitor";
    std::string config_path;
    std::string store_root;
    std::string token;
    bool show_saved = false;
    uint32_t interval = 0;
    uint32_t limit = 0;

    int first = 1;
    if (argc > 1 && argv[1][0] != '-') {
        command = argv[1];
        first = 2;
    }

    for (int i = first; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            g_verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--root") {
            if (i + 1 < argc) store_root = argv[++i];
        } else if (arg == "--saved" || arg == "-s") {
            show_saved = true;
        } else if (arg == "--interval" || arg == "-i") {
            if (i + 1 >= argc || !parse_uint(argv[++i], interval) || interval == 0) {
                std::println(stderr, "--interval expects a positive number of seconds");
                return 1;
            }
        } else if (arg == "--limit" || arg == "-n") {
            if (i + 1 >= argc || !parse_uint(argv[++i], limit)) {
                std::println(stderr, "--limit expects a number");
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && token.empty()) {
            token = arg;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (!token.empty() && command != "attach") {
        std::println(stderr, "Unexpected argument: {}", token);
        usage(argv[0]);
        return 1;
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }
    if (!store_root.empty()) config.store_root = store_root;
    if (show_saved) config.monitor.show_saved = true;
    if (interval > 0) config.monitor.refresh_seconds = interval;
    config.resolve_paths();

    if (command == "monitor") return run_monitor(config);
    if (command == "list") return run_list(config, limit);
    if (command == "attach") {
        if (token.empty()) {
            std::println(stderr, "attach needs an ordinal or a session id fragment");
            return 1;
        }
        return run_attach(config, token);
    }

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
