#include <catch2/catch.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "cs_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.agent == "claude");
        REQUIRE(cfg.store_root.empty());
        REQUIRE(cfg.home_dir.empty());
        REQUIRE(cfg.monitor.refresh_seconds == 3);
        REQUIRE(cfg.monitor.refresh_period() == std::chrono::milliseconds(3000));
        REQUIRE(cfg.monitor.max_consecutive_failures == 5);
        REQUIRE(cfg.monitor.busy_cpu_ticks == 2);
        REQUIRE_FALSE(cfg.monitor.show_saved);
        REQUIRE(cfg.monitor.saved_limit == 5);
        REQUIRE(cfg.display.summary_length == 60);
        REQUIRE(cfg.display.path_width == 50);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "agent": "claude-dev",
            "store_root": "/data/sessions",
            "home_dir": "/home/someone",
            "monitor": {
                "refresh_seconds": 10,
                "max_consecutive_failures": 2,
                "busy_cpu_ticks": 7,
                "show_saved": true,
                "saved_limit": 20
            },
            "display": { "summary_length": 80, "path_width": 40 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.agent == "claude-dev");
        REQUIRE(cfg.store_root == "/data/sessions");
        REQUIRE(cfg.home_dir == "/home/someone");
        REQUIRE(cfg.monitor.refresh_seconds == 10);
        REQUIRE(cfg.monitor.max_consecutive_failures == 2);
        REQUIRE(cfg.monitor.busy_cpu_ticks == 7);
        REQUIRE(cfg.monitor.show_saved);
        REQUIRE(cfg.monitor.saved_limit == 20);
        REQUIRE(cfg.display.summary_length == 80);
        REQUIRE(cfg.display.path_width == 40);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "monitor": { "refresh_seconds": 1 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.monitor.refresh_seconds == 1);
        // Other fields retain defaults
        REQUIRE(cfg.agent == "claude");
        REQUIRE(cfg.monitor.max_consecutive_failures == 5);
        REQUIRE(cfg.display.summary_length == 60);
    }

    SECTION("ZeroRefreshRejected") {
        TmpFile f(R"({ "monitor": { "refresh_seconds": 0 } })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.monitor.refresh_seconds == 3);
    }

    SECTION("NegativeNumbersRejected") {
        TmpFile f(R"({ "monitor": { "refresh_seconds": -1, "saved_limit": -3, "busy_cpu_ticks": 4 },
                       "display": { "path_width": -20 } })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.monitor.refresh_seconds == 3);
        REQUIRE(cfg.monitor.saved_limit == 5);
        REQUIRE(cfg.monitor.busy_cpu_ticks == 4);
        REQUIRE(cfg.display.path_width == 50);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.agent == "claude");
        REQUIRE(cfg.monitor.refresh_seconds == 3);
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "agent": 12 })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.agent == "claude");
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/cs_test_nonexistent_config_file.json");
        REQUIRE(cfg.agent == "claude");
        REQUIRE(cfg.monitor.refresh_seconds == 3);
    }

    SECTION("ResolvePathsKeepsExplicitValues") {
        Config cfg;
        cfg.store_root = "/explicit/root";
        cfg.home_dir = "/explicit/home";
        cfg.resolve_paths();
        REQUIRE(cfg.store_root == "/explicit/root");
        REQUIRE(cfg.home_dir == "/explicit/home");
    }

    SECTION("ResolvePathsUsesClaudeConfigDir") {
        const char* old = std::getenv("CLAUDE_CONFIG_DIR");
        std::string saved = old ? old : "";
        ::setenv("CLAUDE_CONFIG_DIR", "/opt/claude-cfg", 1);

        Config cfg;
        cfg.resolve_paths();
        REQUIRE(cfg.store_root == "/opt/claude-cfg/projects");

        if (old) ::setenv("CLAUDE_CONFIG_DIR", saved.c_str(), 1);
        else ::unsetenv("CLAUDE_CONFIG_DIR");
    }
}
