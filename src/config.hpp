#pragma once

#include <chrono>
#include <cstdint>
#include <string>

struct Config {
    // Base executable name of the agent whose sessions are observed.
    std::string agent = "claude";

    // Empty means the per-user default (see platform::session_store_root).
    std::string store_root;

    // Empty means $HOME. Used only to abbreviate paths for display.
    std::string home_dir;

    struct Monitor {
        uint32_t refresh_seconds = 3;
        uint32_t max_consecutive_failures = 5;
        uint32_t busy_cpu_ticks = 2;
        bool show_saved = false;
        uint32_t saved_limit = 5;

        std::chrono::milliseconds refresh_period() const {
            return std::chrono::seconds(refresh_seconds);
        }
    } monitor;

    struct Display {
        uint32_t summary_length = 60;
        uint32_t path_width = 50;
    } display;

    static Config load(const std::string& path);
    static Config load_default();

    // Fill empty store_root / home_dir from the platform defaults.
    void resolve_paths();
};
