#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Negative numbers would wrap on conversion; they keep the default instead.
void read_count(const json& section, const char* key, uint32_t& out) {
    if (!section.contains(key)) return;
    const auto& v = section[key];
    if (v.is_number() && v.get<double>() < 0) {
        std::println(stderr, "config: {} must not be negative, using {}", key, out);
        return;
    }
    out = v.get<uint32_t>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("agent")) cfg.agent = j["agent"].get<std::string>();
        if (j.contains("store_root")) cfg.store_root = j["store_root"].get<std::string>();
        if (j.contains("home_dir")) cfg.home_dir = j["home_dir"].get<std::string>();

        if (j.contains("monitor")) {
            auto& m = j["monitor"];
            read_count(m, "refresh_seconds", cfg.monitor.refresh_seconds);
            read_count(m, "max_consecutive_failures", cfg.monitor.max_consecutive_failures);
            read_count(m, "busy_cpu_ticks", cfg.monitor.busy_cpu_ticks);
            if (m.contains("show_saved")) cfg.monitor.show_saved = m["show_saved"].get<bool>();
            read_count(m, "saved_limit", cfg.monitor.saved_limit);
        }

        if (j.contains("display")) {
            auto& d = j["display"];
            read_count(d, "summary_length", cfg.display.summary_length);
            read_count(d, "path_width", cfg.display.path_width);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.agent.empty()) {
        std::println(stderr, "config: empty agent name, using \"claude\"");
        cfg.agent = "claude";
    }
    if (cfg.monitor.refresh_seconds == 0) {
        std::println(stderr, "config: refresh_seconds must be positive, using 3");
        cfg.monitor.refresh_seconds = 3;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::resolve_paths() {
    if (home_dir.empty()) home_dir = platform::home_dir();
    if (store_root.empty()) store_root = platform::session_store_root();
}
