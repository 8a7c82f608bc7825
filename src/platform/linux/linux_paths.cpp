#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace platform {

std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return home;
    if (auto* pw = getpwuid(getuid()); pw && pw->pw_dir) return pw->pw_dir;
    return {};
}

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/claude-sessions";
    auto home = home_dir();
    if (home.empty()) return {};
    return home + "/.config/claude-sessions";
}

std::string session_store_root() {
    const char* claude_dir = std::getenv("CLAUDE_CONFIG_DIR");
    if (claude_dir && *claude_dir) return std::string(claude_dir) + "/projects";
    auto home = home_dir();
    if (home.empty()) return {};
    return home + "/.claude/projects";
}

} // namespace platform
