#include "platform/resume.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <unistd.h>

namespace platform {

std::expected<void, std::string> exec_resume(const std::string& agent,
                                             const std::string& session_id,
                                             const std::string& directory) {
    if (!directory.empty() && ::chdir(directory.c_str()) != 0) {
        std::println(stderr, "resume: cannot enter {}: {}, staying in current directory",
                     directory, std::strerror(errno));
    }

    ::execlp(agent.c_str(), agent.c_str(), "--resume", session_id.c_str(), nullptr);
    return std::unexpected(std::string("exec ") + agent + " failed: " + std::strerror(errno));
}

} // namespace platform
