#pragma once

#include <expected>
#include <string>

namespace platform {

// Replaces this process with `<agent> --resume <session_id>` started in
// `directory` (the current directory is kept if that one is gone).
// Returns only on failure.
std::expected<void, std::string> exec_resume(const std::string& agent,
                                             const std::string& session_id,
                                             const std::string& directory);

} // namespace platform
