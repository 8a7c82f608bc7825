#pragma once

#include <string>

namespace platform {

std::string home_dir();
std::string config_dir();

// Root of the agent's per-project session store.
std::string session_store_root();

} // namespace platform
