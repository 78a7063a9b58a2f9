#pragma once

#include <string>

namespace platform {

// Directory holding config.json; empty when no home directory is known.
std::string config_dir();

// Scratch root for per-request decode directories.
std::string temp_dir();

} // namespace platform
