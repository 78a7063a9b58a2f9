#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/audio-qc";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/audio-qc";
}

std::string temp_dir() {
    const char* tmp = std::getenv("TMPDIR");
    if (tmp && *tmp) return tmp;
    return "/tmp";
}

} // namespace platform
