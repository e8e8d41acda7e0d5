#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/transcribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/transcribe";
}

std::filesystem::path override_file() {
    auto dir = config_dir();
    if (dir.empty()) return "override.json";
    return std::filesystem::path(dir) / "override.json";
}

} // namespace platform
