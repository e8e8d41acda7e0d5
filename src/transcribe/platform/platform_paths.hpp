#pragma once

#include <filesystem>
#include <string>

namespace platform {

// Per-user configuration directory, empty if it cannot be determined.
std::string config_dir();

// Location of the persisted override settings.
std::filesystem::path override_file();

} // namespace platform
