#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp directory.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

} // namespace platform
