#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp dir.
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on most systems).
std::filesystem::path temp_dir();

// Look up an environment variable. Empty string when unset.
std::string env_or_empty(const char* name);

// Locate an executable on PATH (or check an explicit path). Empty if not found.
std::filesystem::path find_in_path(const std::string& program);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
