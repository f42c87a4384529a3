#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp dir.
std::filesystem::path home_dir();

// Expand a leading "~/" against home_dir().
std::filesystem::path expand_user(const std::string& path);

// Local host name, "localhost" if unavailable.
std::string hostname();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
