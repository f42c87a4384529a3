#pragma once

#include <string>
#include <vector>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS,mmm) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Lowercase ASCII copy.
std::string to_lower(std::string s);

// Decode %XX escapes. Malformed escapes are kept literally.
std::string percent_decode(const std::string& s);

// Quote one argument for a POSIX shell. Plain words are returned unchanged.
std::string shell_quote(const std::string& arg);

// Quote each argument and join with single spaces.
std::string join_command(const std::vector<std::string>& argv);

// Standard base64 with '=' padding.
std::string base64_encode(const std::string& input);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
