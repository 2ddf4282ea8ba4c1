#pragma once

#include <string>
#include <utility>
#include <filesystem>

// Expand a leading "~" or "~/" to the local home directory.
std::filesystem::path expand_home(const std::string& path);

// Split "user@host" into {user, host}. A string without '@' is a bare host.
std::pair<std::string, std::string> split_user_host(const std::string& remote_host);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}
