#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the passwd entry).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Expands a leading "~/" against home_dir().
std::filesystem::path expand_user(const std::string& path);

// Login name of the effective user, or "" if it has no passwd entry.
std::string current_user();

// Name of the effective group, or "" if it has no group entry.
std::string current_group();

// Hostname with the domain part removed.
std::string short_hostname();

// Free bytes on the filesystem holding `dir` (f_bfree * f_frsize).
// Returns -1 if statvfs fails.
int64_t free_space_bytes(const std::filesystem::path& dir);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
