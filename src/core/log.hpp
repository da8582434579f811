#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

// Select the log destination. "-" logs to stdout; an empty path opens
// <log_dir>/autocopy_<YYMMDD>.log. Files are always opened for append.
Result<void> set_log_file(const std::string& path, const std::filesystem::path& log_dir);

// Active log file, or "" when logging to stdout.
std::string log_file_path();

// Append a message to the log. Each line of a multi-line message gets
// its own "[YYYY Mon DD HH:MM:SS] " prefix.
void autocopy_log(const std::string& msg);

// Log a remote command and its outcome.
void autocopy_log_ssh(const std::string& label, const std::string& cmd, const SSHResult& r);
