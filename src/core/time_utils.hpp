#pragma once

#include <string>
#include <chrono>

// Format an elapsed duration as "2h35m", "14m22s" or "8s".
std::string format_duration(std::chrono::seconds elapsed);

// Format a wall-clock time with strftime conventions in local time.
std::string format_local_time(std::chrono::system_clock::time_point when, const char* pattern);
