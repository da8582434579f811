#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>

std::string format_duration(std::chrono::seconds elapsed) {
    long long seconds = elapsed.count();
    if (seconds < 0) seconds = 0;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_local_time(std::chrono::system_clock::time_point when, const char* pattern) {
    auto t = std::chrono::system_clock::to_time_t(when);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[64];
    std::strftime(buf, sizeof(buf), pattern, &tm_buf);
    return std::string(buf);
}
