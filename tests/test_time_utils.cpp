#include <gtest/gtest.h>
#include <core/time_utils.hpp>
#include <ctime>

TEST(TimeUtils, FormatElapsedSeconds) {
    EXPECT_EQ(format_duration(std::chrono::seconds(8)), "8s");
    EXPECT_EQ(format_duration(std::chrono::seconds(0)), "0s");
}

TEST(TimeUtils, FormatElapsedMinutes) {
    EXPECT_EQ(format_duration(std::chrono::seconds(14 * 60 + 22)), "14m22s");
}

TEST(TimeUtils, FormatElapsedHours) {
    // seconds are dropped once hours are shown
    EXPECT_EQ(format_duration(std::chrono::seconds(2 * 3600 + 35 * 60 + 59)), "2h35m");
}

TEST(TimeUtils, FormatElapsedNegativeClampsToZero) {
    EXPECT_EQ(format_duration(std::chrono::seconds(-5)), "0s");
}

TEST(TimeUtils, FormatLocalTime) {
    std::tm tm{};
    tm.tm_year = 2025 - 1900;
    tm.tm_mon = 0;
    tm.tm_mday = 15;
    tm.tm_hour = 14;
    tm.tm_min = 35;
    tm.tm_sec = 22;
    tm.tm_isdst = -1;
    auto when = std::chrono::system_clock::from_time_t(std::mktime(&tm));
    EXPECT_EQ(format_local_time(when, "%Y-%m-%d %H:%M:%S"), "2025-01-15 14:35:22");
    EXPECT_EQ(format_local_time(when, "%y%m%d"), "250115");
}
