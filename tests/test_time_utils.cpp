#include <gtest/gtest.h>
#include <chrono>
#include <core/time_utils.hpp>
#include <core/utils.hpp>

using namespace std::chrono_literals;

TEST(TimeUtils, FormatDurationSeconds) {
    EXPECT_EQ(format_duration(45), "45s");
}

TEST(TimeUtils, FormatDurationMinutes) {
    EXPECT_EQ(format_duration(5 * 60 + 30), "5m30s");
}

TEST(TimeUtils, FormatDurationHours) {
    EXPECT_EQ(format_duration(2 * 3600 + 15 * 60), "2h15m");
}

TEST(TimeUtils, FormatDurationZero) {
    EXPECT_EQ(format_duration(0), "0s");
}

TEST(TimeUtils, FormatDurationNegativeClamped) {
    EXPECT_EQ(format_duration(-20), "0s");
}

TEST(TimeUtils, FormatAgeUnset) {
    EXPECT_EQ(format_age(std::nullopt), "-");
}

TEST(TimeUtils, FormatAge) {
    auto now = Clock::now();
    EXPECT_EQ(format_age(now - 90s, now), "1m30s");
}

TEST(TimeUtils, FormatUtcIso) {
    TimePoint epoch_plus{std::chrono::seconds(86400 + 3661)};
    EXPECT_EQ(format_utc_iso(epoch_plus), "1970-01-02T01:01:01Z");
}

TEST(StringUtils, SplitLinesTrimsAndDropsBlank) {
    auto lines = split_lines("  one \n\n\ttwo\r\n   \n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
}

TEST(StringUtils, SplitWords) {
    auto words = split_words("rhel  centos\tfedora");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[2], "fedora");
}
