#include <gtest/gtest.h>

#include "TimeUtils.hpp"

TEST(TimeUtilsTest, FormatsByteCounts)
{
    EXPECT_EQ(FormatBytes(0), "0 B");
    EXPECT_EQ(FormatBytes(1023), "1023 B");
    EXPECT_EQ(FormatBytes(1536), "1.50 KiB");
    EXPECT_EQ(FormatBytes(5ULL * 1024 * 1024 * 1024), "5.00 GiB");
}

TEST(TimeUtilsTest, FormatsDurations)
{
    EXPECT_EQ(FormatDuration(-1.0), "--:--");
    EXPECT_EQ(FormatDuration(0.0), "00:00");
    EXPECT_EQ(FormatDuration(65.4), "01:05");
    EXPECT_EQ(FormatDuration(3725.0), "1:02:05");
}

TEST(TimeUtilsTest, FormatsUtcTimestamps)
{
    EXPECT_EQ(FormatIsoUtc(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatIsoUtc(1700000000), "2023-11-14T22:13:20Z");
}
