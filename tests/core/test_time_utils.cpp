#include <gtest/gtest.h>
#include <chrono>
#include "barsim/core/time_utils.hpp"

using namespace barsim;

TEST(TimeUtilsTest, EpochRoundTrip) {
    const Timestamp ts = core::from_epoch_seconds(1641168000);
    EXPECT_EQ(core::to_epoch_seconds(ts), 1641168000);
}

TEST(TimeUtilsTest, FormatTimestampIsUtc) {
    const Timestamp ts = core::from_epoch_seconds(1641168000);  // 2022-01-03 00:00:00 UTC
    EXPECT_EQ(core::format_timestamp(ts), "2022-01-03 00:00:00");
    EXPECT_EQ(core::format_timestamp(ts, "%Y%m%d"), "20220103");
}

TEST(TimeUtilsTest, SafeGmtime) {
    std::time_t t = 0;
    std::tm tm{};
    ASSERT_NE(core::safe_gmtime(&t, &tm), nullptr);
    EXPECT_EQ(tm.tm_year, 70);
    EXPECT_EQ(tm.tm_mday, 1);
}
