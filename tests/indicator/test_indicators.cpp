#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "../core/test_base.hpp"
#include "barsim/indicator/indicators.hpp"

using namespace barsim;
using namespace barsim::testing;

class IndicatorsTest : public TestBase {};

TEST_F(IndicatorsTest, SmaUndefinedDuringWarmup) {
    const auto result = indicators::sma({1.0, 2.0, 3.0, 4.0, 5.0}, 3);
    ASSERT_EQ(result.size(), 5u);
    EXPECT_FALSE(result[0]);
    EXPECT_FALSE(result[1]);
    EXPECT_DOUBLE_EQ(*result[2], 2.0);
    EXPECT_DOUBLE_EQ(*result[3], 3.0);
    EXPECT_DOUBLE_EQ(*result[4], 4.0);
}

TEST_F(IndicatorsTest, SmaZeroPeriodAllUndefined) {
    const auto result = indicators::sma({1.0, 2.0}, 0);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_FALSE(result[0]);
    EXPECT_FALSE(result[1]);
}

TEST_F(IndicatorsTest, EmaRecursionSeededWithFirstValue) {
    const std::vector<double> values{10.0, 11.0, 12.0, 13.0};
    const auto result = indicators::ema(values, 3, 1);

    const double alpha = 2.0 / 4.0;
    double expected = 10.0;
    EXPECT_DOUBLE_EQ(*result[0], expected);
    for (std::size_t i = 1; i < values.size(); ++i) {
        expected = (1.0 - alpha) * expected + alpha * values[i];
        EXPECT_DOUBLE_EQ(*result[i], expected);
    }
}

TEST_F(IndicatorsTest, EmaMinPeriodsDefaultsToSpan) {
    const auto result = indicators::ema(std::vector<double>{1.0, 2.0, 3.0, 4.0}, 3);
    EXPECT_FALSE(result[0]);
    EXPECT_FALSE(result[1]);
    EXPECT_TRUE(result[2]);
    EXPECT_TRUE(result[3]);
}

TEST_F(IndicatorsTest, EmaSkipsUndefinedInputs) {
    IndicatorSeries input{std::nullopt, 4.0, std::nullopt, 8.0};
    const auto result = indicators::ema(input, 1, 1);
    EXPECT_FALSE(result[0]);
    EXPECT_DOUBLE_EQ(*result[1], 4.0);
    EXPECT_FALSE(result[2]);
    EXPECT_DOUBLE_EQ(*result[3], 8.0);
}

TEST_F(IndicatorsTest, FromValuesDropsNonFinite) {
    const auto result = indicators::from_values(
        {1.0, std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity()});
    EXPECT_DOUBLE_EQ(*result[0], 1.0);
    EXPECT_FALSE(result[1]);
    EXPECT_FALSE(result[2]);
}

TEST_F(IndicatorsTest, RollingExtremes) {
    const std::vector<double> values{3.0, 1.0, 4.0, 1.0, 5.0};
    const auto highs = indicators::rolling_max(values, 3);
    const auto lows = indicators::rolling_min(values, 3);
    EXPECT_FALSE(highs[1]);
    EXPECT_DOUBLE_EQ(*highs[2], 4.0);
    EXPECT_DOUBLE_EQ(*highs[4], 5.0);
    EXPECT_DOUBLE_EQ(*lows[2], 1.0);
    EXPECT_DOUBLE_EQ(*lows[4], 1.0);
}

TEST_F(IndicatorsTest, MacdWarmupAndHistogram) {
    std::vector<double> closes;
    for (int i = 0; i < 60; ++i) {
        closes.push_back(100.0 + std::sin(i / 4.0) * 5.0);
    }

    const auto line = indicators::macd_line(closes);
    const auto signal = indicators::macd_signal(closes);
    const auto hist = indicators::macd_histogram(closes);

    EXPECT_FALSE(line[24]);
    EXPECT_TRUE(line[25]);
    EXPECT_FALSE(signal[32]);
    EXPECT_TRUE(signal[33]);
    for (std::size_t i = 33; i < closes.size(); ++i) {
        EXPECT_DOUBLE_EQ(*hist[i], *line[i] - *signal[i]);
    }
}

TEST_F(IndicatorsTest, DualThrustBounds) {
    auto series = make_series({10.0, 12.0, 11.0, 13.0});
    ASSERT_NE(series, nullptr);
    const auto window = series->all();

    const auto upper = indicators::dual_thrust_upper(window);
    const auto lower = indicators::dual_thrust_lower(window);
    EXPECT_FALSE(upper[1]);
    ASSERT_TRUE(upper[2]);

    // Bars 0..2: highs 10.5 12.5 12.5, lows 9.5 9.5 10.5, closes 10 12 11
    const double range = std::max(12.5 - 10.0, 12.0 - 9.5);
    EXPECT_DOUBLE_EQ(*upper[2], window[2].open + 0.5 * range);
    EXPECT_DOUBLE_EQ(*lower[2], window[2].open - 0.3 * range);
}
