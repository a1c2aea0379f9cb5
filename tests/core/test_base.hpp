//===== test_base.hpp =====
#pragma once

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <vector>
#include "barsim/core/logger.hpp"
#include "barsim/core/time_utils.hpp"
#include "barsim/core/types.hpp"
#include "barsim/data/bar_series.hpp"

namespace barsim {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.destination = LogDestination::CONSOLE;
        config.min_level = LogLevel::ERR;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }

    // Daily bars starting 2022-01-03, OHLC derived from the closes
    static std::vector<Bar> make_bars(const std::vector<double>& closes) {
        std::vector<Bar> bars;
        bars.reserve(closes.size());
        const Timestamp start = core::from_epoch_seconds(1641168000);
        for (std::size_t i = 0; i < closes.size(); ++i) {
            const double close = closes[i];
            const double open = i == 0 ? close : closes[i - 1];
            bars.emplace_back(start + std::chrono::hours(24 * static_cast<int>(i)), open,
                              std::max(open, close) + 0.5, std::min(open, close) - 0.5, close,
                              1000.0);
        }
        return bars;
    }

    static std::shared_ptr<const BarSeries> make_series(const std::vector<double>& closes) {
        auto result = BarSeries::load(make_bars(closes));
        EXPECT_TRUE(result.is_ok()) << (result.error() ? result.error()->what() : "");
        return result.is_ok() ? result.value() : nullptr;
    }
};

}  // namespace testing
}  // namespace barsim
