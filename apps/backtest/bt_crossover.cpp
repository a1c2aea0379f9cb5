// apps/backtest/bt_crossover.cpp

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "barsim/backtest/backtest_runner.hpp"
#include "barsim/core/logger.hpp"
#include "barsim/core/time_utils.hpp"
#include "barsim/data/bar_series.hpp"
#include "barsim/data/csv_bar_loader.hpp"
#include "barsim/strategy/dual_thrust.hpp"
#include "barsim/strategy/macd_crossover.hpp"
#include "barsim/strategy/sma_crossover.hpp"

using namespace barsim;
using namespace barsim::backtest;

namespace {

// Daily bars following a slow oscillation around a drifting mean
std::vector<Bar> synthetic_bars(std::size_t count) {
    std::vector<Bar> bars;
    bars.reserve(count);
    const Timestamp start = core::from_epoch_seconds(1640995200);  // 2022-01-01
    double previous_close = 100.0;
    for (std::size_t i = 0; i < count; ++i) {
        const double t = static_cast<double>(i);
        const double close = 100.0 + 0.05 * t + 8.0 * std::sin(t / 9.0) + 2.0 * std::sin(t / 2.3);
        const double open = previous_close;
        const double high = std::max(open, close) + 0.8;
        const double low = std::min(open, close) - 0.8;
        bars.emplace_back(start + std::chrono::hours(24 * i), open, high, low, close,
                          1000.0 + 10.0 * t);
        previous_close = close;
    }
    return bars;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Logger::reset_for_tests();

        auto& logger = Logger::instance();
        LoggerConfig logger_config;
        logger_config.min_level = LogLevel::INFO;
        logger_config.destination = LogDestination::CONSOLE;
        logger_config.filename_prefix = "bt_crossover";
        logger.initialize(logger_config);

        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }

        std::vector<Bar> bars;
        if (argc > 1) {
            INFO("Loading bars from " << argv[1]);
            CsvBarLoader loader;
            auto loaded = loader.load(argv[1]);
            if (loaded.is_error()) {
                ERROR("Failed to load bars: " << loaded.error()->to_string());
                return 1;
            }
            bars = loaded.take_value();
        } else {
            INFO("No CSV given, using 250 synthetic daily bars");
            bars = synthetic_bars(250);
        }

        auto series_result = BarSeries::load(std::move(bars));
        if (series_result.is_error()) {
            ERROR("Invalid bar series: " << series_result.error()->to_string());
            return 1;
        }
        auto series = series_result.value();

        BacktestConfig config;
        if (argc > 2) {
            auto config_result = config.load_from_file(argv[2]);
            if (config_result.is_error()) {
                ERROR("Failed to load config: " << config_result.error()->to_string());
                return 1;
            }
        }
        INFO("Backtest config: " << config.to_json().dump());

        std::vector<std::unique_ptr<StrategyInterface>> strategies;
        strategies.push_back(std::make_unique<SmaCrossoverStrategy>("SMA", series));
        strategies.push_back(std::make_unique<MacdCrossoverStrategy>("MACD", series));
        strategies.push_back(std::make_unique<DualThrustStrategy>("DualThrust", series));

        BacktestRunner runner(config);
        int status = 0;
        for (auto& strategy : strategies) {
            auto result = runner.run(*strategy);
            if (result.is_error()) {
                ERROR("Backtest of " << strategy->name()
                                     << " failed: " << result.error()->to_string());
                status = 1;
                continue;
            }
            std::cout << format_report(result.value()) << std::endl;
        }
        return status;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
