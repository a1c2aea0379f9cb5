// include/barsim/indicator/indicators.hpp
#pragma once

#include <cstddef>
#include <vector>
#include "barsim/core/types.hpp"
#include "barsim/data/bar_series.hpp"

namespace barsim {
namespace indicators {

/**
 * @brief Lift a raw column into an indicator sequence
 * NaN and infinite values become undefined.
 */
IndicatorSeries from_values(const std::vector<double>& values);

/**
 * @brief Simple moving average
 * @param values Input column
 * @param period Window length, undefined for the first period-1 values
 * @return Sequence aligned with values; all undefined if period is 0
 */
IndicatorSeries sma(const std::vector<double>& values, std::size_t period);

/**
 * @brief Exponential moving average, alpha = 2 / (span + 1)
 *
 * Recursive form seeded with the first defined input. A value is defined
 * once min_periods defined inputs have been seen (min_periods = 0 means
 * span). Undefined inputs yield undefined output and leave the state alone.
 */
IndicatorSeries ema(const IndicatorSeries& values, std::size_t span, std::size_t min_periods = 0);
IndicatorSeries ema(const std::vector<double>& values, std::size_t span,
                    std::size_t min_periods = 0);

/**
 * @brief Highest value over the trailing period (current value included)
 */
IndicatorSeries rolling_max(const std::vector<double>& values, std::size_t period);

/**
 * @brief Lowest value over the trailing period (current value included)
 */
IndicatorSeries rolling_min(const std::vector<double>& values, std::size_t period);

/**
 * @brief Element-wise a - b, undefined where either side is undefined
 */
IndicatorSeries subtract(const IndicatorSeries& a, const IndicatorSeries& b);

// MACD family, parameters follow the usual 12/26/9 convention
IndicatorSeries macd_line(const std::vector<double>& values, std::size_t fast = 12,
                          std::size_t slow = 26);
IndicatorSeries macd_signal(const std::vector<double>& values, std::size_t fast = 12,
                            std::size_t slow = 26, std::size_t signal = 9);
IndicatorSeries macd_histogram(const std::vector<double>& values, std::size_t fast = 12,
                               std::size_t slow = 26, std::size_t signal = 9);

/**
 * @brief Dual Thrust breakout bounds
 *
 * range = max(HH - LC, HC - LL) over the trailing lookback bars, where HH/LL
 * are the highest high / lowest low and HC/LC the highest / lowest close.
 * upper = open + k_up * range, lower = open - k_down * range.
 */
IndicatorSeries dual_thrust_upper(const BarWindow& window, std::size_t lookback = 3,
                                  double k_up = 0.5);
IndicatorSeries dual_thrust_lower(const BarWindow& window, std::size_t lookback = 3,
                                  double k_down = 0.3);

}  // namespace indicators
}  // namespace barsim
