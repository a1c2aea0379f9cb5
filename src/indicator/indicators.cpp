// src/indicator/indicators.cpp

#include "barsim/indicator/indicators.hpp"
#include <algorithm>
#include <cmath>

namespace barsim {
namespace indicators {

namespace {

IndicatorSeries rolling_extreme(const std::vector<double>& values, std::size_t period,
                                bool take_max) {
    IndicatorSeries result(values.size());
    if (period == 0) {
        return result;
    }

    for (std::size_t i = period - 1; i < values.size(); ++i) {
        auto first = values.begin() + static_cast<std::ptrdiff_t>(i + 1 - period);
        auto last = values.begin() + static_cast<std::ptrdiff_t>(i + 1);
        result[i] = take_max ? *std::max_element(first, last) : *std::min_element(first, last);
    }
    return result;
}

IndicatorSeries dual_thrust_range(const BarWindow& window, std::size_t lookback) {
    const auto hh = rolling_max(window.column(PriceField::HIGH), lookback);
    const auto hc = rolling_max(window.column(PriceField::CLOSE), lookback);
    const auto lc = rolling_min(window.column(PriceField::CLOSE), lookback);
    const auto ll = rolling_min(window.column(PriceField::LOW), lookback);

    IndicatorSeries range(window.size());
    for (std::size_t i = 0; i < window.size(); ++i) {
        if (hh[i] && hc[i] && lc[i] && ll[i]) {
            range[i] = std::max(*hh[i] - *lc[i], *hc[i] - *ll[i]);
        }
    }
    return range;
}

}  // namespace

IndicatorSeries from_values(const std::vector<double>& values) {
    IndicatorSeries result;
    result.reserve(values.size());
    for (double v : values) {
        result.push_back(std::isfinite(v) ? IndicatorValue(v) : std::nullopt);
    }
    return result;
}

IndicatorSeries sma(const std::vector<double>& values, std::size_t period) {
    IndicatorSeries result(values.size());
    if (period == 0) {
        return result;
    }

    // Each value is summed over its own window, in order, so that the
    // incremental SMA reproduces it exactly.
    for (std::size_t i = period - 1; i < values.size(); ++i) {
        double sum = 0.0;
        for (std::size_t j = i + 1 - period; j <= i; ++j) {
            sum += values[j];
        }
        result[i] = sum / static_cast<double>(period);
    }
    return result;
}

IndicatorSeries ema(const IndicatorSeries& values, std::size_t span, std::size_t min_periods) {
    IndicatorSeries result(values.size());
    if (span == 0) {
        return result;
    }

    const double alpha = 2.0 / (static_cast<double>(span) + 1.0);
    const std::size_t required = min_periods == 0 ? span : min_periods;

    bool seeded = false;
    double state = 0.0;
    std::size_t observed = 0;

    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!values[i]) {
            continue;
        }
        if (!seeded) {
            state = *values[i];
            seeded = true;
        } else {
            state = (1.0 - alpha) * state + alpha * *values[i];
        }
        ++observed;
        if (observed >= required) {
            result[i] = state;
        }
    }
    return result;
}

IndicatorSeries ema(const std::vector<double>& values, std::size_t span,
                    std::size_t min_periods) {
    return ema(from_values(values), span, min_periods);
}

IndicatorSeries rolling_max(const std::vector<double>& values, std::size_t period) {
    return rolling_extreme(values, period, true);
}

IndicatorSeries rolling_min(const std::vector<double>& values, std::size_t period) {
    return rolling_extreme(values, period, false);
}

IndicatorSeries subtract(const IndicatorSeries& a, const IndicatorSeries& b) {
    const std::size_t n = std::min(a.size(), b.size());
    IndicatorSeries result(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (a[i] && b[i]) {
            result[i] = *a[i] - *b[i];
        }
    }
    return result;
}

IndicatorSeries macd_line(const std::vector<double>& values, std::size_t fast, std::size_t slow) {
    return subtract(ema(values, fast), ema(values, slow));
}

IndicatorSeries macd_signal(const std::vector<double>& values, std::size_t fast,
                            std::size_t slow, std::size_t signal) {
    return ema(macd_line(values, fast, slow), signal);
}

IndicatorSeries macd_histogram(const std::vector<double>& values, std::size_t fast,
                               std::size_t slow, std::size_t signal) {
    const auto line = macd_line(values, fast, slow);
    return subtract(line, ema(line, signal));
}

IndicatorSeries dual_thrust_upper(const BarWindow& window, std::size_t lookback, double k_up) {
    auto range = dual_thrust_range(window, lookback);
    for (std::size_t i = 0; i < range.size(); ++i) {
        if (range[i]) {
            range[i] = window[i].open + k_up * *range[i];
        }
    }
    return range;
}

IndicatorSeries dual_thrust_lower(const BarWindow& window, std::size_t lookback, double k_down) {
    auto range = dual_thrust_range(window, lookback);
    for (std::size_t i = 0; i < range.size(); ++i) {
        if (range[i]) {
            range[i] = window[i].open - k_down * *range[i];
        }
    }
    return range;
}

}  // namespace indicators
}  // namespace barsim
