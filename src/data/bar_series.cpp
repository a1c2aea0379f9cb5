// src/data/bar_series.cpp

#include "barsim/data/bar_series.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include "barsim/core/logger.hpp"
#include "barsim/core/time_utils.hpp"

namespace barsim {

const Bar& BarWindow::at(std::size_t index) const {
    if (index >= size_) {
        throw std::out_of_range("BarWindow index " + std::to_string(index) +
                                " outside visible window of " + std::to_string(size_) + " bars");
    }
    return data_[index];
}

std::vector<double> BarWindow::column(PriceField field) const {
    std::vector<double> values;
    values.reserve(size_);
    for (const auto& bar : *this) {
        values.push_back(bar_field(bar, field));
    }
    return values;
}

Result<void> BarSeries::validate_bar(const Bar& bar, std::size_t index) {
    const std::string row = "Bar " + std::to_string(index) + " (" +
                            core::format_timestamp(bar.timestamp) + "): ";

    for (double price : {bar.open, bar.high, bar.low, bar.close}) {
        if (!std::isfinite(price) || price <= 0.0) {
            return make_error<void>(ErrorCode::MALFORMED_DATA,
                                    row + "prices must be finite and strictly positive",
                                    "BarSeries");
        }
    }

    if (!std::isfinite(bar.volume) || bar.volume < 0.0) {
        return make_error<void>(ErrorCode::MALFORMED_DATA,
                                row + "volume must be finite and non-negative", "BarSeries");
    }

    if (bar.high < bar.open || bar.high < bar.close) {
        return make_error<void>(ErrorCode::MALFORMED_DATA,
                                row + "high " + std::to_string(bar.high) +
                                    " is below max(open, close)",
                                "BarSeries");
    }

    if (bar.low > bar.open || bar.low > bar.close) {
        return make_error<void>(ErrorCode::MALFORMED_DATA,
                                row + "low " + std::to_string(bar.low) +
                                    " is above min(open, close)",
                                "BarSeries");
    }

    return Result<void>();
}

Result<std::shared_ptr<const BarSeries>> BarSeries::load(std::vector<Bar> bars,
                                                         std::size_t min_length) {
    if (bars.size() < min_length || bars.empty()) {
        return make_error<std::shared_ptr<const BarSeries>>(
            ErrorCode::EMPTY_SERIES,
            "Series has " + std::to_string(bars.size()) + " bars, at least " +
                std::to_string(std::max<std::size_t>(min_length, 1)) + " required",
            "BarSeries");
    }

    for (std::size_t i = 0; i < bars.size(); ++i) {
        auto valid = validate_bar(bars[i], i);
        if (valid.is_error()) {
            return make_error<std::shared_ptr<const BarSeries>>(
                valid.error()->code(), valid.error()->what(), "BarSeries");
        }

        if (i > 0 && bars[i].timestamp <= bars[i - 1].timestamp) {
            return make_error<std::shared_ptr<const BarSeries>>(
                ErrorCode::MALFORMED_DATA,
                "Bar " + std::to_string(i) + " (" + core::format_timestamp(bars[i].timestamp) +
                    ") is not strictly after bar " + std::to_string(i - 1) + " (" +
                    core::format_timestamp(bars[i - 1].timestamp) + ")",
                "BarSeries");
        }
    }

    DEBUG("Loaded bar series with " << bars.size() << " bars from "
                                    << core::format_timestamp(bars.front().timestamp) << " to "
                                    << core::format_timestamp(bars.back().timestamp));

    return Result<std::shared_ptr<const BarSeries>>(
        std::shared_ptr<const BarSeries>(new BarSeries(std::move(bars))));
}

Result<BarWindow> BarSeries::window(std::size_t upto_index) const {
    if (upto_index >= bars_.size()) {
        return make_error<BarWindow>(ErrorCode::INVALID_ARGUMENT,
                                     "Window end " + std::to_string(upto_index) +
                                         " is past the last bar (" +
                                         std::to_string(bars_.size()) + " bars)",
                                     "BarSeries");
    }
    return Result<BarWindow>(BarWindow(bars_.data(), upto_index + 1));
}

}  // namespace barsim
