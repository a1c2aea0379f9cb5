// include/barsim/data/bar_series.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <vector>
#include "barsim/core/error.hpp"
#include "barsim/core/types.hpp"

namespace barsim {

/**
 * @brief Read-only, right-bounded view over the first size() bars of a series
 *
 * A window never reaches past its bound, so a strategy holding one cannot
 * observe future bars. Views stay valid as long as the owning series lives.
 */
class BarWindow {
public:
    using const_iterator = const Bar*;

    BarWindow() = default;
    BarWindow(const Bar* data, std::size_t size) : data_(data), size_(size) {}

    std::size_t size() const {
        return size_;
    }

    bool empty() const {
        return size_ == 0;
    }

    const Bar& operator[](std::size_t index) const {
        return data_[index];
    }

    /**
     * @brief Bounds-checked access
     * @throws std::out_of_range if index >= size()
     */
    const Bar& at(std::size_t index) const;

    const Bar& back() const {
        return data_[size_ - 1];
    }

    const_iterator begin() const {
        return data_;
    }

    const_iterator end() const {
        return data_ + size_;
    }

    /**
     * @brief Copy one column of the window
     * @param field Column to extract
     * @return Values aligned index-for-index with the window
     */
    std::vector<double> column(PriceField field) const;

private:
    const Bar* data_{nullptr};
    std::size_t size_{0};
};

/**
 * @brief Immutable, time-ordered table of OHLCV bars
 *
 * Constructed only through load(), which validates ordering and OHLC
 * consistency. Once loaded the series is never mutated and may be shared
 * read-only by any number of concurrent runs.
 */
class BarSeries {
public:
    /**
     * @brief Validate bars and build a series
     * @param bars Bars ordered by timestamp
     * @param min_length Minimum number of bars required
     * @return Shared read-only series, MALFORMED_DATA on invalid bars,
     *         EMPTY_SERIES when fewer than min_length bars are supplied
     */
    static Result<std::shared_ptr<const BarSeries>> load(std::vector<Bar> bars,
                                                         std::size_t min_length = 1);

    /**
     * @brief Check a single bar against the OHLCV invariants
     * @param bar Bar to check
     * @param index Row index used in the error message
     */
    static Result<void> validate_bar(const Bar& bar, std::size_t index);

    /**
     * @brief Visible history up to and including upto_index
     * @return INVALID_ARGUMENT if upto_index is past the last bar
     */
    Result<BarWindow> window(std::size_t upto_index) const;

    /**
     * @brief View over the whole series
     */
    BarWindow all() const {
        return BarWindow(bars_.data(), bars_.size());
    }

    std::size_t size() const {
        return bars_.size();
    }

    const Bar& at(std::size_t index) const {
        return bars_.at(index);
    }

    const Bar& front() const {
        return bars_.front();
    }

    const Bar& back() const {
        return bars_.back();
    }

private:
    explicit BarSeries(std::vector<Bar> bars) : bars_(std::move(bars)) {}

    std::vector<Bar> bars_;
};

}  // namespace barsim
