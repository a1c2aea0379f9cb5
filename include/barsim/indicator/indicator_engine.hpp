// include/barsim/indicator/indicator_engine.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "barsim/core/error.hpp"
#include "barsim/core/types.hpp"
#include "barsim/data/bar_series.hpp"
#include "barsim/indicator/incremental.hpp"

namespace barsim {

/**
 * @brief Opaque reference to an indicator registered with an engine
 */
struct IndicatorHandle {
    std::size_t id{0};

    bool operator==(const IndicatorHandle& other) const {
        return id == other.id;
    }
    bool operator!=(const IndicatorHandle& other) const {
        return id != other.id;
    }
};

/**
 * @brief Pure function over one column of the visible window
 */
using ColumnFunction =
    std::function<IndicatorSeries(const std::vector<double>& column, const std::vector<double>& params)>;

/**
 * @brief Pure function over the whole visible window
 */
using WindowFunction =
    std::function<IndicatorSeries(const BarWindow& window, const std::vector<double>& params)>;

/**
 * @brief Evaluates indicator functions over a growing window of bars
 *
 * Batch functions are re-evaluated on the full window at every advance().
 * Incremental indicators are fed only the bars they have not seen yet and
 * replayed from the start whenever the window does not extend the previous
 * one. Both paths yield the same values for the same window.
 *
 * Not thread-safe; each strategy owns its own engine.
 */
class IndicatorEngine {
public:
    IndicatorEngine() = default;

    IndicatorEngine(const IndicatorEngine&) = delete;
    IndicatorEngine& operator=(const IndicatorEngine&) = delete;
    IndicatorEngine(IndicatorEngine&&) = default;
    IndicatorEngine& operator=(IndicatorEngine&&) = default;

    /**
     * @brief Register a function over one price column
     * @param name Display name
     * @param fn Function returning one value per bar of the column
     * @param source Column the function reads
     * @param params Extra parameters passed through to fn
     * @param warmup Bars needed before the first defined value
     */
    IndicatorHandle define(std::string name, ColumnFunction fn, PriceField source,
                           std::vector<double> params = {}, std::size_t warmup = 0);

    /**
     * @brief Register a function over full bars
     */
    IndicatorHandle define_window(std::string name, WindowFunction fn,
                                  std::vector<double> params = {}, std::size_t warmup = 0);

    /**
     * @brief Register an indicator that is maintained bar by bar
     */
    IndicatorHandle define_incremental(std::unique_ptr<IncrementalIndicator> indicator);

    /**
     * @brief Recompute every indicator on the given window
     * @return INDICATOR_ERROR if a function throws or returns a sequence
     *         whose length differs from the window
     */
    Result<void> advance(const BarWindow& window);

    /**
     * @brief Value of an indicator at a step of the current window
     * @return std::nullopt during warm-up, past the visible window, or for
     *         an unknown handle
     */
    IndicatorValue value_at(IndicatorHandle handle, std::size_t step) const;

    /**
     * @brief Full sequence for the current window, undefined inside the warm-up
     * @throws std::out_of_range for an unknown handle
     */
    const IndicatorSeries& series(IndicatorHandle handle) const;

    /**
     * @throws std::out_of_range for an unknown handle
     */
    const std::string& name(IndicatorHandle handle) const;

    std::size_t warmup(IndicatorHandle handle) const;

    /**
     * @brief Largest declared warm-up over all indicators
     */
    std::size_t warmup_period() const;

    std::size_t size() const {
        return entries_.size();
    }

    /**
     * @brief Length of the window passed to the last advance()
     */
    std::size_t visible_length() const {
        return visible_length_;
    }

    /**
     * @brief Drop computed values, keep definitions
     */
    void reset();

    /**
     * @brief Drop every definition; previously issued handles become unknown
     */
    void clear();

private:
    struct Entry {
        std::string name;
        WindowFunction fn;
        std::vector<double> params;
        std::unique_ptr<IncrementalIndicator> incremental;
        std::size_t warmup{0};
        IndicatorSeries values;
    };

    const Entry& entry(IndicatorHandle handle) const;
    Result<void> advance_batch(Entry& entry, const BarWindow& window);
    Result<void> advance_incremental(Entry& entry, const BarWindow& window);

    std::vector<Entry> entries_;
    std::size_t visible_length_{0};
};

}  // namespace barsim
