// include/barsim/strategy/strategy_interface.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "barsim/core/error.hpp"
#include "barsim/core/types.hpp"
#include "barsim/data/bar_series.hpp"

namespace barsim {

/**
 * @brief Interface for all trading strategies
 *
 * The runner calls clear_indicators() and set_indicators() once per run,
 * then prepare(step) and next(step)
 * for every bar from the first step past the warm-up period. Implementations
 * must not mutate the bar series or any computed indicator values.
 */
class StrategyInterface {
public:
    virtual ~StrategyInterface() = default;

    // Setup
    virtual void clear_indicators() = 0;
    virtual Result<void> set_indicators() = 0;

    // Per-bar processing
    virtual Result<void> prepare(std::size_t step) = 0;
    virtual Result<Decision> next(std::size_t step) = 0;

    // State
    virtual std::size_t warmup_period() const = 0;
    virtual const std::string& name() const = 0;
    virtual std::shared_ptr<const BarSeries> data() const = 0;
};

}  // namespace barsim
