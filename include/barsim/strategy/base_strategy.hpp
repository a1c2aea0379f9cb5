// include/barsim/strategy/base_strategy.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "barsim/core/error.hpp"
#include "barsim/core/logger.hpp"
#include "barsim/indicator/indicator_engine.hpp"
#include "barsim/strategy/strategy_interface.hpp"

namespace barsim {

/**
 * @brief Base class for all trading strategies
 *
 * Owns the data handle and an IndicatorEngine. Derived classes register
 * indicators in set_indicators() and return one Decision per bar in next().
 */
class BaseStrategy : public StrategyInterface {
public:
    /**
     * @brief Constructor
     * @param id Strategy identifier, used as the report name
     * @param data Bar series the strategy runs on
     */
    BaseStrategy(std::string id, std::shared_ptr<const BarSeries> data);

    virtual ~BaseStrategy() = default;

    // StrategyInterface implementations
    /**
     * @brief Drop the indicators of a previous run; handles held by the
     *        subclass are reassigned by the next set_indicators()
     */
    void clear_indicators() override;

    /**
     * @brief Advance every indicator to the window ending at step
     * @return NOT_INITIALIZED without data, INDICATOR_ERROR if an indicator fails
     */
    Result<void> prepare(std::size_t step) override;

    /**
     * @brief Largest warm-up of the registered indicators
     */
    std::size_t warmup_period() const override;

    const std::string& name() const override {
        return id_;
    }

    std::shared_ptr<const BarSeries> data() const override {
        return data_;
    }

    const IndicatorEngine& indicator_engine() const {
        return engine_;
    }

protected:
    /**
     * @brief Register a function over one price column
     *
     * The display name is built as fn_name(x,p1,p2...) where x is the first
     * letter of the source column.
     */
    IndicatorHandle indicator(const std::string& fn_name, ColumnFunction fn,
                              PriceField source = PriceField::CLOSE,
                              std::vector<double> params = {}, std::size_t warmup = 0);

    IndicatorHandle indicator(const std::string& fn_name, WindowFunction fn,
                              std::vector<double> params = {}, std::size_t warmup = 0);

    IndicatorHandle indicator(std::unique_ptr<IncrementalIndicator> incremental);

    IndicatorValue value(IndicatorHandle handle, std::size_t step) const {
        return engine_.value_at(handle, step);
    }

    const IndicatorSeries& series(IndicatorHandle handle) const {
        return engine_.series(handle);
    }

    /**
     * @brief Whether indicator fast has just crossed above indicator slow
     */
    bool crossover(IndicatorHandle fast, IndicatorHandle slow, std::size_t step) const;

    /**
     * @brief Close price of a bar inside the visible window
     * @throws std::out_of_range past the window of the last prepare()
     */
    double close(std::size_t step) const;

    // Decision factories
    static Decision enter_long() {
        return Decision::LONG;
    }
    static Decision enter_short() {
        return Decision::SHORT;
    }
    static Decision close_position() {
        return Decision::CLOSE;
    }
    static Decision hold() {
        return Decision::HOLD;
    }

    std::string id_;
    std::shared_ptr<const BarSeries> data_;
    IndicatorEngine engine_;
};

/**
 * @brief Build a display name such as sma(c,5)
 */
std::string indicator_display_name(const std::string& fn_name, PriceField source,
                                   const std::vector<double>& params);

}  // namespace barsim
