// include/barsim/strategy/sma_crossover.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "barsim/strategy/base_strategy.hpp"

namespace barsim {

/**
 * @brief Configuration specific to the moving average crossover strategy
 */
struct SmaCrossoverConfig {
    std::size_t fast_period{5};  // Fast moving average length
    std::size_t slow_period{20};  // Slow moving average length
    bool incremental{false};      // Maintain the averages bar by bar
};

/**
 * @brief Goes long when the fast SMA crosses above the slow one, short on
 *        the opposite cross
 */
class SmaCrossoverStrategy : public BaseStrategy {
public:
    SmaCrossoverStrategy(std::string id, std::shared_ptr<const BarSeries> data,
                         SmaCrossoverConfig config = {});

    Result<void> set_indicators() override;
    Result<Decision> next(std::size_t step) override;

    IndicatorHandle fast() const {
        return fast_;
    }
    IndicatorHandle slow() const {
        return slow_;
    }

private:
    SmaCrossoverConfig config_;
    IndicatorHandle fast_;
    IndicatorHandle slow_;
};

}  // namespace barsim
