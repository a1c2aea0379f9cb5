// include/barsim/strategy/macd_crossover.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "barsim/strategy/base_strategy.hpp"

namespace barsim {

/**
 * @brief Configuration specific to the MACD strategy
 */
struct MacdCrossoverConfig {
    std::size_t fast_span{12};
    std::size_t slow_span{26};
    std::size_t signal_span{9};
};

/**
 * @brief Goes long when the MACD line crosses above its signal line, short
 *        on the opposite cross
 */
class MacdCrossoverStrategy : public BaseStrategy {
public:
    MacdCrossoverStrategy(std::string id, std::shared_ptr<const BarSeries> data,
                          MacdCrossoverConfig config = {});

    Result<void> set_indicators() override;
    Result<Decision> next(std::size_t step) override;

private:
    MacdCrossoverConfig config_;
    IndicatorHandle macd_;
    IndicatorHandle signal_;
};

}  // namespace barsim
