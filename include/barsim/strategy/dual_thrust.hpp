// include/barsim/strategy/dual_thrust.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "barsim/strategy/base_strategy.hpp"

namespace barsim {

/**
 * @brief Configuration specific to the Dual Thrust breakout strategy
 */
struct DualThrustConfig {
    std::size_t lookback{3};  // Bars used for the range
    double k_up{0.5};         // Upper bound multiplier
    double k_down{0.3};       // Lower bound multiplier
};

/**
 * @brief Dual Thrust breakout
 *
 * Long when the close breaks above the upper bound, flat when it falls back
 * under it, short when the close breaks below the lower bound.
 */
class DualThrustStrategy : public BaseStrategy {
public:
    DualThrustStrategy(std::string id, std::shared_ptr<const BarSeries> data,
                       DualThrustConfig config = {});

    Result<void> set_indicators() override;
    Result<Decision> next(std::size_t step) override;

private:
    DualThrustConfig config_;
    IndicatorHandle upper_;
    IndicatorHandle close_;
    IndicatorHandle lower_;
};

}  // namespace barsim
