// src/strategy/dual_thrust.cpp

#include "barsim/strategy/dual_thrust.hpp"
#include <cmath>
#include "barsim/indicator/indicators.hpp"

namespace barsim {

DualThrustStrategy::DualThrustStrategy(std::string id, std::shared_ptr<const BarSeries> data,
                                       DualThrustConfig config)
    : BaseStrategy(std::move(id), std::move(data)), config_(config) {
    Logger::register_component("DualThrust");
}

Result<void> DualThrustStrategy::set_indicators() {
    if (config_.lookback == 0 || !std::isfinite(config_.k_up) || !std::isfinite(config_.k_down) ||
        config_.k_up < 0.0 || config_.k_down < 0.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "Dual Thrust needs a positive lookback and non-negative multipliers",
                                "DualThrust");
    }

    upper_ = indicator(
        "dt_upper",
        [](const BarWindow& window, const std::vector<double>& p) {
            return indicators::dual_thrust_upper(window, static_cast<std::size_t>(p.at(0)), p.at(1));
        },
        {static_cast<double>(config_.lookback), config_.k_up}, config_.lookback);
    close_ = indicator(
        "close",
        [](const std::vector<double>& column, const std::vector<double>&) {
            return indicators::from_values(column);
        },
        PriceField::CLOSE);
    lower_ = indicator(
        "dt_lower",
        [](const BarWindow& window, const std::vector<double>& p) {
            return indicators::dual_thrust_lower(window, static_cast<std::size_t>(p.at(0)), p.at(1));
        },
        {static_cast<double>(config_.lookback), config_.k_down}, config_.lookback);

    return Result<void>();
}

Result<Decision> DualThrustStrategy::next(std::size_t step) {
    if (crossover(close_, upper_, step)) {
        return enter_long();
    }
    if (crossover(upper_, close_, step)) {
        return close_position();
    }
    if (crossover(lower_, close_, step)) {
        return enter_short();
    }
    return hold();
}

}  // namespace barsim
