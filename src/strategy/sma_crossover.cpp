// src/strategy/sma_crossover.cpp

#include "barsim/strategy/sma_crossover.hpp"
#include "barsim/indicator/incremental.hpp"
#include "barsim/indicator/indicators.hpp"

namespace barsim {

SmaCrossoverStrategy::SmaCrossoverStrategy(std::string id, std::shared_ptr<const BarSeries> data,
                                           SmaCrossoverConfig config)
    : BaseStrategy(std::move(id), std::move(data)), config_(config) {
    Logger::register_component("SmaCrossover");
}

Result<void> SmaCrossoverStrategy::set_indicators() {
    if (config_.fast_period == 0 || config_.fast_period >= config_.slow_period) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "Fast period must be positive and shorter than slow period",
                                "SmaCrossover");
    }

    if (config_.incremental) {
        fast_ = indicator(std::make_unique<IncrementalSma>(config_.fast_period));
        slow_ = indicator(std::make_unique<IncrementalSma>(config_.slow_period));
    } else {
        auto sma = [](const std::vector<double>& column, const std::vector<double>& params) {
            return indicators::sma(column, static_cast<std::size_t>(params.at(0)));
        };
        fast_ = indicator("sma", sma, PriceField::CLOSE,
                          {static_cast<double>(config_.fast_period)}, config_.fast_period);
        slow_ = indicator("sma", sma, PriceField::CLOSE,
                          {static_cast<double>(config_.slow_period)}, config_.slow_period);
    }

    DEBUG(id_ << " using " << engine_.name(fast_) << " / " << engine_.name(slow_));
    return Result<void>();
}

Result<Decision> SmaCrossoverStrategy::next(std::size_t step) {
    if (crossover(fast_, slow_, step)) {
        return enter_long();
    }
    if (crossover(slow_, fast_, step)) {
        return enter_short();
    }
    return hold();
}

}  // namespace barsim
