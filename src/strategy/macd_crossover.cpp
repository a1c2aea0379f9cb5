// src/strategy/macd_crossover.cpp

#include "barsim/strategy/macd_crossover.hpp"
#include "barsim/indicator/indicators.hpp"

namespace barsim {

namespace {

std::size_t param(const std::vector<double>& params, std::size_t i) {
    return static_cast<std::size_t>(params.at(i));
}

}  // namespace

MacdCrossoverStrategy::MacdCrossoverStrategy(std::string id,
                                             std::shared_ptr<const BarSeries> data,
                                             MacdCrossoverConfig config)
    : BaseStrategy(std::move(id), std::move(data)), config_(config) {
    Logger::register_component("MacdCrossover");
}

Result<void> MacdCrossoverStrategy::set_indicators() {
    if (config_.fast_span == 0 || config_.fast_span >= config_.slow_span ||
        config_.signal_span == 0) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "MACD spans must be positive with fast shorter than slow",
                                "MacdCrossover");
    }

    const std::vector<double> line_params{static_cast<double>(config_.fast_span),
                                          static_cast<double>(config_.slow_span)};
    const std::vector<double> signal_params{static_cast<double>(config_.fast_span),
                                            static_cast<double>(config_.slow_span),
                                            static_cast<double>(config_.signal_span)};

    // Line is defined from slow_span bars, the signal needs signal_span more
    macd_ = indicator(
        "macd",
        [](const std::vector<double>& column, const std::vector<double>& p) {
            return indicators::macd_line(column, param(p, 0), param(p, 1));
        },
        PriceField::CLOSE, line_params, config_.slow_span);
    signal_ = indicator(
        "macd_signal",
        [](const std::vector<double>& column, const std::vector<double>& p) {
            return indicators::macd_signal(column, param(p, 0), param(p, 1), param(p, 2));
        },
        PriceField::CLOSE, signal_params, config_.slow_span + config_.signal_span - 1);

    return Result<void>();
}

Result<Decision> MacdCrossoverStrategy::next(std::size_t step) {
    if (crossover(macd_, signal_, step)) {
        return enter_long();
    }
    if (crossover(signal_, macd_, step)) {
        return enter_short();
    }
    return hold();
}

}  // namespace barsim
